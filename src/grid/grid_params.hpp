#pragma once

#include <common.hpp>
#include <geometry/face_area.hpp>
#include <validation/validator.hpp>

namespace ugrid {

struct GridParams {
  bool m_use_dual = false;
  // must be negative so that it can never be a node id
  Int m_fill_value = default_fill_value;
  FaceAreaParams m_area;
  ValidationOptions m_validation;
};

} // namespace ugrid
