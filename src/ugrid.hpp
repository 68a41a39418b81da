#pragma once

#include <common.hpp>
#include <mesh/connectivity.hpp>
#include <mesh/icosahedral_mesh.hpp>
#include <mesh/normalized_mesh.hpp>
#include <mesh/raw_mesh.hpp>
#include <mesh/view_selector.hpp>

#include <geometry/coordinates.hpp>
#include <geometry/face_area.hpp>

#include <validation/issue.hpp>
#include <validation/validator.hpp>

#include <grid/grid.hpp>
#include <grid/grid_params.hpp>
