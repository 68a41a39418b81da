#pragma once

#include <common.hpp>
#include <mesh/view_selector.hpp>

namespace ugrid {

// UGRID-style topology: 0-indexed connectivity with a single fill value,
// coordinates in degrees with longitudes in [-180, 180). Built once by Grid
// and never modified afterwards.
struct NormalizedMesh {
  MeshMode m_mode = MeshMode::primal;
  Int m_fill_value = default_fill_value;

  Int m_nnodes = 0;
  Int m_nfaces = 0;
  Int m_nedges = 0;
  Int m_max_face_nodes = 0;

  RealConst1d m_node_lon;
  RealConst1d m_node_lat;
  RealConst1d m_face_lon;
  RealConst1d m_face_lat;

  // (nfaces, max_face_nodes), valid ids first, counter-clockwise
  IntConst2d m_face_nodes;
  IntConst1d m_nnodes_per_face;
  // (nedges, 2)
  IntConst2d m_edge_nodes;

  bool m_on_sphere = true;
  Real m_sphere_radius = 1;
};

} // namespace ugrid
