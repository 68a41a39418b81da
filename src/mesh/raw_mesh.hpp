#pragma once

#include <common.hpp>

namespace ugrid {

// MPAS mesh arrays exactly as stored: coordinates in radians, connectivity
// 1-indexed with 0 marking a missing or padded slot. Any array may be left
// unallocated when the source does not carry it.
struct RawMesh {
  RealConst1d m_lon_vertex;
  RealConst1d m_lat_vertex;
  RealConst1d m_lon_cell;
  RealConst1d m_lat_cell;

  IntConst2d m_vertices_on_cell;
  IntConst2d m_vertices_on_edge;
  IntConst2d m_cells_on_vertex;
  IntConst2d m_cells_on_edge;
  IntConst1d m_nedges_on_cell;

  bool m_on_sphere = true;
  Real m_sphere_radius = 1;

  static constexpr Int index_base = 1;
  static constexpr Int missing_index = 0;
};

template <class V> inline bool has_array(const V &view) {
  return view.is_allocated();
}

} // namespace ugrid
