#pragma once

#include "raw_mesh.hpp"
#include <common.hpp>

namespace ugrid {

struct IcosahedralMeshParams {
  // number of times every icosahedron triangle is split in four
  Int m_nsubdiv = 0;
  Real m_sphere_radius = 1;
  // width of verticesOnCell; MPAS files use the maximum cell degree or more
  Int m_max_edges = 6;
  // pad unused verticesOnCell slots by repeating the last vertex instead of 0
  bool m_pad_with_last_vertex = false;
};

// Spherical centroidal-like Voronoi mesh with the MPAS layout: cells are the
// points of a subdivided icosahedron (12 pentagons, the rest hexagons),
// vertices are the circumcenters of its triangles. Level n has
// 10 * 4^n + 2 cells, 30 * 4^n edges and 20 * 4^n vertices.
RawMesh icosahedral_mesh(const IcosahedralMeshParams &params);

} // namespace ugrid
