#include "icosahedral_mesh.hpp"
#include <algorithm>
#include <array>
#include <map>
#include <utility>
#include <vector>

namespace ugrid {

namespace {

using Point = std::array<Real, 3>;
using Triangle = std::array<Int, 3>;

Point normalize(const Point &p) {
  const Real norm = std::sqrt(p[0] * p[0] + p[1] * p[1] + p[2] * p[2]);
  return {p[0] / norm, p[1] / norm, p[2] / norm};
}

Real dot(const Point &a, const Point &b) {
  return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

Point cross(const Point &a, const Point &b) {
  return {a[1] * b[2] - a[2] * b[1], a[2] * b[0] - a[0] * b[2],
          a[0] * b[1] - a[1] * b[0]};
}

Point minus(const Point &a, const Point &b) {
  return {a[0] - b[0], a[1] - b[1], a[2] - b[2]};
}

std::pair<Int, Int> edge_key(Int a, Int b) {
  return {std::min(a, b), std::max(a, b)};
}

void icosahedron(std::vector<Point> &points, std::vector<Triangle> &tris) {
  const Real phi = (1 + std::sqrt(5.0)) / 2;
  for (const Real s1 : {-1., 1.}) {
    for (const Real s2 : {-phi, phi}) {
      points.push_back({0, s1, s2});
      points.push_back({s1, s2, 0});
      points.push_back({s2, 0, s1});
    }
  }

  // unnormalized icosahedron edges have length 2
  const auto adjacent = [&](Int i, Int j) {
    const Point d = minus(points[i], points[j]);
    return std::abs(dot(d, d) - 4) < 1e-8;
  };
  const Int npoints = points.size();
  for (Int i = 0; i < npoints; ++i) {
    for (Int j = i + 1; j < npoints; ++j) {
      for (Int k = j + 1; k < npoints; ++k) {
        if (adjacent(i, j) && adjacent(j, k) && adjacent(k, i)) {
          const Point n =
              cross(minus(points[j], points[i]), minus(points[k], points[i]));
          if (dot(n, points[i]) > 0) {
            tris.push_back({i, j, k});
          } else {
            tris.push_back({i, k, j});
          }
        }
      }
    }
  }

  for (auto &p : points) {
    p = normalize(p);
  }
}

void subdivide(std::vector<Point> &points, std::vector<Triangle> &tris) {
  std::map<std::pair<Int, Int>, Int> midpoints;
  const auto midpoint = [&](Int a, Int b) {
    const auto key = edge_key(a, b);
    const auto it = midpoints.find(key);
    if (it != midpoints.end()) {
      return it->second;
    }
    const Int idx = points.size();
    points.push_back(normalize({points[a][0] + points[b][0],
                                points[a][1] + points[b][1],
                                points[a][2] + points[b][2]}));
    midpoints.emplace(key, idx);
    return idx;
  };

  std::vector<Triangle> refined;
  refined.reserve(4 * tris.size());
  for (const auto &t : tris) {
    const Int ab = midpoint(t[0], t[1]);
    const Int bc = midpoint(t[1], t[2]);
    const Int ca = midpoint(t[2], t[0]);
    refined.push_back({t[0], ab, ca});
    refined.push_back({t[1], bc, ab});
    refined.push_back({t[2], ca, bc});
    refined.push_back({ab, bc, ca});
  }
  tris = std::move(refined);
}

void lonlat(const Point &p, Real &lon, Real &lat) {
  lon = std::atan2(p[1], p[0]);
  if (lon < 0) {
    lon += 2 * pi;
  }
  lat = std::atan2(p[2], std::hypot(p[0], p[1]));
}

} // namespace

RawMesh icosahedral_mesh(const IcosahedralMeshParams &params) {
  std::vector<Point> points;
  std::vector<Triangle> tris;
  icosahedron(points, tris);
  for (Int level = 0; level < params.m_nsubdiv; ++level) {
    subdivide(points, tris);
  }

  const Int ncells = points.size();
  const Int nvertices = tris.size();
  const Int max_edges = params.m_max_edges;

  Real1d lon_cell("lonCell", ncells);
  Real1d lat_cell("latCell", ncells);
  Real1d lon_vertex("lonVertex", nvertices);
  Real1d lat_vertex("latVertex", nvertices);
  Int2d vertices_on_cell("verticesOnCell", ncells, max_edges);
  Int1d nedges_on_cell("nEdgesOnCell", ncells);
  Int2d cells_on_vertex("cellsOnVertex", nvertices, 3);

  auto lon_cell_h = create_mirror_view(lon_cell);
  auto lat_cell_h = create_mirror_view(lat_cell);
  auto lon_vertex_h = create_mirror_view(lon_vertex);
  auto lat_vertex_h = create_mirror_view(lat_vertex);
  auto vertices_on_cell_h = create_mirror_view(vertices_on_cell);
  auto nedges_on_cell_h = create_mirror_view(nedges_on_cell);
  auto cells_on_vertex_h = create_mirror_view(cells_on_vertex);

  std::vector<Point> vertices(nvertices);
  std::vector<std::vector<Int>> vertices_around(ncells);
  std::map<std::pair<Int, Int>, std::vector<Int>> edge_vertices;
  for (Int ivertex = 0; ivertex < nvertices; ++ivertex) {
    const auto &t = tris[ivertex];
    const Point &a = points[t[0]];
    const Point &b = points[t[1]];
    const Point &c = points[t[2]];
    vertices[ivertex] = normalize(cross(minus(b, a), minus(c, a)));
    lonlat(vertices[ivertex], lon_vertex_h(ivertex), lat_vertex_h(ivertex));

    for (Int j = 0; j < 3; ++j) {
      cells_on_vertex_h(ivertex, j) = t[j] + 1;
      vertices_around[t[j]].push_back(ivertex);
      edge_vertices[edge_key(t[j], t[(j + 1) % 3])].push_back(ivertex);
    }
  }

  for (Int icell = 0; icell < ncells; ++icell) {
    const Point &p = points[icell];
    lonlat(p, lon_cell_h(icell), lat_cell_h(icell));

    // counter-clockwise seen from outside: angle in the tangent basis
    // (e1, e2) with e1 x e2 = p
    const Point axis =
        std::abs(p[2]) < 0.9 ? Point{0, 0, 1} : Point{1, 0, 0};
    const Point e1 = normalize(cross(axis, p));
    const Point e2 = cross(p, e1);
    auto &around = vertices_around[icell];
    std::vector<std::pair<Real, Int>> sorted;
    for (const Int ivertex : around) {
      const Point &v = vertices[ivertex];
      sorted.emplace_back(std::atan2(dot(v, e2), dot(v, e1)), ivertex);
    }
    std::sort(sorted.begin(), sorted.end());

    const Int degree = sorted.size();
    if (degree > max_edges) {
      throw ConfigurationError("icosahedral mesh: cell degree " +
                               std::to_string(degree) + " exceeds max_edges " +
                               std::to_string(max_edges));
    }
    nedges_on_cell_h(icell) = degree;
    for (Int j = 0; j < max_edges; ++j) {
      if (j < degree) {
        vertices_on_cell_h(icell, j) = sorted[j].second + 1;
      } else {
        vertices_on_cell_h(icell, j) = params.m_pad_with_last_vertex
                                           ? sorted[degree - 1].second + 1
                                           : RawMesh::missing_index;
      }
    }
  }

  const Int nedges = edge_vertices.size();
  Int2d cells_on_edge("cellsOnEdge", nedges, 2);
  Int2d vertices_on_edge("verticesOnEdge", nedges, 2);
  auto cells_on_edge_h = create_mirror_view(cells_on_edge);
  auto vertices_on_edge_h = create_mirror_view(vertices_on_edge);
  Int iedge = 0;
  for (const auto &edge : edge_vertices) {
    cells_on_edge_h(iedge, 0) = edge.first.first + 1;
    cells_on_edge_h(iedge, 1) = edge.first.second + 1;
    for (Int j = 0; j < 2; ++j) {
      vertices_on_edge_h(iedge, j) = j < Int(edge.second.size())
                                         ? edge.second[j] + 1
                                         : RawMesh::missing_index;
    }
    ++iedge;
  }

  deep_copy(lon_cell, lon_cell_h);
  deep_copy(lat_cell, lat_cell_h);
  deep_copy(lon_vertex, lon_vertex_h);
  deep_copy(lat_vertex, lat_vertex_h);
  deep_copy(vertices_on_cell, vertices_on_cell_h);
  deep_copy(nedges_on_cell, nedges_on_cell_h);
  deep_copy(cells_on_vertex, cells_on_vertex_h);
  deep_copy(cells_on_edge, cells_on_edge_h);
  deep_copy(vertices_on_edge, vertices_on_edge_h);

  RawMesh raw;
  raw.m_lon_cell = lon_cell;
  raw.m_lat_cell = lat_cell;
  raw.m_lon_vertex = lon_vertex;
  raw.m_lat_vertex = lat_vertex;
  raw.m_vertices_on_cell = vertices_on_cell;
  raw.m_nedges_on_cell = nedges_on_cell;
  raw.m_cells_on_vertex = cells_on_vertex;
  raw.m_cells_on_edge = cells_on_edge;
  raw.m_vertices_on_edge = vertices_on_edge;
  raw.m_on_sphere = true;
  raw.m_sphere_radius = params.m_sphere_radius;
  return raw;
}

} // namespace ugrid
