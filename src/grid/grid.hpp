#pragma once

#include "grid_params.hpp"
#include <common.hpp>
#include <geometry/coordinates.hpp>
#include <geometry/face_area.hpp>
#include <mesh/normalized_mesh.hpp>
#include <mesh/raw_mesh.hpp>
#include <mesh/view_selector.hpp>
#include <optional>
#include <validation/issue.hpp>
#include <vector>

namespace ugrid {

// UGRID view of an MPAS mesh. The topology is normalized once at
// construction; face edges, Cartesian coordinates, face areas and the
// antimeridian faces are computed on first use and cached for the lifetime
// of the grid. The caches are filled without locking: a Grid shared between
// threads must have them filled (or be guarded) by the caller first.
class Grid {
public:
  explicit Grid(const RawMesh &raw, const GridParams &params = GridParams());

  const NormalizedMesh &mesh() const { return m_mesh; }
  const ViewDescriptor &view() const { return m_view; }
  const GridParams &params() const { return m_params; }
  MeshMode mode() const { return m_mesh.m_mode; }

  Int nnodes() const { return m_mesh.m_nnodes; }
  Int nfaces() const { return m_mesh.m_nfaces; }
  Int nedges() const { return m_mesh.m_nedges; }

  // issues found by the checker when the grid was built
  const std::vector<Issue> &construction_issues() const {
    return m_construction_issues;
  }

  // (nfaces, max_face_nodes) edge ids, slot j joins face nodes j and j + 1
  IntConst2d face_edges() const;

  const CartesianCoords &node_cartesian() const;
  const CartesianCoords &face_cartesian() const;

  // Throws ConfigurationError for meshes that are not on a sphere.
  const FaceAreas &face_areas() const;
  RealConst1d face_area() const { return face_areas().m_area; }
  Real total_face_area() const;
  std::vector<Issue> geometry_warnings() const;

  const std::vector<Int> &antimeridian_face_indices() const;

  std::vector<Issue> validate() const;
  std::vector<Issue> validate(const ValidationOptions &options) const;

private:
  GridParams m_params;
  ViewDescriptor m_view;
  NormalizedMesh m_mesh;
  std::vector<Issue> m_construction_issues;

  mutable std::optional<IntConst2d> m_face_edges;
  mutable std::optional<CartesianCoords> m_node_cartesian;
  mutable std::optional<CartesianCoords> m_face_cartesian;
  mutable std::optional<FaceAreas> m_face_areas;
  mutable std::optional<Real> m_total_face_area;
  mutable std::optional<std::vector<Int>> m_antimeridian_faces;

  void check_params(const RawMesh &raw) const;
  void build_face_nodes();
  void build_edge_nodes();
  void build_coordinates();
};

} // namespace ugrid
