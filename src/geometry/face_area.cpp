#include "face_area.hpp"

namespace ugrid {

bool is_supported_quadrature(QuadratureRule rule, Int order) {
  if (rule == QuadratureRule::gaussian) {
    return order >= 1 && order <= 5;
  }
  return order == 1 || order == 4;
}

FaceAreas compute_face_areas(const IntConst2d &face_nodes,
                             const CartesianCoords &nodes,
                             const CartesianCoords &centers, Real radius,
                             const FaceAreaParams &params) {
  const Int nfaces = face_nodes.extent(0);
  if (centers.size() != nfaces) {
    throw StructuralError("face area: " + std::to_string(centers.size()) +
                          " face centers for " + std::to_string(nfaces) +
                          " faces");
  }

  if (params.m_method == AreaMethod::quadrature &&
      !is_supported_quadrature(params.m_quadrature_rule,
                               params.m_quadrature_order)) {
    const char *rule = params.m_quadrature_rule == QuadratureRule::gaussian
                           ? "gaussian"
                           : "triangular";
    throw ConfigurationError(std::string("face area: no ") + rule +
                             " quadrature of order " +
                             std::to_string(params.m_quadrature_order));
  }

  FaceAreas areas;
  areas.m_area = Real1d("face_area", nfaces);
  areas.m_flags = Int1d("face_area_flags", nfaces);

  UGRID_SCOPE(area, areas.m_area);
  UGRID_SCOPE(flags, areas.m_flags);
  UGRID_SCOPE(x_node, nodes.m_x);
  UGRID_SCOPE(y_node, nodes.m_y);
  UGRID_SCOPE(z_node, nodes.m_z);
  UGRID_SCOPE(x_face, centers.m_x);
  UGRID_SCOPE(y_face, centers.m_y);
  UGRID_SCOPE(z_face, centers.m_z);

  timer_start("compute_face_areas");
  ugrid_parallel_for(
      "compute_face_areas", nfaces, KOKKOS_LAMBDA(Int iface) {
        const Real center[3] = {x_face(iface), y_face(iface), z_face(iface)};
        Int face_flags = face_ok;
        area(iface) = face_area(iface, face_nodes, x_node, y_node, z_node,
                                center, radius, params, face_flags);
        flags(iface) = face_flags;
      });
  timer_stop("compute_face_areas");

  return areas;
}

Real sum_face_areas(const RealConst1d &area) {
  Real total;
  ugrid_parallel_reduce(
      "sum_face_areas", Int(area.extent(0)),
      KOKKOS_LAMBDA(Int iface, Real & accum) { accum += area(iface); },
      total);
  return total;
}

std::vector<Issue> geometry_warnings(const FaceAreas &areas) {
  const auto flags_h = host_copy(areas.m_flags);
  const Int nfaces = flags_h.extent(0);

  std::vector<Issue> warnings;
  for (Int iface = 0; iface < nfaces; ++iface) {
    const Int face_flags = flags_h(iface);
    if (face_flags == face_ok) {
      continue;
    }
    const std::string face = "face " + std::to_string(iface);
    if (face_flags & too_few_nodes_flag) {
      warnings.push_back({IssueKind::too_few_nodes, iface,
                          face + " has fewer than 3 valid nodes, area set "
                                 "to zero"});
    }
    if (face_flags & degenerate_triangle_flag) {
      warnings.push_back({IssueKind::degenerate_triangle, iface,
                          face + " has degenerate fan triangles (duplicate "
                                 "or collinear nodes), skipped in its area"});
    }
    if (face_flags & reversed_winding_flag) {
      warnings.push_back({IssueKind::reversed_winding, iface,
                          face + " is wound clockwise seen from outside"});
    }
  }
  return warnings;
}

} // namespace ugrid
