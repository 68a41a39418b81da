#pragma once

#include <common.hpp>
#include <geometry/coordinates.hpp>
#include <validation/issue.hpp>
#include <vector>

namespace ugrid {

enum class AreaMethod { spherical_excess, quadrature };

// triangular: symmetric rules on the reference triangle, orders 1 and 4
// gaussian: Gauss-Legendre tensor rule on the collapsed square, 1 to 5
// points per direction
enum class QuadratureRule { triangular, gaussian };

struct FaceAreaParams {
  AreaMethod m_method = AreaMethod::spherical_excess;
  QuadratureRule m_quadrature_rule = QuadratureRule::triangular;
  Int m_quadrature_order = 4;
  // fan triangles with |det(c, a, b)| at or below this are degenerate
  Real m_degenerate_tol = 1e-15;
};

bool is_supported_quadrature(QuadratureRule rule, Int order);

// per-face diagnostic bits
enum FaceAreaFlag : Int {
  face_ok = 0,
  degenerate_triangle_flag = 1,
  too_few_nodes_flag = 2,
  reversed_winding_flag = 4,
};

struct FaceAreas {
  Real1d m_area;
  Int1d m_flags;
};

KOKKOS_INLINE_FUNCTION Real dot3(const Real a[3], const Real b[3]) {
  return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

KOKKOS_INLINE_FUNCTION void cross3(const Real a[3], const Real b[3],
                                   Real c[3]) {
  c[0] = a[1] * b[2] - a[2] * b[1];
  c[1] = a[2] * b[0] - a[0] * b[2];
  c[2] = a[0] * b[1] - a[1] * b[0];
}

KOKKOS_INLINE_FUNCTION Real triple_product(const Real a[3], const Real b[3],
                                           const Real c[3]) {
  Real bxc[3];
  cross3(b, c, bxc);
  return dot3(a, bxc);
}

// Spherical excess of the unit-sphere triangle (a, b, c) from the half-angle
// identity tan(E/2) = det(a, b, c) / (1 + a.b + b.c + c.a) (Van Oosterom and
// Strackee). Positive for counter-clockwise triangles seen from outside.
KOKKOS_INLINE_FUNCTION Real signed_spherical_excess(const Real a[3],
                                                    const Real b[3],
                                                    const Real c[3],
                                                    Real det) {
  const Real denom = 1 + dot3(a, b) + dot3(b, c) + dot3(c, a);
  return 2 * std::atan2(det, denom);
}

// Jacobian of the gnomonic map from the planar triangle (v1, v2, v3) to the
// sphere, at barycentric point alpha.
KOKKOS_INLINE_FUNCTION Real spherical_triangle_jacobian(const Real v1[3],
                                                        const Real v2[3],
                                                        const Real v3[3],
                                                        const Real alpha[3]) {
  Real u[3];
  for (Int d = 0; d < 3; ++d) {
    u[d] = alpha[0] * v1[d] + alpha[1] * v2[d] + alpha[2] * v3[d];
  }
  const Real oovn = 1 / std::sqrt(dot3(u, u));
  for (Int d = 0; d < 3; ++d) {
    u[d] *= oovn;
  }

  Real u_a[2][3];
  for (Int d = 0; d < 3; ++d) {
    u_a[0][d] = v1[d] - v3[d];
    u_a[1][d] = v2[d] - v3[d];
  }
  for (Int i = 0; i < 2; ++i) {
    const Real proj = dot3(u, u_a[i]);
    for (Int d = 0; d < 3; ++d) {
      u_a[i][d] = (u_a[i][d] - proj * u[d]) * oovn;
    }
  }

  Real normal[3];
  cross3(u_a[0], u_a[1], normal);
  return std::sqrt(dot3(normal, normal));
}

// Unsigned area of the unit-sphere triangle by a 6-point, degree-4 rule on
// the reference triangle.
KOKKOS_INLINE_FUNCTION Real triangular_rule_area(const Real a[3],
                                                 const Real b[3],
                                                 const Real c[3]) {
  constexpr Int npoints = 6;
  constexpr Real w0 = 0.223381589678011;
  constexpr Real w1 = 0.109951743655322;
  constexpr Real p0 = 0.445948490915965;
  constexpr Real q0 = 0.108103018168070;
  constexpr Real p1 = 0.091576213509771;
  constexpr Real q1 = 0.816847572980459;
  const Real weights[npoints] = {w0, w0, w0, w1, w1, w1};
  const Real points[npoints][3] = {{q0, p0, p0}, {p0, q0, p0}, {p0, p0, q0},
                                   {q1, p1, p1}, {p1, q1, p1}, {p1, p1, q1}};

  Real area = 0;
  for (Int k = 0; k < npoints; ++k) {
    area += weights[k] * spherical_triangle_jacobian(a, b, c, points[k]);
  }
  return area / 2;
}

// k-th node and weight of the n-point Gauss-Legendre rule on [0, 1]
KOKKOS_INLINE_FUNCTION void gauss_legendre(Int n, Int k, Real &x, Real &w) {
  const Real x2[] = {0.211324865405187, 0.788675134594813};
  const Real w2[] = {0.5, 0.5};
  const Real x3[] = {0.112701665379258, 0.5, 0.887298334620742};
  const Real w3[] = {0.277777777777778, 0.444444444444444,
                     0.277777777777778};
  const Real x4[] = {0.069431844202974, 0.330009478207572, 0.669990521792428,
                     0.930568155797026};
  const Real w4[] = {0.173927422568727, 0.326072577431273, 0.326072577431273,
                     0.173927422568727};
  const Real x5[] = {0.046910077030668, 0.230765344947158, 0.5,
                     0.769234655052842, 0.953089922969332};
  const Real w5[] = {0.118463442528095, 0.239314335249683, 0.284444444444444,
                     0.239314335249683, 0.118463442528095};
  switch (n) {
  case 2:
    x = x2[k];
    w = w2[k];
    return;
  case 3:
    x = x3[k];
    w = w3[k];
    return;
  case 4:
    x = x4[k];
    w = w4[k];
    return;
  case 5:
    x = x5[k];
    w = w5[k];
    return;
  default:
    x = 0.5;
    w = 1;
  }
}

// Unsigned area of the unit-sphere triangle by an n x n Gauss-Legendre rule
// on the unit square collapsed onto the triangle (the corner at c).
KOKKOS_INLINE_FUNCTION Real gaussian_rule_area(const Real a[3],
                                               const Real b[3],
                                               const Real c[3], Int n) {
  Real area = 0;
  for (Int p = 0; p < n; ++p) {
    Real s, ws;
    gauss_legendre(n, p, s, ws);
    for (Int q = 0; q < n; ++q) {
      Real t, wt;
      gauss_legendre(n, q, t, wt);
      const Real alpha[3] = {(1 - t) * (1 - s), (1 - t) * s, t};
      area += ws * wt * (1 - t) * spherical_triangle_jacobian(a, b, c, alpha);
    }
  }
  return area;
}

KOKKOS_INLINE_FUNCTION Real quadrature_triangle_area(const Real a[3],
                                                     const Real b[3],
                                                     const Real c[3],
                                                     QuadratureRule rule,
                                                     Int order) {
  if (rule == QuadratureRule::gaussian) {
    return gaussian_rule_area(a, b, c, order);
  }
  if (order == 1) {
    const Real centroid[3] = {1 / 3._fp, 1 / 3._fp, 1 / 3._fp};
    return spherical_triangle_jacobian(a, b, c, centroid) / 2;
  }
  return triangular_rule_area(a, b, c);
}

KOKKOS_INLINE_FUNCTION Real fan_triangle_area(const Real center[3],
                                              const Real a[3], const Real b[3],
                                              const FaceAreaParams &params,
                                              bool &degenerate) {
  const Real det = triple_product(center, a, b);
  if (std::abs(det) <= params.m_degenerate_tol) {
    degenerate = true;
    return 0;
  }
  if (params.m_method == AreaMethod::quadrature) {
    const Real area =
        quadrature_triangle_area(center, a, b, params.m_quadrature_rule,
                                 params.m_quadrature_order);
    return det > 0 ? area : -area;
  }
  return signed_spherical_excess(center, a, b, det);
}

// Area of one face on a sphere of the given radius: a fan of spherical
// triangles from the face center through each consecutive pair of valid
// nodes, closing pair included. Negative (fill) entries of the row are
// skipped. Diagnostic bits are or-ed into `flags`; the result is always
// finite and non-negative.
template <class FaceNodes, class Coord>
KOKKOS_INLINE_FUNCTION Real
face_area(Int iface, const FaceNodes &face_nodes, const Coord &x,
          const Coord &y, const Coord &z, const Real center[3], Real radius,
          const FaceAreaParams &params, Int &flags) {
  const Int width = face_nodes.extent(1);

  Int nvalid = 0;
  Int first = -1;
  Real prev[3] = {0, 0, 0};
  Real signed_area = 0;
  bool degenerate = false;
  for (Int j = 0; j < width; ++j) {
    const Int jnode = face_nodes(iface, j);
    if (jnode < 0) {
      continue;
    }
    const Real node[3] = {x(jnode), y(jnode), z(jnode)};
    if (nvalid == 0) {
      first = jnode;
    } else {
      signed_area +=
          fan_triangle_area(center, prev, node, params, degenerate);
    }
    prev[0] = node[0];
    prev[1] = node[1];
    prev[2] = node[2];
    ++nvalid;
  }

  if (nvalid < 3) {
    flags |= too_few_nodes_flag;
    return 0;
  }

  const Real closing[3] = {x(first), y(first), z(first)};
  signed_area += fan_triangle_area(center, prev, closing, params, degenerate);

  if (degenerate) {
    flags |= degenerate_triangle_flag;
  }
  if (signed_area < 0) {
    flags |= reversed_winding_flag;
    signed_area = -signed_area;
  }
  return signed_area * radius * radius;
}

// Area of every face, written to its own slot in parallel.
FaceAreas compute_face_areas(const IntConst2d &face_nodes,
                             const CartesianCoords &nodes,
                             const CartesianCoords &centers, Real radius,
                             const FaceAreaParams &params = FaceAreaParams());

Real sum_face_areas(const RealConst1d &area);

// One issue per flagged face and condition, in face order.
std::vector<Issue> geometry_warnings(const FaceAreas &areas);

} // namespace ugrid
