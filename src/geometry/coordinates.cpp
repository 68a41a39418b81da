#include "coordinates.hpp"

namespace ugrid {

Real1d to_degrees(const std::string &name, const RealConst1d &radians) {
  const Int n = radians.extent(0);
  Real1d degrees(name, n);
  ugrid_parallel_for(
      "to_degrees_" + name, n,
      KOKKOS_LAMBDA(Int i) { degrees(i) = radians(i) * deg_per_rad; });
  return degrees;
}

Real1d longitude_to_degrees(const std::string &name,
                            const RealConst1d &radians) {
  const Int n = radians.extent(0);
  Real1d degrees(name, n);
  ugrid_parallel_for(
      "longitude_to_degrees_" + name, n, KOKKOS_LAMBDA(Int i) {
        degrees(i) = wrap_longitude(radians(i) * deg_per_rad);
      });
  return degrees;
}

CartesianCoords to_cartesian(const std::string &name,
                             const RealConst1d &lon_deg,
                             const RealConst1d &lat_deg) {
  const Int n = lon_deg.extent(0);
  CartesianCoords coords;
  coords.m_x = Real1d(name + "_x", n);
  coords.m_y = Real1d(name + "_y", n);
  coords.m_z = Real1d(name + "_z", n);

  UGRID_SCOPE(x, coords.m_x);
  UGRID_SCOPE(y, coords.m_y);
  UGRID_SCOPE(z, coords.m_z);
  ugrid_parallel_for(
      "to_cartesian_" + name, n, KOKKOS_LAMBDA(Int i) {
        Real xyz[3];
        lonlat_to_unit_vector(lon_deg(i), lat_deg(i), xyz);
        x(i) = xyz[0];
        y(i) = xyz[1];
        z(i) = xyz[2];
      });
  return coords;
}

std::vector<Int> find_antimeridian_faces(const IntConst2d &face_nodes,
                                         const RealConst1d &node_lon) {
  const Int nfaces = face_nodes.extent(0);
  const Int width = face_nodes.extent(1);
  const Int nnodes = node_lon.extent(0);

  Int1d crosses("crosses_antimeridian", nfaces);
  ugrid_parallel_for(
      "find_antimeridian_faces", nfaces, KOKKOS_LAMBDA(Int iface) {
        Real min_lon = 180;
        Real max_lon = -180;
        for (Int j = 0; j < width; ++j) {
          const Int jnode = face_nodes(iface, j);
          // fill, or an id the validator reports as out of range
          if (jnode < 0 || jnode >= nnodes) {
            continue;
          }
          const Real lon = node_lon(jnode);
          min_lon = lon < min_lon ? lon : min_lon;
          max_lon = lon > max_lon ? lon : max_lon;
        }
        crosses(iface) = max_lon - min_lon > 180;
      });

  const auto crosses_h = host_copy(crosses);
  std::vector<Int> faces;
  for (Int iface = 0; iface < nfaces; ++iface) {
    if (crosses_h(iface)) {
      faces.push_back(iface);
    }
  }
  return faces;
}

} // namespace ugrid
