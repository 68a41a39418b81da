#pragma once

#include <common.hpp>
#include <string>
#include <vector>

namespace ugrid {

constexpr Real deg_per_rad = 180 / pi;
constexpr Real rad_per_deg = pi / 180;

// Maps any longitude in degrees to [-180, 180).
KOKKOS_INLINE_FUNCTION Real wrap_longitude(Real lon) {
  Real wrapped = std::fmod(lon + 180, 360._fp);
  if (wrapped < 0) {
    wrapped += 360;
  }
  // a tiny negative remainder rounds up to 360
  if (wrapped >= 360) {
    wrapped -= 360;
  }
  return wrapped - 180;
}

KOKKOS_INLINE_FUNCTION void lonlat_to_unit_vector(Real lon_deg, Real lat_deg,
                                                  Real xyz[3]) {
  using std::cos;
  using std::sin;
  const Real lon = lon_deg * rad_per_deg;
  const Real lat = lat_deg * rad_per_deg;
  xyz[0] = cos(lat) * cos(lon);
  xyz[1] = cos(lat) * sin(lon);
  xyz[2] = sin(lat);
}

// Unit-sphere positions; the radius is applied by whoever needs lengths or
// areas.
struct CartesianCoords {
  Real1d m_x;
  Real1d m_y;
  Real1d m_z;

  Int size() const { return m_x.extent(0); }
};

Real1d to_degrees(const std::string &name, const RealConst1d &radians);

// to_degrees followed by wrap_longitude
Real1d longitude_to_degrees(const std::string &name,
                            const RealConst1d &radians);

CartesianCoords to_cartesian(const std::string &name,
                             const RealConst1d &lon_deg,
                             const RealConst1d &lat_deg);

// Faces whose nodes span more than half the globe in longitude, i.e. faces
// that straddle the antimeridian (or enclose a pole). Entries that are not
// node ids are ignored.
std::vector<Int> find_antimeridian_faces(const IntConst2d &face_nodes,
                                         const RealConst1d &node_lon);

} // namespace ugrid
