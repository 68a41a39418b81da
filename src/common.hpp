#pragma once

#include <Kokkos_Core.hpp>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#ifdef UGRID_USE_CALIPER
#include <caliper/cali.h>
#endif

namespace ugrid {

using Real = double;
using Int = int;

KOKKOS_INLINE_FUNCTION constexpr Real operator""_fp(long double x) { return x; }

constexpr Real pi = M_PI;

// Reserved "no index here" marker shared by every normalized connectivity
// array. Never a valid (non-negative) index.
constexpr Int default_fill_value = std::numeric_limits<Int>::min();

#define UGRID_SCOPE(a, b) const auto &a = b

using Kokkos::create_mirror_view;
using Kokkos::deep_copy;
using Kokkos::parallel_for;
using Kokkos::parallel_reduce;

using ExecSpace = Kokkos::DefaultExecutionSpace;
using HostExecSpace = Kokkos::DefaultHostExecutionSpace;
constexpr bool exec_is_gpu =
    !Kokkos::SpaceAccessibility<ExecSpace, Kokkos::HostSpace>::accessible;

using MemSpace = ExecSpace::memory_space;
using HostMemSpace = HostExecSpace::memory_space;
using Layout = Kokkos::LayoutRight;

using RangePolicy = Kokkos::RangePolicy<ExecSpace>;

using Real1d = Kokkos::View<Real *, Layout, MemSpace>;
using RealConst1d = Kokkos::View<Real const *, Layout, MemSpace>;

using Int1d = Kokkos::View<Int *, Layout, MemSpace>;
using Int2d = Kokkos::View<Int **, Layout, MemSpace>;

using IntConst1d = Kokkos::View<Int const *, Layout, MemSpace>;
using IntConst2d = Kokkos::View<Int const **, Layout, MemSpace>;

using Bool2d = Kokkos::View<bool **, Layout, MemSpace>;

// Host copy of a device view, for the checks that walk the mesh serially.
template <class V> inline auto host_copy(const V &view) {
  auto host_view =
      Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), view);
  return host_view;
}

// one index per mesh entity (row, face, node)
template <class F>
inline void ugrid_parallel_for(const std::string &label, Int upper_bound,
                               const F &f) {
  parallel_for(label, RangePolicy(0, upper_bound), f);
}

template <class F, class R>
inline void ugrid_parallel_reduce(const std::string &label, Int upper_bound,
                                  const F &f, R &&reducer) {
  parallel_reduce(label, RangePolicy(0, upper_bound), f,
                  std::forward<R>(reducer));
}

#ifdef UGRID_USE_CALIPER
inline void timer_start(char const *label) {
  if constexpr (exec_is_gpu) {
    Kokkos::fence();
  }
  cali_begin_region(label);
}

inline void timer_stop(char const *label) {
  if constexpr (exec_is_gpu) {
    Kokkos::fence();
  }
  cali_end_region(label);
}
#else
inline void timer_start(char const *label) {}
inline void timer_stop(char const *label) {}
#endif

// Malformed raw connectivity: the mesh cannot be built.
struct StructuralError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The request does not fit the mesh (radius, dual closure, planar areas).
struct ConfigurationError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace ugrid
