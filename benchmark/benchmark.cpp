#include <chrono>
#include <iostream>
#include <mesh/file_mesh.hpp>
#include <string>
#include <ugrid.hpp>

using namespace ugrid;

void run(const RawMesh &raw, bool use_dual, AreaMethod method, Int nrepeat) {
  GridParams params;
  params.m_use_dual = use_dual;
  params.m_area.m_method = method;

  Kokkos::fence();
  auto ts = std::chrono::steady_clock::now();
  const Grid grid(raw, params);
  Kokkos::fence();
  auto te = std::chrono::steady_clock::now();
  const auto construction_second =
      std::chrono::duration<double>(te - ts).count();

  for (const auto &issue : grid.construction_issues()) {
    std::cout << issue << std::endl;
  }

  // warm up, also fills the coordinate caches
  grid.face_areas();

  timer_start("face_areas");
  Kokkos::fence();
  ts = std::chrono::steady_clock::now();
  for (Int i = 0; i < nrepeat; ++i) {
    compute_face_areas(grid.mesh().m_face_nodes, grid.node_cartesian(),
                       grid.face_cartesian(), grid.mesh().m_sphere_radius,
                       params.m_area);
  }
  Kokkos::fence();
  te = std::chrono::steady_clock::now();
  const auto area_second = std::chrono::duration<double>(te - ts).count();
  timer_stop("face_areas");

  const Real radius = grid.mesh().m_sphere_radius;
  std::cout << to_string(grid.mode()) << " faces: " << grid.nfaces()
            << " total area / (4 pi r^2) - 1: "
            << grid.total_face_area() / (4 * pi * radius * radius) - 1
            << std::endl;
  for (const auto &warning : grid.geometry_warnings()) {
    std::cout << warning << std::endl;
  }

  std::cerr << construction_second << " " << area_second / nrepeat
            << std::endl;
}

// benchmark [mesh.nc | nsubdiv] [dual] [quadrature] [nrepeat]
int main(int argc, char *argv[]) {
  Kokkos::initialize();
  {
    const std::string source = argc > 1 ? argv[1] : "6";
    const bool use_dual = argc > 2 ? std::stoi(argv[2]) != 0 : false;
    const AreaMethod method = argc > 3 && std::stoi(argv[3]) != 0
                                  ? AreaMethod::quadrature
                                  : AreaMethod::spherical_excess;
    const Int nrepeat = argc > 4 ? std::stoi(argv[4]) : 10;

    RawMesh raw;
    if (source.find(".nc") != std::string::npos) {
      raw = read_mpas_mesh(source);
    } else {
      IcosahedralMeshParams mesh_params;
      mesh_params.m_nsubdiv = std::stoi(source);
      raw = icosahedral_mesh(mesh_params);
    }

    run(raw, use_dual, method, nrepeat);
  }
  Kokkos::finalize();
}
