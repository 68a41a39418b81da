#include "test_utils.hpp"

using namespace ugrid;

RawMesh level1_mesh() {
  IcosahedralMeshParams params;
  params.m_nsubdiv = 1;
  return icosahedral_mesh(params);
}

void test_primal_mapping() {
  const auto raw = level1_mesh();
  const auto view = select_view(raw, false);

  check(view.m_mode == MeshMode::primal, "primal: wrong mode");
  check(view.m_face_nodes_name == "verticesOnCell",
        "primal: faces should come from verticesOnCell");
  check(view.nnodes() == 80 && view.nfaces() == 42,
        "primal: wrong node or face count");
  check(view.m_face_nodes.data() == raw.m_vertices_on_cell.data(),
        "primal: face nodes should alias verticesOnCell");
  check(view.m_node_lon.data() == raw.m_lon_vertex.data(),
        "primal: nodes should alias lonVertex");
  check(has_array(view.m_nnodes_per_face),
        "primal: nEdgesOnCell should be carried");
}

void test_dual_mapping() {
  const auto raw = level1_mesh();
  const auto view = select_view(raw, true);

  check(view.m_mode == MeshMode::dual, "dual: wrong mode");
  check(view.m_face_nodes_name == "cellsOnVertex",
        "dual: faces should come from cellsOnVertex");
  check(view.nnodes() == 42 && view.nfaces() == 80,
        "dual: wrong node or face count");
  check(view.m_face_nodes.data() == raw.m_cells_on_vertex.data(),
        "dual: face nodes should alias cellsOnVertex");
  check(view.m_edge_nodes.data() == raw.m_cells_on_edge.data(),
        "dual: edge nodes should alias cellsOnEdge");
}

void test_duality_counts() {
  const auto raw = level1_mesh();
  const Grid primal(raw);
  GridParams params;
  params.m_use_dual = true;
  const Grid dual(raw, params);

  check(primal.nnodes() == dual.nfaces(), "primal nodes != dual faces");
  check(primal.nfaces() == dual.nnodes(), "primal faces != dual nodes");
  check(primal.nedges() == dual.nedges(), "primal edges != dual edges");
  check(primal.mesh().m_max_face_nodes == 6, "primal faces are hexagons");
  check(dual.mesh().m_max_face_nodes == 3, "dual faces are triangles");
}

void test_missing_primal_arrays() {
  auto raw = level1_mesh();
  raw.m_vertices_on_cell = IntConst2d();
  check_throws<StructuralError>([&] { select_view(raw, false); },
                                "primal view without verticesOnCell");
  // the dual does not need it
  select_view(raw, true);
}

void test_missing_dual_arrays() {
  auto raw = level1_mesh();
  raw.m_cells_on_vertex = IntConst2d();
  check_throws<ConfigurationError>([&] { select_view(raw, true); },
                                   "dual view without cellsOnVertex");
  select_view(raw, false);
}

void test_open_dual_rejected() {
  auto raw = level1_mesh();
  const auto cells_on_vertex = copy_int2d(raw.m_cells_on_vertex);
  set_entry(cells_on_vertex, 7, 2, RawMesh::missing_index);
  raw.m_cells_on_vertex = cells_on_vertex;

  check_throws<ConfigurationError>([&] { select_view(raw, true); },
                                   "dual view with open faces");
  GridParams params;
  params.m_use_dual = true;
  check_throws<ConfigurationError>([&] { Grid grid(raw, params); },
                                   "dual grid with open faces");
}

void test_coordinate_mismatch() {
  auto raw = level1_mesh();
  raw.m_lat_vertex = make_real1d("latVertex", std::vector<Real>(10, 0));
  check_throws<StructuralError>([&] { select_view(raw, false); },
                                "latVertex shorter than lonVertex");
}

// Slot j of a face is the edge between its nodes j and j + 1.
void test_face_edges(bool use_dual) {
  GridParams params;
  params.m_use_dual = use_dual;
  const Grid grid(level1_mesh(), params);

  const auto face_nodes = host_copy(grid.mesh().m_face_nodes);
  const auto nnodes_per_face = host_copy(grid.mesh().m_nnodes_per_face);
  const auto edge_nodes = host_copy(grid.mesh().m_edge_nodes);
  const auto face_edges = host_copy(grid.face_edges());
  check(face_edges.extent(0) == face_nodes.extent(0) &&
            face_edges.extent(1) == face_nodes.extent(1),
        "face_edges should have the shape of face_nodes");

  for (Int iface = 0; iface < grid.nfaces(); ++iface) {
    const Int n = nnodes_per_face(iface);
    for (Int j = 0; j < n; ++j) {
      const Int iedge = face_edges(iface, j);
      check(iedge >= 0 && iedge < grid.nedges(), "face edge is fill");
      const Int a = face_nodes(iface, j);
      const Int b = face_nodes(iface, (j + 1) % n);
      const Int ea = edge_nodes(iedge, 0);
      const Int eb = edge_nodes(iedge, 1);
      check((ea == a && eb == b) || (ea == b && eb == a),
            "face edge does not join consecutive face nodes");
    }
    for (Int j = n; j < Int(face_edges.extent(1)); ++j) {
      check(face_edges(iface, j) < 0, "unused face edge slot is not fill");
    }
  }
}

int main() {
  Kokkos::initialize();
  {
    std::cout << "View selection" << std::endl;
    test_primal_mapping();
    test_dual_mapping();
    test_duality_counts();
    test_face_edges(false);
    test_face_edges(true);
    test_missing_primal_arrays();
    test_missing_dual_arrays();
    test_open_dual_rejected();
    test_coordinate_mismatch();
  }
  Kokkos::finalize();
}
