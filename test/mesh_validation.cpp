#include "test_utils.hpp"

using namespace ugrid;

constexpr Int F = default_fill_value;

// Two triangles sharing the edge (0, 2), plus an unused node 4.
NormalizedMesh small_mesh() {
  NormalizedMesh mesh;
  mesh.m_nnodes = 5;
  mesh.m_nfaces = 2;
  mesh.m_nedges = 2;
  mesh.m_max_face_nodes = 3;
  mesh.m_node_lon = make_real1d("node_lon", {0, 10, 10, 0, 50});
  mesh.m_node_lat = make_real1d("node_lat", {0, 0, 10, 10, 50});
  mesh.m_face_lon = make_real1d("face_lon", {7, 3});
  mesh.m_face_lat = make_real1d("face_lat", {3, 7});
  mesh.m_face_nodes = make_int2d("face_nodes", 2, 3, {0, 1, 2, 0, 2, 3});
  mesh.m_nnodes_per_face = make_int1d("nnodes_per_face", {3, 3});
  mesh.m_edge_nodes = make_int2d("edge_nodes", 2, 2, {0, 1, 2, 3});
  return mesh;
}

void test_orphan_node() {
  const auto issues = validate(small_mesh());
  for (const auto &issue : issues) {
    std::cout << "  " << issue << std::endl;
  }
  check(issues.size() == 1, "expected a single issue");
  check(issues[0].m_kind == IssueKind::orphan_node && issues[0].m_id == 4,
        "node 4 should be reported as orphan");

  ValidationOptions options;
  options.m_check_orphan_nodes = false;
  check(validate(small_mesh(), options).empty(),
        "orphan check should be optional");
}

void test_index_out_of_range() {
  auto mesh = small_mesh();
  mesh.m_face_nodes = make_int2d("face_nodes", 2, 3, {0, 1, 2, 0, 2, 9});
  mesh.m_edge_nodes = make_int2d("edge_nodes", 2, 2, {0, 1, -3, 3});
  ValidationOptions options;
  options.m_check_orphan_nodes = false;
  const auto issues = validate(mesh, options);
  for (const auto &issue : issues) {
    std::cout << "  " << issue << std::endl;
  }
  check(count_issues(issues, IssueKind::index_out_of_range) == 2,
        "expected two out-of-range entries");
  check(issues[0].m_id == 1, "out-of-range face should be face 1");
  check(count_issues(issues, IssueKind::too_few_nodes) == 1,
        "face 1 is left with two valid nodes");
}

// A node id past the end must be reported, not read, by the antimeridian
// check.
void test_antimeridian_with_bad_index() {
  auto mesh = small_mesh();
  mesh.m_face_nodes = make_int2d("face_nodes", 2, 3, {0, 1, 2, 0, 2, 9});
  check(find_antimeridian_faces(mesh.m_face_nodes, mesh.m_node_lon).empty(),
        "no face crosses the antimeridian");

  ValidationOptions options;
  options.m_check_orphan_nodes = false;
  options.m_check_antimeridian = true;
  const auto issues = validate(mesh, options);
  check(count_issues(issues, IssueKind::index_out_of_range) == 1,
        "node 9 should be reported out of range");
  check(count_issues(issues, IssueKind::antimeridian_face) == 0,
        "no face crosses the antimeridian");
}

void test_too_few_nodes() {
  auto mesh = small_mesh();
  mesh.m_face_nodes = make_int2d("face_nodes", 2, 3, {0, 1, 2, 0, 2, F});
  ValidationOptions options;
  options.m_check_orphan_nodes = false;
  options.m_check_edge_symmetry = false;
  const auto issues = validate(mesh, options);
  check(issues.size() == 1 && issues[0].m_kind == IssueKind::too_few_nodes &&
            issues[0].m_id == 1,
        "face 1 should have too few nodes");
}

void test_dangling_edge() {
  auto mesh = small_mesh();
  mesh.m_edge_nodes = make_int2d("edge_nodes", 3, 2, {0, 1, 1, 3, 2, F});
  mesh.m_nedges = 3;
  ValidationOptions options;
  options.m_check_orphan_nodes = false;
  const auto issues = validate(mesh, options);
  check(issues.size() == 1 && issues[0].m_kind == IssueKind::dangling_edge &&
            issues[0].m_id == 1,
        "edge (1, 3) bounds no face");
}

void test_nonpositive_radius() {
  auto mesh = small_mesh();
  mesh.m_sphere_radius = -1;
  const auto issues = validate(mesh);
  check(count_issues(issues, IssueKind::nonpositive_radius) == 1,
        "negative radius not reported");

  mesh.m_on_sphere = false;
  check(count_issues(validate(mesh), IssueKind::nonpositive_radius) == 0,
        "radius of a planar mesh should not be checked");

  auto raw = icosahedral_mesh(IcosahedralMeshParams());
  raw.m_sphere_radius = 0;
  check_throws<ConfigurationError>([&] { Grid grid(raw); },
                                   "grid on a sphere of radius 0");
}

void test_antimeridian_opt_in() {
  auto mesh = small_mesh();
  mesh.m_node_lon = make_real1d("node_lon", {170, -170, -175, 175, 50});
  check(count_issues(validate(mesh), IssueKind::antimeridian_face) == 0,
        "antimeridian check should be off by default");

  ValidationOptions options;
  options.m_check_antimeridian = true;
  const auto issues = validate(mesh, options);
  check(count_issues(issues, IssueKind::antimeridian_face) == 2,
        "both faces cross the antimeridian");
  check(is_geometry_warning(IssueKind::antimeridian_face),
        "antimeridian faces are warnings");
}

void test_grid_construction_issues() {
  IcosahedralMeshParams mesh_params;
  mesh_params.m_nsubdiv = 1;
  auto raw = icosahedral_mesh(mesh_params);

  // cell 4 keeps only two of its vertices
  Int1d nedges_on_cell("nEdgesOnCell", raw.m_nedges_on_cell.extent(0));
  deep_copy(nedges_on_cell, raw.m_nedges_on_cell);
  auto nedges_on_cell_h = host_copy(nedges_on_cell);
  nedges_on_cell_h(4) = 2;
  deep_copy(nedges_on_cell, nedges_on_cell_h);
  raw.m_nedges_on_cell = nedges_on_cell;

  GridParams params;
  params.m_validation.m_check_edge_symmetry = false;
  const Grid grid(raw, params);
  const auto &issues = grid.construction_issues();
  check(count_issues(issues, IssueKind::too_few_nodes) == 1 &&
            issues[0].m_id == 4,
        "cell 4 should be reported at construction");

  const auto warnings = grid.geometry_warnings();
  check(warnings.size() == 1 &&
            warnings[0].m_kind == IssueKind::too_few_nodes,
        "cell 4 should have a zero area and a warning");
  check(host_copy(grid.face_area())(4) == 0, "cell 4 should have zero area");
}

void test_edges_built_from_faces() {
  IcosahedralMeshParams mesh_params;
  mesh_params.m_nsubdiv = 1;
  auto raw = icosahedral_mesh(mesh_params);
  raw.m_vertices_on_edge = IntConst2d();

  const Grid grid(raw);
  check(grid.nedges() == 120, "level 1 mesh has 120 edges");
  check(grid.construction_issues().empty(),
        "edges built from faces should be consistent");
}

int main() {
  Kokkos::initialize();
  {
    std::cout << "Mesh validation" << std::endl;
    test_orphan_node();
    test_index_out_of_range();
    test_antimeridian_with_bad_index();
    test_too_few_nodes();
    test_dangling_edge();
    test_nonpositive_radius();
    test_antimeridian_opt_in();
    test_grid_construction_issues();
    test_edges_built_from_faces();
  }
  Kokkos::finalize();
}
