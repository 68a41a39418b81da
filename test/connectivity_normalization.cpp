#include "test_utils.hpp"
#include <limits>

using namespace ugrid;

constexpr Int F = default_fill_value;

void check_equal(const Int2d &array, const std::vector<Int> &expected,
                 const std::string &what) {
  const auto array_h = host_copy(array);
  const Int ncols = array_h.extent(1);
  check(Int(array_h.size()) == Int(expected.size()), what + ": wrong size");
  for (Int i = 0; i < Int(array_h.extent(0)); ++i) {
    for (Int j = 0; j < ncols; ++j) {
      if (array_h(i, j) != expected[i * ncols + j]) {
        throw std::runtime_error(what + ": mismatch at (" + std::to_string(i) +
                                 ", " + std::to_string(j) + "), got " +
                                 std::to_string(array_h(i, j)));
      }
    }
  }
}

void test_rebasing() {
  const auto raw = make_int2d("verticesOnCell", 2, 4, {1, 2, 3, 0, 4, 5, 0, 0});
  const auto conn = normalize_connectivity("verticesOnCell", raw, {});
  check_equal(conn.m_array, {0, 1, 2, F, 3, 4, F, F}, "rebasing");

  const auto nvalid_h = host_copy(conn.m_nvalid);
  check(nvalid_h(0) == 3 && nvalid_h(1) == 2, "rebasing: wrong valid counts");

  const auto mask_h = host_copy(conn.m_fill_mask);
  check(!mask_h(0, 2) && mask_h(0, 3) && mask_h(1, 2),
        "rebasing: wrong fill mask");

  // input untouched
  const auto raw_h = host_copy(raw);
  check(raw_h(0, 0) == 1 && raw_h(0, 3) == 0, "rebasing: input was modified");
}

void test_row_count_padding() {
  // MPAS files may pad by repeating the last vertex
  const auto raw = make_int2d("verticesOnCell", 2, 4, {1, 2, 3, 3, 2, 3, 4, 5});
  const auto counts = make_int1d("nEdgesOnCell", {3, 4});
  const auto conn = normalize_connectivity("verticesOnCell", raw, {}, counts);
  check_equal(conn.m_array, {0, 1, 2, F, 1, 2, 3, 4}, "row count padding");
  check(max_row_count(conn.m_nvalid) == 4, "row count padding: wrong max");

  const auto bad_counts = make_int1d("nEdgesOnCell", {3});
  check_throws<StructuralError>(
      [&] { normalize_connectivity("verticesOnCell", raw, {}, bad_counts); },
      "row counts of the wrong length were accepted");
}

void test_degree_zero_row() {
  const auto raw = make_int2d("verticesOnCell", 3, 3, {1, 2, 3, 0, 0, 0, 2, 3, 4});
  check_throws<StructuralError>(
      [&] { normalize_connectivity("verticesOnCell", raw, {}); },
      "degree-0 face was accepted");

  NormalizeOptions options;
  options.m_allow_empty_rows = true;
  const auto conn = normalize_connectivity("verticesOnEdge", raw, options);
  check(host_copy(conn.m_nvalid)(1) == 0, "empty row should have no entries");
}

void test_index_out_of_range() {
  const auto raw = make_int2d("verticesOnCell", 2, 3, {1, 2, 3, 2, 7, 4});
  NormalizeOptions options;
  options.m_upper_bound = 5;
  check_throws<StructuralError>(
      [&] { normalize_connectivity("verticesOnCell", raw, options); },
      "out-of-range index was accepted");

  options.m_upper_bound = 7;
  normalize_connectivity("verticesOnCell", raw, options);
}

// Entries below the index base are rejected even without an upper bound.
void test_index_below_base() {
  const Int int_min = std::numeric_limits<Int>::min();
  auto raw = make_int2d("verticesOnCell", 2, 3, {1, 2, 3, 2, int_min, 4});
  check_throws<StructuralError>(
      [&] { normalize_connectivity("verticesOnCell", raw, {}); },
      "most negative index was accepted");

  raw = make_int2d("verticesOnCell", 2, 3, {1, 2, 3, 2, -2, 4});
  check_throws<StructuralError>(
      [&] { normalize_connectivity("verticesOnCell", raw, {}); },
      "negative index was accepted");
}

void test_idempotence() {
  const auto raw = make_int2d("verticesOnCell", 2, 4, {1, 2, 3, 0, 4, 5, 0, 0});
  const auto once = normalize_connectivity("verticesOnCell", raw, {});

  NormalizeOptions options;
  options.m_index_base = 0;
  options.m_raw_missing = default_fill_value;
  const auto twice =
      normalize_connectivity("verticesOnCell", once.m_array, options);

  check_equal(twice.m_array, {0, 1, 2, F, 3, 4, F, F}, "idempotence");
}

void test_packing() {
  const auto raw = make_int2d("cellsOnVertex", 2, 5, {0, 2, 0, 3, 4, 1, 0, 2, 3, 0});
  NormalizeOptions options;
  options.m_fill_value = -1;
  const auto conn = normalize_connectivity("cellsOnVertex", raw, options);
  const Int width = max_row_count(conn.m_nvalid);
  check(width == 3, "packing: wrong width");
  const auto packed = pack_connectivity("face_nodes", conn, width, -1);
  check_equal(packed, {1, 2, 3, 0, 1, 2}, "packing");
}

void test_edges_from_faces() {
  const auto faces = make_int2d("face_nodes", 2, 4, {0, 1, 2, F, 0, 2, 3, F});
  const auto edges = build_edge_nodes("edge_nodes", faces);
  check_equal(edges, {0, 1, 0, 2, 0, 3, 1, 2, 2, 3}, "edges from faces");
}

void test_face_edges() {
  const auto faces = make_int2d("face_nodes", 2, 4, {0, 1, 2, F, 0, 2, 3, F});
  const auto edges =
      make_int2d("edge_nodes", 5, 2, {0, 1, 0, 2, 0, 3, 1, 2, 2, 3});
  const auto face_edges = build_face_edges("face_edges", faces, edges, F);
  check_equal(face_edges, {0, 3, 1, F, 1, 4, 2, F}, "face edges");

  // an edge array missing (2, 3) leaves that slot as fill
  const auto partial = make_int2d("edge_nodes", 4, 2, {1, 0, 2, 0, 3, 0, 2, 1});
  check_equal(build_face_edges("face_edges", faces, partial, F),
              {0, 3, 1, F, 1, F, 2, F}, "face edges with a missing edge");
}

int main() {
  Kokkos::initialize();
  {
    std::cout << "Connectivity normalization" << std::endl;
    test_rebasing();
    test_row_count_padding();
    test_degree_zero_row();
    test_index_out_of_range();
    test_index_below_base();
    test_idempotence();
    test_packing();
    test_edges_from_faces();
    test_face_edges();
  }
  Kokkos::finalize();
}
