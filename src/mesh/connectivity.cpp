#include "connectivity.hpp"
#include <algorithm>
#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ugrid {

NormalizedConnectivity
normalize_connectivity(const std::string &name, const IntConst2d &raw,
                       const NormalizeOptions &options,
                       const IntConst1d &row_counts) {
  const Int nrows = raw.extent(0);
  const Int ncols = raw.extent(1);

  const bool use_counts = has_array(row_counts);
  if (use_counts && Int(row_counts.extent(0)) != nrows) {
    throw StructuralError(name + ": row count array has " +
                          std::to_string(row_counts.extent(0)) +
                          " entries, expected " + std::to_string(nrows));
  }

  NormalizedConnectivity conn;
  conn.m_array = Int2d(name, nrows, ncols);
  conn.m_fill_mask = Bool2d(name + "_fill_mask", nrows, ncols);
  conn.m_nvalid = Int1d(name + "_nvalid", nrows);

  const Int index_base = options.m_index_base;
  const Int raw_missing = options.m_raw_missing;
  const Int fill_value = options.m_fill_value;

  UGRID_SCOPE(array, conn.m_array);
  UGRID_SCOPE(fill_mask, conn.m_fill_mask);
  UGRID_SCOPE(nvalid, conn.m_nvalid);

  ugrid_parallel_for(
      "normalize_" + name, nrows, KOKKOS_LAMBDA(Int irow) {
        const Int count = use_counts ? row_counts(irow) : ncols;
        Int n = 0;
        for (Int j = 0; j < ncols; ++j) {
          const Int value = raw(irow, j);
          const bool missing = j >= count || value == raw_missing;
          fill_mask(irow, j) = missing;
          // entries below the base are rejected by the range check
          array(irow, j) =
              missing || value < index_base ? fill_value : value - index_base;
          if (!missing) {
            ++n;
          }
        }
        nvalid(irow) = n;
      });

  if (!options.m_allow_empty_rows) {
    Int first_empty;
    ugrid_parallel_reduce(
        "find_empty_rows_" + name, nrows,
        KOKKOS_LAMBDA(Int irow, Int & first) {
          if (nvalid(irow) == 0 && irow < first) {
            first = irow;
          }
        },
        Kokkos::Min<Int>(first_empty));
    if (first_empty < nrows) {
      throw StructuralError(name + ": row " + std::to_string(first_empty) +
                            " holds only padding (degree-0 face)");
    }
  }

  // flat positions may exceed the Int range on large meshes
  const Int upper_bound = options.m_upper_bound;
  const std::int64_t nentries = std::int64_t(nrows) * ncols;
  std::int64_t first_bad;
  ugrid_parallel_reduce(
      "check_index_range_" + name, nrows,
      KOKKOS_LAMBDA(Int irow, std::int64_t & first) {
        for (Int j = 0; j < ncols; ++j) {
          if (fill_mask(irow, j)) {
            continue;
          }
          const std::int64_t rebased = std::int64_t(raw(irow, j)) - index_base;
          const bool bad =
              rebased < 0 || (upper_bound >= 0 && rebased >= upper_bound);
          const std::int64_t pos = std::int64_t(irow) * ncols + j;
          if (bad && pos < first) {
            first = pos;
          }
        }
      },
      Kokkos::Min<std::int64_t>(first_bad));
  if (first_bad < nentries) {
    const Int irow = first_bad / ncols;
    const Int j = first_bad % ncols;
    const auto raw_host = host_copy(raw);
    const std::string allowed =
        upper_bound >= 0
            ? "[" + std::to_string(index_base) + ", " +
                  std::to_string(std::int64_t(upper_bound) + index_base) + ")"
            : "[" + std::to_string(index_base) + ", inf)";
    throw StructuralError(name + ": entry (" + std::to_string(irow) + ", " +
                          std::to_string(j) + ") = " +
                          std::to_string(raw_host(irow, j)) +
                          " is outside " + allowed);
  }

  return conn;
}

Int max_row_count(const IntConst1d &nvalid) {
  Int max_count;
  ugrid_parallel_reduce(
      "max_row_count", Int(nvalid.extent(0)),
      KOKKOS_LAMBDA(Int irow, Int & max) {
        if (nvalid(irow) > max) {
          max = nvalid(irow);
        }
      },
      Kokkos::Max<Int>(max_count));
  return std::max(max_count, 0);
}

Int2d pack_connectivity(const std::string &name,
                        const NormalizedConnectivity &conn, Int width,
                        Int fill_value) {
  const Int nrows = conn.nrows();
  const Int ncols = conn.ncols();
  Int2d packed(name, nrows, width);

  UGRID_SCOPE(array, conn.m_array);
  UGRID_SCOPE(fill_mask, conn.m_fill_mask);

  ugrid_parallel_for(
      "pack_" + name, nrows, KOKKOS_LAMBDA(Int irow) {
        Int k = 0;
        for (Int j = 0; j < ncols && k < width; ++j) {
          if (!fill_mask(irow, j)) {
            packed(irow, k) = array(irow, j);
            ++k;
          }
        }
        for (; k < width; ++k) {
          packed(irow, k) = fill_value;
        }
      });
  return packed;
}

Int2d build_edge_nodes(const std::string &name, const IntConst2d &face_nodes) {
  const auto face_nodes_h = host_copy(face_nodes);
  const Int nfaces = face_nodes_h.extent(0);
  const Int width = face_nodes_h.extent(1);

  std::vector<std::pair<Int, Int>> pairs;
  pairs.reserve(nfaces * width);
  std::vector<Int> nodes;
  for (Int iface = 0; iface < nfaces; ++iface) {
    nodes.clear();
    for (Int j = 0; j < width; ++j) {
      if (face_nodes_h(iface, j) >= 0) {
        nodes.push_back(face_nodes_h(iface, j));
      }
    }
    const Int n = nodes.size();
    if (n < 2) {
      continue;
    }
    for (Int j = 0; j < n; ++j) {
      const Int a = nodes[j];
      const Int b = nodes[(j + 1) % n];
      if (a != b) {
        pairs.emplace_back(std::min(a, b), std::max(a, b));
      }
    }
  }
  std::sort(pairs.begin(), pairs.end());
  pairs.erase(std::unique(pairs.begin(), pairs.end()), pairs.end());

  Int2d edge_nodes(name, pairs.size(), 2);
  auto edge_nodes_h = create_mirror_view(edge_nodes);
  for (size_t iedge = 0; iedge < pairs.size(); ++iedge) {
    edge_nodes_h(iedge, 0) = pairs[iedge].first;
    edge_nodes_h(iedge, 1) = pairs[iedge].second;
  }
  deep_copy(edge_nodes, edge_nodes_h);
  return edge_nodes;
}

Int2d build_face_edges(const std::string &name, const IntConst2d &face_nodes,
                       const IntConst2d &edge_nodes, Int fill_value) {
  const auto face_nodes_h = host_copy(face_nodes);
  const auto edge_nodes_h = host_copy(edge_nodes);
  const Int nfaces = face_nodes_h.extent(0);
  const Int width = face_nodes_h.extent(1);
  const Int nedges = edge_nodes_h.extent(0);

  const auto key = [](Int a, Int b) {
    return (std::int64_t(std::min(a, b)) << 32) |
           std::uint32_t(std::max(a, b));
  };

  std::unordered_map<std::int64_t, Int> edge_ids;
  edge_ids.reserve(nedges);
  for (Int iedge = 0; iedge < nedges; ++iedge) {
    const Int a = edge_nodes_h(iedge, 0);
    const Int b = edge_nodes_h(iedge, 1);
    if (a >= 0 && b >= 0) {
      edge_ids.emplace(key(a, b), iedge);
    }
  }

  Int2d face_edges(name, nfaces, width);
  auto face_edges_h = create_mirror_view(face_edges);
  std::vector<Int> nodes;
  for (Int iface = 0; iface < nfaces; ++iface) {
    nodes.clear();
    for (Int j = 0; j < width; ++j) {
      if (face_nodes_h(iface, j) >= 0) {
        nodes.push_back(face_nodes_h(iface, j));
      }
    }
    const Int n = nodes.size();
    for (Int j = 0; j < width; ++j) {
      face_edges_h(iface, j) = fill_value;
      if (n < 2 || j >= n) {
        continue;
      }
      const auto it = edge_ids.find(key(nodes[j], nodes[(j + 1) % n]));
      if (it != edge_ids.end()) {
        face_edges_h(iface, j) = it->second;
      }
    }
  }
  deep_copy(face_edges, face_edges_h);
  return face_edges;
}

} // namespace ugrid
