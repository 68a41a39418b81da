#pragma once

#include <common.hpp>
#include <mesh/raw_mesh.hpp>
#include <string>

namespace ugrid {

struct NormalizeOptions {
  Int m_index_base = RawMesh::index_base;
  // raw value meaning "missing" (MPAS also pads unused slots with it)
  Int m_raw_missing = RawMesh::missing_index;
  Int m_fill_value = default_fill_value;
  // exclusive bound on re-based indices, unchecked when negative
  Int m_upper_bound = -1;
  bool m_allow_empty_rows = false;
};

struct NormalizedConnectivity {
  Int2d m_array;
  Bool2d m_fill_mask;
  Int1d m_nvalid;

  Int nrows() const { return m_array.extent(0); }
  Int ncols() const { return m_array.extent(1); }
};

// Re-bases every non-missing entry of `raw` by the index base and replaces
// missing entries with the fill value. When `row_counts` is allocated, slots
// at or past the count of their row are padding and become fill as well.
// Throws StructuralError on a row without any valid entry (unless allowed)
// and on an entry below the index base or outside the declared bound.
NormalizedConnectivity
normalize_connectivity(const std::string &name, const IntConst2d &raw,
                       const NormalizeOptions &options,
                       const IntConst1d &row_counts = IntConst1d());

Int max_row_count(const IntConst1d &nvalid);

// Moves the valid entries of every row to its front, keeping their order,
// and trims the rows to `width` columns.
Int2d pack_connectivity(const std::string &name,
                        const NormalizedConnectivity &conn, Int width,
                        Int fill_value);

// Unique undirected node pairs along the boundary of every face, for meshes
// that do not carry their own edge array.
Int2d build_edge_nodes(const std::string &name, const IntConst2d &face_nodes);

// Edge ids around every face: slot j holds the edge joining nodes j and j + 1
// of the row (the last slot closes the face). Same width as `face_nodes`,
// unused slots and node pairs missing from `edge_nodes` are fill.
Int2d build_face_edges(const std::string &name, const IntConst2d &face_nodes,
                       const IntConst2d &edge_nodes, Int fill_value);

} // namespace ugrid
