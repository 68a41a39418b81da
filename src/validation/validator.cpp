#include "validator.hpp"
#include <geometry/coordinates.hpp>
#include <algorithm>
#include <cstdint>
#include <unordered_set>

namespace ugrid {

namespace {

bool is_fill(Int idx, Int fill_value) { return idx == fill_value; }

bool in_range(Int idx, Int n) { return idx >= 0 && idx < n; }

std::int64_t edge_key(Int a, Int b, Int nnodes) {
  return std::int64_t(std::min(a, b)) * nnodes + std::max(a, b);
}

void check_radius(const NormalizedMesh &mesh, std::vector<Issue> &issues) {
  if (mesh.m_on_sphere && !(mesh.m_sphere_radius > 0)) {
    issues.push_back({IssueKind::nonpositive_radius, -1,
                      "mesh is on a sphere but sphere_radius = " +
                          std::to_string(mesh.m_sphere_radius)});
  }
}

} // namespace

std::vector<Issue> validate(const NormalizedMesh &mesh,
                            const ValidationOptions &options) {
  std::vector<Issue> issues;
  check_radius(mesh, issues);

  const Int nnodes = mesh.m_nnodes;
  const Int fill_value = mesh.m_fill_value;

  const auto face_nodes = host_copy(mesh.m_face_nodes);
  const Int nfaces = face_nodes.extent(0);
  const Int width = face_nodes.extent(1);

  std::vector<bool> referenced(nnodes, false);
  std::unordered_set<std::int64_t> face_edges;

  std::vector<Int> nodes;
  for (Int iface = 0; iface < nfaces; ++iface) {
    nodes.clear();
    for (Int j = 0; j < width; ++j) {
      const Int jnode = face_nodes(iface, j);
      if (is_fill(jnode, fill_value)) {
        continue;
      }
      if (!in_range(jnode, nnodes)) {
        issues.push_back({IssueKind::index_out_of_range, iface,
                          "face_nodes(" + std::to_string(iface) + ", " +
                              std::to_string(j) + ") = " +
                              std::to_string(jnode) + " is not a node id"});
        continue;
      }
      nodes.push_back(jnode);
      referenced[jnode] = true;
    }

    const Int n = nodes.size();
    if (n < 3) {
      issues.push_back({IssueKind::too_few_nodes, iface,
                        "face " + std::to_string(iface) + " has " +
                            std::to_string(n) + " valid nodes"});
    }
    for (Int j = 0; n > 1 && j < n; ++j) {
      face_edges.insert(edge_key(nodes[j], nodes[(j + 1) % n], nnodes));
    }
  }

  const auto edge_nodes = host_copy(mesh.m_edge_nodes);
  const Int nedges = edge_nodes.extent(0);
  for (Int iedge = 0; iedge < nedges; ++iedge) {
    const Int a = edge_nodes(iedge, 0);
    const Int b = edge_nodes(iedge, 1);
    bool valid = true;
    for (const Int idx : {a, b}) {
      if (!is_fill(idx, fill_value) && !in_range(idx, nnodes)) {
        issues.push_back({IssueKind::index_out_of_range, iedge,
                          "edge_nodes(" + std::to_string(iedge) + ") = " +
                              std::to_string(idx) + " is not a node id"});
        valid = false;
      }
    }
    // edges with a missing end are allowed (domain boundaries)
    if (!valid || is_fill(a, fill_value) || is_fill(b, fill_value)) {
      continue;
    }
    if (options.m_check_edge_symmetry &&
        face_edges.count(edge_key(a, b, nnodes)) == 0) {
      issues.push_back({IssueKind::dangling_edge, iedge,
                        "edge " + std::to_string(iedge) + " (" +
                            std::to_string(a) + ", " + std::to_string(b) +
                            ") bounds no face"});
    }
  }

  if (options.m_check_orphan_nodes) {
    for (Int inode = 0; inode < nnodes; ++inode) {
      if (!referenced[inode]) {
        issues.push_back({IssueKind::orphan_node, inode,
                          "node " + std::to_string(inode) +
                              " belongs to no face"});
      }
    }
  }

  if (options.m_check_antimeridian) {
    for (const Int iface :
         find_antimeridian_faces(mesh.m_face_nodes, mesh.m_node_lon)) {
      issues.push_back({IssueKind::antimeridian_face, iface,
                        "face " + std::to_string(iface) +
                            " crosses the antimeridian"});
    }
  }

  return issues;
}

} // namespace ugrid
