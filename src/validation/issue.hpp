#pragma once

#include <common.hpp>
#include <iosfwd>
#include <string>
#include <vector>

namespace ugrid {

enum class IssueKind {
  index_out_of_range,
  too_few_nodes,
  orphan_node,
  dangling_edge,
  nonpositive_radius,
  // geometry warnings, raised by the area engine or opt-in checks
  degenerate_triangle,
  reversed_winding,
  antimeridian_face,
};

struct Issue {
  IssueKind m_kind;
  // face, node or edge id, depending on the kind; -1 for mesh-wide issues
  Int m_id;
  std::string m_message;
};

const char *to_string(IssueKind kind);

bool is_geometry_warning(IssueKind kind);

Int count_issues(const std::vector<Issue> &issues, IssueKind kind);

std::ostream &operator<<(std::ostream &os, IssueKind kind);
std::ostream &operator<<(std::ostream &os, const Issue &issue);

} // namespace ugrid
