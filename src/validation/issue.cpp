#include "issue.hpp"
#include <algorithm>
#include <ostream>

namespace ugrid {

const char *to_string(IssueKind kind) {
  switch (kind) {
  case IssueKind::index_out_of_range:
    return "index_out_of_range";
  case IssueKind::too_few_nodes:
    return "too_few_nodes";
  case IssueKind::orphan_node:
    return "orphan_node";
  case IssueKind::dangling_edge:
    return "dangling_edge";
  case IssueKind::nonpositive_radius:
    return "nonpositive_radius";
  case IssueKind::degenerate_triangle:
    return "degenerate_triangle";
  case IssueKind::reversed_winding:
    return "reversed_winding";
  case IssueKind::antimeridian_face:
    return "antimeridian_face";
  }
  return "unknown";
}

bool is_geometry_warning(IssueKind kind) {
  return kind == IssueKind::degenerate_triangle ||
         kind == IssueKind::reversed_winding ||
         kind == IssueKind::antimeridian_face;
}

Int count_issues(const std::vector<Issue> &issues, IssueKind kind) {
  return std::count_if(issues.begin(), issues.end(),
                       [kind](const Issue &issue) { return issue.m_kind == kind; });
}

std::ostream &operator<<(std::ostream &os, IssueKind kind) {
  return os << to_string(kind);
}

std::ostream &operator<<(std::ostream &os, const Issue &issue) {
  os << (is_geometry_warning(issue.m_kind) ? "warning " : "issue ")
     << issue.m_kind;
  if (issue.m_id >= 0) {
    os << " [" << issue.m_id << "]";
  }
  return os << ": " << issue.m_message;
}

} // namespace ugrid
