#pragma once

#include <common.hpp>
#include <mesh/normalized_mesh.hpp>
#include <validation/issue.hpp>
#include <vector>

namespace ugrid {

struct ValidationOptions {
  bool m_check_edge_symmetry = true;
  bool m_check_orphan_nodes = true;
  bool m_check_antimeridian = false;
};

// Reports every broken invariant of the mesh without modifying it. Callers
// decide which issues are fatal.
std::vector<Issue> validate(const NormalizedMesh &mesh,
                            const ValidationOptions &options =
                                ValidationOptions());

} // namespace ugrid
