#pragma once

#include <common.hpp>
#include <mesh/raw_mesh.hpp>
#include <string>

namespace ugrid {

enum class MeshMode { primal, dual };

const char *to_string(MeshMode mode);

// Which raw arrays play the role of nodes, face centers and face-node
// connectivity for one mode. The views alias the RawMesh buffers.
struct ViewDescriptor {
  MeshMode m_mode = MeshMode::primal;

  std::string m_node_lon_name;
  std::string m_node_lat_name;
  std::string m_face_lon_name;
  std::string m_face_lat_name;
  std::string m_face_nodes_name;
  std::string m_edge_nodes_name;

  RealConst1d m_node_lon;
  RealConst1d m_node_lat;
  RealConst1d m_face_lon;
  RealConst1d m_face_lat;

  IntConst2d m_face_nodes;
  // per-face degree, only carried by the primal (nEdgesOnCell)
  IntConst1d m_nnodes_per_face;
  // unallocated when the mesh has no edge array for this mode
  IntConst2d m_edge_nodes;

  Int nnodes() const { return m_node_lon.extent(0); }
  Int nfaces() const { return m_face_nodes.extent(0); }
};

// Primal: vertices are nodes, cells are faces (verticesOnCell).
// Dual: cells are nodes, vertices are faces (cellsOnVertex).
// Throws StructuralError when the primal arrays are missing or inconsistent
// and ConfigurationError when the mesh has no closed dual.
ViewDescriptor select_view(const RawMesh &raw, bool use_dual);

} // namespace ugrid
