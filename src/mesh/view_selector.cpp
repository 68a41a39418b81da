#include "view_selector.hpp"

namespace ugrid {

const char *to_string(MeshMode mode) {
  switch (mode) {
  case MeshMode::primal:
    return "primal";
  case MeshMode::dual:
    return "dual";
  }
  return "unknown";
}

namespace {

template <class Error>
void require_array(bool present, MeshMode mode, const std::string &name) {
  if (!present) {
    throw Error(std::string("mode unsupported for this mesh: the ") +
                to_string(mode) + " view needs " + name);
  }
}

void check_extent(const std::string &name, Int actual,
                  const std::string &other, Int expected) {
  if (actual != expected) {
    throw StructuralError(name + " has " + std::to_string(actual) +
                          " entries but " + other + " has " +
                          std::to_string(expected));
  }
}

void check_coordinates(const ViewDescriptor &view) {
  check_extent(view.m_node_lat_name, view.m_node_lat.extent(0),
               view.m_node_lon_name, view.m_node_lon.extent(0));
  check_extent(view.m_face_lat_name, view.m_face_lat.extent(0),
               view.m_face_lon_name, view.m_face_lon.extent(0));
  check_extent(view.m_face_nodes_name, view.m_face_nodes.extent(0),
               view.m_face_lon_name, view.m_face_lon.extent(0));
}

ViewDescriptor select_primal_view(const RawMesh &raw) {
  constexpr auto mode = MeshMode::primal;
  require_array<StructuralError>(has_array(raw.m_lon_vertex), mode,
                                 "lonVertex");
  require_array<StructuralError>(has_array(raw.m_lat_vertex), mode,
                                 "latVertex");
  require_array<StructuralError>(has_array(raw.m_lon_cell), mode, "lonCell");
  require_array<StructuralError>(has_array(raw.m_lat_cell), mode, "latCell");
  require_array<StructuralError>(has_array(raw.m_vertices_on_cell), mode,
                                 "verticesOnCell");

  ViewDescriptor view;
  view.m_mode = mode;
  view.m_node_lon_name = "lonVertex";
  view.m_node_lat_name = "latVertex";
  view.m_face_lon_name = "lonCell";
  view.m_face_lat_name = "latCell";
  view.m_face_nodes_name = "verticesOnCell";
  view.m_edge_nodes_name = "verticesOnEdge";

  view.m_node_lon = raw.m_lon_vertex;
  view.m_node_lat = raw.m_lat_vertex;
  view.m_face_lon = raw.m_lon_cell;
  view.m_face_lat = raw.m_lat_cell;
  view.m_face_nodes = raw.m_vertices_on_cell;
  view.m_nnodes_per_face = raw.m_nedges_on_cell;
  view.m_edge_nodes = raw.m_vertices_on_edge;

  check_coordinates(view);
  return view;
}

ViewDescriptor select_dual_view(const RawMesh &raw) {
  constexpr auto mode = MeshMode::dual;
  require_array<ConfigurationError>(has_array(raw.m_lon_cell), mode,
                                    "lonCell");
  require_array<ConfigurationError>(has_array(raw.m_lat_cell), mode,
                                    "latCell");
  require_array<ConfigurationError>(has_array(raw.m_lon_vertex), mode,
                                    "lonVertex");
  require_array<ConfigurationError>(has_array(raw.m_lat_vertex), mode,
                                    "latVertex");
  require_array<ConfigurationError>(has_array(raw.m_cells_on_vertex), mode,
                                    "cellsOnVertex");

  // A vertex next to a domain boundary (e.g. the coastline of an ocean mesh)
  // misses some of its cells and its dual face is not closed.
  UGRID_SCOPE(cells_on_vertex, raw.m_cells_on_vertex);
  const Int nvertices = cells_on_vertex.extent(0);
  const Int degree = cells_on_vertex.extent(1);
  Int nopen;
  ugrid_parallel_reduce(
      "count_open_dual_faces", nvertices,
      KOKKOS_LAMBDA(Int ivertex, Int & accum) {
        for (Int j = 0; j < degree; ++j) {
          if (cells_on_vertex(ivertex, j) == RawMesh::missing_index) {
            ++accum;
            break;
          }
        }
      },
      nopen);
  if (nopen > 0) {
    throw ConfigurationError(
        "mode unsupported for this mesh: cellsOnVertex leaves " +
        std::to_string(nopen) + " dual faces open");
  }

  ViewDescriptor view;
  view.m_mode = mode;
  view.m_node_lon_name = "lonCell";
  view.m_node_lat_name = "latCell";
  view.m_face_lon_name = "lonVertex";
  view.m_face_lat_name = "latVertex";
  view.m_face_nodes_name = "cellsOnVertex";
  view.m_edge_nodes_name = "cellsOnEdge";

  view.m_node_lon = raw.m_lon_cell;
  view.m_node_lat = raw.m_lat_cell;
  view.m_face_lon = raw.m_lon_vertex;
  view.m_face_lat = raw.m_lat_vertex;
  view.m_face_nodes = raw.m_cells_on_vertex;
  view.m_edge_nodes = raw.m_cells_on_edge;

  check_coordinates(view);
  return view;
}

} // namespace

ViewDescriptor select_view(const RawMesh &raw, bool use_dual) {
  if (use_dual) {
    return select_dual_view(raw);
  }
  return select_primal_view(raw);
}

} // namespace ugrid
