#include "grid.hpp"
#include <mesh/connectivity.hpp>

namespace ugrid {

Grid::Grid(const RawMesh &raw, const GridParams &params) : m_params(params) {
  check_params(raw);

  m_view = select_view(raw, m_params.m_use_dual);

  m_mesh.m_mode = m_view.m_mode;
  m_mesh.m_fill_value = m_params.m_fill_value;
  m_mesh.m_nnodes = m_view.nnodes();
  m_mesh.m_nfaces = m_view.nfaces();
  m_mesh.m_on_sphere = raw.m_on_sphere;
  m_mesh.m_sphere_radius = raw.m_sphere_radius;

  build_face_nodes();
  build_edge_nodes();
  build_coordinates();

  m_construction_issues = ugrid::validate(m_mesh, m_params.m_validation);
}

void Grid::check_params(const RawMesh &raw) const {
  if (m_params.m_fill_value >= 0) {
    throw ConfigurationError("fill value " +
                             std::to_string(m_params.m_fill_value) +
                             " could be a valid index, it must be negative");
  }
  if (raw.m_on_sphere && !(raw.m_sphere_radius > 0)) {
    throw ConfigurationError("on_a_sphere mesh with sphere_radius = " +
                             std::to_string(raw.m_sphere_radius));
  }
}

void Grid::build_face_nodes() {
  NormalizeOptions options;
  options.m_fill_value = m_mesh.m_fill_value;
  options.m_upper_bound = m_mesh.m_nnodes;

  const auto conn =
      normalize_connectivity(m_view.m_face_nodes_name, m_view.m_face_nodes,
                             options, m_view.m_nnodes_per_face);

  m_mesh.m_max_face_nodes = max_row_count(conn.m_nvalid);
  m_mesh.m_face_nodes = pack_connectivity("face_nodes", conn,
                                          m_mesh.m_max_face_nodes,
                                          m_mesh.m_fill_value);
  m_mesh.m_nnodes_per_face = conn.m_nvalid;
}

void Grid::build_edge_nodes() {
  if (!has_array(m_view.m_edge_nodes)) {
    m_mesh.m_edge_nodes =
        ugrid::build_edge_nodes("edge_nodes", m_mesh.m_face_nodes);
    m_mesh.m_nedges = m_mesh.m_edge_nodes.extent(0);
    return;
  }

  NormalizeOptions options;
  options.m_fill_value = m_mesh.m_fill_value;
  options.m_upper_bound = m_mesh.m_nnodes;
  options.m_allow_empty_rows = true;

  const auto conn = normalize_connectivity(m_view.m_edge_nodes_name,
                                           m_view.m_edge_nodes, options);
  m_mesh.m_edge_nodes = conn.m_array;
  m_mesh.m_nedges = conn.nrows();
}

void Grid::build_coordinates() {
  m_mesh.m_node_lon = longitude_to_degrees("node_lon", m_view.m_node_lon);
  m_mesh.m_node_lat = to_degrees("node_lat", m_view.m_node_lat);
  m_mesh.m_face_lon = longitude_to_degrees("face_lon", m_view.m_face_lon);
  m_mesh.m_face_lat = to_degrees("face_lat", m_view.m_face_lat);
}

IntConst2d Grid::face_edges() const {
  if (!m_face_edges) {
    m_face_edges =
        build_face_edges("face_edges", m_mesh.m_face_nodes,
                         m_mesh.m_edge_nodes, m_mesh.m_fill_value);
  }
  return *m_face_edges;
}

const CartesianCoords &Grid::node_cartesian() const {
  if (!m_node_cartesian) {
    m_node_cartesian =
        to_cartesian("node", m_mesh.m_node_lon, m_mesh.m_node_lat);
  }
  return *m_node_cartesian;
}

const CartesianCoords &Grid::face_cartesian() const {
  if (!m_face_cartesian) {
    m_face_cartesian =
        to_cartesian("face", m_mesh.m_face_lon, m_mesh.m_face_lat);
  }
  return *m_face_cartesian;
}

const FaceAreas &Grid::face_areas() const {
  if (!m_face_areas) {
    if (!m_mesh.m_on_sphere) {
      throw ConfigurationError(
          "face areas are only defined for meshes on a sphere");
    }
    m_face_areas = compute_face_areas(m_mesh.m_face_nodes, node_cartesian(),
                                      face_cartesian(),
                                      m_mesh.m_sphere_radius, m_params.m_area);
  }
  return *m_face_areas;
}

Real Grid::total_face_area() const {
  if (!m_total_face_area) {
    m_total_face_area = sum_face_areas(face_areas().m_area);
  }
  return *m_total_face_area;
}

std::vector<Issue> Grid::geometry_warnings() const {
  return ugrid::geometry_warnings(face_areas());
}

const std::vector<Int> &Grid::antimeridian_face_indices() const {
  if (!m_antimeridian_faces) {
    m_antimeridian_faces =
        find_antimeridian_faces(m_mesh.m_face_nodes, m_mesh.m_node_lon);
  }
  return *m_antimeridian_faces;
}

std::vector<Issue> Grid::validate() const {
  return validate(m_params.m_validation);
}

std::vector<Issue> Grid::validate(const ValidationOptions &options) const {
  return ugrid::validate(m_mesh, options);
}

} // namespace ugrid
