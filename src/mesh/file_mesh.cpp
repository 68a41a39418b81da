#include "file_mesh.hpp"

namespace ugrid {

template <class DeviceView>
static DeviceView get_from_file(const std::string &name,
                                const netCDF::NcFile &mesh_file) {
  const auto var = mesh_file.getVar(name);
  if (var.isNull()) {
    return DeviceView();
  }

  constexpr Int rank = DeviceView::rank;
  const auto dims = var.getDims();
  if (Int(dims.size()) != rank) {
    throw StructuralError(name + " has " + std::to_string(dims.size()) +
                          " dimensions, expected " + std::to_string(rank));
  }

  DeviceView view;
  if constexpr (rank == 1) {
    view = DeviceView(name, dims[0].getSize());
  } else {
    view = DeviceView(name, dims[0].getSize(), dims[1].getSize());
  }
  auto host_view = create_mirror_view(HostMemSpace(), view);
  var.getVar(host_view.data());
  deep_copy(view, host_view);
  return view;
}

static bool read_on_sphere(const netCDF::NcFile &mesh_file) {
  const auto atts = mesh_file.getAtts();
  const auto it = atts.find("on_a_sphere");
  if (it == atts.end()) {
    return true;
  }
  std::string value;
  it->second.getValues(value);
  return value.compare(0, 3, "YES") == 0;
}

static Real read_sphere_radius(const netCDF::NcFile &mesh_file) {
  const auto atts = mesh_file.getAtts();
  const auto it = atts.find("sphere_radius");
  if (it == atts.end()) {
    return 1;
  }
  Real radius;
  it->second.getValues(&radius);
  return radius;
}

RawMesh read_mpas_mesh(const std::string &filename) {
  return read_mpas_mesh(netCDF::NcFile(filename, netCDF::NcFile::read));
}

RawMesh read_mpas_mesh(const netCDF::NcFile &mesh_file) {
  RawMesh raw;

  raw.m_lon_vertex = get_from_file<Real1d>("lonVertex", mesh_file);
  raw.m_lat_vertex = get_from_file<Real1d>("latVertex", mesh_file);
  raw.m_lon_cell = get_from_file<Real1d>("lonCell", mesh_file);
  raw.m_lat_cell = get_from_file<Real1d>("latCell", mesh_file);

  raw.m_vertices_on_cell = get_from_file<Int2d>("verticesOnCell", mesh_file);
  raw.m_vertices_on_edge = get_from_file<Int2d>("verticesOnEdge", mesh_file);
  raw.m_cells_on_vertex = get_from_file<Int2d>("cellsOnVertex", mesh_file);
  raw.m_cells_on_edge = get_from_file<Int2d>("cellsOnEdge", mesh_file);
  raw.m_nedges_on_cell = get_from_file<Int1d>("nEdgesOnCell", mesh_file);

  raw.m_on_sphere = read_on_sphere(mesh_file);
  raw.m_sphere_radius = read_sphere_radius(mesh_file);

  return raw;
}

} // namespace ugrid
