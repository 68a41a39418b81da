#pragma once

#include "raw_mesh.hpp"
#include <common.hpp>
#include <netcdf>
#include <string>

namespace ugrid {

// Reads the arrays of RawMesh from an MPAS mesh file. Variables the file
// does not carry are left unallocated.
RawMesh read_mpas_mesh(const std::string &filename);
RawMesh read_mpas_mesh(const netCDF::NcFile &mesh_file);

} // namespace ugrid
