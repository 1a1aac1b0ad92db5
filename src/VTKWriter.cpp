#include "VTKWriter.hpp"
#include "RectilinearMesh.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <stdexcept>

namespace KineticFV {

/// Ensure the parent directory of a file path exists, creating it if needed.
static void ensureParentDir(const std::string& filepath) {
    auto parent = std::filesystem::path(filepath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
}

static std::string speciesSuffix(const SimulationConfig& config, int s) {
    if (config.nSpecies == 1) return "";
    return s == 0 ? "_ion" : "_electron";
}

// Velocity components carried in a primitive vector.
static int velocityComponents(const SimulationConfig& config) {
    return config.stateLength() - (config.distribution == DistributionModel::Rotational ? 3 : 2);
}

std::vector<std::pair<std::string, int>> VTKWriter::cellFields(const SimulationConfig& config) {
    std::vector<std::pair<std::string, int>> fields;
    for (int s = 0; s < config.nSpecies; ++s) {
        const std::string sfx = speciesSuffix(config, s);
        fields.emplace_back("Density" + sfx, 1);
        fields.emplace_back("Velocity" + sfx, 3);
        fields.emplace_back("Temperature" + sfx, 1);
        fields.emplace_back("Pressure" + sfx, 1);
        if (config.distribution == DistributionModel::Rotational) {
            fields.emplace_back("RotationalTemperature" + sfx, 1);
        }
    }
    if (config.isPlasma()) {
        fields.emplace_back("ElectricField", 3);
        fields.emplace_back("MagneticField", 3);
    }
    return fields;
}

void VTKWriter::writeVTR(const std::string& filename,
                         const RectilinearMesh& mesh,
                         const std::vector<KineticCell>& cells,
                         const SimulationConfig& config,
                         const std::array<int,6>& pieceExtent,
                         int rank)
{
    int nx = mesh.nx(), ny = mesh.ny();

    bool hasExtent = false;
    for (int d = 0; d < 6; ++d) {
        if (pieceExtent[d] != 0) { hasExtent = true; break; }
    }
    int ei0 = 0, ei1 = nx;
    int ej0 = 0, ej1 = ny;
    int ek0 = 0, ek1 = 1;
    if (hasExtent) {
        ei0 = pieceExtent[0]; ei1 = pieceExtent[1];
        ej0 = pieceExtent[2]; ej1 = pieceExtent[3];
        ek0 = pieceExtent[4]; ek1 = pieceExtent[5];
    }

    ensureParentDir(filename);
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("VTKWriter::writeVTR: cannot open " + filename);
    }

    file << std::setprecision(15);

    file << "<?xml version=\"1.0\"?>\n";
    file << "<VTKFile type=\"RectilinearGrid\" version=\"1.0\" byte_order=\"LittleEndian\">\n";
    file << "  <RectilinearGrid WholeExtent=\""
         << ei0 << " " << ei1 << " "
         << ej0 << " " << ej1 << " "
         << ek0 << " " << ek1 << "\">\n";
    file << "    <Piece Extent=\""
         << ei0 << " " << ei1 << " "
         << ej0 << " " << ej1 << " "
         << ek0 << " " << ek1 << "\">\n";

    file << "      <Coordinates>\n";

    file << "        <DataArray type=\"Float64\" Name=\"X\" format=\"ascii\">\n";
    file << "         ";
    for (int i = 0; i <= nx; ++i) {
        file << " " << mesh.nodeX(i);
    }
    file << "\n        </DataArray>\n";

    file << "        <DataArray type=\"Float64\" Name=\"Y\" format=\"ascii\">\n";
    file << "         ";
    if (mesh.dim() < 2) {
        // 1D case: write a small y width
        file << " 0.0 " << mesh.dx(0);
    } else {
        for (int j = 0; j <= ny; ++j) {
            file << " " << mesh.nodeY(j);
        }
    }
    file << "\n        </DataArray>\n";

    // Always a single layer in z
    file << "        <DataArray type=\"Float64\" Name=\"Z\" format=\"ascii\">\n";
    file << "          0.0 " << std::min(mesh.dx(0), std::min(mesh.dy(0), 1.0));
    file << "\n        </DataArray>\n";

    file << "      </Coordinates>\n";

    file << "      <CellData>\n";

    auto writeArray = [&](const std::string& name, int nComp,
                          const std::function<void(const KineticCell&)>& emit) {
        file << "        <DataArray type=\"Float64\" Name=\"" << name << "\"";
        if (nComp > 1) file << " NumberOfComponents=\"" << nComp << "\"";
        file << " format=\"ascii\">\n";
        for (int j = 0; j < ny; ++j) {
            file << "         ";
            for (int i = 0; i < nx; ++i) {
                emit(cells[mesh.index(i, j)]);
            }
            file << "\n";
        }
        file << "        </DataArray>\n";
    };

    const int nVel = velocityComponents(config);
    const bool rotational = config.distribution == DistributionModel::Rotational;

    for (int s = 0; s < config.nSpecies; ++s) {
        const std::string sfx = speciesSuffix(config, s);
        const double mass = config.nSpecies == 1 ? 1.0 : (s == 0 ? config.mixture.mi : config.mixture.me);
        const std::size_t lambdaIdx = static_cast<std::size_t>(nVel + 1);

        writeArray("Density" + sfx, 1, [&](const KineticCell& c) {
            file << " " << c.species[s].prim[0];
        });
        writeArray("Velocity" + sfx, 3, [&](const KineticCell& c) {
            for (int d = 0; d < 3; ++d)
                file << " " << (d < nVel ? c.species[s].prim[d + 1] : 0.0);
        });
        writeArray("Temperature" + sfx, 1, [&](const KineticCell& c) {
            file << " " << mass / c.species[s].prim[lambdaIdx];
        });
        // p = n k T = rho / (2 lambda) for every species mass
        writeArray("Pressure" + sfx, 1, [&](const KineticCell& c) {
            file << " " << 0.5 * c.species[s].prim[0] / c.species[s].prim[lambdaIdx];
        });
        if (rotational) {
            writeArray("RotationalTemperature" + sfx, 1, [&](const KineticCell& c) {
                file << " " << 1.0 / c.species[s].prim[lambdaIdx + 1];
            });
        }
    }

    if (config.isPlasma()) {
        writeArray("ElectricField", 3, [&](const KineticCell& c) {
            for (double v : c.field.E) file << " " << v;
        });
        writeArray("MagneticField", 3, [&](const KineticCell& c) {
            for (double v : c.field.B) file << " " << v;
        });
    }

    // MPI rank field (only when rank >= 0)
    if (rank >= 0) {
        file << "        <DataArray type=\"Int32\" Name=\"Rank\" format=\"ascii\">\n";
        for (int j = 0; j < ny; ++j) {
            file << "         ";
            for (int i = 0; i < nx; ++i) {
                file << " " << rank;
            }
            file << "\n";
        }
        file << "        </DataArray>\n";
    }

    file << "      </CellData>\n";
    file << "    </Piece>\n";
    file << "  </RectilinearGrid>\n";
    file << "</VTKFile>\n";

    file.close();
}

void VTKWriter::writePVTR(const std::string& filename,
                          int globalNx, int globalNy,
                          const std::vector<std::array<int,6>>& pieceExtents,
                          const std::vector<std::string>& pieceFiles,
                          const SimulationConfig& config)
{
    ensureParentDir(filename);
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("VTKWriter::writePVTR: cannot open " + filename);
    }

    file << "<?xml version=\"1.0\"?>\n";
    file << "<VTKFile type=\"PRectilinearGrid\" version=\"1.0\" byte_order=\"LittleEndian\">\n";
    file << "  <PRectilinearGrid WholeExtent=\"0 " << globalNx
         << " 0 " << globalNy
         << " 0 1\" GhostLevel=\"0\">\n";

    file << "    <PCoordinates>\n";
    file << "      <PDataArray type=\"Float64\" Name=\"X\"/>\n";
    file << "      <PDataArray type=\"Float64\" Name=\"Y\"/>\n";
    file << "      <PDataArray type=\"Float64\" Name=\"Z\"/>\n";
    file << "    </PCoordinates>\n";

    file << "    <PCellData>\n";
    for (const auto& [name, nComp] : cellFields(config)) {
        file << "      <PDataArray type=\"Float64\" Name=\"" << name << "\"";
        if (nComp > 1) file << " NumberOfComponents=\"" << nComp << "\"";
        file << "/>\n";
    }
    file << "      <PDataArray type=\"Int32\" Name=\"Rank\"/>\n";
    file << "    </PCellData>\n";

    for (std::size_t p = 0; p < pieceFiles.size(); ++p) {
        const auto& ext = pieceExtents[p];
        file << "    <Piece Extent=\""
             << ext[0] << " " << ext[1] << " "
             << ext[2] << " " << ext[3] << " "
             << ext[4] << " " << ext[5]
             << "\" Source=\"" << pieceFiles[p] << "\"/>\n";
    }

    file << "  </PRectilinearGrid>\n";
    file << "</VTKFile>\n";

    file.close();
}

// PVD footer written after every append so the file is always valid XML
// and can be opened in ParaView while the simulation is still running.
static const std::string pvdFooter = "  </Collection>\n</VTKFile>\n";

void VTKWriter::writePVD(const std::string& filename,
                         const std::string& mode,
                         double time,
                         const std::string& dataFile)
{
    ensureParentDir(filename);
    if (mode == "w") {
        std::ofstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("VTKWriter::writePVD: cannot open " + filename);
        }
        file << "<?xml version=\"1.0\"?>\n";
        file << "<VTKFile type=\"Collection\" version=\"1.0\" byte_order=\"LittleEndian\">\n";
        file << "  <Collection>\n";
        file << pvdFooter;
        file.close();
    } else if (mode == "a") {
        auto fileSize = std::filesystem::file_size(filename);
        std::filesystem::resize_file(filename, fileSize - pvdFooter.size());

        std::ofstream file(filename, std::ios::app);
        if (!file.is_open()) {
            throw std::runtime_error("VTKWriter::writePVD: cannot open " + filename);
        }
        file << std::setprecision(15);
        file << "    <DataSet timestep=\"" << time
             << "\" file=\"" << dataFile << "\"/>\n";
        file << pvdFooter;
        file.close();
    } else if (mode != "close") {
        throw std::invalid_argument("VTKWriter::writePVD: unknown mode '" + mode + "'");
    }
}

} // namespace KineticFV
