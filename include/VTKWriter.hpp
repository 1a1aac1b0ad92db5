#ifndef VTK_WRITER_HPP
#define VTK_WRITER_HPP

#include "SimulationConfig.hpp"
#include "State.hpp"
#include <string>
#include <utility>
#include <vector>
#include <array>

namespace KineticFV {

class RectilinearMesh;

/// VTK XML RectilinearGrid writer for ParaView visualization.
///
/// Cell data are the macroscopic moments of each species (density,
/// velocity, temperature T = m / lambda in reduced units, pressure
/// p = rho / (2 lambda)) plus E and B for plasma runs. Supports serial .vtr files, parallel .pvtr meta-files,
/// and .pvd time-series collection files.
class VTKWriter {
public:
    /// (name, number of components) of every cell array, in file order.
    static std::vector<std::pair<std::string, int>> cellFields(const SimulationConfig& config);

    /// Write a single .vtr piece file.
    /// pieceExtent: {i0, i1, j0, j1, k0, k1} local extent within global grid.
    /// Default (empty/zero) = full grid (serial mode).
    /// rank: MPI rank for "Rank" cell data field (-1 = omit).
    static void writeVTR(const std::string& filename,
                         const RectilinearMesh& mesh,
                         const std::vector<KineticCell>& cells,
                         const SimulationConfig& config,
                         const std::array<int,6>& pieceExtent = {},
                         int rank = -1);

    /// Write .pvtr parallel meta-file referencing piece files.
    /// Only rank 0 calls this in MPI.
    static void writePVTR(const std::string& filename,
                          int globalNx, int globalNy,
                          const std::vector<std::array<int,6>>& pieceExtents,
                          const std::vector<std::string>& pieceFiles,
                          const SimulationConfig& config);

    /// Three-phase .pvd time-series file:
    ///   mode="w"     -- write header
    ///   mode="a"     -- append timestep entry
    ///   mode="close" -- write closing tags
    static void writePVD(const std::string& filename,
                         const std::string& mode,
                         double time = 0.0,
                         const std::string& dataFile = "");
};

} // namespace KineticFV

#endif // VTK_WRITER_HPP
