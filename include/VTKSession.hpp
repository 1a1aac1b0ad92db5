#ifndef VTK_SESSION_HPP
#define VTK_SESSION_HPP

#include "VTKWriter.hpp"
#include "Runtime.hpp"
#include <string>
#include <array>
#include <vector>

namespace KineticFV {

class RectilinearMesh;

/// Encapsulates the entire VTK output lifecycle: PVD open/append/close,
/// per-rank VTR writing, and MPI gather + PVTR meta-file generation.
class VTKSession {
public:
    VTKSession(Runtime& rt, const std::string& baseName,
               const RectilinearMesh& mesh, const SimulationConfig& config,
               const std::string& dir = "VTK");

    /// Write the owned cells at the given time.  Collective in MPI mode.
    void write(const std::vector<KineticCell>& cells, double time);

    /// Close the PVD time-series file.
    void finalize();

private:
    Runtime& rt_;
    const RectilinearMesh& mesh_;
    const SimulationConfig& config_;
    std::string baseName_;
    std::string dir_;
    int fileNum_ = 0;

    std::array<int,6> localExtent_ = {};
};

} // namespace KineticFV

#endif // VTK_SESSION_HPP
