#include "VTKSession.hpp"
#include "RectilinearMesh.hpp"

#include <mpi.h>

#include <vector>

namespace KineticFV {

VTKSession::VTKSession(Runtime& rt, const std::string& baseName,
                       const RectilinearMesh& mesh, const SimulationConfig& config,
                       const std::string& dir)
    : rt_(rt), mesh_(mesh), config_(config), baseName_(baseName), dir_(dir)
{
    if (rt_.hasMPIContext()) {
        const MPIContext& mpi = rt_.mpiContext();
        localExtent_ = {mpi.offsetX(), mpi.offsetX() + mesh.nx(),
                        mpi.offsetY(), mpi.offsetY() + mesh.ny(),
                        0, 1};
    }

    if (rt_.isRoot()) {
        VTKWriter::writePVD(baseName_ + ".pvd", "w");
    }
}

void VTKSession::write(const std::vector<KineticCell>& cells, double time) {
    if (!rt_.hasMPIContext()) {
        std::string vtrFile = baseName_ + "_" + std::to_string(fileNum_) + ".vtr";
        VTKWriter::writeVTR(dir_ + "/" + vtrFile, mesh_, cells, config_);
        VTKWriter::writePVD(baseName_ + ".pvd", "a", time, dir_ + "/" + vtrFile);
        fileNum_++;
        return;
    }

    int rank = rt_.rank();
    int nprocs = rt_.size();

    std::string vtrFile = baseName_ + "_" + std::to_string(fileNum_)
                        + "_r" + std::to_string(rank) + ".vtr";
    VTKWriter::writeVTR(dir_ + "/" + vtrFile, mesh_, cells, config_, localExtent_, rank);

    // Gather all extents on rank 0
    std::vector<int> allExtBuf(nprocs * 6);
    MPI_Gather(localExtent_.data(), 6, MPI_INT,
               allExtBuf.data(), 6, MPI_INT, 0, rt_.mpiContext().comm());

    if (rt_.isRoot()) {
        std::vector<std::array<int,6>> allExtents(nprocs);
        std::vector<std::string> allFiles(nprocs);
        for (int r = 0; r < nprocs; ++r) {
            for (int d = 0; d < 6; ++d)
                allExtents[r][d] = allExtBuf[r * 6 + d];
            allFiles[r] = baseName_ + "_" + std::to_string(fileNum_)
                        + "_r" + std::to_string(r) + ".vtr";
        }
        std::string pvtrFile = baseName_ + "_" + std::to_string(fileNum_) + ".pvtr";
        VTKWriter::writePVTR(dir_ + "/" + pvtrFile,
                             rt_.globalNx(), rt_.globalNy(),
                             allExtents, allFiles, config_);
        VTKWriter::writePVD(baseName_ + ".pvd", "a", time, dir_ + "/" + pvtrFile);
    }

    fileNum_++;
}

void VTKSession::finalize() {
    if (rt_.isRoot()) {
        VTKWriter::writePVD(baseName_ + ".pvd", "close");
    }
}

} // namespace KineticFV
