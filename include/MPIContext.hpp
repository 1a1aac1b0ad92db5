#ifndef MPI_CONTEXT_HPP
#define MPI_CONTEXT_HPP

#include <mpi.h>
#include <array>
#include <vector>

namespace KineticFV {

/// Cartesian MPI decomposition of a 1D or 2D structured mesh.
///
/// Each rank owns a contiguous block of cells; the first (n % p) ranks along
/// an axis receive one extra cell.
class MPIContext {
public:
    /// @param globalNx/Ny  Number of cells in each direction (global).
    /// @param xNodes/yNodes  Global node coordinates.
    /// @param periods  Periodic flags per direction (x, y).
    /// @param procsPerDir  Desired process counts per direction (0 = auto).
    static MPIContext create(int globalNx, int globalNy,
                             const std::vector<double>& xNodes,
                             const std::vector<double>& yNodes,
                             int dim,
                             const std::array<int,2>& periods = {0,0},
                             const std::array<int,2>& procsPerDir = {0,0});

    ~MPIContext();

    MPIContext(const MPIContext&) = delete;
    MPIContext& operator=(const MPIContext&) = delete;
    MPIContext(MPIContext&& other) noexcept;
    MPIContext& operator=(MPIContext&& other) = delete;

    int rank() const { return rank_; }
    int size() const { return size_; }
    MPI_Comm comm() const { return cartComm_; }

    const std::array<int,2>& dims() const { return dims_; }
    const std::array<int,2>& coords() const { return coords_; }

    /// Face identifiers (matching RectilinearMesh).
    static constexpr int XLow  = 0;
    static constexpr int XHigh = 1;
    static constexpr int YLow  = 2;
    static constexpr int YHigh = 3;

    /// Neighbor rank for a face (MPI_PROC_NULL on a physical boundary).
    int neighbor(int face) const { return neighbors_[face]; }
    bool isPhysicalBoundary(int face) const { return neighbors_[face] == MPI_PROC_NULL; }

    const std::vector<double>& localXNodes() const { return localXNodes_; }
    const std::vector<double>& localYNodes() const { return localYNodes_; }

    /// Global index of this rank's first cell along x and y.
    int offsetX() const { return offset_[0]; }
    int offsetY() const { return offset_[1]; }

private:
    MPIContext() = default;

    MPI_Comm cartComm_ = MPI_COMM_NULL;
    int rank_ = 0;
    int size_ = 1;
    std::array<int,2> dims_ = {1,1};
    std::array<int,2> coords_ = {0,0};
    std::array<int,2> offset_ = {0,0};
    std::array<int,4> neighbors_ = {MPI_PROC_NULL, MPI_PROC_NULL,
                                     MPI_PROC_NULL, MPI_PROC_NULL};

    std::vector<double> localXNodes_;
    std::vector<double> localYNodes_;

    /// First cell and cell count owned by coord out of nProcs.
    static std::array<int,2> partition(int globalN, int nProcs, int coord);
};

} // namespace KineticFV

#endif // MPI_CONTEXT_HPP
