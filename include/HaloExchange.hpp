#ifndef HALO_EXCHANGE_HPP
#define HALO_EXCHANGE_HPP

#ifdef ENABLE_MPI

#include "MPIContext.hpp"
#include "RectilinearMesh.hpp"
#include "State.hpp"
#include <functional>
#include <vector>

namespace KineticFV {

/// Ghost cell communication for MPI domain decomposition.
///
/// Every value a neighbor needs to evaluate a face flux (conserved and
/// primitive moments, all distribution arrays, field state) is packed per
/// cell. Directions are exchanged x then y, the y slab spanning the x ghosts,
/// so corner ghosts are filled correctly.
class HaloExchange {
public:
    HaloExchange(const MPIContext& mpi, const RectilinearMesh& mesh);

    const MPIContext& mpi() const { return mpi_; }

    /// Exchange one direction (0 = x, 1 = y).
    void exchangeDirection(std::vector<KineticCell>& cells, int direction);

    /// Exchange all active directions.
    void exchange(std::vector<KineticCell>& cells);

private:
    const MPIContext& mpi_;
    const RectilinearMesh& mesh_;

    std::vector<double> sendBuf_[4];
    std::vector<double> recvBuf_[4];

    /// Call fn(flat index) for every cell of the slab sent through (interior)
    /// or received into (ghost) the given face, in a fixed order.
    void forEachSlabCell(int face, bool ghost, const std::function<void(std::size_t)>& fn) const;

    std::size_t slabCells(int face) const;

    static std::size_t packedSize(const KineticCell& cell);
    static void packCell(const KineticCell& cell, std::vector<double>& buf, std::size_t& pos);
    static void unpackCell(KineticCell& cell, const std::vector<double>& buf, std::size_t& pos);

    void doExchange(int lowFace, int highFace, std::size_t bufSize);
};

} // namespace KineticFV

#endif // ENABLE_MPI
#endif // HALO_EXCHANGE_HPP
