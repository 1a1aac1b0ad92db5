#ifndef RECONSTRUCTION_HPP
#define RECONSTRUCTION_HPP

#include "CellUpdate.hpp"
#include "RectilinearMesh.hpp"
#include "SimulationConfig.hpp"
#include "State.hpp"
#include <cstddef>
#include <vector>

namespace KineticFV {

/// Cell-wise slopes of every discrete distribution along each active mesh axis.
///
/// Interior cells take the van Leer limited slope of their two one-sided
/// differences. A cell whose face lies on a Maxwell wall takes the two-point
/// difference toward the interior, since its wall-side ghost carries no
/// physical neighbour. Slopes are stored for the owned cells plus the first
/// ghost layer, which closes the stencil of every interior face.
class Reconstructor {
public:
    explicit Reconstructor(ReconstructionOrder order = ReconstructionOrder::FirstOrder);

    /// Allocate slope arrays for every cell of the mesh.
    void allocate(const RectilinearMesh& mesh, const CellUpdate& update);

    /// Recompute all slopes. Precondition: ghost cells must already be filled.
    void reconstruct(const RectilinearMesh& mesh, const std::vector<KineticCell>& cells);

    /// Minimum ghost cells needed for the chosen order.
    int requiredGhostCells() const;

    ReconstructionOrder order() const { return order_; }

    /// Slopes of every species of a cell (flat mesh index), species-major.
    const DistributionSet* xSlopes(std::size_t cell) const { return &xSlopes_[cell * nSpecies_]; }
    const DistributionSet* ySlopes(std::size_t cell) const { return &ySlopes_[cell * nSpecies_]; }

    /// van Leer limiter of the left and right one-sided slopes.
    static double vanLeer(double sL, double sR);

private:
    ReconstructionOrder order_;
    int nSpecies_ = 0;
    std::vector<DistributionSet> xSlopes_;
    std::vector<DistributionSet> ySlopes_;

    void reconstructX(const RectilinearMesh& mesh, const std::vector<KineticCell>& cells);
    void reconstructY(const RectilinearMesh& mesh, const std::vector<KineticCell>& cells);
};

} // namespace KineticFV

#endif // RECONSTRUCTION_HPP
