#ifndef KINETIC_SOLVER_HPP
#define KINETIC_SOLVER_HPP

#include "RectilinearMesh.hpp"
#include "SimulationConfig.hpp"
#include "State.hpp"
#include "CellUpdate.hpp"
#include "KineticFlux.hpp"
#include "Reconstruction.hpp"
#include "VelocitySpace.hpp"
#include <functional>
#include <vector>
#include "HaloExchange.hpp"

namespace KineticFV {

/// Explicit finite-volume driver over a rectilinear mesh.
///
/// Each step fills ghost cells, reconstructs distribution slopes when
/// config.reconOrder asks for them, evaluates every face flux, then advances
/// the owned cells with CellUpdate. Cells are independent once the fluxes are
/// known, so the update loop has no ordering constraints.
class KineticSolver {
public:
    KineticSolver(const RectilinearMesh& mesh,
                  const SimulationConfig& config,
                  std::vector<VelocityGrid> grids);

    ~KineticSolver() = default;

    KineticSolver(const KineticSolver&) = delete;
    KineticSolver& operator=(const KineticSolver&) = delete;

    /// Primitive state per species at a cell centroid.
    using PrimitiveField = std::function<std::vector<std::vector<double>>(double x, double y)>;

    /// Set every owned cell to the equilibrium of primFn(x, y) and fill ghosts.
    void initialize(const RectilinearMesh& mesh, const PrimitiveField& primFn);

    /// Advance one step; returns the dt taken (<= targetDt when targetDt > 0).
    double step(const SimulationConfig& config,
                const RectilinearMesh& mesh,
                double targetDt = -1.0);

#ifdef ENABLE_MPI
    void setHaloExchange(HaloExchange* halo) { halo_ = halo; }
#endif

    const CellUpdate& cellUpdate() const { return update_; }
    const Reconstructor& reconstructor() const { return recon_; }
    const std::vector<KineticCell>& cells() const { return cells_; }
    std::vector<KineticCell>& cells() { return cells_; }

    /// Normalized residual of the last step, one entry per conserved
    /// component (species-major): sqrt(RES * N) / (AVG + 1e-7).
    const std::vector<double>& residual() const { return residual_; }
    double maxResidual() const;

    /// Cell updates that reported a warning / rolled back a species, summed
    /// over the whole run on this rank.
    long warningCount() const { return warningCount_; }
    long rollbackCount() const { return rollbackCount_; }

private:
    CellUpdate update_;
    KineticFlux flux_;
    Reconstructor recon_;

#ifdef ENABLE_MPI
    HaloExchange* halo_ = nullptr;
#endif

    std::vector<KineticCell> cells_;
    std::vector<FaceFlux> xFaces_;   // (nx + 1) * ny
    std::vector<FaceFlux> yFaces_;   // nx * (ny + 1), 2D only

    std::vector<double> residual_;
    long warningCount_ = 0;
    long rollbackCount_ = 0;

    void fillGhosts(const RectilinearMesh& mesh);
    void computeFluxes(const RectilinearMesh& mesh, double dt);
    double globalCellCount(const RectilinearMesh& mesh) const;

    std::size_t xFace(const RectilinearMesh& mesh, int i, int j) const {
        return static_cast<std::size_t>(i + (mesh.nx() + 1) * j);
    }
    std::size_t yFace(const RectilinearMesh& mesh, int i, int j) const {
        return static_cast<std::size_t>(i + mesh.nx() * j);
    }
};

} // namespace KineticFV

#endif // KINETIC_SOLVER_HPP
