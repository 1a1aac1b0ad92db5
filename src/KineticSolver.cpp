#include "KineticSolver.hpp"
#include "TimeStepping.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#ifdef ENABLE_MPI
#include <mpi.h>
#endif

namespace KineticFV {

KineticSolver::KineticSolver(const RectilinearMesh& mesh,
                             const SimulationConfig& config,
                             std::vector<VelocityGrid> grids)
    : update_(config, std::move(grids))
    , flux_(update_)
    , recon_(config.reconOrder)
{
    if (mesh.dim() != config.dim) {
        throw std::invalid_argument("KineticSolver: mesh dimension does not match config.dim");
    }
    if (mesh.nGhost() < config.requiredGhostCells()) {
        throw std::invalid_argument("KineticSolver: mesh has " + std::to_string(mesh.nGhost()) +
                                    " ghost layer(s), reconOrder needs " +
                                    std::to_string(config.requiredGhostCells()));
    }

    std::vector<std::size_t> nodes(config.nSpecies);
    for (int s = 0; s < config.nSpecies; ++s) nodes[s] = update_.grid(s).size();

    cells_.resize(mesh.totalCells());

    xFaces_.resize(static_cast<std::size_t>(mesh.nx() + 1) * mesh.ny());
    for (auto& f : xFaces_) f.allocate(config, nodes);
    if (mesh.dim() >= 2) {
        yFaces_.resize(static_cast<std::size_t>(mesh.nx()) * (mesh.ny() + 1));
        for (auto& f : yFaces_) f.allocate(config, nodes);
    }

    recon_.allocate(mesh, update_);
    residual_.assign(update_.residualLength(), 0.0);
}

void KineticSolver::initialize(const RectilinearMesh& mesh, const PrimitiveField& primFn) {
    for (int j = 0; j < mesh.ny(); ++j) {
        for (int i = 0; i < mesh.nx(); ++i) {
            const std::size_t idx = mesh.index(i, j);
            update_.initializeCell(cells_[idx],
                                   primFn(mesh.cellCentroidX(i), mesh.cellCentroidY(j)),
                                   mesh.cellVolume(i, j));
        }
    }
    fillGhosts(mesh);
}

void KineticSolver::fillGhosts(const RectilinearMesh& mesh) {
    mesh.applyBoundaryConditions(cells_);
#ifdef ENABLE_MPI
    if (halo_) halo_->exchange(cells_);
#endif
}

// ---------------------------------------------------------------------------
// Face fluxes
// ---------------------------------------------------------------------------

void KineticSolver::computeFluxes(const RectilinearMesh& mesh, double dt) {
    const int nx = mesh.nx();
    const int ny = mesh.ny();
    const bool secondOrder = recon_.order() != ReconstructionOrder::FirstOrder;

    for (int j = 0; j < ny; ++j) {
        const double area = mesh.faceAreaX(j);
        for (int i = 0; i <= nx; ++i) {
            FaceFlux& face = xFaces_[xFace(mesh, i, j)];
            if (i == 0 && mesh.boundaryCondition(RectilinearMesh::XLow) == BoundaryCondition::MaxwellWall) {
                flux_.maxwellWall(face, cells_[mesh.index(0, j)],
                                  mesh.wallState(RectilinearMesh::XLow), 0, false, dt, area);
            } else if (i == nx && mesh.boundaryCondition(RectilinearMesh::XHigh) == BoundaryCondition::MaxwellWall) {
                flux_.maxwellWall(face, cells_[mesh.index(nx - 1, j)],
                                  mesh.wallState(RectilinearMesh::XHigh), 0, true, dt, area);
            } else if (secondOrder) {
                const std::size_t lo = mesh.index(i - 1, j), hi = mesh.index(i, j);
                flux_.kfvs(face, cells_[lo], cells_[hi], recon_.xSlopes(lo), recon_.xSlopes(hi),
                           mesh.dx(i - 1), mesh.dx(i), 0, dt, area);
            } else {
                flux_.kfvs(face, cells_[mesh.index(i - 1, j)], cells_[mesh.index(i, j)], 0, dt, area);
            }
        }
    }

    if (mesh.dim() < 2) return;

    for (int j = 0; j <= ny; ++j) {
        for (int i = 0; i < nx; ++i) {
            const double area = mesh.faceAreaY(i);
            FaceFlux& face = yFaces_[yFace(mesh, i, j)];
            if (j == 0 && mesh.boundaryCondition(RectilinearMesh::YLow) == BoundaryCondition::MaxwellWall) {
                flux_.maxwellWall(face, cells_[mesh.index(i, 0)],
                                  mesh.wallState(RectilinearMesh::YLow), 1, false, dt, area);
            } else if (j == ny && mesh.boundaryCondition(RectilinearMesh::YHigh) == BoundaryCondition::MaxwellWall) {
                flux_.maxwellWall(face, cells_[mesh.index(i, ny - 1)],
                                  mesh.wallState(RectilinearMesh::YHigh), 1, true, dt, area);
            } else if (secondOrder) {
                const std::size_t lo = mesh.index(i, j - 1), hi = mesh.index(i, j);
                flux_.kfvs(face, cells_[lo], cells_[hi], recon_.ySlopes(lo), recon_.ySlopes(hi),
                           mesh.dy(j - 1), mesh.dy(j), 1, dt, area);
            } else {
                flux_.kfvs(face, cells_[mesh.index(i, j - 1)], cells_[mesh.index(i, j)], 1, dt, area);
            }
        }
    }
}

// ---------------------------------------------------------------------------
// Time step
// ---------------------------------------------------------------------------

double KineticSolver::step(const SimulationConfig& config,
                           const RectilinearMesh& mesh,
                           double targetDt) {
    const ExplicitParams& params = config.explicitParams;

    double dt;
    if (params.constDt > 0) {
        dt = params.constDt;
    } else {
#ifdef ENABLE_MPI
        if (halo_)
            dt = computeKineticTimeStep(mesh, update_, params.cfl, params.maxDt, halo_->mpi().comm());
        else
#endif
            dt = computeKineticTimeStep(mesh, update_, params.cfl, params.maxDt);
    }
    if (targetDt > 0) {
        dt = std::min(dt, targetDt);
    }
    if (dt < params.minDt) {
        throw std::runtime_error("KineticSolver::step: time step " + std::to_string(dt) +
                                 " fell below minDt");
    }

    fillGhosts(mesh);
    recon_.reconstruct(mesh, cells_);
    computeFluxes(mesh, dt);

    ResidualAccumulator acc(update_.residualLength());
    const bool twoD = mesh.dim() >= 2;

    for (int j = 0; j < mesh.ny(); ++j) {
        for (int i = 0; i < mesh.nx(); ++i) {
            CellFaces faces;
            faces.left  = &xFaces_[xFace(mesh, i, j)];
            faces.right = &xFaces_[xFace(mesh, i + 1, j)];
            if (twoD) {
                faces.down = &yFaces_[yFace(mesh, i, j)];
                faces.up   = &yFaces_[yFace(mesh, i, j + 1)];
            }

            StepStatus status = update_.step(cells_[mesh.index(i, j)], faces, dt, acc);
            if (!status.ok()) ++warningCount_;
            if (status.rolledBack()) ++rollbackCount_;
        }
    }

#ifdef ENABLE_MPI
    if (halo_) {
        const int n = static_cast<int>(acc.res.size());
        MPI_Allreduce(MPI_IN_PLACE, acc.res.data(), n, MPI_DOUBLE, MPI_SUM, halo_->mpi().comm());
        MPI_Allreduce(MPI_IN_PLACE, acc.avg.data(), n, MPI_DOUBLE, MPI_SUM, halo_->mpi().comm());
    }
#endif

    const double nCells = globalCellCount(mesh);
    for (std::size_t k = 0; k < residual_.size(); ++k) {
        residual_[k] = std::sqrt(acc.res[k] * nCells) / (acc.avg[k] + 1e-7);
    }

    // Keep ghosts consistent with the updated interior for output.
    fillGhosts(mesh);

    return dt;
}

double KineticSolver::maxResidual() const {
    double r = 0.0;
    for (double v : residual_) r = std::max(r, v);
    return r;
}

double KineticSolver::globalCellCount(const RectilinearMesh& mesh) const {
    double n = static_cast<double>(mesh.nx()) * mesh.ny();
#ifdef ENABLE_MPI
    if (halo_) {
        double global = n;
        MPI_Allreduce(&n, &global, 1, MPI_DOUBLE, MPI_SUM, halo_->mpi().comm());
        return global;
    }
#endif
    return n;
}

} // namespace KineticFV
