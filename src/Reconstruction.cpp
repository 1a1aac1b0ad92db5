#include "Reconstruction.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace KineticFV {

namespace {
    constexpr double LIMITER_EPS = 1.0e-7;

    // Slope of every field of cell c from its neighbours along one axis.
    //   lo / hi : neighbour distributions (nullptr at a wall side)
    //   dxL, dxR: centroid distances to them
    void limitedSlope(DistributionSet& slope, const DistributionSet& c,
                      const DistributionSet* lo, const DistributionSet* hi,
                      double dxL, double dxR)
    {
        for (int f = 0; f < slope.count(); ++f) {
            std::vector<double>& s = slope.field(f);
            const std::vector<double>& v = c.field(f);
            if (!lo && !hi) {
                std::fill(s.begin(), s.end(), 0.0);
            } else if (!lo) {
                const std::vector<double>& vr = hi->field(f);
                for (std::size_t i = 0; i < s.size(); ++i) s[i] = (vr[i] - v[i]) / dxR;
            } else if (!hi) {
                const std::vector<double>& vl = lo->field(f);
                for (std::size_t i = 0; i < s.size(); ++i) s[i] = (v[i] - vl[i]) / dxL;
            } else {
                const std::vector<double>& vl = lo->field(f);
                const std::vector<double>& vr = hi->field(f);
                for (std::size_t i = 0; i < s.size(); ++i) {
                    s[i] = Reconstructor::vanLeer((v[i] - vl[i]) / dxL, (vr[i] - v[i]) / dxR);
                }
            }
        }
    }
} // anonymous namespace

Reconstructor::Reconstructor(ReconstructionOrder order)
    : order_(order)
{}

int Reconstructor::requiredGhostCells() const {
    switch (order_) {
        case ReconstructionOrder::FirstOrder: return 1;
        case ReconstructionOrder::VanLeer:    return 2;
    }
    return 1;
}

double Reconstructor::vanLeer(double sL, double sR) {
    return (std::copysign(1.0, sL) + std::copysign(1.0, sR)) * std::abs(sL) * std::abs(sR) /
           (std::abs(sL) + std::abs(sR) + LIMITER_EPS);
}

void Reconstructor::allocate(const RectilinearMesh& mesh, const CellUpdate& update) {
    if (order_ == ReconstructionOrder::FirstOrder) return;
    if (mesh.nGhost() < requiredGhostCells()) {
        throw std::invalid_argument("Reconstructor::allocate: mesh carries " + std::to_string(mesh.nGhost()) +
                                    " ghost layer(s), reconstruction needs " +
                                    std::to_string(requiredGhostCells()));
    }

    const SimulationConfig& config = update.config();
    nSpecies_ = config.nSpecies;
    xSlopes_.resize(mesh.totalCells() * nSpecies_);
    if (mesh.dim() >= 2) ySlopes_.resize(mesh.totalCells() * nSpecies_);

    for (std::size_t c = 0; c < mesh.totalCells(); ++c) {
        for (int s = 0; s < nSpecies_; ++s) {
            const std::size_t nodes = update.grid(s).size();
            xSlopes_[c * nSpecies_ + s].allocate(config.distribution, nodes);
            if (mesh.dim() >= 2) ySlopes_[c * nSpecies_ + s].allocate(config.distribution, nodes);
        }
    }
}

void Reconstructor::reconstruct(const RectilinearMesh& mesh, const std::vector<KineticCell>& cells) {
    if (order_ == ReconstructionOrder::FirstOrder) return;
    if (xSlopes_.size() != mesh.totalCells() * nSpecies_) {
        throw std::invalid_argument("Reconstructor::reconstruct: slopes are not allocated for this mesh");
    }
    reconstructX(mesh, cells);
    if (mesh.dim() >= 2) reconstructY(mesh, cells);
}

void Reconstructor::reconstructX(const RectilinearMesh& mesh, const std::vector<KineticCell>& cells) {
    const int nx = mesh.nx();
    const bool wallLo = mesh.boundaryCondition(RectilinearMesh::XLow) == BoundaryCondition::MaxwellWall;
    const bool wallHi = mesh.boundaryCondition(RectilinearMesh::XHigh) == BoundaryCondition::MaxwellWall;

    for (int j = 0; j < mesh.ny(); ++j) {
        for (int i = wallLo ? 0 : -1; i <= (wallHi ? nx - 1 : nx); ++i) {
            const KineticCell& c = cells[mesh.index(i, j)];
            const bool loWall = wallLo && i == 0;
            const bool hiWall = wallHi && i == nx - 1;
            const double dxL = 0.5 * (mesh.dx(i - 1) + mesh.dx(i));
            const double dxR = 0.5 * (mesh.dx(i) + mesh.dx(i + 1));
            for (int s = 0; s < nSpecies_; ++s) {
                const DistributionSet* lo = loWall ? nullptr : &cells[mesh.index(i - 1, j)].species[s].pdf;
                const DistributionSet* hi = hiWall ? nullptr : &cells[mesh.index(i + 1, j)].species[s].pdf;
                limitedSlope(xSlopes_[mesh.index(i, j) * nSpecies_ + s], c.species[s].pdf,
                             lo, hi, dxL, dxR);
            }
        }
    }
}

void Reconstructor::reconstructY(const RectilinearMesh& mesh, const std::vector<KineticCell>& cells) {
    const int ny = mesh.ny();
    const bool wallLo = mesh.boundaryCondition(RectilinearMesh::YLow) == BoundaryCondition::MaxwellWall;
    const bool wallHi = mesh.boundaryCondition(RectilinearMesh::YHigh) == BoundaryCondition::MaxwellWall;

    for (int j = wallLo ? 0 : -1; j <= (wallHi ? ny - 1 : ny); ++j) {
        const bool loWall = wallLo && j == 0;
        const bool hiWall = wallHi && j == ny - 1;
        const double dyL = 0.5 * (mesh.dy(j - 1) + mesh.dy(j));
        const double dyR = 0.5 * (mesh.dy(j) + mesh.dy(j + 1));
        for (int i = 0; i < mesh.nx(); ++i) {
            const KineticCell& c = cells[mesh.index(i, j)];
            for (int s = 0; s < nSpecies_; ++s) {
                const DistributionSet* lo = loWall ? nullptr : &cells[mesh.index(i, j - 1)].species[s].pdf;
                const DistributionSet* hi = hiWall ? nullptr : &cells[mesh.index(i, j + 1)].species[s].pdf;
                limitedSlope(ySlopes_[mesh.index(i, j) * nSpecies_ + s], c.species[s].pdf,
                             lo, hi, dyL, dyR);
            }
        }
    }
}

} // namespace KineticFV
