#include "KineticFlux.hpp"
#include "Moments.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace KineticFV {

KineticFlux::KineticFlux(const CellUpdate& update)
    : update_(update)
{
    if (update.scheme() == UpdateScheme::Hydrodynamic) {
        throw std::invalid_argument("KineticFlux: the hydrodynamic scheme carries no distributions");
    }
}

namespace {

const std::vector<double>& normalSpeed(const VelocityGrid& grid, int direction) {
    if (direction < 0 || direction >= grid.dim()) {
        throw std::invalid_argument("KineticFlux: face direction " + std::to_string(direction) +
                                    " is not resolved by a " + std::to_string(grid.dim()) +
                                    "D velocity grid");
    }
    return grid.coord(direction);
}

} // namespace

// ---------------------------------------------------------------------------
// Interior faces
// ---------------------------------------------------------------------------

void KineticFlux::kfvs(FaceFlux& face, const KineticCell& low, const KineticCell& high,
                       int direction, double dt, double area) const {
    const int nSpecies = update_.config().nSpecies;
    for (int s = 0; s < nSpecies; ++s) {
        const VelocityGrid& grid = update_.grid(s);
        const std::vector<double>& cn = normalSpeed(grid, direction);
        const DistributionSet& fl = low.species[s].pdf;
        const DistributionSet& fr = high.species[s].pdf;
        DistributionSet& ff = face.species[s].ff;

        for (int f = 0; f < ff.count(); ++f) {
            const std::vector<double>& a = fl.field(f);
            const std::vector<double>& b = fr.field(f);
            std::vector<double>& out = ff.field(f);
            for (std::size_t i = 0; i < grid.size(); ++i) {
                out[i] = dt * area * cn[i] * (cn[i] > 0.0 ? a[i] : b[i]);
            }
        }
        face.species[s].fw = conservedMoments(ff, grid);
    }
    face.emLeft.fill(0.0);
    face.emRight.fill(0.0);
}

void KineticFlux::kfvs(FaceFlux& face, const KineticCell& low, const KineticCell& high,
                       const DistributionSet* lowSlope, const DistributionSet* highSlope,
                       double dxLow, double dxHigh, int direction, double dt, double area) const {
    const int nSpecies = update_.config().nSpecies;
    for (int s = 0; s < nSpecies; ++s) {
        const VelocityGrid& grid = update_.grid(s);
        const std::vector<double>& cn = normalSpeed(grid, direction);
        const DistributionSet& fl = low.species[s].pdf;
        const DistributionSet& fr = high.species[s].pdf;
        DistributionSet& ff = face.species[s].ff;

        for (int f = 0; f < ff.count(); ++f) {
            const std::vector<double>& a = fl.field(f);
            const std::vector<double>& b = fr.field(f);
            const std::vector<double>& sa = lowSlope[s].field(f);
            const std::vector<double>& sb = highSlope[s].field(f);
            std::vector<double>& out = ff.field(f);
            for (std::size_t i = 0; i < grid.size(); ++i) {
                const double c = cn[i];
                const double value = c > 0.0 ? a[i] + 0.5 * dxLow * sa[i] : b[i] - 0.5 * dxHigh * sb[i];
                const double slope = c > 0.0 ? sa[i] : sb[i];
                out[i] = dt * area * (c * value - 0.5 * dt * c * c * slope);
            }
        }
        face.species[s].fw = conservedMoments(ff, grid);
    }
    face.emLeft.fill(0.0);
    face.emRight.fill(0.0);
}

// ---------------------------------------------------------------------------
// Maxwell wall
// ---------------------------------------------------------------------------

std::vector<double> KineticFlux::wallPrimitive(int species, const WallState& wall) const {
    const SimulationConfig& config = update_.config();
    const bool rotational = config.distribution == DistributionModel::Rotational;
    const int length = config.stateLength();
    const int nVel = length - (rotational ? 3 : 2);

    // lambda = m / (2 kT): heavier species see a larger wall lambda.
    double lambda = wall.lambda;
    if (config.nSpecies == 2) {
        lambda *= (species == 0) ? config.mixture.mi : config.mixture.me;
    }

    std::vector<double> prim(length, 0.0);
    prim[0] = 1.0;
    for (int d = 0; d < nVel && d < 3; ++d) prim[d + 1] = wall.velocity[d];
    prim[nVel + 1] = lambda;
    if (rotational) prim[nVel + 2] = lambda;
    return prim;
}

void KineticFlux::maxwellWall(FaceFlux& face, const KineticCell& cell, const WallState& wall,
                              int direction, bool wallOnHighSide, double dt, double area) const {
    const int nSpecies = update_.config().nSpecies;
    for (int s = 0; s < nSpecies; ++s) {
        const VelocityGrid& grid = update_.grid(s);
        const std::vector<double>& cn = normalSpeed(grid, direction);
        const std::vector<double>& omega = grid.weights();
        const DistributionSet& f = cell.species[s].pdf;
        const DistributionSet M = update_.equilibrium(s, wallPrimitive(s, wall));

        // Nodes leaving the cell toward the wall.
        auto outgoing = [&](std::size_t i) {
            return wallOnHighSide ? cn[i] > 0.0 : cn[i] < 0.0;
        };

        double outflow = 0.0;
        double inflow = 0.0;
        for (std::size_t i = 0; i < grid.size(); ++i) {
            if (outgoing(i)) {
                outflow += omega[i] * cn[i] * f.h[i];
            } else {
                inflow += omega[i] * cn[i] * M.h[i];
            }
        }
        if (inflow == 0.0) {
            throw std::runtime_error("KineticFlux::maxwellWall: velocity grid has no nodes entering species " +
                                     std::to_string(s) + " from the wall");
        }
        const double rhoWall = -outflow / inflow;

        DistributionSet& ff = face.species[s].ff;
        for (int k = 0; k < ff.count(); ++k) {
            const std::vector<double>& cellField = f.field(k);
            const std::vector<double>& wallField = M.field(k);
            std::vector<double>& out = ff.field(k);
            for (std::size_t i = 0; i < grid.size(); ++i) {
                const double value = outgoing(i) ? cellField[i] : rhoWall * wallField[i];
                out[i] = dt * area * cn[i] * value;
            }
        }
        face.species[s].fw = conservedMoments(ff, grid);
    }
    face.emLeft.fill(0.0);
    face.emRight.fill(0.0);
}

} // namespace KineticFV
