#include "CellUpdate.hpp"
#include "DiatomicGasEOS.hpp"
#include "ElectromagneticCoupling.hpp"
#include "Equilibrium.hpp"
#include "IdealGasEOS.hpp"
#include "Moments.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

namespace KineticFV {

namespace {

void warn(StepStatus& status, const std::string& message) {
    std::cerr << "Warning: " << message << "\n";
    status.warnings.push_back(message);
}

// q += (left - right + down - up) / measure for the array selected by field.
template <typename Accessor>
void addFaceFluxes(std::vector<double>& q, const CellFaces& faces, double measure,
                   Accessor field) {
    const double inv = 1.0 / measure;
    auto add = [&](const FaceFlux* face, double sign) {
        if (!face) return;
        const std::vector<double>& flux = field(*face);
        for (std::size_t i = 0; i < q.size(); ++i) {
            q[i] += sign * flux[i] * inv;
        }
    };
    add(faces.left, 1.0);
    add(faces.right, -1.0);
    add(faces.down, 1.0);
    add(faces.up, -1.0);
}

void transportPdf(DistributionSet& pdf, const CellFaces& faces, int s, double measure) {
    for (int f = 0; f < pdf.count(); ++f) {
        addFaceFluxes(pdf.field(f), faces, measure,
                      [s, f](const FaceFlux& face) -> const std::vector<double>& {
                          return face.species[s].ff.field(f);
                      });
    }
}

// f = (f + r M) / (1 + r), r = dt / tau
void relax(DistributionSet& pdf, const DistributionSet& target, double ratio) {
    const double denom = 1.0 / (1.0 + ratio);
    for (int f = 0; f < pdf.count(); ++f) {
        std::vector<double>& a = pdf.field(f);
        const std::vector<double>& M = target.field(f);
        for (std::size_t i = 0; i < a.size(); ++i) {
            a[i] = (a[i] + ratio * M[i]) * denom;
        }
    }
}

std::string componentName(const SimulationConfig& config, int s) {
    if (config.isPlasma()) return s == 0 ? "ion" : "electron";
    return "component " + std::to_string(s + 1);
}

// Velocity-space advection of one species under the Lorentz acceleration F.
void applyLorentz(DistributionSet& pdf, const VelocityGrid& grid, const Vector3& F, double dt) {
    if (pdf.model == DistributionModel::PlasmaFourMoment) {
        const double du = grid.axis(0).width();
        for (int f = 0; f < 4; ++f) {
            shiftPdf(pdf.field(f), F[0], du, dt);
        }

        // v and w are carried as moments: shear h1, h2, h3 = <v>, <w>, <v^2 + w^2>.
        const double ay = dt * F[1];
        const double az = dt * F[2];
        for (std::size_t i = 0; i < pdf.nodes(); ++i) {
            pdf.e[i] += 2.0 * ay * pdf.b[i] + ay * ay * pdf.h[i] +
                        2.0 * az * pdf.r[i] + az * az * pdf.h[i];
            pdf.r[i] += az * pdf.h[i];
            pdf.b[i] += ay * pdf.h[i];
        }
    } else {
        const std::size_t nu = grid.count(0);
        const std::size_t nv = grid.count(1);
        const double du = grid.axis(0).width();
        const double dv = grid.axis(1).width();
        for (int f = 0; f < 3; ++f) {
            std::vector<double>& a = pdf.field(f);
            for (std::size_t j = 0; j < nv; ++j) shiftPdf(a, j * nu, nu, 1, F[0], du, dt);
            for (std::size_t i = 0; i < nu; ++i) shiftPdf(a, i, nv, nu, F[1], dv, dt);
        }

        // h1, h2 = <w>, <w^2>
        const double az = dt * F[2];
        for (std::size_t i = 0; i < pdf.nodes(); ++i) {
            pdf.r[i] += 2.0 * az * pdf.b[i] + az * az * pdf.h[i];
            pdf.b[i] += az * pdf.h[i];
        }
    }
}

} // namespace

std::string toString(UpdateScheme scheme) {
    switch (scheme) {
        case UpdateScheme::Hydrodynamic: return "hydrodynamic";
        case UpdateScheme::Kinetic:      return "kinetic";
        case UpdateScheme::Rykov:        return "rykov";
        case UpdateScheme::Mixture:      return "mixture";
        case UpdateScheme::Plasma:       return "plasma";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

CellUpdate::CellUpdate(const SimulationConfig& config, std::vector<VelocityGrid> grids)
    : config_(config), grids_(std::move(grids))
{
    config_.validate();

    switch (config_.distribution) {
        case DistributionModel::None:
            scheme_ = UpdateScheme::Hydrodynamic;
            break;
        case DistributionModel::Monatomic:
            scheme_ = UpdateScheme::Kinetic;
            break;
        case DistributionModel::InternalEnergy:
            scheme_ = config_.nSpecies == 2 ? UpdateScheme::Mixture : UpdateScheme::Kinetic;
            break;
        case DistributionModel::Rotational:
            scheme_ = UpdateScheme::Rykov;
            break;
        case DistributionModel::PlasmaThreeMoment:
        case DistributionModel::PlasmaFourMoment:
            scheme_ = UpdateScheme::Plasma;
            break;
    }

    if (scheme_ != UpdateScheme::Hydrodynamic) {
        if (static_cast<int>(grids_.size()) != config_.nSpecies) {
            throw std::invalid_argument("CellUpdate: expected " + std::to_string(config_.nSpecies) +
                                        " velocity grid(s), got " + std::to_string(grids_.size()));
        }
        for (const auto& g : grids_) {
            if (g.dim() != config_.velocityDim) {
                throw std::invalid_argument("CellUpdate: velocity grid dimension " +
                                            std::to_string(g.dim()) + " does not match velocityDim " +
                                            std::to_string(config_.velocityDim));
            }
        }
    }

    if (scheme_ == UpdateScheme::Rykov) {
        eos_ = std::make_unique<DiatomicGasEOS>(config_.gas.K, config_.rykov.Kr);
    } else {
        eos_ = std::make_unique<IdealGasEOS>(config_.gas.gamma);
    }
}

std::size_t CellUpdate::residualLength() const {
    return static_cast<std::size_t>(config_.nSpecies) * config_.stateLength();
}

// ---------------------------------------------------------------------------
// Equilibrium and initialization
// ---------------------------------------------------------------------------

DistributionSet CellUpdate::equilibrium(int species, const std::vector<double>& prim) const {
    DistributionSet M;
    M.model = config_.distribution;
    if (M.model == DistributionModel::None) return M;

    const VelocityGrid& g = grids_.at(species);
    const double K = config_.gas.K;

    switch (M.model) {
        case DistributionModel::Monatomic:
            M.h = maxwellian(g, prim);
            break;
        case DistributionModel::InternalEnergy:
            M.h = maxwellian(g, prim);
            M.b = maxwellianInternal(M.h, K, prim.back());
            break;
        case DistributionModel::Rotational: {
            const DiatomicGasEOS diatomic(K, config_.rykov.Kr);
            RykovEquilibrium R = rykovMaxwellian(g, prim, diatomic.translationalLambda(prim),
                                                 K, config_.rykov.Kr);
            M.h = std::move(R.HT);
            M.b = std::move(R.BT);
            M.r = std::move(R.RT);
            break;
        }
        case DistributionModel::PlasmaFourMoment: {
            const GaussMoments G = gaussMoments(prim);
            M.h = maxwellian(g, prim);
            M.b.resize(M.h.size());
            M.r.resize(M.h.size());
            M.e.resize(M.h.size());
            for (std::size_t i = 0; i < M.h.size(); ++i) {
                M.b[i] = G.Mv[1] * M.h[i];
                M.r[i] = G.Mw[1] * M.h[i];
                M.e[i] = (G.Mv[2] + G.Mw[2]) * M.h[i];
            }
            break;
        }
        case DistributionModel::PlasmaThreeMoment: {
            const GaussMoments G = gaussMoments(prim);
            M.h = maxwellian(g, prim);
            M.b.resize(M.h.size());
            M.r.resize(M.h.size());
            for (std::size_t i = 0; i < M.h.size(); ++i) {
                M.b[i] = G.Mw[1] * M.h[i];
                M.r[i] = G.Mw[2] * M.h[i];
            }
            break;
        }
        case DistributionModel::None:
            break;
    }
    return M;
}

void CellUpdate::initializeCell(KineticCell& cell, const std::vector<std::vector<double>>& prim,
                                double measure) const {
    if (static_cast<int>(prim.size()) != config_.nSpecies) {
        throw std::invalid_argument("CellUpdate::initializeCell: expected " +
                                    std::to_string(config_.nSpecies) + " primitive state(s)");
    }
    if (measure <= 0.0) {
        throw std::invalid_argument("CellUpdate::initializeCell: cell measure must be positive");
    }

    cell.measure = measure;
    cell.species.assign(config_.nSpecies, SpeciesState{});
    cell.field = FieldState{};
    for (int s = 0; s < config_.nSpecies; ++s) {
        if (static_cast<int>(prim[s].size()) != config_.stateLength()) {
            throw std::invalid_argument("CellUpdate::initializeCell: primitive state must have " +
                                        std::to_string(config_.stateLength()) + " entries (got " +
                                        std::to_string(prim[s].size()) + ")");
        }
        if (!physical(prim[s])) {
            throw std::invalid_argument("CellUpdate::initializeCell: density and temperature must be positive");
        }
        SpeciesState& sp = cell.species[s];
        sp.prim = prim[s];
        sp.w = eos_->toConservative(sp.prim);
        sp.pdf = equilibrium(s, sp.prim);
    }
}

// ---------------------------------------------------------------------------
// Shared sub-steps
// ---------------------------------------------------------------------------

bool CellUpdate::physical(const std::vector<double>& prim) const {
    // NaN compares false, so it counts as unphysical.
    if (!isPhysical(prim)) return false;
    if (config_.distribution == DistributionModel::Rotational) {
        return prim[prim.size() - 2] > 0.0;
    }
    return true;
}

void CellUpdate::integrateMoments(SpeciesState& sp, int s, const CellFaces& faces,
                                  double measure, StepStatus& status) const {
    const std::vector<double> wOld = sp.w;
    const std::vector<double> primOld = sp.prim;

    addFaceFluxes(sp.w, faces, measure,
                  [s](const FaceFlux& face) -> const std::vector<double>& {
                      return face.species[s].fw;
                  });
    sp.prim = eos_->toPrimitive(sp.w);

    if (!physical(sp.prim)) {
        sp.w = wOld;
        sp.prim = primOld;
        status.rolledBackSpecies.push_back(s);
        warn(status, "negative temperature update of " + componentName(config_, s) +
                     "; macroscopic state rolled back");
    }
}

void CellUpdate::interspeciesSource(KineticCell& cell, const std::vector<std::vector<double>>& wOld,
                                    double dt, StepStatus& status) const {
    const std::vector<std::vector<double>> prim = {cell.species[0].prim, cell.species[1].prim};
    const auto tau = mixtureCollisionTime(prim, config_.mixture);
    const auto mprim = mixturePrimitive(prim, tau, config_.mixture);

    for (int s = 0; s < 2; ++s) {
        SpeciesState& sp = cell.species[s];
        const std::vector<double> wPre = sp.w;
        const std::vector<double> mw = eos_->toConservative(mprim[s]);
        for (std::size_t i = 0; i < sp.w.size(); ++i) {
            sp.w[i] += (mw[i] - wOld[s][i]) * dt / tau[s];
        }
        std::vector<double> primNew = eos_->toPrimitive(sp.w);
        if (physical(primNew)) {
            sp.prim = std::move(primNew);
        } else {
            sp.w = wPre;
            status.rolledBackSpecies.push_back(s);
            warn(status, "interspecies source drove the temperature of " +
                         componentName(config_, s) + " negative; source skipped");
        }
    }
}

void CellUpdate::accumulate(const KineticCell& cell, const std::vector<std::vector<double>>& wOld,
                            ResidualAccumulator& residual) const {
    const std::size_t L = config_.stateLength();
    for (std::size_t s = 0; s < cell.species.size(); ++s) {
        const std::vector<double>& w = cell.species[s].w;
        for (std::size_t i = 0; i < L; ++i) {
            const double dw = w[i] - wOld[s][i];
            residual.res[s * L + i] += dw * dw;
            residual.avg[s * L + i] += std::abs(w[i]);
        }
    }
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

StepStatus CellUpdate::step(KineticCell& cell, const CellFaces& faces, double dt,
                            ResidualAccumulator& residual) const {
    if (static_cast<int>(cell.species.size()) != config_.nSpecies) {
        throw std::invalid_argument("CellUpdate::step: cell holds " +
                                    std::to_string(cell.species.size()) + " species, expected " +
                                    std::to_string(config_.nSpecies));
    }
    if (residual.res.size() != residualLength() || residual.avg.size() != residualLength()) {
        throw std::invalid_argument("CellUpdate::step: residual accumulator holds " +
                                    std::to_string(residual.res.size()) + " entries, expected " +
                                    std::to_string(residualLength()));
    }

    StepStatus status;
    switch (scheme_) {
        case UpdateScheme::Hydrodynamic: stepHydrodynamic(cell, faces, residual, status); break;
        case UpdateScheme::Kinetic:      stepKinetic(cell, faces, dt, residual, status); break;
        case UpdateScheme::Rykov:        stepRykov(cell, faces, dt, residual, status); break;
        case UpdateScheme::Mixture:      stepMixture(cell, faces, dt, residual, status); break;
        case UpdateScheme::Plasma:       stepPlasma(cell, faces, dt, residual, status); break;
    }
    return status;
}

// ---------------------------------------------------------------------------
// Variants
// ---------------------------------------------------------------------------

void CellUpdate::stepHydrodynamic(KineticCell& cell, const CellFaces& faces,
                                  ResidualAccumulator& residual, StepStatus& status) const {
    const std::vector<std::vector<double>> wOld = {cell.species[0].w};
    integrateMoments(cell.species[0], 0, faces, cell.measure, status);
    accumulate(cell, wOld, residual);
}

void CellUpdate::stepKinetic(KineticCell& cell, const CellFaces& faces, double dt,
                             ResidualAccumulator& residual, StepStatus& status) const {
    SpeciesState& sp = cell.species[0];
    const VelocityGrid& g = grids_[0];
    const bool internal = sp.pdf.model == DistributionModel::InternalEnergy;
    const double K = config_.gas.K;

    // Shakhov terms are built from the pre-step state.
    std::vector<double> SH, SB;
    if (config_.collision == CollisionModel::Shakhov) {
        const std::vector<double> q = heatFlux(sp.pdf, sp.prim, g);
        const std::vector<double> MH = maxwellian(g, sp.prim);
        if (internal) {
            ShakhovCorrection S = shakhov(g, MH, maxwellianInternal(MH, K, sp.prim.back()),
                                          q, sp.prim, config_.gas.Pr, K);
            SH = std::move(S.SH);
            SB = std::move(S.SB);
        } else {
            SH = shakhov(g, MH, q, sp.prim, config_.gas.Pr);
        }
    }

    const std::vector<std::vector<double>> wOld = {sp.w};
    integrateMoments(sp, 0, faces, cell.measure, status);
    accumulate(cell, wOld, residual);

    DistributionSet M = equilibrium(0, sp.prim);
    for (std::size_t i = 0; i < SH.size(); ++i) M.h[i] += SH[i];
    for (std::size_t i = 0; i < SB.size(); ++i) M.b[i] += SB[i];
    const double tau = collisionTime(sp.prim, config_.gas.muRef, config_.gas.omega);

    transportPdf(sp.pdf, faces, 0, cell.measure);
    relax(sp.pdf, M, dt / tau);
}

void CellUpdate::stepRykov(KineticCell& cell, const CellFaces& faces, double dt,
                           ResidualAccumulator& residual, StepStatus& status) const {
    SpeciesState& sp = cell.species[0];
    const VelocityGrid& g = grids_[0];
    const std::vector<double>& omega = g.weights();
    const RykovParams& ry = config_.rykov;
    const double K = config_.gas.K;
    const DiatomicGasEOS diatomic(K, ry.Kr);

    // (rho, U, lambda, lambdaR); rhoEr is the last conserved entry.
    const std::vector<double> wOld = sp.w;
    const std::vector<double> primOld = sp.prim;
    const std::size_t iEr = sp.w.size() - 1;

    const std::vector<double> q = heatFlux(sp.pdf, primOld, g);

    addFaceFluxes(sp.w, faces, cell.measure,
                  [](const FaceFlux& face) -> const std::vector<double>& {
                      return face.species[0].fw;
                  });

    // Rotational energy relaxes toward the Zr-weighted mix of both equilibria.
    // Collision times follow the translational temperature.
    const double lambdaTOld = diatomic.translationalLambda(primOld);
    const RykovEquilibrium Mold = rykovMaxwellian(g, primOld, lambdaTOld, K, ry.Kr);
    const double tauOld = collisionTime(primOld[0], lambdaTOld,
                                        config_.gas.muRef, config_.gas.omega);
    const double Zr = rykovZr(1.0 / lambdaTOld, ry.T0, ry.Z0);
    double Er = 0.0;
    for (std::size_t i = 0; i < g.size(); ++i) {
        Er += 0.5 * omega[i] * (Mold.RR[i] / Zr + (1.0 - 1.0 / Zr) * Mold.RT[i]);
    }
    sp.w[iEr] += dt * (Er - wOld[iEr]) / tauOld;
    sp.prim = diatomic.toPrimitive(sp.w);

    if (!physical(sp.prim)) {
        sp.w = wOld;
        sp.prim = primOld;
        status.rolledBackSpecies.push_back(0);
        warn(status, "negative temperature update of component 1; macroscopic state rolled back");
    }
    accumulate(cell, {wOld}, residual);

    const double lambdaT = diatomic.translationalLambda(sp.prim);
    const RykovEquilibrium M = rykovMaxwellian(g, sp.prim, lambdaT, K, ry.Kr);
    const RykovCorrection S = rykov(g, M, q, sp.prim, lambdaT, config_.gas.Pr, K, ry);

    DistributionSet target(DistributionModel::Rotational, g.size());
    const double wR = 1.0 / Zr;
    const double wT = 1.0 - wR;
    for (std::size_t i = 0; i < g.size(); ++i) {
        target.h[i] = wT * (M.HT[i] + S.SHT[i]) + wR * (M.HR[i] + S.SHR[i]);
        target.b[i] = wT * (M.BT[i] + S.SBT[i]) + wR * (M.BR[i] + S.SBR[i]);
        target.r[i] = wT * (M.RT[i] + S.SRT[i]) + wR * (M.RR[i] + S.SRR[i]);
    }
    const double tau = collisionTime(sp.prim[0], lambdaT,
                                     config_.gas.muRef, config_.gas.omega);

    transportPdf(sp.pdf, faces, 0, cell.measure);
    relax(sp.pdf, target, dt / tau);
}

void CellUpdate::stepMixture(KineticCell& cell, const CellFaces& faces, double dt,
                             ResidualAccumulator& residual, StepStatus& status) const {
    const std::vector<std::vector<double>> wOld = {cell.species[0].w, cell.species[1].w};

    for (int s = 0; s < 2; ++s) {
        integrateMoments(cell.species[s], s, faces, cell.measure, status);
    }
    interspeciesSource(cell, wOld, dt, status);
    accumulate(cell, wOld, residual);

    const std::vector<std::vector<double>> prim = {cell.species[0].prim, cell.species[1].prim};
    const auto tau = mixtureCollisionTime(prim, config_.mixture);
    const auto mprim = mixturePrimitive(prim, tau, config_.mixture);

    for (int s = 0; s < 2; ++s) {
        SpeciesState& sp = cell.species[s];
        transportPdf(sp.pdf, faces, s, cell.measure);
        relax(sp.pdf, equilibrium(s, mprim[s]), dt / tau[s]);
    }
}

void CellUpdate::stepPlasma(KineticCell& cell, const CellFaces& faces, double dt,
                            ResidualAccumulator& residual, StepStatus& status) const {
    const std::vector<std::vector<double>> wOld = {cell.species[0].w, cell.species[1].w};

    for (int s = 0; s < 2; ++s) {
        integrateMoments(cell.species[s], s, faces, cell.measure, status);
    }
    if (config_.plasma.interspeciesCollisions) {
        interspeciesSource(cell, wOld, dt, status);
    }

    // Field transport: (E, B, phi, psi) -= (left.emRight + right.emLeft + ...) / measure
    FieldState& field = cell.field;
    std::array<double, 8> em = {field.E[0], field.E[1], field.E[2],
                                field.B[0], field.B[1], field.B[2],
                                field.phi, field.psi};
    auto subtract = [&](const FaceFlux* face, bool lowSide) {
        if (!face) return;
        const std::array<double, 8>& flux = lowSide ? face->emRight : face->emLeft;
        for (int k = 0; k < 8; ++k) em[k] -= flux[k] / cell.measure;
    };
    subtract(faces.left, true);
    subtract(faces.right, false);
    subtract(faces.down, true);
    subtract(faces.up, false);
    field.E = {em[0], em[1], em[2]};
    field.B = {em[3], em[4], em[5]};
    field.phi = em[6];
    field.psi = em[7];

    for (double value : em) {
        if (std::isnan(value)) {
            status.fieldNaN = true;
            break;
        }
    }

    Eigen::Matrix<double, 9, 1> x;
    if (!status.fieldNaN) {
        const std::vector<std::vector<double>> prim = {cell.species[0].prim, cell.species[1].prim};
        try {
            x = solveFieldVelocity(
                emCoefficients(prim, field.E, field.B, config_.mixture, config_.plasma, dt));
        } catch (const std::runtime_error& e) {
            warn(status, e.what());
            status.fieldNaN = true;
        }
    }

    if (status.fieldNaN) {
        // No recovery is defined for the field state; skip the implicit solve.
        warn(status, "NaN electromagnetic update; Lorentz force disabled for this step");
        for (auto& sp : cell.species) sp.lorentz = {0.0, 0.0, 0.0};
    } else {
        const std::vector<std::vector<double>> prim = {cell.species[0].prim, cell.species[1].prim};
        const auto force = lorentzForce(prim, field.E, field.B, x, config_.mixture, config_.plasma);

        field.E = {x[0], x[1], x[2]};
        for (int s = 0; s < 2; ++s) {
            SpeciesState& sp = cell.species[s];
            sp.lorentz = force[s];
            for (int d = 0; d < 3; ++d) sp.prim[d + 1] = x[3 + 3 * s + d];
            sp.w = eos_->toConservative(sp.prim);
        }
    }
    accumulate(cell, wOld, residual);

    for (int s = 0; s < 2; ++s) {
        SpeciesState& sp = cell.species[s];
        transportPdf(sp.pdf, faces, s, cell.measure);
        if (!status.fieldNaN) {
            applyLorentz(sp.pdf, grids_[s], sp.lorentz, dt);
        }
    }

    const std::vector<std::vector<double>> prim = {cell.species[0].prim, cell.species[1].prim};
    const auto tau = mixtureCollisionTime(prim, config_.mixture);
    const auto targetPrim = config_.plasma.interspeciesCollisions
                                ? mixturePrimitive(prim, tau, config_.mixture)
                                : prim;
    for (int s = 0; s < 2; ++s) {
        relax(cell.species[s].pdf, equilibrium(s, targetPrim[s]), dt / tau[s]);
    }
}

} // namespace KineticFV
