#ifndef MOMENTS_HPP
#define MOMENTS_HPP

#include "State.hpp"
#include "VelocitySpace.hpp"
#include <array>
#include <vector>

namespace KineticFV {

/// Raw moments of orders 0..6 along one velocity axis.
using MomentSeries = std::array<double, 7>;
/// Internal-energy moments of orders 0, 2 and 4 (indexed by order / 2).
using InternalMoments = std::array<double, 3>;

/// Closed-form moments of a unit-density Maxwellian.
///
/// Mu is split into half-range parts, MuL over u > 0 and MuR over u < 0
/// (the velocity ranges that feed a face from its left and right cells),
/// with Mu = MuL + MuR. Mv and Mw are only filled when the primitive vector
/// carries the corresponding velocity component; Mxi only when the internal
/// degrees of freedom are supplied.
struct GaussMoments {
    MomentSeries Mu = {};
    MomentSeries MuL = {};
    MomentSeries MuR = {};
    MomentSeries Mv = {};
    MomentSeries Mw = {};
    InternalMoments Mxi = {1.0, 0.0, 0.0};
    int nVelocity = 1;
    bool hasInternal = false;
};

// ---- Quadrature sums ----

/// Sum of weights * f.
double discreteMoment(const std::vector<double>& f, const std::vector<double>& weights);

/// Sum of weights * u^n * f.
double discreteMoment(const std::vector<double>& f, const std::vector<double>& u,
                      const std::vector<double>& weights, int n);

/// Conserved moments (mass, momentum, energy) of a distribution set. The
/// layout follows pdf.model and grid.dim(); the energy entry is half the
/// second moment plus half the zeroth moment of any internal-energy carrier.
/// Unsupported model/dimension pairs throw std::invalid_argument.
std::vector<double> conservedMoments(const DistributionSet& pdf, const VelocityGrid& grid);

// ---- Analytic Maxwellian moments ----

GaussMoments gaussMoments(const std::vector<double>& prim);
GaussMoments gaussMoments(const std::vector<double>& prim, double inK);

/// <u^alpha xi^delta psi> for 1V with internal energy (3 entries).
std::vector<double> momentsConserve(const MomentSeries& Mu, const InternalMoments& Mxi,
                                    int alpha, int delta);
/// <u^alpha v^beta xi^delta psi> for 2V with internal energy (4 entries).
std::vector<double> momentsConserve(const MomentSeries& Mu, const MomentSeries& Mv,
                                    const InternalMoments& Mxi,
                                    int alpha, int beta, int delta);
/// <u^alpha v^beta w^delta psi> for 3V (5 entries).
std::vector<double> momentsConserve(const MomentSeries& Mu, const MomentSeries& Mv,
                                    const MomentSeries& Mw,
                                    int alpha, int beta, int delta);

/// <a u^alpha psi> where a holds the expansion coefficients of a slope.
std::vector<double> momentsConserveSlope(const std::vector<double>& a,
                                         const MomentSeries& Mu, const InternalMoments& Mxi,
                                         int alpha);
std::vector<double> momentsConserveSlope(const std::vector<double>& a,
                                         const MomentSeries& Mu, const MomentSeries& Mv,
                                         const InternalMoments& Mxi,
                                         int alpha, int beta);
std::vector<double> momentsConserveSlope(const std::vector<double>& a,
                                         const MomentSeries& Mu, const MomentSeries& Mv,
                                         const MomentSeries& Mw,
                                         int alpha, int beta, int delta);

// ---- Non-conserved moments ----

/// p = rho / (2 lambda).
double pressure(const std::vector<double>& prim);

/// Pressure from the distributions. Internal-energy carriers share the
/// pressure over K + D degrees of freedom.
double pressure(const DistributionSet& pdf, const std::vector<double>& prim,
                const VelocityGrid& grid, double K);

/// Stress tensor of f about the bulk velocity, row-major D x D.
std::vector<double> stress(const std::vector<double>& f, const std::vector<double>& prim,
                           const VelocityGrid& grid);

/// Heat flux about the bulk velocity.
///   Monatomic, InternalEnergy : D entries
///   Rotational 1V             : {translational, rotational}
///   Rotational 2V             : {qt_x, qt_y, qr_x, qr_y}
///   PlasmaFourMoment          : 1 entry (along u)
///   PlasmaThreeMoment         : 2 entries
std::vector<double> heatFlux(const DistributionSet& pdf, const std::vector<double>& prim,
                             const VelocityGrid& grid);

} // namespace KineticFV

#endif // MOMENTS_HPP
