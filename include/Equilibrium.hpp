#ifndef EQUILIBRIUM_HPP
#define EQUILIBRIUM_HPP

#include "SimulationConfig.hpp"
#include "VelocitySpace.hpp"
#include <array>
#include <vector>

namespace KineticFV {

// ---- Equilibrium distributions ----

/// rho (lambda/pi)^(D/2) exp(-lambda |c - U|^2) at every node of the grid,
/// D = grid.dim(). Bulk velocity is read from prim[1..D], lambda from prim.back().
std::vector<double> maxwellian(const VelocityGrid& grid, const std::vector<double>& prim);

/// Internal-energy companion of a reduced Maxwellian: B = H K / (2 lambda).
std::vector<double> maxwellianInternal(const std::vector<double>& H, double K, double lambda);

/// Partial (T) and full (R) equilibria of the Rykov model on a 1V grid.
/// The T set keeps the rotational temperature frozen; the R set is the
/// common-temperature Maxwellian.
struct RykovEquilibrium {
    std::vector<double> HT, BT, RT;
    std::vector<double> HR, BR, RR;
};

/// prim = (rho, U, lambda, lambdaR), lambdaT the translational inverse temperature.
RykovEquilibrium rykovMaxwellian(const VelocityGrid& grid, const std::vector<double>& prim,
                                 double lambdaT, double K, double Kr);

// ---- Relaxation times ----

/// VHS reference viscosity for a given Knudsen number.
double referenceViscosity(double Kn, double alpha, double omega);

/// VHS collision time tau = 2 muRef lambda^(1 - omega) / rho.
double collisionTime(double rho, double lambda, double muRef, double omega);
double collisionTime(const std::vector<double>& prim, double muRef, double omega);

/// Hard-sphere relaxation times of a two-species gas (AAP model).
std::array<double, 2> mixtureCollisionTime(const std::vector<std::vector<double>>& prim,
                                           const MixtureParams& params);

/// Interspecies-equilibrated primitive states of the AAP model: each species
/// relaxes toward a velocity and temperature shifted toward its partner.
std::vector<std::vector<double>> mixturePrimitive(const std::vector<std::vector<double>>& prim,
                                                  const std::array<double, 2>& tau,
                                                  const MixtureParams& params);

// ---- Non-equilibrium corrections ----

struct ShakhovCorrection {
    std::vector<double> SH;
    std::vector<double> SB;
};

/// Shakhov term for a single (monatomic) distribution in D velocity dimensions.
std::vector<double> shakhov(const VelocityGrid& grid, const std::vector<double>& M,
                            const std::vector<double>& q, const std::vector<double>& prim,
                            double Pr);

/// Shakhov terms for the reduced (H, B) pair with K internal degrees of freedom.
ShakhovCorrection shakhov(const VelocityGrid& grid,
                          const std::vector<double>& MH, const std::vector<double>& MB,
                          const std::vector<double>& q, const std::vector<double>& prim,
                          double Pr, double K);

struct RykovCorrection {
    std::vector<double> SHT, SBT, SRT;
    std::vector<double> SHR, SBR, SRR;
};

/// Rykov corrections on a 1V grid. q = {translational, rotational} heat flux.
RykovCorrection rykov(const VelocityGrid& grid, const RykovEquilibrium& M,
                      const std::vector<double>& q, const std::vector<double>& prim,
                      double lambdaT, double Pr, double K, const RykovParams& params);

/// Rotational collision number (Parker's formula).
double rykovZr(double T, double T0, double Z0);

} // namespace KineticFV

#endif // EQUILIBRIUM_HPP
