#ifndef ELECTROMAGNETIC_COUPLING_HPP
#define ELECTROMAGNETIC_COUPLING_HPP

#include "SimulationConfig.hpp"
#include <Eigen/Dense>
#include <array>
#include <cstddef>
#include <vector>

namespace KineticFV {

using Vector3 = std::array<double, 3>;

/// Crank-Nicolson system coupling the electric field with the ion and
/// electron bulk velocities. Unknowns at the new level are ordered
/// (E_x, E_y, E_z, U_i, V_i, W_i, U_e, V_e, W_e).
struct FieldVelocitySystem {
    Eigen::Matrix<double, 9, 9> A;
    Eigen::Matrix<double, 9, 1> b;
};

/// Assemble the 9x9 system from the two species' primitive states
/// (rho, U, V, W, lambda), the current fields and the step size.
FieldVelocitySystem emCoefficients(const std::vector<std::vector<double>>& prim,
                                   const Vector3& E, const Vector3& B,
                                   const MixtureParams& mixture,
                                   const PlasmaParams& plasma, double dt);

/// Solve with a partially pivoted LU. Throws std::runtime_error if the
/// solution is not finite.
Eigen::Matrix<double, 9, 1> solveFieldVelocity(const FieldVelocitySystem& system);

/// Time-centred Lorentz acceleration per species, {ion, electron}, from the
/// old state and the solved new-level unknowns x.
std::array<Vector3, 2> lorentzForce(const std::vector<std::vector<double>>& prim,
                                    const Vector3& E, const Vector3& B,
                                    const Eigen::Matrix<double, 9, 1>& x,
                                    const MixtureParams& mixture,
                                    const PlasmaParams& plasma);

/// Advect a distribution along one uniform velocity axis by a*dt: an integer
/// node shift followed by a first-order upwind fractional shift. Nodes that
/// enter from outside the grid are set to zero. The line addressed is
/// f[offset + k*stride], k in [0, n).
void shiftPdf(std::vector<double>& f, std::size_t offset, std::size_t n, std::size_t stride,
              double a, double du, double dt);

void shiftPdf(std::vector<double>& f, double a, double du, double dt);

} // namespace KineticFV

#endif // ELECTROMAGNETIC_COUPLING_HPP
