#ifndef ENTROPY_CLOSURE_HPP
#define ENTROPY_CLOSURE_HPP

#include <Eigen/Dense>
#include <random>
#include <vector>

namespace KineticFV {

/// Maxwell-Boltzmann entropy closure on a 1D velocity grid.
///
/// The closed distribution is f(u) = exp(alpha . m(u)) where m(u) holds the
/// monomials 1, u, ..., u^(n-1). The Lagrange multipliers alpha are found by
/// minimising the dual objective
///
///   L(alpha) = sum_j w_j exp(alpha . m_j) - alpha . target
///
/// whose gradient vanishes when the closure reproduces the target moments.

struct ClosureOptions {
    int maxIterations = 100;
    double tolerance = 1e-10;      // on the gradient norm
};

struct ClosureResult {
    Eigen::VectorXd alpha;
    double objective = 0.0;
    double gradientNorm = 0.0;
    int iterations = 0;
};

/// n x nu matrix, row i = u^i.
Eigen::MatrixXd momentBasis(const std::vector<double>& u, int n);

/// Damped Newton iteration on L(alpha). Throws std::runtime_error when the
/// Hessian is not positive definite or the iteration limit is reached.
ClosureResult optimizeClosure(const Eigen::VectorXd& alpha0,
                              const Eigen::MatrixXd& m,
                              const std::vector<double>& weights,
                              const Eigen::VectorXd& target,
                              const ClosureOptions& options = ClosureOptions());

/// Moments sum_j w_j exp(alpha . m_j) m_j of the closed distribution.
Eigen::VectorXd realizableReconstruct(const Eigen::VectorXd& alpha,
                                      const Eigen::MatrixXd& m,
                                      const std::vector<double>& weights);

/// exp(alpha . m_j) at every node.
std::vector<double> closurePdf(const Eigen::VectorXd& alpha, const Eigen::MatrixXd& m);

/// Random closure distribution around the Maxwellian of prim = (rho, U, lambda).
/// The first three multipliers reproduce the Maxwellian; higher multipliers are
/// drawn from N(0, sigma), with even powers kept non-positive so the
/// distribution stays integrable.
std::vector<double> samplePdf(const Eigen::MatrixXd& m, const std::vector<double>& prim,
                              std::mt19937& rng, double sigma = 0.1);

} // namespace KineticFV

#endif // ENTROPY_CLOSURE_HPP
