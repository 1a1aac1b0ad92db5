#include "EntropyClosure.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace KineticFV {

namespace {

Eigen::VectorXd closureValues(const Eigen::VectorXd& alpha, const Eigen::MatrixXd& m) {
    return (m.transpose() * alpha).array().exp().matrix();
}

double objective(const Eigen::VectorXd& alpha, const Eigen::MatrixXd& m,
                 const Eigen::VectorXd& w, const Eigen::VectorXd& target) {
    return closureValues(alpha, m).dot(w) - alpha.dot(target);
}

} // namespace

Eigen::MatrixXd momentBasis(const std::vector<double>& u, int n) {
    if (n < 1) {
        throw std::invalid_argument("momentBasis: moment count must be positive (got " +
                                    std::to_string(n) + ")");
    }
    Eigen::MatrixXd m(n, static_cast<Eigen::Index>(u.size()));
    for (Eigen::Index j = 0; j < m.cols(); ++j) {
        double p = 1.0;
        for (int i = 0; i < n; ++i) {
            m(i, j) = p;
            p *= u[j];
        }
    }
    return m;
}

ClosureResult optimizeClosure(const Eigen::VectorXd& alpha0,
                              const Eigen::MatrixXd& m,
                              const std::vector<double>& weights,
                              const Eigen::VectorXd& target,
                              const ClosureOptions& options) {
    if (alpha0.size() != m.rows() || target.size() != m.rows() ||
        static_cast<Eigen::Index>(weights.size()) != m.cols()) {
        throw std::invalid_argument("optimizeClosure: inconsistent basis, weight and moment sizes");
    }

    const Eigen::VectorXd w = Eigen::Map<const Eigen::VectorXd>(weights.data(),
                                                                static_cast<Eigen::Index>(weights.size()));
    ClosureResult result;
    result.alpha = alpha0;
    result.objective = objective(result.alpha, m, w, target);

    for (int it = 0; it < options.maxIterations; ++it) {
        const Eigen::VectorXd f = closureValues(result.alpha, m).cwiseProduct(w);
        const Eigen::VectorXd grad = m * f - target;
        result.gradientNorm = grad.norm();
        result.iterations = it;
        if (result.gradientNorm < options.tolerance) {
            return result;
        }

        const Eigen::MatrixXd hessian = m * f.asDiagonal() * m.transpose();
        Eigen::LDLT<Eigen::MatrixXd> ldlt(hessian);
        if (ldlt.info() != Eigen::Success || !ldlt.isPositive()) {
            throw std::runtime_error("optimizeClosure: Hessian is not positive definite");
        }
        const Eigen::VectorXd step = ldlt.solve(-grad);

        // Backtracking line search (Armijo condition).
        const double slope = grad.dot(step);
        double t = 1.0;
        Eigen::VectorXd trial = result.alpha + step;
        double trialObjective = objective(trial, m, w, target);
        while (!(trialObjective <= result.objective + 1e-4 * t * slope) && t > 1e-10) {
            t *= 0.5;
            trial = result.alpha + t * step;
            trialObjective = objective(trial, m, w, target);
        }

        result.alpha = trial;
        result.objective = trialObjective;
    }

    const Eigen::VectorXd grad =
        m * closureValues(result.alpha, m).cwiseProduct(w) - target;
    result.gradientNorm = grad.norm();
    result.iterations = options.maxIterations;
    if (result.gradientNorm < options.tolerance) {
        return result;
    }
    throw std::runtime_error("optimizeClosure: no convergence after " +
                             std::to_string(options.maxIterations) +
                             " iterations (|grad| = " + std::to_string(result.gradientNorm) + ")");
}

Eigen::VectorXd realizableReconstruct(const Eigen::VectorXd& alpha,
                                      const Eigen::MatrixXd& m,
                                      const std::vector<double>& weights) {
    if (static_cast<Eigen::Index>(weights.size()) != m.cols()) {
        throw std::invalid_argument("realizableReconstruct: weight count does not match basis");
    }
    const Eigen::VectorXd w = Eigen::Map<const Eigen::VectorXd>(weights.data(),
                                                                static_cast<Eigen::Index>(weights.size()));
    return m * closureValues(alpha, m).cwiseProduct(w);
}

std::vector<double> closurePdf(const Eigen::VectorXd& alpha, const Eigen::MatrixXd& m) {
    const Eigen::VectorXd f = closureValues(alpha, m);
    return std::vector<double>(f.data(), f.data() + f.size());
}

std::vector<double> samplePdf(const Eigen::MatrixXd& m, const std::vector<double>& prim,
                              std::mt19937& rng, double sigma) {
    if (m.rows() < 3 || prim.size() != 3) {
        throw std::invalid_argument("samplePdf: needs at least three moments and prim = (rho, U, lambda)");
    }
    const double rho = prim[0], U = prim[1], lambda = prim[2];

    // log of rho sqrt(lambda/pi) exp(-lambda (u - U)^2) expanded in powers of u
    Eigen::VectorXd alpha = Eigen::VectorXd::Zero(m.rows());
    alpha[0] = std::log(rho * std::sqrt(lambda / M_PI)) - lambda * U * U;
    alpha[1] = 2.0 * lambda * U;
    alpha[2] = -lambda;

    std::normal_distribution<double> noise(0.0, sigma);
    for (Eigen::Index i = 3; i < alpha.size(); ++i) {
        const double r = noise(rng);
        alpha[i] = (i % 2 == 0) ? -std::abs(r) : r;
    }

    return closurePdf(alpha, m);
}

} // namespace KineticFV
