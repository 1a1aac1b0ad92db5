#include "Equilibrium.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace KineticFV {

// ---------------------------------------------------------------------------
// Equilibrium distributions
// ---------------------------------------------------------------------------

std::vector<double> maxwellian(const VelocityGrid& grid, const std::vector<double>& prim) {
    const int D = grid.dim();
    if (static_cast<int>(prim.size()) < D + 2) {
        throw std::invalid_argument("maxwellian: primitive vector too short for a " +
                                    std::to_string(D) + "D velocity grid");
    }

    const double rho = prim[0];
    const double lambda = prim.back();
    const double norm = rho * std::pow(lambda / M_PI, 0.5 * D);

    std::vector<double> M(grid.size());
    for (std::size_t i = 0; i < grid.size(); ++i) {
        double c2 = 0.0;
        for (int d = 0; d < D; ++d) {
            double c = grid.coord(d)[i] - prim[d + 1];
            c2 += c * c;
        }
        M[i] = norm * std::exp(-lambda * c2);
    }
    return M;
}

std::vector<double> maxwellianInternal(const std::vector<double>& H, double K, double lambda) {
    std::vector<double> B(H.size());
    for (std::size_t i = 0; i < H.size(); ++i) {
        B[i] = H[i] * K / (2.0 * lambda);
    }
    return B;
}

RykovEquilibrium rykovMaxwellian(const VelocityGrid& grid, const std::vector<double>& prim,
                                 double lambdaT, double K, double Kr) {
    if (grid.dim() != 1 || prim.size() != 4) {
        throw std::invalid_argument("rykovMaxwellian: requires a 1V grid and (rho, U, lambda, lambdaR)");
    }
    const double rho = prim[0], U = prim[1], lambda = prim[2], lambdaR = prim[3];

    RykovEquilibrium M;
    M.HT = maxwellian(grid, {rho, U, lambdaT});
    M.BT = maxwellianInternal(M.HT, K, lambdaT);
    M.RT = maxwellianInternal(M.HT, Kr, lambdaR);

    M.HR = maxwellian(grid, {rho, U, lambda});
    M.BR = maxwellianInternal(M.HR, K, lambda);
    M.RR = maxwellianInternal(M.HR, Kr, lambda);
    return M;
}

// ---------------------------------------------------------------------------
// Relaxation times
// ---------------------------------------------------------------------------

double referenceViscosity(double Kn, double alpha, double omega) {
    return 5.0 * (alpha + 1.0) * (alpha + 2.0) * std::sqrt(M_PI) /
           (4.0 * alpha * (5.0 - 2.0 * omega) * (7.0 - 2.0 * omega)) * Kn;
}

double collisionTime(double rho, double lambda, double muRef, double omega) {
    return muRef * 2.0 * std::pow(lambda, 1.0 - omega) / rho;
}

double collisionTime(const std::vector<double>& prim, double muRef, double omega) {
    return collisionTime(prim.front(), prim.back(), muRef, omega);
}

std::array<double, 2> mixtureCollisionTime(const std::vector<std::vector<double>>& prim,
                                           const MixtureParams& p) {
    if (prim.size() != 2) {
        throw std::invalid_argument("mixtureCollisionTime: expected two species");
    }
    const double mass[2] = {p.mi, p.me};
    const double ntot = p.ni + p.ne;
    const double coeff = 4.0 * std::sqrt(M_PI) / 3.0 / (std::sqrt(2.0) * M_PI * p.Kn);

    std::array<double, 2> tau{};
    for (int k = 0; k < 2; ++k) {
        double nu = 0.0;
        for (int l = 0; l < 2; ++l) {
            double relative = std::sqrt(1.0 / prim[k].back() + 1.0 / prim[l].back());
            nu += prim[l].front() / (mass[l] * ntot) * coeff * relative;
        }
        tau[k] = 1.0 / nu;
    }
    return tau;
}

std::vector<std::vector<double>> mixturePrimitive(const std::vector<std::vector<double>>& prim,
                                                  const std::array<double, 2>& tau,
                                                  const MixtureParams& p) {
    if (prim.size() != 2 || prim[0].size() != prim[1].size()) {
        throw std::invalid_argument("mixturePrimitive: expected two species of equal layout");
    }
    const double mass[2] = {p.mi, p.me};
    const std::size_t nVel = prim[0].size() - 2;

    std::vector<std::vector<double>> mix = prim;
    for (int k = 0; k < 2; ++k) {
        const int l = 1 - k;
        const double nukl = 4.0 * std::sqrt(2.0) / (3.0 * std::sqrt(M_PI)) *
                            prim[l].front() / (mass[k] + mass[l]) *
                            std::sqrt(1.0 / prim[k].back() + 1.0 / prim[l].back());
        const double rate = tau[k] / p.Kn * nukl;

        double shift2 = 0.0;
        double du2 = 0.0;
        for (std::size_t d = 1; d <= nVel; ++d) {
            mix[k][d] = prim[k][d] + rate * (prim[l][d] - prim[k][d]);
            shift2 += (mix[k][d] - prim[k][d]) * (mix[k][d] - prim[k][d]);
            du2 += (prim[l][d] - prim[k][d]) * (prim[l][d] - prim[k][d]);
        }

        const double massRatio = mass[l] / mass[k];
        const double invLambda = 1.0 / prim[k].back() - 2.0 / 3.0 * shift2 +
                                 rate * 2.0 * mass[k] / (mass[k] + mass[l]) *
                                     (massRatio / prim[l].back() - 1.0 / prim[k].back() +
                                      2.0 / 3.0 * massRatio * du2);
        mix[k].back() = 1.0 / invLambda;
    }
    return mix;
}

// ---------------------------------------------------------------------------
// Shakhov
// ---------------------------------------------------------------------------

namespace {

// Projection c.q and |c|^2 about the bulk velocity at node i.
void peculiar(const VelocityGrid& grid, const std::vector<double>& prim,
              const std::vector<double>& q, std::size_t i, double& cq, double& c2) {
    cq = 0.0;
    c2 = 0.0;
    for (int d = 0; d < grid.dim(); ++d) {
        double c = grid.coord(d)[i] - prim[d + 1];
        cq += c * q[d];
        c2 += c * c;
    }
}

} // namespace

std::vector<double> shakhov(const VelocityGrid& grid, const std::vector<double>& M,
                            const std::vector<double>& q, const std::vector<double>& prim,
                            double Pr) {
    // The D-velocity gas carries D + 2 in place of 5 so that S holds (1 - Pr) q.
    const double D = grid.dim();
    const double rho = prim.front();
    const double lambda = prim.back();
    const double prefactor = 4.0 * (1.0 - Pr) * lambda * lambda / ((D + 2.0) * rho);

    std::vector<double> S(grid.size());
    for (std::size_t i = 0; i < grid.size(); ++i) {
        double cq, c2;
        peculiar(grid, prim, q, i, cq, c2);
        S[i] = prefactor * cq * (2.0 * lambda * c2 - (D + 2.0)) * M[i];
    }
    return S;
}

ShakhovCorrection shakhov(const VelocityGrid& grid,
                          const std::vector<double>& MH, const std::vector<double>& MB,
                          const std::vector<double>& q, const std::vector<double>& prim,
                          double Pr, double K) {
    const double rho = prim.front();
    const double lambda = prim.back();
    const double prefactor = 0.8 * (1.0 - Pr) * lambda * lambda / rho;

    ShakhovCorrection S;
    S.SH.resize(grid.size());
    S.SB.resize(grid.size());
    for (std::size_t i = 0; i < grid.size(); ++i) {
        double cq, c2;
        peculiar(grid, prim, q, i, cq, c2);
        S.SH[i] = prefactor * cq * (2.0 * lambda * c2 + K - 5.0) * MH[i];
        S.SB[i] = prefactor * cq * (2.0 * lambda * c2 + K - 3.0) * MB[i];
    }
    return S;
}

// ---------------------------------------------------------------------------
// Rykov
// ---------------------------------------------------------------------------

RykovCorrection rykov(const VelocityGrid& grid, const RykovEquilibrium& M,
                      const std::vector<double>& q, const std::vector<double>& prim,
                      double lambdaT, double Pr, double K, const RykovParams& params) {
    const double rho = prim[0];
    const double U = prim[1];
    const double lambda = prim[2];
    const double lambdaR = prim[3];
    const double qt = q[0];
    const double qr = q[1];
    const std::vector<double>& u = grid.u();

    // Translational heat flux is relaxed to (1 - Pr) qt on the partial branch and
    // omega0 qt on the equilibrium branch; rotational heat flux to sigma qr and
    // omega1 sigma qr respectively.
    const double aT = 0.8 * (1.0 - Pr) * lambdaT * lambdaT / rho;
    const double aR = 0.8 * params.omega0 * lambda * lambda / rho;
    const double bT = 8.0 * params.sigma * lambdaT * lambdaR / (rho * params.Kr);
    const double bR = 8.0 * params.omega1 * params.sigma * lambda * lambda / (rho * params.Kr);

    RykovCorrection S;
    const std::size_t n = grid.size();
    S.SHT.resize(n); S.SBT.resize(n); S.SRT.resize(n);
    S.SHR.resize(n); S.SBR.resize(n); S.SRR.resize(n);

    for (std::size_t i = 0; i < n; ++i) {
        const double c = u[i] - U;
        const double tT = aT * c * qt;
        const double tR = aR * c * qt;
        const double c2T = 2.0 * lambdaT * c * c;
        const double c2R = 2.0 * lambda * c * c;

        S.SHT[i] = tT * (c2T + K - 5.0) * M.HT[i];
        S.SBT[i] = tT * (c2T + K - 3.0) * M.BT[i];
        S.SRT[i] = tT * (c2T + K - 5.0) * M.RT[i] + bT * c * qr * M.RT[i];

        S.SHR[i] = tR * (c2R + K - 5.0) * M.HR[i];
        S.SBR[i] = tR * (c2R + K - 3.0) * M.BR[i];
        S.SRR[i] = tR * (c2R + K - 5.0) * M.RR[i] + bR * c * qr * M.RR[i];
    }
    return S;
}

double rykovZr(double T, double T0, double Z0) {
    return Z0 / (1.0 + 0.5 * std::pow(M_PI, 1.5) * std::sqrt(T0 / T) +
                 (M_PI + 0.25 * M_PI * M_PI) * T0 / T);
}

} // namespace KineticFV
