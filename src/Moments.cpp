#include "Moments.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace KineticFV {

namespace {

double bulk(const std::vector<double>& prim, int d) {
    return (d + 1 < static_cast<int>(prim.size()) - 1) ? prim[d + 1] : 0.0;
}

void fillSeries(MomentSeries& M, double u, double lambda) {
    for (int i = 2; i < 7; ++i) {
        M[i] = u * M[i - 1] + 0.5 * (i - 1) * M[i - 2] / lambda;
    }
}

[[noreturn]] void unsupported(const char* where, DistributionModel model, int dim) {
    throw std::invalid_argument(std::string(where) + ": unsupported distribution model " +
                                std::to_string(static_cast<int>(model)) + " for " +
                                std::to_string(dim) + "D velocity space");
}

} // namespace

// ---------------------------------------------------------------------------
// Quadrature sums
// ---------------------------------------------------------------------------

double discreteMoment(const std::vector<double>& f, const std::vector<double>& weights) {
    double sum = 0.0;
    for (std::size_t i = 0; i < f.size(); ++i) {
        sum += weights[i] * f[i];
    }
    return sum;
}

double discreteMoment(const std::vector<double>& f, const std::vector<double>& u,
                      const std::vector<double>& weights, int n) {
    double sum = 0.0;
    for (std::size_t i = 0; i < f.size(); ++i) {
        sum += weights[i] * std::pow(u[i], n) * f[i];
    }
    return sum;
}

std::vector<double> conservedMoments(const DistributionSet& pdf, const VelocityGrid& grid) {
    const int D = grid.dim();
    const std::vector<double>& omega = grid.weights();
    const std::size_t n = grid.size();

    // |c|^2 at each node, c = node velocity
    auto speed2 = [&](std::size_t i) {
        double s = 0.0;
        for (int d = 0; d < D; ++d) s += grid.coord(d)[i] * grid.coord(d)[i];
        return s;
    };

    switch (pdf.model) {
        case DistributionModel::Monatomic:
        case DistributionModel::InternalEnergy: {
            const bool internal = pdf.model == DistributionModel::InternalEnergy;
            std::vector<double> w(D + 2, 0.0);
            for (std::size_t i = 0; i < n; ++i) {
                const double wf = omega[i] * pdf.h[i];
                w[0] += wf;
                for (int d = 0; d < D; ++d) w[d + 1] += grid.coord(d)[i] * wf;
                w[D + 1] += 0.5 * speed2(i) * wf;
                if (internal) w[D + 1] += 0.5 * omega[i] * pdf.b[i];
            }
            return w;
        }
        case DistributionModel::Rotational: {
            if (D > 2) unsupported("conservedMoments", pdf.model, D);
            std::vector<double> w(D + 3, 0.0);
            for (std::size_t i = 0; i < n; ++i) {
                const double wh = omega[i] * pdf.h[i];
                w[0] += wh;
                for (int d = 0; d < D; ++d) w[d + 1] += grid.coord(d)[i] * wh;
                w[D + 1] += 0.5 * (speed2(i) * wh + omega[i] * pdf.b[i] + omega[i] * pdf.r[i]);
                w[D + 2] += 0.5 * omega[i] * pdf.r[i];
            }
            return w;
        }
        case DistributionModel::PlasmaFourMoment: {
            if (D != 1) unsupported("conservedMoments", pdf.model, D);
            const std::vector<double>& u = grid.u();
            std::vector<double> w(5, 0.0);
            for (std::size_t i = 0; i < n; ++i) {
                w[0] += omega[i] * pdf.h[i];
                w[1] += omega[i] * u[i] * pdf.h[i];
                w[2] += omega[i] * pdf.b[i];
                w[3] += omega[i] * pdf.r[i];
                w[4] += 0.5 * (omega[i] * u[i] * u[i] * pdf.h[i] + omega[i] * pdf.e[i]);
            }
            return w;
        }
        case DistributionModel::PlasmaThreeMoment: {
            if (D != 2) unsupported("conservedMoments", pdf.model, D);
            const std::vector<double>& u = grid.u();
            const std::vector<double>& v = grid.v();
            std::vector<double> w(5, 0.0);
            for (std::size_t i = 0; i < n; ++i) {
                w[0] += omega[i] * pdf.h[i];
                w[1] += omega[i] * u[i] * pdf.h[i];
                w[2] += omega[i] * v[i] * pdf.h[i];
                w[3] += omega[i] * pdf.b[i];
                w[4] += 0.5 * (omega[i] * (u[i] * u[i] + v[i] * v[i]) * pdf.h[i] +
                               omega[i] * pdf.r[i]);
            }
            return w;
        }
        case DistributionModel::None:
            break;
    }
    unsupported("conservedMoments", pdf.model, D);
}

// ---------------------------------------------------------------------------
// Analytic Maxwellian moments
// ---------------------------------------------------------------------------

GaussMoments gaussMoments(const std::vector<double>& prim) {
    if (prim.size() < 3 || prim.size() > 5) {
        throw std::invalid_argument("gaussMoments: primitive vector must have 3, 4 or 5 entries (got " +
                                    std::to_string(prim.size()) + ")");
    }

    GaussMoments M;
    const double lambda = prim.back();
    const double u = prim[1];
    const double sl = std::sqrt(lambda);
    const double tail = 0.5 * std::exp(-lambda * u * u) / std::sqrt(M_PI * lambda);

    M.MuL[0] = 0.5 * std::erfc(-sl * u);
    M.MuL[1] = u * M.MuL[0] + tail;
    M.MuR[0] = 0.5 * std::erfc(sl * u);
    M.MuR[1] = u * M.MuR[0] - tail;
    fillSeries(M.MuL, u, lambda);
    fillSeries(M.MuR, u, lambda);
    for (int i = 0; i < 7; ++i) {
        M.Mu[i] = M.MuL[i] + M.MuR[i];
    }

    M.nVelocity = static_cast<int>(prim.size()) - 2;
    if (M.nVelocity >= 2) {
        M.Mv[0] = 1.0;
        M.Mv[1] = prim[2];
        fillSeries(M.Mv, prim[2], lambda);
    }
    if (M.nVelocity >= 3) {
        M.Mw[0] = 1.0;
        M.Mw[1] = prim[3];
        fillSeries(M.Mw, prim[3], lambda);
    }
    return M;
}

GaussMoments gaussMoments(const std::vector<double>& prim, double inK) {
    GaussMoments M = gaussMoments(prim);
    const double lambda = prim.back();
    M.Mxi[0] = 1.0;
    M.Mxi[1] = 0.5 * inK / lambda;
    M.Mxi[2] = (inK * inK + 2.0 * inK) / (4.0 * lambda * lambda);
    M.hasInternal = true;
    return M;
}

std::vector<double> momentsConserve(const MomentSeries& Mu, const InternalMoments& Mxi,
                                    int alpha, int delta) {
    const int x = delta / 2;
    return {
        Mu[alpha] * Mxi[x],
        Mu[alpha + 1] * Mxi[x],
        0.5 * (Mu[alpha + 2] * Mxi[x] + Mu[alpha] * Mxi[x + 1])
    };
}

std::vector<double> momentsConserve(const MomentSeries& Mu, const MomentSeries& Mv,
                                    const InternalMoments& Mxi,
                                    int alpha, int beta, int delta) {
    const int x = delta / 2;
    return {
        Mu[alpha] * Mv[beta] * Mxi[x],
        Mu[alpha + 1] * Mv[beta] * Mxi[x],
        Mu[alpha] * Mv[beta + 1] * Mxi[x],
        0.5 * (Mu[alpha + 2] * Mv[beta] * Mxi[x] +
               Mu[alpha] * Mv[beta + 2] * Mxi[x] +
               Mu[alpha] * Mv[beta] * Mxi[x + 1])
    };
}

std::vector<double> momentsConserve(const MomentSeries& Mu, const MomentSeries& Mv,
                                    const MomentSeries& Mw,
                                    int alpha, int beta, int delta) {
    return {
        Mu[alpha] * Mv[beta] * Mw[delta],
        Mu[alpha + 1] * Mv[beta] * Mw[delta],
        Mu[alpha] * Mv[beta + 1] * Mw[delta],
        Mu[alpha] * Mv[beta] * Mw[delta + 1],
        0.5 * (Mu[alpha + 2] * Mv[beta] * Mw[delta] +
               Mu[alpha] * Mv[beta + 2] * Mw[delta] +
               Mu[alpha] * Mv[beta] * Mw[delta + 2])
    };
}

std::vector<double> momentsConserveSlope(const std::vector<double>& a,
                                         const MomentSeries& Mu, const InternalMoments& Mxi,
                                         int alpha) {
    auto m0 = momentsConserve(Mu, Mxi, alpha, 0);
    auto m1 = momentsConserve(Mu, Mxi, alpha + 1, 0);
    auto m2 = momentsConserve(Mu, Mxi, alpha + 2, 0);
    auto mx = momentsConserve(Mu, Mxi, alpha, 2);

    std::vector<double> au(3);
    for (int i = 0; i < 3; ++i) {
        au[i] = a[0] * m0[i] + a[1] * m1[i] + 0.5 * a[2] * (m2[i] + mx[i]);
    }
    return au;
}

std::vector<double> momentsConserveSlope(const std::vector<double>& a,
                                         const MomentSeries& Mu, const MomentSeries& Mv,
                                         const InternalMoments& Mxi,
                                         int alpha, int beta) {
    auto m0 = momentsConserve(Mu, Mv, Mxi, alpha, beta, 0);
    auto mu = momentsConserve(Mu, Mv, Mxi, alpha + 1, beta, 0);
    auto mv = momentsConserve(Mu, Mv, Mxi, alpha, beta + 1, 0);
    auto muu = momentsConserve(Mu, Mv, Mxi, alpha + 2, beta, 0);
    auto mvv = momentsConserve(Mu, Mv, Mxi, alpha, beta + 2, 0);
    auto mxx = momentsConserve(Mu, Mv, Mxi, alpha, beta, 2);

    std::vector<double> au(4);
    for (int i = 0; i < 4; ++i) {
        au[i] = a[0] * m0[i] + a[1] * mu[i] + a[2] * mv[i] +
                0.5 * a[3] * (muu[i] + mvv[i] + mxx[i]);
    }
    return au;
}

std::vector<double> momentsConserveSlope(const std::vector<double>& a,
                                         const MomentSeries& Mu, const MomentSeries& Mv,
                                         const MomentSeries& Mw,
                                         int alpha, int beta, int delta) {
    auto m0 = momentsConserve(Mu, Mv, Mw, alpha, beta, delta);
    auto mu = momentsConserve(Mu, Mv, Mw, alpha + 1, beta, delta);
    auto mv = momentsConserve(Mu, Mv, Mw, alpha, beta + 1, delta);
    auto mw = momentsConserve(Mu, Mv, Mw, alpha, beta, delta + 1);
    auto muu = momentsConserve(Mu, Mv, Mw, alpha + 2, beta, delta);
    auto mvv = momentsConserve(Mu, Mv, Mw, alpha, beta + 2, delta);
    auto mww = momentsConserve(Mu, Mv, Mw, alpha, beta, delta + 2);

    std::vector<double> au(5);
    for (int i = 0; i < 5; ++i) {
        au[i] = a[0] * m0[i] + a[1] * mu[i] + a[2] * mv[i] + a[3] * mw[i] +
                0.5 * a[4] * (muu[i] + mvv[i] + mww[i]);
    }
    return au;
}

// ---------------------------------------------------------------------------
// Non-conserved moments
// ---------------------------------------------------------------------------

double pressure(const std::vector<double>& prim) {
    return 0.5 * prim.front() / prim.back();
}

double pressure(const DistributionSet& pdf, const std::vector<double>& prim,
                const VelocityGrid& grid, double K) {
    const int D = grid.dim();
    const std::vector<double>& omega = grid.weights();

    double sum = 0.0;
    for (std::size_t i = 0; i < grid.size(); ++i) {
        double c2 = 0.0;
        for (int d = 0; d < D; ++d) {
            double c = grid.coord(d)[i] - bulk(prim, d);
            c2 += c * c;
        }
        sum += omega[i] * c2 * pdf.h[i];
    }

    switch (pdf.model) {
        case DistributionModel::Monatomic:
            return sum / D;
        case DistributionModel::InternalEnergy:
        case DistributionModel::Rotational:
            return (sum + discreteMoment(pdf.b, omega)) / (K + D);
        default:
            unsupported("pressure", pdf.model, D);
    }
}

std::vector<double> stress(const std::vector<double>& f, const std::vector<double>& prim,
                           const VelocityGrid& grid) {
    const int D = grid.dim();
    const std::vector<double>& omega = grid.weights();
    std::vector<double> P(D * D, 0.0);

    for (std::size_t i = 0; i < grid.size(); ++i) {
        double c[3] = {0.0, 0.0, 0.0};
        for (int d = 0; d < D; ++d) c[d] = grid.coord(d)[i] - bulk(prim, d);
        for (int r = 0; r < D; ++r) {
            for (int s = r; s < D; ++s) {
                P[r * D + s] += omega[i] * c[r] * c[s] * f[i];
            }
        }
    }
    for (int r = 0; r < D; ++r) {
        for (int s = 0; s < r; ++s) {
            P[r * D + s] = P[s * D + r];
        }
    }
    return P;
}

std::vector<double> heatFlux(const DistributionSet& pdf, const std::vector<double>& prim,
                             const VelocityGrid& grid) {
    const int D = grid.dim();
    const std::vector<double>& omega = grid.weights();
    const std::size_t n = grid.size();

    auto peculiar = [&](std::size_t i, double* c) {
        double c2 = 0.0;
        for (int d = 0; d < D; ++d) {
            c[d] = grid.coord(d)[i] - prim[d + 1];
            c2 += c[d] * c[d];
        }
        return c2;
    };

    switch (pdf.model) {
        case DistributionModel::Monatomic:
        case DistributionModel::InternalEnergy: {
            const bool internal = pdf.model == DistributionModel::InternalEnergy;
            std::vector<double> q(D, 0.0);
            double c[3];
            for (std::size_t i = 0; i < n; ++i) {
                double c2 = peculiar(i, c);
                for (int d = 0; d < D; ++d) {
                    q[d] += 0.5 * omega[i] * c[d] * c2 * pdf.h[i];
                    if (internal) q[d] += 0.5 * omega[i] * c[d] * pdf.b[i];
                }
            }
            return q;
        }
        case DistributionModel::Rotational: {
            if (D > 2) break;
            std::vector<double> q(2 * D, 0.0);
            double c[3];
            for (std::size_t i = 0; i < n; ++i) {
                double c2 = peculiar(i, c);
                for (int d = 0; d < D; ++d) {
                    q[d] += 0.5 * omega[i] * c[d] * (c2 * pdf.h[i] + pdf.b[i]);
                    q[D + d] += 0.5 * omega[i] * c[d] * pdf.r[i];
                }
            }
            return q;
        }
        case DistributionModel::PlasmaFourMoment: {
            if (D != 1) break;
            // h1, h2, h3 carry raw v, w and v^2 + w^2 moments; shift them to the bulk frame.
            const double V = prim[2], W = prim[3];
            std::vector<double> q(1, 0.0);
            for (std::size_t i = 0; i < n; ++i) {
                double c = grid.u()[i] - prim[1];
                double transverse = pdf.e[i] - 2.0 * V * pdf.b[i] - 2.0 * W * pdf.r[i] +
                                    (V * V + W * W) * pdf.h[i];
                q[0] += 0.5 * omega[i] * c * (c * c * pdf.h[i] + transverse);
            }
            return q;
        }
        case DistributionModel::PlasmaThreeMoment: {
            if (D != 2) break;
            const double W = prim[3];
            std::vector<double> q(2, 0.0);
            double c[3];
            for (std::size_t i = 0; i < n; ++i) {
                double c2 = peculiar(i, c);
                double transverse = pdf.r[i] - 2.0 * W * pdf.b[i] + W * W * pdf.h[i];
                for (int d = 0; d < 2; ++d) {
                    q[d] += 0.5 * omega[i] * c[d] * (c2 * pdf.h[i] + transverse);
                }
            }
            return q;
        }
        case DistributionModel::None:
            break;
    }
    unsupported("heatFlux", pdf.model, D);
}

} // namespace KineticFV
