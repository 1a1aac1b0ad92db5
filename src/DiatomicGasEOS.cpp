#include "DiatomicGasEOS.hpp"

#include <stdexcept>
#include <string>

namespace KineticFV {

DiatomicGasEOS::DiatomicGasEOS(double K, double Kr)
    : K_(K)
    , Kr_(Kr)
{
    if (K_ < 0.0 || Kr_ <= 0.0) {
        throw std::invalid_argument("DiatomicGasEOS: K must be non-negative and Kr positive");
    }
}

std::vector<double> DiatomicGasEOS::toPrimitive(const std::vector<double>& w) const {
    if (w.size() != 4 && w.size() != 5) {
        throw std::invalid_argument("DiatomicGasEOS::toPrimitive: state vector must have 4 or 5 entries (got " +
                                    std::to_string(w.size()) + ")");
    }
    const std::size_t nVel = w.size() - 3;

    std::vector<double> prim(w.size());
    prim[0] = w[0];

    double ke = 0.0;
    for (std::size_t d = 0; d < nVel; ++d) {
        prim[d + 1] = w[d + 1] / w[0];
        ke += w[d + 1] * w[d + 1];
    }
    ke *= 0.5 / w[0];

    const double rhoE = w[nVel + 1];
    const double rhoEr = w[nVel + 2];
    prim[nVel + 1] = 0.25 * w[0] * (K_ + Kr_ + nVel) / (rhoE - ke);
    prim[nVel + 2] = 0.25 * w[0] * Kr_ / rhoEr;
    return prim;
}

std::vector<double> DiatomicGasEOS::toConservative(const std::vector<double>& prim) const {
    if (prim.size() != 4 && prim.size() != 5) {
        throw std::invalid_argument("DiatomicGasEOS::toConservative: primitive vector must have 4 or 5 entries (got " +
                                    std::to_string(prim.size()) + ")");
    }
    const std::size_t nVel = prim.size() - 3;

    std::vector<double> w(prim.size());
    w[0] = prim[0];

    double u2 = 0.0;
    for (std::size_t d = 0; d < nVel; ++d) {
        w[d + 1] = prim[0] * prim[d + 1];
        u2 += prim[d + 1] * prim[d + 1];
    }

    w[nVel + 1] = 0.5 * prim[0] * u2 + 0.25 * prim[0] * (K_ + Kr_ + nVel) / prim[nVel + 1];
    w[nVel + 2] = 0.25 * prim[0] * Kr_ / prim[nVel + 2];
    return w;
}

double DiatomicGasEOS::translationalLambda(const std::vector<double>& prim) const {
    const std::size_t nVel = prim.size() - 3;
    const double lambda = prim[nVel + 1];
    const double lambdaR = prim[nVel + 2];
    return (K_ + nVel) / ((K_ + Kr_ + nVel) / lambda - Kr_ / lambdaR);
}

} // namespace KineticFV
