#include "IdealGasEOS.hpp"

#include <stdexcept>
#include <string>

namespace KineticFV {

namespace {

void checkLength(const char* where, std::size_t n) {
    if (n < 3 || n > 5) {
        throw std::invalid_argument(std::string(where) +
                                    ": state vector must have 3, 4 or 5 entries (got " +
                                    std::to_string(n) + ")");
    }
}

} // namespace

std::vector<double> primitiveFromConserved(const std::vector<double>& w, double gamma) {
    checkLength("primitiveFromConserved", w.size());
    const std::size_t nVel = w.size() - 2;

    std::vector<double> prim(w.size());
    prim[0] = w[0];

    double ke = 0.0;
    for (std::size_t d = 0; d < nVel; ++d) {
        prim[d + 1] = w[d + 1] / w[0];
        ke += w[d + 1] * w[d + 1];
    }
    ke *= 0.5 / w[0];

    prim.back() = 0.5 * w[0] / ((gamma - 1.0) * (w.back() - ke));
    return prim;
}

std::vector<double> conservedFromPrimitive(const std::vector<double>& prim, double gamma) {
    checkLength("conservedFromPrimitive", prim.size());
    const std::size_t nVel = prim.size() - 2;

    std::vector<double> w(prim.size());
    w[0] = prim[0];

    double u2 = 0.0;
    for (std::size_t d = 0; d < nVel; ++d) {
        w[d + 1] = prim[0] * prim[d + 1];
        u2 += prim[d + 1] * prim[d + 1];
    }

    w.back() = 0.5 * prim[0] / prim.back() / (gamma - 1.0) + 0.5 * prim[0] * u2;
    return w;
}

std::vector<std::vector<double>> mixturePrimitiveFromConserved(
    const std::vector<std::vector<double>>& w, double gamma) {
    std::vector<std::vector<double>> prim;
    prim.reserve(w.size());
    for (const auto& ws : w) {
        prim.push_back(primitiveFromConserved(ws, gamma));
    }
    return prim;
}

std::vector<std::vector<double>> mixtureConservedFromPrimitive(
    const std::vector<std::vector<double>>& prim, double gamma) {
    std::vector<std::vector<double>> w;
    w.reserve(prim.size());
    for (const auto& ps : prim) {
        w.push_back(conservedFromPrimitive(ps, gamma));
    }
    return w;
}

IdealGasEOS::IdealGasEOS(double gamma)
    : gamma_(gamma)
{
    if (gamma_ <= 1.0) {
        throw std::invalid_argument("IdealGasEOS: gamma must be > 1 (got " + std::to_string(gamma_) + ")");
    }
}

std::vector<double> IdealGasEOS::toPrimitive(const std::vector<double>& w) const {
    return primitiveFromConserved(w, gamma_);
}

std::vector<double> IdealGasEOS::toConservative(const std::vector<double>& prim) const {
    return conservedFromPrimitive(prim, gamma_);
}

} // namespace KineticFV
