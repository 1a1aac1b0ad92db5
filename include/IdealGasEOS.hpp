#ifndef IDEAL_GAS_EOS_HPP
#define IDEAL_GAS_EOS_HPP

#include "EquationOfState.hpp"

namespace KineticFV {

// Calorically perfect gas; state vectors of length 3, 4 or 5 (1, 2 or 3
// velocity components).
class IdealGasEOS : public EquationOfState {
public:
    explicit IdealGasEOS(double gamma = 5.0 / 3.0);

    std::vector<double> toPrimitive(const std::vector<double>& w) const override;
    std::vector<double> toConservative(const std::vector<double>& prim) const override;

    std::string name() const override { return "IdealGas"; }

    double gamma() const { return gamma_; }

private:
    double gamma_;  // Ratio of specific heats
};

std::vector<double> primitiveFromConserved(const std::vector<double>& w, double gamma);
std::vector<double> conservedFromPrimitive(const std::vector<double>& prim, double gamma);

// Species-by-species conversion for two-component gases.
std::vector<std::vector<double>> mixturePrimitiveFromConserved(
    const std::vector<std::vector<double>>& w, double gamma);
std::vector<std::vector<double>> mixtureConservedFromPrimitive(
    const std::vector<std::vector<double>>& prim, double gamma);

} // namespace KineticFV

#endif // IDEAL_GAS_EOS_HPP
