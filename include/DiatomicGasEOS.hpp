#ifndef DIATOMIC_GAS_EOS_HPP
#define DIATOMIC_GAS_EOS_HPP

#include "EquationOfState.hpp"

namespace KineticFV {

// Gas with K translational/internal and Kr rotational degrees of freedom
// whose rotational energy is carried separately.
//   1V: w = (rho, rhoU, rhoE, rhoEr)        prim = (rho, U, lambda, lambdaR)
//   2V: w = (rho, rhoU, rhoV, rhoE, rhoEr)  prim = (rho, U, V, lambda, lambdaR)
// lambda is the equilibrium (total) inverse temperature, lambdaR the
// rotational one.
class DiatomicGasEOS : public EquationOfState {
public:
    DiatomicGasEOS(double K, double Kr);

    std::vector<double> toPrimitive(const std::vector<double>& w) const override;
    std::vector<double> toConservative(const std::vector<double>& prim) const override;

    std::string name() const override { return "DiatomicGas"; }

    double K() const { return K_; }
    double Kr() const { return Kr_; }

    // Translational inverse temperature implied by (lambda, lambdaR).
    double translationalLambda(const std::vector<double>& prim) const;

private:
    double K_;
    double Kr_;
};

} // namespace KineticFV

#endif // DIATOMIC_GAS_EOS_HPP
