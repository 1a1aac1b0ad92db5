#ifndef EQUATION_OF_STATE_HPP
#define EQUATION_OF_STATE_HPP

#include <string>
#include <vector>

namespace KineticFV {

// Abstract map between conserved moments and primitive variables.
//
// Primitive vectors are (rho, U..., lambda[, lambdaR]) with lambda = rho / (2p)
// the inverse-temperature parameter. No clamping is applied: a non-positive
// lambda in the result signals an unphysical conserved state to the caller.
class EquationOfState {
public:
    virtual ~EquationOfState() = default;

    // Convert conservative to primitive
    virtual std::vector<double> toPrimitive(const std::vector<double>& w) const = 0;

    // Convert primitive to conservative
    virtual std::vector<double> toConservative(const std::vector<double>& prim) const = 0;

    virtual std::string name() const = 0;
};

// Internal degrees of freedom carried by B so that a D-velocity kinetic model
// reproduces the ratio of specific heats gamma.
inline double internalDofFromGamma(double gamma, int velocityDim) {
    return 2.0 / (gamma - 1.0) - velocityDim;
}

// True when density and inverse temperature are both strictly positive.
inline bool isPhysical(const std::vector<double>& prim) {
    return prim.front() > 0.0 && prim.back() > 0.0;
}

} // namespace KineticFV

#endif // EQUATION_OF_STATE_HPP
