#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include <stdexcept>
#include <string>

namespace KineticFV {

enum class CollisionModel {
    BGK,       // plain relaxation to the local Maxwellian (Pr = 1)
    Shakhov,   // heat-flux corrected target, arbitrary Pr
    Rykov      // translational/rotational relaxation for diatomic gases
};

// Which distribution functions a cell carries and how their moments combine.
enum class DistributionModel {
    None,               // hydrodynamic: conserved moments only
    Monatomic,          // f
    InternalEnergy,     // H, B
    Rotational,         // H, B, R
    PlasmaThreeMoment,  // h0, h1, h2 over a 2V grid
    PlasmaFourMoment    // h0, h1, h2, h3 over a 1V grid
};

enum class ReconstructionOrder {
    FirstOrder,   // piecewise constant distributions
    VanLeer       // van Leer limited linear distributions (needs 2 ghost cells)
};

inline int distributionCount(DistributionModel model) {
    switch (model) {
        case DistributionModel::None:              return 0;
        case DistributionModel::Monatomic:         return 1;
        case DistributionModel::InternalEnergy:    return 2;
        case DistributionModel::Rotational:        return 3;
        case DistributionModel::PlasmaThreeMoment: return 3;
        case DistributionModel::PlasmaFourMoment:  return 4;
    }
    return 0;
}

inline std::string toString(CollisionModel model) {
    switch (model) {
        case CollisionModel::BGK:     return "bgk";
        case CollisionModel::Shakhov: return "shakhov";
        case CollisionModel::Rykov:   return "rykov";
    }
    return "unknown";
}

struct GasParams {
    double gamma = 5.0 / 3.0;
    double K = 0.0;           // internal degrees of freedom carried by B
    double muRef = 1e-3;      // VHS reference viscosity
    double omega = 0.81;      // VHS viscosity exponent
    double Pr = 2.0 / 3.0;
    double Kn = 1e-3;
};

struct RykovParams {
    double Kr = 2.0;          // rotational degrees of freedom
    double T0 = 91.5 / 273.0; // characteristic temperature (reduced)
    double Z0 = 18.1;         // rotational collision number at the reference state
    double sigma = 1.0 / 1.55;
    double omega0 = 0.2354;
    double omega1 = 0.3049;
};

// Two-species hard-sphere (AAP) parameters, ion = species 0, electron = species 1.
struct MixtureParams {
    double mi = 1.0;
    double ni = 0.5;
    double me = 1.0;
    double ne = 0.5;
    double Kn = 1.0;
};

// Mass ratio mi / me is taken from MixtureParams.
struct PlasmaParams {
    double debyeLength = 1.0;
    double larmorRadius = 1.0;
    bool interspeciesCollisions = true;  // false: each species relaxes to its own Maxwellian
};

struct ExplicitParams {
    double cfl = 0.8;
    double constDt = -1.0;       // if > 0, overrides CFL-based time step
    double maxDt = 1e-2;
    double minDt = 1e-12;
};

struct SimulationConfig {
    // Global parameters
    int dim = 1;            // physical dimension
    int velocityDim = 1;    // velocity-space dimension
    int nSpecies = 1;
    int nGhost = 1;
    ReconstructionOrder reconOrder = ReconstructionOrder::FirstOrder;
    CollisionModel collision = CollisionModel::BGK;
    DistributionModel distribution = DistributionModel::Monatomic;
    double time = 0.0;
    int step = 0;

    GasParams gas;
    RykovParams rykov;
    MixtureParams mixture;
    PlasmaParams plasma;
    ExplicitParams explicitParams;

    bool isPlasma() const {
        return distribution == DistributionModel::PlasmaThreeMoment ||
               distribution == DistributionModel::PlasmaFourMoment;
    }

    // Length of a conserved/primitive vector for one species.
    int stateLength() const {
        switch (distribution) {
            case DistributionModel::Rotational:
                return velocityDim + 3;
            case DistributionModel::PlasmaThreeMoment:
            case DistributionModel::PlasmaFourMoment:
                return 5;
            case DistributionModel::InternalEnergy:
                // 1D+K and 2D+K keep the same layout as the monatomic state
            case DistributionModel::Monatomic:
            case DistributionModel::None:
                break;
        }
        return velocityDim + 2;
    }

    int requiredGhostCells() const {
        switch (reconOrder) {
            case ReconstructionOrder::FirstOrder:
                return 1;
            case ReconstructionOrder::VanLeer:
                return 2;
        }
        return 1;
    }

    void validate() const {
        if (dim < 1 || dim > 3)
            throw std::invalid_argument("dim must be 1, 2, or 3 (got " + std::to_string(dim) + ")");

        int reqGhost = requiredGhostCells();
        if (nGhost < reqGhost)
            throw std::invalid_argument("nGhost=" + std::to_string(nGhost)
                + " is too small for chosen reconOrder (need >= " + std::to_string(reqGhost) + ")");

        if (reconOrder != ReconstructionOrder::FirstOrder && distribution == DistributionModel::None)
            throw std::invalid_argument("reconOrder applies to distributions; the hydrodynamic model has none");

        if (velocityDim < 1 || velocityDim > 3)
            throw std::invalid_argument("velocityDim must be 1, 2, or 3 (got " + std::to_string(velocityDim) + ")");

        if (nSpecies < 1 || nSpecies > 2)
            throw std::invalid_argument("nSpecies must be 1 or 2 (got " + std::to_string(nSpecies) + ")");

        if (gas.gamma <= 1.0)
            throw std::invalid_argument("gamma must be > 1 (got " + std::to_string(gas.gamma) + ")");

        if (gas.K < 0.0)
            throw std::invalid_argument("K must be non-negative (got " + std::to_string(gas.K) + ")");

        if (gas.muRef <= 0.0)
            throw std::invalid_argument("muRef must be positive (got " + std::to_string(gas.muRef) + ")");

        if (gas.Pr <= 0.0)
            throw std::invalid_argument("Pr must be positive (got " + std::to_string(gas.Pr) + ")");

        if (explicitParams.cfl <= 0.0 || explicitParams.cfl > 1.0)
            throw std::invalid_argument("cfl must be in (0, 1] (got " + std::to_string(explicitParams.cfl) + ")");

        if (collision == CollisionModel::Rykov && distribution != DistributionModel::Rotational)
            throw std::invalid_argument("Rykov collisions require the rotational (H, B, R) distribution model");

        if (distribution == DistributionModel::Rotational) {
            if (collision != CollisionModel::Rykov)
                throw std::invalid_argument("the rotational distribution model requires Rykov collisions");
            if (velocityDim != 1 || nSpecies != 1)
                throw std::invalid_argument("Rykov update supports one species with a 1D velocity space");
            if (rykov.Kr <= 0.0 || rykov.Z0 <= 0.0 || rykov.T0 <= 0.0)
                throw std::invalid_argument("Rykov parameters Kr, Z0 and T0 must be positive");
        }

        if (isPlasma()) {
            if (nSpecies != 2)
                throw std::invalid_argument("plasma models require nSpecies = 2 (got " + std::to_string(nSpecies) + ")");
            if (distribution == DistributionModel::PlasmaFourMoment && velocityDim != 1)
                throw std::invalid_argument("the four-moment plasma model requires velocityDim = 1");
            if (distribution == DistributionModel::PlasmaThreeMoment && velocityDim != 2)
                throw std::invalid_argument("the three-moment plasma model requires velocityDim = 2");
            if (collision != CollisionModel::BGK)
                throw std::invalid_argument("plasma models support BGK collisions only");
            if (dim != 1)
                throw std::invalid_argument("plasma models require dim = 1 (got " + std::to_string(dim) + ")");
            if (plasma.debyeLength <= 0.0 || plasma.larmorRadius <= 0.0)
                throw std::invalid_argument("plasma parameters must be positive");
        }

        if (nSpecies == 2) {
            if (!isPlasma() && distribution != DistributionModel::InternalEnergy)
                throw std::invalid_argument("two-species mixtures require the internal-energy or a plasma distribution model");
            if (!isPlasma() && velocityDim != 1)
                throw std::invalid_argument("two-species mixtures require velocityDim = 1");
            if (!isPlasma() && collision != CollisionModel::BGK)
                throw std::invalid_argument("two-species mixtures support BGK collisions only");
            if (mixture.mi <= 0.0 || mixture.me <= 0.0 || mixture.ni <= 0.0 ||
                mixture.ne <= 0.0 || mixture.Kn <= 0.0)
                throw std::invalid_argument("mixture masses, number densities and Kn must be positive");
        } else if (isPlasma()) {
            throw std::invalid_argument("plasma models require two species");
        }

        // Every kinetic model, the 1V Rykov and mixture layouts included, carries one
        // discrete velocity axis per physical axis.
        if (distribution != DistributionModel::None && velocityDim < dim)
            throw std::invalid_argument("velocityDim (" + std::to_string(velocityDim) +
                                        ") must cover the physical dimension (" +
                                        std::to_string(dim) + ")");
    }
};

} // namespace KineticFV

#endif // SIMULATION_CONFIG_HPP
