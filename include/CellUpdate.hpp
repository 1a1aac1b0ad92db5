#ifndef CELL_UPDATE_HPP
#define CELL_UPDATE_HPP

#include "EquationOfState.hpp"
#include "SimulationConfig.hpp"
#include "State.hpp"
#include "VelocitySpace.hpp"
#include <memory>
#include <string>
#include <vector>

namespace KineticFV {

/// Update variant, resolved once from the configuration.
enum class UpdateScheme {
    Hydrodynamic,  // conserved moments only
    Kinetic,       // Monatomic or InternalEnergy, BGK or Shakhov
    Rykov,         // Rotational (H, B, R), 1V
    Mixture,       // two species, InternalEnergy, 1V, AAP interspecies relaxation
    Plasma         // two species, PlasmaFourMoment or PlasmaThreeMoment, EM coupled
};

std::string toString(UpdateScheme scheme);

/// Outcome of one cell update. Physical-state violations are reported here
/// (and on std::cerr) rather than thrown.
struct StepStatus {
    std::vector<std::string> warnings;
    std::vector<int> rolledBackSpecies;
    bool fieldNaN = false;

    bool ok() const { return warnings.empty(); }
    bool rolledBack() const { return !rolledBackSpecies.empty(); }
};

/// Explicit transport / implicit relaxation update of a single cell.
///
/// Face fluxes are time- and face-integrated by the flux evaluator: a cell
/// advances as  w += (left - right + down - up) / measure  and every
/// distribution as
///
///   f = (f + netflux / measure + dt/tau * target) / (1 + dt/tau)
///
/// The EM face fluxes follow the same convention. The update only reads the
/// cell's own state and its faces, so cells can be updated in any order.
class CellUpdate {
public:
    /// grids holds one velocity grid per species (unused for Hydrodynamic).
    CellUpdate(const SimulationConfig& config, std::vector<VelocityGrid> grids);

    UpdateScheme scheme() const { return scheme_; }
    const SimulationConfig& config() const { return config_; }
    const VelocityGrid& grid(int species) const { return grids_.at(species); }
    const EquationOfState& eos() const { return *eos_; }

    /// Number of entries in a residual accumulator (species-major).
    std::size_t residualLength() const;

    /// Allocate the cell and set every species to its equilibrium at prim.
    void initializeCell(KineticCell& cell, const std::vector<std::vector<double>>& prim,
                        double measure) const;

    /// Run one update. Mutates the cell in place and adds to the residual.
    StepStatus step(KineticCell& cell, const CellFaces& faces, double dt,
                    ResidualAccumulator& residual) const;

    /// Equilibrium set for one species at prim, shaped like its distributions.
    DistributionSet equilibrium(int species, const std::vector<double>& prim) const;

private:
    SimulationConfig config_;
    std::vector<VelocityGrid> grids_;
    UpdateScheme scheme_;
    std::unique_ptr<EquationOfState> eos_;

    void stepHydrodynamic(KineticCell& cell, const CellFaces& faces,
                          ResidualAccumulator& residual, StepStatus& status) const;
    void stepKinetic(KineticCell& cell, const CellFaces& faces, double dt,
                     ResidualAccumulator& residual, StepStatus& status) const;
    void stepRykov(KineticCell& cell, const CellFaces& faces, double dt,
                   ResidualAccumulator& residual, StepStatus& status) const;
    void stepMixture(KineticCell& cell, const CellFaces& faces, double dt,
                     ResidualAccumulator& residual, StepStatus& status) const;
    void stepPlasma(KineticCell& cell, const CellFaces& faces, double dt,
                    ResidualAccumulator& residual, StepStatus& status) const;

    /// Flux integration and primitive recovery with rollback for species s.
    void integrateMoments(SpeciesState& sp, int s, const CellFaces& faces, double measure,
                          StepStatus& status) const;

    /// AAP interspecies source sub-step on the conserved moments.
    void interspeciesSource(KineticCell& cell, const std::vector<std::vector<double>>& wOld,
                            double dt, StepStatus& status) const;

    bool physical(const std::vector<double>& prim) const;
    void accumulate(const KineticCell& cell, const std::vector<std::vector<double>>& wOld,
                    ResidualAccumulator& residual) const;
};

} // namespace KineticFV

#endif // CELL_UPDATE_HPP
