#ifndef STATE_HPP
#define STATE_HPP

#include "SimulationConfig.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace KineticFV {

// Per-species distribution functions, one independent buffer per logical field.
//
//   model               h      b      r      e
//   Monatomic           f
//   InternalEnergy      H      B
//   Rotational          H      B      R
//   PlasmaThreeMoment   h0     h1     h2
//   PlasmaFourMoment    h0     h1     h2     h3
struct DistributionSet {
    DistributionModel model = DistributionModel::None;
    std::vector<double> h;
    std::vector<double> b;
    std::vector<double> r;
    std::vector<double> e;

    DistributionSet() = default;
    DistributionSet(DistributionModel m, std::size_t nNodes) { allocate(m, nNodes); }

    void allocate(DistributionModel m, std::size_t nNodes) {
        model = m;
        int n = distributionCount(m);
        h.assign(n > 0 ? nNodes : 0, 0.0);
        b.assign(n > 1 ? nNodes : 0, 0.0);
        r.assign(n > 2 ? nNodes : 0, 0.0);
        e.assign(n > 3 ? nNodes : 0, 0.0);
    }

    int count() const { return distributionCount(model); }
    std::size_t nodes() const { return h.size(); }

    std::vector<double>& field(int i) {
        switch (i) {
            case 0: return h;
            case 1: return b;
            case 2: return r;
            case 3: return e;
        }
        throw std::out_of_range("DistributionSet::field: index must be 0-3");
    }

    const std::vector<double>& field(int i) const {
        return const_cast<DistributionSet*>(this)->field(i);
    }
};

struct SpeciesState {
    std::vector<double> w;      // conserved moments
    std::vector<double> prim;   // primitive variables
    DistributionSet pdf;
    std::array<double, 3> lorentz = {0.0, 0.0, 0.0};
};

// Electric and magnetic field with the divergence-cleaning potentials.
struct FieldState {
    std::array<double, 3> E = {0.0, 0.0, 0.0};
    std::array<double, 3> B = {0.0, 0.0, 0.0};
    double phi = 0.0;
    double psi = 0.0;
};

struct KineticCell {
    double measure = 1.0;               // length, area or volume
    std::vector<SpeciesState> species;  // one entry, or ion/electron pair
    FieldState field;
};

// Fluxes through one face, already integrated over the face and the time step.
// Positive values move mass from the low-index to the high-index side.
struct FaceFlux {
    struct Species {
        std::vector<double> fw;   // conserved-moment flux
        DistributionSet ff;       // per-distribution flux
    };

    std::vector<Species> species;
    std::array<double, 8> emLeft = {};   // EM flux carried to the low-index side
    std::array<double, 8> emRight = {};  // EM flux carried to the high-index side

    void allocate(const SimulationConfig& config, const std::vector<std::size_t>& nodesPerSpecies) {
        species.resize(config.nSpecies);
        for (int s = 0; s < config.nSpecies; ++s) {
            species[s].fw.assign(config.stateLength(), 0.0);
            species[s].ff.allocate(config.distribution,
                                   config.distribution == DistributionModel::None
                                       ? 0 : nodesPerSpecies[s]);
        }
        emLeft.fill(0.0);
        emRight.fill(0.0);
    }

    void zero() {
        for (auto& sp : species) {
            std::fill(sp.fw.begin(), sp.fw.end(), 0.0);
            for (int f = 0; f < sp.ff.count(); ++f) {
                auto& a = sp.ff.field(f);
                std::fill(a.begin(), a.end(), 0.0);
            }
        }
        emLeft.fill(0.0);
        emRight.fill(0.0);
    }
};

// Faces bounding a cell. Net transport is left - right + down - up.
struct CellFaces {
    const FaceFlux* left = nullptr;
    const FaceFlux* right = nullptr;
    const FaceFlux* down = nullptr;
    const FaceFlux* up = nullptr;
};

// Convergence monitors: RES += (dw)^2, AVG += |w|, one entry per conserved
// component and species (species-major).
struct ResidualAccumulator {
    std::vector<double> res;
    std::vector<double> avg;

    ResidualAccumulator() = default;
    explicit ResidualAccumulator(std::size_t n) : res(n, 0.0), avg(n, 0.0) {}

    void reset() {
        std::fill(res.begin(), res.end(), 0.0);
        std::fill(avg.begin(), avg.end(), 0.0);
    }

    void merge(const ResidualAccumulator& other) {
        for (std::size_t i = 0; i < res.size(); ++i) {
            res[i] += other.res[i];
            avg[i] += other.avg[i];
        }
    }
};

} // namespace KineticFV

#endif // STATE_HPP
