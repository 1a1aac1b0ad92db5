#include "VelocitySpace.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace KineticFV {

QuadratureRule parseQuadratureRule(const std::string& name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "rectangle") return QuadratureRule::Rectangle;
    if (key == "newton")    return QuadratureRule::NewtonCotes;
    if (key == "gauss")     return QuadratureRule::Gauss;

    throw std::invalid_argument("parseQuadratureRule: invalid quadrature rule '" + name + "'");
}

double newtonCotesCoefficient(int idx, int num) {
    if (idx == 1 || idx == num) {
        return 14.0 / 45.0;
    } else if ((idx - 5) % 4 == 0) {
        return 28.0 / 45.0;
    } else if ((idx - 3) % 4 == 0) {
        return 24.0 / 45.0;
    }
    return 64.0 / 45.0;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

VelocityGrid::VelocityGrid(const std::vector<VelocityAxis>& axes, QuadratureRule rule)
    : axes_(axes), rule_(rule)
{
    if (axes_.empty() || axes_.size() > 3) {
        throw std::invalid_argument("VelocityGrid: dim must be 1, 2, or 3 (got " +
                                    std::to_string(axes_.size()) + ")");
    }
    if (rule_ == QuadratureRule::Gauss) {
        throw std::runtime_error("VelocityGrid: unsupported quadrature rule 'gauss'");
    }
    for (const auto& ax : axes_) {
        if (ax.n < 1) {
            throw std::invalid_argument("VelocityGrid: node count must be positive (got " +
                                        std::to_string(ax.n) + ")");
        }
        if (ax.nGhost < 0) {
            throw std::invalid_argument("VelocityGrid: nGhost must be non-negative");
        }
        if (!(ax.hi > ax.lo)) {
            throw std::invalid_argument("VelocityGrid: axis upper bound must exceed lower bound");
        }
    }

    // Per-axis node centres and 1D weight factors.
    const int d = dim();
    std::vector<double> axisNodes[3];
    std::vector<double> axisFactor[3];
    for (int a = 0; a < d; ++a) {
        const VelocityAxis& ax = axes_[a];
        const double delta = ax.width();
        const int nt = ax.total();
        axisNodes[a].resize(nt);
        axisFactor[a].resize(nt);
        for (int i = 0; i < nt; ++i) {
            axisNodes[a][i] = ax.lo + (i - ax.nGhost + 0.5) * delta;
            axisFactor[a][i] = (rule_ == QuadratureRule::NewtonCotes)
                                   ? newtonCotesCoefficient(i + 1, nt) * delta
                                   : delta;
        }
    }

    const std::size_t n = static_cast<std::size_t>(count(0)) * count(1) * count(2);
    for (int a = 0; a < 3; ++a) {
        coords_[a].assign(a < d ? n : 0, 0.0);
        widths_[a].assign(a < d ? n : 0, 0.0);
    }
    weights_.assign(n, 0.0);

    for (int k = 0; k < count(2); ++k) {
        for (int j = 0; j < count(1); ++j) {
            for (int i = 0; i < count(0); ++i) {
                std::size_t idx = index(i, j, k);
                const int local[3] = {i, j, k};
                double weight = 1.0;
                for (int a = 0; a < d; ++a) {
                    coords_[a][idx] = axisNodes[a][local[a]];
                    widths_[a][idx] = axes_[a].width();
                    weight *= axisFactor[a][local[a]];
                }
                weights_[idx] = weight;
            }
        }
    }
}

VelocityGrid VelocityGrid::create1D(double u0, double u1, int nu,
                                    QuadratureRule rule, int nGhost) {
    return VelocityGrid({VelocityAxis{u0, u1, nu, nGhost}}, rule);
}

VelocityGrid VelocityGrid::create2D(double u0, double u1, int nu,
                                    double v0, double v1, int nv,
                                    QuadratureRule rule, int nGhost) {
    return VelocityGrid({VelocityAxis{u0, u1, nu, nGhost},
                         VelocityAxis{v0, v1, nv, nGhost}}, rule);
}

VelocityGrid VelocityGrid::create3D(double u0, double u1, int nu,
                                    double v0, double v1, int nv,
                                    double w0, double w1, int nw,
                                    QuadratureRule rule, int nGhost) {
    return VelocityGrid({VelocityAxis{u0, u1, nu, nGhost},
                         VelocityAxis{v0, v1, nv, nGhost},
                         VelocityAxis{w0, w1, nw, nGhost}}, rule);
}

double VelocityGrid::maxSpeed(int d) const {
    double vmax = 0.0;
    for (double c : coords_[d]) {
        vmax = std::max(vmax, std::abs(c));
    }
    return vmax;
}

std::vector<VelocityGrid> createSpeciesGrids(const std::vector<VelocityAxis>& ionAxes,
                                             const std::vector<VelocityAxis>& electronAxes,
                                             QuadratureRule rule) {
    if (ionAxes.size() != electronAxes.size()) {
        throw std::invalid_argument("createSpeciesGrids: ion and electron grids must have the same dimension");
    }
    for (std::size_t a = 0; a < ionAxes.size(); ++a) {
        if (ionAxes[a].n != electronAxes[a].n || ionAxes[a].nGhost != electronAxes[a].nGhost) {
            throw std::invalid_argument("createSpeciesGrids: ion and electron axes must share node counts");
        }
    }

    std::vector<VelocityGrid> grids;
    grids.reserve(2);
    grids.emplace_back(ionAxes, rule);
    grids.emplace_back(electronAxes, rule);
    return grids;
}

} // namespace KineticFV
