#ifndef VELOCITY_SPACE_HPP
#define VELOCITY_SPACE_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace KineticFV {

enum class QuadratureRule {
    Rectangle,    // midpoint rule, weight = cell width
    NewtonCotes,  // composite Boole rule
    Gauss         // declared, not available
};

/// Parse "rectangle", "newton" or "gauss". Unknown names throw std::invalid_argument.
QuadratureRule parseQuadratureRule(const std::string& name);

/// Composite Newton-Cotes coefficient for 1-based node idx out of num nodes.
double newtonCotesCoefficient(int idx, int num);

/// One velocity axis: n physical nodes on [lo, hi] plus nGhost nodes per side.
struct VelocityAxis {
    double lo = -5.0;
    double hi = 5.0;
    int n = 50;
    int nGhost = 0;

    int total() const { return n + 2 * nGhost; }
    double width() const { return (hi - lo) / n; }
};

/// Discrete velocity space over one to three axes.
///
/// Nodes are stored flat with the first axis varying fastest. Coordinate,
/// width and weight arrays all have size() entries, so every moment sum is a
/// single loop over nodes. The grid is immutable after construction.
class VelocityGrid {
public:
    VelocityGrid(const std::vector<VelocityAxis>& axes, QuadratureRule rule);

    /// Convenience factories mirroring the common setups.
    static VelocityGrid create1D(double u0, double u1, int nu,
                                 QuadratureRule rule = QuadratureRule::Rectangle,
                                 int nGhost = 0);
    static VelocityGrid create2D(double u0, double u1, int nu,
                                 double v0, double v1, int nv,
                                 QuadratureRule rule = QuadratureRule::Rectangle,
                                 int nGhost = 0);
    static VelocityGrid create3D(double u0, double u1, int nu,
                                 double v0, double v1, int nv,
                                 double w0, double w1, int nw,
                                 QuadratureRule rule = QuadratureRule::Rectangle,
                                 int nGhost = 0);

    int dim() const { return static_cast<int>(axes_.size()); }
    std::size_t size() const { return weights_.size(); }
    QuadratureRule rule() const { return rule_; }

    const VelocityAxis& axis(int d) const { return axes_[d]; }
    /// Node count along axis d, ghosts included (1 for inactive axes).
    int count(int d) const { return d < dim() ? axes_[d].total() : 1; }

    std::size_t index(int i, int j = 0, int k = 0) const {
        return static_cast<std::size_t>(i + count(0) * (j + count(1) * k));
    }

    /// Node coordinates along each axis, one entry per node.
    const std::vector<double>& u() const { return coords_[0]; }
    const std::vector<double>& v() const { return coords_[1]; }
    const std::vector<double>& w() const { return coords_[2]; }
    const std::vector<double>& coord(int d) const { return coords_[d]; }

    const std::vector<double>& du() const { return widths_[0]; }
    const std::vector<double>& dv() const { return widths_[1]; }
    const std::vector<double>& dw() const { return widths_[2]; }
    const std::vector<double>& width(int d) const { return widths_[d]; }

    const std::vector<double>& weights() const { return weights_; }

    /// Largest |coordinate| along axis d.
    double maxSpeed(int d) const;

private:
    std::vector<VelocityAxis> axes_;
    QuadratureRule rule_;
    std::vector<double> coords_[3];
    std::vector<double> widths_[3];
    std::vector<double> weights_;
};

/// Per-species grids for two-component gases: the ion grid and the electron
/// grid share node counts but carry their own bounds.
std::vector<VelocityGrid> createSpeciesGrids(const std::vector<VelocityAxis>& ionAxes,
                                             const std::vector<VelocityAxis>& electronAxes,
                                             QuadratureRule rule);

} // namespace KineticFV

#endif // VELOCITY_SPACE_HPP
