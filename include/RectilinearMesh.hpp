#ifndef RECTILINEAR_MESH_HPP
#define RECTILINEAR_MESH_HPP

#include "State.hpp"
#include <array>
#include <cstddef>
#include <vector>

namespace KineticFV {

enum class BoundaryCondition {
    Outflow,      // zero gradient: ghosts copy the nearest interior cell
    Periodic,     // wrap around to the opposite boundary
    MaxwellWall   // diffuse reflection from a wall Maxwellian
};

/// Wall velocity and inverse temperature for a MaxwellWall face.
struct WallState {
    std::array<double, 3> velocity = {0.0, 0.0, 0.0};
    double lambda = 1.0;
};

/// Rectilinear mesh of 1D or 2D cells without AMR.
///
/// Grid geometry is defined by node-coordinate arrays along each axis. For 1D
/// problems the y direction has a single cell of unit width. Ghost cells are
/// only added in active dimensions and are filled from the boundary
/// conditions or by the halo exchange.
///
/// Indexing is x-fastest (i varies fastest).
class RectilinearMesh {
public:
    RectilinearMesh(int dim,
                    const std::vector<double>& xNodes,
                    const std::vector<double>& yNodes = {0.0, 1.0},
                    int nGhost = 1);

    static RectilinearMesh createUniform(int dim,
                                         int nx, double xMin, double xMax,
                                         int ny = 1, double yMin = 0.0, double yMax = 1.0,
                                         int nGhost = 1);

    int dim() const { return dim_; }
    int nx() const { return nx_; }
    int ny() const { return ny_; }
    int nGhost() const { return nGhost_; }

    int ngx() const { return ngx_; }
    int ngy() const { return ngy_; }

    int nxTotal() const { return nx_ + 2 * ngx_; }
    int nyTotal() const { return ny_ + 2 * ngy_; }

    /// Total number of cells (including all ghost cells).
    std::size_t totalCells() const {
        return static_cast<std::size_t>(nxTotal()) * nyTotal();
    }

    /// Flat index; ghost cells extend into negative indices and past nx/ny.
    std::size_t index(int i, int j = 0) const {
        return static_cast<std::size_t>((i + ngx_) + nxTotal() * (j + ngy_));
    }

    double dx(int i) const { return xNodesExt_[i + ngx_ + 1] - xNodesExt_[i + ngx_]; }
    double dy(int j) const { return yNodesExt_[j + ngy_ + 1] - yNodesExt_[j + ngy_]; }

    double cellVolume(int i, int j = 0) const { return dx(i) * dy(j); }

    double nodeX(int i) const { return xNodesExt_[i + ngx_]; }
    double nodeY(int j) const { return yNodesExt_[j + ngy_]; }

    double cellCentroidX(int i) const {
        return 0.5 * (xNodesExt_[i + ngx_] + xNodesExt_[i + ngx_ + 1]);
    }
    double cellCentroidY(int j) const {
        return 0.5 * (yNodesExt_[j + ngy_] + yNodesExt_[j + ngy_ + 1]);
    }

    /// Face length normal to x (between (i,j) and (i+1,j)) and normal to y.
    double faceAreaX(int j) const { return dy(j); }
    double faceAreaY(int i) const { return dx(i); }

    // --- Boundary conditions ---

    static constexpr int XLow  = 0;
    static constexpr int XHigh = 1;
    static constexpr int YLow  = 2;
    static constexpr int YHigh = 3;

    void setBoundaryCondition(int face, BoundaryCondition bc, const WallState& wall = WallState());
    BoundaryCondition boundaryCondition(int face) const { return bc_[face]; }
    const WallState& wallState(int face) const { return wall_[face]; }

    /// Fill ghost cells of every active dimension (x first, then y over the
    /// full x range so corner ghosts are filled). Wall ghosts copy the nearest
    /// interior cell; wall faces take their flux from the wall itself.
    void applyBoundaryConditions(std::vector<KineticCell>& cells) const;

private:
    int dim_;
    int nx_, ny_;
    int nGhost_;
    int ngx_, ngy_;

    std::vector<double> xNodesExt_;
    std::vector<double> yNodesExt_;

    std::array<BoundaryCondition, 4> bc_;
    std::array<WallState, 4> wall_;

    static std::vector<double> buildExtendedNodes(
        const std::vector<double>& physNodes, int nCells, int ng);

    void fillGhostX(std::vector<KineticCell>& cells) const;
    void fillGhostY(std::vector<KineticCell>& cells) const;
};

} // namespace KineticFV

#endif // RECTILINEAR_MESH_HPP
