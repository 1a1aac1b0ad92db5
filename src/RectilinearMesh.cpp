#include "RectilinearMesh.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace KineticFV {

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

RectilinearMesh::RectilinearMesh(int dim,
                                 const std::vector<double>& xNodes,
                                 const std::vector<double>& yNodes,
                                 int nGhost)
    : dim_(dim), nGhost_(nGhost)
{
    if (dim < 1 || dim > 2) {
        throw std::invalid_argument("RectilinearMesh: dim must be 1 or 2 (got " + std::to_string(dim) + ")");
    }
    if (nGhost < 1) {
        throw std::invalid_argument("RectilinearMesh: at least one ghost layer is required");
    }
    if (xNodes.size() < 2) {
        throw std::invalid_argument("RectilinearMesh: xNodes must have at least 2 entries");
    }
    if (dim == 2 && yNodes.size() < 2) {
        throw std::invalid_argument("RectilinearMesh: yNodes must have at least 2 entries for 2D");
    }

    nx_ = static_cast<int>(xNodes.size()) - 1;
    ny_ = static_cast<int>(yNodes.size()) - 1;

    ngx_ = nGhost_;
    ngy_ = (dim_ >= 2) ? nGhost_ : 0;

    xNodesExt_ = buildExtendedNodes(xNodes, nx_, ngx_);
    yNodesExt_ = buildExtendedNodes(yNodes, ny_, ngy_);

    bc_.fill(BoundaryCondition::Outflow);
}

RectilinearMesh RectilinearMesh::createUniform(
    int dim,
    int nx, double xMin, double xMax,
    int ny, double yMin, double yMax,
    int nGhost)
{
    auto linspace = [](int n, double lo, double hi) {
        std::vector<double> nodes(n + 1);
        double h = (hi - lo) / n;
        for (int i = 0; i <= n; ++i) {
            nodes[i] = lo + i * h;
        }
        return nodes;
    };

    return RectilinearMesh(dim, linspace(nx, xMin, xMax), linspace(ny, yMin, yMax), nGhost);
}

// Mirror cell widths outward from each boundary into the ghost region.
std::vector<double> RectilinearMesh::buildExtendedNodes(
    const std::vector<double>& physNodes, int nCells, int ng)
{
    std::vector<double> ext(nCells + 2 * ng + 1);
    for (int i = 0; i <= nCells; ++i) {
        ext[ng + i] = physNodes[i];
    }
    for (int g = 1; g <= ng; ++g) {
        int mirror = std::min(g - 1, nCells - 1);
        ext[ng - g] = ext[ng - g + 1] - (physNodes[mirror + 1] - physNodes[mirror]);
    }
    for (int g = 1; g <= ng; ++g) {
        int mirror = std::max(nCells - g, 0);
        ext[ng + nCells + g] = ext[ng + nCells + g - 1] + (physNodes[mirror + 1] - physNodes[mirror]);
    }
    return ext;
}

// ---------------------------------------------------------------------------
// Boundary conditions
// ---------------------------------------------------------------------------

void RectilinearMesh::setBoundaryCondition(int face, BoundaryCondition bc, const WallState& wall) {
    if (face < 0 || face > 3) {
        throw std::out_of_range("RectilinearMesh::setBoundaryCondition: face must be 0-3");
    }
    if (face >= YLow && dim_ < 2) {
        throw std::invalid_argument("RectilinearMesh::setBoundaryCondition: y faces need a 2D mesh");
    }
    bc_[face] = bc;
    wall_[face] = wall;
}

void RectilinearMesh::applyBoundaryConditions(std::vector<KineticCell>& cells) const {
    if (cells.size() != totalCells()) {
        throw std::invalid_argument("RectilinearMesh::applyBoundaryConditions: cell array does not match mesh");
    }
    fillGhostX(cells);
    if (dim_ >= 2) fillGhostY(cells);
}

void RectilinearMesh::fillGhostX(std::vector<KineticCell>& cells) const {
    for (int j = 0; j < ny_; ++j) {
        for (int g = 1; g <= ngx_; ++g) {
            int lo = bc_[XLow] == BoundaryCondition::Periodic ? nx_ - g : std::min(g - 1, nx_ - 1);
            if (bc_[XLow] == BoundaryCondition::Outflow) lo = 0;
            cells[index(-g, j)] = cells[index(lo, j)];

            int hi = bc_[XHigh] == BoundaryCondition::Periodic ? g - 1 : std::max(nx_ - g, 0);
            if (bc_[XHigh] == BoundaryCondition::Outflow) hi = nx_ - 1;
            cells[index(nx_ - 1 + g, j)] = cells[index(hi, j)];
        }
    }
}

void RectilinearMesh::fillGhostY(std::vector<KineticCell>& cells) const {
    for (int i = -ngx_; i < nx_ + ngx_; ++i) {
        for (int g = 1; g <= ngy_; ++g) {
            int lo = bc_[YLow] == BoundaryCondition::Periodic ? ny_ - g : std::min(g - 1, ny_ - 1);
            if (bc_[YLow] == BoundaryCondition::Outflow) lo = 0;
            cells[index(i, -g)] = cells[index(i, lo)];

            int hi = bc_[YHigh] == BoundaryCondition::Periodic ? g - 1 : std::max(ny_ - g, 0);
            if (bc_[YHigh] == BoundaryCondition::Outflow) hi = ny_ - 1;
            cells[index(i, ny_ - 1 + g)] = cells[index(i, hi)];
        }
    }
}

} // namespace KineticFV
