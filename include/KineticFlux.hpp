#ifndef KINETIC_FLUX_HPP
#define KINETIC_FLUX_HPP

#include "CellUpdate.hpp"
#include "RectilinearMesh.hpp"
#include "State.hpp"
#include <vector>

namespace KineticFV {

/// Kinetic flux-vector splitting across cell faces.
///
/// Every flux is integrated over the face (area) and the time step (dt) so
/// that CellUpdate::step only divides by the cell measure. The face normal is
/// the mesh axis `direction` (0 = x, 1 = y); the normal particle speed at a
/// node is its velocity-grid coordinate along that axis.
///
/// EM face fluxes are left at zero: there is no Maxwell solver on the mesh,
/// so fields only change through the cell-local coupling.
class KineticFlux {
public:
    explicit KineticFlux(const CellUpdate& update);

    /// Upwind flux between a low-index and a high-index cell.
    void kfvs(FaceFlux& face, const KineticCell& low, const KineticCell& high,
              int direction, double dt, double area) const;

    /// Second-order upwind flux. The upwind distribution is extrapolated to
    /// the face with its slope (one DistributionSet per species, widths
    /// dxLow / dxHigh along `direction`) and carries the time-centring term
    /// -dt c^2 s / 2.
    void kfvs(FaceFlux& face, const KineticCell& low, const KineticCell& high,
              const DistributionSet* lowSlope, const DistributionSet* highSlope,
              double dxLow, double dxHigh, int direction, double dt, double area) const;

    /// Diffuse-reflection flux between a cell and a Maxwell wall. With
    /// wallOnHighSide the wall closes the cell's high face (particles leave
    /// with positive normal speed), otherwise its low face. Emitted particles
    /// follow the wall Maxwellian scaled so the wall absorbs no mass.
    void maxwellWall(FaceFlux& face, const KineticCell& cell, const WallState& wall,
                     int direction, bool wallOnHighSide, double dt, double area) const;

    /// Primitive vector of the wall Maxwellian for one species (unit density).
    std::vector<double> wallPrimitive(int species, const WallState& wall) const;

private:
    const CellUpdate& update_;
};

} // namespace KineticFV

#endif // KINETIC_FLUX_HPP
