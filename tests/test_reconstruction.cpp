#include "Reconstruction.hpp"
#include "KineticFlux.hpp"
#include "KineticSolver.hpp"
#include "Equilibrium.hpp"
#include "EquationOfState.hpp"
#include "TestHelpers.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace KineticFV;

namespace {

SimulationConfig tubeConfig() {
    SimulationConfig config;
    config.dim = 1;
    config.velocityDim = 1;
    config.distribution = DistributionModel::Monatomic;
    config.gas.gamma = 3.0;
    config.gas.muRef = 1e-2;
    config.nGhost = 2;
    return config;
}

RectilinearMesh tubeMesh(BoundaryCondition lo, BoundaryCondition hi) {
    RectilinearMesh mesh = RectilinearMesh::createUniform(1, 8, 0.0, 1.0, 1, 0.0, 1.0, 2);
    mesh.setBoundaryCondition(RectilinearMesh::XLow, lo);
    mesh.setBoundaryCondition(RectilinearMesh::XHigh, hi);
    return mesh;
}

// Density 1 + 0.4 x at rest: every node of f is linear in x with slope 0.4 M1.
std::vector<std::vector<double>> linearDensity(double x, double) {
    return {{1.0 + 0.4 * x, 0.0, 1.0}};
}

void vanLeerLimiter() {
    ASSERT_NEAR(Reconstructor::vanLeer(2.0, 2.0), 2.0, 1e-7);
    ASSERT_NEAR(Reconstructor::vanLeer(1.0, 3.0), 1.5, 1e-7);
    ASSERT_NEAR(Reconstructor::vanLeer(3.0, 1.0), Reconstructor::vanLeer(1.0, 3.0), 1e-15);
    ASSERT_NEAR(Reconstructor::vanLeer(-1.0, -3.0), -1.5, 1e-7);
    ASSERT_NEAR(Reconstructor::vanLeer(1.0, -1.0), 0.0, 1e-15);
    ASSERT_NEAR(Reconstructor::vanLeer(0.0, 5.0), 0.0, 1e-15);

    Reconstructor first;
    ASSERT_TRUE(first.order() == ReconstructionOrder::FirstOrder);
    ASSERT_TRUE(first.requiredGhostCells() == 1);
    ASSERT_TRUE(Reconstructor(ReconstructionOrder::VanLeer).requiredGhostCells() == 2);
}

void linearProfileGivesExactSlopes() {
    SimulationConfig config = tubeConfig();
    RectilinearMesh mesh = tubeMesh(BoundaryCondition::Outflow, BoundaryCondition::Outflow);
    KineticSolver solver(mesh, config, {VelocityGrid::create1D(-6.0, 6.0, 32)});
    solver.initialize(mesh, linearDensity);

    Reconstructor recon(ReconstructionOrder::VanLeer);
    recon.allocate(mesh, solver.cellUpdate());
    recon.reconstruct(mesh, solver.cells());

    const std::vector<double> M1 = maxwellian(solver.cellUpdate().grid(0), {1.0, 0.0, 1.0});
    for (int i = 1; i < mesh.nx() - 1; ++i) {
        const std::vector<double>& s = recon.xSlopes(mesh.index(i))[0].h;
        for (std::size_t k = 0; k < M1.size(); ++k) {
            ASSERT_NEAR(s[k], 0.4 * M1[k], 1e-7);
        }
    }

    // Outflow ghosts copy the edge cell, flattening its slope.
    for (double v : recon.xSlopes(mesh.index(0))[0].h) ASSERT_NEAR(v, 0.0, 1e-15);
    for (double v : recon.xSlopes(mesh.index(mesh.nx() - 1))[0].h) ASSERT_NEAR(v, 0.0, 1e-15);
}

void extremumHasZeroSlope() {
    SimulationConfig config = tubeConfig();
    RectilinearMesh mesh = tubeMesh(BoundaryCondition::Periodic, BoundaryCondition::Periodic);
    KineticSolver solver(mesh, config, {VelocityGrid::create1D(-6.0, 6.0, 32)});
    // Peak in cell 3 (centroid 0.4375).
    solver.initialize(mesh, [](double x, double) {
        return std::vector<std::vector<double>>{{std::abs(x - 0.4375) < 1e-3 ? 2.0 : 1.0, 0.0, 1.0}};
    });

    Reconstructor recon(ReconstructionOrder::VanLeer);
    recon.allocate(mesh, solver.cellUpdate());
    recon.reconstruct(mesh, solver.cells());

    for (int i : {2, 3, 4}) {
        for (double v : recon.xSlopes(mesh.index(i))[0].h) ASSERT_NEAR(v, 0.0, 1e-15);
    }
}

void wallCellUsesOneSidedDifference() {
    SimulationConfig config = tubeConfig();
    RectilinearMesh mesh = tubeMesh(BoundaryCondition::MaxwellWall, BoundaryCondition::MaxwellWall);
    KineticSolver solver(mesh, config, {VelocityGrid::create1D(-6.0, 6.0, 32)});
    solver.initialize(mesh, linearDensity);

    Reconstructor recon(ReconstructionOrder::VanLeer);
    recon.allocate(mesh, solver.cellUpdate());
    recon.reconstruct(mesh, solver.cells());

    const std::vector<double> M1 = maxwellian(solver.cellUpdate().grid(0), {1.0, 0.0, 1.0});
    const std::vector<double>& lo = recon.xSlopes(mesh.index(0))[0].h;
    const std::vector<double>& hi = recon.xSlopes(mesh.index(mesh.nx() - 1))[0].h;
    for (std::size_t k = 0; k < M1.size(); ++k) {
        ASSERT_NEAR(lo[k], 0.4 * M1[k], 1e-12);
        ASSERT_NEAR(hi[k], 0.4 * M1[k], 1e-12);
    }
}

void twoDimensionalSlopesFollowEachAxis() {
    SimulationConfig config;
    config.dim = 2;
    config.velocityDim = 2;
    config.distribution = DistributionModel::InternalEnergy;
    config.gas.K = internalDofFromGamma(config.gas.gamma, config.velocityDim);
    config.nGhost = 2;

    RectilinearMesh mesh = RectilinearMesh::createUniform(2, 4, 0.0, 1.0, 6, 0.0, 1.5, 2);
    for (auto face : {RectilinearMesh::XLow, RectilinearMesh::XHigh,
                      RectilinearMesh::YLow, RectilinearMesh::YHigh}) {
        mesh.setBoundaryCondition(face, BoundaryCondition::Periodic);
    }
    KineticSolver solver(mesh, config, {VelocityGrid::create2D(-5.0, 5.0, 12, -5.0, 5.0, 12)});
    solver.initialize(mesh, [](double, double y) {
        return std::vector<std::vector<double>>{{1.0 + 0.2 * y, 0.0, 0.0, 1.0}};
    });

    Reconstructor recon(ReconstructionOrder::VanLeer);
    recon.allocate(mesh, solver.cellUpdate());
    recon.reconstruct(mesh, solver.cells());

    const DistributionSet M1 = solver.cellUpdate().equilibrium(0, {1.0, 0.0, 0.0, 1.0});
    const std::size_t c = mesh.index(1, 2);
    for (int f = 0; f < 2; ++f) {
        const std::vector<double>& sy = recon.ySlopes(c)[0].field(f);
        const std::vector<double>& sx = recon.xSlopes(c)[0].field(f);
        for (std::size_t k = 0; k < sy.size(); ++k) {
            ASSERT_NEAR(sy[k], 0.2 * M1.field(f)[k], 1e-7);
            ASSERT_NEAR(sx[k], 0.0, 1e-15);
        }
    }
}

void secondOrderFluxExtrapolatesUpwindState() {
    SimulationConfig config = tubeConfig();
    CellUpdate update(config, {VelocityGrid::create1D(-6.0, 6.0, 32)});
    KineticFlux flux(update);

    KineticCell low, high;
    update.initializeCell(low, {{1.0, 0.0, 1.0}}, 0.1);
    update.initializeCell(high, {{0.5, 0.0, 1.0}}, 0.1);

    std::vector<std::size_t> nodes = {update.grid(0).size()};
    FaceFlux first, flat, sloped;
    first.allocate(config, nodes);
    flat.allocate(config, nodes);
    sloped.allocate(config, nodes);

    const double dt = 1e-2, area = 1.0, dx = 0.1;
    std::vector<DistributionSet> zero(1, DistributionSet(DistributionModel::Monatomic, nodes[0]));
    flux.kfvs(first, low, high, 0, dt, area);
    flux.kfvs(flat, low, high, zero.data(), zero.data(), dx, dx, 0, dt, area);
    for (std::size_t k = 0; k < nodes[0]; ++k) {
        ASSERT_NEAR(flat.species[0].ff.h[k], first.species[0].ff.h[k], 1e-15);
    }

    // Both cells carry the slope of the jump (f_high - f_low) / dx.
    std::vector<DistributionSet> slope = zero;
    for (std::size_t k = 0; k < nodes[0]; ++k) {
        slope[0].h[k] = (high.species[0].pdf.h[k] - low.species[0].pdf.h[k]) / dx;
    }
    flux.kfvs(sloped, low, high, slope.data(), slope.data(), dx, dx, 0, dt, area);

    const std::vector<double>& u = update.grid(0).u();
    for (std::size_t k = 0; k < nodes[0]; ++k) {
        const double c = u[k];
        const double s = slope[0].h[k];
        // Extrapolation by half a cell lands on the average of the two cells.
        const double face = 0.5 * (low.species[0].pdf.h[k] + high.species[0].pdf.h[k]);
        ASSERT_NEAR(sloped.species[0].ff.h[k], dt * area * (c * face - 0.5 * dt * c * c * s), 1e-14);
    }
    // At rest only the time-centring term moves mass: -dt/2 * d(rho / 2 lambda)/dx.
    const double dpdx = (0.5 - 1.0) / (2.0 * 1.0) / dx;
    ASSERT_NEAR(sloped.species[0].fw[0], dt * area * (-0.5 * dt * dpdx), 1e-12);
}

void ghostLayersMustCoverStencil() {
    SimulationConfig config = tubeConfig();
    config.nGhost = 1;
    config.reconOrder = ReconstructionOrder::VanLeer;
    ASSERT_THROWS(config.validate(), std::invalid_argument);

    config.nGhost = 2;
    config.validate();
    RectilinearMesh thin = RectilinearMesh::createUniform(1, 8, 0.0, 1.0);
    ASSERT_THROWS(KineticSolver(thin, config, {VelocityGrid::create1D(-6.0, 6.0, 32)}),
                  std::invalid_argument);

    SimulationConfig hydro;
    hydro.distribution = DistributionModel::None;
    hydro.nGhost = 2;
    hydro.reconOrder = ReconstructionOrder::VanLeer;
    ASSERT_THROWS(hydro.validate(), std::invalid_argument);
}

void secondOrderKeepsUniformFlow() {
    SimulationConfig config = tubeConfig();
    config.reconOrder = ReconstructionOrder::VanLeer;
    RectilinearMesh mesh = tubeMesh(BoundaryCondition::Periodic, BoundaryCondition::Periodic);
    KineticSolver solver(mesh, config, {VelocityGrid::create1D(-6.0, 6.0, 48)});
    solver.initialize(mesh, [](double, double) {
        return std::vector<std::vector<double>>{{1.0, 0.3, 1.0}};
    });

    for (int n = 0; n < 30; ++n) solver.step(config, mesh);

    for (int i = 0; i < mesh.nx(); ++i) {
        const std::vector<double>& prim = solver.cells()[mesh.index(i)].species[0].prim;
        ASSERT_NEAR(prim[0], 1.0, 1e-10);
        ASSERT_NEAR(prim[1], 0.3, 1e-10);
        ASSERT_NEAR(prim[2], 1.0, 1e-9);
    }
}

void secondOrderConservesMassInPeriodicTube() {
    SimulationConfig config = tubeConfig();
    config.reconOrder = ReconstructionOrder::VanLeer;
    RectilinearMesh mesh = tubeMesh(BoundaryCondition::Periodic, BoundaryCondition::Periodic);
    KineticSolver solver(mesh, config, {VelocityGrid::create1D(-6.0, 6.0, 48)});
    solver.initialize(mesh, [](double x, double) {
        return std::vector<std::vector<double>>{{1.0 + 0.2 * std::sin(2.0 * M_PI * x), 0.1, 1.0}};
    });

    auto mass = [&]() {
        double m = 0.0;
        for (int i = 0; i < mesh.nx(); ++i) {
            const KineticCell& c = solver.cells()[mesh.index(i)];
            m += c.species[0].w[0] * c.measure;
        }
        return m;
    };
    const double mass0 = mass();
    for (int n = 0; n < 40; ++n) solver.step(config, mesh);
    ASSERT_NEAR(mass(), mass0, 1e-12);
    ASSERT_TRUE(solver.warningCount() == 0);
}

} // namespace

int main() {
    RUN_TEST(vanLeerLimiter);
    RUN_TEST(linearProfileGivesExactSlopes);
    RUN_TEST(extremumHasZeroSlope);
    RUN_TEST(wallCellUsesOneSidedDifference);
    RUN_TEST(twoDimensionalSlopesFollowEachAxis);
    RUN_TEST(secondOrderFluxExtrapolatesUpwindState);
    RUN_TEST(ghostLayersMustCoverStencil);
    RUN_TEST(secondOrderKeepsUniformFlow);
    RUN_TEST(secondOrderConservesMassInPeriodicTube);
    return KineticFV::test::testSummary();
}
