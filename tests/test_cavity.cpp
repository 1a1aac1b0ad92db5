#include "KineticSolver.hpp"
#include "RectilinearMesh.hpp"
#include "TimeStepping.hpp"
#include "Equilibrium.hpp"
#include "EquationOfState.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace KineticFV;

namespace {

SimulationConfig cavityConfig() {
    SimulationConfig config;
    config.dim = 2;
    config.velocityDim = 2;
    config.distribution = DistributionModel::InternalEnergy;
    config.collision = CollisionModel::BGK;
    config.gas.gamma = 5.0 / 3.0;
    config.gas.K = internalDofFromGamma(config.gas.gamma, config.velocityDim);
    config.gas.Kn = 0.075;
    config.gas.omega = 0.72;
    config.gas.muRef = referenceViscosity(config.gas.Kn, 1.0, 0.5);
    config.explicitParams.cfl = 0.8;
    config.validate();
    return config;
}

RectilinearMesh cavityMesh(int n, int nGhost = 1) {
    RectilinearMesh mesh = RectilinearMesh::createUniform(2, n, 0.0, 1.0, n, 0.0, 1.0, nGhost);
    WallState lid;
    lid.velocity = {0.15, 0.0, 0.0};
    mesh.setBoundaryCondition(RectilinearMesh::XLow,  BoundaryCondition::MaxwellWall);
    mesh.setBoundaryCondition(RectilinearMesh::XHigh, BoundaryCondition::MaxwellWall);
    mesh.setBoundaryCondition(RectilinearMesh::YLow,  BoundaryCondition::MaxwellWall);
    mesh.setBoundaryCondition(RectilinearMesh::YHigh, BoundaryCondition::MaxwellWall, lid);
    return mesh;
}

std::vector<VelocityGrid> cavityGrids() {
    return {VelocityGrid::create2D(-4.0, 4.0, 16, -4.0, 4.0, 16)};
}

double totalMass(const RectilinearMesh& mesh, const std::vector<KineticCell>& cells) {
    double m = 0.0;
    for (int j = 0; j < mesh.ny(); ++j) {
        for (int i = 0; i < mesh.nx(); ++i) {
            const KineticCell& c = cells[mesh.index(i, j)];
            m += c.species[0].w[0] * c.measure;
        }
    }
    return m;
}

void timeStepFollowsCfl() {
    SimulationConfig config = cavityConfig();
    RectilinearMesh mesh = cavityMesh(16);
    KineticSolver solver(mesh, config, cavityGrids());

    // Largest node speed 3.75 on both axes, dx = dy = 1/16.
    const double rate = 2.0 * 3.75 * 16.0;
    ASSERT_NEAR(computeKineticTimeStep(mesh, solver.cellUpdate(), 0.8, 1.0), 0.8 / rate, 1e-12);
    ASSERT_NEAR(computeKineticTimeStep(mesh, solver.cellUpdate(), 0.8, 1e-4), 1e-4, 1e-18);
}

void solverRejectsMismatchedMesh() {
    SimulationConfig config = cavityConfig();
    RectilinearMesh mesh1D = RectilinearMesh::createUniform(1, 16, 0.0, 1.0);
    ASSERT_THROWS(KineticSolver(mesh1D, config, cavityGrids()), std::invalid_argument);
}

void densityRange(const RectilinearMesh& mesh, const KineticSolver& solver, int rows,
                  double& minRho, double& maxRho) {
    minRho = 1e30;
    maxRho = 0.0;
    for (int j = 0; j < rows; ++j) {
        for (int i = 0; i < mesh.nx(); ++i) {
            const double rho = solver.cells()[mesh.index(i, j)].species[0].prim[0];
            minRho = std::min(minRho, rho);
            maxRho = std::max(maxRho, rho);
        }
    }
}

void cavityConservesMassAndDrivesFlow() {
    SimulationConfig config = cavityConfig();
    RectilinearMesh mesh = cavityMesh(16);
    KineticSolver solver(mesh, config, cavityGrids());
    solver.initialize(mesh, [](double, double) {
        return std::vector<std::vector<double>>{{1.0, 0.0, 0.0, 1.0}};
    });

    const double mass0 = totalMass(mesh, solver.cells());
    ASSERT_NEAR(mass0, 1.0, 1e-12);

    double minRho = 0.0, maxRho = 0.0;
    double t = 0.0;
    for (int n = 0; n < 300; ++n) {
        t += solver.step(config, mesh, 10.0 - t);
        if (n == 24) {
            // Before the lid corners have built up their compression and expansion.
            densityRange(mesh, solver, mesh.ny(), minRho, maxRho);
            ASSERT_TRUE(minRho > 0.95 && maxRho < 1.05);
        }
    }
    ASSERT_TRUE(t > 0.0);

    ASSERT_TRUE(solver.warningCount() == 0);
    ASSERT_TRUE(solver.rollbackCount() == 0);
    ASSERT_NEAR(totalMass(mesh, solver.cells()), mass0, 1e-10);

    // The lid compresses gas into the downstream top corner and rarefies the
    // upstream one. Away from the lid corners the density stays within 5%.
    densityRange(mesh, solver, mesh.ny(), minRho, maxRho);
    ASSERT_TRUE(minRho > 0.85 && maxRho < 1.15);
    densityRange(mesh, solver, mesh.ny() - 5, minRho, maxRho);
    ASSERT_TRUE(minRho > 0.95 && maxRho < 1.05);

    const int top = mesh.ny() - 1;
    ASSERT_TRUE(solver.cells()[mesh.index(0, top)].species[0].prim[0] < 1.0);
    ASSERT_TRUE(solver.cells()[mesh.index(mesh.nx() - 1, top)].species[0].prim[0] > 1.0);

    // The lid drags the top row in +x.
    double topU = 0.0;
    for (int i = 0; i < mesh.nx(); ++i) {
        topU += solver.cells()[mesh.index(i, top)].species[0].prim[1];
    }
    ASSERT_TRUE(topU / mesh.nx() > 0.0);

    ASSERT_TRUE(solver.residual().size() == 4);
    ASSERT_TRUE(std::isfinite(solver.maxResidual()));
    ASSERT_TRUE(solver.maxResidual() > 0.0);
}

void residualDecaysAfterTransient() {
    for (ReconstructionOrder order : {ReconstructionOrder::FirstOrder, ReconstructionOrder::VanLeer}) {
        SimulationConfig config = cavityConfig();
        config.nGhost = 2;
        config.reconOrder = order;
        config.validate();
        RectilinearMesh mesh = cavityMesh(8, 2);
        KineticSolver solver(mesh, config, cavityGrids());
        solver.initialize(mesh, [](double, double) {
            return std::vector<std::vector<double>>{{1.0, 0.0, 0.0, 1.0}};
        });
        const double mass0 = totalMass(mesh, solver.cells());

        // The residual oscillates from step to step while the cavity settles,
        // so compare its maximum over windows of 100 steps.
        std::vector<double> windowMax(3, 0.0);
        for (int n = 0; n < 300; ++n) {
            solver.step(config, mesh);
            ASSERT_TRUE(std::isfinite(solver.maxResidual()));
            windowMax[n / 100] = std::max(windowMax[n / 100], solver.maxResidual());
        }
        ASSERT_TRUE(windowMax[1] < 0.5 * windowMax[0]);
        ASSERT_TRUE(windowMax[2] < 0.5 * windowMax[1]);

        ASSERT_NEAR(totalMass(mesh, solver.cells()), mass0, 1e-10);
        double minRho = 0.0, maxRho = 0.0;
        densityRange(mesh, solver, mesh.ny(), minRho, maxRho);
        ASSERT_TRUE(minRho > 0.85 && maxRho < 1.15);
        ASSERT_TRUE(solver.warningCount() == 0);
    }
}

void constantTimeStepAndTarget() {
    SimulationConfig config = cavityConfig();
    config.explicitParams.constDt = 1e-3;
    RectilinearMesh mesh = cavityMesh(8);
    KineticSolver solver(mesh, config, cavityGrids());
    solver.initialize(mesh, [](double, double) {
        return std::vector<std::vector<double>>{{1.0, 0.0, 0.0, 1.0}};
    });

    ASSERT_NEAR(solver.step(config, mesh), 1e-3, 1e-18);
    ASSERT_NEAR(solver.step(config, mesh, 4e-4), 4e-4, 1e-18);

    config.explicitParams.constDt = 1e-14;
    ASSERT_THROWS(solver.step(config, mesh), std::runtime_error);
}

void periodicTubeStaysUniform() {
    SimulationConfig config;
    config.dim = 1;
    config.velocityDim = 1;
    config.distribution = DistributionModel::Monatomic;
    config.gas.gamma = 3.0;
    config.gas.muRef = 1e-2;
    config.validate();

    RectilinearMesh mesh = RectilinearMesh::createUniform(1, 20, 0.0, 1.0);
    mesh.setBoundaryCondition(RectilinearMesh::XLow,  BoundaryCondition::Periodic);
    mesh.setBoundaryCondition(RectilinearMesh::XHigh, BoundaryCondition::Periodic);

    KineticSolver solver(mesh, config, {VelocityGrid::create1D(-6.0, 6.0, 48)});
    solver.initialize(mesh, [](double, double) {
        return std::vector<std::vector<double>>{{1.0, 0.3, 1.0}};
    });

    for (int n = 0; n < 50; ++n) solver.step(config, mesh);

    for (int i = 0; i < mesh.nx(); ++i) {
        const std::vector<double>& prim = solver.cells()[mesh.index(i)].species[0].prim;
        ASSERT_NEAR(prim[0], 1.0, 1e-10);
        ASSERT_NEAR(prim[1], 0.3, 1e-10);
        ASSERT_NEAR(prim[2], 1.0, 1e-9);
    }
    ASSERT_TRUE(solver.maxResidual() < 1e-6);
}

} // namespace

int main() {
    RUN_TEST(timeStepFollowsCfl);
    RUN_TEST(solverRejectsMismatchedMesh);
    RUN_TEST(cavityConservesMassAndDrivesFlow);
    RUN_TEST(residualDecaysAfterTransient);
    RUN_TEST(constantTimeStepAndTarget);
    RUN_TEST(periodicTubeStaysUniform);
    return KineticFV::test::testSummary();
}
