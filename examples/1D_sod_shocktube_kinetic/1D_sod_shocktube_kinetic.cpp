#include "RectilinearMesh.hpp"
#include "State.hpp"
#include "KineticSolver.hpp"
#include "VelocitySpace.hpp"
#include "Equilibrium.hpp"
#include "EquationOfState.hpp"
#include "SimulationConfig.hpp"
#include "Runtime.hpp"
#include "VTKSession.hpp"

#include "TimeStepping.hpp"

#include <vector>

using namespace KineticFV;

// Sod shock tube in the near-continuum regime, Shakhov collisions so the
// Prandtl number matches a monatomic gas.
int main(int argc, char** argv) {
    Runtime rt(argc, argv);

    const int numCells = 100;
    const double length = 1.0;
    const double endTime = 0.2;

    SimulationConfig config;
    config.dim = 1;
    config.velocityDim = 1;
    config.distribution = DistributionModel::InternalEnergy;
    config.collision = CollisionModel::Shakhov;
    config.gas.gamma = 5.0 / 3.0;
    config.gas.K = internalDofFromGamma(config.gas.gamma, config.velocityDim);
    config.gas.Kn = 1e-4;
    config.gas.omega = 0.81;
    config.gas.Pr = 2.0 / 3.0;
    config.gas.muRef = referenceViscosity(config.gas.Kn, 1.0, 0.5);
    config.explicitParams.cfl = 0.5;
    config.validate();

    // ---- Mesh setup ----
    RectilinearMesh mesh = rt.createUniformMesh(config, numCells, 0.0, length);
    rt.setBoundaryCondition(mesh, RectilinearMesh::XLow,  BoundaryCondition::Outflow);
    rt.setBoundaryCondition(mesh, RectilinearMesh::XHigh, BoundaryCondition::Outflow);

    rt.print("Created mesh with ", numCells, " total cells");
    if (rt.size() > 1) rt.print(" on ", rt.size(), " ranks");
    rt.print(".\n");

    std::vector<VelocityGrid> grids = {VelocityGrid::create1D(-5.0, 5.0, 100)};

    KineticSolver solver(mesh, config, grids);
    rt.attachSolver(solver, mesh);

    // (rho, U, lambda) with lambda = rho / (2 p)
    solver.initialize(mesh, [&](double x, double) {
        if (x < 0.5 * length)
            return std::vector<std::vector<double>>{{1.0, 0.0, 0.5}};
        return std::vector<std::vector<double>>{{0.125, 0.0, 0.625}};
    });

    VTKSession vtk(rt, "1D_sod_kinetic", mesh, config);

    auto stepFn = [&](double targetDt) {
        return solver.step(config, mesh, targetDt);
    };
    runTimeLoop(rt, config, stepFn,
                {.endTime = endTime, .outputInterval = 0.02, .printInterval = 10,
                 .outputFn = [&](double t) { vtk.write(solver.cells(), t); }});
    vtk.finalize();

    return 0;
}
