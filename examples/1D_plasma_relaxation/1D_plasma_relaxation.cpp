#include "RectilinearMesh.hpp"
#include "State.hpp"
#include "KineticSolver.hpp"
#include "VelocitySpace.hpp"
#include "SimulationConfig.hpp"
#include "Runtime.hpp"
#include "VTKSession.hpp"

#include "TimeStepping.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

using namespace KineticFV;

// Two-species (ion/electron) Riemann problem with a Brio-Wu magnetic field.
// Fields evolve through the cell-local implicit coupling only.
int main(int argc, char** argv) {
    Runtime rt(argc, argv);

    const int numCells = 100;
    const double length = 1.0;
    const double endTime = 0.1;

    SimulationConfig config;
    config.dim = 1;
    config.velocityDim = 1;
    config.nSpecies = 2;
    config.distribution = DistributionModel::PlasmaFourMoment;
    config.collision = CollisionModel::BGK;
    config.mixture.mi = 1.0;
    config.mixture.me = 0.25;
    config.mixture.ni = 0.5;
    config.mixture.ne = 0.5;
    config.mixture.Kn = 0.1;
    config.plasma.debyeLength = 0.1;
    config.plasma.larmorRadius = 0.1;
    config.explicitParams.cfl = 0.5;
    config.validate();

    // ---- Mesh setup ----
    RectilinearMesh mesh = rt.createUniformMesh(config, numCells, 0.0, length);
    rt.setBoundaryCondition(mesh, RectilinearMesh::XLow,  BoundaryCondition::Outflow);
    rt.setBoundaryCondition(mesh, RectilinearMesh::XHigh, BoundaryCondition::Outflow);

    rt.print("Created mesh with ", numCells, " total cells");
    if (rt.size() > 1) rt.print(" on ", rt.size(), " ranks");
    rt.print(".\n");

    std::vector<VelocityGrid> grids = createSpeciesGrids(
        {VelocityAxis{-5.0, 5.0, 64, 0}}, {VelocityAxis{-10.0, 10.0, 64, 0}},
        QuadratureRule::Rectangle);

    KineticSolver solver(mesh, config, grids);
    rt.attachSolver(solver, mesh);

    // (rho, U, V, W, lambda) per species, lambda = m / (2 T)
    const double mi = config.mixture.mi;
    const double me = config.mixture.me;
    solver.initialize(mesh, [&](double x, double) {
        if (x < 0.5 * length) {
            return std::vector<std::vector<double>>{
                {mi, 0.0, 0.0, 0.0, 0.5 * mi},
                {me, 0.0, 0.0, 0.0, 0.5 * me}};
        }
        return std::vector<std::vector<double>>{
            {0.125 * mi, 0.0, 0.0, 0.0, 0.625 * mi},
            {0.125 * me, 0.0, 0.0, 0.0, 0.625 * me}};
    });

    for (int i = 0; i < mesh.nx(); ++i) {
        FieldState& field = solver.cells()[mesh.index(i)].field;
        field.B = {0.75, mesh.cellCentroidX(i) < 0.5 * length ? 1.0 : -1.0, 0.0};
    }

    VTKSession vtk(rt, "1D_plasma", mesh, config);

    auto stepFn = [&](double targetDt) {
        return solver.step(config, mesh, targetDt);
    };
    runTimeLoop(rt, config, stepFn,
                {.endTime = endTime, .outputInterval = 0.01, .printInterval = 10,
                 .outputFn = [&](double t) { vtk.write(solver.cells(), t); }});
    vtk.finalize();

    // Global diagnostics
    double localMaxE = 0.0;
    for (int i = 0; i < mesh.nx(); ++i) {
        localMaxE = std::max(localMaxE, std::abs(solver.cells()[mesh.index(i)].field.E[0]));
    }
    double maxE = rt.reduceMax(localMaxE);
    double warnings = rt.reduceSum(static_cast<double>(solver.warningCount()));
    rt.print("Peak |Ex|: ", maxE, "\n");
    if (warnings > 0.0) {
        rt.print("Warning: ", warnings, " cell updates reported warnings\n");
    }

    return 0;
}
