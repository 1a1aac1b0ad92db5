#include "TimeStepping.hpp"
#include "Runtime.hpp"
#include <cmath>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace KineticFV {

double computeKineticTimeStep(const RectilinearMesh& mesh,
                              const CellUpdate& update,
                              double cfl, double maxDt) {
    const SimulationConfig& config = update.config();
    double umax = 0.0;
    double vmax = 0.0;
    for (int s = 0; s < config.nSpecies; ++s) {
        const VelocityGrid& grid = update.grid(s);
        umax = std::max(umax, grid.maxSpeed(0));
        if (grid.dim() >= 2) vmax = std::max(vmax, grid.maxSpeed(1));
    }

    double rate = 0.0;
    for (int j = 0; j < mesh.ny(); ++j) {
        for (int i = 0; i < mesh.nx(); ++i) {
            double r = umax / mesh.dx(i);
            if (mesh.dim() >= 2)
                r += vmax / mesh.dy(j);
            rate = std::max(rate, r);
        }
    }

    if (rate <= 0.0) return maxDt;
    return std::min(maxDt, cfl / rate);
}

double computeKineticTimeStep(const RectilinearMesh& mesh,
                              const CellUpdate& update,
                              double cfl, double maxDt,
                              MPI_Comm comm) {
    double localDt = computeKineticTimeStep(mesh, update, cfl, maxDt);
    double globalDt = localDt;
    MPI_Allreduce(&localDt, &globalDt, 1, MPI_DOUBLE, MPI_MIN, comm);
    return globalDt;
}

double runTimeLoop(
    Runtime& rt,
    SimulationConfig& config,
    const std::function<double(double)>& stepFn,
    const TimeLoopParams& params)
{
    double time = config.time;
    if (params.outputFn) params.outputFn(time);

    rt.print("Running simulation to t = ", params.endTime, "...\n");

    const bool periodicOutput = params.outputInterval > 0.0;
    double nextOutput = periodicOutput ? time + params.outputInterval : params.endTime;
    double wallTotal = 0.0;
    bool converged = false;

    while (time < params.endTime) {
        if (params.maxSteps >= 0 && config.step >= params.maxSteps) break;

        // Clamp dt to hit the next output time or endTime exactly
        double targetDt = params.endTime - time;
        if (periodicOutput && nextOutput < params.endTime) {
            targetDt = std::min(targetDt, nextOutput - time);
        }

        config.time = time;
        auto t0 = std::chrono::high_resolution_clock::now();
        double dt = stepFn(targetDt);
        auto t1 = std::chrono::high_resolution_clock::now();
        double stepWall = std::chrono::duration<double>(t1 - t0).count();
        wallTotal += stepWall;

        time += dt;
        config.step++;

        if (periodicOutput && time >= nextOutput - 1e-12 * params.outputInterval) {
            if (params.outputFn && time < params.endTime) params.outputFn(time);
            nextOutput += params.outputInterval;
        }

        double residual = params.residualFn ? params.residualFn() : 0.0;
        converged = params.residualTolerance > 0.0 && params.residualFn &&
                    residual < params.residualTolerance;

        if (config.step % params.printInterval == 0 || config.step == 1 || converged) {
            double pct = 100.0 * time / params.endTime;

            std::ostringstream oss;
            oss << "  Step " << std::setw(6) << config.step
                << " | t = " << std::scientific << std::setprecision(3) << std::setw(10) << time
                << " | dt = " << std::scientific << std::setprecision(3) << std::setw(10) << dt
                << " | t/T = " << std::fixed << std::setprecision(1) << std::setw(5) << pct << "%"
                << " | step wall = " << std::scientific << std::setprecision(2) << stepWall << " s";

            if (params.residualFn) {
                oss << " | residual = " << std::scientific << std::setprecision(3) << residual;
            }

            oss << "\n";
            rt.print(oss.str());
        }

        if (converged) break;
    }
    config.time = time;
    if (params.outputFn) params.outputFn(time);

    {
        std::ostringstream summary;
        summary << "\nSimulation " << (converged ? "converged" : "complete") << ": "
                << config.step << " steps, wall time = "
                << std::fixed << std::setprecision(3) << wallTotal << " s\n";
        rt.print(summary.str());
    }

    return time;
}

} // namespace KineticFV
