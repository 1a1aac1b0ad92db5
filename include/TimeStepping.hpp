#ifndef TIME_STEPPING_HPP
#define TIME_STEPPING_HPP

#include "SimulationConfig.hpp"
#include "RectilinearMesh.hpp"
#include "CellUpdate.hpp"

#include <functional>
#include <mpi.h>

namespace KineticFV {

class Runtime;

// Transport time step: dt = cfl / max over cells of (umax/dx + vmax/dy), with
// umax, vmax the largest discrete particle speeds over all species.
double computeKineticTimeStep(const RectilinearMesh& mesh,
                              const CellUpdate& update,
                              double cfl, double maxDt);

// MPI-aware transport time step with global reduction.
double computeKineticTimeStep(const RectilinearMesh& mesh,
                              const CellUpdate& update,
                              double cfl, double maxDt,
                              MPI_Comm comm);

// ---- Time loop ----

struct TimeLoopParams {
    double endTime;
    int maxSteps = -1;              // < 0: unlimited
    double outputInterval = -1.0;   // <= 0: no intermediate output
    int printInterval = 1;
    // Stop once residualFn() drops below this value (<= 0 disables).
    double residualTolerance = -1.0;
    // Returns the latest global residual; printed at each print step if set.
    std::function<double()> residualFn;
    // Called at t = 0, at every output time and at the end of the run.
    std::function<void(double)> outputFn;
};

// Advance until endTime, maxSteps or residual convergence. Returns the final time.
double runTimeLoop(
    Runtime& rt,
    SimulationConfig& config,
    const std::function<double(double)>& stepFn,
    const TimeLoopParams& params);

} // namespace KineticFV

#endif // TIME_STEPPING_HPP
