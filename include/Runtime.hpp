#ifndef RUNTIME_HPP
#define RUNTIME_HPP

#include "RectilinearMesh.hpp"
#include "SimulationConfig.hpp"
#include <array>
#include <iostream>
#include <sstream>
#include <memory>
#include "MPIContext.hpp"
#include "HaloExchange.hpp"

namespace KineticFV {

class KineticSolver;

/// Unified initialization / utility class that abstracts MPI vs serial.
/// In serial mode it is a thin passthrough.  In MPI mode it owns
/// MPIContext and HaloExchange internally.
class Runtime {
public:
    Runtime(int& argc, char**& argv);
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    int rank() const { return rank_; }
    int size() const { return size_; }
    bool isRoot() const { return rank_ == 0; }

    // --- Mesh creation (1D) ---
    RectilinearMesh createUniformMesh(
        const SimulationConfig& config,
        int globalNx, double xMin, double xMax,
        const std::array<int,2>& periods = {0,0});

    // --- Mesh creation (2D) ---
    RectilinearMesh createUniformMesh(
        const SimulationConfig& config,
        int globalNx, double xMin, double xMax,
        int globalNy, double yMin, double yMax,
        const std::array<int,2>& periods = {0,0});

    // --- BC setup (ignored on faces shared with another rank) ---
    void setBoundaryCondition(RectilinearMesh& mesh, int face, BoundaryCondition bc,
                              const WallState& wall = WallState());

    // --- Solver attachment ---
    void attachSolver(KineticSolver& solver, const RectilinearMesh& mesh);

    // --- Reductions ---
    double reduceMax(double localValue);
    double reduceSum(double localValue);

    // --- Console output (rank 0 only) ---
    template <typename... Args>
    void print(Args&&... args) {
        if (rank_ != 0) return;
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        std::cout << oss.str();
    }

    int globalNx() const { return globalNx_; }
    int globalNy() const { return globalNy_; }

    bool hasMPIContext() const { return static_cast<bool>(mpiCtx_); }
    const MPIContext& mpiContext() const { return *mpiCtx_; }
#ifdef ENABLE_MPI
    HaloExchange* haloExchange() { return halo_.get(); }
#endif

private:
    int rank_ = 0;
    int size_ = 1;
    int globalNx_ = 0, globalNy_ = 0;

    std::unique_ptr<MPIContext> mpiCtx_;
#ifdef ENABLE_MPI
    std::unique_ptr<HaloExchange> halo_;
#endif
};

} // namespace KineticFV

#endif // RUNTIME_HPP
