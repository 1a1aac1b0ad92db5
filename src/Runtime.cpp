#include "Runtime.hpp"
#include "KineticSolver.hpp"

#ifdef ENABLE_MPI
#include <mpi.h>
#endif

#include <stdexcept>
#include <string>
#include <vector>

namespace KineticFV {

#ifdef ENABLE_MPI
static std::vector<double> linspace(double a, double b, int n) {
    std::vector<double> v(n);
    for (int i = 0; i < n; ++i)
        v[i] = a + (b - a) * i / (n - 1);
    return v;
}
#endif

// ---- Constructor / Destructor ----

Runtime::Runtime(int& argc, char**& argv) {
#ifdef ENABLE_MPI
    MPI_Init(&argc, &argv);
    MPI_Comm_rank(MPI_COMM_WORLD, &rank_);
    MPI_Comm_size(MPI_COMM_WORLD, &size_);
#else
    (void)argc; (void)argv;
#endif
}

Runtime::~Runtime() {
#ifdef ENABLE_MPI
    halo_.reset();
    mpiCtx_.reset();
    int finalized = 0;
    MPI_Finalized(&finalized);
    if (!finalized) {
        MPI_Finalize();
    }
#endif
}

// ---- Mesh creation (1D) ----

RectilinearMesh Runtime::createUniformMesh(
    const SimulationConfig& config,
    int globalNx, double xMin, double xMax,
    const std::array<int,2>& periods)
{
    if (config.dim != 1) {
        throw std::invalid_argument("Runtime::createUniformMesh: 1D mesh requested for dim = " +
                                    std::to_string(config.dim));
    }
    globalNx_ = globalNx;
    globalNy_ = 1;

#ifdef ENABLE_MPI
    std::vector<double> gxNodes = linspace(xMin, xMax, globalNx + 1);
    std::vector<double> gyNodes = {0.0, 1.0};

    mpiCtx_ = std::make_unique<MPIContext>(
        MPIContext::create(globalNx, 1, gxNodes, gyNodes, 1, periods));

    rank_ = mpiCtx_->rank();
    size_ = mpiCtx_->size();

    return RectilinearMesh(1, mpiCtx_->localXNodes(), {0.0, 1.0}, config.nGhost);
#else
    (void)periods;
    return RectilinearMesh::createUniform(1, globalNx, xMin, xMax, 1, 0.0, 1.0, config.nGhost);
#endif
}

// ---- Mesh creation (2D) ----

RectilinearMesh Runtime::createUniformMesh(
    const SimulationConfig& config,
    int globalNx, double xMin, double xMax,
    int globalNy, double yMin, double yMax,
    const std::array<int,2>& periods)
{
    globalNx_ = globalNx;
    globalNy_ = globalNy;

#ifdef ENABLE_MPI
    std::vector<double> gxNodes = linspace(xMin, xMax, globalNx + 1);
    std::vector<double> gyNodes = linspace(yMin, yMax, globalNy + 1);

    mpiCtx_ = std::make_unique<MPIContext>(
        MPIContext::create(globalNx, globalNy, gxNodes, gyNodes, config.dim, periods));

    rank_ = mpiCtx_->rank();
    size_ = mpiCtx_->size();

    return RectilinearMesh(config.dim, mpiCtx_->localXNodes(), mpiCtx_->localYNodes(),
                           config.nGhost);
#else
    (void)periods;
    return RectilinearMesh::createUniform(config.dim, globalNx, xMin, xMax,
                                           globalNy, yMin, yMax, config.nGhost);
#endif
}

// ---- Boundary conditions ----

void Runtime::setBoundaryCondition(RectilinearMesh& mesh, int face, BoundaryCondition bc,
                                   const WallState& wall) {
#ifdef ENABLE_MPI
    // Faces shared with a rank (periodic wrap included) are filled by the halo exchange.
    if (mpiCtx_ && !mpiCtx_->isPhysicalBoundary(face)) {
        return;
    }
#endif
    mesh.setBoundaryCondition(face, bc, wall);
}

// ---- Solver attachment ----

void Runtime::attachSolver(KineticSolver& solver, const RectilinearMesh& mesh) {
#ifdef ENABLE_MPI
    if (mpiCtx_) {
        halo_ = std::make_unique<HaloExchange>(*mpiCtx_, mesh);
        solver.setHaloExchange(halo_.get());
    }
#else
    (void)solver; (void)mesh;
#endif
}

// ---- Reductions ----

double Runtime::reduceMax(double localValue) {
#ifdef ENABLE_MPI
    if (mpiCtx_) {
        double globalValue = 0.0;
        MPI_Allreduce(&localValue, &globalValue, 1, MPI_DOUBLE, MPI_MAX, mpiCtx_->comm());
        return globalValue;
    }
#endif
    return localValue;
}

double Runtime::reduceSum(double localValue) {
#ifdef ENABLE_MPI
    if (mpiCtx_) {
        double globalValue = 0.0;
        MPI_Allreduce(&localValue, &globalValue, 1, MPI_DOUBLE, MPI_SUM, mpiCtx_->comm());
        return globalValue;
    }
#endif
    return localValue;
}

} // namespace KineticFV
