#include "MPIContext.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace KineticFV {

MPIContext::~MPIContext() {
    if (cartComm_ != MPI_COMM_NULL && cartComm_ != MPI_COMM_WORLD) {
        int finalized = 0;
        MPI_Finalized(&finalized);
        if (!finalized) {
            MPI_Comm_free(&cartComm_);
        }
    }
}

MPIContext::MPIContext(MPIContext&& other) noexcept
    : cartComm_(other.cartComm_)
    , rank_(other.rank_)
    , size_(other.size_)
    , dims_(other.dims_)
    , coords_(other.coords_)
    , offset_(other.offset_)
    , neighbors_(other.neighbors_)
    , localXNodes_(std::move(other.localXNodes_))
    , localYNodes_(std::move(other.localYNodes_))
{
    other.cartComm_ = MPI_COMM_NULL;
}

std::array<int,2> MPIContext::partition(int globalN, int nProcs, int coord) {
    int base = globalN / nProcs;
    int remainder = globalN % nProcs;
    int start = coord * base + std::min(coord, remainder);
    int count = base + (coord < remainder ? 1 : 0);
    return {start, count};
}

MPIContext MPIContext::create(int globalNx, int globalNy,
                              const std::vector<double>& xNodes,
                              const std::vector<double>& yNodes,
                              int dim,
                              const std::array<int,2>& periods,
                              const std::array<int,2>& procsPerDir) {
    MPIContext ctx;

    int worldSize;
    MPI_Comm_size(MPI_COMM_WORLD, &worldSize);

    ctx.dims_ = procsPerDir;
    if (dim < 2) {
        ctx.dims_ = {worldSize, 1};
    } else {
        MPI_Dims_create(worldSize, 2, ctx.dims_.data());
    }

    if (ctx.dims_[0] * ctx.dims_[1] != worldSize) {
        throw std::runtime_error(
            "MPIContext::create: dims product (" + std::to_string(ctx.dims_[0] * ctx.dims_[1]) +
            ") != worldSize (" + std::to_string(worldSize) + ")");
    }
    if (ctx.dims_[0] > globalNx || ctx.dims_[1] > globalNy) {
        throw std::runtime_error("MPIContext::create: more ranks than cells along an axis");
    }

    int mpiPeriods[2] = {periods[0], periods[1]};
    MPI_Cart_create(MPI_COMM_WORLD, 2, ctx.dims_.data(), mpiPeriods, 1, &ctx.cartComm_);

    MPI_Comm_rank(ctx.cartComm_, &ctx.rank_);
    MPI_Comm_size(ctx.cartComm_, &ctx.size_);
    MPI_Cart_coords(ctx.cartComm_, ctx.rank_, 2, ctx.coords_.data());

    MPI_Cart_shift(ctx.cartComm_, 0, 1, &ctx.neighbors_[XLow], &ctx.neighbors_[XHigh]);
    MPI_Cart_shift(ctx.cartComm_, 1, 1, &ctx.neighbors_[YLow], &ctx.neighbors_[YHigh]);

    auto slice = [](const std::vector<double>& nodes, const std::array<int,2>& part) {
        return std::vector<double>(nodes.begin() + part[0], nodes.begin() + part[0] + part[1] + 1);
    };

    const auto px = partition(globalNx, ctx.dims_[0], ctx.coords_[0]);
    const auto py = partition(globalNy, ctx.dims_[1], ctx.coords_[1]);
    ctx.localXNodes_ = slice(xNodes, px);
    ctx.localYNodes_ = slice(yNodes, py);
    ctx.offset_ = {px[0], py[0]};

    return ctx;
}

} // namespace KineticFV
