#ifdef ENABLE_MPI

#include "HaloExchange.hpp"
#include <stdexcept>

namespace KineticFV {

HaloExchange::HaloExchange(const MPIContext& mpi, const RectilinearMesh& mesh)
    : mpi_(mpi)
    , mesh_(mesh)
{}

std::size_t HaloExchange::slabCells(int face) const {
    const std::size_t ng = mesh_.nGhost();
    if (face == MPIContext::XLow || face == MPIContext::XHigh) {
        // nGhost x ny (physical y range only at this stage)
        return ng * mesh_.ny();
    }
    // (nx + 2 ngx) x nGhost, including the x ghosts filled by the x pass
    return static_cast<std::size_t>(mesh_.nxTotal()) * ng;
}

void HaloExchange::forEachSlabCell(int face, bool ghost,
                                   const std::function<void(std::size_t)>& fn) const {
    const int ng = mesh_.nGhost();
    const int nx = mesh_.nx();
    const int ny = mesh_.ny();

    switch (face) {
        case MPIContext::XLow: {
            const int i0 = ghost ? -ng : 0;
            for (int j = 0; j < ny; ++j)
                for (int g = 0; g < ng; ++g)
                    fn(mesh_.index(i0 + g, j));
            break;
        }
        case MPIContext::XHigh: {
            const int i0 = ghost ? nx : nx - ng;
            for (int j = 0; j < ny; ++j)
                for (int g = 0; g < ng; ++g)
                    fn(mesh_.index(i0 + g, j));
            break;
        }
        case MPIContext::YLow: {
            const int j0 = ghost ? -ng : 0;
            for (int g = 0; g < ng; ++g)
                for (int i = -mesh_.ngx(); i < nx + mesh_.ngx(); ++i)
                    fn(mesh_.index(i, j0 + g));
            break;
        }
        case MPIContext::YHigh: {
            const int j0 = ghost ? ny : ny - ng;
            for (int g = 0; g < ng; ++g)
                for (int i = -mesh_.ngx(); i < nx + mesh_.ngx(); ++i)
                    fn(mesh_.index(i, j0 + g));
            break;
        }
    }
}

// ---------------------------------------------------------------------------
// Cell pack/unpack
// ---------------------------------------------------------------------------

std::size_t HaloExchange::packedSize(const KineticCell& cell) {
    std::size_t n = 8;  // E, B, phi, psi
    for (const auto& sp : cell.species) {
        n += sp.w.size() + sp.prim.size();
        for (int f = 0; f < sp.pdf.count(); ++f) n += sp.pdf.field(f).size();
    }
    return n;
}

void HaloExchange::packCell(const KineticCell& cell, std::vector<double>& buf, std::size_t& pos) {
    for (double v : cell.field.E) buf[pos++] = v;
    for (double v : cell.field.B) buf[pos++] = v;
    buf[pos++] = cell.field.phi;
    buf[pos++] = cell.field.psi;
    for (const auto& sp : cell.species) {
        for (double v : sp.w) buf[pos++] = v;
        for (double v : sp.prim) buf[pos++] = v;
        for (int f = 0; f < sp.pdf.count(); ++f)
            for (double v : sp.pdf.field(f)) buf[pos++] = v;
    }
}

void HaloExchange::unpackCell(KineticCell& cell, const std::vector<double>& buf, std::size_t& pos) {
    for (double& v : cell.field.E) v = buf[pos++];
    for (double& v : cell.field.B) v = buf[pos++];
    cell.field.phi = buf[pos++];
    cell.field.psi = buf[pos++];
    for (auto& sp : cell.species) {
        for (double& v : sp.w) v = buf[pos++];
        for (double& v : sp.prim) v = buf[pos++];
        for (int f = 0; f < sp.pdf.count(); ++f)
            for (double& v : sp.pdf.field(f)) v = buf[pos++];
    }
}

// ---------------------------------------------------------------------------
// MPI exchange
// ---------------------------------------------------------------------------

void HaloExchange::doExchange(int lowFace, int highFace, std::size_t bufSize) {
    MPI_Request reqs[4];
    MPI_Comm comm = mpi_.comm();
    const int count = static_cast<int>(bufSize);

    MPI_Isend(sendBuf_[lowFace].data(), count, MPI_DOUBLE, mpi_.neighbor(lowFace), 0, comm, &reqs[0]);
    MPI_Irecv(recvBuf_[highFace].data(), count, MPI_DOUBLE, mpi_.neighbor(highFace), 0, comm, &reqs[1]);
    MPI_Isend(sendBuf_[highFace].data(), count, MPI_DOUBLE, mpi_.neighbor(highFace), 1, comm, &reqs[2]);
    MPI_Irecv(recvBuf_[lowFace].data(), count, MPI_DOUBLE, mpi_.neighbor(lowFace), 1, comm, &reqs[3]);

    MPI_Waitall(4, reqs, MPI_STATUSES_IGNORE);
}

void HaloExchange::exchangeDirection(std::vector<KineticCell>& cells, int direction) {
    if (cells.size() != mesh_.totalCells()) {
        throw std::invalid_argument("HaloExchange::exchangeDirection: cell array does not match mesh");
    }
    const int lowFace  = direction * 2;
    const int highFace = direction * 2 + 1;

    // Every cell has the same layout; size the buffers from the first one.
    const std::size_t perCell = packedSize(cells[mesh_.index(0, 0)]);
    const std::size_t bufSize = slabCells(lowFace) * perCell;
    for (int face : {lowFace, highFace}) {
        sendBuf_[face].resize(bufSize);
        recvBuf_[face].resize(bufSize);
    }

    for (int face : {lowFace, highFace}) {
        std::size_t pos = 0;
        forEachSlabCell(face, false, [&](std::size_t idx) { packCell(cells[idx], sendBuf_[face], pos); });
    }

    doExchange(lowFace, highFace, bufSize);

    for (int face : {lowFace, highFace}) {
        if (mpi_.isPhysicalBoundary(face)) continue;
        std::size_t pos = 0;
        forEachSlabCell(face, true, [&](std::size_t idx) { unpackCell(cells[idx], recvBuf_[face], pos); });
    }
}

void HaloExchange::exchange(std::vector<KineticCell>& cells) {
    exchangeDirection(cells, 0);
    if (mesh_.dim() >= 2) exchangeDirection(cells, 1);
}

} // namespace KineticFV

#endif // ENABLE_MPI
