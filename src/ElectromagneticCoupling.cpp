#include "ElectromagneticCoupling.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace KineticFV {

namespace {

// C(B) u = u x B
Eigen::Matrix3d crossMatrix(const Vector3& B) {
    Eigen::Matrix3d C;
    C <<  0.0,   B[2], -B[1],
         -B[2],  0.0,   B[0],
          B[1], -B[0],  0.0;
    return C;
}

Eigen::Vector3d bulkVelocity(const std::vector<double>& prim) {
    return Eigen::Vector3d(prim[1], prim[2], prim[3]);
}

void checkPlasmaPrim(const std::vector<std::vector<double>>& prim, const char* where) {
    if (prim.size() != 2 || prim[0].size() != 5 || prim[1].size() != 5) {
        throw std::invalid_argument(std::string(where) +
                                    ": expected two species with (rho, U, V, W, lambda)");
    }
}

} // namespace

FieldVelocitySystem emCoefficients(const std::vector<std::vector<double>>& prim,
                                   const Vector3& E, const Vector3& B,
                                   const MixtureParams& mixture,
                                   const PlasmaParams& plasma, double dt) {
    checkPlasmaPrim(prim, "emCoefficients");

    const double h = 0.5 * dt;
    const double rL = plasma.larmorRadius;
    const double lD = plasma.debyeLength;
    const double mr = mixture.mi / mixture.me;
    const double ni = prim[0][0] / mixture.mi;
    const double ne = prim[1][0] / mixture.me;

    const double cE = h / (lD * lD * rL);
    const double cI = h / rL;
    const double cEl = h * mr / rL;

    const Eigen::Matrix3d I = Eigen::Matrix3d::Identity();
    const Eigen::Matrix3d C = crossMatrix(B);
    const Eigen::Vector3d E0(E[0], E[1], E[2]);
    const Eigen::Vector3d ui = bulkVelocity(prim[0]);
    const Eigen::Vector3d ue = bulkVelocity(prim[1]);

    FieldVelocitySystem sys;
    sys.A.setZero();

    // Ampere: E' + cE (ni ui' - ne ue') = E - cE (ni ui - ne ue)
    sys.A.block<3, 3>(0, 0) = I;
    sys.A.block<3, 3>(0, 3) = cE * ni * I;
    sys.A.block<3, 3>(0, 6) = -cE * ne * I;
    sys.b.segment<3>(0) = E0 - cE * (ni * ui - ne * ue);

    // Ions: ui' - cI (E' + ui' x B) = ui + cI (E + ui x B)
    sys.A.block<3, 3>(3, 0) = -cI * I;
    sys.A.block<3, 3>(3, 3) = I - cI * C;
    sys.b.segment<3>(3) = ui + cI * (E0 + C * ui);

    // Electrons carry the opposite charge and mr times the specific charge.
    sys.A.block<3, 3>(6, 0) = cEl * I;
    sys.A.block<3, 3>(6, 6) = I + cEl * C;
    sys.b.segment<3>(6) = ue - cEl * (E0 + C * ue);

    return sys;
}

Eigen::Matrix<double, 9, 1> solveFieldVelocity(const FieldVelocitySystem& system) {
    Eigen::Matrix<double, 9, 1> x = system.A.partialPivLu().solve(system.b);
    if (!x.allFinite()) {
        throw std::runtime_error("solveFieldVelocity: field/velocity system is singular");
    }
    return x;
}

std::array<Vector3, 2> lorentzForce(const std::vector<std::vector<double>>& prim,
                                    const Vector3& E, const Vector3& B,
                                    const Eigen::Matrix<double, 9, 1>& x,
                                    const MixtureParams& mixture,
                                    const PlasmaParams& plasma) {
    checkPlasmaPrim(prim, "lorentzForce");

    const double rL = plasma.larmorRadius;
    const double mr = mixture.mi / mixture.me;
    const Eigen::Matrix3d C = crossMatrix(B);
    const Eigen::Vector3d Ec = Eigen::Vector3d(E[0], E[1], E[2]) + x.segment<3>(0);

    const Eigen::Vector3d fi = 0.5 * (Ec + C * (bulkVelocity(prim[0]) + x.segment<3>(3))) / rL;
    const Eigen::Vector3d fe = -0.5 * (Ec + C * (bulkVelocity(prim[1]) + x.segment<3>(6))) * mr / rL;

    return {Vector3{fi[0], fi[1], fi[2]}, Vector3{fe[0], fe[1], fe[2]}};
}

void shiftPdf(std::vector<double>& f, std::size_t offset, std::size_t n, std::size_t stride,
              double a, double du, double dt) {
    if (n == 0) return;
    if (du <= 0.0) {
        throw std::invalid_argument("shiftPdf: velocity spacing must be positive");
    }

    auto at = [&](std::size_t k) -> double& { return f[offset + k * stride]; };
    const double distance = std::abs(a) * dt;
    const std::size_t shift = static_cast<std::size_t>(std::floor(distance / du));
    const double frac = (distance - du * static_cast<double>(shift)) / du;

    if (shift >= n) {
        for (std::size_t k = 0; k < n; ++k) at(k) = 0.0;
        return;
    }

    if (a > 0.0) {
        for (std::size_t k = n; k-- > shift;) at(k) = at(k - shift);
        for (std::size_t k = 0; k < shift; ++k) at(k) = 0.0;
        for (std::size_t k = n - 1; k >= 1; --k) at(k) += frac * (at(k - 1) - at(k));
        at(0) -= frac * at(0);
    } else {
        for (std::size_t k = 0; k + shift < n; ++k) at(k) = at(k + shift);
        for (std::size_t k = n - shift; k < n; ++k) at(k) = 0.0;
        for (std::size_t k = 0; k + 1 < n; ++k) at(k) += frac * (at(k + 1) - at(k));
        at(n - 1) -= frac * at(n - 1);
    }
}

void shiftPdf(std::vector<double>& f, double a, double du, double dt) {
    shiftPdf(f, 0, f.size(), 1, a, du, dt);
}

} // namespace KineticFV
