#include "ElectromagneticCoupling.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace KineticFV;

namespace {

MixtureParams mixture() {
    MixtureParams p;
    p.mi = 1.0;
    p.me = 0.25;
    p.ni = 1.0;
    p.ne = 1.0;
    p.Kn = 0.1;
    return p;
}

PlasmaParams plasma() {
    PlasmaParams p;
    p.debyeLength = 0.1;
    p.larmorRadius = 0.1;
    return p;
}

const std::vector<std::vector<double>> kMoving = {
    {1.0, 0.2, -0.1, 0.05, 0.5},
    {0.25, -0.3, 0.2, 0.1, 0.125},
};

void zeroStateGivesZeroSolution() {
    const std::vector<std::vector<double>> rest = {
        {1.0, 0.0, 0.0, 0.0, 0.5}, {0.25, 0.0, 0.0, 0.0, 0.125}};
    FieldVelocitySystem sys = emCoefficients(rest, {0.0, 0.0, 0.0}, {0.75, 1.0, 0.0},
                                             mixture(), plasma(), 1e-2);
    Eigen::Matrix<double, 9, 1> x = solveFieldVelocity(sys);
    ASSERT_NEAR(x.norm(), 0.0, 1e-14);
}

void solutionSatisfiesTheSystem() {
    FieldVelocitySystem sys = emCoefficients(kMoving, {0.1, -0.2, 0.3}, {0.75, 1.0, -0.5},
                                             mixture(), plasma(), 5e-3);
    Eigen::Matrix<double, 9, 1> x = solveFieldVelocity(sys);
    ASSERT_TRUE(x.allFinite());
    ASSERT_NEAR((sys.A * x - sys.b).norm(), 0.0, 1e-10);
}

void vanishingStepKeepsOldState() {
    const std::array<double, 3> E = {0.1, -0.2, 0.3};
    FieldVelocitySystem sys = emCoefficients(kMoving, E, {0.75, 1.0, -0.5},
                                             mixture(), plasma(), 1e-12);
    Eigen::Matrix<double, 9, 1> x = solveFieldVelocity(sys);
    for (int d = 0; d < 3; ++d) {
        ASSERT_NEAR(x[d], E[d], 1e-9);
        ASSERT_NEAR(x[3 + d], kMoving[0][d + 1], 1e-9);
        ASSERT_NEAR(x[6 + d], kMoving[1][d + 1], 1e-9);
    }
}

void singularSystemThrows() {
    FieldVelocitySystem sys;
    sys.A.setZero();
    sys.b.setOnes();
    ASSERT_THROWS(solveFieldVelocity(sys), std::runtime_error);

    ASSERT_THROWS(emCoefficients({{1.0, 0.0, 0.5}}, {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0},
                                 mixture(), plasma(), 1e-3),
                  std::invalid_argument);
}

void lorentzForceOfVanishingFields() {
    Eigen::Matrix<double, 9, 1> x = Eigen::Matrix<double, 9, 1>::Zero();
    for (int d = 0; d < 3; ++d) {
        x[3 + d] = kMoving[0][d + 1];
        x[6 + d] = kMoving[1][d + 1];
    }
    auto F = lorentzForce(kMoving, {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}, x, mixture(), plasma());
    for (int d = 0; d < 3; ++d) {
        ASSERT_NEAR(F[0][d], 0.0, 1e-15);
        ASSERT_NEAR(F[1][d], 0.0, 1e-15);
    }

    // A pure electric field pushes ions along E and electrons against it,
    // with the electron response scaled by the mass ratio.
    Eigen::Matrix<double, 9, 1> xe = Eigen::Matrix<double, 9, 1>::Zero();
    xe[0] = 0.2;
    const std::vector<std::vector<double>> rest = {
        {1.0, 0.0, 0.0, 0.0, 0.5}, {0.25, 0.0, 0.0, 0.0, 0.125}};
    auto Fe = lorentzForce(rest, {0.2, 0.0, 0.0}, {0.0, 0.0, 0.0}, xe, mixture(), plasma());
    ASSERT_NEAR(Fe[0][0], 0.2 / 0.1, 1e-14);
    ASSERT_NEAR(Fe[1][0], -4.0 * 0.2 / 0.1, 1e-14);
}

std::vector<double> bump(std::size_t n, double centre, double halfWidth) {
    std::vector<double> f(n, 0.0);
    for (std::size_t k = 0; k < n; ++k) {
        const double x = (static_cast<double>(k) - centre) / halfWidth;
        f[k] = std::max(0.0, 1.0 - x * x);
    }
    return f;
}

double mean(const std::vector<double>& f, double du) {
    double m0 = 0.0, m1 = 0.0;
    for (std::size_t k = 0; k < f.size(); ++k) {
        m0 += f[k];
        m1 += f[k] * du * static_cast<double>(k);
    }
    return m1 / m0;
}

double total(const std::vector<double>& f) {
    return std::accumulate(f.begin(), f.end(), 0.0);
}

void integerShiftMovesNodes() {
    std::vector<double> f = bump(40, 15.0, 5.0);
    const std::vector<double> f0 = f;
    shiftPdf(f, 1.0, 0.5, 1.0);  // distance 1.0 = two nodes
    for (std::size_t k = 2; k < f.size(); ++k) {
        ASSERT_NEAR(f[k], f0[k - 2], 1e-15);
    }
    ASSERT_NEAR(f[0], 0.0, 1e-15);
    ASSERT_NEAR(f[1], 0.0, 1e-15);

    std::vector<double> g = f0;
    shiftPdf(g, -1.0, 0.5, 1.0);
    for (std::size_t k = 0; k + 2 < g.size(); ++k) {
        ASSERT_NEAR(g[k], f0[k + 2], 1e-15);
    }
}

void fractionalShiftConservesMassAndMovesTheMean() {
    const double du = 0.5;
    const double dt = 1.3;
    std::vector<double> f = bump(40, 15.0, 5.0);
    const double mass0 = total(f);
    const double mean0 = mean(f, du);

    shiftPdf(f, 1.0, du, dt);
    ASSERT_NEAR(total(f), mass0, 1e-12);
    ASSERT_NEAR(mean(f, du), mean0 + dt, 1e-12);
    for (double v : f) ASSERT_TRUE(v >= 0.0);

    std::vector<double> g = bump(40, 24.0, 5.0);
    const double meanG = mean(g, du);
    shiftPdf(g, -1.0, du, dt);
    ASSERT_NEAR(total(g), mass0, 1e-12);
    ASSERT_NEAR(mean(g, du), meanG - dt, 1e-12);
}

void stridedShiftTouchesOneLine() {
    // 3 x 4 array, shift the column i = 1 (stride 3) by one node.
    std::vector<double> f(12);
    for (std::size_t k = 0; k < f.size(); ++k) f[k] = static_cast<double>(k);
    shiftPdf(f, 1, 4, 3, 1.0, 1.0, 1.0);
    ASSERT_NEAR(f[1], 0.0, 1e-15);
    ASSERT_NEAR(f[4], 1.0, 1e-15);
    ASSERT_NEAR(f[7], 4.0, 1e-15);
    ASSERT_NEAR(f[10], 7.0, 1e-15);
    ASSERT_NEAR(f[0], 0.0, 1e-15);
    ASSERT_NEAR(f[2], 2.0, 1e-15);

    // Shifting past the end of the line empties it.
    std::vector<double> g(5, 1.0);
    shiftPdf(g, 1.0, 1.0, 10.0);
    ASSERT_NEAR(total(g), 0.0, 1e-15);

    ASSERT_THROWS(shiftPdf(g, 1.0, 0.0, 1.0), std::invalid_argument);
}

} // namespace

int main() {
    RUN_TEST(zeroStateGivesZeroSolution);
    RUN_TEST(solutionSatisfiesTheSystem);
    RUN_TEST(vanishingStepKeepsOldState);
    RUN_TEST(singularSystemThrows);
    RUN_TEST(lorentzForceOfVanishingFields);
    RUN_TEST(integerShiftMovesNodes);
    RUN_TEST(fractionalShiftConservesMassAndMovesTheMean);
    RUN_TEST(stridedShiftTouchesOneLine);
    return KineticFV::test::testSummary();
}
