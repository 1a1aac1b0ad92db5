#include "Moments.hpp"
#include "Equilibrium.hpp"
#include "IdealGasEOS.hpp"
#include "EquationOfState.hpp"
#include "TestHelpers.hpp"

#include <stdexcept>
#include <vector>

using namespace KineticFV;

namespace {

const std::vector<double> kPrim = {1.0, 0.3, 0.8};

void gaussMomentsMatchQuadrature() {
    VelocityGrid g = VelocityGrid::create1D(-8.0, 8.0, 400);
    std::vector<double> M = maxwellian(g, kPrim);
    GaussMoments G = gaussMoments(kPrim);

    for (int n = 0; n < 7; ++n) {
        ASSERT_NEAR(G.Mu[n], discreteMoment(M, g.u(), g.weights(), n), 1e-9);
        ASSERT_NEAR(G.MuL[n] + G.MuR[n], G.Mu[n], 1e-12);
    }

    // Half-range sums only see a kink at u = 0, so they converge at second order.
    std::vector<double> right(M.size(), 0.0);
    for (std::size_t i = 0; i < M.size(); ++i) {
        if (g.u()[i] > 0.0) right[i] = M[i];
    }
    ASSERT_NEAR(G.MuL[0], discreteMoment(right, g.weights()), 1e-3);
    ASSERT_NEAR(G.MuL[1], discreteMoment(right, g.u(), g.weights(), 1), 1e-3);
    ASSERT_TRUE(G.nVelocity == 1);
    ASSERT_FALSE(G.hasInternal);
}

void gaussMomentsInternalAndTransverse() {
    GaussMoments G = gaussMoments({1.0, 0.3, -0.2, 0.8}, 2.0);
    ASSERT_TRUE(G.nVelocity == 2);
    ASSERT_TRUE(G.hasInternal);
    ASSERT_NEAR(G.Mv[1], -0.2, 1e-15);
    ASSERT_NEAR(G.Mv[2], 0.04 + 0.5 / 0.8, 1e-14);
    ASSERT_NEAR(G.Mxi[1], 1.0 / 0.8, 1e-14);
    ASSERT_NEAR(G.Mxi[2], 8.0 / (4.0 * 0.64), 1e-14);

    ASSERT_THROWS(gaussMoments({1.0, 0.5}), std::invalid_argument);
}

void momentsConserveGivesSpecificConservedState() {
    const double K = 2.0;
    GaussMoments G = gaussMoments(kPrim, K);
    std::vector<double> m = momentsConserve(G.Mu, G.Mxi, 0, 0);
    std::vector<double> w = conservedFromPrimitive(kPrim, 5.0 / 3.0);
    for (int i = 0; i < 3; ++i) {
        ASSERT_NEAR(m[i], w[i] / kPrim[0], 1e-12);
    }

    // A constant slope a = (1, 0, 0) reproduces the plain moment.
    std::vector<double> s = momentsConserveSlope({1.0, 0.0, 0.0}, G.Mu, G.Mxi, 1);
    std::vector<double> m1 = momentsConserve(G.Mu, G.Mxi, 1, 0);
    for (int i = 0; i < 3; ++i) {
        ASSERT_NEAR(s[i], m1[i], 1e-14);
    }
}

void conservedMomentsOfInternalEnergyEquilibrium() {
    const double gamma = 5.0 / 3.0;
    const double K = internalDofFromGamma(gamma, 1);
    ASSERT_NEAR(K, 2.0, 1e-14);

    VelocityGrid g = VelocityGrid::create1D(-8.0, 8.0, 400);
    DistributionSet pdf;
    pdf.model = DistributionModel::InternalEnergy;
    pdf.h = maxwellian(g, kPrim);
    pdf.b = maxwellianInternal(pdf.h, K, kPrim.back());

    std::vector<double> w = conservedMoments(pdf, g);
    std::vector<double> expected = conservedFromPrimitive(kPrim, gamma);
    ASSERT_TRUE(w.size() == 3);
    for (int i = 0; i < 3; ++i) {
        ASSERT_NEAR(w[i], expected[i], 1e-9);
    }

    ASSERT_NEAR(pressure(kPrim), 0.5 / 0.8, 1e-15);
    ASSERT_NEAR(pressure(pdf, kPrim, g, K), pressure(kPrim), 1e-9);

    std::vector<double> q = heatFlux(pdf, kPrim, g);
    ASSERT_TRUE(q.size() == 1);
    ASSERT_NEAR(q[0], 0.0, 1e-9);
}

void conservedMomentsTwoDimensional() {
    const std::vector<double> prim = {1.2, 0.2, -0.1, 1.5};
    VelocityGrid g = VelocityGrid::create2D(-6.0, 6.0, 80, -6.0, 6.0, 80);
    DistributionSet pdf;
    pdf.model = DistributionModel::Monatomic;
    pdf.h = maxwellian(g, prim);

    std::vector<double> w = conservedMoments(pdf, g);
    ASSERT_TRUE(w.size() == 4);
    ASSERT_NEAR(w[0], 1.2, 1e-9);
    ASSERT_NEAR(w[1], 1.2 * 0.2, 1e-9);
    ASSERT_NEAR(w[2], -1.2 * 0.1, 1e-9);
    ASSERT_NEAR(w[3], 0.5 * 1.2 * (0.05 + 1.0 / 1.5), 1e-9);

    // Isotropic stress: P = p I.
    std::vector<double> P = stress(pdf.h, prim, g);
    ASSERT_NEAR(P[0], pressure(prim), 1e-9);
    ASSERT_NEAR(P[3], pressure(prim), 1e-9);
    ASSERT_NEAR(P[1], 0.0, 1e-9);
    ASSERT_NEAR(P[1], P[2], 1e-15);
}

void unsupportedLayoutThrows() {
    VelocityGrid g = VelocityGrid::create2D(-4.0, 4.0, 8, -4.0, 4.0, 8);
    DistributionSet pdf(DistributionModel::PlasmaFourMoment, g.size());
    ASSERT_THROWS(conservedMoments(pdf, g), std::invalid_argument);
}

} // namespace

int main() {
    RUN_TEST(gaussMomentsMatchQuadrature);
    RUN_TEST(gaussMomentsInternalAndTransverse);
    RUN_TEST(momentsConserveGivesSpecificConservedState);
    RUN_TEST(conservedMomentsOfInternalEnergyEquilibrium);
    RUN_TEST(conservedMomentsTwoDimensional);
    RUN_TEST(unsupportedLayoutThrows);
    return KineticFV::test::testSummary();
}
