#include "Equilibrium.hpp"
#include "Moments.hpp"
#include "DiatomicGasEOS.hpp"
#include "TestHelpers.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace KineticFV;

namespace {

void maxwellianNormalization() {
    VelocityGrid g = VelocityGrid::create2D(-6.0, 6.0, 60, -6.0, 6.0, 60);
    std::vector<double> M = maxwellian(g, {0.7, 0.1, 0.2, 1.3});
    ASSERT_NEAR(discreteMoment(M, g.weights()), 0.7, 1e-9);
    ASSERT_THROWS(maxwellian(g, {1.0, 1.0}), std::invalid_argument);

    std::vector<double> B = maxwellianInternal({2.0, 4.0}, 3.0, 0.5);
    ASSERT_NEAR(B[0], 6.0, 1e-14);
    ASSERT_NEAR(B[1], 12.0, 1e-14);
}

void relaxationTimes() {
    const double mu = 0.02;
    ASSERT_NEAR(collisionTime(1.0, 1.0, mu, 0.81), 2.0 * mu, 1e-15);
    ASSERT_NEAR(collisionTime({2.0, 0.0, 4.0}, mu, 0.5), 2.0 * mu, 1e-15);
    ASSERT_NEAR(referenceViscosity(0.1, 1.0, 0.5), 0.3125 * std::sqrt(M_PI) * 0.1, 1e-14);
}

void shakhovSingleDistributionIsMassNeutral() {
    VelocityGrid g = VelocityGrid::create1D(-8.0, 8.0, 200);
    const std::vector<double> prim = {1.3, 0.0, 0.9};
    std::vector<double> M = maxwellian(g, prim);
    std::vector<double> S = shakhov(g, M, {0.2}, prim, 2.0 / 3.0);
    ASSERT_NEAR(discreteMoment(S, g.weights()), 0.0, 1e-13);

    // Pr = 1 switches the correction off.
    std::vector<double> S1 = shakhov(g, M, {0.2}, prim, 1.0);
    for (double s : S1) ASSERT_NEAR(s, 0.0, 1e-15);
}

void shakhovSingleDistributionCorrectsHeatFlux() {
    const double Pr = 2.0 / 3.0;
    const std::vector<VelocityGrid> grids = {
        VelocityGrid::create1D(-6.0, 6.0, 48),
        VelocityGrid::create2D(-6.0, 6.0, 32, -6.0, 6.0, 32),
        VelocityGrid::create3D(-6.0, 6.0, 24, -6.0, 6.0, 24, -6.0, 6.0, 24)};
    const std::vector<std::vector<double>> prims = {
        {1.3, 0.1, 0.9},
        {1.3, 0.1, -0.2, 0.9},
        {1.3, 0.1, -0.2, 0.05, 0.9}};
    const std::vector<double> qAll = {0.15, -0.05, 0.08};

    for (std::size_t k = 0; k < grids.size(); ++k) {
        const VelocityGrid& g = grids[k];
        const std::vector<double>& prim = prims[k];
        const std::vector<double> q(qAll.begin(), qAll.begin() + g.dim());

        DistributionSet corr;
        corr.model = DistributionModel::Monatomic;
        corr.h = shakhov(g, maxwellian(g, prim), q, prim, Pr);

        std::vector<double> w = conservedMoments(corr, g);
        for (double v : w) ASSERT_NEAR(v, 0.0, 1e-12);

        std::vector<double> qS = heatFlux(corr, prim, g);
        ASSERT_TRUE(static_cast<int>(qS.size()) == g.dim());
        for (int d = 0; d < g.dim(); ++d) {
            ASSERT_NEAR(qS[d], (1.0 - Pr) * q[d], 1e-9);
        }
    }
}

void shakhovPairCorrectsHeatFlux() {
    VelocityGrid g = VelocityGrid::create1D(-8.0, 8.0, 200);
    const std::vector<double> prim = {1.3, 0.0, 0.9};
    const double K = 2.0;
    const double Pr = 2.0 / 3.0;
    const double q = 0.15;

    std::vector<double> MH = maxwellian(g, prim);
    std::vector<double> MB = maxwellianInternal(MH, K, prim.back());
    ShakhovCorrection S = shakhov(g, MH, MB, {q}, prim, Pr, K);

    ASSERT_NEAR(discreteMoment(S.SH, g.weights()), 0.0, 1e-13);

    DistributionSet corr;
    corr.model = DistributionModel::InternalEnergy;
    corr.h = S.SH;
    corr.b = S.SB;
    std::vector<double> w = conservedMoments(corr, g);
    ASSERT_NEAR(w[0], 0.0, 1e-13);
    ASSERT_NEAR(w[2], 0.0, 1e-13);

    // The target carries (1 - Pr) of the current heat flux.
    ASSERT_NEAR(heatFlux(corr, prim, g)[0], (1.0 - Pr) * q, 1e-9);
}

void rykovCorrectionsAreMassNeutral() {
    VelocityGrid g = VelocityGrid::create1D(-8.0, 8.0, 200);
    const double K = 0.0;
    RykovParams params;
    DiatomicGasEOS eos(K, params.Kr);
    const std::vector<double> prim = {1.0, 0.0, 0.6, 0.8};
    const double lambdaT = eos.translationalLambda(prim);

    RykovEquilibrium M = rykovMaxwellian(g, prim, lambdaT, K, params.Kr);
    ASSERT_NEAR(discreteMoment(M.HT, g.weights()), 1.0, 1e-10);
    ASSERT_NEAR(discreteMoment(M.HR, g.weights()), 1.0, 1e-10);
    // R_T carries the rotational temperature, R_R the common one.
    ASSERT_NEAR(discreteMoment(M.RT, g.weights()), params.Kr / (2.0 * 0.8), 1e-10);
    ASSERT_NEAR(discreteMoment(M.RR, g.weights()), params.Kr / (2.0 * 0.6), 1e-10);

    RykovCorrection S = rykov(g, M, {0.1, 0.05}, prim, lambdaT, 2.0 / 3.0, K, params);
    ASSERT_NEAR(discreteMoment(S.SHT, g.weights()), 0.0, 1e-13);
    ASSERT_NEAR(discreteMoment(S.SHR, g.weights()), 0.0, 1e-13);

    ASSERT_THROWS(rykovMaxwellian(g, {1.0, 0.0, 0.5}, 0.5, K, params.Kr), std::invalid_argument);
}

void rotationalCollisionNumber() {
    const RykovParams params;
    const double high = rykovZr(1e8, params.T0, params.Z0);
    ASSERT_NEAR(high, params.Z0, 1e-2 * params.Z0);
    ASSERT_TRUE(high < params.Z0);

    ASSERT_TRUE(rykovZr(1.0, params.T0, params.Z0) < rykovZr(2.0, params.T0, params.Z0));
    ASSERT_TRUE(rykovZr(2.0, params.T0, params.Z0) < rykovZr(10.0, params.T0, params.Z0));
    ASSERT_TRUE(rykovZr(1.0, params.T0, params.Z0) > 0.0);
}

void mixtureRelaxationTimesAndTargets() {
    MixtureParams p;
    p.mi = 1.0;
    p.me = 1.0;
    p.ni = 0.5;
    p.ne = 0.5;
    p.Kn = 1.0;

    const std::vector<std::vector<double>> same = {{1.0, 0.0, 1.0}, {1.0, 0.0, 1.0}};
    auto tau = mixtureCollisionTime(same, p);
    ASSERT_TRUE(tau[0] > 0.0);
    ASSERT_NEAR(tau[0], tau[1], 1e-14);

    auto mix = mixturePrimitive(same, tau, p);
    for (int s = 0; s < 2; ++s) {
        for (int i = 0; i < 3; ++i) ASSERT_NEAR(mix[s][i], same[s][i], 1e-14);
    }

    // A hot and a cold component move toward each other, density untouched.
    const std::vector<std::vector<double>> prim = {{1.0, 0.2, 0.5}, {0.6, -0.1, 1.0}};
    tau = mixtureCollisionTime(prim, p);
    mix = mixturePrimitive(prim, tau, p);
    ASSERT_NEAR(mix[0][0], 1.0, 1e-15);
    ASSERT_NEAR(mix[1][0], 0.6, 1e-15);
    ASSERT_TRUE(mix[0][1] < 0.2 && mix[0][1] > -0.1);
    ASSERT_TRUE(mix[1][1] > -0.1 && mix[1][1] < 0.2);

    ASSERT_THROWS(mixtureCollisionTime({{1.0, 0.0, 1.0}}, p), std::invalid_argument);
}

} // namespace

int main() {
    RUN_TEST(maxwellianNormalization);
    RUN_TEST(relaxationTimes);
    RUN_TEST(shakhovSingleDistributionIsMassNeutral);
    RUN_TEST(shakhovSingleDistributionCorrectsHeatFlux);
    RUN_TEST(shakhovPairCorrectsHeatFlux);
    RUN_TEST(rykovCorrectionsAreMassNeutral);
    RUN_TEST(rotationalCollisionNumber);
    RUN_TEST(mixtureRelaxationTimesAndTargets);
    return KineticFV::test::testSummary();
}
