#include "VelocitySpace.hpp"
#include "TestHelpers.hpp"

#include <numeric>
#include <stdexcept>

using namespace KineticFV;

namespace {

double weightSum(const VelocityGrid& g) {
    return std::accumulate(g.weights().begin(), g.weights().end(), 0.0);
}

void rectangleWeightsCoverTheBox() {
    VelocityGrid g1 = VelocityGrid::create1D(-5.0, 5.0, 20);
    ASSERT_NEAR(weightSum(g1), 10.0, 1e-12);
    ASSERT_TRUE(g1.size() == 20);

    VelocityGrid g2 = VelocityGrid::create2D(-5.0, 5.0, 12, -3.0, 3.0, 8);
    ASSERT_NEAR(weightSum(g2), 60.0, 1e-12);
    ASSERT_TRUE(g2.size() == 96);
    ASSERT_TRUE(g2.dim() == 2);

    VelocityGrid g3 = VelocityGrid::create3D(-1.0, 1.0, 4, -2.0, 2.0, 6, -3.0, 3.0, 8);
    ASSERT_NEAR(weightSum(g3), 48.0, 1e-12);
    ASSERT_TRUE(g3.size() == 4 * 6 * 8);
}

void flatIndexIsFirstAxisFastest() {
    VelocityGrid g = VelocityGrid::create2D(-1.0, 1.0, 4, -2.0, 2.0, 3);
    const std::size_t idx = g.index(2, 1);
    ASSERT_TRUE(idx == 6);
    ASSERT_NEAR(g.u()[idx], 0.25, 1e-14);
    ASSERT_NEAR(g.v()[idx], 0.0, 1e-14);
    ASSERT_NEAR(g.du()[idx], 0.5, 1e-14);
    ASSERT_NEAR(g.dv()[idx], 4.0 / 3.0, 1e-14);
}

void newtonCotesWeights() {
    // 9 nodes of width 10/9: two Boole panels over (n - 1) widths.
    VelocityGrid g = VelocityGrid::create1D(-5.0, 5.0, 9, QuadratureRule::NewtonCotes);
    const double width = 10.0 / 9.0;
    ASSERT_NEAR(weightSum(g), 8.0 * width, 1e-12);
    ASSERT_NEAR(g.weights().front(), 14.0 / 45.0 * width, 1e-14);
    ASSERT_NEAR(g.weights().back(), 14.0 / 45.0 * width, 1e-14);
    ASSERT_NEAR(g.weights()[4], 28.0 / 45.0 * width, 1e-14);

    ASSERT_NEAR(newtonCotesCoefficient(1, 13), 14.0 / 45.0, 1e-15);
    ASSERT_NEAR(newtonCotesCoefficient(2, 13), 64.0 / 45.0, 1e-15);
    ASSERT_NEAR(newtonCotesCoefficient(3, 13), 24.0 / 45.0, 1e-15);
    ASSERT_NEAR(newtonCotesCoefficient(13, 13), 14.0 / 45.0, 1e-15);
}

void quadratureRuleNames() {
    ASSERT_TRUE(parseQuadratureRule("rectangle") == QuadratureRule::Rectangle);
    ASSERT_TRUE(parseQuadratureRule("Newton") == QuadratureRule::NewtonCotes);
    ASSERT_TRUE(parseQuadratureRule("GAUSS") == QuadratureRule::Gauss);
    ASSERT_THROWS(parseQuadratureRule("simpson"), std::invalid_argument);
}

void gaussRuleIsRejected() {
    ASSERT_THROWS(VelocityGrid::create1D(-5.0, 5.0, 10, QuadratureRule::Gauss), std::runtime_error);
}

void invalidAxesThrow() {
    ASSERT_THROWS(VelocityGrid::create1D(-5.0, 5.0, 0), std::invalid_argument);
    ASSERT_THROWS(VelocityGrid::create1D(5.0, -5.0, 10), std::invalid_argument);
    ASSERT_THROWS(VelocityGrid(std::vector<VelocityAxis>{}, QuadratureRule::Rectangle),
                  std::invalid_argument);
}

void maxSpeedAndGhostNodes() {
    VelocityGrid g = VelocityGrid::create1D(-5.0, 5.0, 50);
    ASSERT_NEAR(g.maxSpeed(0), 4.9, 1e-12);

    VelocityGrid ghost = VelocityGrid::create1D(-5.0, 5.0, 10, QuadratureRule::Rectangle, 2);
    ASSERT_TRUE(ghost.size() == 14);
    ASSERT_NEAR(ghost.u().front(), -6.5, 1e-12);
    ASSERT_NEAR(ghost.u().back(), 6.5, 1e-12);
    ASSERT_NEAR(ghost.u()[2], -4.5, 1e-12);
}

void speciesGridsShareNodeCounts() {
    std::vector<VelocityGrid> grids = createSpeciesGrids(
        {VelocityAxis{-5.0, 5.0, 32, 0}}, {VelocityAxis{-10.0, 10.0, 32, 0}},
        QuadratureRule::Rectangle);
    ASSERT_TRUE(grids.size() == 2);
    ASSERT_TRUE(grids[0].size() == grids[1].size());
    ASSERT_NEAR(weightSum(grids[1]), 20.0, 1e-12);

    ASSERT_THROWS(createSpeciesGrids({VelocityAxis{-5.0, 5.0, 32, 0}},
                                     {VelocityAxis{-5.0, 5.0, 16, 0}},
                                     QuadratureRule::Rectangle),
                  std::invalid_argument);
}

} // namespace

int main() {
    RUN_TEST(rectangleWeightsCoverTheBox);
    RUN_TEST(flatIndexIsFirstAxisFastest);
    RUN_TEST(newtonCotesWeights);
    RUN_TEST(quadratureRuleNames);
    RUN_TEST(gaussRuleIsRejected);
    RUN_TEST(invalidAxesThrow);
    RUN_TEST(maxSpeedAndGhostNodes);
    RUN_TEST(speciesGridsShareNodeCounts);
    return KineticFV::test::testSummary();
}
