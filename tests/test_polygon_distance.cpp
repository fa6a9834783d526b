#include <gtest/gtest.h>
#include <cmath>
#include <utility>
#include <vector>

#include "common/polygon_distance.hpp"
#include "test_shapes.hpp"

using namespace FootprintDistance;
using namespace FootprintTest;

namespace {

std::vector<std::pair<Polygon, Polygon>> samplePairs() {
    return {
        { square(), notched() },
        { square(), roofed() },
        { concave(), irregular() },
        { triangle(), triangleTranslated() },
        { squareExtendedManyVertices(), squareCw() },
    };
}

} // namespace

TEST(PolygonDistanceTest, TranslatedTriangle) {
    Polygon a = triangle();
    Polygon b = triangleTranslated();

    EXPECT_NEAR(hausdorff(a, b), std::sqrt(2.0), 1e-12);

    // directed means: (sqrt2 + 1 + 1) / 3 and (1 + sqrt2 + 1.4) / 3
    const double expected = (4.4 + 2.0 * std::sqrt(2.0)) / 6.0;
    EXPECT_NEAR(chamfer(a, b), expected, 1e-12);
    EXPECT_NEAR(polis(a, b), expected, 1e-12);

    for (double d : { hausdorff(a, b), chamfer(a, b), polis(a, b) }) {
        EXPECT_GT(d, 0.0);
        EXPECT_TRUE(std::isfinite(d));
    }
}

TEST(PolygonDistanceTest, TranslatedTriangleVertexSets) {
    PointSetOptions opt;
    opt.nearest = NearestTarget::Vertices;
    EXPECT_NEAR(hausdorff(triangle(), triangleTranslated(), opt), std::sqrt(2.0), 1e-12);
    EXPECT_NEAR(chamfer(triangle(), triangleTranslated(), ChamferNormalization::Average,
                        NearestTarget::Vertices), std::sqrt(2.0), 1e-12);
}

TEST(PolygonDistanceTest, Symmetric) {
    for (const auto& [a, b] : samplePairs()) {
        EXPECT_DOUBLE_EQ(hausdorff(a, b), hausdorff(b, a));
        EXPECT_DOUBLE_EQ(chamfer(a, b), chamfer(b, a));
        EXPECT_DOUBLE_EQ(chamfer(a, b, ChamferNormalization::Sum), chamfer(b, a, ChamferNormalization::Sum));
        EXPECT_DOUBLE_EQ(polis(a, b), polis(b, a));
    }
}

TEST(PolygonDistanceTest, SelfDistanceIsZero) {
    for (const Polygon& p : { square(), notched(), concave(), irregular(), triangle() }) {
        EXPECT_EQ(hausdorff(p, p), 0.0);
        EXPECT_EQ(chamfer(p, p), 0.0);
        EXPECT_EQ(polis(p, p), 0.0);
    }
}

TEST(PolygonDistanceTest, SumIsTwiceAverage) {
    for (const auto& [a, b] : samplePairs()) {
        EXPECT_NEAR(chamfer(a, b, ChamferNormalization::Sum), 2.0 * chamfer(a, b), 1e-12);
    }
}

TEST(PolygonDistanceTest, Symmetrisation) {
    EXPECT_DOUBLE_EQ(symmetrise(1.0, 3.0, Symmetrisation::Min), 1.0);
    EXPECT_DOUBLE_EQ(symmetrise(1.0, 3.0, Symmetrisation::Max), 3.0);
    EXPECT_DOUBLE_EQ(symmetrise(1.0, 3.0, Symmetrisation::Average), 2.0);
}

TEST(PolygonDistanceTest, HausdorffMinIsZeroWhenVerticesAreShared) {
    PointSetOptions opt;
    opt.symmetrise = Symmetrisation::Min;
    EXPECT_EQ(hausdorff(square(), notched(), opt), 0.0);
    opt.nearest = NearestTarget::Vertices;
    EXPECT_EQ(hausdorff(square(), notched(), opt), 0.0);
}

TEST(PolygonDistanceTest, HausdorffIsWorstVertex) {
    // the notch top sits 1 above the square
    EXPECT_DOUBLE_EQ(directedHausdorff(notched(), square()), 1.0);
    EXPECT_DOUBLE_EQ(directedHausdorff(square(), notched()), 0.0);
    EXPECT_DOUBLE_EQ(hausdorff(square(), notched()), 1.0);
}

TEST(PolygonDistanceTest, VertexSetsAreNeverCloserThanBoundary) {
    for (const auto& [a, b] : samplePairs()) {
        PointSetOptions opt;
        opt.nearest = NearestTarget::Vertices;
        EXPECT_GE(hausdorff(a, b, opt) + 1e-12, hausdorff(a, b));
        EXPECT_GE(chamfer(a, b, ChamferNormalization::Average, NearestTarget::Vertices) + 1e-12, chamfer(a, b));
    }
}

TEST(PolygonDistanceTest, ChamferOverVerticesOfDenserRing) {
    // every vertex of the square is also a vertex of the denser ring
    EXPECT_EQ(directedChamfer(square(), squareMoreVerticesCw(), NearestTarget::Vertices), 0.0);
    EXPECT_EQ(directedChamfer(square(), squareDifferentStart(), NearestTarget::Vertices), 0.0);
    EXPECT_GT(directedChamfer(squareMoreVerticesCw(), square(), NearestTarget::Vertices), 0.0);
    EXPECT_NEAR(directedChamfer(squareMoreVerticesCw(), square()), 0.0, 1e-12);
}

TEST(PolygonDistanceTest, PolisMeasuresAgainstEdges) {
    // extra vertices lie on the square's edges, not on its vertices
    EXPECT_NEAR(polis(square(), squareMoreVerticesCw()), 0.0, 1e-12);
}

TEST(PolygonDistanceTest, PolisOfExtendedSquare) {
    EXPECT_NEAR(polis(square(), squareExtendedManyVertices(), Symmetrisation::Max), 0.75, 1e-12);
    EXPECT_NEAR(polis(squareExtended(), square(), Symmetrisation::Min), 0.0, 1e-12);
    EXPECT_NEAR(directedPolis(squareExtended(), square()), 0.5, 1e-12);
    EXPECT_NEAR(polis(squareExtended(), square()), 0.25, 1e-12);
}

TEST(PolygonDistanceTest, PolisBoundedByHausdorffForConvexPairs) {
    // expected for convex shapes, not a law
    const std::vector<std::pair<Polygon, Polygon>> convex = {
        { square(), squareExtended() },
        { square(), roofed() },
        { triangle(), triangleTranslated() },
        { square(), poly({ {2.5, -1}, {6, 2.5}, {2.5, 6}, {-1, 2.5} }) },
    };
    for (const auto& [a, b] : convex) {
        EXPECT_LE(polis(a, b), hausdorff(a, b) + 1e-9);
    }
}
