#pragma once
#include <vector>
#include "common/geometry_util.hpp"

namespace FootprintDistance {

using FootprintGeometry::Polygon;
using FootprintGeometry::Orientation;

enum class TurnNorm { L1, L2 };

// One constant piece of the turning function: it starts at arc-length
// fraction `start` and holds the cumulative turning `angle` (radians)
// until the next step.
struct TurnStep {
    double start{};
    double angle{};
};

struct TurnFunction {
    std::vector<TurnStep> steps;        // steps[0].start == 0, starts ascending in [0,1)
    double totalTurn{};                 // turning gained over one traversal (2*pi for a simple ring)
    double perimeter{};
    Orientation inputOrientation{Orientation::CounterClockwise};

    // Value at s in [0,1), extended periodically with f(s+1) = f(s) + totalTurn.
    double valueAt(double s) const;
};

struct TurnAlignment {
    double distance{};
    double shift{};     // arc-length offset applied to the first function
    double rotation{};  // constant angle offset between the two functions
};

// Turning function of the ring traversed counter-clockwise. A clockwise
// ring is reversed first; the detected winding is kept in inputOrientation.
// Steps are merged across collinear vertices.
TurnFunction turnFunction(const Polygon& polygon);

// Minimum over start shift t and rotation theta of the integral over [0,1)
// of |a(s+t) - b(s) - theta|^p. Exact: only shifts aligning a breakpoint
// of a with a breakpoint of b are candidates.
TurnAlignment alignTurnFunctions(const TurnFunction& a, const TurnFunction& b,
                                 TurnNorm norm = TurnNorm::L2);

// L2: square root of the minimized integral. L1: the minimized integral.
double turnFunctionDistance(const Polygon& a, const Polygon& b, TurnNorm norm = TurnNorm::L2);

} // namespace FootprintDistance
