#include "turning_function.hpp"
#include <cmath>
#include <algorithm>
#include <iterator>
#include <limits>
#include <utility>

using namespace FootprintGeometry;

namespace FootprintDistance {

// Breakpoints closer than this (in arc-length fraction) are the same event.
static constexpr double kBreakEps = 1e-9;
static constexpr double kPi = 3.14159265358979323846;

namespace {

struct Piece {
    double width;
    double diff;
};

// Signed turning angle at b when walking a -> b -> c, in (-pi, pi].
double turnAngle(const Point& a, const Point& b, const Point& c) {
    const double ux = b.x - a.x, uy = b.y - a.y;
    const double vx = c.x - b.x, vy = c.y - b.y;
    const double dot = ux * vx + uy * vy;

    switch (turnDirection(a, b, c)) {
    case Turn::Collinear:
        // straight on, or a spike that doubles back
        return dot > 0.0 ? 0.0 : kPi;
    case Turn::Left:
        return std::atan2(std::abs(ux * vy - uy * vx), dot);
    case Turn::Right:
        return -std::atan2(std::abs(ux * vy - uy * vx), dot);
    }
    return 0.0;
}

// Steps of `a` as seen from s = t, i.e. the function s -> a(s + t).
std::vector<TurnStep> shiftSteps(const TurnFunction& a, double t) {
    const auto& st = a.steps;

    // last step starting at or before t
    auto it = std::upper_bound(st.begin(), st.end(), t + kBreakEps,
                               [](double v, const TurnStep& s) { return v < s.start; });
    const size_t k = static_cast<size_t>(std::distance(st.begin(), it)) - 1;

    std::vector<TurnStep> out;
    out.reserve(st.size() + 1);
    out.push_back({ 0.0, st[k].angle });
    for (size_t i = k + 1; i < st.size(); ++i) {
        out.push_back({ st[i].start - t, st[i].angle });
    }
    for (size_t i = 0; i <= k; ++i) {
        const double pos = st[i].start - t + 1.0;
        if (pos < 1.0 - kBreakEps) {
            out.push_back({ pos, st[i].angle + a.totalTurn });
        }
    }
    return out;
}

// Merge both breakpoint sets into one partition of [0,1) and record the
// difference of the two functions on each piece.
std::vector<Piece> mergePieces(const std::vector<TurnStep>& a, const std::vector<TurnStep>& b) {
    std::vector<Piece> pieces;
    pieces.reserve(a.size() + b.size());

    size_t ia = 0, ib = 0;
    double s = 0.0;
    while (s < 1.0 - kBreakEps) {
        const double nextA = ia + 1 < a.size() ? a[ia + 1].start : 1.0;
        const double nextB = ib + 1 < b.size() ? b[ib + 1].start : 1.0;
        const double next = std::min(nextA, nextB);

        if (next - s > kBreakEps) {
            pieces.push_back({ next - s, a[ia].angle - b[ib].angle });
        }
        s = next;

        if (ia + 1 < a.size() && nextA <= next + kBreakEps) ++ia;
        if (ib + 1 < b.size() && nextB <= next + kBreakEps) ++ib;
    }
    return pieces;
}

// Best rotation and the integral it leaves, for a fixed shift.
std::pair<double, double> integrate(std::vector<Piece>& pieces, TurnNorm norm) {
    double total = 0.0;
    for (const auto& p : pieces) total += p.width;

    if (norm == TurnNorm::L2) {
        double mean = 0.0;
        for (const auto& p : pieces) mean += p.width * p.diff;
        mean /= total;

        double value = 0.0;
        for (const auto& p : pieces) value += p.width * (p.diff - mean) * (p.diff - mean);
        return { mean, value / total };
    }

    // L1: weighted median
    std::sort(pieces.begin(), pieces.end(),
              [](const Piece& l, const Piece& r) { return l.diff < r.diff; });
    double median = pieces.back().diff;
    double acc = 0.0;
    for (const auto& p : pieces) {
        acc += p.width;
        if (acc >= total / 2.0) { median = p.diff; break; }
    }

    double value = 0.0;
    for (const auto& p : pieces) value += p.width * std::abs(p.diff - median);
    return { median, value / total };
}

} // namespace

double TurnFunction::valueAt(double s) const {
    const double k = std::floor(s);
    const double r = s - k;
    auto it = std::upper_bound(steps.begin(), steps.end(), r,
                               [](double v, const TurnStep& st) { return v < st.start; });
    return std::prev(it)->angle + k * totalTurn;
}

TurnFunction turnFunction(const Polygon& polygon) {
    TurnFunction tf;
    tf.inputOrientation = polygon.orientation();
    tf.perimeter = polygon.perimeter();

    const Polygon ring = tf.inputOrientation == Orientation::Clockwise ? polygon.reversed() : polygon;
    const auto& v = ring.vertices();
    const size_t n = v.size();

    // turn[i]: turning at vertex i, from edge i-1 into edge i
    std::vector<double> turn(n);
    for (size_t i = 0; i < n; ++i) {
        turn[i] = turnAngle(v[(i + n - 1) % n], v[i], v[(i + 1) % n]);
    }

    // start on an edge that follows a real turn so collinear runs stay whole
    size_t first = 0;
    while (first < n && turn[first] == 0.0) ++first;
    if (first == n) {
        throw InvalidGeometryError("ring has no turning vertex");
    }

    double s = 0.0;
    double cumulative = 0.0;
    for (size_t j = 0; j < n; ++j) {
        const size_t e = (first + j) % n;
        if (j == 0) {
            tf.steps.push_back({ 0.0, 0.0 });
        } else if (turn[e] != 0.0) {
            cumulative += turn[e];
            tf.steps.push_back({ s / tf.perimeter, cumulative });
        }
        s += pointToPointDistance(v[e], v[(e + 1) % n]);
    }
    tf.totalTurn = cumulative + turn[first];

    return tf;
}

TurnAlignment alignTurnFunctions(const TurnFunction& a, const TurnFunction& b, TurnNorm norm) {
    TurnAlignment best;
    best.distance = std::numeric_limits<double>::max();

    for (const auto& sa : a.steps) {
        for (const auto& sb : b.steps) {
            double t = sa.start - sb.start;
            if (t < 0.0) t += 1.0;
            if (t >= 1.0 - kBreakEps) t = 0.0;

            auto pieces = mergePieces(shiftSteps(a, t), b.steps);
            auto [rotation, value] = integrate(pieces, norm);

            if (value < best.distance) {
                best.distance = value;
                best.shift = t;
                best.rotation = rotation;
            }
        }
    }

    if (norm == TurnNorm::L2) best.distance = std::sqrt(std::max(0.0, best.distance));
    return best;
}

double turnFunctionDistance(const Polygon& a, const Polygon& b, TurnNorm norm) {
    return alignTurnFunctions(turnFunction(a), turnFunction(b), norm).distance;
}

} // namespace FootprintDistance
