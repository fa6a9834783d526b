#include "geometry_util.hpp"
#include <cmath>
#include <algorithm>
#include <limits>
#include <string>

// CGAL
#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Polygon_2_algorithms.h>

// Clipper2
#include "clipper2/clipper.h"


using namespace Clipper2Lib;

typedef CGAL::Exact_predicates_inexact_constructions_kernel Kernel;
typedef Kernel::Point_2                                     Point_2;

namespace FootprintGeometry {

static bool almostEqual(double a, double b, double tol = TOL) {
    return std::abs(a - b) < tol;
}

static bool samePoint(const Point& a, const Point& b, double eps = TOL) {
    return almostEqual(a.x, b.x, eps) && almostEqual(a.y, b.y, eps);
}

static Point_2 toCgal(const Point& p) {
    return Point_2(p.x, p.y);
}

static Point64 toP64(const Point& p, double scale) {
    return Point64(
        static_cast<int64_t>(std::llround(p.x * scale)),
        static_cast<int64_t>(std::llround(p.y * scale))
    );
}

static Path64 toPath64(const Polygon& poly, double scale) {
    Path64 out;
    out.reserve(poly.size());
    for (const auto& pt : poly.vertices()) out.push_back(toP64(pt, scale));
    return out;
}

Edge EdgeRange::const_iterator::operator*() const {
    const auto& v = *vertices_;
    return Edge{ v[index_], v[(index_ + 1) % v.size()] };
}

double Edge::length() const {
    return pointToPointDistance(start, end);
}

Polygon Polygon::fromVertices(std::vector<Point> p) {
    if (p.empty()) {
        throw EmptyInputError("polygon has no vertices");
    }

    // remove closing duplicate if present
    if (p.size() > 1 && samePoint(p.front(), p.back())) {
        p.pop_back();
    }

    // remove consecutive duplicates
    std::vector<Point> out;
    out.reserve(p.size());
    for (const auto& pt : p) {
        if (out.empty() || !samePoint(out.back(), pt)) {
            out.push_back(pt);
        }
    }

    // if still closed after compaction
    if (out.size() > 1 && samePoint(out.front(), out.back())) {
        out.pop_back();
    }

    if (out.size() < 3) {
        throw InvalidGeometryError("polygon needs at least 3 distinct vertices, got "
                                   + std::to_string(out.size()));
    }

    Polygon poly(std::move(out));
    if (!(poly.perimeter() > TOL)) {
        throw InvalidGeometryError("polygon perimeter is zero");
    }
    return poly;
}

double Polygon::perimeter() const {
    double total = 0.0;
    for (const Edge& e : edges()) total += e.length();
    return total;
}

double Polygon::signedArea() const {
    const auto& p = vertices_;
    long double a = 0.0;
    for (size_t i = 0, j = p.size() - 1; i < p.size(); j = i++) {
        a += (long double)p[j].x * p[i].y - (long double)p[i].x * p[j].y;
    }
    return static_cast<double>(a * 0.5);
}

double Polygon::area() const {
    return std::abs(signedArea());
}

Orientation Polygon::orientation() const {
    return signedArea() < 0.0 ? Orientation::Clockwise : Orientation::CounterClockwise;
}

Point Polygon::centroid() const {
    const auto& p = vertices_;
    const double a = signedArea();

    // zero-area ring: fall back to the vertex mean
    if (std::abs(a) < TOL) {
        Point c;
        for (const auto& pt : p) { c.x += pt.x; c.y += pt.y; }
        c.x /= p.size();
        c.y /= p.size();
        return c;
    }

    // shift to the first vertex to keep the products small
    const double ox = p[0].x;
    const double oy = p[0].y;
    long double cx = 0.0, cy = 0.0;
    for (size_t i = 0, j = p.size() - 1; i < p.size(); j = i++) {
        const long double xj = p[j].x - ox, yj = p[j].y - oy;
        const long double xi = p[i].x - ox, yi = p[i].y - oy;
        const long double cross = xj * yi - xi * yj;
        cx += (xj + xi) * cross;
        cy += (yj + yi) * cross;
    }
    return Point{ static_cast<double>(cx / (6.0L * a)) + ox,
                  static_cast<double>(cy / (6.0L * a)) + oy };
}

bool Polygon::isSimple() const {
    std::vector<Point_2> ring;
    ring.reserve(vertices_.size());
    for (const auto& pt : vertices_) ring.push_back(toCgal(pt));
    return CGAL::is_simple_2(ring.begin(), ring.end(), Kernel());
}

Polygon Polygon::reversed() const {
    std::vector<Point> out;
    out.reserve(vertices_.size());
    out.push_back(vertices_.front());
    for (size_t i = vertices_.size() - 1; i > 0; --i) out.push_back(vertices_[i]);
    return Polygon(std::move(out));
}

EdgeRange edgesOf(const Polygon& polygon) {
    return polygon.edges();
}

double pointToPointDistance(const Point& a, const Point& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

double pointToSegmentDistance(const Point& p, const Point& A, const Point& B) {
    double dxAB = B.x - A.x;
    double dyAB = B.y - A.y;
    double len2 = dxAB * dxAB + dyAB * dyAB;

    // degenerate segment
    if (len2 == 0.0) {
        return pointToPointDistance(p, A);
    }

    // projection via dot product, clamped to the segment span
    double t = ((p.x - A.x) * dxAB + (p.y - A.y) * dyAB) / len2;
    t = std::clamp(t, 0.0, 1.0);

    return pointToPointDistance(p, Point{ A.x + t * dxAB, A.y + t * dyAB });
}

double pointToPolygonDistance(const Point& point, const Polygon& polygon) {
    double best = std::numeric_limits<double>::max();
    for (const Edge& e : polygon.edges()) {
        best = std::min(best, pointToSegmentDistance(point, e.start, e.end));
    }
    return best;
}

double pointToVerticesDistance(const Point& point, const Polygon& polygon) {
    double best = std::numeric_limits<double>::max();
    for (const auto& v : polygon.vertices()) {
        best = std::min(best, pointToPointDistance(point, v));
    }
    return best;
}

Turn turnDirection(const Point& a, const Point& b, const Point& c) {
    switch (CGAL::orientation(toCgal(a), toCgal(b), toCgal(c))) {
    case CGAL::LEFT_TURN:  return Turn::Left;
    case CGAL::RIGHT_TURN: return Turn::Right;
    default:               return Turn::Collinear;
    }
}

AreaOverlap areaOverlap(const Polygon& test, const Polygon& ref, double scale) {
    Paths64 subject{ toPath64(test, scale) };
    Paths64 clip{ toPath64(ref, scale) };

    Paths64 common = Intersect(subject, clip, FillRule::NonZero);

    const double s2 = scale * scale;
    AreaOverlap result;
    result.truePositive  = std::abs(Area(common)) / s2;
    // shoelace and scaled integer areas round differently
    result.falsePositive = std::max(0.0, test.area() - result.truePositive);
    result.falseNegative = std::max(0.0, ref.area() - result.truePositive);
    return result;
}

double overlapPercent(const Polygon& test, const Polygon& ref, double scale) {
    const double minArea = std::min(test.area(), ref.area());
    if (minArea < TOL) {
        throw InvalidGeometryError("overlap percentage undefined for a zero-area polygon");
    }
    return areaOverlap(test, ref, scale).truePositive / minArea * 100.0;
}

double perimeterRatio(const Polygon& test, const Polygon& ref) {
    return test.perimeter() / ref.perimeter();
}

double centroidDistance(const Polygon& test, const Polygon& ref) {
    return pointToPointDistance(test.centroid(), ref.centroid());
}

double maxEdgeLength(const Polygon& polygon) {
    double longest = 0.0;
    for (const Edge& e : polygon.edges()) longest = std::max(longest, e.length());
    return longest;
}

} // namespace FootprintGeometry
