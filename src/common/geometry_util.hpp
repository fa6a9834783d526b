#pragma once
#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

#include "common/errors.hpp"

namespace FootprintGeometry {

struct Point {
    double x{};
    double y{};
};

struct Edge {
    Point start;
    Point end;

    double length() const;
};

inline constexpr double TOL = 1e-9;

enum class Orientation { CounterClockwise, Clockwise };
enum class Turn { Left, Right, Collinear };

class Polygon;

// Lazy view over the edges of a ring, closing edge included.
// Iterating it twice yields the same edges.
class EdgeRange {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = Edge;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const Edge*;
        using reference         = Edge;

        const_iterator(const std::vector<Point>* vertices, std::size_t index)
            : vertices_(vertices), index_(index) {}

        Edge operator*() const;
        const_iterator& operator++() { ++index_; return *this; }
        const_iterator operator++(int) { auto tmp = *this; ++index_; return tmp; }

        bool operator==(const const_iterator& o) const { return index_ == o.index_ && vertices_ == o.vertices_; }
        bool operator!=(const const_iterator& o) const { return !(*this == o); }

    private:
        const std::vector<Point>* vertices_;
        std::size_t index_;
    };

    explicit EdgeRange(const std::vector<Point>& vertices) : vertices_(&vertices) {}

    const_iterator begin() const { return const_iterator(vertices_, 0); }
    const_iterator end() const { return const_iterator(vertices_, vertices_->size()); }
    std::size_t size() const { return vertices_->size(); }

private:
    const std::vector<Point>* vertices_;
};

// Closed ring of >= 3 vertices. The closing vertex is implicit: a trailing
// copy of the first vertex is dropped on construction.
class Polygon {
public:
    // Throws EmptyInputError for an empty sequence and InvalidGeometryError
    // when fewer than 3 distinct vertices remain or the perimeter is zero.
    static Polygon fromVertices(std::vector<Point> vertices);

    const std::vector<Point>& vertices() const { return vertices_; }
    const Point& vertex(std::size_t i) const { return vertices_[i]; }
    std::size_t size() const { return vertices_.size(); }

    EdgeRange edges() const { return EdgeRange(vertices_); }

    double perimeter() const;
    double signedArea() const;
    double area() const;
    Orientation orientation() const;
    Point centroid() const;
    bool isSimple() const;

    // Same ring traversed the other way round, starting at the same vertex.
    Polygon reversed() const;

private:
    explicit Polygon(std::vector<Point> vertices) : vertices_(std::move(vertices)) {}

    std::vector<Point> vertices_;
};

EdgeRange edgesOf(const Polygon& polygon);

double pointToPointDistance(const Point& a, const Point& b);
double pointToSegmentDistance(const Point& point, const Point& segmentStart, const Point& segmentEnd);
double pointToPolygonDistance(const Point& point, const Polygon& polygon);
double pointToVerticesDistance(const Point& point, const Polygon& polygon);

// Direction of the turn a -> b -> c, decided with an exact predicate.
Turn turnDirection(const Point& a, const Point& b, const Point& c);

// Comparison measures for 1-1 matched footprints.
struct AreaOverlap {
    double truePositive{};   // area(test ∩ ref)
    double falsePositive{};  // area(test) - TP
    double falseNegative{};  // area(ref) - TP
};

AreaOverlap areaOverlap(const Polygon& test, const Polygon& ref, double scale = 1e7);
double overlapPercent(const Polygon& test, const Polygon& ref, double scale = 1e7);
double perimeterRatio(const Polygon& test, const Polygon& ref);
double centroidDistance(const Polygon& test, const Polygon& ref);
double maxEdgeLength(const Polygon& polygon);

} // namespace FootprintGeometry
