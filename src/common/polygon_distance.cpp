#include "polygon_distance.hpp"
#include <algorithm>

using namespace FootprintGeometry;

namespace FootprintDistance {

static double nearestDistance(const Point& p, const Polygon& other, NearestTarget nearest) {
    return nearest == NearestTarget::Boundary
        ? pointToPolygonDistance(p, other)
        : pointToVerticesDistance(p, other);
}

double symmetrise(double ab, double ba, Symmetrisation how) {
    switch (how) {
    case Symmetrisation::Min:     return std::min(ab, ba);
    case Symmetrisation::Max:     return std::max(ab, ba);
    case Symmetrisation::Average: break;
    }
    return (ab + ba) / 2.0;
}

double directedHausdorff(const Polygon& a, const Polygon& b, NearestTarget nearest) {
    double worst = 0.0;
    for (const auto& v : a.vertices()) {
        worst = std::max(worst, nearestDistance(v, b, nearest));
    }
    return worst;
}

double hausdorff(const Polygon& a, const Polygon& b, const PointSetOptions& options) {
    return symmetrise(directedHausdorff(a, b, options.nearest),
                      directedHausdorff(b, a, options.nearest),
                      options.symmetrise);
}

double directedChamfer(const Polygon& a, const Polygon& b, NearestTarget nearest) {
    double total = 0.0;
    for (const auto& v : a.vertices()) total += nearestDistance(v, b, nearest);
    return total / a.size();
}

double chamfer(const Polygon& a, const Polygon& b,
               ChamferNormalization normalization, NearestTarget nearest) {
    const double sum = directedChamfer(a, b, nearest) + directedChamfer(b, a, nearest);
    return normalization == ChamferNormalization::Sum ? sum : sum / 2.0;
}

double directedPolis(const Polygon& a, const Polygon& b) {
    double total = 0.0;
    for (const auto& v : a.vertices()) total += pointToPolygonDistance(v, b);
    return total / a.size();
}

double polis(const Polygon& a, const Polygon& b, Symmetrisation symmetrisation) {
    return symmetrise(directedPolis(a, b), directedPolis(b, a), symmetrisation);
}

} // namespace FootprintDistance
