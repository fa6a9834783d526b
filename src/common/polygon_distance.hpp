#pragma once
#include "common/geometry_util.hpp"

namespace FootprintDistance {

using FootprintGeometry::Polygon;

// How the two directed distances a->b and b->a are combined.
enum class Symmetrisation { Min, Max, Average };

// Chamfer: sum or mean of the two directed means.
enum class ChamferNormalization { Sum, Average };

// Target of the nearest-distance query made from each vertex.
// Boundary: closest point on any edge. Vertices: closest vertex only.
enum class NearestTarget { Boundary, Vertices };

struct PointSetOptions {
    NearestTarget nearest = NearestTarget::Boundary;
    Symmetrisation symmetrise = Symmetrisation::Max;
};

double symmetrise(double ab, double ba, Symmetrisation how);

double directedHausdorff(const Polygon& a, const Polygon& b,
                         NearestTarget nearest = NearestTarget::Boundary);
double hausdorff(const Polygon& a, const Polygon& b, const PointSetOptions& options = {});

double directedChamfer(const Polygon& a, const Polygon& b,
                       NearestTarget nearest = NearestTarget::Boundary);
double chamfer(const Polygon& a, const Polygon& b,
               ChamferNormalization normalization = ChamferNormalization::Average,
               NearestTarget nearest = NearestTarget::Boundary);

// PoLis is always measured against the edges of the other polygon.
double directedPolis(const Polygon& a, const Polygon& b);
double polis(const Polygon& a, const Polygon& b,
             Symmetrisation symmetrisation = Symmetrisation::Average);

} // namespace FootprintDistance
