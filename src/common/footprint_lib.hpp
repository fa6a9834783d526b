#pragma once
#include <nlohmann/json.hpp>
#include "common/geometry_util.hpp"
#include "common/polygon_distance.hpp"
#include "common/turning_function.hpp"

using json = nlohmann::json;
namespace FootprintTool{

    struct MetricOptions {
        FootprintDistance::ChamferNormalization chamferNormalization = FootprintDistance::ChamferNormalization::Average;
        FootprintDistance::TurnNorm turnNorm = FootprintDistance::TurnNorm::L2;
        FootprintDistance::Symmetrisation hausdorffSymmetrise = FootprintDistance::Symmetrisation::Max;
        FootprintDistance::Symmetrisation polisSymmetrise = FootprintDistance::Symmetrisation::Average;
        FootprintDistance::NearestTarget nearest = FootprintDistance::NearestTarget::Boundary;
    };

    // Throws std::invalid_argument on an unknown option value.
    MetricOptions parseOptions(const json& j);

    FootprintGeometry::Polygon parseVertices(const json& j);

    json comparePair(const FootprintGeometry::Polygon& test,
                     const FootprintGeometry::Polygon& ref,
                     const MetricOptions& options);

    json processDataset(json &dataset);

}
