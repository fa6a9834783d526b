#include "footprint_lib.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>
#include <iostream>
#include <algorithm>
#include "common/thematic_distance.hpp"

using json = nlohmann::json;
using namespace FootprintDistance;

namespace FootprintTool{
// ---------- JSON helpers ----------
FootprintGeometry::Polygon parseVertices(const json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("VERTICES must be an array");
    }

    std::vector<FootprintGeometry::Point> pts;
    pts.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        const json& pt = j[i];
        if (!pt.is_object() || !pt.contains("x") || !pt.contains("y")) {
            throw std::invalid_argument("vertex " + std::to_string(i) + " needs numeric x and y");
        }
        if (!pt["x"].is_number() || !pt["y"].is_number()) {
            throw std::invalid_argument("vertex " + std::to_string(i) + " has a non-numeric coordinate");
        }
        pts.push_back({ pt["x"].get<double>(), pt["y"].get<double>() });
    }
    return FootprintGeometry::Polygon::fromVertices(std::move(pts));
}

static bool hasVerticesObject(const json& obj) {
    return obj.is_object() && obj.contains("VERTICES") && obj["VERTICES"].is_array();
}

static bool isPairObject(const json& obj) {
    return obj.is_object() && obj.contains("test") && obj.contains("reference");
}

static Symmetrisation parseSymmetrisation(const std::string& s) {
    if (s == "min") return Symmetrisation::Min;
    if (s == "max") return Symmetrisation::Max;
    if (s == "average") return Symmetrisation::Average;
    throw std::invalid_argument("unknown symmetrisation: " + s);
}

MetricOptions parseOptions(const json& j) {
    MetricOptions opt;
    if (j.is_null()) return opt;
    if (!j.is_object()) {
        throw std::invalid_argument("options must be an object");
    }

    if (j.contains("chamfer_normalization")) {
        const auto s = j.at("chamfer_normalization").get<std::string>();
        if (s == "sum") opt.chamferNormalization = ChamferNormalization::Sum;
        else if (s == "average") opt.chamferNormalization = ChamferNormalization::Average;
        else throw std::invalid_argument("unknown chamfer_normalization: " + s);
    }
    if (j.contains("turn_norm")) {
        const auto s = j.at("turn_norm").get<std::string>();
        if (s == "L1") opt.turnNorm = TurnNorm::L1;
        else if (s == "L2") opt.turnNorm = TurnNorm::L2;
        else throw std::invalid_argument("unknown turn_norm: " + s);
    }
    if (j.contains("hausdorff_symmetrise")) {
        opt.hausdorffSymmetrise = parseSymmetrisation(j.at("hausdorff_symmetrise").get<std::string>());
    }
    if (j.contains("polis_symmetrise")) {
        opt.polisSymmetrise = parseSymmetrisation(j.at("polis_symmetrise").get<std::string>());
    }
    if (j.contains("nearest")) {
        const auto s = j.at("nearest").get<std::string>();
        if (s == "boundary") opt.nearest = NearestTarget::Boundary;
        else if (s == "vertices") opt.nearest = NearestTarget::Vertices;
        else throw std::invalid_argument("unknown nearest: " + s);
    }
    return opt;
}

json comparePair(const FootprintGeometry::Polygon& test,
                 const FootprintGeometry::Polygon& ref,
                 const MetricOptions& options)
{
    json d;

    PointSetOptions hOpt;
    hOpt.nearest = options.nearest;
    hOpt.symmetrise = options.hausdorffSymmetrise;

    d["hausdorff"] = hausdorff(test, ref, hOpt);
    d["chamfer"] = chamfer(test, ref, options.chamferNormalization, options.nearest);
    d["polis"] = polis(test, ref, options.polisSymmetrise);

    auto alignment = alignTurnFunctions(turnFunction(test), turnFunction(ref), options.turnNorm);
    d["turn_function"] = alignment.distance;
    d["turn_alignment"] = { {"shift", alignment.shift}, {"rotation", alignment.rotation} };

    auto areas = FootprintGeometry::areaOverlap(test, ref);
    d["areas"] = { {"TP", areas.truePositive}, {"FP", areas.falsePositive}, {"FN", areas.falseNegative} };
    // undefined for a zero-area ring; the other measures still stand
    if (std::min(test.area(), ref.area()) < FootprintGeometry::TOL) {
        d["overlap_percent"] = nullptr;
    } else {
        d["overlap_percent"] = FootprintGeometry::overlapPercent(test, ref);
    }
    d["perimeter_ratio"] = FootprintGeometry::perimeterRatio(test, ref);
    d["centroid_distance"] = FootprintGeometry::centroidDistance(test, ref);

    return d;
}

json processDataset(json &dataset)
{
    const MetricOptions options = parseOptions(dataset.value("options", json()));

    // Collect keys of pair entries to avoid iterating over "options" or unrelated values
    std::vector<std::string> pairKeys;
    pairKeys.reserve(dataset.size());

    for (auto it = dataset.begin(); it != dataset.end(); ++it) {
        const std::string key = it.key();
        if (key == "options") continue;
        if (isPairObject(it.value())) {
            pairKeys.push_back(key);
        } else {
            std::cerr << "WARNING: entry '" << key << "' is not a test/reference pair, skipped\n";
        }
    }

    for (const auto& key : pairKeys) {
        auto& pairObj = dataset[key];
        const json& testObj = pairObj["test"];
        const json& refObj = pairObj["reference"];

        if (!hasVerticesObject(testObj) || !hasVerticesObject(refObj)) {
            pairObj["error"] = "test and reference need a VERTICES array";
            std::cerr << "ERROR: pair '" << key << "': " << pairObj["error"].get<std::string>() << "\n";
            continue;
        }

        if (testObj.contains("NAME") && refObj.contains("NAME")
            && testObj["NAME"].is_string() && refObj["NAME"].is_string()) {
            pairObj["levenshtein"] = levenshtein(testObj["NAME"].get<std::string>(),
                                                 refObj["NAME"].get<std::string>());
        }

        try {
            auto test = parseVertices(testObj["VERTICES"]);
            auto ref = parseVertices(refObj["VERTICES"]);

            if (!test.isSimple() || !ref.isSimple()) {
                std::cerr << "WARNING: pair '" << key << "' has a self-intersecting ring\n";
            }

            pairObj["distances"] = comparePair(test, ref, options);
        } catch (const std::exception& e) {
            // InvalidGeometryError, EmptyInputError, bad vertex entries
            pairObj["error"] = e.what();
            std::cerr << "ERROR: pair '" << key << "': " << e.what() << "\n";
        }
    }
    return dataset;
}
}
