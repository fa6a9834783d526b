#include <iostream>
#include <nlohmann/json.hpp>
#include "common/footprint_lib.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <stdexcept>


using json = nlohmann::json;

// Dataset source: "-" for stdin, a path, or the JSON text itself.
static json loadDataset(const std::string& source) {
    if (source == "-") {
        if (std::cin.peek() == std::char_traits<char>::eof()) {
            throw std::runtime_error("no dataset on stdin");
        }
        return json::parse(std::cin);
    }

    std::error_code ec;
    if (std::filesystem::is_regular_file(source, ec)) {
        std::ifstream in(source);
        if (!in) throw std::runtime_error("cannot open " + source);
        return json::parse(in);
    }

    const auto first = source.find_first_not_of(" \t\r\n");
    if (first == std::string::npos || (source[first] != '{' && source[first] != '[')) {
        throw std::runtime_error("no such file: " + source);
    }
    return json::parse(source);
}

static bool writeDataset(const json& dataset, const std::string& path) {
    std::ofstream out(path);
    if (!out) return false;
    out << dataset.dump(2) << "\n";
    return static_cast<bool>(out);
}

// ---------- Main ----------
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr
            << "Usage:\n"
            << "  footprint_tool <input.json> [output.json]\n\n"
            << "Notes:\n"
            << "  - Entries are objects {\"test\": {...}, \"reference\": {...}}, each side\n"
            << "    with VERTICES: [{x,y},...] and an optional NAME.\n"
            << "  - An optional top-level \"options\" object selects chamfer_normalization,\n"
            << "    turn_norm, hausdorff_symmetrise, polis_symmetrise and nearest.\n";
        return 1;
    }

    json dataset;
    try {
        dataset = loadDataset(argv[1]);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load/parse JSON: " << e.what() << "\n";
        return 1;
    }

    if (!dataset.is_object()) {
        std::cerr << "Expected top-level JSON object.\n";
        return 1;
    }

    try {
        dataset = FootprintTool::processDataset(dataset);
    } catch (const std::exception& e) {
        std::cerr << "Error during distance computation: " << e.what() << "\n";
        return 1;
    }

    if (argc >= 3 && !writeDataset(dataset, argv[2])) {
        std::cerr << "Failed to write output file: " << argv[2] << "\n";
        return 1;
    }
    std::cout << dataset.dump(2) << "\n";

    return 0;
}
