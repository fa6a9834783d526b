#pragma once
#include <stdexcept>
#include <string>

namespace FootprintGeometry {

// Fewer than 3 distinct vertices, or a ring whose perimeter is zero.
class InvalidGeometryError : public std::runtime_error {
public:
    explicit InvalidGeometryError(const std::string& what)
        : std::runtime_error(what) {}
};

// Empty coordinate sequence where a non-empty one is required.
class EmptyInputError : public std::runtime_error {
public:
    explicit EmptyInputError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace FootprintGeometry
