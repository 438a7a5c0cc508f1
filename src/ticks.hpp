#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class Axis : uint8_t { Z = 0, Y = 1, X = 2 };
const char* axisName(Axis a);        // "z", "y", "x"
const char* coordinateName(Axis a);  // "zc", "yc", "xc"

/// Pixel index labels and physical coordinates along one spatial axis
struct AxisTicks {
    std::vector<int32_t> pixel;
    std::vector<double> physical;

    size_t size() const { return pixel.size(); }
    AxisTicks slice(size_t start, size_t len) const;
    bool operator==(const AxisTicks& o) const { return pixel == o.pixel && physical == o.physical; }
    bool operator!=(const AxisTicks& o) const { return !(*this == o); }
};

/// Coordinate ticks of a full 2D {y, x} or 3D {z, y, x} frame. Axes are
/// addressed in array order, so axis(0) is z for 3D data and y for 2D data.
struct Ticks {
    std::optional<AxisTicks> z;
    AxisTicks y;
    AxisTicks x;

    size_t ndim() const { return z ? 3 : 2; }
    const AxisTicks& axis(size_t i) const;
    Axis axisId(size_t i) const;
    std::vector<size_t> shape() const;
    // Ticks of the block [start, start+extent), both given in array axis order
    Ticks slice(const std::vector<size_t>& start, const std::vector<size_t>& extent) const;

    bool operator==(const Ticks& o) const { return z == o.z && y == o.y && x == o.x; }
    bool operator!=(const Ticks& o) const { return !(*this == o); }
};

/// Caller supplied coordinates, any of which may be absent. Pixel ticks that
/// are absent are synthesised as 0..extent-1; physical ticks are required for
/// every axis present in the data.
struct TickInput {
    std::optional<std::vector<int32_t>> z, y, x;
    std::optional<std::vector<double>> zc, yc, xc;
};

// Validate `in` against an array of the given shape (rank 2 or 3)
Ticks resolveTicks(const std::vector<size_t>& shape, const TickInput& in);
// Same, with the frame shape taken from the physical tick lengths
Ticks resolveTicks(const TickInput& in);

void to_json(nlohmann::json& j, const AxisTicks& t);
void from_json(const nlohmann::json& j, AxisTicks& t);
void to_json(nlohmann::json& j, const Ticks& t);
void from_json(const nlohmann::json& j, Ticks& t);
