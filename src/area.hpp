#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <utility>
#include <vector>

/// Axis-aligned rectangle in physical coordinates, closed on both axes
struct Area {
    double xmin = 0, xmax = 0, ymin = 0, ymax = 0;

    Area() = default;
    Area(double xmin_, double xmax_, double ymin_, double ymax_);

    double width() const { return xmax - xmin; }
    double height() const { return ymax - ymin; }
    bool contains(double x, double y) const {
        return x >= xmin && x <= xmax && y >= ymin && y <= ymax;
    }
    bool containsStrictly(double x, double y) const {
        return x > xmin && x < xmax && y > ymin && y < ymax;
    }

    // Overlap of two areas. A shared edge yields a degenerate area, a shared
    // corner (no extent on either axis) or a gap yields nothing.
    static std::optional<Area> intersect(const Area& a, const Area& b);

    bool operator==(const Area& o) const {
        return xmin == o.xmin && xmax == o.xmax && ymin == o.ymin && ymax == o.ymax;
    }
    bool operator!=(const Area& o) const { return !(*this == o); }
};

using OverlapMap = std::map<std::pair<size_t, size_t>, Area>;

// Every unordered pair (i < j) of areas that intersect
OverlapMap findOverlaps(const std::vector<Area>& areas);
