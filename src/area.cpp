#include "area.hpp"
#include "error.hpp"
#include <algorithm>
#include <cmath>

Area::Area(double xmin_, double xmax_, double ymin_, double ymax_)
    : xmin(xmin_), xmax(xmax_), ymin(ymin_), ymax(ymax_) {
    if (!(xmin <= xmax) || !(ymin <= ymax)) {
        fail<std::invalid_argument>("Invalid area: x [%g, %g], y [%g, %g]", xmin, xmax, ymin, ymax);
    }
}

std::optional<Area> Area::intersect(const Area& a, const Area& b) {
    const double x0 = std::max(a.xmin, b.xmin);
    const double x1 = std::min(a.xmax, b.xmax);
    const double y0 = std::max(a.ymin, b.ymin);
    const double y1 = std::min(a.ymax, b.ymax);
    if (x0 > x1 || y0 > y1) {
        return std::nullopt;
    }
    if (x0 == x1 && y0 == y1) {
        return std::nullopt;
    }
    return Area(x0, x1, y0, y1);
}

OverlapMap findOverlaps(const std::vector<Area>& areas) {
    OverlapMap out;
    for (size_t i = 0; i < areas.size(); ++i) {
        for (size_t j = i + 1; j < areas.size(); ++j) {
            auto overlap = Area::intersect(areas[i], areas[j]);
            if (overlap) {
                out.emplace(std::make_pair(i, j), *overlap);
            }
        }
    }
    return out;
}
