#include "ticks.hpp"
#include "error.hpp"
#include <numeric>

const char* axisName(Axis a) {
    switch (a) {
        case Axis::Z: return "z";
        case Axis::Y: return "y";
        case Axis::X: return "x";
    }
    return "?";
}

const char* coordinateName(Axis a) {
    switch (a) {
        case Axis::Z: return "zc";
        case Axis::Y: return "yc";
        case Axis::X: return "xc";
    }
    return "?";
}

AxisTicks AxisTicks::slice(size_t start, size_t len) const {
    if (start + len > pixel.size()) {
        fail<std::out_of_range>("%s: [%zu, %zu) exceeds %zu ticks", __func__, start, start + len, pixel.size());
    }
    AxisTicks out;
    out.pixel.assign(pixel.begin() + start, pixel.begin() + start + len);
    out.physical.assign(physical.begin() + start, physical.begin() + start + len);
    return out;
}

const AxisTicks& Ticks::axis(size_t i) const {
    if (z) {
        if (i == 0) return *z;
        if (i == 1) return y;
        if (i == 2) return x;
    } else {
        if (i == 0) return y;
        if (i == 1) return x;
    }
    fail<std::out_of_range>("%s: axis %zu out of range for %zu-dimensional ticks", __func__, i, ndim());
}

Axis Ticks::axisId(size_t i) const {
    static const Axis axes3[] = {Axis::Z, Axis::Y, Axis::X};
    if (i >= ndim()) {
        fail<std::out_of_range>("%s: axis %zu out of range for %zu-dimensional ticks", __func__, i, ndim());
    }
    return axes3[i + 3 - ndim()];
}

std::vector<size_t> Ticks::shape() const {
    std::vector<size_t> s;
    if (z) s.push_back(z->size());
    s.push_back(y.size());
    s.push_back(x.size());
    return s;
}

Ticks Ticks::slice(const std::vector<size_t>& start, const std::vector<size_t>& extent) const {
    if (start.size() != ndim() || extent.size() != ndim()) {
        fail<ShapeError>("%s: slice of rank %zu requested on %zu-dimensional ticks", __func__, start.size(), ndim());
    }
    Ticks out;
    size_t d = 0;
    if (z) {
        out.z = z->slice(start[0], extent[0]);
        d = 1;
    }
    out.y = y.slice(start[d], extent[d]);
    out.x = x.slice(start[d + 1], extent[d + 1]);
    return out;
}

namespace {

AxisTicks resolveAxis(Axis a, size_t extent,
                      const std::optional<std::vector<int32_t>>& pixel,
                      const std::optional<std::vector<double>>& physical) {
    if (!physical) {
        fail<MissingCoordinateError>("physical coordinates missing for axis '%s' (%s)",
            axisName(a), coordinateName(a));
    }
    if (physical->size() != extent) {
        fail<ShapeError>("physical ticks for %s have length %zu but the data has extent %zu",
            coordinateName(a), physical->size(), extent);
    }
    AxisTicks out;
    out.physical = *physical;
    if (pixel) {
        if (pixel->size() != extent) {
            fail<ShapeError>("pixel ticks for %s have length %zu but the data has extent %zu",
                axisName(a), pixel->size(), extent);
        }
        out.pixel = *pixel;
    } else {
        out.pixel.resize(extent);
        std::iota(out.pixel.begin(), out.pixel.end(), 0);
    }
    return out;
}

} // namespace

Ticks resolveTicks(const std::vector<size_t>& shape, const TickInput& in) {
    if (shape.size() != 2 && shape.size() != 3) {
        fail<TypeMismatchError>("data must be 2D (y, x) or 3D (z, y, x), got rank %zu", shape.size());
    }
    Ticks out;
    size_t d = 0;
    if (shape.size() == 3) {
        out.z = resolveAxis(Axis::Z, shape[0], in.z, in.zc);
        d = 1;
    } else if (in.z || in.zc) {
        fail<ShapeError>("coordinates given for axis 'z' but the data has 2 axes");
    }
    out.y = resolveAxis(Axis::Y, shape[d], in.y, in.yc);
    out.x = resolveAxis(Axis::X, shape[d + 1], in.x, in.xc);
    return out;
}

Ticks resolveTicks(const TickInput& in) {
    std::vector<size_t> shape;
    if (in.zc) shape.push_back(in.zc->size());
    else if (in.z) {
        fail<MissingCoordinateError>("physical coordinates missing for axis 'z' (zc)");
    }
    if (!in.yc) fail<MissingCoordinateError>("physical coordinates missing for axis 'y' (yc)");
    if (!in.xc) fail<MissingCoordinateError>("physical coordinates missing for axis 'x' (xc)");
    shape.push_back(in.yc->size());
    shape.push_back(in.xc->size());
    return resolveTicks(shape, in);
}

void to_json(nlohmann::json& j, const AxisTicks& t) {
    j = nlohmann::json{{"pixel", t.pixel}, {"physical", t.physical}};
}

void from_json(const nlohmann::json& j, AxisTicks& t) {
    j.at("pixel").get_to(t.pixel);
    j.at("physical").get_to(t.physical);
    if (t.pixel.size() != t.physical.size()) {
        fail<ShapeError>("stored ticks have %zu pixel and %zu physical values",
            t.pixel.size(), t.physical.size());
    }
}

void to_json(nlohmann::json& j, const Ticks& t) {
    j = nlohmann::json::object();
    if (t.z) j["z"] = *t.z;
    j["y"] = t.y;
    j["x"] = t.x;
}

void from_json(const nlohmann::json& j, Ticks& t) {
    if (j.contains("z")) {
        t.z = j.at("z").get<AxisTicks>();
    } else {
        t.z.reset();
    }
    j.at("y").get_to(t.y);
    j.at("x").get_to(t.x);
}
