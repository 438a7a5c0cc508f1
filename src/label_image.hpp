#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ndarray.hpp"
#include "ticks.hpp"
#include "provenance.hpp"

#define SPOTCALL_LABEL_IMAGE_DOCTYPE "spotcall/LabelImage"

struct Archive;

/// Integer label raster (0 = background) with its coordinate ticks.
/// Immutable once built except for appending provenance entries.
class LabelImage {
public:
    // Throws TypeMismatchError for a non-integral dtype or a rank other than
    // 2/3, MissingCoordinateError when physical ticks of an axis are absent
    // and ShapeError when tick lengths disagree with the array.
    static LabelImage fromArrayAndTicks(NdArray array, const TickInput& ticks, Log log = Log());
    // Ticks already resolved for a frame of the array's shape
    static LabelImage fromArrayAndTicks(NdArray array, Ticks ticks, Log log = Log());

    const NdArray& array() const { return array_; }
    const Ticks& ticks() const { return ticks_; }
    const Log& log() const { return log_; }
    size_t ndim() const { return array_.ndim(); }
    const std::vector<size_t>& shape() const { return array_.shape(); }

    void appendLog(const std::string& method, nlohmann::json parameters) {
        log_.append(method, std::move(parameters));
    }

    std::vector<uint8_t> toBytes() const;
    static LabelImage fromBytes(const std::vector<uint8_t>& bytes);
    void save(const std::string& path) const;
    static LabelImage open(const std::string& path);

    bool operator==(const LabelImage& o) const {
        return array_ == o.array_ && ticks_ == o.ticks_ && log_ == o.log_;
    }

private:
    LabelImage(NdArray array, Ticks ticks, Log log)
        : array_(std::move(array)), ticks_(std::move(ticks)), log_(std::move(log)) {}

    NdArray array_;
    Ticks ticks_;
    Log log_;

    static void validateArray(const NdArray& array);
    Archive toArchive() const;
    static LabelImage fromArchive(Archive ar);
};
