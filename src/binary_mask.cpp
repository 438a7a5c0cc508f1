#include "binary_mask.hpp"
#include "error.hpp"
#include <algorithm>
#include <limits>

namespace {

// Paint the true pixels of `m` into the full-frame `image` with `value`
template<typename T>
void fillFromMask(const MaskData& m, T value, NdArray& image) {
    const NdArray& mask = m.binaryMask;
    if (mask.size() == 0) return;
    const size_t nd = image.ndim();
    const bool* src = mask.data<bool>();
    T* dst = image.data<T>();
    const size_t mz = nd == 3 ? mask.shape(0) : 1;
    const size_t oz = nd == 3 ? m.offsets[0] : 0;
    const size_t mh = mask.shape(nd - 2), mw = mask.shape(nd - 1);
    const size_t oy = m.offsets[nd - 2], ox = m.offsets[nd - 1];
    const size_t H = image.shape(nd - 2), W = image.shape(nd - 1);
    size_t i = 0;
    for (size_t z = 0; z < mz; ++z) {
        for (size_t y = 0; y < mh; ++y) {
            for (size_t x = 0; x < mw; ++x, ++i) {
                if (src[i]) {
                    dst[((z + oz) * H + y + oy) * W + x + ox] = value;
                }
            }
        }
    }
}

// Tight bounding box of the true pixels, as (start, extent) per axis
void cropBounds(const NdArray& array, std::vector<size_t>& start, std::vector<size_t>& extent) {
    const size_t nd = array.ndim();
    const bool* p = array.data<bool>();
    const size_t Z = nd == 3 ? array.shape(0) : 1;
    const size_t H = array.shape(nd - 2), W = array.shape(nd - 1);
    size_t lo[3] = {SIZE_MAX, SIZE_MAX, SIZE_MAX};
    size_t hi[3] = {0, 0, 0};
    size_t i = 0;
    for (size_t z = 0; z < Z; ++z) {
        for (size_t y = 0; y < H; ++y) {
            for (size_t x = 0; x < W; ++x, ++i) {
                if (!p[i]) continue;
                lo[0] = std::min(lo[0], z); hi[0] = std::max(hi[0], z + 1);
                lo[1] = std::min(lo[1], y); hi[1] = std::max(hi[1], y + 1);
                lo[2] = std::min(lo[2], x); hi[2] = std::max(hi[2], x + 1);
            }
        }
    }
    start.assign(nd, 0);
    extent.assign(nd, 0);
    if (lo[0] == SIZE_MAX) return;
    const size_t d0 = 3 - nd;
    for (size_t d = 0; d < nd; ++d) {
        start[d] = lo[d + d0];
        extent[d] = hi[d + d0] - lo[d + d0];
    }
}

} // namespace

BinaryMaskCollection::BinaryMaskCollection(Ticks ticks, std::vector<MaskData> masks,
    std::vector<PropsPtr> props, Log log)
    : ticks_(std::move(ticks)), masks_(std::move(masks)), log_(std::move(log)),
      props_(std::move(props)), propsMtx_(std::make_shared<std::mutex>()) {
    const std::vector<size_t> frame = ticks_.shape();
    for (size_t i = 0; i < masks_.size(); ++i) {
        const MaskData& m = masks_[i];
        if (m.binaryMask.ndim() != 2 && m.binaryMask.ndim() != 3) {
            fail<TypeMismatchError>("mask %zu: expected 2 or 3 dimensions; got %zu", i, m.binaryMask.ndim());
        }
        if (m.binaryMask.dtype() != DType::Bool) {
            fail<TypeMismatchError>("mask %zu: expected dtype bool; got %s", i, dtypeName(m.binaryMask.dtype()));
        }
        if (m.binaryMask.ndim() != frame.size() || m.offsets.size() != frame.size()) {
            fail<ShapeError>("mask %zu has rank %zu but the collection frame has rank %zu",
                i, m.binaryMask.ndim(), frame.size());
        }
        for (size_t d = 0; d < frame.size(); ++d) {
            if (m.offsets[d] + m.binaryMask.shape(d) > frame[d]) {
                fail<ShapeError>("mask %zu spans [%zu, %zu) on axis %s, outside the frame extent %zu",
                    i, m.offsets[d], m.offsets[d] + m.binaryMask.shape(d), axisName(ticks_.axisId(d)), frame[d]);
            }
        }
    }
    props_.resize(masks_.size());
}

BinaryMaskCollection BinaryMaskCollection::fromLabelImage(const LabelImage& labelImage) {
    std::vector<RegionProperties> props = regionProps(labelImage.array());
    std::vector<MaskData> masks;
    std::vector<PropsPtr> cached;
    masks.reserve(props.size());
    cached.reserve(props.size());
    for (size_t i = 0; i < props.size(); ++i) {
        RegionProperties& p = props[i];
        masks.push_back(MaskData{p.image, p.bboxMin});
        p.label = static_cast<int64_t>(i + 1);
        cached.push_back(std::make_shared<const RegionProperties>(std::move(p)));
    }
    debug("%s: Extracted %zu masks from a label image of shape %s",
        __func__, masks.size(), shapeToString(labelImage.shape()).c_str());
    return BinaryMaskCollection(labelImage.ticks(), std::move(masks), std::move(cached), labelImage.log());
}

BinaryMaskCollection BinaryMaskCollection::fromLabelArrayAndTicks(NdArray array, const TickInput& ticks, Log log) {
    return fromLabelImage(LabelImage::fromArrayAndTicks(std::move(array), ticks, std::move(log)));
}

BinaryMaskCollection BinaryMaskCollection::fromBinaryArraysAndTicks(const std::vector<NdArray>& arrays,
    const TickInput& ticks, Log log) {
    for (size_t i = 1; i < arrays.size(); ++i) {
        if (arrays[i].shape() != arrays[0].shape()) {
            fail<ShapeError>("all masks must be identically sized: array 0 has shape %s, array %zu has shape %s",
                shapeToString(arrays[0].shape()).c_str(), i, shapeToString(arrays[i].shape()).c_str());
        }
    }
    for (size_t i = 0; i < arrays.size(); ++i) {
        if (arrays[i].dtype() != DType::Bool) {
            fail<TypeMismatchError>("arrays must be binary data: array %zu has dtype %s",
                i, dtypeName(arrays[i].dtype()));
        }
    }
    Ticks resolved = arrays.empty() ? resolveTicks(ticks) : resolveTicks(arrays[0].shape(), ticks);

    std::vector<MaskData> masks;
    masks.reserve(arrays.size());
    std::vector<size_t> start, extent;
    for (const auto& a : arrays) {
        cropBounds(a, start, extent);
        masks.push_back(MaskData{a.crop(start, extent), start});
    }
    std::vector<PropsPtr> none(masks.size());
    return BinaryMaskCollection(std::move(resolved), std::move(masks), std::move(none), std::move(log));
}

void BinaryMaskCollection::checkIndex(size_t index, const char* caller) const {
    if (index >= masks_.size()) {
        fail<std::out_of_range>("%s: mask index %zu out of range for a collection of %zu masks",
            caller, index, masks_.size());
    }
}

const MaskData& BinaryMaskCollection::maskData(size_t index) const {
    checkIndex(index, __func__);
    return masks_[index];
}

std::string BinaryMaskCollection::maskName(size_t index) const {
    const int width = static_cast<int>(std::to_string(masks_.size() - 1).size());
    return formatString("%0*zu", width, index);
}

Mask BinaryMaskCollection::mask(size_t index) const {
    checkIndex(index, __func__);
    const MaskData& m = masks_[index];
    Mask out;
    out.name = maskName(index);
    out.data = m.binaryMask;
    out.ticks = ticks_.slice(m.offsets, m.binaryMask.shape());
    out.offsets = m.offsets;
    return out;
}

Mask BinaryMaskCollection::uncroppedMask(size_t index) const {
    checkIndex(index, __func__);
    const MaskData& m = masks_[index];
    const std::vector<size_t> frame = ticks_.shape();
    if (m.binaryMask.shape() == frame) {
        return mask(index);
    }
    Mask out;
    out.name = maskName(index);
    out.data = NdArray(DType::Bool, frame);
    fillFromMask<bool>(m, true, out.data);
    out.ticks = ticks_;
    out.offsets.assign(frame.size(), 0);
    return out;
}

BinaryMaskCollection::PropsPtr BinaryMaskCollection::computeRegionProps(size_t index) const {
    const MaskData& m = masks_[index];
    NdArray image(DType::UInt32, ticks_.shape());
    const uint32_t label = static_cast<uint32_t>(index + 1);
    fillFromMask<uint32_t>(m, label, image);
    std::vector<RegionProperties> props = regionProps(image);
    if (props.empty()) {
        RegionProperties p;
        p.label = label;
        p.bboxMin = m.offsets;
        p.bboxMax = m.offsets;
        p.image = NdArray(DType::Bool, std::vector<size_t>(m.offsets.size(), 0));
        return std::make_shared<const RegionProperties>(std::move(p));
    }
    return std::make_shared<const RegionProperties>(std::move(props[0]));
}

const RegionProperties& BinaryMaskCollection::maskRegionProps(size_t index) const {
    checkIndex(index, __func__);
    {
        std::lock_guard<std::mutex> lock(*propsMtx_);
        if (props_[index]) return *props_[index];
    }
    // computed without the lock; a concurrent caller may do the same and
    // the first result stored is kept
    PropsPtr computed = computeRegionProps(index);
    std::lock_guard<std::mutex> lock(*propsMtx_);
    if (!props_[index]) {
        props_[index] = std::move(computed);
    }
    return *props_[index];
}

bool BinaryMaskCollection::contains(size_t index, const std::vector<size_t>& pos) const {
    checkIndex(index, __func__);
    const MaskData& m = masks_[index];
    if (pos.size() != m.offsets.size()) {
        fail<ShapeError>("%s: position of rank %zu in a frame of rank %zu", __func__, pos.size(), m.offsets.size());
    }
    size_t flat = 0;
    for (size_t d = 0; d < pos.size(); ++d) {
        if (pos[d] < m.offsets[d] || pos[d] >= m.offsets[d] + m.binaryMask.shape(d)) {
            return false;
        }
        flat = flat * m.binaryMask.shape(d) + (pos[d] - m.offsets[d]);
    }
    return m.binaryMask.data<bool>()[flat];
}

LabelImage BinaryMaskCollection::toLabelImage() const {
    const std::vector<size_t> frame = ticks_.shape();
    if (masks_.size() < std::numeric_limits<uint16_t>::max()) {
        NdArray image(DType::UInt16, frame);
        for (size_t i = 0; i < masks_.size(); ++i) {
            fillFromMask<uint16_t>(masks_[i], static_cast<uint16_t>(i + 1), image);
        }
        return LabelImage::fromArrayAndTicks(std::move(image), ticks_, log_);
    }
    NdArray image(DType::UInt32, frame);
    for (size_t i = 0; i < masks_.size(); ++i) {
        fillFromMask<uint32_t>(masks_[i], static_cast<uint32_t>(i + 1), image);
    }
    return LabelImage::fromArrayAndTicks(std::move(image), ticks_, log_);
}
