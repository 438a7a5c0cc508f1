#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "ndarray.hpp"
#include "ticks.hpp"
#include "provenance.hpp"
#include "label_image.hpp"
#include "regionprops.hpp"

#define SPOTCALL_MASK_COLLECTION_DOCTYPE "spotcall/BinaryMaskCollection"

struct Archive;

// A boolean mask cropped to its tight bounding box, with the offset of that
// box inside the uncropped frame
struct MaskData {
    NdArray binaryMask;
    std::vector<size_t> offsets;
};

// A mask materialised with the ticks of the region it covers
struct Mask {
    std::string name;
    NdArray data;
    Ticks ticks;
    std::vector<size_t> offsets;
};

/// Immutable, ordered set of binary masks sharing one coordinate frame.
/// Region properties are the only mutable state: they are computed on first
/// request and cached, safely under concurrent readers.
class BinaryMaskCollection {
public:
    // One mask per distinct positive label, ascending label order
    static BinaryMaskCollection fromLabelImage(const LabelImage& labelImage);
    static BinaryMaskCollection fromLabelArrayAndTicks(NdArray array, const TickInput& ticks, Log log = Log());
    // Each boolean array is cropped independently; an all-false array crops
    // to zero extent on every axis
    static BinaryMaskCollection fromBinaryArraysAndTicks(const std::vector<NdArray>& arrays,
        const TickInput& ticks, Log log = Log());

    size_t size() const { return masks_.size(); }
    size_t ndim() const { return ticks_.ndim(); }
    std::vector<size_t> maxShape() const { return ticks_.shape(); }
    const Ticks& ticks() const { return ticks_; }
    const Log& log() const { return log_; }
    const MaskData& maskData(size_t index) const;

    Mask mask(size_t index) const;
    Mask uncroppedMask(size_t index) const;
    const RegionProperties& maskRegionProps(size_t index) const;
    // True if mask `index` covers the frame position `pos` (array indices)
    bool contains(size_t index, const std::vector<size_t>& pos) const;

    // Masks painted with label index+1 in ascending order; later masks win
    LabelImage toLabelImage() const;

    std::vector<uint8_t> toBytes() const;
    static BinaryMaskCollection fromBytes(const std::vector<uint8_t>& bytes);
    void save(const std::string& path) const;
    static BinaryMaskCollection fromDisk(const std::string& path);

private:
    using PropsPtr = std::shared_ptr<const RegionProperties>;

    BinaryMaskCollection(Ticks ticks, std::vector<MaskData> masks, std::vector<PropsPtr> props, Log log);

    Ticks ticks_;
    std::vector<MaskData> masks_;
    Log log_;
    mutable std::vector<PropsPtr> props_;
    std::shared_ptr<std::mutex> propsMtx_;

    std::string maskName(size_t index) const;
    void checkIndex(size_t index, const char* caller) const;
    PropsPtr computeRegionProps(size_t index) const;
    Archive toArchive() const;
    static BinaryMaskCollection fromArchive(Archive ar);
};
