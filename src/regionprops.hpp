#pragma once

#include <cstdint>
#include <vector>
#include "ndarray.hpp"

/// Geometry of one labeled region. Coordinates are array indices in the
/// frame the properties were computed on, in array axis order.
struct RegionProperties {
    int64_t label = 0;
    size_t area = 0;                 // number of pixels/voxels
    std::vector<double> centroid;
    std::vector<size_t> bboxMin;     // inclusive
    std::vector<size_t> bboxMax;     // exclusive
    NdArray image;                   // boolean, cropped to the bounding box

    std::vector<size_t> bboxExtent() const;
    bool operator==(const RegionProperties& o) const {
        return label == o.label && area == o.area && centroid == o.centroid
            && bboxMin == o.bboxMin && bboxMax == o.bboxMax && image == o.image;
    }
    bool operator!=(const RegionProperties& o) const { return !(*this == o); }
};

// One entry per distinct positive label of an integral raster, ascending
std::vector<RegionProperties> regionProps(const NdArray& labels);

enum class Connectivity : uint8_t {
    Face,  // 4-connected in 2D, 6-connected in 3D
    Full   // 8-connected in 2D, 26-connected in 3D
};

struct ComponentLabeling {
    static constexpr uint32_t NONE = UINT32_MAX;
    std::vector<uint32_t> component;  // per pixel, NONE for background
    uint32_t ncomp = 0;
    std::vector<uint32_t> compClass;  // class value shared by the component
    std::vector<uint64_t> compSize;
};

// Connected components of pixels sharing the same class. `classes` is row
// major over `shape` (rank 2 or 3); pixels with class `bg` are background.
// Components are numbered in order of their first pixel.
ComponentLabeling labelComponents(const std::vector<uint32_t>& classes,
    const std::vector<size_t>& shape, uint32_t bg, Connectivity conn = Connectivity::Face);
