#pragma once

#include <cstdint>
#include <vector>
#include "numerical_utils.hpp"
#include "ndarray.hpp"
#include "ticks.hpp"

/// Per-feature (spot or pixel) intensity vectors over (round, channel),
/// flattened as column r*nChannels + c, with each feature's position
struct IntensityTable {
    int32_t nRounds = 0;
    int32_t nChannels = 0;
    RowMajorMatrixXf intensities;     // nFeatures x (nRounds * nChannels)
    std::vector<double> xc, yc, zc;   // physical
    std::vector<int32_t> x, y, z;     // pixel
    std::vector<float> radius;        // optional, empty or one per feature

    IntensityTable() = default;
    IntensityTable(int32_t nRounds_, int32_t nChannels_, size_t nFeatures);

    size_t size() const { return static_cast<size_t>(intensities.rows()); }
    // Throws ShapeError when a column disagrees with the feature count
    void validate() const;
};

/// Per-pixel intensity vectors over a 2D or 3D frame
struct PixelIntensities {
    int32_t nRounds = 0;
    int32_t nChannels = 0;
    Ticks ticks;
    RowMajorMatrixXf values;  // one row per pixel, frame in row-major order

    // `stack` is a float32 array of shape (r, c, y, x) or (r, c, z, y, x)
    static PixelIntensities fromImageStack(const NdArray& stack, const TickInput& ticks);

    std::vector<size_t> frameShape() const { return ticks.shape(); }
    size_t nPixels() const { return static_cast<size_t>(values.rows()); }
    // One row per pixel with its pixel and physical coordinates
    IntensityTable toIntensityTable() const;
};
