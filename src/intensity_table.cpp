#include "intensity_table.hpp"
#include "error.hpp"

IntensityTable::IntensityTable(int32_t nRounds_, int32_t nChannels_, size_t nFeatures)
    : nRounds(nRounds_), nChannels(nChannels_),
      intensities(RowMajorMatrixXf::Zero(nFeatures, static_cast<Eigen::Index>(nRounds_) * nChannels_)),
      xc(nFeatures, 0), yc(nFeatures, 0), zc(nFeatures, 0),
      x(nFeatures, 0), y(nFeatures, 0), z(nFeatures, 0) {}

void IntensityTable::validate() const {
    if (intensities.cols() != static_cast<Eigen::Index>(nRounds) * nChannels) {
        fail<ShapeError>("intensity table has %ld columns, expected %d rounds * %d channels",
            (long) intensities.cols(), nRounds, nChannels);
    }
    const size_t n = size();
    auto check = [n](size_t len, const char* name) {
        if (len != n) {
            fail<ShapeError>("intensity table column '%s' has %zu values for %zu features", name, len, n);
        }
    };
    check(xc.size(), "xc");
    check(yc.size(), "yc");
    check(zc.size(), "zc");
    check(x.size(), "x");
    check(y.size(), "y");
    check(z.size(), "z");
    if (!radius.empty()) check(radius.size(), "radius");
}

PixelIntensities PixelIntensities::fromImageStack(const NdArray& stack, const TickInput& ticks) {
    if (stack.ndim() != 4 && stack.ndim() != 5) {
        fail<ShapeError>("%s: expected an (r, c, [z,] y, x) stack, got rank %zu", __func__, stack.ndim());
    }
    if (stack.dtype() != DType::Float32) {
        fail<TypeMismatchError>("%s: expected float32 intensities, got %s", __func__, dtypeName(stack.dtype()));
    }
    if (stack.shape(0) == 0 || stack.shape(1) == 0) {
        fail<ShapeError>("%s: stack has %zu rounds and %zu channels", __func__, stack.shape(0), stack.shape(1));
    }
    PixelIntensities out;
    out.nRounds = static_cast<int32_t>(stack.shape(0));
    out.nChannels = static_cast<int32_t>(stack.shape(1));
    std::vector<size_t> frame(stack.shape().begin() + 2, stack.shape().end());
    out.ticks = resolveTicks(frame, ticks);
    const size_t nPix = stack.size() / (stack.shape(0) * stack.shape(1));
    const size_t nCodes = static_cast<size_t>(out.nRounds) * out.nChannels;
    out.values.resize(nPix, nCodes);
    const float* src = stack.data<float>();
    for (size_t rc = 0; rc < nCodes; ++rc) {
        const float* plane = src + rc * nPix;
        for (size_t p = 0; p < nPix; ++p) {
            out.values(p, rc) = plane[p];
        }
    }
    return out;
}

IntensityTable PixelIntensities::toIntensityTable() const {
    IntensityTable it(nRounds, nChannels, nPixels());
    it.intensities = values;
    const std::vector<size_t> shape = frameShape();
    const bool is3d = shape.size() == 3;
    const size_t Z = is3d ? shape[0] : 1;
    const size_t H = shape[shape.size() - 2];
    const size_t W = shape.back();
    size_t i = 0;
    for (size_t zi = 0; zi < Z; ++zi) {
        for (size_t yi = 0; yi < H; ++yi) {
            for (size_t xi = 0; xi < W; ++xi, ++i) {
                if (is3d) {
                    it.z[i] = ticks.z->pixel[zi];
                    it.zc[i] = ticks.z->physical[zi];
                }
                it.y[i] = ticks.y.pixel[yi];
                it.yc[i] = ticks.y.physical[yi];
                it.x[i] = ticks.x.pixel[xi];
                it.xc[i] = ticks.x.physical[xi];
            }
        }
    }
    return it;
}
