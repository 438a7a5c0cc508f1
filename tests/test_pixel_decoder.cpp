#include <gtest/gtest.h>
#include <cmath>
#include "pixel_decoder.hpp"

namespace {

const std::vector<float> kActb = {1, 0, 0, 1};
const std::vector<float> kGapdh = {0, 1, 0.5f, 0};
const std::vector<float> kEmpty = {0, 0, 0, 0};

Codebook twoTargetCodebook() {
    RowMajorMatrixXf values(2, 4);
    values << 1, 0, 0, 1,
              0, 1, 0.5f, 0;
    return Codebook({"ACTB", "GAPDH"}, 2, 2, values);
}

// (2 rounds, 2 channels, H, W) stack from per-pixel vectors in row-major order
PixelIntensities pixelsOf(size_t H, size_t W, const std::vector<std::vector<float>>& px) {
    NdArray stack(DType::Float32, {2, 2, H, W});
    float* v = stack.data<float>();
    const size_t nPix = H * W;
    for (size_t p = 0; p < nPix; ++p) {
        for (size_t rc = 0; rc < 4; ++rc) v[rc * nPix + p] = px[p][rc];
    }
    TickInput in;
    in.yc = std::vector<double>(H);
    in.xc = std::vector<double>(W);
    for (size_t y = 0; y < H; ++y) (*in.yc)[y] = 100.0 + static_cast<double>(y);
    for (size_t x = 0; x < W; ++x) (*in.xc)[x] = 10.0 + 0.5 * static_cast<double>(x);
    return PixelIntensities::fromImageStack(stack, in);
}

} // namespace

TEST(PixelSpotDecoder, AreaThresholdBoundary) {
    Codebook cb = twoTargetCodebook();
    PixelIntensities px = pixelsOf(1, 5, {kActb, kActb, kEmpty, kActb, kEmpty});
    PixelDecoderConfig cfg;
    cfg.minArea = 2;
    PixelSpotDecoder decoder(cb, cfg);
    PixelDecodingResult res = decoder.run(px);

    ASSERT_EQ(res.features.size(), 2u);
    const Feature& big = res.features.at(0);
    const Feature& small = res.features.at(1);
    EXPECT_EQ(big.area, 2);
    EXPECT_TRUE(big.passesThresholds);
    EXPECT_EQ(big.target, "ACTB");
    EXPECT_EQ(small.area, 1);
    EXPECT_FALSE(small.passesThresholds);
    EXPECT_EQ(small.target, "ACTB");

    EXPECT_DOUBLE_EQ(big.xc, 10.25);
    EXPECT_DOUBLE_EQ(big.yc, 100.0);
    EXPECT_EQ(small.x, 3);
    EXPECT_FLOAT_EQ(big.radius, static_cast<float>(std::sqrt(2.0 / 3.14159265358979323846)));
}

TEST(PixelSpotDecoder, MaxAreaIsInclusive) {
    Codebook cb = twoTargetCodebook();
    PixelIntensities px = pixelsOf(1, 4, {kActb, kActb, kActb, kEmpty});
    PixelDecoderConfig cfg;
    cfg.minArea = 1;
    cfg.maxArea = 3;
    EXPECT_TRUE(PixelSpotDecoder(cb, cfg).run(px).features.at(0).passesThresholds);
    cfg.maxArea = 2;
    EXPECT_FALSE(PixelSpotDecoder(cb, cfg).run(px).features.at(0).passesThresholds);
}

TEST(PixelSpotDecoder, DistanceThresholdBoundary) {
    Codebook cb = twoTargetCodebook();
    const std::vector<float> noisy = {1.0f, 0.3f, 0.0f, 0.6f};
    PixelIntensities px = pixelsOf(1, 3, {noisy, noisy, kEmpty});
    PixelDecoderConfig cfg;
    cfg.distanceThreshold = 10.0f;
    const float d = PixelSpotDecoder(cb, cfg).run(px).features.at(0).distance;
    ASSERT_GT(d, 0.0f);

    cfg.distanceThreshold = d;
    EXPECT_TRUE(PixelSpotDecoder(cb, cfg).run(px).features.at(0).passesThresholds);
    cfg.distanceThreshold = std::nextafter(d, 0.0f);
    PixelDecodingResult rejected = PixelSpotDecoder(cb, cfg).run(px);
    ASSERT_EQ(rejected.features.size(), 1u);
    EXPECT_FALSE(rejected.features.at(0).passesThresholds);
    EXPECT_EQ(rejected.features.at(0).target, "ACTB");
}

TEST(PixelSpotDecoder, MeanDistanceAtThresholdPasses) {
    Codebook cb = twoTargetCodebook();
    // three ACTB pixels at different distances from the codeword
    const std::vector<float> a = {1.0f, 0.3f, 0.0f, 0.6f};
    const std::vector<float> b = {1.0f, 0.1f, 0.0f, 0.9f};
    const std::vector<float> c = {0.8f, 0.0f, 0.2f, 1.0f};
    PixelIntensities px = pixelsOf(1, 4, {a, b, c, kEmpty});
    PixelDecoderConfig cfg;
    cfg.distanceThreshold = 10.0f;
    const Feature loose = PixelSpotDecoder(cb, cfg).run(px).features.at(0);
    ASSERT_EQ(loose.area, 3);
    ASSERT_EQ(loose.target, "ACTB");

    cfg.distanceThreshold = loose.distance;
    const Feature exact = PixelSpotDecoder(cb, cfg).run(px).features.at(0);
    EXPECT_EQ(exact.distance, loose.distance);
    EXPECT_TRUE(exact.passesThresholds);

    cfg.distanceThreshold = std::nextafter(loose.distance, 0.0f);
    EXPECT_FALSE(PixelSpotDecoder(cb, cfg).run(px).features.at(0).passesThresholds);
}

TEST(PixelSpotDecoder, OwnsItsCodebook) {
    const Codebook reference = Codebook::synthetic(3, 2, 2, 7);
    std::vector<float> code(reference.values().row(1).data(), reference.values().row(1).data() + 4);
    PixelIntensities px = pixelsOf(1, 3, {code, code, kEmpty});
    PixelDecoderConfig cfg;
    // the decoder outlives the temporary codebook it was built from
    PixelSpotDecoder decoder(Codebook::synthetic(3, 2, 2, 7), cfg);
    PixelDecodingResult res = decoder.run(px);
    ASSERT_EQ(res.features.size(), 1u);
    EXPECT_EQ(res.features.at(0).target, reference.target(1));
    EXPECT_EQ(res.features.at(0).area, 2);
    EXPECT_TRUE(res.features.at(0).passesThresholds);
}

TEST(PixelSpotDecoder, SeparatesTargetsAndBuildsImages) {
    Codebook cb = twoTargetCodebook();
    // row 0: ACTB ACTB GAPDH
    // row 1: empty ACTB GAPDH
    PixelIntensities px = pixelsOf(2, 3, {kActb, kActb, kGapdh, kEmpty, kActb, kGapdh});
    PixelDecoderConfig cfg;
    PixelDecodingResult res = PixelSpotDecoder(cb, cfg).run(px);

    ASSERT_EQ(res.features.size(), 2u);
    EXPECT_EQ(res.features.at(0).target, "ACTB");
    EXPECT_EQ(res.features.at(0).area, 3);
    EXPECT_EQ(res.features.at(1).target, "GAPDH");
    EXPECT_EQ(res.features.at(1).area, 2);

    const NdArray& labels = res.components.labelImage.array();
    EXPECT_EQ(labels, NdArray::fromValues<int32_t>({2, 3}, {1, 1, 2, 0, 1, 2}));
    const NdArray& decoded = res.components.decodedImage.array();
    EXPECT_EQ(decoded, NdArray::fromValues<int32_t>({2, 3}, {1, 1, 2, 0, 1, 2}));
    EXPECT_EQ(res.components.labelImage.ticks(), px.ticks);

    ASSERT_EQ(res.components.regionProperties.size(), 2u);
    EXPECT_EQ(res.components.regionProperties[0].label, 1);
    EXPECT_EQ(res.components.regionProperties[0].area, 3u);
    EXPECT_EQ(res.components.regionProperties[1].bboxMin, (std::vector<size_t>{0, 2}));
    EXPECT_EQ(res.features.log().entries().back().method, "PixelSpotDecoder");
}

TEST(PixelSpotDecoder, Connectivity) {
    Codebook cb = twoTargetCodebook();
    PixelIntensities px = pixelsOf(2, 2, {kActb, kEmpty, kEmpty, kActb});
    PixelDecoderConfig cfg;
    cfg.minArea = 1;
    EXPECT_EQ(PixelSpotDecoder(cb, cfg).run(px).features.size(), 2u);
    cfg.connectivity = Connectivity::Full;
    PixelDecodingResult res = PixelSpotDecoder(cb, cfg).run(px);
    ASSERT_EQ(res.features.size(), 1u);
    EXPECT_EQ(res.features.at(0).area, 2);
}

TEST(PixelSpotDecoder, MagnitudeThresholdRemovesBackground) {
    Codebook cb = twoTargetCodebook();
    std::vector<float> dim = {0.1f, 0, 0, 0.1f};
    PixelIntensities px = pixelsOf(1, 4, {kActb, kActb, dim, dim});
    PixelDecoderConfig cfg;
    cfg.magnitudeThreshold = 1.0f;
    PixelDecodingResult res = PixelSpotDecoder(cb, cfg).run(px);
    ASSERT_EQ(res.features.size(), 1u);
    EXPECT_EQ(res.features.at(0).area, 2);
    EXPECT_EQ(res.components.decodedImage.array().at<int32_t>(0, 3), 0);
}

TEST(PixelSpotDecoder, ThreeDimensionalFrame) {
    Codebook cb = twoTargetCodebook();
    NdArray stack(DType::Float32, {2, 2, 2, 1, 1});
    float* v = stack.data<float>();
    // both planes hold the ACTB code: (r0 c0) and (r1 c1)
    v[0] = v[1] = 1.0f;
    v[6] = v[7] = 1.0f;
    TickInput in;
    in.zc = std::vector<double>{0.0, 2.0};
    in.yc = std::vector<double>{5.0};
    in.xc = std::vector<double>{7.0};
    PixelIntensities px = PixelIntensities::fromImageStack(stack, in);
    PixelDecoderConfig cfg;
    PixelDecodingResult res = PixelSpotDecoder(cb, cfg).run(px);
    ASSERT_EQ(res.features.size(), 1u);
    EXPECT_EQ(res.features.at(0).area, 2);
    EXPECT_DOUBLE_EQ(res.features.at(0).zc, 1.0);
    EXPECT_EQ(res.components.labelImage.ndim(), 3u);
}

TEST(PixelSpotDecoder, ConfigValidation) {
    Codebook cb = twoTargetCodebook();
    PixelDecoderConfig cfg;
    cfg.minArea = 5;
    cfg.maxArea = 4;
    EXPECT_THROW((void) PixelSpotDecoder(cb, cfg), ConfigError);
    cfg.maxArea = 5;
    cfg.distanceThreshold = -1.0f;
    EXPECT_THROW((void) PixelSpotDecoder(cb, cfg), ConfigError);

    EXPECT_THROW(PixelDecoderConfig::fromJson({{"min_area", 3}, {"max_area", 2}}), ConfigError);
    EXPECT_THROW(PixelDecoderConfig::fromJson({{"connectivity", "diagonal"}}), ConfigError);
    PixelDecoderConfig parsed = PixelDecoderConfig::fromJson({{"min_area", 4}, {"connectivity", "full"}});
    EXPECT_EQ(parsed.minArea, 4);
    EXPECT_EQ(parsed.connectivity, Connectivity::Full);
}

TEST(PixelSpotDecoder, CodebookShapeMismatch) {
    Codebook cb = Codebook::synthetic(3, 3, 2, 1);
    PixelIntensities px = pixelsOf(1, 2, {kActb, kActb});
    PixelDecoderConfig cfg;
    PixelSpotDecoder decoder(cb, cfg);
    EXPECT_THROW(decoder.run(px), ShapeError);
}

TEST(PixelIntensities, FromImageStackValidation) {
    TickInput in;
    in.yc = std::vector<double>{0};
    in.xc = std::vector<double>{0};
    EXPECT_THROW(PixelIntensities::fromImageStack(NdArray(DType::Float32, {1, 1}), in), ShapeError);
    EXPECT_THROW(PixelIntensities::fromImageStack(NdArray(DType::UInt16, {1, 1, 1, 1}), in), TypeMismatchError);

    PixelIntensities px = PixelIntensities::fromImageStack(NdArray(DType::Float32, {2, 3, 1, 1}), in);
    EXPECT_EQ(px.nPixels(), 1u);
    IntensityTable table = px.toIntensityTable();
    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.intensities.cols(), 6);
}
