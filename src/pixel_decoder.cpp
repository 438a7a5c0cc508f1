#include "pixel_decoder.hpp"
#include "error.hpp"
#include <cmath>

void PixelDecoderConfig::validate() const {
    if (!(distanceThreshold >= 0)) {
        fail<ConfigError>("distance_threshold must be non-negative, got %g", distanceThreshold);
    }
    if (!(magnitudeThreshold >= 0)) {
        fail<ConfigError>("magnitude_threshold must be non-negative, got %g", magnitudeThreshold);
    }
    if (minArea < 0) {
        fail<ConfigError>("min_area must be non-negative, got %d", minArea);
    }
    if (minArea > maxArea) {
        fail<ConfigError>("min_area (%d) is larger than max_area (%d)", minArea, maxArea);
    }
    if (normOrder != 1 && normOrder != 2) {
        fail<ConfigError>("norm_order must be 1 or 2, got %d", normOrder);
    }
}

nlohmann::json PixelDecoderConfig::toJson() const {
    return nlohmann::json{
        {"method", "pixel_spot_decoder"},
        {"distance_threshold", distanceThreshold},
        {"magnitude_threshold", magnitudeThreshold},
        {"min_area", minArea},
        {"max_area", maxArea},
        {"norm_order", normOrder},
        {"metric", metricName(metric)},
        {"connectivity", connectivity == Connectivity::Full ? "full" : "face"}};
}

PixelDecoderConfig PixelDecoderConfig::fromJson(const nlohmann::json& j) {
    PixelDecoderConfig cfg;
    cfg.distanceThreshold = j.value("distance_threshold", cfg.distanceThreshold);
    cfg.magnitudeThreshold = j.value("magnitude_threshold", cfg.magnitudeThreshold);
    cfg.minArea = j.value("min_area", cfg.minArea);
    cfg.maxArea = j.value("max_area", cfg.maxArea);
    cfg.normOrder = j.value("norm_order", cfg.normOrder);
    cfg.metric = metricFromName(j.value("metric", std::string(metricName(cfg.metric))));
    const std::string conn = j.value("connectivity", std::string("face"));
    if (conn == "face") {
        cfg.connectivity = Connectivity::Face;
    } else if (conn == "full") {
        cfg.connectivity = Connectivity::Full;
    } else {
        fail<ConfigError>("connectivity must be 'face' or 'full', got '%s'", conn.c_str());
    }
    cfg.validate();
    return cfg;
}

namespace {

constexpr double kPi = 3.14159265358979323846;

PixelDecoderConfig validated(PixelDecoderConfig cfg) {
    cfg.validate();
    return cfg;
}

// Physical coordinate at a fractional array index, linear between ticks
double interpolateTick(const AxisTicks& t, double idx) {
    const size_t n = t.physical.size();
    if (n == 0) return 0;
    const double fl = std::floor(idx);
    size_t i0 = fl <= 0 ? 0 : static_cast<size_t>(fl);
    if (i0 >= n - 1) return t.physical[n - 1];
    const double frac = idx - static_cast<double>(i0);
    return t.physical[i0] + frac * (t.physical[i0 + 1] - t.physical[i0]);
}

int32_t nearestPixelTick(const AxisTicks& t, double idx) {
    size_t i = static_cast<size_t>(std::llround(idx));
    if (i >= t.pixel.size()) i = t.pixel.size() - 1;
    return t.pixel[i];
}

} // namespace

PixelSpotDecoder::PixelSpotDecoder(Codebook codebook, PixelDecoderConfig config)
    : codebook_(std::move(codebook)), config_(validated(std::move(config))),
      nearest_(codebook_, config_.normOrder, config_.metric) {}

PixelDecodingResult PixelSpotDecoder::run(const PixelIntensities& pixels) const {
    checkCodebookShape(pixels.nRounds, pixels.nChannels, codebook_);
    const std::vector<size_t> shape = pixels.frameShape();
    const size_t nPix = pixels.nPixels();
    size_t frameSize = 1;
    for (size_t s : shape) frameSize *= s;
    if (nPix != frameSize) {
        fail<ShapeError>("%s: %zu pixel vectors for a frame of shape %s",
            __func__, nPix, shapeToString(shape).c_str());
    }

    // 1. per pixel nearest codeword for the foreground
    const VectorXf magnitudes = rowNorms(pixels.values, config_.normOrder);
    const RowMajorMatrixXf normed = rowNormalize(pixels.values, config_.normOrder);
    std::vector<uint32_t> classes(nPix, 0);
    std::vector<float> dists(nPix, std::numeric_limits<float>::quiet_NaN());
    size_t nForeground = 0;
    for (size_t p = 0; p < nPix; ++p) {
        const float mag = magnitudes(static_cast<Eigen::Index>(p));
        if (!(mag > 0) || mag < config_.magnitudeThreshold) continue;
        int32_t t = 0;
        nearest_.query(normed.row(static_cast<Eigen::Index>(p)).data(), t, dists[p]);
        classes[p] = static_cast<uint32_t>(t) + 1;
        ++nForeground;
    }

    // 2. cluster same-target neighbours
    ComponentLabeling ccl = labelComponents(classes, shape, 0, config_.connectivity);

    // 3. per cluster statistics
    const bool is3d = shape.size() == 3;
    const size_t Z = is3d ? shape[0] : 1;
    const size_t H = shape[shape.size() - 2];
    const size_t W = shape.back();
    std::vector<double> sumZ(ccl.ncomp, 0), sumY(ccl.ncomp, 0), sumX(ccl.ncomp, 0), sumD(ccl.ncomp, 0);
    NdArray labels(DType::Int32, shape);
    NdArray decoded(DType::Int32, shape);
    int32_t* lab = labels.data<int32_t>();
    int32_t* dec = decoded.data<int32_t>();
    size_t idx = 0;
    for (size_t z = 0; z < Z; ++z) {
        for (size_t y = 0; y < H; ++y) {
            for (size_t x = 0; x < W; ++x, ++idx) {
                dec[idx] = static_cast<int32_t>(classes[idx]);
                const uint32_t c = ccl.component[idx];
                if (c == ComponentLabeling::NONE) continue;
                lab[idx] = static_cast<int32_t>(c) + 1;
                sumZ[c] += static_cast<double>(z);
                sumY[c] += static_cast<double>(y);
                sumX[c] += static_cast<double>(x);
                sumD[c] += static_cast<double>(dists[idx]);
            }
        }
    }

    // 4. filter by area and mean distance, keeping rejected clusters
    FeatureTable features;
    size_t nPass = 0;
    for (uint32_t c = 0; c < ccl.ncomp; ++c) {
        const double area = static_cast<double>(ccl.compSize[c]);
        // reported and compared as the same float
        const float meanDist = static_cast<float>(sumD[c] / area);
        const double cz = sumZ[c] / area, cy = sumY[c] / area, cx = sumX[c] / area;
        Feature f;
        f.target = codebook_.target(static_cast<int32_t>(ccl.compClass[c]) - 1);
        f.distance = meanDist;
        f.area = static_cast<int32_t>(ccl.compSize[c]);
        f.radius = static_cast<float>(std::sqrt(area / kPi));
        f.passesThresholds = f.area >= config_.minArea && f.area <= config_.maxArea
            && meanDist <= config_.distanceThreshold;
        if (is3d) {
            f.zc = interpolateTick(*pixels.ticks.z, cz);
            f.z = nearestPixelTick(*pixels.ticks.z, cz);
        }
        f.yc = interpolateTick(pixels.ticks.y, cy);
        f.y = nearestPixelTick(pixels.ticks.y, cy);
        f.xc = interpolateTick(pixels.ticks.x, cx);
        f.x = nearestPixelTick(pixels.ticks.x, cx);
        if (f.passesThresholds) ++nPass;
        features.append(std::move(f));
    }
    features.log().append("PixelSpotDecoder", config_.toJson());
    notice("%s: %zu of %zu pixels in the foreground, %u clusters, %zu pass area and distance thresholds",
        __func__, nForeground, nPix, ccl.ncomp, nPass);

    std::vector<RegionProperties> props = regionProps(labels);
    Log log;
    log.append("PixelSpotDecoder", config_.toJson());
    LabelImage labelImage = LabelImage::fromArrayAndTicks(std::move(labels), pixels.ticks, log);
    LabelImage decodedImage = LabelImage::fromArrayAndTicks(std::move(decoded), pixels.ticks, log);
    return PixelDecodingResult{std::move(features),
        ConnectedComponentDecodingResult{std::move(labelImage), std::move(decodedImage), std::move(props)}};
}
