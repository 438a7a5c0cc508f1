#pragma once

#include <cstdint>
#include <limits>
#include <vector>
#include <nlohmann/json.hpp>
#include "decoder.hpp"
#include "label_image.hpp"
#include "regionprops.hpp"

struct PixelDecoderConfig {
    float distanceThreshold = 0.5176f;
    float magnitudeThreshold = 0.0f;
    int32_t minArea = 2;
    int32_t maxArea = std::numeric_limits<int32_t>::max();
    int32_t normOrder = 2;
    DistanceMetric metric = DistanceMetric::Euclidean;
    Connectivity connectivity = Connectivity::Face;

    void validate() const;  // ConfigError
    nlohmann::json toJson() const;
    static PixelDecoderConfig fromJson(const nlohmann::json& j);
};

struct ConnectedComponentDecodingResult {
    LabelImage labelImage;    // component index + 1, 0 for background
    LabelImage decodedImage;  // codebook target index + 1, 0 for background
    std::vector<RegionProperties> regionProperties;  // label = component index + 1
};

struct PixelDecodingResult {
    FeatureTable features;  // one row per component, including rejected ones
    ConnectedComponentDecodingResult components;
};

/// Decodes every pixel against the codebook, groups adjacent foreground
/// pixels with the same target and filters the groups by area and mean
/// distance.
class PixelSpotDecoder {
public:
    PixelSpotDecoder(Codebook codebook, PixelDecoderConfig config);

    PixelDecodingResult run(const PixelIntensities& pixels) const;
    const PixelDecoderConfig& config() const { return config_; }

private:
    Codebook codebook_;
    PixelDecoderConfig config_;
    NearestCodeword nearest_;
};
