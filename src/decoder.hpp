#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "codebook.hpp"
#include "intensity_table.hpp"
#include "feature_table.hpp"
#include "nanoflann_utils.h"

enum class DistanceMetric : uint8_t { Euclidean, Manhattan };
const char* metricName(DistanceMetric m);
DistanceMetric metricFromName(const std::string& name);

// Exact lookup of the per-round brightest channels
struct PerRoundMaxConfig {
    void validate() const {}
    nlohmann::json toJson() const;
    static PerRoundMaxConfig fromJson(const nlohmann::json& j);
};

// Nearest normalised codeword, accepted when
// distance <= distanceThreshold and magnitude >= magnitudeThreshold
struct MetricDecodeConfig {
    float distanceThreshold = 0.5176f;
    float magnitudeThreshold = 0.0f;
    int32_t normOrder = 2;
    DistanceMetric metric = DistanceMetric::Euclidean;

    void validate() const;  // ConfigError
    nlohmann::json toJson() const;
    static MetricDecodeConfig fromJson(const nlohmann::json& j);
};

using DecoderConfig = std::variant<PerRoundMaxConfig, MetricDecodeConfig>;
// {"method": "per_round_max" | "metric_distance", ...}
DecoderConfig decoderConfigFromJson(const nlohmann::json& j);
nlohmann::json decoderConfigToJson(const DecoderConfig& config);

/// KD-tree over the normalised codewords of a codebook
class NearestCodeword {
public:
    NearestCodeword(const Codebook& codebook, int32_t normOrder, DistanceMetric metric);
    NearestCodeword(const NearestCodeword&) = delete;
    NearestCodeword& operator=(const NearestCodeword&) = delete;

    // `v` is a normalised vector of codeLength() values
    void query(const float* v, int32_t& target, float& distance) const;
    int32_t codeLength() const { return static_cast<int32_t>(codewords_.cols()); }

private:
    RowMajorMatrixXf codewords_;
    MatrixRowCloud cloud_;
    DistanceMetric metric_;
    std::unique_ptr<kd_tree_l2_t> l2_;
    std::unique_ptr<kd_tree_l1_t> l1_;
};

// Throws ShapeError when the data's (round, channel) shape is not the codebook's
void checkCodebookShape(int32_t nRounds, int32_t nChannels, const Codebook& codebook);

FeatureTable decode(const IntensityTable& table, const Codebook& codebook, const PerRoundMaxConfig& config);
FeatureTable decode(const IntensityTable& table, const Codebook& codebook, const MetricDecodeConfig& config);
FeatureTable decode(const IntensityTable& table, const Codebook& codebook, const DecoderConfig& config);
