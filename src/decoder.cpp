#include "decoder.hpp"
#include "error.hpp"
#include <cmath>
#include <limits>

const char* metricName(DistanceMetric m) {
    switch (m) {
        case DistanceMetric::Euclidean: return "euclidean";
        case DistanceMetric::Manhattan: return "manhattan";
    }
    return "unknown";
}

DistanceMetric metricFromName(const std::string& name) {
    if (name == "euclidean") return DistanceMetric::Euclidean;
    if (name == "manhattan" || name == "cityblock") return DistanceMetric::Manhattan;
    fail<ConfigError>("Unsupported distance metric '%s'", name.c_str());
}

nlohmann::json PerRoundMaxConfig::toJson() const {
    return nlohmann::json{{"method", "per_round_max"}};
}

PerRoundMaxConfig PerRoundMaxConfig::fromJson(const nlohmann::json&) {
    return PerRoundMaxConfig();
}

void MetricDecodeConfig::validate() const {
    if (!(distanceThreshold >= 0)) {
        fail<ConfigError>("distance_threshold must be non-negative, got %g", distanceThreshold);
    }
    if (!(magnitudeThreshold >= 0)) {
        fail<ConfigError>("magnitude_threshold must be non-negative, got %g", magnitudeThreshold);
    }
    if (normOrder != 1 && normOrder != 2) {
        fail<ConfigError>("norm_order must be 1 or 2, got %d", normOrder);
    }
}

nlohmann::json MetricDecodeConfig::toJson() const {
    return nlohmann::json{
        {"method", "metric_distance"},
        {"distance_threshold", distanceThreshold},
        {"magnitude_threshold", magnitudeThreshold},
        {"norm_order", normOrder},
        {"metric", metricName(metric)}};
}

MetricDecodeConfig MetricDecodeConfig::fromJson(const nlohmann::json& j) {
    MetricDecodeConfig cfg;
    cfg.distanceThreshold = j.value("distance_threshold", cfg.distanceThreshold);
    cfg.magnitudeThreshold = j.value("magnitude_threshold", cfg.magnitudeThreshold);
    cfg.normOrder = j.value("norm_order", cfg.normOrder);
    cfg.metric = metricFromName(j.value("metric", std::string(metricName(cfg.metric))));
    cfg.validate();
    return cfg;
}

DecoderConfig decoderConfigFromJson(const nlohmann::json& j) {
    const std::string method = j.value("method", std::string());
    if (method == "per_round_max") return PerRoundMaxConfig::fromJson(j);
    if (method == "metric_distance") return MetricDecodeConfig::fromJson(j);
    fail<ConfigError>("Unknown decoding method '%s'", method.c_str());
}

nlohmann::json decoderConfigToJson(const DecoderConfig& config) {
    return std::visit([](const auto& cfg) { return cfg.toJson(); }, config);
}

NearestCodeword::NearestCodeword(const Codebook& codebook, int32_t normOrder, DistanceMetric metric)
    : codewords_(codebook.normalizedCodewords(normOrder)), cloud_(codewords_), metric_(metric) {
    const int32_t dim = static_cast<int32_t>(codewords_.cols());
    if (metric_ == DistanceMetric::Euclidean) {
        l2_ = std::make_unique<kd_tree_l2_t>(dim, cloud_, nanoflann::KDTreeSingleIndexAdaptorParams(10));
    } else {
        l1_ = std::make_unique<kd_tree_l1_t>(dim, cloud_, nanoflann::KDTreeSingleIndexAdaptorParams(10));
    }
}

void NearestCodeword::query(const float* v, int32_t& target, float& distance) const {
    uint32_t idx = 0;
    float dist = 0;
    nanoflann::KNNResultSet<float, uint32_t> resultSet(1);
    resultSet.init(&idx, &dist);
    if (l2_) {
        l2_->findNeighbors(resultSet, v);
        dist = std::sqrt(dist);
    } else {
        l1_->findNeighbors(resultSet, v);
    }
    target = static_cast<int32_t>(idx);
    distance = dist;
}

void checkCodebookShape(int32_t nRounds, int32_t nChannels, const Codebook& codebook) {
    if (nRounds != codebook.nRounds() || nChannels != codebook.nChannels()) {
        fail<ShapeError>("data has %d rounds and %d channels but the codebook has %d rounds and %d channels",
            nRounds, nChannels, codebook.nRounds(), codebook.nChannels());
    }
}

namespace {

Feature featureAt(const IntensityTable& table, size_t i) {
    Feature f;
    f.xc = table.xc[i];
    f.yc = table.yc[i];
    f.zc = table.zc[i];
    f.x = table.x[i];
    f.y = table.y[i];
    f.z = table.z[i];
    if (!table.radius.empty()) f.radius = table.radius[i];
    return f;
}

} // namespace

FeatureTable decode(const IntensityTable& table, const Codebook& codebook, const PerRoundMaxConfig& config) {
    config.validate();
    table.validate();
    checkCodebookShape(table.nRounds, table.nChannels, codebook);
    const RowMajorMatrixXf codewords = codebook.normalizedCodewords(2);
    const int32_t R = table.nRounds, C = table.nChannels;

    FeatureTable out;
    size_t nCalled = 0;
    for (size_t i = 0; i < table.size(); ++i) {
        Feature f = featureAt(table, i);
        const auto row = table.intensities.row(static_cast<Eigen::Index>(i));
        std::optional<int32_t> t = codebook.findCode(perRoundArgmax(row, R, C));
        if (t) {
            const float norm = row.norm();
            VectorXf obs = row.transpose();
            if (norm > 0) obs /= norm;
            f.target = codebook.target(*t);
            f.distance = (obs - codewords.row(*t).transpose()).norm();
            f.passesThresholds = true;
            ++nCalled;
        } else {
            f.target = SPOTCALL_NO_CALL;
            f.distance = std::numeric_limits<float>::quiet_NaN();
            f.passesThresholds = false;
        }
        out.append(std::move(f));
    }
    out.log().append("PerRoundMaxChannel", config.toJson());
    notice("%s: %zu of %zu features matched a codeword", __func__, nCalled, table.size());
    return out;
}

FeatureTable decode(const IntensityTable& table, const Codebook& codebook, const MetricDecodeConfig& config) {
    config.validate();
    table.validate();
    checkCodebookShape(table.nRounds, table.nChannels, codebook);
    NearestCodeword nearest(codebook, config.normOrder, config.metric);
    const VectorXf magnitudes = rowNorms(table.intensities, config.normOrder);
    const RowMajorMatrixXf normed = rowNormalize(table.intensities, config.normOrder);

    FeatureTable out;
    size_t nPass = 0;
    for (size_t i = 0; i < table.size(); ++i) {
        Feature f = featureAt(table, i);
        int32_t t = 0;
        float dist = 0;
        nearest.query(normed.row(static_cast<Eigen::Index>(i)).data(), t, dist);
        f.target = codebook.target(t);
        f.distance = dist;
        f.passesThresholds = dist <= config.distanceThreshold
            && magnitudes(static_cast<Eigen::Index>(i)) >= config.magnitudeThreshold;
        if (f.passesThresholds) ++nPass;
        out.append(std::move(f));
    }
    out.log().append("MetricDistance", config.toJson());
    notice("%s: %zu of %zu features pass the distance and magnitude thresholds", __func__, nPass, table.size());
    return out;
}

FeatureTable decode(const IntensityTable& table, const Codebook& codebook, const DecoderConfig& config) {
    return std::visit([&](const auto& cfg) { return decode(table, codebook, cfg); }, config);
}
