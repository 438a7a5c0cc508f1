#include "codebook.hpp"
#include "error.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <random>
#include <set>

Codebook::Codebook(std::vector<std::string> targets, int32_t nRounds, int32_t nChannels, RowMajorMatrixXf values)
    : targets_(std::move(targets)), nRounds_(nRounds), nChannels_(nChannels), values_(std::move(values)) {
    if (nRounds_ < 1 || nChannels_ < 1) {
        fail<ShapeError>("codebook needs at least one round and one channel, got %d rounds and %d channels",
            nRounds_, nChannels_);
    }
    if (values_.rows() != static_cast<Eigen::Index>(targets_.size())
        || values_.cols() != static_cast<Eigen::Index>(nRounds_) * nChannels_) {
        fail<ShapeError>("codebook values are %ld x %ld, expected %zu targets x (%d rounds * %d channels)",
            (long) values_.rows(), (long) values_.cols(), targets_.size(), nRounds_, nChannels_);
    }
    if (targets_.empty()) {
        fail<ConfigError>("codebook has no targets");
    }
    std::set<std::string> seen;
    for (const auto& t : targets_) {
        if (t.empty()) {
            fail<ConfigError>("codebook contains an empty target name");
        }
        if (!seen.insert(t).second) {
            fail<ConfigError>("codebook target '%s' appears more than once", t.c_str());
        }
    }
    maxCodes_.reserve(targets_.size());
    for (int32_t t = 0; t < nTargets(); ++t) {
        maxCodes_.push_back(perRoundArgmax(values_.row(t), nRounds_, nChannels_));
        auto ins = code2target_.emplace(maxCodes_.back(), t);
        if (!ins.second) {
            warning("%s: Targets '%s' and '%s' share the same per-round max code; '%s' is used for lookups",
                __func__, targets_[ins.first->second].c_str(), targets_[t].c_str(),
                targets_[ins.first->second].c_str());
        }
    }
}

std::optional<int32_t> Codebook::findCode(const std::vector<int32_t>& code) const {
    auto it = code2target_.find(code);
    if (it == code2target_.end()) return std::nullopt;
    return it->second;
}

Codebook Codebook::fromJson(const nlohmann::json& j) {
    const nlohmann::json& entries = (j.is_object() && j.contains("mappings")) ? j.at("mappings") : j;
    if (!entries.is_array()) {
        fail<ConfigError>("codebook document must be an array of codewords or an object with \"mappings\"");
    }
    int32_t nRounds = 0, nChannels = 0;
    for (const auto& e : entries) {
        for (const auto& cw : e.at("codeword")) {
            const int32_t r = cw.at("r").get<int32_t>();
            const int32_t c = cw.at("c").get<int32_t>();
            if (r < 0 || c < 0) {
                fail<ConfigError>("codeword entry with negative round %d or channel %d", r, c);
            }
            nRounds = std::max(nRounds, r + 1);
            nChannels = std::max(nChannels, c + 1);
        }
    }
    std::vector<std::string> targets;
    RowMajorMatrixXf values = RowMajorMatrixXf::Zero(entries.size(), static_cast<Eigen::Index>(nRounds) * nChannels);
    Eigen::Index row = 0;
    for (const auto& e : entries) {
        targets.push_back(e.at("target").get<std::string>());
        for (const auto& cw : e.at("codeword")) {
            const int32_t r = cw.at("r").get<int32_t>();
            const int32_t c = cw.at("c").get<int32_t>();
            values(row, r * nChannels + c) = cw.value("v", 1.0f);
        }
        ++row;
    }
    return Codebook(std::move(targets), nRounds, nChannels, std::move(values));
}

Codebook Codebook::open(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error("Error opening codebook file: %s", path.c_str());
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        error("%s: Error parsing codebook %s: %s", __func__, path.c_str(), e.what());
    }
    Codebook cb = fromJson(j);
    notice("Loaded codebook with %d targets, %d rounds and %d channels from %s",
        cb.nTargets(), cb.nRounds(), cb.nChannels(), path.c_str());
    return cb;
}

nlohmann::json Codebook::toJson() const {
    nlohmann::json mappings = nlohmann::json::array();
    for (int32_t t = 0; t < nTargets(); ++t) {
        nlohmann::json codeword = nlohmann::json::array();
        for (int32_t r = 0; r < nRounds_; ++r) {
            for (int32_t c = 0; c < nChannels_; ++c) {
                float v = value(t, r, c);
                if (v != 0) {
                    codeword.push_back({{"r", r}, {"c", c}, {"v", v}});
                }
            }
        }
        mappings.push_back({{"codeword", codeword}, {"target", targets_[t]}});
    }
    return nlohmann::json{{"version", "0.0.0"}, {"mappings", mappings}};
}

Codebook Codebook::synthetic(int32_t nTargets, int32_t nRounds, int32_t nChannels, uint64_t seed) {
    if (nTargets < 1 || nRounds < 1 || nChannels < 1) {
        fail<ConfigError>("%s: need positive sizes, got %d targets, %d rounds, %d channels",
            __func__, nTargets, nRounds, nChannels);
    }
    const double nCodes = std::pow(static_cast<double>(nChannels), nRounds);
    if (nTargets > nCodes) {
        fail<ConfigError>("%s: %d targets requested but only %.0f distinct codes exist", __func__, nTargets, nCodes);
    }
    std::mt19937 rng(static_cast<uint32_t>(seed));
    std::uniform_int_distribution<int32_t> channel(0, nChannels - 1);
    std::set<std::vector<int32_t>> used;
    std::vector<std::string> targets;
    RowMajorMatrixXf values = RowMajorMatrixXf::Zero(nTargets, static_cast<Eigen::Index>(nRounds) * nChannels);
    while (static_cast<int32_t>(targets.size()) < nTargets) {
        std::vector<int32_t> code(nRounds);
        for (auto& c : code) c = channel(rng);
        if (!used.insert(code).second) continue;
        const Eigen::Index t = static_cast<Eigen::Index>(targets.size());
        for (int32_t r = 0; r < nRounds; ++r) {
            values(t, r * nChannels + code[r]) = 1.0f;
        }
        targets.push_back(formatString("GENE_%03d", static_cast<int>(t)));
    }
    return Codebook(std::move(targets), nRounds, nChannels, std::move(values));
}
