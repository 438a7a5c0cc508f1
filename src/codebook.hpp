#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "numerical_utils.hpp"

/// Mapping from target name to its expected (round x channel) signature.
/// Row t of values() holds target t, column r*nChannels + c holds (r, c).
class Codebook {
public:
    Codebook(std::vector<std::string> targets, int32_t nRounds, int32_t nChannels, RowMajorMatrixXf values);

    // SpaceTx codebook document: [{"codeword": [{"r", "c", "v"}], "target"}]
    // or {"mappings": [...]} holding the same array
    static Codebook fromJson(const nlohmann::json& j);
    static Codebook open(const std::string& path);
    nlohmann::json toJson() const;

    // One-hot codes with a distinct channel sequence per target
    static Codebook synthetic(int32_t nTargets, int32_t nRounds, int32_t nChannels, uint64_t seed = 0);

    int32_t nTargets() const { return static_cast<int32_t>(targets_.size()); }
    int32_t nRounds() const { return nRounds_; }
    int32_t nChannels() const { return nChannels_; }
    int32_t codeLength() const { return nRounds_ * nChannels_; }
    const std::vector<std::string>& targets() const { return targets_; }
    const std::string& target(int32_t t) const { return targets_.at(t); }
    const RowMajorMatrixXf& values() const { return values_; }
    float value(int32_t t, int32_t r, int32_t c) const { return values_(t, r * nChannels_ + c); }

    // Per target, the channel with the largest value in each round (ties go
    // to the lowest channel)
    const std::vector<std::vector<int32_t>>& perRoundMaxCodes() const { return maxCodes_; }
    // Target whose per-round max code equals `code`, if any
    std::optional<int32_t> findCode(const std::vector<int32_t>& code) const;
    RowMajorMatrixXf normalizedCodewords(int normOrder) const { return rowNormalize(values_, normOrder); }

private:
    std::vector<std::string> targets_;
    int32_t nRounds_;
    int32_t nChannels_;
    RowMajorMatrixXf values_;
    std::vector<std::vector<int32_t>> maxCodes_;
    std::map<std::vector<int32_t>, int32_t> code2target_;
};

// Channel index of the largest value in each round of a flattened
// (round x channel) vector; ties go to the lowest channel
template<typename Row>
std::vector<int32_t> perRoundArgmax(const Row& v, int32_t nRounds, int32_t nChannels) {
    std::vector<int32_t> code(nRounds, 0);
    for (int32_t r = 0; r < nRounds; ++r) {
        int32_t best = 0;
        for (int32_t c = 1; c < nChannels; ++c) {
            if (v(r * nChannels + c) > v(r * nChannels + best)) best = c;
        }
        code[r] = best;
    }
    return code;
}
