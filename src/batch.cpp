#include "batch.hpp"
#include "error.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

namespace {

template<typename F>
void forEachFov(size_t n, int32_t threads, F&& work) {
    if (threads <= 1 || n <= 1) {
        for (size_t i = 0; i < n; ++i) work(i);
        return;
    }
    tbb::global_control globalLimit(tbb::global_control::max_allowed_parallelism, static_cast<size_t>(threads));
    tbb::parallel_for(tbb::blocked_range<size_t>(0, n),
        [&](const tbb::blocked_range<size_t>& range) {
            for (size_t i = range.begin(); i < range.end(); ++i) work(i);
        });
}

} // namespace

std::vector<FeatureTable> decodeFieldsOfView(const std::vector<IntensityTable>& fovs,
    const Codebook& codebook, const DecoderConfig& config, int32_t threads) {
    std::visit([](const auto& cfg) { cfg.validate(); }, config);
    auto t0 = std::chrono::steady_clock::now();
    std::vector<FeatureTable> results(fovs.size());
    forEachFov(fovs.size(), threads, [&](size_t i) {
        results[i] = decode(fovs[i], codebook, config);
    });
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
    notice("%s: Decoded %zu fields of view with %d threads in %lld ms",
        __func__, fovs.size(), threads, static_cast<long long>(elapsed.count()));
    return results;
}

std::vector<PixelDecodingResult> decodePixelFieldsOfView(const std::vector<PixelIntensities>& fovs,
    const Codebook& codebook, const PixelDecoderConfig& config, int32_t threads) {
    PixelSpotDecoder decoder(codebook, config);
    auto t0 = std::chrono::steady_clock::now();
    std::vector<std::optional<PixelDecodingResult>> slots(fovs.size());
    forEachFov(fovs.size(), threads, [&](size_t i) {
        slots[i].emplace(decoder.run(fovs[i]));
    });
    std::vector<PixelDecodingResult> results;
    results.reserve(fovs.size());
    for (auto& s : slots) results.push_back(std::move(*s));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
    notice("%s: Decoded %zu fields of view with %d threads in %lld ms",
        __func__, fovs.size(), threads, static_cast<long long>(elapsed.count()));
    return results;
}
