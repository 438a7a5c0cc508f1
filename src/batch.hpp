#pragma once

#include <vector>
#include "decoder.hpp"
#include "pixel_decoder.hpp"

// Decode independent fields of view using up to `threads` workers
// (threads <= 1 runs serially). Results keep the input order.
std::vector<FeatureTable> decodeFieldsOfView(const std::vector<IntensityTable>& fovs,
    const Codebook& codebook, const DecoderConfig& config, int32_t threads = 1);

std::vector<PixelDecodingResult> decodePixelFieldsOfView(const std::vector<PixelIntensities>& fovs,
    const Codebook& codebook, const PixelDecoderConfig& config, int32_t threads = 1);
