#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "models/ProcessingConfig.hpp"

namespace pcanvas
{

struct EncodeResult
{
    std::vector<std::uint8_t> bytes;
    int quality {0};            // 0 for lossless output
    int attempts {0};
    bool sizeTargetMet {true};
};

// File extension cv::imencode expects for a format (".webp", ".jpg", ".png").
std::string extensionFor(OutputFormat format);

// Next quality in the search: larger steps while quality is high, never below the floor.
int nextQuality(int quality, int minQuality);

/**
 * @brief Encode `img` in the configured format.
 *
 * WebP with a size budget re-encodes with decreasing quality until the budget
 * is met, the quality floor is reached, or maxEncodeAttempts encodes were made.
 * A budget still unmet at that point is reported in `sizeTargetMet`, not as a
 * failure. JPEG encodes once at `quality`; PNG once, lossless.
 *
 * @return false only when the codec itself fails.
 */
bool encodeAdaptive(const cv::Mat& img, const ProcessingConfig& cfg, EncodeResult& out);

}
