/**
 * @file Diagnostics.hpp
 * Result records returned alongside the encoded image. Callers decide how to
 * surface them (log line, API field, metric).
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "models/OutputFormat.hpp"

namespace pcanvas
{

enum class Polarity
{
    None = 0,   // alpha-channel mode, no polarity detection ran
    White = 1,
    Black = 2,
};

// Inclusive pixel coordinates; left < right and top < bottom.
struct BoundingBox
{
    int left {0};
    int top {0};
    int right {0};
    int bottom {0};

    int width() const { return right - left + 1; }
    int height() const { return bottom - top + 1; }
    cv::Rect toRect() const { return cv::Rect(left, top, width(), height()); }
};

struct Diagnostics
{
    bool productFound {false};
    Polarity polarity {Polarity::None};
    std::optional<BoundingBox> bbox;

    bool aiRequested {false};
    bool aiApplied {false};
    bool aiFellBack {false};
    std::string aiFallbackReason;
    int aiPromotedPixels {0};
    int aiRestoredRegions {0};

    std::size_t encodedBytes {0};
    int qualityUsed {0};
    int encodeAttempts {0};
    bool sizeTargetMet {true};
};

struct ProcessOutput
{
    std::vector<std::uint8_t> encoded;
    OutputFormat format {OutputFormat::Jpeg};
    cv::Mat composited;     // CV_8UC3, target size
    Diagnostics diagnostics;
};

enum class ErrorKind
{
    InvalidInput = 0,
    InvalidConfig = 1,
    EncodeFailed = 2,
};

struct ProcessingError
{
    ErrorKind kind {ErrorKind::InvalidInput};
    std::string field;      // offending configuration key, when kind == InvalidConfig
    std::string message;
};

}
