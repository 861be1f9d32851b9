#pragma once
#include "models/ProcessingConfig.hpp"
#include "models/Diagnostics.hpp"
namespace cv { class Mat; }

namespace pcanvas
{

// Masks produced here are CV_8U, 255 = background, 0 = product.
// Consumers treat any value below kBackgroundCutoff as product.
constexpr int kBackgroundCutoff = 128;

// True when a BGRA image carries at least one pixel at or below alphaThreshold.
bool hasUsableAlpha(const cv::Mat& img, int alphaThreshold);

// Alpha-channel mode: background where alpha <= alphaThreshold.
bool computeAlphaBackgroundMask(const cv::Mat& bgra, cv::Mat& outMask, int alphaThreshold);

// Background polarity from the corner patches of a BGR image (auto mode), or the forced mode.
Polarity detectPolarity(const cv::Mat& bgr, const ProcessingConfig& cfg);

// Flood-fill mode on a BGR image. Background must pass the polarity's luminance
// test, be reachable from the border through small color steps and stay within
// floodModelTolerance of a smooth backdrop model fitted to the frame border
// (edgeBarrierTolerance inside the edge margin). The fill runs on a downscaled
// copy and is refined at full resolution along the boundary.
bool computeFloodFillBackgroundMask(const cv::Mat& bgr, cv::Mat& outMask,
                                    const ProcessingConfig& cfg, Polarity* polarity = nullptr);

// Dispatches to alpha mode when the image has usable alpha, flood-fill otherwise.
bool computeBackgroundMask(const cv::Mat& img, cv::Mat& outMask,
                           const ProcessingConfig& cfg, Polarity* polarity = nullptr);

}
