#pragma once
#include <array>
#include <string>
#include <opencv2/core.hpp>

namespace pcanvas::util {

// Parse "#RRGGBB" or "RRGGBB" into a BGR scalar. Returns false on malformed input.
bool parseHexColor(const std::string& hex, cv::Scalar& bgr);

// Per-pixel luminance (mean of the three channels) of a BGR image as CV_8U;
// the brightness measure used for all thresholds.
cv::Mat luminanceMap(const cv::Mat& bgr);

// Mean luminance of the four patch x patch corner regions (TL, TR, BL, BR).
std::array<double, 4> cornerMeans(const cv::Mat& lum, int patch = 10);

// Per-channel median of the four corner patch means of a BGR image.
cv::Vec3b cornerReferenceColor(const cv::Mat& bgr, int patch = 10);

// Lower the white cut toward an off-white background seen at the corners.
int effectiveWhiteThreshold(int whiteThr, double cornerMean);

// Largest absolute channel difference.
int channelDistance(const cv::Vec3b& a, const cv::Vec3b& b);

// Composite BGRA onto a solid color; returns CV_8UC3.
cv::Mat flattenOnto(const cv::Mat& bgra, const cv::Scalar& color);

// Normalize any decoded image to CV_8UC3 or CV_8UC4 (alpha kept).
cv::Mat normalizeChannels(const cv::Mat& img);

}
