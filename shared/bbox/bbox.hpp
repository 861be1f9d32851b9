#pragma once
#include <optional>
#include "models/Diagnostics.hpp"

namespace pcanvas
{

// Product mask (255 = product) from a background mask.
cv::Mat productMaskFrom(const cv::Mat& backgroundMask);

/**
 * @brief Tightest box around every product pixel of a background mask, grown by
 *        `padding` on each side and clamped to the image.
 *
 * @param backgroundMask CV_8U, values >= kBackgroundCutoff are background.
 * @param padding        Pixels added on each side before clamping.
 * @param minSize        Unpadded extent required on both axes; smaller boxes are rejected.
 * @return The box, or std::nullopt when there is no (or only a degenerate) product.
 */
std::optional<BoundingBox> findProductBoundingBox(const cv::Mat& backgroundMask,
                                                  int padding = 10,
                                                  int minSize = 2);

}
