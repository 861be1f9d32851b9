#pragma once
#include <opencv2/core.hpp>
#include "models/ProcessingConfig.hpp"

namespace pcanvas
{

struct AiCorrectionStats
{
    int promotedPixels {0};     // low-confidence interior pixels made opaque
    int restoredRegions {0};    // product components the model removed and we put back
};

/**
 * @brief Reconcile a model's alpha with the flood-fill judgment of the same image.
 *
 * Two defects are repaired:
 *  - ghosting: alpha below aiConfidenceThreshold (zero included) on pixels the
 *    flood fill considers interior product becomes 255;
 *  - accidental removal: an 8-connected flood-fill product component of at least
 *    aiMinRegionArea pixels that the model kept less than aiRestoreMaxKeptFraction
 *    of is restored to 255 as a whole.
 *
 * @param aiAlpha          CV_8UC1 model output, 255 = product.
 * @param floodBackground  CV_8UC1 flood-fill mask of the same image, 255 = background.
 * @param cfg              Processing configuration.
 * @param outAlpha         Receives the corrected alpha.
 * @param stats            Optional counters for diagnostics.
 */
bool correctAiAlpha(const cv::Mat& aiAlpha, const cv::Mat& floodBackground,
                    const ProcessingConfig& cfg, cv::Mat& outAlpha,
                    AiCorrectionStats* stats = nullptr);

}
