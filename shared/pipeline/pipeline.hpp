/*========================  pipeline.hpp  ========================

   One request, start to finish.
   ----------------------------------------------------------------
   decoded image → optional flatten → optional AI alpha (+ correction)
   → background mask → bounding box → unmatte → canvas → recolor
   → adaptive encode

   The configuration is validated first and never modified. Nothing
   here touches files; callers decode and write.

================================================================*/
#pragma once
#include <opencv2/core.hpp>
#include "models/ProcessingConfig.hpp"
#include "models/Diagnostics.hpp"
#include "ai_segmenter/ai_segmenter.hpp"

namespace pcanvas
{

/**
 * @brief Segment, recompose and encode one product photo.
 *
 * @param image      Decoded image, 1, 3 or 4 channels, 8 or 16 bit.
 * @param cfg        Merged configuration (see mergeConfig()).
 * @param segmenter  AI background-removal port; only consulted when
 *                   cfg.aiBackgroundRemoval is set.
 * @param out        Encoded bytes, composited canvas and diagnostics.
 * @param err        Filled when the function returns false.
 * @return false for invalid input, invalid configuration or a codec failure.
 *         A missing product, an unavailable model or an unmet size budget
 *         still succeed and are reported in out.diagnostics.
 */
bool process(const cv::Mat& image, const ProcessingConfig& cfg, ISegmenter& segmenter,
             ProcessOutput& out, ProcessingError& err);

}
