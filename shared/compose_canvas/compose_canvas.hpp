/*========================  compose_canvas.hpp  ========================

   Canvas compositor: places a cropped product on a fresh canvas.
   --------------------------------------------------------------------
   • scale to fit `ratio × target` on both axes, minimum margin wins
   • area averaging when shrinking, Lanczos when enlarging
   • optional multi-pass enlargement for small products
   • alpha blending from the crop's alpha or from the product mask

=====================================================================*/
#pragma once
#include <opencv2/core.hpp>
#include "models/ProcessingConfig.hpp"

namespace pcanvas
{

struct Placement
{
    cv::Size size;      // scaled product size
    cv::Point offset;   // top-left corner on the canvas
    double scale {1.0};
};

/**
 * @brief Scale and offset for a crop of `cropSize`, honoring the size ratio,
 *        the minimum margin and the centering mode.
 *
 * @param cropSize  Size of the cropped product in source pixels.
 * @param cfg       Processing configuration.
 * @param centroid  Product centroid in crop coordinates; used only in centroid mode.
 */
Placement computePlacement(const cv::Size& cropSize, const ProcessingConfig& cfg,
                           const cv::Point2d& centroid = cv::Point2d(-1, -1));

// Enlarge by `totalScale` in passes of at most 2x, sharpening after each pass.
cv::Mat upscaleMultiPass(const cv::Mat& img, double totalScale);

/**
 * @brief Composite a cropped product onto a canvas of the target size.
 *
 * @param product      BGR or BGRA crop. With alpha, the alpha channel is the blend mask.
 * @param productMask  CV_8U crop-sized mask, 255 = product. Used for BGR crops and centroid mode.
 * @param cfg          Processing configuration.
 * @param outCanvas    Receives a CV_8UC3 canvas.
 * @return false when the inputs are unusable.
 */
bool composeOnCanvas(const cv::Mat& product, const cv::Mat& productMask,
                     const ProcessingConfig& cfg, cv::Mat& outCanvas);

// Fit the whole frame inside the canvas (aspect preserved, centered). Used when
// no product was found.
bool fitFrameOnCanvas(const cv::Mat& frame, const ProcessingConfig& cfg, cv::Mat& outCanvas);

// Replace near-white and near-black canvas pixels with the background color.
void recolorBackground(cv::Mat& canvas, const ProcessingConfig& cfg);

}
