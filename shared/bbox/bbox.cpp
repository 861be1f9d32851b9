#include "bbox.hpp"
#include "segmentation/segmentation.hpp"
#include <opencv2/core.hpp>
#include <algorithm>

using namespace cv;

namespace pcanvas
{

namespace {
    // Collapse the mask along one axis and return the first/last non-zero index.
    static bool extentAlong(const Mat& productMask, int dim, int& first, int& last)
    {
        Mat collapsed;
        cv::reduce(productMask, collapsed, dim, REDUCE_MAX, CV_8U);
        const int n = dim == 0 ? collapsed.cols : collapsed.rows;
        first = -1; last = -1;
        for (int i = 0; i < n; ++i)
        {
            uchar v = dim == 0 ? collapsed.at<uchar>(0, i) : collapsed.at<uchar>(i, 0);
            if (v) { if (first == -1) first = i; last = i; }
        }
        return first != -1;
    }
}

cv::Mat productMaskFrom(const cv::Mat& backgroundMask)
{
    Mat product;
    cv::compare(backgroundMask, kBackgroundCutoff, product, CMP_LT);
    return product;
}

std::optional<BoundingBox> findProductBoundingBox(const cv::Mat& backgroundMask, int padding, int minSize)
{
    if (backgroundMask.empty() || backgroundMask.type() != CV_8UC1) return std::nullopt;

    Mat product = productMaskFrom(backgroundMask);
    int top, bot, left, right;
    if (!extentAlong(product, 1, top, bot)) return std::nullopt;
    if (!extentAlong(product, 0, left, right)) return std::nullopt;

    if (right - left + 1 < minSize || bot - top + 1 < minSize) return std::nullopt;

    BoundingBox box;
    box.left = std::max(0, left - padding);
    box.top = std::max(0, top - padding);
    box.right = std::min(backgroundMask.cols - 1, right + padding);
    box.bottom = std::min(backgroundMask.rows - 1, bot + padding);
    if (box.left >= box.right || box.top >= box.bottom) return std::nullopt;
    return box;
}

}
