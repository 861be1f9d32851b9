#include "ai_correction.hpp"
#include "bbox/bbox.hpp"
#include <opencv2/opencv.hpp>
#include <vector>

using namespace cv;

namespace pcanvas
{

namespace {
    constexpr int kInteriorErosion = 2;

    // Restore flood-fill product components the model almost entirely removed.
    static int restoreRemovedRegions(Mat& alpha, const Mat& floodProduct, const ProcessingConfig& cfg)
    {
        Mat labels, stats, centroids;
        int n = connectedComponentsWithStats(floodProduct, labels, stats, centroids, 8, CV_32S);
        if (n <= 1) return 0;

        std::vector<int> kept(n, 0);
        for (int y = 0; y < labels.rows; ++y)
        {
            const int* lab = labels.ptr<int>(y);
            const uchar* a = alpha.ptr<uchar>(y);
            for (int x = 0; x < labels.cols; ++x)
                if (lab[x] > 0 && a[x] > cfg.alphaThreshold) ++kept[lab[x]];
        }

        int restored = 0;
        for (int i = 1; i < n; ++i)
        {
            int area = stats.at<int>(i, CC_STAT_AREA);
            if (area < cfg.aiMinRegionArea) continue;
            double keptFraction = static_cast<double>(kept[i]) / area;
            if (keptFraction >= cfg.aiRestoreMaxKeptFraction) continue;
            alpha.setTo(255, labels == i);
            ++restored;
        }
        return restored;
    }

    // Promote low-confidence pixels well inside the flood-fill product to opaque,
    // fully transparent ones included: a hole in a kept object is ghosting too.
    static int promoteGhosting(Mat& alpha, const Mat& floodProduct, const ProcessingConfig& cfg)
    {
        int k = 2 * kInteriorErosion + 1;
        Mat interior;
        erode(floodProduct, interior, getStructuringElement(MORPH_RECT, Size(k, k)),
              Point(-1, -1), 1, BORDER_CONSTANT, Scalar(0));

        Mat ghost;
        compare(alpha, cfg.aiConfidenceThreshold, ghost, CMP_LT);
        ghost &= interior;

        int promoted = countNonZero(ghost);
        if (promoted > 0) alpha.setTo(255, ghost);
        return promoted;
    }
}

bool correctAiAlpha(const cv::Mat& aiAlpha, const cv::Mat& floodBackground,
                    const ProcessingConfig& cfg, cv::Mat& outAlpha, AiCorrectionStats* stats)
{
    if (aiAlpha.empty() || aiAlpha.type() != CV_8UC1) return false;
    if (floodBackground.size() != aiAlpha.size() || floodBackground.type() != CV_8UC1) return false;

    Mat alpha = aiAlpha.clone();
    Mat floodProduct = productMaskFrom(floodBackground);

    AiCorrectionStats s;
    s.restoredRegions = restoreRemovedRegions(alpha, floodProduct, cfg);
    s.promotedPixels = promoteGhosting(alpha, floodProduct, cfg);

    if (stats) *stats = s;
    outAlpha = alpha;
    return true;
}

}
