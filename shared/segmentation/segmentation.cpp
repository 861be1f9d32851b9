#include "segmentation.hpp"
#include "util/ImageOps.hpp"
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>
#include <deque>
#include <vector>

using namespace cv;

namespace pcanvas
{

namespace {
    constexpr int kWorkingMaxDim = 256;
    constexpr int kCornerPatch = 10;
    constexpr int kModelTerms = 6;          // 1, u, v, u^2, uv, v^2
    constexpr int kModelIterations = 4;
    constexpr int kMinModelSamples = 12;

    // Smooth estimate of the backdrop color: one quadratic per channel over
    // coordinates normalised to [-1, 1], so the same fit serves every resolution.
    struct BackgroundModel
    {
        Vec3b constant;     // used while no fit is available
        Mat coef;           // kModelTerms x 3, CV_64F

        Vec3f predict(double u, double v) const
        {
            if (coef.empty()) return Vec3f(constant[0], constant[1], constant[2]);
            const double b[kModelTerms] = { 1.0, u, v, u * u, u * v, v * v };
            Vec3f out;
            for (int c = 0; c < 3; ++c)
            {
                double s = 0;
                for (int k = 0; k < kModelTerms; ++k) s += b[k] * coef.at<double>(k, c);
                out[c] = static_cast<float>(s);
            }
            return out;
        }
    };

    inline double normalised(int i, int n) { return n > 1 ? 2.0 * i / (n - 1) - 1.0 : 0.0; }

    inline float modelDistance(const Vec3b& px, const Vec3f& m)
    {
        float d = 0;
        for (int c = 0; c < 3; ++c) d = std::max(d, std::abs(px[c] - m[c]));
        return d;
    }

    // Robust fit on the outer ring of pixels that pass the luminance test.
    // Starts from the corner color and refits on the samples the current
    // model explains, so a product touching the frame does not bend the fit.
    static BackgroundModel fitBackgroundModel(const Mat& bgr, const Mat& cand,
                                              const Vec3b& reference, int tolerance)
    {
        BackgroundModel model;
        model.constant = reference;

        std::vector<Point> ring;
        auto take = [&](int x, int y) { if (cand.at<uchar>(y, x)) ring.emplace_back(x, y); };
        for (int x = 0; x < bgr.cols; ++x) { take(x, 0); if (bgr.rows > 1) take(x, bgr.rows - 1); }
        for (int y = 1; y + 1 < bgr.rows; ++y) { take(0, y); if (bgr.cols > 1) take(bgr.cols - 1, y); }

        for (int iter = 0; iter < kModelIterations; ++iter)
        {
            std::vector<Point> inliers;
            for (const Point& pt : ring)
            {
                Vec3f m = model.predict(normalised(pt.x, bgr.cols), normalised(pt.y, bgr.rows));
                if (modelDistance(bgr.at<Vec3b>(pt), m) <= tolerance) inliers.push_back(pt);
            }
            if (static_cast<int>(inliers.size()) < kMinModelSamples) break;

            Mat A(static_cast<int>(inliers.size()), kModelTerms, CV_64F);
            Mat B(static_cast<int>(inliers.size()), 3, CV_64F);
            for (int i = 0; i < A.rows; ++i)
            {
                double u = normalised(inliers[i].x, bgr.cols), v = normalised(inliers[i].y, bgr.rows);
                double* a = A.ptr<double>(i);
                a[0] = 1.0; a[1] = u; a[2] = v; a[3] = u * u; a[4] = u * v; a[5] = v * v;
                const Vec3b& px = bgr.at<Vec3b>(inliers[i]);
                for (int c = 0; c < 3; ++c) B.at<double>(i, c) = px[c];
            }
            Mat coef;
            if (!cv::solve(A, B, coef, DECOMP_SVD)) break;
            model.coef = coef;
        }
        return model;
    }

    // Model rendered per pixel, CV_32FC3.
    static Mat renderModel(const BackgroundModel& model, Size size)
    {
        Mat out(size, CV_32FC3);
        for (int y = 0; y < size.height; ++y)
        {
            Vec3f* row = out.ptr<Vec3f>(y);
            double v = normalised(y, size.height);
            for (int x = 0; x < size.width; ++x) row[x] = model.predict(normalised(x, size.width), v);
        }
        return out;
    }

    struct FloodParams
    {
        int margin {1};     // edge barrier width in pixels
        int stepTol {6};
        int modelTol {9};
        int barrierTol {6};
    };

    inline bool inMargin(int x, int y, const Mat& img, int margin)
    {
        return x < margin || y < margin || x >= img.cols - margin || y >= img.rows - margin;
    }

    // Every accepted pixel must stay close to the backdrop model; inside the
    // edge margin the allowance is tighter.
    inline bool fitsBackground(const Mat& bgr, const Mat& model, int x, int y, const FloodParams& p)
    {
        int tol = inMargin(x, y, bgr, p.margin) ? p.barrierTol : p.modelTol;
        return modelDistance(bgr.at<Vec3b>(y, x), model.at<Vec3f>(y, x)) <= tol;
    }

    // Luminance test for the chosen polarity. Result is CV_8U {0,255}.
    static Mat luminanceCandidates(const Mat& bgr, Polarity pol, int whiteThr, int blackThr)
    {
        Mat lum = util::luminanceMap(bgr);
        Mat cand;
        if (pol == Polarity::Black) cv::threshold(lum, cand, blackThr, 255, THRESH_BINARY_INV);
        else cv::threshold(lum, cand, whiteThr - 1, 255, THRESH_BINARY);
        return cand;
    }

    // Candidates at working size: a cell counts only when every full-resolution
    // pixel it covers passes, so outlines thinner than a cell still block.
    static Mat poolCandidates(const Mat& candFull, Size workSize, double scale)
    {
        int pool = static_cast<int>(std::ceil(1.0 / scale));
        Mat eroded, out;
        cv::erode(candFull, eroded, getStructuringElement(MORPH_RECT, Size(pool, pool)),
                  Point(0, 0), 1, BORDER_REPLICATE);
        cv::resize(eroded, out, workSize, 0, 0, INTER_NEAREST);
        return out;
    }

    // Breadth-first growth over 4-neighbours. Pixels in `mask` are accepted
    // background; the queue holds the accepted pixels still to expand.
    static void growRegion(const Mat& bgr, const Mat& model, const Mat& allowed, Mat& mask,
                           std::deque<Point>& q, const FloodParams& p)
    {
        static const int dx[4] = { 1, -1, 0, 0 };
        static const int dy[4] = { 0, 0, 1, -1 };
        while (!q.empty())
        {
            Point pt = q.front(); q.pop_front();
            const Vec3b& c = bgr.at<Vec3b>(pt);
            for (int k = 0; k < 4; ++k)
            {
                int nx = pt.x + dx[k], ny = pt.y + dy[k];
                if (nx < 0 || ny < 0 || nx >= bgr.cols || ny >= bgr.rows) continue;
                if (mask.at<uchar>(ny, nx) || !allowed.at<uchar>(ny, nx)) continue;
                if (util::channelDistance(bgr.at<Vec3b>(ny, nx), c) > p.stepTol) continue;
                if (!fitsBackground(bgr, model, nx, ny, p)) continue;
                mask.at<uchar>(ny, nx) = 255;
                q.emplace_back(nx, ny);
            }
        }
    }

    // Seed every border pixel that passes the candidate and barrier tests, then grow.
    static Mat floodFromBorder(const Mat& bgr, const Mat& model, const Mat& cand, const FloodParams& p)
    {
        Mat mask = Mat::zeros(bgr.size(), CV_8U);
        std::deque<Point> q;
        auto seed = [&](int x, int y)
        {
            if (mask.at<uchar>(y, x) || !cand.at<uchar>(y, x)) return;
            if (!fitsBackground(bgr, model, x, y, p)) return;
            mask.at<uchar>(y, x) = 255;
            q.emplace_back(x, y);
        };
        for (int x = 0; x < bgr.cols; ++x) { seed(x, 0); seed(x, bgr.rows - 1); }
        for (int y = 0; y < bgr.rows; ++y) { seed(0, y); seed(bgr.cols - 1, y); }
        growRegion(bgr, model, cand, mask, q, p);
        return mask;
    }

    // Re-run the growth at full resolution inside the band where the upscaled
    // coarse mask is blocky, so the mask follows the true product edge.
    static Mat refineAtFullResolution(const Mat& bgr, const Mat& model, const Mat& coarseUp,
                                      const Mat& cand, int cell, const FloodParams& p)
    {
        Mat core, reach;
        cv::erode(coarseUp, core, getStructuringElement(MORPH_RECT, Size(2 * cell + 1, 2 * cell + 1)),
                  Point(-1, -1), 1, BORDER_CONSTANT, Scalar(255));
        // The pooled candidates stop the coarse fill up to two cells short of the edge.
        cv::dilate(coarseUp, reach, getStructuringElement(MORPH_RECT, Size(4 * cell + 1, 4 * cell + 1)));

        Mat allowed;
        cv::bitwise_and(reach, cand, allowed);

        Mat mask = core.clone();
        Mat inner;
        cv::erode(core, inner, getStructuringElement(MORPH_CROSS, Size(3, 3)),
                  Point(-1, -1), 1, BORDER_CONSTANT, Scalar(255));
        Mat edge = core & ~inner;

        std::deque<Point> q;
        for (int y = 0; y < edge.rows; ++y)
        {
            const uchar* row = edge.ptr<uchar>(y);
            for (int x = 0; x < edge.cols; ++x)
                if (row[x]) q.emplace_back(x, y);
        }
        growRegion(bgr, model, allowed, mask, q, p);

        // Dark specks inside a coarse cell stay product.
        cv::bitwise_and(mask, cand, mask);
        return mask;
    }

    static int countBorder(const Mat& m)
    {
        int n = countNonZero(m.row(0)) + countNonZero(m.row(m.rows - 1));
        if (m.rows > 2)
        {
            Rect inner(0, 1, m.cols, m.rows - 2);
            n += countNonZero(m(inner).col(0));
            if (m.cols > 1) n += countNonZero(m(inner).col(m.cols - 1));
        }
        return n;
    }
}

bool hasUsableAlpha(const cv::Mat& img, int alphaThreshold)
{
    if (img.empty() || img.type() != CV_8UC4) return false;
    Mat alpha;
    cv::extractChannel(img, alpha, 3);
    double minA = 0;
    cv::minMaxLoc(alpha, &minA);
    return minA <= alphaThreshold;
}

bool computeAlphaBackgroundMask(const cv::Mat& bgra, cv::Mat& outMask, int alphaThreshold)
{
    if (bgra.empty() || bgra.type() != CV_8UC4) return false;
    Mat alpha;
    cv::extractChannel(bgra, alpha, 3);
    cv::threshold(alpha, outMask, alphaThreshold, 255, THRESH_BINARY_INV);
    return true;
}

Polarity detectPolarity(const cv::Mat& bgr, const ProcessingConfig& cfg)
{
    if (cfg.backgroundEdgeMode == BackgroundEdgeMode::White) return Polarity::White;
    if (cfg.backgroundEdgeMode == BackgroundEdgeMode::Black) return Polarity::Black;

    Mat lum = util::luminanceMap(bgr);
    auto corners = util::cornerMeans(lum, kCornerPatch);
    double cornerMean = (corners[0] + corners[1] + corners[2] + corners[3]) / 4.0;
    int whiteThr = util::effectiveWhiteThreshold(cfg.whiteThreshold, cornerMean);

    int whiteVotes = 0, blackVotes = 0;
    for (double m : corners)
    {
        if (m >= whiteThr) ++whiteVotes;
        else if (m <= cfg.blackThreshold) ++blackVotes;
    }
    if (whiteVotes != blackVotes) return blackVotes > whiteVotes ? Polarity::Black : Polarity::White;

    // Corners undecided: compare how much of the frame border passes each test.
    Mat whiteLike, blackLike;
    cv::threshold(lum, whiteLike, whiteThr - 1, 255, THRESH_BINARY);
    cv::threshold(lum, blackLike, cfg.blackThreshold, 255, THRESH_BINARY_INV);
    return countBorder(blackLike) > countBorder(whiteLike) ? Polarity::Black : Polarity::White;
}

bool computeFloodFillBackgroundMask(const cv::Mat& bgr, cv::Mat& outMask,
                                    const ProcessingConfig& cfg, Polarity* polarity)
{
    if (bgr.empty() || bgr.type() != CV_8UC3) return false;

    /* 1 · Working copy ---------------------------------------------------- */
    Mat work = bgr;
    double scale = 1.0;
    int maxDim = std::max(bgr.cols, bgr.rows);
    if (maxDim > kWorkingMaxDim)
    {
        scale = static_cast<double>(kWorkingMaxDim) / maxDim;
        int sw = std::max(1, static_cast<int>(std::lround(bgr.cols * scale)));
        int sh = std::max(1, static_cast<int>(std::lround(bgr.rows * scale)));
        cv::resize(bgr, work, Size(sw, sh), 0, 0, INTER_AREA);
    }

    /* 2 · Polarity and thresholds ---------------------------------------- */
    Polarity pol = detectPolarity(work, cfg);
    if (polarity) *polarity = pol;

    auto corners = util::cornerMeans(util::luminanceMap(work), kCornerPatch);
    double cornerMean = (corners[0] + corners[1] + corners[2] + corners[3]) / 4.0;
    int whiteThr = util::effectiveWhiteThreshold(cfg.whiteThreshold, cornerMean);

    Mat candFull = luminanceCandidates(bgr, pol, whiteThr, cfg.blackThreshold);
    Mat candWork = scale == 1.0 ? candFull : poolCandidates(candFull, work.size(), scale);

    FloodParams p;
    p.stepTol = cfg.floodStepTolerance;
    p.modelTol = cfg.floodModelTolerance;
    p.barrierTol = cfg.edgeBarrierTolerance;
    p.margin = std::max(1, static_cast<int>(std::lround(cfg.edgeBarrierRatio * std::max(work.cols, work.rows))));

    /* 3 · Backdrop model ------------------------------------------------- */
    BackgroundModel model = fitBackgroundModel(work, candWork, util::cornerReferenceColor(work, kCornerPatch),
                                               cfg.floodModelTolerance);

    /* 4 · Coarse flood fill from the border ------------------------------ */
    Mat coarse = floodFromBorder(work, renderModel(model, work.size()), candWork, p);
    if (scale == 1.0)
    {
        outMask = coarse;
        return true;
    }

    /* 5 · Upscale and refine --------------------------------------------- */
    Mat up;
    cv::resize(coarse, up, bgr.size(), 0, 0, INTER_NEAREST);
    int cell = static_cast<int>(std::ceil(1.0 / scale)) + 1;
    FloodParams full = p;
    full.margin = std::max(1, static_cast<int>(std::lround(cfg.edgeBarrierRatio * maxDim)));
    outMask = refineAtFullResolution(bgr, renderModel(model, bgr.size()), up, candFull, cell, full);
    return true;
}

bool computeBackgroundMask(const cv::Mat& img, cv::Mat& outMask,
                           const ProcessingConfig& cfg, Polarity* polarity)
{
    if (img.empty()) return false;
    if (hasUsableAlpha(img, cfg.alphaThreshold))
    {
        if (polarity) *polarity = Polarity::None;
        return computeAlphaBackgroundMask(img, outMask, cfg.alphaThreshold);
    }
    if (img.channels() == 4)
    {
        Mat bgr;
        cv::cvtColor(img, bgr, COLOR_BGRA2BGR);
        return computeFloodFillBackgroundMask(bgr, outMask, cfg, polarity);
    }
    return computeFloodFillBackgroundMask(img, outMask, cfg, polarity);
}

}
