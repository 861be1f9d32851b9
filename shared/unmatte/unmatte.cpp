#include "unmatte.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

using namespace cv;

namespace pcanvas
{

namespace {
    inline double distanceTo(const Vec3d& c, const Vec3d& m)
    {
        Vec3d d = c - m;
        return std::sqrt(d.dot(d));
    }
}

int unmatteEdges(cv::Mat& bgra, const UnmatteSettings& s)
{
    if (bgra.empty() || bgra.type() != CV_8UC4) return 0;

    Mat alpha;
    cv::extractChannel(bgra, alpha, 3);

    /* Edge candidates ------------------------------------------------------ */
    const double opaqueCut = s.opaqueLevel * 255.0;
    const double transparentCut = s.transparentLevel * 255.0;
    Mat opaque, transparent;
    cv::compare(alpha, opaqueCut, opaque, CMP_GE);
    cv::compare(alpha, transparentCut, transparent, CMP_LE);

    Mat k3 = getStructuringElement(MORPH_RECT, Size(3, 3));
    Mat nearTransparent, nearOpaque;
    cv::dilate(transparent, nearTransparent, k3, Point(-1, -1), 2);
    cv::dilate(opaque, nearOpaque, k3, Point(-1, -1), 1);

    Mat edge = nearTransparent & ~opaque & ~transparent;

    Mat lowAlpha, aboveTransparent;
    cv::compare(alpha, 127.5, lowAlpha, CMP_LT);
    cv::compare(alpha, transparentCut, aboveTransparent, CMP_GT);
    Mat antialiased = lowAlpha & aboveTransparent & nearOpaque;

    Mat candidates = edge | antialiased;
    if (countNonZero(candidates) == 0) return 0;

    /* Per-pixel correction ------------------------------------------------- */
    const Vec3d m(s.matte[0] / 255.0, s.matte[1] / 255.0, s.matte[2] / 255.0);
    int corrected = 0;
    for (int y = 0; y < bgra.rows; ++y)
    {
        const uchar* cand = candidates.ptr<uchar>(y);
        Vec4b* px = bgra.ptr<Vec4b>(y);
        for (int x = 0; x < bgra.cols; ++x)
        {
            if (!cand[x]) continue;
            Vec4b& p = px[x];
            double a = p[3] / 255.0;
            Vec3d c(p[0] / 255.0, p[1] / 255.0, p[2] / 255.0);
            if (distanceTo(c, m) >= s.maxMatteDistance) continue;

            Vec3b fixedColor;
            Vec3d q;
            for (int ch = 0; ch < 3; ++ch)
            {
                double f = (c[ch] - m[ch] * (1.0 - a)) / std::max(a, 1e-6);
                fixedColor[ch] = saturate_cast<uchar>(std::clamp(f, 0.0, 1.0) * 255.0 + 0.5);
                q[ch] = fixedColor[ch] / 255.0;
            }
            // A light pixel whose unmatted color is still matte-like is a genuinely
            // light edge; leaving it keeps the correction a fixed point.
            if (distanceTo(q, m) < s.maxMatteDistance) continue;

            p[0] = fixedColor[0]; p[1] = fixedColor[1]; p[2] = fixedColor[2];
            ++corrected;
        }
    }
    return corrected;
}

}
