// Canvas compositor: smart resize and center of a cropped product.
#include "compose_canvas.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

using namespace cv;

namespace pcanvas
{

namespace
{
    inline int interpolationFor(double scale)
    {
        return scale < 1.0 ? INTER_AREA : INTER_LANCZOS4;
    }

    /* Unsharp mask ------------------------------------------------------- */
    // BGRA input is premultiplied, so alpha is sharpened with the color and
    // their ratio holds.
    static void sharpen(Mat &img)
    {
        Mat blurred;
        GaussianBlur(img, blurred, Size(0, 0), 1.0);
        addWeighted(img, 1.5, blurred, -0.5, 0.0, img);
    }

    /* Premultiplied alpha for resampling BGRA --------------------------- */
    // Filters then mix color weighted by coverage, so the color hidden under
    // transparent pixels cannot darken the edge.
    static Mat premultiplied(const Mat &bgra)
    {
        Mat f;
        bgra.convertTo(f, CV_32F, 1.0 / 255.0);
        std::vector<Mat> ch;
        split(f, ch);
        for (int c = 0; c < 3; ++c) ch[c] = ch[c].mul(ch[3]);
        merge(ch, f);
        return f;
    }

    static void unpremultiply(const Mat &f, Mat &bgr, Mat &alpha)
    {
        std::vector<Mat> ch;
        split(f, ch);
        Mat a;
        max(ch[3], 1.0 / 255.0, a);
        for (int c = 0; c < 3; ++c) divide(ch[c], a, ch[c]);
        Mat color;
        merge(std::vector<Mat>{ ch[0], ch[1], ch[2] }, color);
        color.convertTo(bgr, CV_8U, 255.0);
        ch[3].convertTo(alpha, CV_8U, 255.0);
    }

    /* Blend `fg` into `roi` weighted by an 8-bit mask ---------------------- */
    static void blendInto(Mat &roi, const Mat &fg, const Mat &mask8)
    {
        Mat w, inv, out;
        mask8.convertTo(w, CV_32F, 1.0 / 255.0);
        inv = 1.0 - w;
        blendLinear(fg, roi, w, inv, out);
        out.copyTo(roi);
    }

    static Point2d maskCentroid(const Mat &productMask)
    {
        if (productMask.empty()) return Point2d(-1, -1);
        Moments m = moments(productMask, true);
        if (m.m00 <= 0.0) return Point2d(-1, -1);
        return Point2d(m.m10 / m.m00, m.m01 / m.m00);
    }
}

/*-------------------------------------------------------------------------*\
|  Public API                                                               |
\*-------------------------------------------------------------------------*/
Placement computePlacement(const cv::Size &cropSize, const ProcessingConfig &cfg, const cv::Point2d &centroid)
{
    const int W = cfg.targetWidth, H = cfg.targetHeight;
    const int marginX = static_cast<int>(std::lround(W * cfg.minMarginRatio));
    const int marginY = static_cast<int>(std::lround(H * cfg.minMarginRatio));

    // The margin takes precedence over the size ratio.
    const int boxW = std::min(static_cast<int>(W * cfg.productSizeRatio), W - 2 * marginX);
    const int boxH = std::min(static_cast<int>(H * cfg.productSizeRatio), H - 2 * marginY);
    double scaleX = static_cast<double>(std::max(1, boxW)) / cropSize.width;
    double scaleY = static_cast<double>(std::max(1, boxH)) / cropSize.height;

    Placement p;
    p.scale = std::min(scaleX, scaleY);
    p.size.width = std::max(1, static_cast<int>(cropSize.width * p.scale));
    p.size.height = std::max(1, static_cast<int>(cropSize.height * p.scale));

    int x, y;
    if (cfg.centerMode == CenterMode::Centroid && centroid.x >= 0 && centroid.y >= 0)
    {
        x = static_cast<int>(std::lround(W / 2.0 - centroid.x * p.scale));
        y = static_cast<int>(std::lround(H / 2.0 - centroid.y * p.scale));
    }
    else
    {
        x = (W - p.size.width) / 2;
        y = (H - p.size.height) / 2;
    }
    x = std::max(marginX, std::min(x, W - marginX - p.size.width));
    y = std::max(marginY, std::min(y, H - marginY - p.size.height));
    p.offset = Point(std::max(0, x), std::max(0, y));
    return p;
}

cv::Mat upscaleMultiPass(const cv::Mat &img, double totalScale)
{
    Mat cur = img;
    double remaining = totalScale;
    while (remaining > 1.0 + 1e-6)
    {
        double step = std::min(2.0, remaining);
        int w = std::max(1, static_cast<int>(std::lround(cur.cols * step)));
        int h = std::max(1, static_cast<int>(std::lround(cur.rows * step)));
        Mat next;
        resize(cur, next, Size(w, h), 0, 0, INTER_CUBIC);
        sharpen(next);
        cur = next;
        remaining /= step;
    }
    return cur;
}

bool composeOnCanvas(const cv::Mat &product, const cv::Mat &productMask,
                     const ProcessingConfig &cfg, cv::Mat &outCanvas)
{
    if (product.empty() || (product.type() != CV_8UC3 && product.type() != CV_8UC4)) return false;
    Scalar bg;
    if (!util::parseHexColor(cfg.backgroundColor, bg)) return false;

    const bool hasAlpha = product.channels() == 4;
    if (!hasAlpha && (productMask.empty() || productMask.size() != product.size())) return false;

    Mat canvas(cfg.targetHeight, cfg.targetWidth, CV_8UC3, bg);

    /* 1 · Placement -------------------------------------------------------- */
    Point2d centroid = maskCentroid(productMask);
    Placement place = computePlacement(product.size(), cfg, centroid);

    /* 2 · Resize product and blend mask together --------------------------- */
    Mat source = hasAlpha ? premultiplied(product) : product;
    if (cfg.autoUpscale && place.scale > 1.0 &&
        std::min(product.cols, product.rows) < cfg.upscaleThreshold)
    {
        source = upscaleMultiPass(source, place.scale);
    }
    double finalScale = static_cast<double>(place.size.width) / source.cols;
    Mat resized;
    resize(source, resized, place.size, 0, 0, interpolationFor(finalScale));

    Mat fg, mask;
    const bool soften = cfg.softEdges && cfg.softEdgesRadius > 0.0;
    if (hasAlpha)
    {
        if (soften) GaussianBlur(resized, resized, Size(0, 0), cfg.softEdgesRadius);
        unpremultiply(resized, fg, mask);
    }
    else
    {
        fg = resized;
        resize(productMask, mask, place.size, 0, 0, interpolationFor(place.scale));
        if (soften) GaussianBlur(mask, mask, Size(0, 0), cfg.softEdgesRadius);
    }

    /* 3 · Composite -------------------------------------------------------- */
    Rect roi(place.offset, place.size);
    roi &= Rect(0, 0, canvas.cols, canvas.rows);
    if (roi.area() == 0) return false;
    Mat dst = canvas(roi);
    blendInto(dst, fg(Rect(0, 0, roi.width, roi.height)), mask(Rect(0, 0, roi.width, roi.height)));

    outCanvas = canvas;
    return true;
}

bool fitFrameOnCanvas(const cv::Mat &frame, const ProcessingConfig &cfg, cv::Mat &outCanvas)
{
    if (frame.empty()) return false;
    Scalar bg;
    if (!util::parseHexColor(cfg.backgroundColor, bg)) return false;

    Mat bgr = frame.channels() == 4 ? util::flattenOnto(frame, bg) : frame;

    const int W = cfg.targetWidth, H = cfg.targetHeight;
    double scale = std::min(static_cast<double>(W) / bgr.cols, static_cast<double>(H) / bgr.rows);
    int newWidth = std::max(1, static_cast<int>(bgr.cols * scale));
    int newHeight = std::max(1, static_cast<int>(bgr.rows * scale));

    Mat resized;
    resize(bgr, resized, Size(newWidth, newHeight), 0, 0, interpolationFor(scale));

    Mat finalCanvas(H, W, CV_8UC3, bg);
    int xOffset = std::max(0, (W - newWidth) / 2);
    int yOffset = std::max(0, (H - newHeight) / 2);
    resized.copyTo(finalCanvas(Rect(xOffset, yOffset, newWidth, newHeight)));
    outCanvas = finalCanvas;
    return true;
}

void recolorBackground(cv::Mat &canvas, const ProcessingConfig &cfg)
{
    Scalar bg;
    if (canvas.empty() || !util::parseHexColor(cfg.backgroundColor, bg)) return;
    Mat whiteMask, blackMask;
    int w = cfg.whiteThreshold, b = cfg.blackThreshold;
    inRange(canvas, Scalar(w, w, w), Scalar(255, 255, 255), whiteMask);
    inRange(canvas, Scalar(0, 0, 0), Scalar(b, b, b), blackMask);
    canvas.setTo(bg, whiteMask | blackMask);
}

}
