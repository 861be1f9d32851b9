#include "util/ImageOps.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <vector>

namespace pcanvas::util {

bool parseHexColor(const std::string& hex, cv::Scalar& bgr)
{
    std::string h = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
    if (h.size() != 6) return false;
    for (char c : h)
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    unsigned int r = 0, g = 0, b = 0;
    if (std::sscanf(h.c_str(), "%02x%02x%02x", &r, &g, &b) != 3) return false;
    bgr = cv::Scalar(b, g, r); // OpenCV uses BGR
    return true;
}

cv::Mat luminanceMap(const cv::Mat& bgr)
{
    cv::Mat lum;
    cv::transform(bgr, lum, cv::Matx13f(1.f / 3, 1.f / 3, 1.f / 3));
    return lum;
}

std::array<double, 4> cornerMeans(const cv::Mat& lum, int patch)
{
    int ph = std::max(1, std::min(patch, lum.rows));
    int pw = std::max(1, std::min(patch, lum.cols));
    cv::Rect tl(0, 0, pw, ph);
    cv::Rect tr(lum.cols - pw, 0, pw, ph);
    cv::Rect bl(0, lum.rows - ph, pw, ph);
    cv::Rect br(lum.cols - pw, lum.rows - ph, pw, ph);
    return { cv::mean(lum(tl))[0], cv::mean(lum(tr))[0],
             cv::mean(lum(bl))[0], cv::mean(lum(br))[0] };
}

cv::Vec3b cornerReferenceColor(const cv::Mat& bgr, int patch)
{
    int ph = std::max(1, std::min(patch, bgr.rows));
    int pw = std::max(1, std::min(patch, bgr.cols));
    const cv::Rect regions[4] = {
        cv::Rect(0, 0, pw, ph),
        cv::Rect(bgr.cols - pw, 0, pw, ph),
        cv::Rect(0, bgr.rows - ph, pw, ph),
        cv::Rect(bgr.cols - pw, bgr.rows - ph, pw, ph),
    };
    std::array<std::vector<double>, 3> perChannel;
    for (const auto& r : regions)
    {
        cv::Scalar m = cv::mean(bgr(r));
        for (int c = 0; c < 3; ++c) perChannel[c].push_back(m[c]);
    }
    cv::Vec3b ref;
    for (int c = 0; c < 3; ++c)
    {
        auto& v = perChannel[c];
        std::sort(v.begin(), v.end());
        ref[c] = cv::saturate_cast<uchar>((v[1] + v[2]) / 2.0);
    }
    return ref;
}

int effectiveWhiteThreshold(int whiteThr, double cornerMean)
{
    if (cornerMean <= 100.0) return whiteThr;
    int dynamicThr = static_cast<int>(std::max(150.0, cornerMean - 15.0));
    return std::min(whiteThr, dynamicThr);
}

int channelDistance(const cv::Vec3b& a, const cv::Vec3b& b)
{
    int d = 0;
    for (int c = 0; c < 3; ++c) d = std::max(d, std::abs(int(a[c]) - int(b[c])));
    return d;
}

cv::Mat flattenOnto(const cv::Mat& bgra, const cv::Scalar& color)
{
    CV_Assert(bgra.type() == CV_8UC4);
    std::vector<cv::Mat> ch;
    cv::split(bgra, ch);
    cv::Mat fg, alpha;
    cv::merge(std::vector<cv::Mat>{ ch[0], ch[1], ch[2] }, fg);
    ch[3].convertTo(alpha, CV_32F, 1.0 / 255.0);
    cv::Mat bg(bgra.size(), CV_8UC3, color);
    cv::Mat inv = 1.0 - alpha;
    cv::Mat out;
    cv::blendLinear(fg, bg, alpha, inv, out);
    return out;
}

cv::Mat normalizeChannels(const cv::Mat& img)
{
    if (img.empty()) return cv::Mat();
    cv::Mat src = img;
    if (src.depth() == CV_16U) src.convertTo(src, CV_8U, 1.0 / 257.0);
    else if (src.depth() != CV_8U) return cv::Mat();

    cv::Mat out;
    switch (src.channels())
    {
        case 1: cv::cvtColor(src, out, cv::COLOR_GRAY2BGR); break;
        case 3: out = src; break;
        case 4: out = src; break;
        default: return cv::Mat();
    }
    return out;
}

}
