#include "adaptive_encoder.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <iostream>

using namespace cv;

namespace pcanvas
{

namespace {
    static bool encodeOnce(const Mat& img, OutputFormat format, int quality, std::vector<uchar>& buf)
    {
        std::vector<int> params;
        switch (format)
        {
            case OutputFormat::Webp:
                params = { IMWRITE_WEBP_QUALITY, std::clamp(quality, 1, 100) };
                break;
            case OutputFormat::Jpeg:
                params = { IMWRITE_JPEG_QUALITY, std::clamp(quality, 0, 100), IMWRITE_JPEG_OPTIMIZE, 1 };
                break;
            case OutputFormat::Png:
                params = { IMWRITE_PNG_COMPRESSION, 9 };
                break;
        }
        try
        {
            return imencode(extensionFor(format), img, buf, params) && !buf.empty();
        }
        catch (const cv::Exception& e)
        {
            std::cerr << "[encode] " << extensionFor(format) << " encoder failed: " << e.what() << "\n";
            return false;
        }
    }
}

std::string extensionFor(OutputFormat format)
{
    switch (format)
    {
        case OutputFormat::Webp: return ".webp";
        case OutputFormat::Png: return ".png";
        case OutputFormat::Jpeg: break;
    }
    return ".jpg";
}

int nextQuality(int quality, int minQuality)
{
    int step = quality > 85 ? 7 : (quality > 75 ? 5 : 3);
    return std::max(minQuality, quality - step);
}

bool encodeAdaptive(const cv::Mat& img, const ProcessingConfig& cfg, EncodeResult& out)
{
    out = EncodeResult{};
    if (img.empty()) return false;

    std::vector<uchar> buf;
    if (cfg.outputFormat != OutputFormat::Webp || cfg.targetMaxKb <= 0)
    {
        int q = cfg.outputFormat == OutputFormat::Png ? 0 : cfg.quality;
        if (!encodeOnce(img, cfg.outputFormat, q, buf)) return false;
        out.bytes.assign(buf.begin(), buf.end());
        out.quality = q;
        out.attempts = 1;
        out.sizeTargetMet = cfg.targetMaxKb <= 0 || buf.size() <= static_cast<size_t>(cfg.targetMaxKb) * 1024;
        return true;
    }

    const size_t budget = static_cast<size_t>(cfg.targetMaxKb) * 1024;
    const int maxAttempts = std::max(1, cfg.maxEncodeAttempts);
    int q = std::max(cfg.quality, cfg.minQuality);
    for (int attempt = 1; attempt <= maxAttempts; ++attempt)
    {
        if (!encodeOnce(img, OutputFormat::Webp, q, buf)) return false;
        out.bytes.assign(buf.begin(), buf.end());
        out.quality = q;
        out.attempts = attempt;
        out.sizeTargetMet = buf.size() <= budget;
        if (out.sizeTargetMet || q <= cfg.minQuality) break;
        // The last permitted attempt always goes to the floor.
        q = attempt + 1 == maxAttempts ? cfg.minQuality : nextQuality(q, cfg.minQuality);
    }
    return true;
}

}
