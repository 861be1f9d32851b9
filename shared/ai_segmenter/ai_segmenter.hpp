#pragma once
#include <string>
#include <opencv2/core.hpp>

namespace pcanvas
{

enum class SegmentStatus
{
    Ok = 0,
    Unavailable = 1,    // no model configured or installed
    Failed = 2,         // model ran but produced nothing usable
};

// Port to an external background-removal model. The core only calls through
// this interface and treats every non-Ok status as a fallback to flood fill.
class ISegmenter
{
protected:
    ISegmenter() = default;

public:
    virtual ~ISegmenter() = default;

    virtual bool available() const = 0;

    // On Ok, outAlpha is CV_8UC1 with the size of `bgr` (255 = product).
    // Otherwise `reason` says why.
    virtual SegmentStatus segment(const cv::Mat& bgr, cv::Mat& outAlpha, std::string& reason) = 0;

    ISegmenter(const ISegmenter&) = delete;
    ISegmenter& operator=(const ISegmenter&) = delete;
    ISegmenter(ISegmenter&&) = delete;
    ISegmenter& operator=(ISegmenter&&) = delete;
};

// The "not configured" variant.
class NullSegmenter final : public ISegmenter
{
public:
    NullSegmenter() = default;
    ~NullSegmenter() override = default;

    bool available() const override { return false; }
    SegmentStatus segment(const cv::Mat&, cv::Mat&, std::string& reason) override
    {
        reason = "no segmentation model configured";
        return SegmentStatus::Unavailable;
    }
};

// Runs an external model script: python3 <script> --input <png> --output <png>.
// The output may be a single-channel mask or a BGRA image whose alpha is used.
class ScriptSegmenter final : public ISegmenter
{
public:
    explicit ScriptSegmenter(std::string scriptPath, std::string interpreter = "python3");
    ~ScriptSegmenter() override = default;

    // PCANVAS_SEGMENT_SCRIPT if set, else scripts/remove_background.py.
    static std::string defaultScriptPath();

    bool available() const override;
    SegmentStatus segment(const cv::Mat& bgr, cv::Mat& outAlpha, std::string& reason) override;

    const std::string& scriptPath() const { return scriptPath_; }

private:
    std::string scriptPath_;
    std::string interpreter_;
    unsigned runCounter_ {0};
};

}
