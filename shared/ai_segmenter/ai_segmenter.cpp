#include "ai_segmenter.hpp"
#include <opencv2/opencv.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <utility>
#include <system_error>

namespace fs = std::filesystem;

namespace pcanvas
{

namespace {
    bool fileExists(const std::string& p)
    {
        std::error_code ec;
        return fs::exists(p, ec);
    }

    // Removes the scratch files of one model run.
    struct ScratchFiles
    {
        fs::path input;
        fs::path output;
        ~ScratchFiles()
        {
            std::error_code ec;
            fs::remove(input, ec);
            fs::remove(output, ec);
        }
    };
}

ScriptSegmenter::ScriptSegmenter(std::string scriptPath, std::string interpreter)
    : scriptPath_(std::move(scriptPath)), interpreter_(std::move(interpreter))
{
}

std::string ScriptSegmenter::defaultScriptPath()
{
    const char* scriptEnv = std::getenv("PCANVAS_SEGMENT_SCRIPT");
    return scriptEnv ? std::string(scriptEnv) : std::string("scripts/remove_background.py");
}

bool ScriptSegmenter::available() const
{
    return !scriptPath_.empty() && fileExists(scriptPath_);
}

SegmentStatus ScriptSegmenter::segment(const cv::Mat& bgr, cv::Mat& outAlpha, std::string& reason)
{
    if (!available())
    {
        reason = "segmentation script not found at '" + scriptPath_ + "'";
        return SegmentStatus::Unavailable;
    }
    if (bgr.empty())
    {
        reason = "empty input image";
        return SegmentStatus::Failed;
    }

    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec)
    {
        reason = "no temporary directory: " + ec.message();
        return SegmentStatus::Failed;
    }
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::string base = "pcanvas_" + std::to_string(stamp) + "_" + std::to_string(++runCounter_);
    ScratchFiles scratch{ tmp / (base + "_in.png"), tmp / (base + "_out.png") };

    if (!cv::imwrite(scratch.input.string(), bgr))
    {
        reason = "cannot write model input " + scratch.input.string();
        return SegmentStatus::Failed;
    }

    std::string cmd = interpreter_ + " \"" + scriptPath_ + "\"" +
        " --input \"" + scratch.input.string() + "\"" +
        " --output \"" + scratch.output.string() + "\"";
    int rc = std::system(cmd.c_str());
    if (rc != 0 || !fileExists(scratch.output.string()))
    {
        reason = "segmentation script failed (rc=" + std::to_string(rc) + ") or output missing";
        return SegmentStatus::Failed;
    }

    cv::Mat result = cv::imread(scratch.output.string(), cv::IMREAD_UNCHANGED);
    if (result.empty())
    {
        reason = "model output is not a readable image";
        return SegmentStatus::Failed;
    }
    if (result.depth() == CV_16U) result.convertTo(result, CV_8U, 1.0 / 257.0);

    cv::Mat alpha;
    if (result.channels() == 4) cv::extractChannel(result, alpha, 3);
    else if (result.channels() == 1) alpha = result;
    else cv::cvtColor(result, alpha, cv::COLOR_BGR2GRAY);

    if (alpha.size() != bgr.size())
        cv::resize(alpha, alpha, bgr.size(), 0, 0, cv::INTER_LINEAR);
    outAlpha = alpha;
    return SegmentStatus::Ok;
}

}
