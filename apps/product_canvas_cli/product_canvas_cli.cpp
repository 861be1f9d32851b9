// Batch front end for the product canvas pipeline.
// Build via CMake target: product_canvas_cli

#include "config/config.hpp"
#include "pipeline/pipeline.hpp"
#include "ai_segmenter/ai_segmenter.hpp"
#include "encoder/adaptive_encoder.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace pcanvas;

static void printUsage(const char* prog)
{
    std::cerr << "Usage: " << prog << " (--file <image> | --input <dir>) --output <path>\n"
              << "       [--config <file.json>] [--set key=value]... [--<key> <value>]...\n"
              << "       [--ai-script <script.py>] [--print-config]\n"
              << "Keys:";
    for (const auto& k : knownConfigKeys()) std::cerr << ' ' << k;
    std::cerr << "\n";
}

static bool isImageFile(const fs::path& p)
{
    static const std::vector<std::string> exts = { ".jpg", ".jpeg", ".png", ".bmp", ".tif", ".tiff", ".webp" };
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

static bool writeBytes(const fs::path& path, const std::vector<std::uint8_t>& bytes)
{
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    if (ec)
    {
        std::cerr << "[cli] cannot create " << path.parent_path() << ": " << ec.message() << "\n";
        return false;
    }
    std::ofstream f(path, std::ios::binary);
    if (!f) return false;
    std::copy(bytes.begin(), bytes.end(), std::ostreambuf_iterator<char>(f));
    return static_cast<bool>(f);
}

struct Summary
{
    int processed {0};
    int failed {0};
    int noProduct {0};
    int overBudget {0};
    int aiFallbacks {0};
};

static void processFile(const fs::path& in, const fs::path& out, const ProcessingConfig& cfg,
                        ISegmenter& segmenter, Summary& summary)
{
    cv::Mat img = cv::imread(in.string(), cv::IMREAD_UNCHANGED);
    if (img.empty())
    {
        std::cerr << "[cli] cannot read " << in << "\n";
        ++summary.failed;
        return;
    }

    ProcessOutput result;
    ProcessingError err;
    if (!process(img, cfg, segmenter, result, err))
    {
        std::cerr << "[cli] " << in << ": " << err.message << "\n";
        ++summary.failed;
        return;
    }
    if (!writeBytes(out, result.encoded))
    {
        std::cerr << "[cli] cannot write " << out << "\n";
        ++summary.failed;
        return;
    }

    const Diagnostics& d = result.diagnostics;
    ++summary.processed;
    if (!d.productFound) ++summary.noProduct;
    if (!d.sizeTargetMet) ++summary.overBudget;
    if (d.aiFellBack) ++summary.aiFallbacks;

    std::cout << "[cli] " << in.filename().string() << " -> " << out.string()
              << " (" << (d.encodedBytes + 1023) / 1024 << " KB";
    if (d.qualityUsed > 0) std::cout << ", q=" << d.qualityUsed;
    if (d.encodeAttempts > 1) std::cout << ", " << d.encodeAttempts << " attempts";
    if (!d.productFound) std::cout << ", no product";
    if (!d.sizeTargetMet) std::cout << ", over budget";
    if (d.aiApplied) std::cout << ", ai";
    std::cout << ")\n";
}

int main(int argc, char** argv)
{
    std::string filePath, inputDir, outputPath, configPath, aiScript;
    bool printConfig = false;
    ConfigLayer overrides;

    const std::vector<std::string> keys = knownConfigKeys();
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto next = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };

        if (arg == "--help" || arg == "-h") { printUsage(argv[0]); return 0; }
        if (arg == "--print-config") { printConfig = true; continue; }

        const char* value = next();
        if (!value)
        {
            std::cerr << "[cli] missing value for " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }

        if (arg == "--file") filePath = value;
        else if (arg == "--input") inputDir = value;
        else if (arg == "--output") outputPath = value;
        else if (arg == "--config") configPath = value;
        else if (arg == "--ai-script") aiScript = value;
        else if (arg == "--set")
        {
            std::string kv = value;
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0)
            {
                std::cerr << "[cli] --set expects key=value, got '" << kv << "'\n";
                return 1;
            }
            overrides[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
        else if (arg.rfind("--", 0) == 0)
        {
            std::string key = arg.substr(2);
            std::replace(key.begin(), key.end(), '-', '_');
            if (std::find(keys.begin(), keys.end(), key) == keys.end())
            {
                std::cerr << "[cli] unknown option " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
            overrides[key] = value;
        }
        else
        {
            std::cerr << "[cli] unexpected argument " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    /* 1 · Configuration ---------------------------------------------------- */
    std::vector<ConfigLayer> layers;
    ProcessingError err;
    if (!configPath.empty())
    {
        ConfigLayer fileLayer;
        if (!loadConfigFile(configPath, fileLayer, err))
        {
            std::cerr << "[cli] " << err.message << "\n";
            return 1;
        }
        layers.push_back(fileLayer);
    }
    layers.push_back(overrides);

    ProcessingConfig cfg;
    if (!mergeConfig(ProcessingConfig{}, layers, cfg, err))
    {
        std::cerr << "[cli] invalid configuration: " << err.message << "\n";
        return 1;
    }

    if (printConfig)
    {
        for (const auto& [k, v] : configToLayer(cfg)) std::cout << k << " = " << v << "\n";
        if (filePath.empty() && inputDir.empty()) return 0;
    }

    if ((filePath.empty() == inputDir.empty()) || outputPath.empty())
    {
        printUsage(argv[0]);
        return 1;
    }

    /* 2 · Segmenter -------------------------------------------------------- */
    std::unique_ptr<ISegmenter> segmenter;
    if (cfg.aiBackgroundRemoval)
    {
        auto script = std::make_unique<ScriptSegmenter>(aiScript.empty() ? ScriptSegmenter::defaultScriptPath() : aiScript);
        if (!script->available())
            std::cerr << "[cli] segmentation script not found at '" << script->scriptPath()
                      << "'. Images will use flood fill.\n";
        segmenter = std::move(script);
    }
    else
    {
        segmenter = std::make_unique<NullSegmenter>();
    }

    /* 3 · Files ------------------------------------------------------------ */
    const std::string ext = extensionFor(cfg.outputFormat);
    Summary summary;

    if (!filePath.empty())
    {
        fs::path out = outputPath;
        std::error_code ec;
        if (fs::is_directory(out, ec) || outputPath.back() == '/')
            out = out / fs::path(filePath).stem();
        out.replace_extension(ext);
        processFile(filePath, out, cfg, *segmenter, summary);
    }
    else
    {
        std::error_code ec;
        fs::path root = inputDir;
        if (!fs::is_directory(root, ec))
        {
            std::cerr << "[cli] input is not a directory: " << root << "\n";
            return 1;
        }
        std::vector<fs::path> files;
        for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec))
            if (it->is_regular_file(ec) && isImageFile(it->path())) files.push_back(it->path());
        if (ec)
        {
            std::cerr << "[cli] cannot walk " << root << ": " << ec.message() << "\n";
            return 1;
        }
        std::sort(files.begin(), files.end());

        for (const auto& in : files)
        {
            fs::path out = fs::path(outputPath) / fs::relative(in, root, ec);
            if (ec) out = fs::path(outputPath) / in.filename();
            out.replace_extension(ext);
            processFile(in, out, cfg, *segmenter, summary);
        }
    }

    std::cout << "[cli] done: " << summary.processed << " processed, " << summary.failed << " failed";
    if (summary.noProduct) std::cout << ", " << summary.noProduct << " without product";
    if (summary.overBudget) std::cout << ", " << summary.overBudget << " over size budget";
    if (summary.aiFallbacks) std::cout << ", " << summary.aiFallbacks << " AI fallbacks";
    std::cout << "\n";
    return summary.failed > 0 ? 2 : 0;
}
