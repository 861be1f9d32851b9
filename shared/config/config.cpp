#include "config.hpp"
#include "util/ImageOps.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <sstream>

namespace pcanvas
{

namespace {
    std::string lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool parseInt(const std::string& s, int& v)
    {
        if (s.empty()) return false;
        char* end = nullptr;
        errno = 0;
        long x = std::strtol(s.c_str(), &end, 10);
        if (errno != 0 || *end != '\0' || x < -1000000000L || x > 1000000000L) return false;
        v = static_cast<int>(x);
        return true;
    }

    bool parseDouble(const std::string& s, double& v)
    {
        if (s.empty()) return false;
        char* end = nullptr;
        errno = 0;
        double x = std::strtod(s.c_str(), &end);
        if (errno != 0 || *end != '\0') return false;
        v = x;
        return true;
    }

    bool parseBool(const std::string& s, bool& v)
    {
        std::string t = lower(s);
        if (t == "true" || t == "1" || t == "yes" || t == "on") { v = true; return true; }
        if (t == "false" || t == "0" || t == "no" || t == "off") { v = false; return true; }
        return false;
    }

    std::string formatDouble(double d)
    {
        std::ostringstream os;
        os << d;
        return os.str();
    }

    struct Field
    {
        std::string key;
        std::function<bool(ProcessingConfig&, const std::string&)> set;
        std::function<std::string(const ProcessingConfig&)> get;
    };

    Field intField(const char* key, int ProcessingConfig::*m)
    {
        return { key,
                 [m](ProcessingConfig& c, const std::string& v) { return parseInt(v, c.*m); },
                 [m](const ProcessingConfig& c) { return std::to_string(c.*m); } };
    }

    Field doubleField(const char* key, double ProcessingConfig::*m)
    {
        return { key,
                 [m](ProcessingConfig& c, const std::string& v) { return parseDouble(v, c.*m); },
                 [m](const ProcessingConfig& c) { return formatDouble(c.*m); } };
    }

    Field boolField(const char* key, bool ProcessingConfig::*m)
    {
        return { key,
                 [m](ProcessingConfig& c, const std::string& v) { return parseBool(v, c.*m); },
                 [m](const ProcessingConfig& c) { return std::string(c.*m ? "true" : "false"); } };
    }

    Field stringField(const char* key, std::string ProcessingConfig::*m)
    {
        return { key,
                 [m](ProcessingConfig& c, const std::string& v) { c.*m = v; return true; },
                 [m](const ProcessingConfig& c) { return c.*m; } };
    }

    bool parseOutputFormat(const std::string& s, OutputFormat& f)
    {
        std::string t = lower(s);
        if (t == "webp" || t == "lossy" || t == "lossy-with-quality") { f = OutputFormat::Webp; return true; }
        if (t == "jpeg" || t == "jpg" || t == "lossy-fixed") { f = OutputFormat::Jpeg; return true; }
        if (t == "png" || t == "lossless") { f = OutputFormat::Png; return true; }
        return false;
    }

    std::string formatName(OutputFormat f)
    {
        switch (f)
        {
            case OutputFormat::Webp: return "webp";
            case OutputFormat::Png: return "png";
            case OutputFormat::Jpeg: break;
        }
        return "jpeg";
    }

    const std::vector<Field>& fields()
    {
        static const std::vector<Field> table = {
            intField("target_width", &ProcessingConfig::targetWidth),
            intField("target_height", &ProcessingConfig::targetHeight),
            stringField("background_color", &ProcessingConfig::backgroundColor),
            doubleField("product_size_ratio", &ProcessingConfig::productSizeRatio),
            doubleField("min_margin_ratio", &ProcessingConfig::minMarginRatio),
            { "center_mode",
              [](ProcessingConfig& c, const std::string& v) {
                  std::string t = lower(v);
                  if (t == "bbox") { c.centerMode = CenterMode::BoundingBox; return true; }
                  if (t == "centroid") { c.centerMode = CenterMode::Centroid; return true; }
                  return false;
              },
              [](const ProcessingConfig& c) { return std::string(c.centerMode == CenterMode::Centroid ? "centroid" : "bbox"); } },
            boolField("soft_edges", &ProcessingConfig::softEdges),
            doubleField("soft_edges_radius", &ProcessingConfig::softEdgesRadius),
            boolField("recolor_background", &ProcessingConfig::recolorBackground),
            intField("white_threshold", &ProcessingConfig::whiteThreshold),
            intField("black_threshold", &ProcessingConfig::blackThreshold),
            intField("alpha_threshold", &ProcessingConfig::alphaThreshold),
            { "background_edge_mode",
              [](ProcessingConfig& c, const std::string& v) {
                  std::string t = lower(v);
                  if (t == "auto") { c.backgroundEdgeMode = BackgroundEdgeMode::Auto; return true; }
                  if (t == "white") { c.backgroundEdgeMode = BackgroundEdgeMode::White; return true; }
                  if (t == "black") { c.backgroundEdgeMode = BackgroundEdgeMode::Black; return true; }
                  return false;
              },
              [](const ProcessingConfig& c) {
                  switch (c.backgroundEdgeMode)
                  {
                      case BackgroundEdgeMode::White: return std::string("white");
                      case BackgroundEdgeMode::Black: return std::string("black");
                      case BackgroundEdgeMode::Auto: break;
                  }
                  return std::string("auto");
              } },
            intField("flood_step_tolerance", &ProcessingConfig::floodStepTolerance),
            intField("flood_model_tolerance", &ProcessingConfig::floodModelTolerance),
            doubleField("edge_barrier_ratio", &ProcessingConfig::edgeBarrierRatio),
            intField("edge_barrier_tolerance", &ProcessingConfig::edgeBarrierTolerance),
            intField("bbox_padding", &ProcessingConfig::bboxPadding),
            intField("min_box_size", &ProcessingConfig::minBoxSize),
            boolField("flatten_png_first", &ProcessingConfig::flattenPngFirst),
            boolField("png_edge_fix", &ProcessingConfig::pngEdgeFix),
            stringField("png_matte", &ProcessingConfig::pngMatte),
            boolField("auto_upscale", &ProcessingConfig::autoUpscale),
            intField("upscale_threshold", &ProcessingConfig::upscaleThreshold),
            boolField("ai_background_removal", &ProcessingConfig::aiBackgroundRemoval),
            intField("ai_confidence_threshold", &ProcessingConfig::aiConfidenceThreshold),
            intField("ai_min_region_area", &ProcessingConfig::aiMinRegionArea),
            doubleField("ai_restore_max_kept_fraction", &ProcessingConfig::aiRestoreMaxKeptFraction),
            { "output_format",
              [](ProcessingConfig& c, const std::string& v) { return parseOutputFormat(v, c.outputFormat); },
              [](const ProcessingConfig& c) { return formatName(c.outputFormat); } },
            intField("quality", &ProcessingConfig::quality),
            intField("min_quality", &ProcessingConfig::minQuality),
            intField("target_max_kb", &ProcessingConfig::targetMaxKb),
            intField("max_encode_attempts", &ProcessingConfig::maxEncodeAttempts),
        };
        return table;
    }

    bool fail(ProcessingError& err, const std::string& field, const std::string& message)
    {
        err.kind = ErrorKind::InvalidConfig;
        err.field = field;
        err.message = field + ": " + message;
        return false;
    }

    bool checkRange(ProcessingError& err, const char* field, double v, double lo, double hi)
    {
        if (v >= lo && v <= hi) return true;
        std::ostringstream os;
        os << "value " << v << " outside [" << lo << ", " << hi << "]";
        return fail(err, field, os.str());
    }
}

std::vector<std::string> knownConfigKeys()
{
    std::vector<std::string> keys;
    for (const auto& f : fields()) keys.push_back(f.key);
    return keys;
}

bool applyConfigLayer(ProcessingConfig& cfg, const ConfigLayer& layer, ProcessingError& err)
{
    for (const auto& [key, value] : layer)
    {
        auto it = std::find_if(fields().begin(), fields().end(), [&](const Field& f) { return f.key == key; });
        if (it == fields().end())
        {
            std::cerr << "[config] ignoring unknown key '" << key << "'\n";
            continue;
        }
        if (!it->set(cfg, value))
            return fail(err, key, "cannot parse '" + value + "'");
    }
    return true;
}

bool validateConfig(const ProcessingConfig& c, ProcessingError& err)
{
    cv::Scalar color;
    if (c.targetWidth <= 0) return fail(err, "target_width", "must be positive");
    if (c.targetHeight <= 0) return fail(err, "target_height", "must be positive");
    if (!util::parseHexColor(c.backgroundColor, color)) return fail(err, "background_color", "expected #RRGGBB, got '" + c.backgroundColor + "'");
    if (!(c.productSizeRatio > 0.0 && c.productSizeRatio <= 1.0)) return fail(err, "product_size_ratio", "must be in (0, 1]");
    if (!(c.minMarginRatio >= 0.0 && c.minMarginRatio < 0.5)) return fail(err, "min_margin_ratio", "must be in [0, 0.5)");
    if (!checkRange(err, "soft_edges_radius", c.softEdgesRadius, 0.0, 10.0)) return false;
    if (!checkRange(err, "white_threshold", c.whiteThreshold, 0, 255)) return false;
    if (!checkRange(err, "black_threshold", c.blackThreshold, 0, 255)) return false;
    if (c.blackThreshold >= c.whiteThreshold) return fail(err, "black_threshold", "must be below white_threshold");
    if (!checkRange(err, "alpha_threshold", c.alphaThreshold, 0, 254)) return false;
    if (!checkRange(err, "flood_step_tolerance", c.floodStepTolerance, 0, 255)) return false;
    if (!checkRange(err, "flood_model_tolerance", c.floodModelTolerance, 0, 255)) return false;
    if (!checkRange(err, "edge_barrier_ratio", c.edgeBarrierRatio, 0.0, 0.25)) return false;
    if (!checkRange(err, "edge_barrier_tolerance", c.edgeBarrierTolerance, 0, 255)) return false;
    if (c.bboxPadding < 0) return fail(err, "bbox_padding", "must not be negative");
    if (c.minBoxSize < 1) return fail(err, "min_box_size", "must be at least 1");
    if (!util::parseHexColor(c.pngMatte, color)) return fail(err, "png_matte", "expected #RRGGBB, got '" + c.pngMatte + "'");
    if (c.upscaleThreshold <= 0) return fail(err, "upscale_threshold", "must be positive");
    if (!checkRange(err, "ai_confidence_threshold", c.aiConfidenceThreshold, 1, 255)) return false;
    if (c.aiMinRegionArea < 1) return fail(err, "ai_min_region_area", "must be at least 1");
    if (!checkRange(err, "ai_restore_max_kept_fraction", c.aiRestoreMaxKeptFraction, 0.0, 1.0)) return false;
    if (!checkRange(err, "quality", c.quality, 1, 100)) return false;
    if (!checkRange(err, "min_quality", c.minQuality, 1, 100)) return false;
    if (c.minQuality > c.quality) return fail(err, "min_quality", "must not exceed quality");
    if (c.targetMaxKb < 0) return fail(err, "target_max_kb", "must not be negative");
    if (!checkRange(err, "max_encode_attempts", c.maxEncodeAttempts, 2, 50)) return false;
    return true;
}

ConfigLayer forcedLayerFor(const ProcessingConfig& merged)
{
    ConfigLayer forced;
    if (merged.aiBackgroundRemoval) forced["flatten_png_first"] = "false";
    return forced;
}

bool mergeConfig(const ProcessingConfig& defaults, const std::vector<ConfigLayer>& layers,
                 ProcessingConfig& out, ProcessingError& err)
{
    ProcessingConfig cfg = defaults;
    for (const auto& layer : layers)
        if (!applyConfigLayer(cfg, layer, err)) return false;
    if (!applyConfigLayer(cfg, forcedLayerFor(cfg), err)) return false;
    if (!validateConfig(cfg, err)) return false;
    out = cfg;
    return true;
}

bool loadConfigFile(const std::string& path, ConfigLayer& out, ProcessingError& err)
{
    cv::FileStorage fs;
    try
    {
        if (!fs.open(path, cv::FileStorage::READ))
            return fail(err, "config_file", "cannot open " + path);
    }
    catch (const cv::Exception& e)
    {
        return fail(err, "config_file", "cannot parse " + path + ": " + e.what());
    }

    cv::FileNode root = fs.root();
    if (!root.isMap()) return fail(err, "config_file", path + " must hold a single object");

    for (auto it = root.begin(); it != root.end(); ++it)
    {
        cv::FileNode n = *it;
        const std::string key = n.name();
        if (n.isString()) out[key] = static_cast<std::string>(n);
        else if (n.isInt()) out[key] = std::to_string(static_cast<int>(n));
        else if (n.isReal()) out[key] = formatDouble(static_cast<double>(n));
        else std::cerr << "[config] ignoring non-scalar key '" << key << "' in " << path << "\n";
    }
    return true;
}

ConfigLayer configToLayer(const ProcessingConfig& cfg)
{
    ConfigLayer layer;
    for (const auto& f : fields()) layer[f.key] = f.get(cfg);
    return layer;
}

}
