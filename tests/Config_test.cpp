#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "config/config.hpp"

using namespace pcanvas;

namespace {

ConfigLayer one(const std::string &key, const std::string &value)
{
    ConfigLayer layer;
    layer[key] = value;
    return layer;
}

ProcessingError mergeExpectingFailure(const std::vector<ConfigLayer> &layers)
{
    ProcessingConfig cfg;
    ProcessingError err;
    EXPECT_FALSE(mergeConfig(ProcessingConfig{}, layers, cfg, err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidConfig);
    return err;
}

} // namespace

TEST(ConfigTest, DefaultsAreValid)
{
    ProcessingError err;
    EXPECT_TRUE(validateConfig(ProcessingConfig{}, err)) << err.message;
}

TEST(ConfigTest, LaterLayersWin)
{
    ProcessingConfig cfg;
    ProcessingError err;
    ConfigLayer file = one("quality", "80");
    file["target_width"] = "1200";
    ASSERT_TRUE(mergeConfig(ProcessingConfig{}, { file, one("quality", "70") }, cfg, err)) << err.message;
    EXPECT_EQ(cfg.quality, 70);
    EXPECT_EQ(cfg.targetWidth, 1200);
    EXPECT_EQ(cfg.targetHeight, 1000);
}

TEST(ConfigTest, ParsesEveryKind)
{
    ProcessingConfig cfg;
    ProcessingError err;
    ConfigLayer layer = { { "background_color", "#FFFFFF" },
                          { "product_size_ratio", "0.8" },
                          { "soft_edges", "false" },
                          { "auto_upscale", "1" },
                          { "center_mode", "centroid" },
                          { "background_edge_mode", "black" },
                          { "output_format", "webp" },
                          { "target_max_kb", "300" } };
    ASSERT_TRUE(mergeConfig(ProcessingConfig{}, { layer }, cfg, err)) << err.message;
    EXPECT_EQ(cfg.backgroundColor, "#FFFFFF");
    EXPECT_DOUBLE_EQ(cfg.productSizeRatio, 0.8);
    EXPECT_FALSE(cfg.softEdges);
    EXPECT_TRUE(cfg.autoUpscale);
    EXPECT_EQ(cfg.centerMode, CenterMode::Centroid);
    EXPECT_EQ(cfg.backgroundEdgeMode, BackgroundEdgeMode::Black);
    EXPECT_EQ(cfg.outputFormat, OutputFormat::Webp);
    EXPECT_EQ(cfg.targetMaxKb, 300);
}

TEST(ConfigTest, AiForcesFlatteningOff)
{
    ProcessingConfig cfg;
    ProcessingError err;
    ConfigLayer request = one("flatten_png_first", "true");
    request["ai_background_removal"] = "true";
    ASSERT_TRUE(mergeConfig(ProcessingConfig{}, { request }, cfg, err));
    EXPECT_TRUE(cfg.aiBackgroundRemoval);
    EXPECT_FALSE(cfg.flattenPngFirst);

    ASSERT_TRUE(mergeConfig(ProcessingConfig{}, { one("flatten_png_first", "true") }, cfg, err));
    EXPECT_TRUE(cfg.flattenPngFirst);
}

TEST(ConfigTest, UnknownKeysAreIgnored)
{
    ProcessingConfig cfg;
    ProcessingError err;
    EXPECT_TRUE(mergeConfig(ProcessingConfig{}, { one("no_such_key", "1") }, cfg, err));
}

TEST(ConfigTest, ErrorsNameTheField)
{
    EXPECT_EQ(mergeExpectingFailure({ one("quality", "abc") }).field, "quality");
    EXPECT_EQ(mergeExpectingFailure({ one("quality", "0") }).field, "quality");
    EXPECT_EQ(mergeExpectingFailure({ one("background_color", "#XYZ") }).field, "background_color");
    EXPECT_EQ(mergeExpectingFailure({ one("min_quality", "96") }).field, "min_quality");
    EXPECT_EQ(mergeExpectingFailure({ one("target_width", "-5") }).field, "target_width");
    EXPECT_EQ(mergeExpectingFailure({ one("product_size_ratio", "1.5") }).field, "product_size_ratio");
    EXPECT_EQ(mergeExpectingFailure({ one("output_format", "gif") }).field, "output_format");
    EXPECT_EQ(mergeExpectingFailure({ one("max_encode_attempts", "1") }).field, "max_encode_attempts");
    EXPECT_EQ(mergeExpectingFailure({ one("black_threshold", "250") }).field, "black_threshold");
    EXPECT_EQ(mergeExpectingFailure({ one("soft_edges", "maybe") }).field, "soft_edges");
}

TEST(ConfigTest, LayerOfConfigReproducesIt)
{
    ProcessingConfig custom;
    custom.quality = 77;
    custom.outputFormat = OutputFormat::Png;
    custom.centerMode = CenterMode::Centroid;
    custom.softEdgesRadius = 2.5;

    ProcessingConfig back;
    ProcessingError err;
    ASSERT_TRUE(mergeConfig(ProcessingConfig{}, { configToLayer(custom) }, back, err)) << err.message;
    EXPECT_EQ(back.quality, 77);
    EXPECT_EQ(back.outputFormat, OutputFormat::Png);
    EXPECT_EQ(back.centerMode, CenterMode::Centroid);
    EXPECT_DOUBLE_EQ(back.softEdgesRadius, 2.5);
    EXPECT_EQ(configToLayer(custom).size(), knownConfigKeys().size());
}

TEST(ConfigTest, LoadsJsonFile)
{
    const std::string path = ::testing::TempDir() + "pcanvas_config_test.json";
    {
        std::ofstream f(path);
        f << "{\n"
          << "  \"target_width\": 1200,\n"
          << "  \"background_color\": \"#FFFFFF\",\n"
          << "  \"edge_barrier_ratio\": 0.02,\n"
          << "  \"soft_edges\": \"false\"\n"
          << "}\n";
    }

    ConfigLayer layer;
    ProcessingError err;
    ASSERT_TRUE(loadConfigFile(path, layer, err)) << err.message;
    std::remove(path.c_str());

    EXPECT_EQ(layer["target_width"], "1200");
    EXPECT_EQ(layer["background_color"], "#FFFFFF");
    EXPECT_EQ(layer["edge_barrier_ratio"], "0.02");
    EXPECT_EQ(layer["soft_edges"], "false");

    ProcessingConfig cfg;
    ASSERT_TRUE(mergeConfig(ProcessingConfig{}, { layer }, cfg, err)) << err.message;
    EXPECT_EQ(cfg.targetWidth, 1200);
    EXPECT_FALSE(cfg.softEdges);
}

TEST(ConfigTest, NestedValuesInFileAreSkipped)
{
    const std::string path = ::testing::TempDir() + "pcanvas_config_nested.json";
    {
        std::ofstream f(path);
        f << "{\n"
          << "  \"quality\": 80,\n"
          << "  \"sizes\": [1, 2, 3],\n"
          << "  \"extra\": { \"a\": 1 }\n"
          << "}\n";
    }

    ConfigLayer layer;
    ProcessingError err;
    ASSERT_TRUE(loadConfigFile(path, layer, err)) << err.message;
    std::remove(path.c_str());

    EXPECT_EQ(layer.size(), 1u);
    EXPECT_EQ(layer["quality"], "80");
}

TEST(ConfigTest, MissingFileIsConfigError)
{
    ConfigLayer layer;
    ProcessingError err;
    EXPECT_FALSE(loadConfigFile(::testing::TempDir() + "pcanvas_no_such_config.json", layer, err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidConfig);
    EXPECT_EQ(err.field, "config_file");
}
