/**
 * @file ProcessingConfig.hpp
 * Per-request processing parameters. Built once by mergeConfig() and passed
 * by const reference through every stage; nothing in the pipeline mutates it.
 */
#pragma once
#include <string>
#include "models/OutputFormat.hpp"

namespace pcanvas
{

struct ProcessingConfig
{
    // Canvas
    int targetWidth {1000};
    int targetHeight {1000};
    std::string backgroundColor {"#F3F3F3"};
    double productSizeRatio {0.75};
    double minMarginRatio {0.05};
    CenterMode centerMode {CenterMode::BoundingBox};
    bool softEdges {true};
    double softEdgesRadius {1.0};
    bool recolorBackground {false};

    // Background detection
    int whiteThreshold {240};
    int blackThreshold {15};
    int alphaThreshold {5};
    BackgroundEdgeMode backgroundEdgeMode {BackgroundEdgeMode::Auto};
    int floodStepTolerance {6};
    int floodModelTolerance {9};
    double edgeBarrierRatio {0.01};
    int edgeBarrierTolerance {6};

    // Bounding box
    int bboxPadding {10};
    int minBoxSize {2};

    // PNG alpha handling
    bool flattenPngFirst {false};
    bool pngEdgeFix {true};
    std::string pngMatte {"#FFFFFF"};

    // Upscaling of small products
    bool autoUpscale {false};
    int upscaleThreshold {800};

    // AI background removal
    bool aiBackgroundRemoval {false};
    int aiConfidenceThreshold {200};
    int aiMinRegionArea {400};
    double aiRestoreMaxKeptFraction {0.05};

    // Encoding
    OutputFormat outputFormat {OutputFormat::Jpeg};
    int quality {95};
    int minQuality {65};
    int targetMaxKb {0};        // 0 = no size budget
    int maxEncodeAttempts {10};
};

}
