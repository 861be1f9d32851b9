#include "pipeline.hpp"
#include "config/config.hpp"
#include "segmentation/segmentation.hpp"
#include "ai_correction/ai_correction.hpp"
#include "bbox/bbox.hpp"
#include "unmatte/unmatte.hpp"
#include "compose_canvas/compose_canvas.hpp"
#include "encoder/adaptive_encoder.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/opencv.hpp>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

using namespace cv;

namespace pcanvas
{

namespace
{
    const Scalar kWhite(255, 255, 255);

    bool fail(ProcessingError& err, ErrorKind kind, const std::string& message)
    {
        err.kind = kind;
        err.field.clear();
        err.message = message;
        return false;
    }

    /* AI alpha, corrected against the flood fill of the same pixels -------- */
    // Returns a BGRA image on success; on any fallback `img` is returned as is
    // and the reason is recorded.
    static Mat applyAiSegmentation(const Mat& img, const ProcessingConfig& cfg,
                                   ISegmenter& segmenter, Diagnostics& diag)
    {
        diag.aiRequested = true;
        Mat bgr = img.channels() == 4 ? util::flattenOnto(img, kWhite) : img;

        auto fallBack = [&](const std::string& reason) {
            diag.aiFellBack = true;
            diag.aiFallbackReason = reason;
            std::cerr << "[process] AI background removal skipped, using flood fill: " << reason << "\n";
            return img;
        };

        if (!segmenter.available())
            return fallBack("segmenter unavailable");

        Mat aiAlpha;
        std::string reason;
        SegmentStatus status = segmenter.segment(bgr, aiAlpha, reason);
        if (status != SegmentStatus::Ok)
            return fallBack(reason.empty() ? "segmenter failed" : reason);
        if (aiAlpha.empty() || aiAlpha.type() != CV_8UC1 || aiAlpha.size() != bgr.size())
            return fallBack("segmenter returned an unusable mask");

        Mat floodMask;
        if (!computeFloodFillBackgroundMask(bgr, floodMask, cfg))
            return fallBack("flood fill for AI correction failed");

        Mat alpha;
        AiCorrectionStats stats;
        if (!correctAiAlpha(aiAlpha, floodMask, cfg, alpha, &stats))
            return fallBack("AI correction failed");

        diag.aiApplied = true;
        diag.aiPromotedPixels = stats.promotedPixels;
        diag.aiRestoredRegions = stats.restoredRegions;

        std::vector<Mat> ch;
        split(bgr, ch);
        ch.push_back(alpha);
        Mat bgra;
        merge(ch, bgra);
        return bgra;
    }
}

/*-------------------------------------------------------------------------*\
|  Public API                                                               |
\*-------------------------------------------------------------------------*/
bool process(const cv::Mat& image, const ProcessingConfig& cfg, ISegmenter& segmenter,
             ProcessOutput& out, ProcessingError& err)
{
    if (!validateConfig(cfg, err)) return false;

    Mat img = util::normalizeChannels(image);
    if (img.empty())
        return fail(err, ErrorKind::InvalidInput, "unreadable or unsupported image");

    Diagnostics diag;

    /* 1 · Optional flatten ------------------------------------------------- */
    if (cfg.flattenPngFirst && !cfg.aiBackgroundRemoval && img.channels() == 4)
        img = util::flattenOnto(img, kWhite);

    /* 2 · AI alpha --------------------------------------------------------- */
    if (cfg.aiBackgroundRemoval)
        img = applyAiSegmentation(img, cfg, segmenter, diag);

    // An alpha channel that marks nothing as background carries no information.
    if (img.channels() == 4 && !hasUsableAlpha(img, cfg.alphaThreshold))
        cvtColor(img, img, COLOR_BGRA2BGR);

    /* 3 · Background mask and box ----------------------------------------- */
    Mat background;
    Polarity polarity = Polarity::None;
    if (!computeBackgroundMask(img, background, cfg, &polarity))
        return fail(err, ErrorKind::InvalidInput, "background segmentation failed");
    diag.polarity = polarity;

    std::optional<BoundingBox> box = findProductBoundingBox(background, cfg.bboxPadding, cfg.minBoxSize);
    diag.bbox = box;
    diag.productFound = box.has_value();

    /* 4 · Canvas ----------------------------------------------------------- */
    Mat canvas;
    if (box)
    {
        Rect r = box->toRect();
        Mat crop = img(r).clone();
        Mat cropMask = productMaskFrom(background(r));

        if (crop.channels() == 4 && cfg.pngEdgeFix)
        {
            UnmatteSettings settings;
            if (!util::parseHexColor(cfg.pngMatte, settings.matte))
            {
                err = { ErrorKind::InvalidConfig, "png_matte", "png_matte: expected #RRGGBB" };
                return false;
            }
            unmatteEdges(crop, settings);
        }

        if (!composeOnCanvas(crop, cropMask, cfg, canvas))
            return fail(err, ErrorKind::InvalidInput, "cannot composite product onto canvas");
    }
    else
    {
        std::cerr << "[process] no product found, fitting the full frame\n";
        if (!fitFrameOnCanvas(img, cfg, canvas))
            return fail(err, ErrorKind::InvalidInput, "cannot fit frame onto canvas");
    }

    if (cfg.recolorBackground)
        recolorBackground(canvas, cfg);

    /* 5 · Encode ----------------------------------------------------------- */
    EncodeResult encoded;
    if (!encodeAdaptive(canvas, cfg, encoded))
        return fail(err, ErrorKind::EncodeFailed, "encoding " + extensionFor(cfg.outputFormat) + " failed");

    diag.encodedBytes = encoded.bytes.size();
    diag.qualityUsed = encoded.quality;
    diag.encodeAttempts = encoded.attempts;
    diag.sizeTargetMet = encoded.sizeTargetMet;

    out.encoded = std::move(encoded.bytes);
    out.format = cfg.outputFormat;
    out.composited = canvas;
    out.diagnostics = diag;
    return true;
}

}
