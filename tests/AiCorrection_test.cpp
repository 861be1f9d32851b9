#include <gtest/gtest.h>

#include <opencv2/core.hpp>

#include "ai_correction/ai_correction.hpp"
#include "segmentation/segmentation.hpp"
#include "TestImages.hpp"

using namespace pcanvas;

namespace {

const cv::Rect kBlobs[3] = { cv::Rect(30, 30, 40, 40), cv::Rect(130, 30, 40, 40), cv::Rect(80, 120, 40, 40) };

cv::Mat threeBlobs()
{
    cv::Mat img = test::solid(200, 200, cv::Scalar(255, 255, 255));
    for (const auto &r : kBlobs)
        img(r).setTo(cv::Scalar(70, 90, 110));
    return img;
}

cv::Mat floodBackgroundOf(const cv::Mat &img)
{
    cv::Mat mask;
    EXPECT_TRUE(computeFloodFillBackgroundMask(img, mask, ProcessingConfig{}));
    return mask;
}

} // namespace

TEST(AiCorrectionTest, RestoresComponentsTheModelDropped)
{
    cv::Mat img = threeBlobs();
    cv::Mat aiAlpha(img.size(), CV_8UC1, cv::Scalar(0));
    aiAlpha(kBlobs[0]).setTo(255);

    cv::Mat alpha;
    AiCorrectionStats stats;
    ASSERT_TRUE(correctAiAlpha(aiAlpha, floodBackgroundOf(img), ProcessingConfig{}, alpha, &stats));
    EXPECT_EQ(stats.restoredRegions, 2);
    for (const auto &r : kBlobs)
        EXPECT_EQ(cv::countNonZero(alpha(r) == 255), r.area());
    EXPECT_EQ(cv::countNonZero(alpha), 3 * kBlobs[0].area());
}

TEST(AiCorrectionTest, SmallComponentsAreNotRestored)
{
    cv::Mat img = test::solid(120, 120, cv::Scalar(255, 255, 255));
    img(cv::Rect(50, 50, 15, 15)).setTo(cv::Scalar(0, 0, 0));
    cv::Mat aiAlpha(img.size(), CV_8UC1, cv::Scalar(0));

    cv::Mat alpha;
    AiCorrectionStats stats;
    ASSERT_TRUE(correctAiAlpha(aiAlpha, floodBackgroundOf(img), ProcessingConfig{}, alpha, &stats));
    EXPECT_EQ(stats.restoredRegions, 0);
    EXPECT_EQ(cv::countNonZero(alpha), 0);
}

TEST(AiCorrectionTest, PromotesGhostingInsideProduct)
{
    cv::Mat img = threeBlobs();
    cv::Mat aiAlpha(img.size(), CV_8UC1, cv::Scalar(0));
    for (const auto &r : kBlobs)
        aiAlpha(r).setTo(255);
    aiAlpha(kBlobs[1]).setTo(120);
    // Translucent haze over the backdrop is not product.
    aiAlpha(cv::Rect(0, 180, 200, 20)).setTo(120);

    cv::Mat alpha;
    AiCorrectionStats stats;
    ASSERT_TRUE(correctAiAlpha(aiAlpha, floodBackgroundOf(img), ProcessingConfig{}, alpha, &stats));
    EXPECT_EQ(stats.restoredRegions, 0);
    EXPECT_EQ(stats.promotedPixels, 36 * 36);
    EXPECT_EQ(alpha.at<uchar>(50, 150), 255);
    EXPECT_EQ(alpha.at<uchar>(30, 130), 120);
    EXPECT_EQ(alpha.at<uchar>(190, 100), 120);
}

TEST(AiCorrectionTest, FillsTransparentHoleInKeptObject)
{
    cv::Mat img = threeBlobs();
    cv::Mat aiAlpha(img.size(), CV_8UC1, cv::Scalar(0));
    for (const auto &r : kBlobs)
        aiAlpha(r).setTo(255);
    // The model kept the left half of the first blob and cut the right half away.
    aiAlpha(cv::Rect(50, 30, 20, 40)).setTo(0);

    cv::Mat alpha;
    AiCorrectionStats stats;
    ASSERT_TRUE(correctAiAlpha(aiAlpha, floodBackgroundOf(img), ProcessingConfig{}, alpha, &stats));
    EXPECT_EQ(stats.restoredRegions, 0);
    EXPECT_EQ(stats.promotedPixels, 18 * 36);
    EXPECT_EQ(alpha.at<uchar>(50, 60), 255);
    EXPECT_EQ(cv::countNonZero(alpha(cv::Rect(32, 32, 36, 36)) == 0), 0);
    // Only the rim outside the eroded interior stays cut.
    EXPECT_EQ(alpha.at<uchar>(50, 69), 0);
}

TEST(AiCorrectionTest, ConfidentAlphaIsUntouched)
{
    cv::Mat img = threeBlobs();
    cv::Mat aiAlpha(img.size(), CV_8UC1, cv::Scalar(0));
    for (const auto &r : kBlobs)
        aiAlpha(r).setTo(230);

    cv::Mat alpha;
    AiCorrectionStats stats;
    ASSERT_TRUE(correctAiAlpha(aiAlpha, floodBackgroundOf(img), ProcessingConfig{}, alpha, &stats));
    EXPECT_EQ(stats.promotedPixels, 0);
    EXPECT_EQ(cv::norm(alpha, aiAlpha, cv::NORM_INF), 0.0);
}

TEST(AiCorrectionTest, RejectsMismatchedInputs)
{
    cv::Mat alpha;
    cv::Mat bg(50, 50, CV_8UC1, cv::Scalar(255));
    EXPECT_FALSE(correctAiAlpha(cv::Mat(40, 40, CV_8UC1), bg, ProcessingConfig{}, alpha));
    EXPECT_FALSE(correctAiAlpha(cv::Mat(50, 50, CV_8UC3), bg, ProcessingConfig{}, alpha));
    EXPECT_FALSE(correctAiAlpha(cv::Mat(), bg, ProcessingConfig{}, alpha));
}
