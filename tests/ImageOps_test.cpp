#include <gtest/gtest.h>

#include <opencv2/imgproc.hpp>

#include "util/ImageOps.hpp"
#include "TestImages.hpp"

using namespace pcanvas;

TEST(ImageOpsTest, ParsesHexColorsAsBgr)
{
    cv::Scalar c;
    ASSERT_TRUE(util::parseHexColor("#F3F3F3", c));
    EXPECT_EQ(c, cv::Scalar(243, 243, 243));

    ASSERT_TRUE(util::parseHexColor("00ff80", c));
    EXPECT_EQ(c, cv::Scalar(128, 255, 0));
}

TEST(ImageOpsTest, RejectsMalformedHexColors)
{
    cv::Scalar c;
    EXPECT_FALSE(util::parseHexColor("", c));
    EXPECT_FALSE(util::parseHexColor("#FFF", c));
    EXPECT_FALSE(util::parseHexColor("#GG0000", c));
    EXPECT_FALSE(util::parseHexColor("#1234567", c));
}

TEST(ImageOpsTest, DynamicWhiteThresholdFollowsLightCorners)
{
    EXPECT_EQ(util::effectiveWhiteThreshold(240, 255.0), 240);
    EXPECT_EQ(util::effectiveWhiteThreshold(240, 243.0), 228);
    EXPECT_EQ(util::effectiveWhiteThreshold(240, 120.0), 150);
    EXPECT_EQ(util::effectiveWhiteThreshold(240, 40.0), 240);
}

TEST(ImageOpsTest, CornerReferenceIgnoresOneOddCorner)
{
    cv::Mat img = test::solid(50, 50, cv::Scalar(200, 200, 200));
    img(cv::Rect(40, 40, 10, 10)).setTo(cv::Scalar(0, 0, 0));
    EXPECT_EQ(util::cornerReferenceColor(img), cv::Vec3b(200, 200, 200));
}

TEST(ImageOpsTest, ChannelDistanceIsLargestChannelGap)
{
    EXPECT_EQ(util::channelDistance(cv::Vec3b(10, 20, 30), cv::Vec3b(12, 5, 31)), 15);
    EXPECT_EQ(util::channelDistance(cv::Vec3b(7, 7, 7), cv::Vec3b(7, 7, 7)), 0);
}

TEST(ImageOpsTest, FlattenBlendsByAlpha)
{
    cv::Mat bgra(4, 4, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    bgra(cv::Rect(0, 0, 2, 4)).setTo(cv::Scalar(0, 0, 0, 255));
    cv::Mat out = util::flattenOnto(bgra, cv::Scalar(255, 255, 255));
    ASSERT_EQ(out.type(), CV_8UC3);
    EXPECT_EQ(out.at<cv::Vec3b>(1, 0), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(out.at<cv::Vec3b>(1, 3), cv::Vec3b(255, 255, 255));
}

TEST(ImageOpsTest, NormalizesChannelsAndDepth)
{
    cv::Mat gray(8, 8, CV_8UC1, cv::Scalar(90));
    cv::Mat out = util::normalizeChannels(gray);
    EXPECT_EQ(out.type(), CV_8UC3);
    EXPECT_EQ(out.at<cv::Vec3b>(0, 0), cv::Vec3b(90, 90, 90));

    cv::Mat deep(8, 8, CV_16UC3, cv::Scalar(65535, 0, 65535));
    out = util::normalizeChannels(deep);
    EXPECT_EQ(out.type(), CV_8UC3);
    EXPECT_EQ(out.at<cv::Vec3b>(3, 3), cv::Vec3b(255, 0, 255));

    EXPECT_EQ(util::normalizeChannels(cv::Mat(8, 8, CV_8UC4)).type(), CV_8UC4);
    EXPECT_TRUE(util::normalizeChannels(cv::Mat(8, 8, CV_32FC3)).empty());
    EXPECT_TRUE(util::normalizeChannels(cv::Mat()).empty());
}
