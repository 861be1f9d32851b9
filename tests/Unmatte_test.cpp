#include <gtest/gtest.h>

#include <opencv2/core.hpp>

#include "unmatte/unmatte.hpp"

using namespace pcanvas;

namespace {

// Left third transparent, one column of edge pixels, the rest opaque `product`.
// The edge column holds `edge` at alpha `edgeAlpha`.
cv::Mat edgeImage(uchar product, uchar edge, uchar edgeAlpha)
{
    cv::Mat bgra(20, 24, CV_8UC4, cv::Scalar(255, 255, 255, 0));
    bgra(cv::Rect(9, 0, 15, 20)).setTo(cv::Scalar(product, product, product, 255));
    bgra(cv::Rect(8, 0, 1, 20)).setTo(cv::Scalar(edge, edge, edge, edgeAlpha));
    return bgra;
}

} // namespace

TEST(UnmatteTest, RemovesWhiteHaloFromEdge)
{
    // 60 at alpha 0.2 matted on white: 0.2 * 60 + 0.8 * 255 = 216.
    cv::Mat img = edgeImage(60, 216, 51);
    EXPECT_EQ(unmatteEdges(img), 20);

    cv::Vec4b px = img.at<cv::Vec4b>(10, 8);
    EXPECT_NEAR(px[0], 60, 1);
    EXPECT_NEAR(px[1], 60, 1);
    EXPECT_NEAR(px[2], 60, 1);
    EXPECT_EQ(px[3], 51);
}

TEST(UnmatteTest, IsIdempotent)
{
    cv::Mat once = edgeImage(60, 216, 51);
    unmatteEdges(once);
    cv::Mat twice = once.clone();
    EXPECT_EQ(unmatteEdges(twice), 0);
    EXPECT_EQ(cv::norm(once, twice, cv::NORM_INF), 0.0);
}

TEST(UnmatteTest, LeavesDarkEdgePixelsAlone)
{
    cv::Mat img = edgeImage(60, 30, 51);
    cv::Mat before = img.clone();
    EXPECT_EQ(unmatteEdges(img), 0);
    EXPECT_EQ(cv::norm(before, img, cv::NORM_INF), 0.0);
}

TEST(UnmatteTest, KeepsGenuinelyLightEdges)
{
    // A white product's edge is matte-colored and must stay so.
    cv::Mat img = edgeImage(250, 252, 51);
    cv::Mat before = img.clone();
    EXPECT_EQ(unmatteEdges(img), 0);
    EXPECT_EQ(cv::norm(before, img, cv::NORM_INF), 0.0);
}

TEST(UnmatteTest, NoOpOnHardAlpha)
{
    cv::Mat img = edgeImage(60, 60, 255);
    img(cv::Rect(0, 0, 8, 20)).setTo(cv::Scalar(250, 250, 250, 0));
    cv::Mat before = img.clone();
    EXPECT_EQ(unmatteEdges(img), 0);
    EXPECT_EQ(cv::norm(before, img, cv::NORM_INF), 0.0);
}

TEST(UnmatteTest, HonorsMatteColor)
{
    // 60 at alpha 0.2 matted on black: 12.
    cv::Mat img = edgeImage(200, 12, 51);
    UnmatteSettings black;
    black.matte = cv::Scalar(0, 0, 0);
    EXPECT_EQ(unmatteEdges(img, black), 20);
    EXPECT_NEAR(img.at<cv::Vec4b>(3, 8)[0], 60, 1);
}

TEST(UnmatteTest, IgnoresImagesWithoutAlpha)
{
    cv::Mat bgr(10, 10, CV_8UC3, cv::Scalar(220, 220, 220));
    EXPECT_EQ(unmatteEdges(bgr), 0);
}
