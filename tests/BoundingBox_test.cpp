#include <gtest/gtest.h>

#include <opencv2/core.hpp>

#include "bbox/bbox.hpp"

using namespace pcanvas;

namespace {

cv::Mat backgroundWith(const cv::Size &size, const cv::Rect &product)
{
    cv::Mat mask(size, CV_8UC1, cv::Scalar(255));
    mask(product).setTo(0);
    return mask;
}

} // namespace

TEST(BoundingBoxTest, NoProductYieldsNone)
{
    cv::Mat mask(100, 100, CV_8UC1, cv::Scalar(255));
    EXPECT_FALSE(findProductBoundingBox(mask).has_value());
}

TEST(BoundingBoxTest, PadsAndContainsProduct)
{
    const cv::Rect product(20, 30, 40, 40);
    auto box = findProductBoundingBox(backgroundWith({ 100, 100 }, product), 10);
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(box->left, 10);
    EXPECT_EQ(box->top, 20);
    EXPECT_EQ(box->right, 69);
    EXPECT_EQ(box->bottom, 79);
    EXPECT_EQ(box->toRect() & product, product);
}

TEST(BoundingBoxTest, ExactWithoutPadding)
{
    const cv::Rect product(20, 30, 40, 10);
    auto box = findProductBoundingBox(backgroundWith({ 100, 100 }, product), 0);
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(box->toRect(), product);
    EXPECT_EQ(box->width(), 40);
    EXPECT_EQ(box->height(), 10);
}

TEST(BoundingBoxTest, ClampsAtBorder)
{
    auto box = findProductBoundingBox(backgroundWith({ 100, 80 }, cv::Rect(0, 70, 10, 10)), 10);
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(box->left, 0);
    EXPECT_EQ(box->right, 19);
    EXPECT_EQ(box->top, 60);
    EXPECT_EQ(box->bottom, 79);
}

TEST(BoundingBoxTest, RejectsDegenerateProduct)
{
    EXPECT_FALSE(findProductBoundingBox(backgroundWith({ 50, 50 }, cv::Rect(25, 25, 1, 1))).has_value());
    EXPECT_FALSE(findProductBoundingBox(backgroundWith({ 50, 50 }, cv::Rect(10, 25, 30, 1))).has_value());
    EXPECT_TRUE(findProductBoundingBox(backgroundWith({ 50, 50 }, cv::Rect(25, 25, 2, 2))).has_value());
}

TEST(BoundingBoxTest, SpansSeparateProducts)
{
    cv::Mat mask = backgroundWith({ 200, 100 }, cv::Rect(20, 20, 10, 10));
    mask(cv::Rect(150, 60, 20, 20)).setTo(0);
    auto box = findProductBoundingBox(mask, 0);
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(box->toRect(), cv::Rect(20, 20, 150, 60));
}

TEST(BoundingBoxTest, ProductIsBelowCutoff)
{
    cv::Mat mask(1, 3, CV_8UC1);
    mask.at<uchar>(0, 0) = 127;
    mask.at<uchar>(0, 1) = 128;
    mask.at<uchar>(0, 2) = 0;
    cv::Mat product = productMaskFrom(mask);
    EXPECT_EQ(product.at<uchar>(0, 0), 255);
    EXPECT_EQ(product.at<uchar>(0, 1), 0);
    EXPECT_EQ(product.at<uchar>(0, 2), 255);
}
