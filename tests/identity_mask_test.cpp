#include <gtest/gtest.h>

#include "algorithms/identity_protection/identity_mask.h"

#include <opencv2/opencv.hpp>

namespace {

cv::Mat randomMask(const cv::Size &size, int seed)
{
    cv::Mat mask(size, CV_8UC1);
    cv::RNG rng(seed);
    rng.fill(mask, cv::RNG::UNIFORM, 0, 2);
    return mask * 255;
}

bool identical(const cv::Mat &a, const cv::Mat &b)
{
    return a.size() == b.size() && a.type() == b.type() && cv::countNonZero(a != b) == 0;
}

} // namespace

TEST(IdentityMaskTest, NoFaceReturnsMaskUnchanged)
{
    for (int seed = 1; seed <= 3; ++seed) {
        const cv::Mat mask = randomMask(cv::Size(97, 61), seed);
        const IdentityMask::Result result = IdentityMask::apply(mask, std::nullopt, 30);

        EXPECT_TRUE(identical(result.mask, mask));
        EXPECT_FALSE(result.isProtected);
        EXPECT_EQ(result.candidateIndex, -1);
        EXPECT_TRUE(result.protectedRect.empty());
    }
}

TEST(IdentityMaskTest, ZeroesPaddedFaceRectangleOnly)
{
    const cv::Mat mask(1024, 1024, CV_8UC1, cv::Scalar(255));
    const IdentityMask::Result result = IdentityMask::apply(mask, BoundingBox(100, 100, 300, 300), 30);

    ASSERT_TRUE(result.isProtected);
    EXPECT_EQ(result.protectedRect, cv::Rect(70, 70, 260, 260));
    EXPECT_EQ(cv::countNonZero(result.mask(result.protectedRect)), 0);

    // Everything outside the rectangle is untouched
    cv::Mat outside = result.mask.clone();
    outside(result.protectedRect).setTo(cv::Scalar(255));
    EXPECT_TRUE(identical(outside, mask));

    EXPECT_EQ(result.mask.at<uchar>(69, 69), 255);
    EXPECT_EQ(result.mask.at<uchar>(70, 70), 0);
    EXPECT_EQ(result.mask.at<uchar>(329, 329), 0);
    EXPECT_EQ(result.mask.at<uchar>(330, 330), 255);
}

TEST(IdentityMaskTest, ClipsAtImageBorder)
{
    const cv::Mat mask = randomMask(cv::Size(80, 80), 7);
    const IdentityMask::Result result = IdentityMask::apply(mask, BoundingBox(0, 0, 20, 20), 30);

    ASSERT_TRUE(result.isProtected);
    EXPECT_EQ(result.protectedRect, cv::Rect(0, 0, 50, 50));
    EXPECT_EQ(cv::countNonZero(result.mask(result.protectedRect)), 0);
    EXPECT_TRUE(identical(result.mask(cv::Rect(50, 0, 30, 80)), mask(cv::Rect(50, 0, 30, 80))));
}

TEST(IdentityMaskTest, InputMaskIsNotModified)
{
    const cv::Mat mask(40, 40, CV_8UC1, cv::Scalar(255));
    const cv::Mat copy = mask.clone();
    IdentityMask::apply(mask, BoundingBox(10, 10, 20, 20), 2);
    EXPECT_TRUE(identical(mask, copy));
}

TEST(IdentityMaskTest, FirstPresentCandidateWins)
{
    const cv::Mat mask(200, 200, CV_8UC1, cv::Scalar(255));
    const std::vector<OptionalBox> candidates = {std::nullopt, BoundingBox(50, 50, 60, 60),
                                                 BoundingBox(0, 0, 10, 10)};

    const IdentityMask::Result result = IdentityMask::apply(mask, candidates, 5);
    ASSERT_TRUE(result.isProtected);
    EXPECT_EQ(result.candidateIndex, 1);
    EXPECT_EQ(result.protectedRect, cv::Rect(45, 45, 20, 20));
    EXPECT_EQ(result.mask.at<uchar>(0, 0), 255);
}

TEST(IdentityMaskTest, NegativePaddingActsAsZero)
{
    const cv::Mat mask(50, 50, CV_8UC1, cv::Scalar(255));
    const IdentityMask::Result result = IdentityMask::apply(mask, BoundingBox(10, 10, 20, 20), -5);
    EXPECT_EQ(result.protectedRect, cv::Rect(10, 10, 10, 10));
}
