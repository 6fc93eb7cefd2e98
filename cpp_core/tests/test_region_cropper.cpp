#include "region_cropper.hpp"
#include <gtest/gtest.h>
#include <climits>

TEST(RegionCropperTest, ParseRequiresFourValues) {
    EXPECT_THROW(ParseRegionArray({1, 2, 3}), InvalidInputError);
    EXPECT_THROW(ParseRegionArray({1, 2, 3, 4, 5}), InvalidInputError);
    EXPECT_THROW(ParseRegionArray({}), InvalidInputError);

    std::array<int, 4> parsed = ParseRegionArray({1, 2, 3, 4});
    EXPECT_EQ(parsed[0], 1);
    EXPECT_EQ(parsed[3], 4);
}

TEST(RegionCropperTest, RegionOutsideImageIsEmpty) {
    EXPECT_FALSE(ClampRegion({10, 10, 5, 5}, cv::Size(4, 4)).has_value());
    EXPECT_FALSE(ClampRegion({-20, 0, 10, 4}, cv::Size(4, 4)).has_value());
}

TEST(RegionCropperTest, ZeroOrNegativeExtentIsEmpty) {
    EXPECT_FALSE(ClampRegion({1, 1, 0, 2}, cv::Size(4, 4)).has_value());
    EXPECT_FALSE(ClampRegion({1, 1, 2, -3}, cv::Size(4, 4)).has_value());
}

TEST(RegionCropperTest, ClampsToImageBounds) {
    auto clamped = ClampRegion({-5, 50, 30, 100}, cv::Size(20, 80));
    ASSERT_TRUE(clamped.has_value());
    EXPECT_EQ(*clamped, cv::Rect(0, 50, 20, 30));
}

TEST(RegionCropperTest, HugeExtentDoesNotOverflow) {
    auto clamped = ClampRegion({5, 5, INT_MAX, INT_MAX}, cv::Size(10, 10));
    ASSERT_TRUE(clamped.has_value());
    EXPECT_EQ(*clamped, cv::Rect(5, 5, 5, 5));
}

TEST(RegionCropperTest, CropCopiesPixels) {
    cv::Mat image(4, 4, CV_8UC1, cv::Scalar(0));
    image.at<uchar>(2, 3) = 200;
    cv::Mat crop = CropToRegion(image, cv::Rect(2, 1, 2, 2));
    ASSERT_EQ(crop.size(), cv::Size(2, 2));
    EXPECT_EQ(crop.at<uchar>(1, 1), 200);

    crop.at<uchar>(0, 0) = 7;
    EXPECT_EQ(image.at<uchar>(1, 2), 0);
}

TEST(RegionCropperTest, ClipTrimsBoxesToImage) {
    std::vector<TextRegion> regions = {
        TextRegion("a", BBox{-3, 2, 10, 5}, 0.7),
        TextRegion("b", BBox{15, 15, 10, 10}, 0.7),
        TextRegion("c", BBox{1, 1, 2, 2}, 0.7),
    };
    std::vector<TextRegion> clipped = ClipToImage(regions, cv::Size(20, 20));
    ASSERT_EQ(clipped.size(), 3u);
    EXPECT_EQ(clipped[0].Box(), (BBox{0, 2, 7, 5}));
    EXPECT_EQ(clipped[1].Box(), (BBox{15, 15, 5, 5}));
    EXPECT_EQ(clipped[2].Box(), (BBox{1, 1, 2, 2}));
}

TEST(RegionCropperTest, OffsetMovesBackToPageCoordinates) {
    std::vector<TextRegion> regions = {TextRegion("bubble", BBox{2, 3, 4, 5}, 0.9)};
    std::vector<TextRegion> moved = OffsetRegions(regions, cv::Point(100, 40));
    ASSERT_EQ(moved.size(), 1u);
    EXPECT_EQ(moved[0].Box(), (BBox{102, 43, 4, 5}));
    EXPECT_EQ(moved[0].Text(), "bubble");
    EXPECT_EQ(regions[0].Box(), (BBox{2, 3, 4, 5}));
}
