#include "preprocess_utils.hpp"
#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>

using namespace PreprocessUtils;

namespace {

bool SameBytes(const cv::Mat& a, const cv::Mat& b) {
    if (a.size() != b.size() || a.type() != b.type()) return false;
    return cv::countNonZero(a != b) == 0;
}

cv::Mat NoisyPage() {
    cv::Mat image(48, 64, CV_8UC3);
    cv::RNG rng(1234);
    rng.fill(image, cv::RNG::UNIFORM, 0, 256);
    cv::putText(image, "AB", cv::Point(4, 36), cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0, 0, 0), 2);
    return image;
}

// Horizontal lighting ramp with two dark vertical strokes, one on each side.
cv::Mat UnevenlyLitStrokes() {
    cv::Mat gray(40, 120, CV_8UC1);
    for (int y = 0; y < gray.rows; ++y) {
        for (int x = 0; x < gray.cols; ++x) {
            const double background = 40.0 + 1.5 * x;
            const bool stroke = y >= 10 && y < 30 && ((x >= 20 && x < 23) || (x >= 100 && x < 103));
            gray.at<uchar>(y, x) = cv::saturate_cast<uchar>(stroke ? background - 60.0 : background);
        }
    }
    return gray;
}

}

TEST(PreprocessUtilsTest, EveryProfileIsDeterministic) {
    cv::Mat page = NoisyPage();
    for (PreprocessProfile profile : {PreprocessProfile::None, PreprocessProfile::Minimal,
                                      PreprocessProfile::Default, PreprocessProfile::Adaptive,
                                      PreprocessProfile::HighContrast, PreprocessProfile::LowContrast,
                                      PreprocessProfile::Denoised}) {
        cv::Mat first = ApplyProfile(page, profile);
        cv::Mat second = ApplyProfile(page, profile);
        EXPECT_EQ(first.type(), CV_8UC1) << ProfileName(profile);
        EXPECT_EQ(first.size(), page.size()) << ProfileName(profile);
        EXPECT_TRUE(SameBytes(first, second)) << ProfileName(profile);
    }
}

TEST(PreprocessUtilsTest, InputIsLeftUntouched) {
    cv::Mat page = NoisyPage();
    cv::Mat copy = page.clone();
    ApplyProfile(page, PreprocessProfile::Denoised);
    EXPECT_TRUE(SameBytes(page, copy));
}

TEST(PreprocessUtilsTest, ProfileTable) {
    EXPECT_TRUE(StepsFor(PreprocessProfile::None).empty());

    const auto& minimal = StepsFor(PreprocessProfile::Minimal);
    ASSERT_EQ(minimal.size(), 1u);
    EXPECT_EQ(minimal[0].kind, StepKind::Contrast);
    EXPECT_DOUBLE_EQ(minimal[0].a, 1.2);

    const auto& def = StepsFor(PreprocessProfile::Default);
    ASSERT_EQ(def.size(), 3u);
    EXPECT_EQ(def[0].kind, StepKind::AutoContrast);
    EXPECT_EQ(def[2].kind, StepKind::UnsharpMask);
    EXPECT_DOUBLE_EQ(def[2].b, 160.0);

    const auto& adaptive = StepsFor(PreprocessProfile::Adaptive);
    ASSERT_EQ(adaptive.size(), 3u);
    EXPECT_EQ(adaptive[1].kind, StepKind::AdaptiveBinarize);
    EXPECT_DOUBLE_EQ(adaptive[1].a, 15.0);
    EXPECT_DOUBLE_EQ(adaptive[1].b, -10.0);

    const auto& denoised = StepsFor(PreprocessProfile::Denoised);
    ASSERT_EQ(denoised.size(), 4u);
    EXPECT_EQ(denoised[1].kind, StepKind::Median);
    EXPECT_DOUBLE_EQ(denoised[1].a, 5.0);
    EXPECT_EQ(denoised[3].kind, StepKind::Threshold);
    EXPECT_DOUBLE_EQ(denoised[3].a, 180.0);
}

TEST(PreprocessUtilsTest, GrayscaleHandlesAlphaAndSingleChannel) {
    cv::Mat bgra(8, 8, CV_8UC4, cv::Scalar(10, 20, 30, 0));
    EXPECT_EQ(ToGrayscale(bgra).type(), CV_8UC1);

    cv::Mat gray(8, 8, CV_8UC1, cv::Scalar(77));
    cv::Mat out = ToGrayscale(gray);
    EXPECT_TRUE(SameBytes(out, gray));
    EXPECT_NE(out.data, gray.data);

    EXPECT_THROW(ToGrayscale(cv::Mat()), std::invalid_argument);
}

TEST(PreprocessUtilsTest, ToBgrStripsAlpha) {
    cv::Mat bgra(8, 8, CV_8UC4, cv::Scalar(10, 20, 30, 128));
    cv::Mat bgr = ToBgr(bgra);
    EXPECT_EQ(bgr.type(), CV_8UC3);
    EXPECT_EQ(bgr.at<cv::Vec3b>(0, 0), cv::Vec3b(10, 20, 30));

    cv::Mat gray(8, 8, CV_8UC1, cv::Scalar(5));
    EXPECT_EQ(ToBgr(gray).type(), CV_8UC3);
}

TEST(PreprocessUtilsTest, ContrastOfOneIsIdentity) {
    cv::Mat gray = ToGrayscale(NoisyPage());
    EXPECT_TRUE(SameBytes(AdjustContrast(gray, 1.0), gray));
}

TEST(PreprocessUtilsTest, ContrastSpreadsAroundMean) {
    cv::Mat gray(2, 2, CV_8UC1);
    gray.at<uchar>(0, 0) = 100;
    gray.at<uchar>(0, 1) = 100;
    gray.at<uchar>(1, 0) = 140;
    gray.at<uchar>(1, 1) = 140;
    cv::Mat out = AdjustContrast(gray, 2.0);
    EXPECT_EQ(out.at<uchar>(0, 0), 80);
    EXPECT_EQ(out.at<uchar>(1, 1), 160);
}

TEST(PreprocessUtilsTest, AutoContrastStretchesToFullRange) {
    cv::Mat gray(16, 16, CV_8UC1);
    for (int y = 0; y < gray.rows; ++y) {
        for (int x = 0; x < gray.cols; ++x) {
            gray.at<uchar>(y, x) = static_cast<uchar>(100 + (y * gray.cols + x) % 51);
        }
    }
    double lo = 0, hi = 0;
    cv::minMaxLoc(AutoContrast(gray, 1.0), &lo, &hi);
    EXPECT_EQ(lo, 0.0);
    EXPECT_EQ(hi, 255.0);
}

TEST(PreprocessUtilsTest, AutoContrastLeavesFlatImageAlone) {
    cv::Mat flat(8, 8, CV_8UC1, cv::Scalar(90));
    EXPECT_TRUE(SameBytes(AutoContrast(flat, 1.0), flat));
}

TEST(PreprocessUtilsTest, FlatImageSurvivesSharpening) {
    cv::Mat flat(8, 8, CV_8UC1, cv::Scalar(120));
    EXPECT_TRUE(SameBytes(UnsharpMask(flat, 1.5, 160.0, 3), flat));
    EXPECT_TRUE(SameBytes(Sharpen(flat), flat));
}

TEST(PreprocessUtilsTest, ThresholdKeepsOnlyPixelsAboveLevel) {
    cv::Mat gray(1, 3, CV_8UC1);
    gray.at<uchar>(0, 0) = 169;
    gray.at<uchar>(0, 1) = 170;
    gray.at<uchar>(0, 2) = 171;
    cv::Mat out = Threshold(gray, 170);
    EXPECT_EQ(out.at<uchar>(0, 0), 0);
    EXPECT_EQ(out.at<uchar>(0, 1), 0);
    EXPECT_EQ(out.at<uchar>(0, 2), 255);
}

TEST(PreprocessUtilsTest, MedianRemovesIsolatedSpeck) {
    cv::Mat gray(9, 9, CV_8UC1, cv::Scalar(255));
    gray.at<uchar>(4, 4) = 0;
    EXPECT_EQ(MedianDenoise(gray, 3).at<uchar>(4, 4), 255);
}

TEST(PreprocessUtilsTest, AdaptiveBinarizeHandlesUnevenLighting) {
    cv::Mat gray = UnevenlyLitStrokes();
    cv::Mat binary = AdaptiveBinarize(gray, 15, -10);

    // Strokes on both the dark and the bright side come out black.
    EXPECT_EQ(binary.at<uchar>(20, 21), 0);
    EXPECT_EQ(binary.at<uchar>(20, 101), 0);

    // Background everywhere along the ramp stays white.
    for (int x : {0, 5, 50, 70, 119}) {
        EXPECT_EQ(binary.at<uchar>(3, x), 255) << "x=" << x;
    }
    EXPECT_EQ(binary.at<uchar>(20, 60), 255);

    // A single global level cannot do both.
    cv::Mat global = Threshold(gray, 128);
    EXPECT_EQ(global.at<uchar>(3, 5), 0);
    EXPECT_EQ(global.at<uchar>(20, 101), 255);
}

TEST(PreprocessUtilsTest, AdaptiveRejectsBadWindow) {
    cv::Mat gray(4, 4, CV_8UC1, cv::Scalar(0));
    EXPECT_THROW(AdaptiveBinarize(gray, 0, -10), std::invalid_argument);
}
