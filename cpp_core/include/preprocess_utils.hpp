#pragma once
#include "ocr_types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// Stateless single-channel image transforms applied ahead of Tesseract.
// Every function returns a new CV_8UC1 image and leaves its input untouched.
namespace PreprocessUtils {

    enum class StepKind {
        Contrast,       // a = factor
        AutoContrast,   // a = percent clipped from each end of the histogram
        UnsharpMask,    // a = radius, b = percent, c = threshold
        AdaptiveBinarize, // a = window size, b = offset added to the local mean
        Sharpen,
        Threshold,      // a = level, pixels above it become white
        Median          // a = kernel size
    };

    struct Step {
        StepKind kind;
        double a = 0.0;
        double b = 0.0;
        double c = 0.0;
    };

    // Steps run after the grayscale conversion every profile starts with.
    const std::vector<Step>& StepsFor(PreprocessProfile profile);
    std::string StepName(const Step& step);

    cv::Mat ApplyProfile(const cv::Mat& image, PreprocessProfile profile);
    cv::Mat ApplyStep(const cv::Mat& gray, const Step& step);

    cv::Mat ToGrayscale(const cv::Mat& image);
    cv::Mat AdjustContrast(const cv::Mat& gray, double factor);
    cv::Mat AutoContrast(const cv::Mat& gray, double cutoff_percent);
    cv::Mat UnsharpMask(const cv::Mat& gray, double radius, double percent, int threshold);
    cv::Mat AdaptiveBinarize(const cv::Mat& gray, int window, int offset);
    cv::Mat Sharpen(const cv::Mat& gray);
    cv::Mat Threshold(const cv::Mat& gray, int level);
    cv::Mat MedianDenoise(const cv::Mat& gray, int kernel);

    // 3-channel BGR for engines that cannot take alpha or single-channel input.
    cv::Mat ToBgr(const cv::Mat& image);
}
