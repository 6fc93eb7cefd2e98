#include "preprocess_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace PreprocessUtils {

    namespace {
        cv::Mat To8Bit(const cv::Mat& image) {
            if (image.depth() == CV_8U) return image;
            cv::Mat converted;
            if (image.depth() == CV_16U) {
                image.convertTo(converted, CV_8U, 1.0 / 256.0);
            } else if (image.depth() == CV_32F || image.depth() == CV_64F) {
                image.convertTo(converted, CV_8U, 255.0);
            } else {
                image.convertTo(converted, CV_8U);
            }
            return converted;
        }

        cv::Mat ApplyLut(const cv::Mat& gray, const std::vector<double>& mapping) {
            cv::Mat lut(1, 256, CV_8U);
            for (int i = 0; i < 256; ++i) {
                lut.at<uchar>(i) = cv::saturate_cast<uchar>(mapping[i]);
            }
            cv::Mat out;
            cv::LUT(gray, lut, out);
            return out;
        }
    }

    const std::vector<Step>& StepsFor(PreprocessProfile profile) {
        static const std::vector<Step> kNone = {};
        static const std::vector<Step> kMinimal = {
            {StepKind::Contrast, 1.2}
        };
        static const std::vector<Step> kDefault = {
            {StepKind::AutoContrast, 1.0},
            {StepKind::Contrast, 1.4},
            {StepKind::UnsharpMask, 1.5, 160.0, 3.0}
        };
        static const std::vector<Step> kAdaptive = {
            {StepKind::Contrast, 1.8},
            {StepKind::AdaptiveBinarize, 15.0, -10.0},
            {StepKind::Median, 3.0}
        };
        static const std::vector<Step> kHighContrast = {
            {StepKind::Contrast, 2.5},
            {StepKind::Sharpen},
            {StepKind::Threshold, 170.0},
            {StepKind::Median, 3.0}
        };
        static const std::vector<Step> kLowContrast = {
            {StepKind::Contrast, 1.25},
            {StepKind::UnsharpMask, 1.2, 150.0, 3.0}
        };
        static const std::vector<Step> kDenoised = {
            {StepKind::Contrast, 2.0},
            {StepKind::Median, 5.0},
            {StepKind::Sharpen},
            {StepKind::Threshold, 180.0}
        };

        switch (profile) {
            case PreprocessProfile::None: return kNone;
            case PreprocessProfile::Minimal: return kMinimal;
            case PreprocessProfile::Default: return kDefault;
            case PreprocessProfile::Adaptive: return kAdaptive;
            case PreprocessProfile::HighContrast: return kHighContrast;
            case PreprocessProfile::LowContrast: return kLowContrast;
            case PreprocessProfile::Denoised: return kDenoised;
        }
        return kDefault;
    }

    std::string StepName(const Step& step) {
        std::ostringstream ss;
        switch (step.kind) {
            case StepKind::Contrast: ss << "contrast x" << step.a; break;
            case StepKind::AutoContrast: ss << "autocontrast " << step.a << "%"; break;
            case StepKind::UnsharpMask: ss << "unsharp r=" << step.a << " " << step.b << "% t=" << step.c; break;
            case StepKind::AdaptiveBinarize: ss << "adaptive w=" << step.a << " off=" << step.b; break;
            case StepKind::Sharpen: ss << "sharpen"; break;
            case StepKind::Threshold: ss << "threshold " << step.a; break;
            case StepKind::Median: ss << "median " << step.a << "x" << step.a; break;
        }
        return ss.str();
    }

    cv::Mat ApplyProfile(const cv::Mat& image, PreprocessProfile profile) {
        cv::Mat current = ToGrayscale(image);
        for (const auto& step : StepsFor(profile)) {
            current = ApplyStep(current, step);
        }
        return current;
    }

    cv::Mat ApplyStep(const cv::Mat& gray, const Step& step) {
        switch (step.kind) {
            case StepKind::Contrast:
                return AdjustContrast(gray, step.a);
            case StepKind::AutoContrast:
                return AutoContrast(gray, step.a);
            case StepKind::UnsharpMask:
                return UnsharpMask(gray, step.a, step.b, static_cast<int>(step.c));
            case StepKind::AdaptiveBinarize:
                return AdaptiveBinarize(gray, static_cast<int>(step.a), static_cast<int>(step.b));
            case StepKind::Sharpen:
                return Sharpen(gray);
            case StepKind::Threshold:
                return Threshold(gray, static_cast<int>(step.a));
            case StepKind::Median:
                return MedianDenoise(gray, static_cast<int>(step.a));
        }
        return gray.clone();
    }

    cv::Mat ToGrayscale(const cv::Mat& image) {
        if (image.empty()) {
            throw std::invalid_argument("Cannot preprocess an empty image");
        }
        cv::Mat src = To8Bit(image);
        cv::Mat gray;
        switch (src.channels()) {
            case 1: gray = src.clone(); break;
            case 3: cv::cvtColor(src, gray, cv::COLOR_BGR2GRAY); break;
            case 4: cv::cvtColor(src, gray, cv::COLOR_BGRA2GRAY); break;
            default:
                throw std::invalid_argument("Unsupported channel count: " + std::to_string(src.channels()));
        }
        return gray;
    }

    cv::Mat AdjustContrast(const cv::Mat& gray, double factor) {
        // Blend against the mean gray level, so factor 1.0 is the identity.
        const double mean = std::floor(cv::mean(gray)[0] + 0.5);
        std::vector<double> mapping(256);
        for (int i = 0; i < 256; ++i) {
            mapping[i] = mean + factor * (i - mean);
        }
        return ApplyLut(gray, mapping);
    }

    cv::Mat AutoContrast(const cv::Mat& gray, double cutoff_percent) {
        int hist[256] = {0};
        for (int y = 0; y < gray.rows; ++y) {
            const uchar* row = gray.ptr<uchar>(y);
            for (int x = 0; x < gray.cols; ++x) {
                ++hist[row[x]];
            }
        }

        const double total = static_cast<double>(gray.total());
        const double cut = total * cutoff_percent / 100.0;

        int lo = 0;
        double acc = 0.0;
        for (; lo < 255; ++lo) {
            acc += hist[lo];
            if (acc > cut) break;
        }
        int hi = 255;
        acc = 0.0;
        for (; hi > 0; --hi) {
            acc += hist[hi];
            if (acc > cut) break;
        }

        if (hi <= lo) return gray.clone();

        const double scale = 255.0 / (hi - lo);
        const double offset = -lo * scale;
        std::vector<double> mapping(256);
        for (int i = 0; i < 256; ++i) {
            mapping[i] = std::floor(i * scale + offset + 0.5);
        }
        return ApplyLut(gray, mapping);
    }

    cv::Mat UnsharpMask(const cv::Mat& gray, double radius, double percent, int threshold) {
        cv::Mat blurred;
        cv::GaussianBlur(gray, blurred, cv::Size(0, 0), radius, radius, cv::BORDER_REPLICATE);

        cv::Mat out = gray.clone();
        for (int y = 0; y < gray.rows; ++y) {
            const uchar* src = gray.ptr<uchar>(y);
            const uchar* blur = blurred.ptr<uchar>(y);
            uchar* dst = out.ptr<uchar>(y);
            for (int x = 0; x < gray.cols; ++x) {
                const int diff = static_cast<int>(src[x]) - static_cast<int>(blur[x]);
                if (std::abs(diff) >= threshold) {
                    dst[x] = cv::saturate_cast<uchar>(src[x] + diff * percent / 100.0);
                }
            }
        }
        return out;
    }

    cv::Mat AdaptiveBinarize(const cv::Mat& gray, int window, int offset) {
        if (window < 1) {
            throw std::invalid_argument("Adaptive window must be positive");
        }
        cv::Mat integral;
        cv::integral(gray, integral, CV_64F);

        const int half = window / 2;
        cv::Mat out(gray.size(), CV_8U);
        for (int y = 0; y < gray.rows; ++y) {
            const int y0 = std::max(0, y - half);
            const int y1 = std::min(gray.rows - 1, y + half);
            const uchar* src = gray.ptr<uchar>(y);
            uchar* dst = out.ptr<uchar>(y);
            for (int x = 0; x < gray.cols; ++x) {
                const int x0 = std::max(0, x - half);
                const int x1 = std::min(gray.cols - 1, x + half);
                const double sum = integral.at<double>(y1 + 1, x1 + 1) - integral.at<double>(y0, x1 + 1)
                                 - integral.at<double>(y1 + 1, x0) + integral.at<double>(y0, x0);
                const double area = static_cast<double>((y1 - y0 + 1) * (x1 - x0 + 1));
                const double local_mean = sum / area;
                dst[x] = (src[x] > local_mean + offset) ? 255 : 0;
            }
        }
        return out;
    }

    cv::Mat Sharpen(const cv::Mat& gray) {
        const cv::Mat kernel = (cv::Mat_<float>(3, 3) <<
            -2, -2, -2,
            -2, 32, -2,
            -2, -2, -2) / 16.0f;
        cv::Mat out;
        cv::filter2D(gray, out, CV_8U, kernel, cv::Point(-1, -1), 0, cv::BORDER_REPLICATE);
        return out;
    }

    cv::Mat Threshold(const cv::Mat& gray, int level) {
        cv::Mat out;
        cv::threshold(gray, out, level, 255, cv::THRESH_BINARY);
        return out;
    }

    cv::Mat MedianDenoise(const cv::Mat& gray, int kernel) {
        cv::Mat out;
        cv::medianBlur(gray, out, kernel);
        return out;
    }

    cv::Mat ToBgr(const cv::Mat& image) {
        if (image.empty()) {
            throw std::invalid_argument("Cannot convert an empty image");
        }
        cv::Mat src = To8Bit(image);
        cv::Mat bgr;
        switch (src.channels()) {
            case 1: cv::cvtColor(src, bgr, cv::COLOR_GRAY2BGR); break;
            case 3: bgr = src.clone(); break;
            case 4: cv::cvtColor(src, bgr, cv::COLOR_BGRA2BGR); break;
            default:
                throw std::invalid_argument("Unsupported channel count: " + std::to_string(src.channels()));
        }
        return bgr;
    }
}
