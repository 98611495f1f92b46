#include "roi_image.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace roithumb {

namespace {

std::vector<cv::Point> polygonPoints(const Roi& roi) {
    std::vector<cv::Point> points;
    points.reserve(roi.boundary.size());
    for (const auto& p : roi.boundary) {
        points.emplace_back(
            static_cast<int>(std::lround(p[1])),
            static_cast<int>(std::lround(p[0]))
        );
    }
    return points;
}

float median(std::vector<float> values) {
    if (values.empty()) return 0.0f;
    const auto mid = values.begin() + static_cast<std::ptrdiff_t>(values.size() / 2);
    std::nth_element(values.begin(), mid, values.end());
    return *mid;
}

} // anonymous namespace

cv::Mat roiMask(const Roi& roi, const cv::Size& size) {
    cv::Mat mask = cv::Mat::zeros(size, CV_8UC1);
    std::vector<std::vector<cv::Point>> contours = {polygonPoints(roi)};
    if (contours[0].size() < 3) {
        return mask;
    }
    cv::drawContours(mask, contours, 0, cv::Scalar(255), cv::FILLED);
    return mask;
}

std::vector<float> extractRoiTrace(const FrameStack& frames, const cv::Mat& mask) {
    std::vector<float> trace;
    trace.reserve(frames.size());
    for (const auto& frame : frames) {
        cv::Scalar mean = cv::mean(frame, mask);
        trace.push_back(static_cast<float>(mean[0]));
    }
    return trace;
}

std::vector<float> computeDff(const std::vector<float>& trace) {
    std::vector<float> dff(trace.size(), 0.0f);
    const float f0 = median(trace);
    if (std::abs(f0) < 1e-6f) {
        return dff;
    }
    for (std::size_t i = 0; i < trace.size(); ++i) {
        dff[i] = (trace[i] - f0) / f0;
    }
    return dff;
}

cv::Mat computeRoiThumbnail(const FrameStack& frames, const Roi& roi) {
    if (frames.empty() || roi.boundary.size() < 3) {
        return cv::Mat();
    }

    const cv::Size frameSize = frames.front().size();
    const cv::Rect frameRect(0, 0, frameSize.width, frameSize.height);
    const cv::Rect box = cv::boundingRect(polygonPoints(roi)) & frameRect;
    if (box.empty()) {
        return cv::Mat();
    }

    const cv::Mat mask = roiMask(roi, frameSize);
    if (cv::countNonZero(mask) == 0) {
        return cv::Mat();
    }

    const std::vector<float> dff = computeDff(extractRoiTrace(frames, mask));

    cv::Mat weighted = cv::Mat::zeros(box.size(), CV_32FC1);
    cv::Mat average = cv::Mat::zeros(box.size(), CV_32FC1);
    double weightSum = 0.0;

    cv::Mat crop;
    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (frames[i].size() != frameSize) {
            return cv::Mat();
        }
        frames[i](box).convertTo(crop, CV_32F);
        average += crop;

        const float w = std::max(0.0f, dff[i]);
        if (w > 0.0f) {
            cv::scaleAdd(crop, w, weighted, weighted);
            weightSum += w;
        }
    }

    if (weightSum <= 0.0) {
        return cv::Mat();
    }

    weighted /= weightSum;
    average /= static_cast<double>(frames.size());

    cv::Mat enhanced = weighted - average;
    cv::Mat result;
    cv::normalize(enhanced, result, 0, 255, cv::NORM_MINMAX, CV_8U);
    return result;
}

} // namespace roithumb
