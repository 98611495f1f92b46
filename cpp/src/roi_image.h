#pragma once

#include "image_stack.h"
#include "roi_types.h"

#include <opencv2/core.hpp>

#include <vector>

namespace roithumb {

/**
 * Create a filled mask of the roi polygon
 *
 * @param roi Roi with boundary in (row, col) source pixels
 * @param size Size of the frames the roi lives in
 * @return CV_8UC1 mask, 255 inside the roi
 */
cv::Mat roiMask(const Roi& roi, const cv::Size& size);

/**
 * Mean intensity inside the mask for every frame
 */
std::vector<float> extractRoiTrace(const FrameStack& frames, const cv::Mat& mask);

/**
 * Relative change of a trace against its median baseline
 */
std::vector<float> computeDff(const std::vector<float>& trace);

/**
 * Compute an activity enhanced image of a roi
 *
 * Frames are averaged over the roi bounding box with weights given by the
 * positive part of the roi's dF/F, and the plain average is subtracted. The
 * result is scaled to 8 bit.
 *
 * @param frames Single channel frames, all of the same size
 * @param roi Roi to compute the image for
 * @return CV_8UC1 image of the roi bounding box, empty if it can not be computed
 */
cv::Mat computeRoiThumbnail(const FrameStack& frames, const Roi& roi);

} // namespace roithumb
