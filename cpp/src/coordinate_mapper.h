#pragma once

#include "roi_types.h"

#include <QPointF>

#include <opencv2/core.hpp>

#include <vector>

namespace roithumb::coordinate_mapper {

/**
 * Map a roi boundary into the upsampled thumbnail space
 *
 * Stored (row, col) points become (x, y) display points:
 *   x = (col - ul.x + 1) * upsampleFactor
 *   y = (row - ul.y + 1) * upsampleFactor
 * where ul is the roi's upper left corner.
 */
std::vector<QPointF> mapBoundary(const Roi& roi, int upsampleFactor);

std::vector<QPointF> mapBoundary(
    const std::vector<cv::Vec2d>& boundary,
    const cv::Point2d& upperLeft,
    int upsampleFactor
);

// Inverse of mapBoundary, returns (row, col) points in source pixels
std::vector<cv::Vec2d> unmapBoundary(
    const std::vector<QPointF>& points,
    const cv::Point2d& upperLeft,
    int upsampleFactor
);

}  // namespace roithumb::coordinate_mapper
