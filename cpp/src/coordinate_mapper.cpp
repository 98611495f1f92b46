#include "coordinate_mapper.h"

namespace roithumb::coordinate_mapper {

std::vector<QPointF> mapBoundary(const Roi& roi, int upsampleFactor) {
    return mapBoundary(roi.boundary, roi.upperLeftCorner(), upsampleFactor);
}

std::vector<QPointF> mapBoundary(
    const std::vector<cv::Vec2d>& boundary,
    const cv::Point2d& upperLeft,
    int upsampleFactor
) {
    const double f = static_cast<double>(upsampleFactor);

    std::vector<QPointF> points;
    points.reserve(boundary.size());
    for (const auto& p : boundary) {
        points.emplace_back(
            (p[1] - upperLeft.x + 1.0) * f,
            (p[0] - upperLeft.y + 1.0) * f
        );
    }
    return points;
}

std::vector<cv::Vec2d> unmapBoundary(
    const std::vector<QPointF>& points,
    const cv::Point2d& upperLeft,
    int upsampleFactor
) {
    const double f = upsampleFactor != 0 ? static_cast<double>(upsampleFactor) : 1.0;

    std::vector<cv::Vec2d> boundary;
    boundary.reserve(points.size());
    for (const auto& p : points) {
        boundary.emplace_back(
            p.y() / f + upperLeft.y - 1.0,
            p.x() / f + upperLeft.x - 1.0
        );
    }
    return boundary;
}

}  // namespace roithumb::coordinate_mapper
