#include "roi_types.h"

#include <algorithm>
#include <limits>

namespace roithumb {

cv::Point2d Roi::upperLeftCorner() const {
    if (boundary.empty()) return cv::Point2d(0.0, 0.0);

    double minRow = std::numeric_limits<double>::infinity();
    double minCol = std::numeric_limits<double>::infinity();
    for (const auto& p : boundary) {
        minRow = std::min(minRow, p[0]);
        minCol = std::min(minCol, p[1]);
    }
    return cv::Point2d(minCol, minRow);
}

}  // namespace roithumb
