#pragma once

#include <QPointF>
#include <QString>

#include <opencv2/core.hpp>

#include <vector>

namespace roithumb {

// Intensity range mapped to the first and last colour of the colormap
struct DisplayRange {
    double low = 0.0;
    double high = 255.0;
};

/**
 * Drawing surface of a thumbnail display
 *
 * Images are handed over as snapshots; a renderer may keep them but they are
 * never written to by the caller afterwards.
 */
class ThumbnailRenderer {
public:
    virtual ~ThumbnailRenderer() = default;

    virtual void showImage(const cv::Mat& pixels, const DisplayRange& range) = 0;
    virtual void showOutline(const std::vector<QPointF>& points) = 0;
    virtual void showMessage(const QString& text) = 0;

    // Visible area is [0.5, width + 0.5] x [0.5, height + 0.5] in display coordinates
    virtual void setViewBounds(int width, int height, const DisplayRange& range) = 0;

    // Remove image and outline
    virtual void clear() = 0;
};

} // namespace roithumb
