#pragma once

#include "thumbnail_renderer.h"

#include <QColor>
#include <QImage>
#include <QPointF>
#include <QRectF>
#include <QString>
#include <QWidget>

#include <vector>

namespace roithumb {

/**
 * Widget drawing a roi thumbnail with its outline
 *
 * The image is scaled to fit the widget while keeping its aspect ratio.
 * Outline points are given in image display coordinates where pixel i
 * (1-based) is centered at i.
 */
class RoiThumbnailWidget : public QWidget, public ThumbnailRenderer {
    Q_OBJECT

public:
    explicit RoiThumbnailWidget(QWidget* parent = nullptr);

    void setLineColor(const QColor& color);
    void setLineWidth(int width);

    void showImage(const cv::Mat& pixels, const DisplayRange& range) override;
    void showOutline(const std::vector<QPointF>& points) override;
    void showMessage(const QString& text) override;
    void setViewBounds(int width, int height, const DisplayRange& range) override;
    void clear() override;

    QSize sizeHint() const override;

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    QRectF imageTargetRect() const;
    void rebuildImage();

    cv::Mat m_pixels;
    DisplayRange m_range;
    QImage m_image;
    std::vector<QPointF> m_outline;
    QString m_message;
    int m_viewWidth = 0;
    int m_viewHeight = 0;

    QColor m_lineColor = QColor(0, 114, 189);
    int m_lineWidth = 2;
};

} // namespace roithumb
