#include "roi_thumbnail_widget.h"

#include <QFont>
#include <QPainter>
#include <QPolygonF>

#include <algorithm>
#include <cmath>

namespace roithumb {

RoiThumbnailWidget::RoiThumbnailWidget(QWidget* parent)
    : QWidget(parent)
{
    setMinimumSize(120, 120);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
    setAccessibleName("Roi Thumbnail Display");
}

QSize RoiThumbnailWidget::sizeHint() const {
    return QSize(240, 240);
}

void RoiThumbnailWidget::setLineColor(const QColor& color) {
    m_lineColor = color;
    update();
}

void RoiThumbnailWidget::setLineWidth(int width) {
    m_lineWidth = std::max(1, width);
    update();
}

void RoiThumbnailWidget::showImage(const cv::Mat& pixels, const DisplayRange& range) {
    m_pixels = pixels;
    m_range = range;
    if (!m_pixels.empty()) {
        m_viewWidth = m_pixels.cols;
        m_viewHeight = m_pixels.rows;
    }
    rebuildImage();
    update();
}

void RoiThumbnailWidget::showOutline(const std::vector<QPointF>& points) {
    m_outline = points;
    update();
}

void RoiThumbnailWidget::showMessage(const QString& text) {
    m_message = text;
    update();
}

void RoiThumbnailWidget::setViewBounds(int width, int height, const DisplayRange& range) {
    m_viewWidth = std::max(0, width);
    m_viewHeight = std::max(0, height);
    if (range.low != m_range.low || range.high != m_range.high) {
        m_range = range;
        rebuildImage();
    }
    update();
}

void RoiThumbnailWidget::clear() {
    m_pixels.release();
    m_image = QImage();
    m_outline.clear();
    update();
}

void RoiThumbnailWidget::rebuildImage() {
    if (m_pixels.empty()) {
        m_image = QImage();
        return;
    }

    const double span = std::max(1e-12, m_range.high - m_range.low);
    const double alpha = 255.0 / span;
    const double beta = -m_range.low * alpha;

    cv::Mat gray8;
    m_pixels.reshape(1).convertTo(gray8, CV_8U, alpha, beta);

    QImage img(gray8.data, gray8.cols, gray8.rows, static_cast<int>(gray8.step), QImage::Format_Grayscale8);
    m_image = img.copy();
}

QRectF RoiThumbnailWidget::imageTargetRect() const {
    if (m_viewWidth <= 0 || m_viewHeight <= 0 || width() <= 4 || height() <= 4) return {};

    const QRect bounds = rect().adjusted(4, 4, -4, -4);
    QSize fit(m_viewWidth, m_viewHeight);
    fit.scale(bounds.size(), Qt::KeepAspectRatio);
    const double x = bounds.x() + (bounds.width() - fit.width()) / 2.0;
    const double y = bounds.y() + (bounds.height() - fit.height()) / 2.0;
    return QRectF(x, y, fit.width(), fit.height());
}

void RoiThumbnailWidget::paintEvent(QPaintEvent* event) {
    Q_UNUSED(event);
    QPainter p(this);
    p.fillRect(rect(), palette().color(QPalette::Window));

    const QRectF target = imageTargetRect();
    if (!target.isEmpty() && !m_image.isNull()) {
        p.drawImage(target, m_image);
    }

    if (!target.isEmpty() && m_outline.size() >= 2) {
        const double sx = target.width() / static_cast<double>(m_viewWidth);
        const double sy = target.height() / static_cast<double>(m_viewHeight);

        // Display coordinate 0.5 is the left/top edge of the first pixel
        QPolygonF poly;
        poly.reserve(static_cast<int>(m_outline.size()));
        for (const auto& pt : m_outline) {
            if (std::isnan(pt.x()) || std::isnan(pt.y())) continue;
            poly << QPointF(
                target.left() + (pt.x() - 0.5) * sx,
                target.top() + (pt.y() - 0.5) * sy
            );
        }

        if (poly.size() >= 2) {
            p.setRenderHint(QPainter::Antialiasing, true);
            p.setPen(QPen(m_lineColor, m_lineWidth));
            p.setBrush(Qt::NoBrush);
            p.drawPolyline(poly);
        }
    }

    if (!m_message.isEmpty()) {
        QFont font = p.font();
        font.setPointSize(12);
        p.setFont(font);
        p.setPen(QColor(102, 102, 102));
        p.drawText(rect(), Qt::AlignCenter | Qt::TextWordWrap, m_message);
    }
}

} // namespace roithumb
