#include "roi_thumbnail_display.h"
#include "coordinate_mapper.h"
#include "roi_group.h"

#include <opencv2/imgproc.hpp>

#include <iostream>
#include <limits>
#include <utility>

namespace roithumb {

const QString RoiThumbnailDisplay::kNoRoiSelectedText = QStringLiteral("No roi selected");

DisplayRange imageDisplayRange(const cv::Mat& image) {
    DisplayRange range{0.0, 1.0};
    if (image.empty()) return range;

    cv::minMaxLoc(image.reshape(1), &range.low, &range.high);
    if (range.high <= range.low) {
        range.high = range.low + 1.0;
    }
    return range;
}

RoiThumbnailDisplay::RoiThumbnailDisplay(RoiGroup& roiGroup,
                                         ThumbnailRenderer& renderer,
                                         ThumbnailGenerator generator,
                                         const RoiThumbnailOptions& options)
    : m_roiGroup(roiGroup)
    , m_renderer(renderer)
    , m_resolver(m_cache, std::move(generator), options.minFrameCount)
    , m_upsampleFactor(options.upsampleFactor > 0 ? options.upsampleFactor : 1)
{
    m_connections = connectRoiDisplay(m_roiGroup, *this);

    const auto& selection = m_roiGroup.selectedIndices();
    if (selection.empty()) {
        resetImageDisplay();
        m_renderer.showMessage(kNoRoiSelectedText);
    } else {
        updateImageDisplay(selection.back());
    }
}

RoiThumbnailDisplay::~RoiThumbnailDisplay() {
    disconnectRoiDisplay(m_connections);
}

void RoiThumbnailDisplay::setImageStack(const ImageStack* imageStack) {
    m_resolver.setImageStack(imageStack);
}

void RoiThumbnailDisplay::setDashboard(Dashboard* dashboard) {
    m_resolver.setDashboard(dashboard);
}

void RoiThumbnailDisplay::onRoiGroupChanged(const RoiGroupChangedEvent& event) {
    switch (event.eventType) {
    case RoiGroupEventType::Modify:
    case RoiGroupEventType::Reshape: {
        if (event.roiIndices.empty()) {
            return;
        }

        // Only the last roi of a batch is considered
        const int roiIndex = event.roiIndices.back();
        if (roiIndex < 0 || roiIndex >= m_roiGroup.roiCount()) {
            std::cerr << "Ignoring " << eventTypeName(event.eventType)
                      << " event for unknown roi index " << roiIndex << std::endl;
            return;
        }

        const QString roiId = m_roiGroup.roiAt(roiIndex).id;
        m_cache.invalidate(roiId);

        if (m_state.showsRoi() && roiIndex == m_state.roi.index && roiId == m_state.roi.id) {
            updateImageDisplay(roiIndex);
        }
        break;
    }
    case RoiGroupEventType::Remove:
        // Removed rois can no longer be looked up by index
        m_cache.clear();
        followRemovedRois(event.roiIndices);
        break;
    case RoiGroupEventType::Add:
        break;
    }
}

void RoiThumbnailDisplay::followRemovedRois(const std::vector<int>& removedIndices) {
    if (!m_state.showsRoi()) return;

    int shift = 0;
    for (int removed : removedIndices) {
        if (removed == m_state.roi.index) {
            resetImageDisplay();
            m_renderer.showMessage(kNoRoiSelectedText);
            m_state = DisplayState();
            return;
        }
        if (removed < m_state.roi.index) {
            ++shift;
        }
    }
    m_state.roi.index -= shift;
}

void RoiThumbnailDisplay::onRoiSelectionChanged(const RoiSelectionChangedEvent& event) {
    if (event.newIndices.empty()) {
        resetImageDisplay();
        m_renderer.showMessage(kNoRoiSelectedText);
        m_state = DisplayState();
    } else {
        updateImageDisplay(event.newIndices.back());
    }
}

void RoiThumbnailDisplay::onRoiClassificationChanged(const RoiClassificationChangedEvent& event) {
    Q_UNUSED(event);
}

RoiMutationResult RoiThumbnailDisplay::addRois(const std::vector<Roi>& rois) {
    std::cerr << "Roi thumbnail display can not add rois (" << rois.size() << " requested)" << std::endl;
    return RoiMutationResult::Unsupported;
}

RoiMutationResult RoiThumbnailDisplay::removeRois(const std::vector<int>& indices) {
    std::cerr << "Roi thumbnail display can not remove rois (" << indices.size() << " requested)" << std::endl;
    return RoiMutationResult::Unsupported;
}

void RoiThumbnailDisplay::updateImageDisplay(int roiIndex) {
    Roi& roi = m_roiGroup.roiAt(roiIndex);
    const RoiRef ref{roi.id, roiIndex};

    const ImageResolution resolution = m_resolver.resolve(roi);
    if (resolution.ok()) {
        showResolvedImage(roi, resolution.image);
        m_state = DisplayState{DisplayStateKind::ShowingImage, ref, ImageUnavailable::None};
    } else {
        showUnavailable(resolution.reason);
        m_state = DisplayState{DisplayStateKind::ShowingUnavailable, ref, resolution.reason};
    }
}

void RoiThumbnailDisplay::showResolvedImage(const Roi& roi, const cv::Mat& image) {
    cv::Mat gray = image;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    }

    cv::Mat upsampled;
    if (m_upsampleFactor > 1) {
        cv::resize(gray, upsampled, cv::Size(), m_upsampleFactor, m_upsampleFactor, cv::INTER_CUBIC);
    } else {
        upsampled = gray.clone();
    }

    const DisplayRange range = imageDisplayRange(upsampled);

    m_renderer.showImage(upsampled, range);
    m_renderer.showOutline(coordinate_mapper::mapBoundary(roi, m_upsampleFactor));
    m_renderer.setViewBounds(upsampled.cols, upsampled.rows, range);
    m_renderer.showMessage(QString());
}

void RoiThumbnailDisplay::showUnavailable(ImageUnavailable reason) {
    m_renderer.clear();
    m_renderer.showMessage(QStringLiteral("Image not available: %1").arg(unavailableReasonText(reason)));
}

void RoiThumbnailDisplay::resetImageDisplay() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    m_renderer.showOutline({QPointF(nan, nan)});
    m_renderer.showImage(cv::Mat(), DisplayRange());
}

} // namespace roithumb
