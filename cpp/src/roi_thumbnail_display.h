#pragma once

#include "image_cache.h"
#include "image_resolver.h"
#include "roi_display.h"
#include "thumbnail_renderer.h"

#include <QMetaObject>
#include <QString>

#include <vector>

namespace roithumb {

class Dashboard;
class ImageStack;
class RoiGroup;

enum class DisplayStateKind {
    Empty,
    ShowingImage,
    ShowingUnavailable
};

struct DisplayState {
    DisplayStateKind kind = DisplayStateKind::Empty;
    RoiRef roi;                                         // valid unless kind is Empty
    ImageUnavailable reason = ImageUnavailable::None;   // set for ShowingUnavailable

    bool showsRoi() const { return kind != DisplayStateKind::Empty; }
};

struct RoiThumbnailOptions {
    int upsampleFactor = 4;
    int minFrameCount = 100;
};

/**
 * Thumbnail display of the selected roi
 *
 * Listens to a RoiGroup. When a roi is selected its image is resolved and
 * drawn with the roi outline on top. If the displayed roi is modified or
 * reshaped the image is resolved again. Images that can not be resolved are
 * replaced by a message.
 *
 * The image stack and dashboard are optional and not owned.
 */
class RoiThumbnailDisplay : public RoiDisplay {
public:
    RoiThumbnailDisplay(RoiGroup& roiGroup,
                        ThumbnailRenderer& renderer,
                        ThumbnailGenerator generator,
                        const RoiThumbnailOptions& options = RoiThumbnailOptions());
    ~RoiThumbnailDisplay() override;

    // Non-copyable
    RoiThumbnailDisplay(const RoiThumbnailDisplay&) = delete;
    RoiThumbnailDisplay& operator=(const RoiThumbnailDisplay&) = delete;

    void setImageStack(const ImageStack* imageStack);
    void setDashboard(Dashboard* dashboard);

    const DisplayState& state() const { return m_state; }
    int upsampleFactor() const { return m_upsampleFactor; }

    void onRoiGroupChanged(const RoiGroupChangedEvent& event) override;
    void onRoiSelectionChanged(const RoiSelectionChangedEvent& event) override;
    void onRoiClassificationChanged(const RoiClassificationChangedEvent& event) override;

    // This display can not add or remove rois
    RoiMutationResult addRois(const std::vector<Roi>& rois) override;
    RoiMutationResult removeRois(const std::vector<int>& indices) override;

    static const QString kNoRoiSelectedText;

private:
    void updateImageDisplay(int roiIndex);
    void showResolvedImage(const Roi& roi, const cv::Mat& image);
    void showUnavailable(ImageUnavailable reason);
    void resetImageDisplay();

    // Keep the shown roi reference pointing at the same roi after a removal
    void followRemovedRois(const std::vector<int>& removedIndices);

    RoiGroup& m_roiGroup;
    ThumbnailRenderer& m_renderer;
    ImageCache m_cache;
    ImageResolver m_resolver;
    int m_upsampleFactor;

    DisplayState m_state;
    std::vector<QMetaObject::Connection> m_connections;
};

// Intensity range of an image, widened by one when the image is flat
DisplayRange imageDisplayRange(const cv::Mat& image);

} // namespace roithumb
