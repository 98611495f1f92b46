#pragma once

#include "image_cache.h"
#include "image_stack.h"
#include "roi_types.h"

#include <QString>

#include <opencv2/core.hpp>

#include <functional>

namespace roithumb {

class Dashboard;

// Computes a roi image from raw frames, returns an empty Mat on failure
using ThumbnailGenerator = std::function<cv::Mat(const FrameStack&, const Roi&)>;

enum class ImageUnavailable {
    None,
    NoImageStack,
    InsufficientFrames,
    GenerationFailed
};

// Short human readable reason, empty for None
QString unavailableReasonText(ImageUnavailable reason);

struct ImageResolution {
    cv::Mat image;
    ImageUnavailable reason = ImageUnavailable::None;

    bool ok() const { return reason == ImageUnavailable::None && !image.empty(); }
};

/**
 * Finds a displayable image for a roi
 *
 * Lookup order: cache, the roi's stored image, generation from the frames
 * resident in the image stack. Every failure is reported as an
 * ImageUnavailable reason, never thrown.
 */
class ImageResolver {
public:
    ImageResolver(ImageCache& cache, ThumbnailGenerator generator, int minFrameCount = 100);

    // Non-copyable
    ImageResolver(const ImageResolver&) = delete;
    ImageResolver& operator=(const ImageResolver&) = delete;

    /**
     * Resolve the display image of a roi
     * @param roi Roi to resolve. A generated image is written back to roi.storedImage.
     * @return Image or the reason it is unavailable
     */
    ImageResolution resolve(Roi& roi);

    // Non-owning, may be null
    void setImageStack(const ImageStack* stack) { m_imageStack = stack; }
    void setDashboard(Dashboard* dashboard) { m_dashboard = dashboard; }

    int minFrameCount() const { return m_minFrameCount; }

    static bool hasImageData(const cv::Mat& image);

private:
    void warnInsufficientFrames();

    ImageCache& m_cache;
    ThumbnailGenerator m_generator;
    int m_minFrameCount;

    const ImageStack* m_imageStack = nullptr;
    Dashboard* m_dashboard = nullptr;

    // Warning about missing frames is shown once per resolver
    bool m_showInsufficientFramesWarning = true;
};

} // namespace roithumb
