#include "image_resolver.h"
#include "dashboard.h"

#include <iostream>
#include <utility>

namespace roithumb {

QString unavailableReasonText(ImageUnavailable reason) {
    switch (reason) {
    case ImageUnavailable::None: return QString();
    case ImageUnavailable::NoImageStack: return QStringLiteral("no image stack configured");
    case ImageUnavailable::InsufficientFrames: return QStringLiteral("not enough frames in memory");
    case ImageUnavailable::GenerationFailed: return QStringLiteral("generation failed");
    }
    return QString();
}

ImageResolver::ImageResolver(ImageCache& cache, ThumbnailGenerator generator, int minFrameCount)
    : m_cache(cache)
    , m_generator(std::move(generator))
    , m_minFrameCount(minFrameCount)
{
}

bool ImageResolver::hasImageData(const cv::Mat& image) {
    if (image.empty()) return false;
    // All-zero images are placeholders written before an image was computed
    return cv::countNonZero(image.reshape(1)) > 0;
}

void ImageResolver::warnInsufficientFrames() {
    if (!m_showInsufficientFramesWarning) return;
    m_showInsufficientFramesWarning = false;

    const QString message =
        QStringLiteral("Can not update roi image because there are not enough image frames in memory");
    std::cerr << message.toStdString() << std::endl;
    if (m_dashboard) {
        m_dashboard->displayMessage(message);
    }
}

ImageResolution ImageResolver::resolve(Roi& roi) {
    if (auto cached = m_cache.get(roi.id)) {
        return {std::move(*cached), ImageUnavailable::None};
    }

    if (hasImageData(roi.storedImage)) {
        m_cache.put(roi.id, roi.storedImage);
        return {roi.storedImage.clone(), ImageUnavailable::None};
    }

    if (!m_imageStack) {
        return {cv::Mat(), ImageUnavailable::NoImageStack};
    }

    const FrameStack frames = m_imageStack->getFrameSet(FrameSetMode::Cache);
    if (static_cast<int>(frames.size()) < m_minFrameCount) {
        warnInsufficientFrames();
        return {cv::Mat(), ImageUnavailable::InsufficientFrames};
    }

    if (!m_generator) {
        return {cv::Mat(), ImageUnavailable::GenerationFailed};
    }

    cv::Mat image;
    try {
        image = m_generator(frames, roi);
    } catch (const std::exception& e) {
        std::cerr << "Roi image generation failed for " << roi.id.toStdString() << ": " << e.what() << std::endl;
        return {cv::Mat(), ImageUnavailable::GenerationFailed};
    }

    if (image.empty()) {
        return {cv::Mat(), ImageUnavailable::GenerationFailed};
    }

    roi.storedImage = image;
    m_cache.put(roi.id, image);
    return {image.clone(), ImageUnavailable::None};
}

} // namespace roithumb
