#include "image_cache.h"

namespace roithumb {

std::optional<cv::Mat> ImageCache::get(const QString& roiId) const {
    const auto it = m_images.constFind(roiId);
    if (it == m_images.constEnd()) {
        return std::nullopt;
    }
    return it.value().clone();
}

void ImageCache::put(const QString& roiId, const cv::Mat& image) {
    if (image.empty()) {
        m_images.remove(roiId);
        return;
    }
    m_images.insert(roiId, image.clone());
}

void ImageCache::invalidate(const QString& roiId) {
    m_images.remove(roiId);
}

void ImageCache::clear() {
    m_images.clear();
}

} // namespace roithumb
