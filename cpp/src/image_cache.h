#pragma once

#include <QHash>
#include <QString>

#include <opencv2/core.hpp>

#include <optional>

namespace roithumb {

/**
 * Most recently resolved display image per roi id
 *
 * Entries live until invalidated. Lookups hand out deep copies so callers
 * can never write into a cached image.
 */
class ImageCache {
public:
    std::optional<cv::Mat> get(const QString& roiId) const;
    void put(const QString& roiId, const cv::Mat& image);
    void invalidate(const QString& roiId);
    void clear();

    bool contains(const QString& roiId) const { return m_images.contains(roiId); }
    int size() const { return static_cast<int>(m_images.size()); }

private:
    QHash<QString, cv::Mat> m_images;
};

} // namespace roithumb
