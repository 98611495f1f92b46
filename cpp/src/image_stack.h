#pragma once

#include <opencv2/core.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace roithumb {

// Frames of a recording, one single-channel image per time point
using FrameStack = std::vector<cv::Mat>;

enum class FrameSetMode {
    Cache,  // Only frames already resident in memory, never touches storage
    All     // Every frame, reading from storage if needed
};

/**
 * Source of raw imaging frames used to generate roi images
 */
class ImageStack {
public:
    virtual ~ImageStack() = default;

    virtual FrameStack getFrameSet(FrameSetMode mode) const = 0;
};

/**
 * Image stack backed by a multi-page TIFF file
 *
 * The first cacheFrames pages are kept in memory on open. Cache mode returns
 * those; All mode re-reads the whole file.
 */
class TiffImageStack : public ImageStack {
public:
    explicit TiffImageStack(int cacheFrames = 2000);

    /**
     * Open a multi-page TIFF and load the frame cache
     * @param path Path to .tif/.tiff file
     * @return true if at least one frame was read
     */
    bool open(const std::filesystem::path& path);

    void close();

    bool isOpen() const { return !m_path.empty(); }

    FrameStack getFrameSet(FrameSetMode mode) const override;

    int cachedFrameCount() const { return static_cast<int>(m_cache.size()); }

    const std::filesystem::path& getPath() const { return m_path; }

    const std::string& getLastError() const { return m_lastError; }

private:
    int m_cacheFrames;
    std::filesystem::path m_path;
    FrameStack m_cache;
    mutable std::string m_lastError;
};

} // namespace roithumb
