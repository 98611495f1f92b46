#pragma once

#include <array>
#include <filesystem>
#include <string>

namespace roithumb {

/**
 * Application configuration loaded from roithumb.yaml
 */
struct Config {
    // Thumbnail display
    int upsampleFactor = 4;                        // Integer zoom applied to the roi image
    int minFrameCount = 100;                       // Frames needed in memory to generate an image
    int lineWidth = 2;                             // Outline pen width
    std::array<int, 3> lineColor = {0, 114, 189};  // Outline colour (RGB)

    // Raw data
    std::filesystem::path imageStackPath;          // Multi-page TIFF with the recording
    int cacheFrames = 2000;                        // Frames kept resident by the image stack

    // Rois
    std::filesystem::path roiPath;                 // JSON file with the roi collection

    /**
     * Load configuration from YAML file
     * Searches: $ROITHUMB_CONFIG -> executable dir -> current dir
     * @return Loaded config with defaults for missing values
     */
    static Config load();

    /**
     * Load configuration from specific file
     * @param path Path to YAML config file
     * @return Loaded config with defaults for missing values
     */
    static Config loadFrom(const std::filesystem::path& path);
};

} // namespace roithumb
