#include "image_stack.h"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <iostream>

namespace fs = std::filesystem;

namespace roithumb {

namespace {

cv::Mat toSingleChannel(const cv::Mat& frame) {
    if (frame.channels() == 1) {
        return frame;
    }
    cv::Mat gray;
    cv::cvtColor(frame, gray, frame.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    return gray;
}

} // anonymous namespace

TiffImageStack::TiffImageStack(int cacheFrames)
    : m_cacheFrames(cacheFrames)
{
}

bool TiffImageStack::open(const fs::path& path) {
    close();

    if (!fs::exists(path)) {
        m_lastError = "Image stack not found: " + path.string();
        return false;
    }

    std::vector<cv::Mat> pages;
    try {
        if (m_cacheFrames > 0) {
            cv::imreadmulti(path.string(), pages, 0, m_cacheFrames, cv::IMREAD_UNCHANGED);
        }
    } catch (const cv::Exception& e) {
        m_lastError = std::string("Failed to read image stack: ") + e.what();
        std::cerr << m_lastError << std::endl;
        return false;
    }

    if (pages.empty() && m_cacheFrames > 0) {
        m_lastError = "No frames could be read from: " + path.string();
        return false;
    }

    m_cache.reserve(pages.size());
    for (const auto& page : pages) {
        m_cache.push_back(toSingleChannel(page));
    }
    m_path = path;

    std::cout << "Opened image stack: " << path << std::endl;
    std::cout << "Frames in memory: " << m_cache.size() << std::endl;

    return true;
}

void TiffImageStack::close() {
    m_cache.clear();
    m_path.clear();
}

FrameStack TiffImageStack::getFrameSet(FrameSetMode mode) const {
    if (mode == FrameSetMode::Cache || m_path.empty()) {
        return m_cache;
    }

    std::vector<cv::Mat> pages;
    try {
        if (!cv::imreadmulti(m_path.string(), pages, cv::IMREAD_UNCHANGED)) {
            m_lastError = "Failed to read frames from: " + m_path.string();
            return m_cache;
        }
    } catch (const cv::Exception& e) {
        m_lastError = std::string("Failed to read image stack: ") + e.what();
        std::cerr << m_lastError << std::endl;
        return m_cache;
    }

    FrameStack frames;
    frames.reserve(pages.size());
    for (const auto& page : pages) {
        frames.push_back(toSingleChannel(page));
    }
    return frames;
}

} // namespace roithumb
