#pragma once

#include <QString>

#include <opencv2/core.hpp>

#include <vector>

namespace roithumb {

struct Roi {
    QString id;
    std::vector<cv::Vec2d> boundary;  // closed polygon, (row, col) in source pixels
    cv::Mat storedImage;              // enhanced image, empty until computed
    QString classification;

    // Bounding-box corner as (x = min col, y = min row)
    cv::Point2d upperLeftCorner() const;
};

// Identity of a roi plus its position in the collection at the time of the event
struct RoiRef {
    QString id;
    int index = -1;

    bool operator==(const RoiRef& other) const { return id == other.id && index == other.index; }
    bool operator!=(const RoiRef& other) const { return !(*this == other); }
};

enum class RoiGroupEventType {
    Add,
    Modify,
    Reshape,
    Remove
};

struct RoiGroupChangedEvent {
    RoiGroupEventType eventType = RoiGroupEventType::Modify;
    std::vector<int> roiIndices;
};

struct RoiSelectionChangedEvent {
    std::vector<int> newIndices;
    std::vector<int> oldIndices;
};

struct RoiClassificationChangedEvent {
    std::vector<int> roiIndices;
};

inline const char* eventTypeName(RoiGroupEventType type) {
    switch (type) {
    case RoiGroupEventType::Add: return "add";
    case RoiGroupEventType::Modify: return "modify";
    case RoiGroupEventType::Reshape: return "reshape";
    case RoiGroupEventType::Remove: return "remove";
    }
    return "unknown";
}

}  // namespace roithumb
