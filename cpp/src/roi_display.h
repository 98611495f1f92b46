#pragma once

#include "roi_types.h"

#include <QMetaObject>

#include <vector>

namespace roithumb {

class RoiGroup;

enum class RoiMutationResult {
    Applied,
    Unsupported
};

/**
 * Capabilities of a view on a RoiGroup
 *
 * Each display variant reacts to the group's notifications. Variants that
 * can not create or delete rois return RoiMutationResult::Unsupported.
 */
class RoiDisplay {
public:
    virtual ~RoiDisplay() = default;

    virtual void onRoiGroupChanged(const RoiGroupChangedEvent& event) = 0;
    virtual void onRoiSelectionChanged(const RoiSelectionChangedEvent& event) = 0;
    virtual void onRoiClassificationChanged(const RoiClassificationChangedEvent& event) = 0;

    virtual RoiMutationResult addRois(const std::vector<Roi>& rois) = 0;
    virtual RoiMutationResult removeRois(const std::vector<int>& indices) = 0;
};

/**
 * Forward the group's signals to a display
 *
 * The display must outlive the returned connections or disconnect them
 * before it is destroyed.
 */
std::vector<QMetaObject::Connection> connectRoiDisplay(RoiGroup& group, RoiDisplay& display);

void disconnectRoiDisplay(std::vector<QMetaObject::Connection>& connections);

} // namespace roithumb
