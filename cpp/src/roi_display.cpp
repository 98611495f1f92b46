#include "roi_display.h"
#include "roi_group.h"

#include <QObject>

namespace roithumb {

std::vector<QMetaObject::Connection> connectRoiDisplay(RoiGroup& group, RoiDisplay& display) {
    RoiDisplay* target = &display;
    return {
        QObject::connect(&group, &RoiGroup::roiGroupChanged, [target](const RoiGroupChangedEvent& event) {
            target->onRoiGroupChanged(event);
        }),
        QObject::connect(&group, &RoiGroup::roiSelectionChanged, [target](const RoiSelectionChangedEvent& event) {
            target->onRoiSelectionChanged(event);
        }),
        QObject::connect(&group, &RoiGroup::roiClassificationChanged,
            [target](const RoiClassificationChangedEvent& event) {
                target->onRoiClassificationChanged(event);
            }),
    };
}

void disconnectRoiDisplay(std::vector<QMetaObject::Connection>& connections) {
    for (auto& connection : connections) {
        QObject::disconnect(connection);
    }
    connections.clear();
}

} // namespace roithumb
