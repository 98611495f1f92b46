#include "roi_group.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace roithumb {

RoiGroup::RoiGroup(QObject* parent)
    : QObject(parent)
{
}

void RoiGroup::checkIndex(int index) const {
    if (index < 0 || index >= roiCount()) {
        throw std::out_of_range(
            "Roi index " + std::to_string(index) + " out of range (count " + std::to_string(roiCount()) + ")");
    }
}

Roi& RoiGroup::roiAt(int index) {
    checkIndex(index);
    return m_rois[static_cast<std::size_t>(index)];
}

const Roi& RoiGroup::roiAt(int index) const {
    checkIndex(index);
    return m_rois[static_cast<std::size_t>(index)];
}

RoiRef RoiGroup::refAt(int index) const {
    return RoiRef{roiAt(index).id, index};
}

void RoiGroup::setRois(std::vector<Roi> rois) {
    setSelection({});

    std::vector<int> removed(m_rois.size());
    for (std::size_t i = 0; i < removed.size(); ++i) removed[i] = static_cast<int>(i);
    m_rois.clear();
    if (!removed.empty()) {
        emit roiGroupChanged({RoiGroupEventType::Remove, removed});
    }

    m_rois = std::move(rois);
    std::vector<int> added(m_rois.size());
    for (std::size_t i = 0; i < added.size(); ++i) added[i] = static_cast<int>(i);
    if (!added.empty()) {
        emit roiGroupChanged({RoiGroupEventType::Add, added});
    }
}

void RoiGroup::addRoi(Roi roi) {
    m_rois.push_back(std::move(roi));
    emit roiGroupChanged({RoiGroupEventType::Add, {roiCount() - 1}});
}

void RoiGroup::removeRoi(int index) {
    checkIndex(index);

    std::vector<int> selection;
    selection.reserve(m_selection.size());
    for (int i : m_selection) {
        if (i == index) continue;
        selection.push_back(i > index ? i - 1 : i);
    }

    // Deselect before removing so no listener sees a selection pointing at the removed roi
    if (selection.size() != m_selection.size()) {
        std::vector<int> remaining = m_selection;
        remaining.erase(std::remove(remaining.begin(), remaining.end(), index), remaining.end());
        setSelection(remaining);
    }

    m_rois.erase(m_rois.begin() + index);
    m_selection = std::move(selection);
    emit roiGroupChanged({RoiGroupEventType::Remove, {index}});
}

void RoiGroup::modifyRoi(int index, Roi roi) {
    checkIndex(index);
    m_rois[static_cast<std::size_t>(index)] = std::move(roi);
    emit roiGroupChanged({RoiGroupEventType::Modify, {index}});
}

void RoiGroup::reshapeRoi(int index, std::vector<cv::Vec2d> boundary) {
    checkIndex(index);
    Roi& roi = m_rois[static_cast<std::size_t>(index)];
    roi.boundary = std::move(boundary);
    roi.storedImage.release();
    emit roiGroupChanged({RoiGroupEventType::Reshape, {index}});
}

void RoiGroup::setSelection(const std::vector<int>& indices) {
    for (int i : indices) {
        checkIndex(i);
    }
    if (indices == m_selection) return;

    RoiSelectionChangedEvent event;
    event.oldIndices = m_selection;
    event.newIndices = indices;
    m_selection = indices;
    emit roiSelectionChanged(event);
}

void RoiGroup::setClassification(int index, const QString& classification) {
    checkIndex(index);
    m_rois[static_cast<std::size_t>(index)].classification = classification;
    emit roiClassificationChanged({{index}});
}

}  // namespace roithumb
