#pragma once

#include "roi_types.h"

#include <QObject>
#include <QString>

#include <vector>

namespace roithumb {

/**
 * In-memory roi collection
 *
 * Owns the rois and broadcasts every change through Qt signals. Displays
 * react to these signals and never mutate the group themselves.
 */
class RoiGroup : public QObject {
    Q_OBJECT

public:
    explicit RoiGroup(QObject* parent = nullptr);

    int roiCount() const { return static_cast<int>(m_rois.size()); }

    /**
     * Access a roi by index
     * @throws std::out_of_range if index is not in [0, roiCount())
     */
    Roi& roiAt(int index);
    const Roi& roiAt(int index) const;

    RoiRef refAt(int index) const;

    // Replace all rois, clears the selection
    void setRois(std::vector<Roi> rois);

    void addRoi(Roi roi);
    void removeRoi(int index);

    // Replace roi content (image, classification...) and emit a modify event
    void modifyRoi(int index, Roi roi);

    // Replace the boundary; the stored image no longer matches and is dropped
    void reshapeRoi(int index, std::vector<cv::Vec2d> boundary);

    void setSelection(const std::vector<int>& indices);
    const std::vector<int>& selectedIndices() const { return m_selection; }

    void setClassification(int index, const QString& classification);

signals:
    void roiGroupChanged(const roithumb::RoiGroupChangedEvent& event);
    void roiSelectionChanged(const roithumb::RoiSelectionChangedEvent& event);
    void roiClassificationChanged(const roithumb::RoiClassificationChangedEvent& event);

private:
    void checkIndex(int index) const;

    std::vector<Roi> m_rois;
    std::vector<int> m_selection;
};

}  // namespace roithumb
