#include "test_fakes.h"

#include <gtest/gtest.h>

#include "roi_display.h"
#include "roi_group.h"

#include <stdexcept>

using namespace roithumb;
using namespace roithumb::test;

namespace {

// Display that only records what it was told
class CountingDisplay : public RoiDisplay {
public:
    void onRoiGroupChanged(const RoiGroupChangedEvent& event) override { groupEvents.push_back(event); }
    void onRoiSelectionChanged(const RoiSelectionChangedEvent& event) override { selectionEvents.push_back(event); }
    void onRoiClassificationChanged(const RoiClassificationChangedEvent& event) override
    {
        classificationEvents.push_back(event);
    }
    RoiMutationResult addRois(const std::vector<Roi>&) override { return RoiMutationResult::Applied; }
    RoiMutationResult removeRois(const std::vector<int>&) override { return RoiMutationResult::Applied; }

    std::vector<RoiGroupChangedEvent> groupEvents;
    std::vector<RoiSelectionChangedEvent> selectionEvents;
    std::vector<RoiClassificationChangedEvent> classificationEvents;
};

}  // namespace

TEST(RoiGroup, RoiAtChecksIndex)
{
    RoiGroup group;
    group.addRoi(makeSquareRoi("a", 0, 0, 2));

    EXPECT_EQ(group.roiAt(0).id, QString("a"));
    EXPECT_THROW(group.roiAt(1), std::out_of_range);
    EXPECT_THROW(group.roiAt(-1), std::out_of_range);
    EXPECT_EQ(group.refAt(0), (RoiRef{"a", 0}));
}

TEST(RoiGroup, ForwardsEventsToConnectedDisplay)
{
    RoiGroup group;
    CountingDisplay display;
    auto connections = connectRoiDisplay(group, display);

    group.setRois({makeSquareRoi("a", 0, 0, 2), makeSquareRoi("b", 5, 5, 2)});
    ASSERT_EQ(display.groupEvents.size(), 1u);
    EXPECT_EQ(display.groupEvents[0].eventType, RoiGroupEventType::Add);
    EXPECT_EQ(display.groupEvents[0].roiIndices, (std::vector<int>{0, 1}));

    group.setSelection({1});
    ASSERT_EQ(display.selectionEvents.size(), 1u);
    EXPECT_EQ(display.selectionEvents[0].newIndices, std::vector<int>{1});
    EXPECT_TRUE(display.selectionEvents[0].oldIndices.empty());

    group.modifyRoi(0, group.roiAt(0));
    EXPECT_EQ(display.groupEvents.back().eventType, RoiGroupEventType::Modify);

    group.setClassification(1, "neuron");
    ASSERT_EQ(display.classificationEvents.size(), 1u);
    EXPECT_EQ(group.roiAt(1).classification, QString("neuron"));

    disconnectRoiDisplay(connections);
    group.setSelection({});
    EXPECT_EQ(display.selectionEvents.size(), 1u);
}

TEST(RoiGroup, SameSelectionIsNotBroadcastAgain)
{
    RoiGroup group;
    CountingDisplay display;
    auto connections = connectRoiDisplay(group, display);
    group.setRois({makeSquareRoi("a", 0, 0, 2)});

    group.setSelection({0});
    group.setSelection({0});

    EXPECT_EQ(display.selectionEvents.size(), 1u);
    disconnectRoiDisplay(connections);
}

TEST(RoiGroup, InvalidSelectionThrowsAndKeepsSelection)
{
    RoiGroup group;
    group.setRois({makeSquareRoi("a", 0, 0, 2)});
    group.setSelection({0});

    EXPECT_THROW(group.setSelection({0, 3}), std::out_of_range);
    EXPECT_EQ(group.selectedIndices(), std::vector<int>{0});
}

TEST(RoiGroup, ReshapeDropsStoredImage)
{
    RoiGroup group;
    Roi roi = makeSquareRoi("a", 0, 0, 2);
    roi.storedImage = makeGradientImage(3, 3);
    group.addRoi(roi);

    group.reshapeRoi(0, makeSquareRoi("a", 1, 1, 4).boundary);

    EXPECT_TRUE(group.roiAt(0).storedImage.empty());
    EXPECT_DOUBLE_EQ(group.roiAt(0).upperLeftCorner().x, 1.0);
}

TEST(RoiGroup, RemovingSelectedRoiDeselectsFirst)
{
    RoiGroup group;
    CountingDisplay display;
    group.setRois({makeSquareRoi("a", 0, 0, 2), makeSquareRoi("b", 5, 5, 2), makeSquareRoi("c", 9, 9, 2)});
    group.setSelection({0, 1, 2});
    auto connections = connectRoiDisplay(group, display);

    group.removeRoi(1);

    ASSERT_EQ(display.selectionEvents.size(), 1u);
    EXPECT_EQ(display.selectionEvents[0].newIndices, (std::vector<int>{0, 2}));
    EXPECT_EQ(display.groupEvents.back().eventType, RoiGroupEventType::Remove);
    EXPECT_EQ(group.selectedIndices(), (std::vector<int>{0, 1}));
    EXPECT_EQ(group.roiAt(1).id, QString("c"));
    disconnectRoiDisplay(connections);
}

TEST(Roi, UpperLeftCornerIsMinColumnAndMinRow)
{
    Roi roi;
    EXPECT_EQ(roi.upperLeftCorner(), cv::Point2d(0.0, 0.0));

    roi.boundary = {{4.0, 9.0}, {2.5, 11.0}, {7.0, 3.0}};
    EXPECT_EQ(roi.upperLeftCorner(), cv::Point2d(3.0, 2.5));
}
