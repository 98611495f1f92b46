#include <gtest/gtest.h>

#include "image_cache.h"

using namespace roithumb;

TEST(ImageCache, MissingEntryIsAbsent)
{
    ImageCache cache;
    EXPECT_FALSE(cache.get("roi").has_value());
    EXPECT_FALSE(cache.contains("roi"));
}

TEST(ImageCache, PutThenGet)
{
    ImageCache cache;
    cache.put("roi", cv::Mat(4, 4, CV_8UC1, cv::Scalar(3)));

    const auto image = cache.get("roi");
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->size(), cv::Size(4, 4));
    EXPECT_EQ(image->at<uchar>(1, 1), 3);
    EXPECT_EQ(cache.size(), 1);
}

TEST(ImageCache, PutOverwritesEntry)
{
    ImageCache cache;
    cache.put("roi", cv::Mat(4, 4, CV_8UC1, cv::Scalar(3)));
    cache.put("roi", cv::Mat(2, 2, CV_8UC1, cv::Scalar(9)));

    EXPECT_EQ(cache.size(), 1);
    EXPECT_EQ(cache.get("roi")->at<uchar>(0, 0), 9);
}

TEST(ImageCache, InvalidateRemovesOnlyThatEntry)
{
    ImageCache cache;
    cache.put("a", cv::Mat(2, 2, CV_8UC1, cv::Scalar(1)));
    cache.put("b", cv::Mat(2, 2, CV_8UC1, cv::Scalar(2)));

    cache.invalidate("a");

    EXPECT_FALSE(cache.contains("a"));
    EXPECT_TRUE(cache.contains("b"));
}

TEST(ImageCache, CallersCanNotModifyCachedImage)
{
    ImageCache cache;
    cv::Mat source(2, 2, CV_8UC1, cv::Scalar(1));
    cache.put("roi", source);
    source.setTo(cv::Scalar(50));

    cv::Mat copy = *cache.get("roi");
    copy.setTo(cv::Scalar(100));

    EXPECT_EQ(cache.get("roi")->at<uchar>(0, 0), 1);
}

TEST(ImageCache, EmptyImageIsNotStored)
{
    ImageCache cache;
    cache.put("roi", cv::Mat(2, 2, CV_8UC1, cv::Scalar(1)));
    cache.put("roi", cv::Mat());
    EXPECT_FALSE(cache.contains("roi"));
}

TEST(ImageCache, ClearRemovesEverything)
{
    ImageCache cache;
    cache.put("a", cv::Mat(2, 2, CV_8UC1, cv::Scalar(1)));
    cache.put("b", cv::Mat(2, 2, CV_8UC1, cv::Scalar(2)));
    cache.clear();
    EXPECT_EQ(cache.size(), 0);
}
