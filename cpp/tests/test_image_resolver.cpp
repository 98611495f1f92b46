#include "test_fakes.h"

#include <gtest/gtest.h>

#include "image_resolver.h"

#include <stdexcept>

using namespace roithumb;
using namespace roithumb::test;

class ImageResolverTest : public ::testing::Test {
protected:
    ImageResolver makeResolver(int minFrameCount = 100)
    {
        return ImageResolver(cache, [this](const FrameStack& frames, const Roi&) {
            ++generatorCalls;
            lastFrameCount = static_cast<int>(frames.size());
            if (throwOnGenerate) {
                throw std::runtime_error("trace extraction failed");
            }
            return generated.clone();
        }, minFrameCount);
    }

    ImageCache cache;
    cv::Mat generated = makeGradientImage(6, 6);
    int generatorCalls = 0;
    int lastFrameCount = 0;
    bool throwOnGenerate = false;
};

TEST_F(ImageResolverTest, StoredImageIsReturnedWithoutFrames)
{
    ImageResolver resolver = makeResolver();
    FakeImageStack stack(150);
    resolver.setImageStack(&stack);

    Roi roi = makeSquareRoi("a", 0, 0, 4);
    roi.storedImage = makeGradientImage(5, 5);

    const ImageResolution result = resolver.resolve(roi);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.image.size(), cv::Size(5, 5));
    EXPECT_EQ(stack.getFrameSetCalls, 0);
    EXPECT_EQ(generatorCalls, 0);
    EXPECT_TRUE(cache.contains("a"));
}

TEST_F(ImageResolverTest, CacheWinsOverStoredImage)
{
    ImageResolver resolver = makeResolver();
    cache.put("a", cv::Mat(3, 3, CV_8UC1, cv::Scalar(42)));

    Roi roi = makeSquareRoi("a", 0, 0, 4);
    roi.storedImage = makeGradientImage(5, 5);

    const ImageResolution result = resolver.resolve(roi);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.image.size(), cv::Size(3, 3));
}

TEST_F(ImageResolverTest, AllZeroStoredImageCountsAsMissing)
{
    ImageResolver resolver = makeResolver();
    Roi roi = makeSquareRoi("a", 0, 0, 4);
    roi.storedImage = cv::Mat::zeros(5, 5, CV_8UC1);

    const ImageResolution result = resolver.resolve(roi);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.reason, ImageUnavailable::NoImageStack);
    EXPECT_FALSE(cache.contains("a"));
}

TEST_F(ImageResolverTest, NoImageStackIsUnavailable)
{
    ImageResolver resolver = makeResolver();
    Roi roi = makeSquareRoi("a", 0, 0, 4);

    const ImageResolution result = resolver.resolve(roi);

    EXPECT_EQ(result.reason, ImageUnavailable::NoImageStack);
    EXPECT_TRUE(result.image.empty());
    EXPECT_EQ(unavailableReasonText(result.reason), QString("no image stack configured"));
}

TEST_F(ImageResolverTest, TooFewFramesWarnsDashboardOnce)
{
    ImageResolver resolver = makeResolver();
    FakeImageStack stack(50);
    RecordingDashboard dashboard;
    resolver.setImageStack(&stack);
    resolver.setDashboard(&dashboard);

    Roi roi = makeSquareRoi("a", 0, 0, 4);

    EXPECT_EQ(resolver.resolve(roi).reason, ImageUnavailable::InsufficientFrames);
    ASSERT_EQ(dashboard.messages.size(), 1u);
    EXPECT_TRUE(dashboard.messages[0].contains("not enough image frames in memory"));

    EXPECT_EQ(resolver.resolve(roi).reason, ImageUnavailable::InsufficientFrames);
    EXPECT_EQ(dashboard.messages.size(), 1u);

    EXPECT_EQ(generatorCalls, 0);
    EXPECT_EQ(stack.lastMode, FrameSetMode::Cache);
}

TEST_F(ImageResolverTest, WarningLatchIsPerResolver)
{
    FakeImageStack stack(50);
    RecordingDashboard dashboard;
    Roi roi = makeSquareRoi("a", 0, 0, 4);

    ImageResolver first = makeResolver();
    first.setImageStack(&stack);
    first.setDashboard(&dashboard);
    first.resolve(roi);

    ImageResolver second = makeResolver();
    second.setImageStack(&stack);
    second.setDashboard(&dashboard);
    second.resolve(roi);

    EXPECT_EQ(dashboard.messages.size(), 2u);
}

TEST_F(ImageResolverTest, MinimumFrameCountIsInclusive)
{
    ImageResolver resolver = makeResolver(100);
    FakeImageStack stack(100);
    resolver.setImageStack(&stack);
    Roi roi = makeSquareRoi("a", 0, 0, 4);

    const ImageResolution result = resolver.resolve(roi);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(lastFrameCount, 100);
}

TEST_F(ImageResolverTest, GeneratedImageIsStoredAndCached)
{
    ImageResolver resolver = makeResolver();
    FakeImageStack stack(120);
    resolver.setImageStack(&stack);
    Roi roi = makeSquareRoi("a", 0, 0, 4);

    const ImageResolution result = resolver.resolve(roi);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(generatorCalls, 1);
    EXPECT_EQ(cv::norm(roi.storedImage, generated, cv::NORM_INF), 0.0);
    EXPECT_TRUE(cache.contains("a"));

    resolver.resolve(roi);
    EXPECT_EQ(generatorCalls, 1);
    EXPECT_EQ(stack.getFrameSetCalls, 1);
}

TEST_F(ImageResolverTest, EmptyGeneratorResultIsUnavailable)
{
    ImageResolver resolver = makeResolver();
    FakeImageStack stack(120);
    resolver.setImageStack(&stack);
    generated = cv::Mat();
    Roi roi = makeSquareRoi("a", 0, 0, 4);

    const ImageResolution result = resolver.resolve(roi);

    EXPECT_EQ(result.reason, ImageUnavailable::GenerationFailed);
    EXPECT_TRUE(roi.storedImage.empty());
    EXPECT_FALSE(cache.contains("a"));
}

TEST_F(ImageResolverTest, GeneratorExceptionIsUnavailable)
{
    ImageResolver resolver = makeResolver();
    FakeImageStack stack(120);
    resolver.setImageStack(&stack);
    throwOnGenerate = true;
    Roi roi = makeSquareRoi("a", 0, 0, 4);

    ImageResolution result;
    EXPECT_NO_THROW(result = resolver.resolve(roi));
    EXPECT_EQ(result.reason, ImageUnavailable::GenerationFailed);
}

TEST_F(ImageResolverTest, ReturnedImageDoesNotAliasCache)
{
    ImageResolver resolver = makeResolver();
    Roi roi = makeSquareRoi("a", 0, 0, 4);
    roi.storedImage = cv::Mat(3, 3, CV_8UC1, cv::Scalar(5));

    ImageResolution result = resolver.resolve(roi);
    result.image.setTo(cv::Scalar(200));

    EXPECT_EQ(cache.get("a")->at<uchar>(0, 0), 5);
    EXPECT_EQ(roi.storedImage.at<uchar>(0, 0), 5);
}
