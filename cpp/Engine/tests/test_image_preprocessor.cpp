#include <gtest/gtest.h>

#include <opencv2/core.hpp>

#include <string>

#include "Architecture.hpp"
#include "ImagePreprocessor.hpp"
#include "RequestError.hpp"
#include "TestImages.hpp"

using namespace std::string_literals;

namespace
{
constexpr std::size_t kPlane = 224 * 224;

float normalised(float pixel, std::size_t channel)
{
    const auto &spec = tl::find_architecture("efficientnet_b0");
    return (pixel / 255.0F - spec.mean[channel]) / spec.std[channel];
}

tl::ErrorKind failure_kind(const tl::ImagePreprocessor &preprocessor, const std::string &bytes)
{
    try
    {
        preprocessor.preprocess(bytes);
    }
    catch (const tl::RequestFailure &failure)
    {
        return failure.kind();
    }
    ADD_FAILURE() << "preprocess did not throw";
    return tl::ErrorKind::Internal;
}
} // namespace

class ImagePreprocessorTest : public ::testing::Test
{
protected:
    tl::ImagePreprocessor preprocessor_{tl::find_architecture("efficientnet_b0")};
};

TEST_F(ImagePreprocessorTest, ProducesBatchOfOneInChwLayout)
{
    const auto tensor = preprocessor_.preprocess(solid_png(512, 512, cv::Scalar(10, 20, 30)));

    EXPECT_EQ(tensor.shape, (std::vector<int64_t>{1, 3, 224, 224}));
    EXPECT_EQ(tensor.data.size(), 3 * kPlane);
}

TEST_F(ImagePreprocessorTest, ShapeDoesNotDependOnInputAspectRatio)
{
    const auto wide = preprocessor_.preprocess(solid_png(640, 100, cv::Scalar(0, 0, 0)));
    const auto tiny = preprocessor_.preprocess(solid_png(3, 7, cv::Scalar(0, 0, 0)));

    EXPECT_EQ(wide.shape, tiny.shape);
    EXPECT_EQ(wide.data.size(), tiny.data.size());
}

TEST_F(ImagePreprocessorTest, ConvertsBgrToNormalisedRgbPlanes)
{
    // Pure blue in OpenCV's BGR order.
    const auto tensor = preprocessor_.preprocess(solid_png(64, 64, cv::Scalar(255, 0, 0)));

    EXPECT_NEAR(tensor.data[0], normalised(0.0F, 0), 1e-5);
    EXPECT_NEAR(tensor.data[kPlane], normalised(0.0F, 1), 1e-5);
    EXPECT_NEAR(tensor.data[2 * kPlane], normalised(255.0F, 2), 1e-5);
    EXPECT_NEAR(tensor.data[kPlane - 1], normalised(0.0F, 0), 1e-5);
    EXPECT_NEAR(tensor.data[3 * kPlane - 1], normalised(255.0F, 2), 1e-5);
}

TEST_F(ImagePreprocessorTest, GrayscaleInputIsExpandedToThreeChannels)
{
    const cv::Mat gray(50, 80, CV_8UC1, cv::Scalar(128));
    const auto tensor = preprocessor_.preprocess(encode_image(gray));

    ASSERT_EQ(tensor.data.size(), 3 * kPlane);
    EXPECT_NEAR(tensor.data[0], normalised(128.0F, 0), 1e-5);
    EXPECT_NEAR(tensor.data[kPlane], normalised(128.0F, 1), 1e-5);
    EXPECT_NEAR(tensor.data[2 * kPlane], normalised(128.0F, 2), 1e-5);
}

TEST_F(ImagePreprocessorTest, AlphaChannelIsDropped)
{
    const cv::Mat rgba(32, 32, CV_8UC4, cv::Scalar(0, 255, 0, 40));
    const auto tensor = preprocessor_.preprocess(encode_image(rgba));

    ASSERT_EQ(tensor.data.size(), 3 * kPlane);
    EXPECT_NEAR(tensor.data[kPlane], normalised(255.0F, 1), 1e-5);
}

TEST_F(ImagePreprocessorTest, SameBytesGiveIdenticalTensors)
{
    cv::Mat noise(100, 120, CV_8UC3);
    cv::randu(noise, cv::Scalar::all(0), cv::Scalar::all(255));
    const std::string bytes = encode_image(noise);

    const auto first = preprocessor_.preprocess(bytes);
    const auto second = preprocessor_.preprocess(bytes);

    EXPECT_EQ(first.data, second.data);
}

TEST_F(ImagePreprocessorTest, LargerArchitectureUsesItsOwnResolution)
{
    tl::ImagePreprocessor preprocessor(tl::find_architecture("efficientnet_b3"));
    const auto tensor = preprocessor.preprocess(solid_png(64, 64, cv::Scalar(1, 2, 3)));

    EXPECT_EQ(tensor.shape, (std::vector<int64_t>{1, 3, 300, 300}));
}

TEST_F(ImagePreprocessorTest, UndecodableBytesAreMalformed)
{
    EXPECT_EQ(failure_kind(preprocessor_, "not an image at all"), tl::ErrorKind::MalformedImage);
    EXPECT_EQ(failure_kind(preprocessor_, "\x89PNG\r\n\x1A\n garbage follows"s), tl::ErrorKind::MalformedImage);
    EXPECT_EQ(failure_kind(preprocessor_, ""), tl::ErrorKind::MalformedImage);
}
