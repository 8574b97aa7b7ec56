#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

#include "Architecture.hpp"
#include "InferenceBackendFactory.hpp"
#include "ModelLoadError.hpp"

TEST(ArchitectureRegistryTest, EfficientNetB0UsesImageNetInput)
{
    const auto &spec = tl::find_architecture("efficientnet_b0");

    EXPECT_EQ(spec.input_height, 224);
    EXPECT_EQ(spec.input_width, 224);
    EXPECT_EQ(spec.input_shape(), (std::vector<int64_t>{1, 3, 224, 224}));
    EXPECT_EQ(spec.input_elements(), 3U * 224U * 224U);
    EXPECT_FLOAT_EQ(spec.mean[0], 0.485F);
    EXPECT_FLOAT_EQ(spec.std[2], 0.225F);
}

TEST(ArchitectureRegistryTest, LargerVariantsHaveLargerInputs)
{
    EXPECT_EQ(tl::find_architecture("efficientnet_b1").input_height, 240);
    EXPECT_EQ(tl::find_architecture("efficientnet_b3").input_width, 300);
}

TEST(ArchitectureRegistryTest, UnknownNameIsLoadError)
{
    try
    {
        tl::find_architecture("EfficientNet-B0");
        FAIL() << "lookup did not throw";
    }
    catch (const tl::ModelLoadError &ex)
    {
        EXPECT_EQ(ex.reason(), tl::LoadFailure::UnknownArchitecture);
        EXPECT_STREQ(tl::load_failure_name(ex.reason()), "UnknownArchitecture");
    }
}

TEST(ArchitectureRegistryTest, ListsEveryRegisteredName)
{
    const auto names = tl::known_architectures();

    EXPECT_NE(std::find(names.begin(), names.end(), "efficientnet_b0"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "resnet50"), names.end());
}

TEST(BackendKindTest, ParsesAliases)
{
    EXPECT_EQ(tl::parse_backend_kind("onnx"), tl::BackendKind::Onnx);
    EXPECT_EQ(tl::parse_backend_kind("onnxruntime"), tl::BackendKind::Onnx);
    EXPECT_EQ(tl::parse_backend_kind("tensorrt"), tl::BackendKind::TensorRt);
    EXPECT_EQ(tl::parse_backend_kind("trt"), tl::BackendKind::TensorRt);
    EXPECT_THROW(tl::parse_backend_kind("tflite"), std::invalid_argument);
}
