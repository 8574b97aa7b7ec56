#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>

#include "MockInferenceBackend.hpp"
#include "ModelLoader.hpp"

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace fs = std::filesystem;

class ModelLoaderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() / ("tumorlens_loader_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
        artifact_ = dir_ / "model.onnx";
        std::ofstream(artifact_, std::ios::binary) << "onnx-bytes";
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    // Each factory call builds a fresh mock, adjusted by `configure_`.
    tl::BackendFactory factory()
    {
        return [this](const std::string &path) {
            factory_paths_.push_back(path);
            auto backend = make_mock_backend(logits_);
            if (configure_)
            {
                configure_(*backend);
            }
            return backend;
        };
    }

    tl::ModelSource source() const
    {
        return tl::ModelSource{
            .artifact_path = artifact_.string(),
            .architecture = "efficientnet_b0",
            .labels = kTumorLabels,
        };
    }

    tl::LoadFailure failure_reason(const tl::ModelSource &source, tl::LoaderOptions options = {})
    {
        tl::ModelLoader loader(factory(), options);
        try
        {
            loader.load(source);
        }
        catch (const tl::ModelLoadError &ex)
        {
            return ex.reason();
        }
        ADD_FAILURE() << "load did not throw";
        return tl::LoadFailure::InvalidConfiguration;
    }

    fs::path dir_;
    fs::path artifact_;
    std::vector<float> logits_{0.1F, 0.2F, 0.3F, 0.4F};
    std::function<void(MockInferenceBackend &)> configure_;
    std::vector<std::string> factory_paths_;
};

TEST_F(ModelLoaderTest, LoadsCompatibleModel)
{
    tl::ModelLoader loader(factory());

    const auto handle = loader.load(source());

    ASSERT_NE(handle, nullptr);
    EXPECT_EQ(handle->labels(), kTumorLabels);
    EXPECT_EQ(handle->class_count(), 4U);
    EXPECT_EQ(handle->architecture().name, "efficientnet_b0");
    EXPECT_EQ(handle->backend_name(), "mock");
    ASSERT_EQ(factory_paths_.size(), 1U);
    EXPECT_TRUE(fs::path(factory_paths_.front()).is_absolute());
}

TEST_F(ModelLoaderTest, WarmupRunsOneZeroForwardPass)
{
    configure_ = [](MockInferenceBackend &backend) {
        EXPECT_CALL(backend, forward(_, std::vector<int64_t>{1, 3, 224, 224}, _))
            .WillOnce([](const std::vector<float> &input, const std::vector<int64_t> &, std::chrono::milliseconds) {
                EXPECT_EQ(input.size(), 3U * 224U * 224U);
                EXPECT_EQ(input.front(), 0.0F);
                return std::vector<float>{1.0F, 2.0F, 3.0F, 4.0F};
            });
    };

    tl::ModelLoader loader(factory());
    EXPECT_NO_THROW(loader.load(source()));
}

TEST_F(ModelLoaderTest, WarmupCanBeDisabledWhenOutputSizeIsKnown)
{
    configure_ = [](MockInferenceBackend &backend) { EXPECT_CALL(backend, forward(_, _, _)).Times(0); };

    tl::ModelLoader loader(factory(), tl::LoaderOptions{.warmup = false});
    EXPECT_NO_THROW(loader.load(source()));
}

TEST_F(ModelLoaderTest, DynamicDimensionsAreAccepted)
{
    configure_ = [](MockInferenceBackend &backend) {
        ON_CALL(backend, input_shape()).WillByDefault(Return(std::vector<int64_t>{-1, 3, -1, -1}));
    };

    tl::ModelLoader loader(factory());
    EXPECT_NO_THROW(loader.load(source()));
}

TEST_F(ModelLoaderTest, EmptyLabelListIsInvalidConfiguration)
{
    auto bad = source();
    bad.labels.clear();

    EXPECT_EQ(failure_reason(bad), tl::LoadFailure::InvalidConfiguration);
    EXPECT_TRUE(factory_paths_.empty());
}

TEST_F(ModelLoaderTest, DuplicateLabelsAreInvalidConfiguration)
{
    auto bad = source();
    bad.labels = {"glioma", "glioma", "no-tumor", "pituitary"};

    EXPECT_EQ(failure_reason(bad), tl::LoadFailure::InvalidConfiguration);
}

TEST_F(ModelLoaderTest, UnknownArchitectureIsCheckedBeforeArtifact)
{
    auto bad = source();
    bad.architecture = "vgg_tumor_9000";
    bad.artifact_path = (dir_ / "missing.onnx").string();

    EXPECT_EQ(failure_reason(bad), tl::LoadFailure::UnknownArchitecture);
}

TEST_F(ModelLoaderTest, MissingArtifactIsNotFound)
{
    auto bad = source();
    bad.artifact_path = (dir_ / "missing.onnx").string();

    EXPECT_EQ(failure_reason(bad), tl::LoadFailure::ArtifactNotFound);
    EXPECT_TRUE(factory_paths_.empty());
}

TEST_F(ModelLoaderTest, DirectoryIsNotAnArtifact)
{
    auto bad = source();
    bad.artifact_path = dir_.string();

    EXPECT_EQ(failure_reason(bad), tl::LoadFailure::ArtifactNotFound);
}

TEST_F(ModelLoaderTest, EmptyArtifactIsCorrupt)
{
    std::ofstream(artifact_, std::ios::binary | std::ios::trunc).close();

    EXPECT_EQ(failure_reason(source()), tl::LoadFailure::ArtifactCorrupt);
}

TEST_F(ModelLoaderTest, BackendConstructionFailureIsCorrupt)
{
    tl::ModelLoader loader([](const std::string &) -> std::unique_ptr<tl::IInferenceBackend> {
        throw std::runtime_error("protobuf parsing failed");
    });

    try
    {
        loader.load(source());
        FAIL() << "load did not throw";
    }
    catch (const tl::ModelLoadError &ex)
    {
        EXPECT_EQ(ex.reason(), tl::LoadFailure::ArtifactCorrupt);
        EXPECT_THAT(ex.what(), ::testing::HasSubstr("protobuf parsing failed"));
    }
}

TEST_F(ModelLoaderTest, RecordedArchitectureMustMatch)
{
    configure_ = [](MockInferenceBackend &backend) {
        ON_CALL(backend, metadata("architecture")).WillByDefault(Return(std::optional<std::string>("resnet50")));
    };

    EXPECT_EQ(failure_reason(source()), tl::LoadFailure::ArchitectureMismatch);
}

TEST_F(ModelLoaderTest, InputResolutionMustMatchArchitecture)
{
    configure_ = [](MockInferenceBackend &backend) {
        ON_CALL(backend, input_shape()).WillByDefault(Return(std::vector<int64_t>{1, 3, 240, 240}));
    };

    EXPECT_EQ(failure_reason(source()), tl::LoadFailure::ArchitectureMismatch);
}

TEST_F(ModelLoaderTest, InputRankMustMatchArchitecture)
{
    configure_ = [](MockInferenceBackend &backend) {
        ON_CALL(backend, input_shape()).WillByDefault(Return(std::vector<int64_t>{1, 150528}));
    };

    EXPECT_EQ(failure_reason(source()), tl::LoadFailure::ArchitectureMismatch);
}

TEST_F(ModelLoaderTest, DeclaredOutputSizeMustMatchLabels)
{
    logits_ = {0.1F, 0.2F, 0.3F};

    EXPECT_EQ(failure_reason(source()), tl::LoadFailure::OutputMismatch);
}

TEST_F(ModelLoaderTest, DynamicOutputIsVerifiedByWarmupEvenWhenDisabled)
{
    configure_ = [](MockInferenceBackend &backend) {
        ON_CALL(backend, output_size()).WillByDefault(Return(0U));
        ON_CALL(backend, forward(_, _, _)).WillByDefault(Return(std::vector<float>{0.0F, 1.0F, 2.0F}));
    };

    EXPECT_EQ(failure_reason(source(), tl::LoaderOptions{.warmup = false}), tl::LoadFailure::OutputMismatch);
}

TEST_F(ModelLoaderTest, WarmupFailureIsCorrupt)
{
    configure_ = [](MockInferenceBackend &backend) {
        ON_CALL(backend, forward(_, _, _)).WillByDefault(Throw(std::runtime_error("kernel not implemented")));
    };

    EXPECT_EQ(failure_reason(source()), tl::LoadFailure::ArtifactCorrupt);
}

TEST_F(ModelLoaderTest, NormalisationMismatchOnlyWarns)
{
    configure_ = [](MockInferenceBackend &backend) {
        ON_CALL(backend, metadata("normalize_mean"))
            .WillByDefault(Return(std::optional<std::string>("[0.5, 0.5, 0.5]")));
    };

    tl::ModelLoader loader(factory());
    EXPECT_NO_THROW(loader.load(source()));
}

TEST(ModelLoaderConstructionTest, RequiresFactory)
{
    EXPECT_THROW({ tl::ModelLoader loader{tl::BackendFactory{}}; }, std::invalid_argument);
}
