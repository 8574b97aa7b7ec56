#include "TensorRtEngineCache.hpp"

#include <unistd.h>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>

#include "Logger.hpp"

#if TL_ENABLE_TENSORRT
#include <NvInfer.h>
#include <NvOnnxParser.h>
#endif

namespace tl
{
namespace
{
#if TL_ENABLE_TENSORRT
class BuildLogger : public nvinfer1::ILogger
{
public:
    void log(Severity severity, const char *msg) noexcept override
    {
        if (severity <= Severity::kWARNING)
        {
            tl::log::warn(std::string("[TensorRT] ") + msg);
        }
    }
};
#endif

void write_engine_atomically(const std::filesystem::path &engine_path, const std::vector<char> &serialized)
{
    const std::filesystem::path staging =
        engine_path.string() + ".tmp." + std::to_string(static_cast<long>(::getpid()));

    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        if (!output.is_open())
        {
            throw std::runtime_error("Failed to open TensorRT engine output file: " + staging.string());
        }

        output.write(serialized.data(), static_cast<std::streamsize>(serialized.size()));
        if (!output.good())
        {
            throw std::runtime_error("Failed to write TensorRT engine file: " + staging.string());
        }
    }

    std::filesystem::rename(staging, engine_path);
}
} // namespace

TensorRtEngineCache::TensorRtEngineCache(TensorRtBuildOptions options)
    : options_(std::move(options))
{
}

std::filesystem::path TensorRtEngineCache::engine_path_for(const std::filesystem::path &onnx_model_path)
{
    if (onnx_model_path.empty())
    {
        throw std::runtime_error("ONNX model path is empty");
    }

    return onnx_model_path.parent_path() / (onnx_model_path.stem().string() + ".engine");
}

std::filesystem::path TensorRtEngineCache::ensure_engine_file(const std::filesystem::path &onnx_model_path) const
{
    const auto onnx_absolute = std::filesystem::absolute(onnx_model_path);
    const auto engine_path = engine_path_for(onnx_absolute);

    if (std::filesystem::exists(engine_path))
    {
        tl::log::info("TensorRT engine imported from: " + engine_path.string());
        return engine_path;
    }

    const std::filesystem::path lock_path = engine_path.string() + ".lock";
    {
        std::ofstream touch(lock_path, std::ios::app);
        if (!touch.is_open())
        {
            throw std::runtime_error("Failed to create TensorRT engine lock file: " + lock_path.string());
        }
    }

    boost::interprocess::file_lock lock_file(lock_path.c_str());
    boost::interprocess::scoped_lock<boost::interprocess::file_lock> guard(lock_file);

    // Another worker may have finished the build while this one waited.
    if (std::filesystem::exists(engine_path))
    {
        tl::log::info("TensorRT engine imported from: " + engine_path.string());
        return engine_path;
    }

    write_engine_atomically(engine_path, build_serialized_engine(onnx_absolute));

    tl::log::info("TensorRT engine exported to: " + engine_path.string());
    return engine_path;
}

std::vector<char> TensorRtEngineCache::build_serialized_engine(const std::filesystem::path &onnx_model_path) const
{
#if TL_ENABLE_TENSORRT
    BuildLogger logger;

    auto builder = std::unique_ptr<nvinfer1::IBuilder>(nvinfer1::createInferBuilder(logger));
    if (!builder)
    {
        throw std::runtime_error("Failed to create TensorRT builder");
    }

    const auto explicit_batch_flag =
        1U << static_cast<unsigned>(nvinfer1::NetworkDefinitionCreationFlag::kEXPLICIT_BATCH);
    auto network = std::unique_ptr<nvinfer1::INetworkDefinition>(builder->createNetworkV2(explicit_batch_flag));
    if (!network)
    {
        throw std::runtime_error("Failed to create TensorRT network definition");
    }

    auto parser = std::unique_ptr<nvonnxparser::IParser>(nvonnxparser::createParser(*network, logger));
    if (!parser)
    {
        throw std::runtime_error("Failed to create TensorRT ONNX parser");
    }

    const bool parsed =
        parser->parseFromFile(onnx_model_path.c_str(), static_cast<int>(nvinfer1::ILogger::Severity::kWARNING));
    if (!parsed)
    {
        throw std::runtime_error("Failed to parse ONNX file with TensorRT: " + onnx_model_path.string());
    }

    auto config = std::unique_ptr<nvinfer1::IBuilderConfig>(builder->createBuilderConfig());
    if (!config)
    {
        throw std::runtime_error("Failed to create TensorRT builder config");
    }

    config->setMemoryPoolLimit(nvinfer1::MemoryPoolType::kWORKSPACE, options_.max_workspace_size_bytes);

    if (options_.enable_fp16 && builder->platformHasFastFp16())
    {
        config->setFlag(nvinfer1::BuilderFlag::kFP16);
    }

    // Classification requests always carry a single image; pin a dynamic batch
    // dimension to 1 so the engine has one fixed profile.
    nvinfer1::ITensor *input = network->getInput(0);
    nvinfer1::Dims dims = input->getDimensions();
    if (dims.nbDims == 4 && dims.d[0] < 0)
    {
        nvinfer1::IOptimizationProfile *profile = builder->createOptimizationProfile();
        dims.d[0] = 1;
        profile->setDimensions(input->getName(), nvinfer1::OptProfileSelector::kMIN, dims);
        profile->setDimensions(input->getName(), nvinfer1::OptProfileSelector::kOPT, dims);
        profile->setDimensions(input->getName(), nvinfer1::OptProfileSelector::kMAX, dims);
        config->addOptimizationProfile(profile);
    }

    auto serialized_engine = std::unique_ptr<nvinfer1::IHostMemory>(builder->buildSerializedNetwork(*network, *config));
    if (!serialized_engine)
    {
        throw std::runtime_error("Failed to build serialized TensorRT engine");
    }

    const auto *bytes = static_cast<const char *>(serialized_engine->data());
    const std::size_t size = serialized_engine->size();
    return std::vector<char>(bytes, bytes + size);
#else
    (void)onnx_model_path;
    throw std::runtime_error("TensorRT builder is unavailable because TL_ENABLE_TENSORRT=OFF");
#endif
}
} // namespace tl
