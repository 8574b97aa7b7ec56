#include "TensorRtInferenceBackend.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <onnxruntime_cxx_api.h>

#include "Logger.hpp"
#include "TensorRtEngineCache.hpp"

#if TL_ENABLE_TENSORRT
#include <cuda_runtime_api.h>
#include <NvInfer.h>
#endif

namespace tl
{
namespace
{
#if TL_ENABLE_TENSORRT
// The engine drops ONNX metadata, so the declared input shape and custom
// metadata entries are read from the source artifact.
void inspect_onnx_artifact(const std::filesystem::path &onnx_path,
                           std::vector<int64_t> &input_shape,
                           std::map<std::string, std::string> &metadata)
{
    Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "TumorLensTensorRtInspect");
    Ort::SessionOptions options;
    options.SetIntraOpNumThreads(1);
    options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_DISABLE_ALL);

    Ort::Session session(env, onnx_path.c_str(), options);

    const auto input_type_info = session.GetInputTypeInfo(0);
    if (input_type_info.GetONNXType() != ONNX_TYPE_TENSOR)
    {
        throw std::runtime_error("TensorRT backend expects tensor input, but ONNX input type is different");
    }

    input_shape = input_type_info.GetTensorTypeAndShapeInfo().GetShape();
    if (input_shape.empty())
    {
        throw std::runtime_error("ONNX input tensor has empty shape");
    }

    Ort::AllocatorWithDefaultOptions allocator;
    const Ort::ModelMetadata model_metadata = session.GetModelMetadata();
    for (const auto &key : model_metadata.GetCustomMetadataMapKeysAllocated(allocator))
    {
        const std::string name(key.get());
        auto value = model_metadata.LookupCustomMetadataMapAllocated(name.c_str(), allocator);
        if (value)
        {
            metadata[name] = value.get();
        }
    }
}

std::size_t volume_of_dims(const nvinfer1::Dims &dims)
{
    std::size_t volume = 1;
    for (int i = 0; i < dims.nbDims; ++i)
    {
        if (dims.d[i] <= 0)
        {
            throw std::runtime_error("TensorRT tensor shape has dynamic or invalid dimensions");
        }
        volume *= static_cast<std::size_t>(dims.d[i]);
    }
    return volume;
}

void throw_if_cuda_failed(cudaError_t code, const std::string &context)
{
    if (code != cudaSuccess)
    {
        throw std::runtime_error(context + ": " + cudaGetErrorString(code));
    }
}

class RuntimeLogger final : public nvinfer1::ILogger
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

RuntimeLogger &trt_logger()
{
    static RuntimeLogger logger;
    return logger;
}
#endif
} // namespace

#if TL_ENABLE_TENSORRT
class TensorRtInferenceBackend::Impl
{
public:
    explicit Impl(const std::filesystem::path &engine_path)
    {
        load_engine_bytes(engine_path);

        runtime_.reset(nvinfer1::createInferRuntime(trt_logger()));
        if (!runtime_)
        {
            throw std::runtime_error("Failed to create TensorRT runtime");
        }

        engine_.reset(runtime_->deserializeCudaEngine(engine_bytes_.data(), engine_bytes_.size()));
        if (!engine_)
        {
            throw std::runtime_error("Failed to deserialize TensorRT engine from: " + engine_path.string());
        }

        context_.reset(engine_->createExecutionContext());
        if (!context_)
        {
            throw std::runtime_error("Failed to create TensorRT execution context");
        }

        resolve_tensor_names();
        validate_tensor_types();
        configure_single_image_shape();
        allocate_device_buffers();
    }

    ~Impl()
    {
        release_buffers();
    }

    std::size_t output_elements() const
    {
        return output_elements_;
    }

    std::vector<float> forward(const std::vector<float> &input, std::chrono::milliseconds timeout)
    {
        if (input.size() != input_elements_)
        {
            throw std::runtime_error("Input tensor has " + std::to_string(input.size()) +
                                     " elements, TensorRT engine expects " + std::to_string(input_elements_));
        }

        throw_if_cuda_failed(
            cudaMemcpyAsync(device_input_, input.data(), input_bytes_, cudaMemcpyHostToDevice, stream_),
            "Failed to copy TensorRT input to device");

        if (!context_->setTensorAddress(input_name_.c_str(), device_input_) ||
            !context_->setTensorAddress(output_name_.c_str(), device_output_))
        {
            throw std::runtime_error("Failed to bind TensorRT tensor addresses");
        }

        if (!context_->enqueueV3(stream_))
        {
            throw std::runtime_error("TensorRT inference enqueue failed");
        }

        // The staging buffer is pinned so the copy is queued behind the kernel
        // instead of blocking here. It outlives a timed-out request, so a late
        // copy never lands in freed memory.
        throw_if_cuda_failed(
            cudaMemcpyAsync(host_output_, device_output_, output_bytes_, cudaMemcpyDeviceToHost, stream_),
            "Failed to copy TensorRT output to host");

        wait_for_stream(timeout);
        return std::vector<float>(host_output_, host_output_ + output_elements_);
    }

private:
    struct InferDeleter
    {
        template <typename T>
        void operator()(T *ptr) const
        {
            delete ptr;
        }
    };

    using RuntimePtr = std::unique_ptr<nvinfer1::IRuntime, InferDeleter>;
    using EnginePtr = std::unique_ptr<nvinfer1::ICudaEngine, InferDeleter>;
    using ContextPtr = std::unique_ptr<nvinfer1::IExecutionContext, InferDeleter>;

    // CUDA work cannot be cancelled; a stream still busy at the deadline fails
    // the request and the context is left to drain on its own.
    void wait_for_stream(std::chrono::milliseconds timeout)
    {
        if (timeout.count() <= 0)
        {
            throw_if_cuda_failed(cudaStreamSynchronize(stream_), "Failed to synchronize CUDA stream");
            return;
        }

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true)
        {
            const cudaError_t status = cudaStreamQuery(stream_);
            if (status == cudaSuccess)
            {
                return;
            }
            if (status != cudaErrorNotReady)
            {
                throw_if_cuda_failed(status, "CUDA stream failed");
            }
            if (std::chrono::steady_clock::now() >= deadline)
            {
                throw InferenceTimeout("TensorRT inference exceeded " + std::to_string(timeout.count()) + " ms");
            }
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    }

    void load_engine_bytes(const std::filesystem::path &engine_path)
    {
        std::ifstream input(engine_path, std::ios::binary | std::ios::ate);
        if (!input.is_open())
        {
            throw std::runtime_error("Failed to open TensorRT engine file: " + engine_path.string());
        }

        const auto end_pos = input.tellg();
        if (end_pos <= 0)
        {
            throw std::runtime_error("TensorRT engine file is empty: " + engine_path.string());
        }

        engine_bytes_.resize(static_cast<std::size_t>(end_pos));
        input.seekg(0, std::ios::beg);
        input.read(engine_bytes_.data(), static_cast<std::streamsize>(engine_bytes_.size()));

        if (!input.good())
        {
            throw std::runtime_error("Failed to read TensorRT engine file: " + engine_path.string());
        }
    }

    void resolve_tensor_names()
    {
        const int tensor_count = engine_->getNbIOTensors();
        for (int i = 0; i < tensor_count; ++i)
        {
            const char *name = engine_->getIOTensorName(i);
            if (name == nullptr)
            {
                continue;
            }

            const auto mode = engine_->getTensorIOMode(name);
            if (mode == nvinfer1::TensorIOMode::kINPUT && input_name_.empty())
            {
                input_name_ = name;
            }
            else if (mode == nvinfer1::TensorIOMode::kOUTPUT && output_name_.empty())
            {
                output_name_ = name;
            }
        }

        if (input_name_.empty() || output_name_.empty())
        {
            throw std::runtime_error("TensorRT engine must expose one input and one output tensor");
        }
    }

    void validate_tensor_types() const
    {
        if (engine_->getTensorDataType(input_name_.c_str()) != nvinfer1::DataType::kFLOAT ||
            engine_->getTensorDataType(output_name_.c_str()) != nvinfer1::DataType::kFLOAT)
        {
            throw std::runtime_error("TensorRT input and output tensors must be float32");
        }
    }

    void configure_single_image_shape()
    {
        nvinfer1::Dims input_dims = engine_->getTensorShape(input_name_.c_str());
        if (input_dims.nbDims != 4)
        {
            throw std::runtime_error("TensorRT input must be a 4D NCHW tensor");
        }
        input_dims.d[0] = 1;

        if (!context_->setInputShape(input_name_.c_str(), input_dims))
        {
            throw std::runtime_error("Failed to set TensorRT input shape");
        }

        input_elements_ = volume_of_dims(context_->getTensorShape(input_name_.c_str()));
        output_elements_ = volume_of_dims(context_->getTensorShape(output_name_.c_str()));
        input_bytes_ = input_elements_ * sizeof(float);
        output_bytes_ = output_elements_ * sizeof(float);
    }

    // ~Impl does not run when the constructor throws, so a partial allocation
    // is released here.
    void allocate_device_buffers()
    {
        try
        {
            throw_if_cuda_failed(cudaMalloc(&device_input_, input_bytes_), "Failed to allocate TensorRT input buffer");
            throw_if_cuda_failed(cudaMalloc(&device_output_, output_bytes_),
                                 "Failed to allocate TensorRT output buffer");
            throw_if_cuda_failed(cudaMallocHost(reinterpret_cast<void **>(&host_output_), output_bytes_),
                                 "Failed to allocate pinned TensorRT output buffer");
            throw_if_cuda_failed(cudaStreamCreate(&stream_), "Failed to create CUDA stream");
        }
        catch (...)
        {
            release_buffers();
            throw;
        }
    }

    void release_buffers()
    {
        if (stream_ != nullptr)
        {
            cudaStreamSynchronize(stream_);
            cudaStreamDestroy(stream_);
            stream_ = nullptr;
        }
        if (host_output_ != nullptr)
        {
            cudaFreeHost(host_output_);
            host_output_ = nullptr;
        }
        if (device_input_ != nullptr)
        {
            cudaFree(device_input_);
            device_input_ = nullptr;
        }
        if (device_output_ != nullptr)
        {
            cudaFree(device_output_);
            device_output_ = nullptr;
        }
    }

    std::vector<char> engine_bytes_;

    RuntimePtr runtime_{nullptr};
    EnginePtr engine_{nullptr};
    ContextPtr context_{nullptr};

    std::string input_name_;
    std::string output_name_;

    std::size_t input_elements_{0};
    std::size_t output_elements_{0};
    std::size_t input_bytes_{0};
    std::size_t output_bytes_{0};

    void *device_input_{nullptr};
    void *device_output_{nullptr};
    float *host_output_{nullptr};
    cudaStream_t stream_{nullptr};
};
#else
class TensorRtInferenceBackend::Impl
{
};
#endif

TensorRtInferenceBackend::TensorRtInferenceBackend(const std::string &model_path)
    : model_path_(std::filesystem::absolute(model_path))
{
#if TL_ENABLE_TENSORRT
    if (!std::filesystem::exists(model_path_))
    {
        throw std::runtime_error("Model file not found: " + model_path_.string());
    }

    inspect_onnx_artifact(model_path_, input_shape_, metadata_);

    TensorRtEngineCache cache(TensorRtBuildOptions{});
    engine_path_ = cache.ensure_engine_file(model_path_);
    impl_ = std::make_unique<Impl>(engine_path_);

    tl::log::info("TensorRT engine file: " + engine_path_.string());
#else
    throw std::runtime_error("TensorRT backend is unavailable because binary was built without TensorRT support");
#endif
}

TensorRtInferenceBackend::~TensorRtInferenceBackend() = default;

TensorRtInferenceBackend::TensorRtInferenceBackend(TensorRtInferenceBackend &&) noexcept = default;

TensorRtInferenceBackend &TensorRtInferenceBackend::operator=(TensorRtInferenceBackend &&) noexcept = default;

std::string TensorRtInferenceBackend::backend_name() const
{
    return "tensorrt";
}

std::vector<int64_t> TensorRtInferenceBackend::input_shape() const
{
    return input_shape_;
}

std::size_t TensorRtInferenceBackend::output_size() const
{
#if TL_ENABLE_TENSORRT
    return impl_ ? impl_->output_elements() : 0;
#else
    return 0;
#endif
}

std::optional<std::string> TensorRtInferenceBackend::metadata(const std::string &key) const
{
    const auto it = metadata_.find(key);
    if (it == metadata_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<float> TensorRtInferenceBackend::forward(const std::vector<float> &input,
                                                     const std::vector<int64_t> &shape,
                                                     std::chrono::milliseconds timeout)
{
    (void)shape;
#if TL_ENABLE_TENSORRT
    if (!impl_)
    {
        throw std::runtime_error("TensorRT backend internal state is not initialized");
    }
    return impl_->forward(input, timeout);
#else
    (void)input;
    (void)timeout;
    throw std::runtime_error("TensorRT backend is unavailable because binary was built without TensorRT support");
#endif
}
} // namespace tl
