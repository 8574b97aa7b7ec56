#include "OnnxInferenceBackend.hpp"

#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

namespace tl
{
namespace
{
// Sets the terminate flag on the run options if the run outlives the deadline.
class RunDeadline
{
public:
    RunDeadline(Ort::RunOptions &options, std::chrono::milliseconds timeout)
        : options_(options)
    {
        if (timeout.count() > 0)
        {
            watchdog_ = std::thread([this, timeout] { watch(timeout); });
        }
    }

    ~RunDeadline()
    {
        finish();
    }

    RunDeadline(const RunDeadline &) = delete;
    RunDeadline &operator=(const RunDeadline &) = delete;

    void finish()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();

        if (watchdog_.joinable())
        {
            watchdog_.join();
        }
    }

    bool expired() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return expired_;
    }

private:
    void watch(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return done_; }))
        {
            expired_ = true;
            options_.SetTerminate();
        }
    }

    Ort::RunOptions &options_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool done_{false};
    bool expired_{false};
    std::thread watchdog_;
};
} // namespace

OnnxInferenceBackend::OnnxInferenceBackend(const std::string &model_path, int intra_op_threads)
    : env_(ORT_LOGGING_LEVEL_WARNING, "TumorLens"),
      session_(nullptr),
      memory_info_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)),
      output_size_(0)
{
    const fs::path absolute_path = fs::absolute(model_path);
    if (!fs::exists(absolute_path))
    {
        throw std::runtime_error("Model file not found: " + absolute_path.string());
    }

    Ort::SessionOptions options;
    options.SetIntraOpNumThreads(intra_op_threads);
    options.SetInterOpNumThreads(1);
    options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

    session_ = Ort::Session(env_, absolute_path.c_str(), options);

    input_names_owned_ = session_.GetInputNames();
    output_names_owned_ = session_.GetOutputNames();

    if (input_names_owned_.size() != 1 || output_names_owned_.empty())
    {
        throw std::runtime_error("Model must expose exactly one input and at least one output");
    }

    for (const auto &name : input_names_owned_)
    {
        input_names_.push_back(name.c_str());
    }

    for (const auto &name : output_names_owned_)
    {
        output_names_.push_back(name.c_str());
    }

    input_shape_ = resolve_input_shape();
    output_size_ = resolve_output_size();
    read_metadata();
}

std::string OnnxInferenceBackend::backend_name() const
{
    return "onnx";
}

std::vector<int64_t> OnnxInferenceBackend::input_shape() const
{
    return input_shape_;
}

std::size_t OnnxInferenceBackend::output_size() const
{
    return output_size_;
}

std::optional<std::string> OnnxInferenceBackend::metadata(const std::string &key) const
{
    const auto it = metadata_.find(key);
    if (it == metadata_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<float> OnnxInferenceBackend::forward(const std::vector<float> &input,
                                                 const std::vector<int64_t> &shape,
                                                 std::chrono::milliseconds timeout)
{
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        memory_info_,
        const_cast<float *>(input.data()),
        input.size(),
        shape.data(),
        shape.size());

    Ort::RunOptions run_options;
    std::vector<Ort::Value> output_tensors;
    {
        RunDeadline deadline(run_options, timeout);
        try
        {
            output_tensors = session_.Run(
                run_options,
                input_names_.data(),
                &input_tensor,
                1,
                output_names_.data(),
                1);
        }
        catch (const Ort::Exception &)
        {
            deadline.finish();
            if (deadline.expired())
            {
                throw InferenceTimeout("ONNX inference exceeded " + std::to_string(timeout.count()) + " ms");
            }
            throw;
        }
    }

    if (output_tensors.empty() || !output_tensors[0].IsTensor())
    {
        throw std::runtime_error("ONNX backend returned an invalid output tensor");
    }

    const auto output_info = output_tensors[0].GetTensorTypeAndShapeInfo();
    if (output_info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT)
    {
        throw std::runtime_error("ONNX output tensor is not float32");
    }

    const std::size_t element_count = output_info.GetElementCount();
    const float *output_data = output_tensors[0].GetTensorData<float>();
    return std::vector<float>(output_data, output_data + element_count);
}

std::vector<int64_t> OnnxInferenceBackend::resolve_input_shape() const
{
    const auto type_info = session_.GetInputTypeInfo(0);
    if (type_info.GetONNXType() != ONNX_TYPE_TENSOR)
    {
        throw std::runtime_error("Model input is not a tensor");
    }

    const auto tensor_info = type_info.GetTensorTypeAndShapeInfo();
    if (tensor_info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT)
    {
        throw std::runtime_error("Model input tensor is not float32");
    }

    const auto shape = tensor_info.GetShape();
    if (shape.empty())
    {
        throw std::runtime_error("Input tensor has empty shape");
    }

    return shape;
}

std::size_t OnnxInferenceBackend::resolve_output_size() const
{
    const auto type_info = session_.GetOutputTypeInfo(0);
    if (type_info.GetONNXType() != ONNX_TYPE_TENSOR)
    {
        throw std::runtime_error("Model output is not a tensor");
    }

    const auto shape = type_info.GetTensorTypeAndShapeInfo().GetShape();
    if (shape.empty())
    {
        throw std::runtime_error("Output tensor has empty shape");
    }

    // 0 when the class dimension is dynamic; the loader measures it instead.
    const int64_t class_dim = shape.back();
    return class_dim > 0 ? static_cast<std::size_t>(class_dim) : 0;
}

void OnnxInferenceBackend::read_metadata()
{
    Ort::AllocatorWithDefaultOptions allocator;
    const Ort::ModelMetadata model_metadata = session_.GetModelMetadata();

    for (const auto &key : model_metadata.GetCustomMetadataMapKeysAllocated(allocator))
    {
        const std::string name(key.get());
        auto value = model_metadata.LookupCustomMetadataMapAllocated(name.c_str(), allocator);
        if (value)
        {
            metadata_[name] = value.get();
        }
    }
}
} // namespace tl
