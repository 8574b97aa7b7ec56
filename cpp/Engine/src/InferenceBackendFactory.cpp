#include "InferenceBackendFactory.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "OnnxInferenceBackend.hpp"
#include "TensorRtInferenceBackend.hpp"

namespace tl
{
namespace
{
std::string normalize_backend_name(const std::string &backend_name)
{
    std::string value = backend_name;
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}
} // namespace

BackendKind parse_backend_kind(const std::string &backend_name)
{
    const std::string value = normalize_backend_name(backend_name);

    if (value == "onnx" || value == "onnxruntime")
    {
        return BackendKind::Onnx;
    }

    if (value == "tensorrt" || value == "trt")
    {
        return BackendKind::TensorRt;
    }

    throw std::invalid_argument("Unsupported backend: " + backend_name + " (supported: onnx, tensorrt)");
}

std::unique_ptr<IInferenceBackend> create_backend(const BackendOptions &options,
                                                  const std::string &model_path)
{
    switch (options.kind)
    {
    case BackendKind::Onnx:
        return std::make_unique<OnnxInferenceBackend>(model_path, options.intra_op_threads);
    case BackendKind::TensorRt:
        return std::make_unique<TensorRtInferenceBackend>(model_path);
    }

    throw std::runtime_error("Unknown backend kind");
}

BackendFactory make_backend_factory(const BackendOptions &options)
{
    return [options](const std::string &model_path) {
        return create_backend(options, model_path);
    };
}
} // namespace tl
