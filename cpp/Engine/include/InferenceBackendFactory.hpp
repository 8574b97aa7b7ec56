#pragma once

#include <functional>
#include <memory>
#include <string>

#include "IInferenceBackend.hpp"

namespace tl
{
enum class BackendKind
{
    Onnx,
    TensorRt
};

struct BackendOptions
{
    BackendKind kind{BackendKind::Onnx};
    int intra_op_threads{1};
};

using BackendFactory = std::function<std::unique_ptr<IInferenceBackend>(const std::string &model_path)>;

BackendKind parse_backend_kind(const std::string &backend_name);
std::unique_ptr<IInferenceBackend> create_backend(const BackendOptions &options,
                                                  const std::string &model_path);
BackendFactory make_backend_factory(const BackendOptions &options);
} // namespace tl
