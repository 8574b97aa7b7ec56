#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "Architecture.hpp"
#include "IInferenceBackend.hpp"
#include "Tensor.hpp"

namespace tl
{
// A loaded, inference-ready model with its label vocabulary. Built once per
// worker process by ModelLoader and never modified afterwards.
class ModelHandle
{
public:
    ModelHandle(std::unique_ptr<IInferenceBackend> backend,
                ArchitectureSpec architecture,
                std::vector<std::string> labels);

    ModelHandle(const ModelHandle &) = delete;
    ModelHandle &operator=(const ModelHandle &) = delete;

    const ArchitectureSpec &architecture() const;
    const std::vector<std::string> &labels() const;
    std::size_t class_count() const;
    std::string backend_name() const;

    std::vector<float> forward(const Tensor &tensor, std::chrono::milliseconds timeout) const;

private:
    std::unique_ptr<IInferenceBackend> backend_;
    ArchitectureSpec architecture_;
    std::vector<std::string> labels_;
};
} // namespace tl
