#include "ModelHandle.hpp"

#include <stdexcept>
#include <utility>

namespace tl
{
ModelHandle::ModelHandle(std::unique_ptr<IInferenceBackend> backend,
                         ArchitectureSpec architecture,
                         std::vector<std::string> labels)
    : backend_(std::move(backend)),
      architecture_(std::move(architecture)),
      labels_(std::move(labels))
{
    if (!backend_)
    {
        throw std::invalid_argument("ModelHandle requires an inference backend");
    }
}

const ArchitectureSpec &ModelHandle::architecture() const
{
    return architecture_;
}

const std::vector<std::string> &ModelHandle::labels() const
{
    return labels_;
}

std::size_t ModelHandle::class_count() const
{
    return labels_.size();
}

std::string ModelHandle::backend_name() const
{
    return backend_->backend_name();
}

std::vector<float> ModelHandle::forward(const Tensor &tensor, std::chrono::milliseconds timeout) const
{
    if (tensor.data.size() != architecture_.input_elements())
    {
        throw std::runtime_error("Tensor has " + std::to_string(tensor.data.size()) + " elements, " +
                                 architecture_.name + " expects " +
                                 std::to_string(architecture_.input_elements()));
    }

    return backend_->forward(tensor.data, tensor.shape, timeout);
}
} // namespace tl
