#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tl
{
class InferenceTimeout : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class IInferenceBackend
{
public:
    virtual ~IInferenceBackend() = default;

    virtual std::string backend_name() const = 0;

    // Declared model input shape; dynamic dimensions are reported as -1.
    virtual std::vector<int64_t> input_shape() const = 0;
    virtual std::size_t output_size() const = 0;
    virtual std::optional<std::string> metadata(const std::string &key) const = 0;

    // Runs one forward pass and returns the raw logits. A zero timeout disables
    // the deadline; otherwise expiry throws InferenceTimeout.
    virtual std::vector<float> forward(const std::vector<float> &input,
                                       const std::vector<int64_t> &shape,
                                       std::chrono::milliseconds timeout) = 0;
};
} // namespace tl
