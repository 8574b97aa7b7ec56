#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "IInferenceBackend.hpp"

namespace tl
{
class TensorRtInferenceBackend : public IInferenceBackend
{
public:
    explicit TensorRtInferenceBackend(const std::string &model_path);
    ~TensorRtInferenceBackend() override;

    TensorRtInferenceBackend(const TensorRtInferenceBackend &) = delete;
    TensorRtInferenceBackend &operator=(const TensorRtInferenceBackend &) = delete;
    TensorRtInferenceBackend(TensorRtInferenceBackend &&) noexcept;
    TensorRtInferenceBackend &operator=(TensorRtInferenceBackend &&) noexcept;

    std::string backend_name() const override;
    std::vector<int64_t> input_shape() const override;
    std::size_t output_size() const override;
    std::optional<std::string> metadata(const std::string &key) const override;

    std::vector<float> forward(const std::vector<float> &input,
                               const std::vector<int64_t> &shape,
                               std::chrono::milliseconds timeout) override;

private:
    std::filesystem::path model_path_;
    std::filesystem::path engine_path_;
    std::vector<int64_t> input_shape_;
    std::map<std::string, std::string> metadata_;
    class Impl;
    std::unique_ptr<Impl> impl_;
};
} // namespace tl
