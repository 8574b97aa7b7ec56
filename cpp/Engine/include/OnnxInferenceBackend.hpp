#pragma once

#include <onnxruntime_cxx_api.h>

#include <map>
#include <string>
#include <vector>

#include "IInferenceBackend.hpp"

namespace tl
{
class OnnxInferenceBackend : public IInferenceBackend
{
public:
    OnnxInferenceBackend(const std::string &model_path, int intra_op_threads);

    std::string backend_name() const override;
    std::vector<int64_t> input_shape() const override;
    std::size_t output_size() const override;
    std::optional<std::string> metadata(const std::string &key) const override;

    std::vector<float> forward(const std::vector<float> &input,
                               const std::vector<int64_t> &shape,
                               std::chrono::milliseconds timeout) override;

private:
    std::vector<int64_t> resolve_input_shape() const;
    std::size_t resolve_output_size() const;
    void read_metadata();

    Ort::Env env_;
    Ort::Session session_;
    Ort::MemoryInfo memory_info_;

    std::vector<std::string> input_names_owned_;
    std::vector<std::string> output_names_owned_;
    std::vector<const char *> input_names_;
    std::vector<const char *> output_names_;

    std::vector<int64_t> input_shape_;
    std::size_t output_size_;
    std::map<std::string, std::string> metadata_;
};
} // namespace tl
