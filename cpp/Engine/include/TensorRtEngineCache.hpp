#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

namespace tl
{
struct TensorRtBuildOptions
{
    std::size_t max_workspace_size_bytes{1024 * 1024 * 1024};
    bool enable_fp16{true};
};

// Compiles an ONNX artifact into a serialized TensorRT engine stored next to
// it. Workers booting together share one build through an advisory file lock.
class TensorRtEngineCache
{
public:
    explicit TensorRtEngineCache(TensorRtBuildOptions options);

    static std::filesystem::path engine_path_for(const std::filesystem::path &onnx_model_path);

    std::filesystem::path ensure_engine_file(const std::filesystem::path &onnx_model_path) const;

private:
    std::vector<char> build_serialized_engine(const std::filesystem::path &onnx_model_path) const;

    TensorRtBuildOptions options_;
};
} // namespace tl
