#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "InferenceBackendFactory.hpp"
#include "ModelHandle.hpp"
#include "ModelLoadError.hpp"

namespace tl
{
struct ModelSource
{
    std::string artifact_path;
    std::string architecture;
    std::vector<std::string> labels;
};

struct LoaderOptions
{
    bool warmup{true};
    std::chrono::milliseconds warmup_timeout{0};
};

class ModelLoader
{
public:
    explicit ModelLoader(BackendFactory factory, LoaderOptions options = {});

    // Builds a verified ModelHandle or throws ModelLoadError. Callers treat
    // any throw as fatal for the process.
    std::unique_ptr<ModelHandle> load(const ModelSource &source) const;

private:
    BackendFactory factory_;
    LoaderOptions options_;
};
} // namespace tl
