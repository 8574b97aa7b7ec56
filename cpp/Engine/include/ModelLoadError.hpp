#pragma once

#include <stdexcept>
#include <string>

namespace tl
{
enum class LoadFailure
{
    InvalidConfiguration,
    UnknownArchitecture,
    ArtifactNotFound,
    ArtifactCorrupt,
    ArchitectureMismatch,
    OutputMismatch
};

const char *load_failure_name(LoadFailure reason);

// Every instance is fatal for the worker that raised it.
class ModelLoadError : public std::runtime_error
{
public:
    ModelLoadError(LoadFailure reason, const std::string &message);

    LoadFailure reason() const noexcept;

private:
    LoadFailure reason_;
};
} // namespace tl
