#include "ModelLoadError.hpp"

namespace tl
{
const char *load_failure_name(LoadFailure reason)
{
    switch (reason)
    {
    case LoadFailure::InvalidConfiguration:
        return "InvalidConfiguration";
    case LoadFailure::UnknownArchitecture:
        return "UnknownArchitecture";
    case LoadFailure::ArtifactNotFound:
        return "ArtifactNotFound";
    case LoadFailure::ArtifactCorrupt:
        return "ArtifactCorrupt";
    case LoadFailure::ArchitectureMismatch:
        return "ArchitectureMismatch";
    case LoadFailure::OutputMismatch:
        return "OutputMismatch";
    }

    return "Unknown";
}

ModelLoadError::ModelLoadError(LoadFailure reason, const std::string &message)
    : std::runtime_error(message),
      reason_(reason)
{
}

LoadFailure ModelLoadError::reason() const noexcept
{
    return reason_;
}
} // namespace tl
