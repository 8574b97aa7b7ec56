#include "ModelLoader.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "Logger.hpp"

namespace fs = std::filesystem;

namespace tl
{
namespace
{
void validate_source(const ModelSource &source)
{
    if (source.artifact_path.empty())
    {
        throw ModelLoadError(LoadFailure::InvalidConfiguration, "Model artifact path is empty");
    }
    if (source.architecture.empty())
    {
        throw ModelLoadError(LoadFailure::InvalidConfiguration, "Model architecture identifier is empty");
    }
    if (source.labels.empty())
    {
        throw ModelLoadError(LoadFailure::InvalidConfiguration, "Label list is empty");
    }

    std::set<std::string> seen;
    for (const auto &label : source.labels)
    {
        if (label.empty() || !seen.insert(label).second)
        {
            throw ModelLoadError(LoadFailure::InvalidConfiguration,
                                 "Label list must contain unique, non-empty names");
        }
    }
}

void check_artifact_file(const fs::path &path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        throw ModelLoadError(LoadFailure::ArtifactNotFound, "Model artifact not found: " + path.string());
    }
    if (!fs::is_regular_file(path, ec))
    {
        throw ModelLoadError(LoadFailure::ArtifactNotFound, "Model artifact is not a regular file: " + path.string());
    }

    std::ifstream stream(path, std::ios::binary | std::ios::ate);
    if (!stream.is_open())
    {
        throw ModelLoadError(LoadFailure::ArtifactCorrupt, "Model artifact is not readable: " + path.string());
    }
    if (stream.tellg() <= 0)
    {
        throw ModelLoadError(LoadFailure::ArtifactCorrupt, "Model artifact is empty: " + path.string());
    }
}

std::string describe_shape(const std::vector<int64_t> &shape)
{
    std::ostringstream out;
    out << '[';
    for (std::size_t i = 0; i < shape.size(); ++i)
    {
        out << (i > 0 ? ", " : "") << shape[i];
    }
    out << ']';
    return out.str();
}

bool dimension_matches(int64_t declared, int64_t expected)
{
    return declared < 0 || declared == expected;
}

void check_input_shape(const IInferenceBackend &backend, const ArchitectureSpec &architecture)
{
    const auto declared = backend.input_shape();
    const auto expected = architecture.input_shape();

    bool compatible = declared.size() == expected.size();
    for (std::size_t i = 0; compatible && i < declared.size(); ++i)
    {
        compatible = dimension_matches(declared[i], expected[i]);
    }

    if (!compatible)
    {
        throw ModelLoadError(LoadFailure::ArchitectureMismatch,
                             "Model input shape " + describe_shape(declared) + " is incompatible with " +
                                 architecture.name + " input " + describe_shape(expected));
    }
}

std::vector<float> parse_float_list(const std::string &text)
{
    std::vector<float> values;
    try
    {
        const auto parsed = nlohmann::json::parse(text.front() == '[' ? text : "[" + text + "]");
        for (const auto &value : parsed)
        {
            values.push_back(value.get<float>());
        }
    }
    catch (const nlohmann::json::exception &)
    {
        values.clear();
    }
    return values;
}

// Normalisation constants are not part of the ONNX graph. When an exporter
// recorded them as metadata, a disagreement is reported but not enforced.
void compare_normalisation(const IInferenceBackend &backend, const ArchitectureSpec &architecture)
{
    const std::pair<const char *, const std::array<float, 3> *> entries[] = {
        {"normalize_mean", &architecture.mean},
        {"normalize_std", &architecture.std},
    };

    for (const auto &[key, expected] : entries)
    {
        const auto recorded = backend.metadata(key);
        if (!recorded || recorded->empty())
        {
            continue;
        }

        const auto values = parse_float_list(*recorded);
        bool matches = values.size() == expected->size();
        for (std::size_t i = 0; matches && i < values.size(); ++i)
        {
            matches = std::fabs(values[i] - (*expected)[i]) < 1e-4F;
        }

        if (!matches)
        {
            tl::log::event(tl::log::Level::Warn, "normalization_mismatch",
                           {{"key", key}, {"artifact", *recorded}, {"architecture", architecture.name}});
        }
    }
}
} // namespace

ModelLoader::ModelLoader(BackendFactory factory, LoaderOptions options)
    : factory_(std::move(factory)),
      options_(options)
{
    if (!factory_)
    {
        throw std::invalid_argument("ModelLoader requires a backend factory");
    }
}

std::unique_ptr<ModelHandle> ModelLoader::load(const ModelSource &source) const
{
    const auto started = std::chrono::steady_clock::now();

    validate_source(source);
    const ArchitectureSpec &architecture = find_architecture(source.architecture);

    const fs::path artifact = fs::absolute(source.artifact_path);
    check_artifact_file(artifact);

    std::unique_ptr<IInferenceBackend> backend;
    try
    {
        backend = factory_(artifact.string());
    }
    catch (const std::exception &ex)
    {
        throw ModelLoadError(LoadFailure::ArtifactCorrupt,
                             "Failed to load model artifact " + artifact.string() + ": " + ex.what());
    }
    if (!backend)
    {
        throw ModelLoadError(LoadFailure::ArtifactCorrupt, "Backend factory returned no model for " + artifact.string());
    }

    if (const auto recorded = backend->metadata("architecture"); recorded && *recorded != architecture.name)
    {
        throw ModelLoadError(LoadFailure::ArchitectureMismatch,
                             "Artifact was exported for architecture " + *recorded + ", configured " +
                                 architecture.name);
    }

    check_input_shape(*backend, architecture);

    const std::size_t declared_outputs = backend->output_size();
    if (declared_outputs != 0 && declared_outputs != source.labels.size())
    {
        throw ModelLoadError(LoadFailure::OutputMismatch,
                             "Model produces " + std::to_string(declared_outputs) + " outputs but " +
                                 std::to_string(source.labels.size()) + " labels are configured");
    }

    compare_normalisation(*backend, architecture);

    auto handle = std::make_unique<ModelHandle>(std::move(backend), architecture, source.labels);

    // A dynamic class dimension can only be verified by running the model.
    if (options_.warmup || declared_outputs == 0)
    {
        const Tensor zeros{
            .data = std::vector<float>(architecture.input_elements(), 0.0F),
            .shape = architecture.input_shape(),
        };

        std::vector<float> logits;
        try
        {
            logits = handle->forward(zeros, options_.warmup_timeout);
        }
        catch (const std::exception &ex)
        {
            throw ModelLoadError(LoadFailure::ArtifactCorrupt, std::string("Warm-up inference failed: ") + ex.what());
        }

        if (logits.size() != source.labels.size())
        {
            throw ModelLoadError(LoadFailure::OutputMismatch,
                                 "Warm-up produced " + std::to_string(logits.size()) + " outputs but " +
                                     std::to_string(source.labels.size()) + " labels are configured");
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    tl::log::event(tl::log::Level::Info, "model_loaded",
                   {{"artifact", artifact.string()},
                    {"architecture", architecture.name},
                    {"backend", handle->backend_name()},
                    {"classes", handle->class_count()},
                    {"input_height", architecture.input_height},
                    {"input_width", architecture.input_width},
                    {"warmup", options_.warmup},
                    {"elapsed_ms", elapsed.count()}});

    return handle;
}
} // namespace tl
