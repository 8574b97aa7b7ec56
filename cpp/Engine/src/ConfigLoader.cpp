#include "ConfigLoader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <set>

#include <nlohmann/json.hpp>

#include "InferenceBackendFactory.hpp"
#include "Logger.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace tl
{
namespace
{
std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

template <typename T>
void read_field(const json &section, const char *key, T &target)
{
    if (!section.contains(key) || section[key].is_null())
    {
        return;
    }

    try
    {
        target = section[key].get<T>();
    }
    catch (const json::exception &ex)
    {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + ex.what());
    }
}

const json &section_of(const json &payload, const char *name)
{
    static const json empty = json::object();
    if (!payload.contains(name))
    {
        return empty;
    }

    const json &section = payload[name];
    if (!section.is_object())
    {
        throw ConfigError(std::string("Config section '") + name + "' must be an object");
    }
    return section;
}

unsigned long parse_unsigned(const std::string &name, const std::string &value, unsigned long max)
{
    std::size_t consumed = 0;
    unsigned long parsed = 0;
    try
    {
        if (!value.empty() && value.front() == '-')
        {
            throw std::invalid_argument("negative");
        }
        parsed = std::stoul(value, &consumed);
    }
    catch (const std::exception &)
    {
        throw ConfigError("Environment variable " + name + " is not a non-negative integer: " + value);
    }

    if (consumed != value.size() || parsed > max)
    {
        throw ConfigError("Environment variable " + name + " is out of range: " + value);
    }
    return parsed;
}
} // namespace

Transport parse_transport(const std::string &name)
{
    const std::string value = to_lower(name);
    if (value == "http")
    {
        return Transport::Http;
    }
    if (value == "grpc")
    {
        return Transport::Grpc;
    }

    throw ConfigError("Unsupported transport: " + name + " (supported: http, grpc)");
}

std::string transport_name(Transport transport)
{
    return transport == Transport::Grpc ? "grpc" : "http";
}

AppConfig load_app_config(const std::string &config_path)
{
    const fs::path path = fs::absolute(config_path);

    if (!fs::exists(path))
    {
        throw ConfigError("Config file not found: " + path.string());
    }

    std::ifstream config_stream(path);
    if (!config_stream.is_open())
    {
        throw ConfigError("Failed to open config file: " + path.string());
    }

    json payload;
    try
    {
        config_stream >> payload;
    }
    catch (const json::parse_error &ex)
    {
        throw ConfigError("Failed to parse config file " + path.string() + ": " + ex.what());
    }

    if (!payload.is_object())
    {
        throw ConfigError("Config root must be a JSON object: " + path.string());
    }

    AppConfig config;

    const json &model = section_of(payload, "model");
    read_field(model, "path", config.model.path);
    read_field(model, "architecture", config.model.architecture);
    read_field(model, "labels", config.model.labels);
    read_field(model, "backend", config.model.backend);
    read_field(model, "intra_op_threads", config.model.intra_op_threads);
    read_field(model, "warmup", config.model.warmup);

    const json &server = section_of(payload, "server");
    std::string transport = transport_name(config.server.transport);
    read_field(server, "transport", transport);
    config.server.transport = parse_transport(transport);
    read_field(server, "bind_address", config.server.bind_address);
    read_field(server, "port", config.server.port);
    read_field(server, "read_timeout_seconds", config.server.read_timeout_seconds);
    read_field(server, "keep_alive_timeout_seconds", config.server.keep_alive_timeout_seconds);
    read_field(server, "connection_threads", config.server.connection_threads);

    const json &workers = section_of(payload, "workers");
    read_field(workers, "count", config.workers.count);
    read_field(workers, "max", config.workers.max);

    const json &limits = section_of(payload, "limits");
    read_field(limits, "max_upload_bytes", config.limits.max_upload_bytes);
    read_field(limits, "inference_timeout_ms", config.limits.inference_timeout_ms);

    const json &observability = section_of(payload, "observability");
    read_field(observability, "log_level", config.observability.log_level);
    read_field(observability, "error_tracking_endpoint", config.observability.error_tracking_endpoint);

    return config;
}

void apply_environment_overrides(AppConfig &config, const EnvironmentLookup &lookup)
{
    if (auto value = lookup("MODEL_PATH"))
    {
        config.model.path = *value;
    }
    if (auto value = lookup("MODEL_NAME"))
    {
        config.model.architecture = *value;
    }
    if (auto value = lookup("MODEL_BACKEND"))
    {
        config.model.backend = *value;
    }
    if (auto value = lookup("TRANSPORT"))
    {
        config.server.transport = parse_transport(*value);
    }
    if (auto value = lookup("BIND_ADDRESS"))
    {
        config.server.bind_address = *value;
    }
    if (auto value = lookup("PORT"))
    {
        config.server.port = static_cast<std::uint16_t>(
            parse_unsigned("PORT", *value, std::numeric_limits<std::uint16_t>::max()));
    }
    if (auto value = lookup("WORKERS"))
    {
        config.workers.count = static_cast<unsigned>(parse_unsigned("WORKERS", *value, 1024));
    }
    if (auto value = lookup("MAX_WORKERS"))
    {
        config.workers.max = static_cast<unsigned>(parse_unsigned("MAX_WORKERS", *value, 1024));
    }
    if (auto value = lookup("MAX_UPLOAD_BYTES"))
    {
        config.limits.max_upload_bytes = static_cast<std::size_t>(
            parse_unsigned("MAX_UPLOAD_BYTES", *value, std::numeric_limits<std::uint32_t>::max()));
    }
    if (auto value = lookup("INFERENCE_TIMEOUT_MS"))
    {
        config.limits.inference_timeout_ms = static_cast<unsigned>(
            parse_unsigned("INFERENCE_TIMEOUT_MS", *value, std::numeric_limits<std::uint32_t>::max()));
    }
    if (auto value = lookup("LOG_LEVEL"))
    {
        config.observability.log_level = *value;
    }
    if (auto value = lookup("ERROR_TRACKING_ENDPOINT"))
    {
        config.observability.error_tracking_endpoint = *value;
    }
}

std::optional<std::string> process_environment(const std::string &name)
{
    const char *value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::string(value);
}

void validate_app_config(const AppConfig &config)
{
    if (config.model.path.empty())
    {
        throw ConfigError("model.path must not be empty");
    }
    if (config.model.architecture.empty())
    {
        throw ConfigError("model.architecture must not be empty");
    }
    if (config.model.labels.empty())
    {
        throw ConfigError("model.labels must not be empty");
    }

    std::set<std::string> unique_labels;
    for (const auto &label : config.model.labels)
    {
        if (label.empty())
        {
            throw ConfigError("model.labels must not contain empty names");
        }
        if (!unique_labels.insert(label).second)
        {
            throw ConfigError("model.labels contains a duplicate: " + label);
        }
    }

    if (config.model.intra_op_threads < 1)
    {
        throw ConfigError("model.intra_op_threads must be at least 1");
    }
    if (config.server.port == 0)
    {
        throw ConfigError("server.port must be between 1 and 65535");
    }
    if (config.server.read_timeout_seconds < 1)
    {
        throw ConfigError("server.read_timeout_seconds must be at least 1");
    }
    if (config.server.keep_alive_timeout_seconds < 1)
    {
        throw ConfigError("server.keep_alive_timeout_seconds must be at least 1");
    }
    if (config.server.connection_threads == 0)
    {
        throw ConfigError("server.connection_threads must be at least 1");
    }
    if (config.workers.max == 0)
    {
        throw ConfigError("workers.max must be at least 1");
    }
    if (config.limits.max_upload_bytes == 0)
    {
        throw ConfigError("limits.max_upload_bytes must be greater than zero");
    }

    try
    {
        parse_backend_kind(config.model.backend);
        log::parse_level(config.observability.log_level);
    }
    catch (const std::invalid_argument &ex)
    {
        throw ConfigError(ex.what());
    }
}
} // namespace tl
