#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include "Config.hpp"

namespace tl
{
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

using EnvironmentLookup = std::function<std::optional<std::string>(const std::string &)>;

Transport parse_transport(const std::string &name);
std::string transport_name(Transport transport);

// Reads a JSON config file. Keys that are absent keep their defaults.
AppConfig load_app_config(const std::string &config_path);

void apply_environment_overrides(AppConfig &config, const EnvironmentLookup &lookup);
std::optional<std::string> process_environment(const std::string &name);

// Throws ConfigError on values that cannot produce a working server.
void validate_app_config(const AppConfig &config);
} // namespace tl
