#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include <boost/program_options.hpp>

#include "ConfigLoader.hpp"
#include "Logger.hpp"
#include "WorkerProcess.hpp"
#include "WorkerSupervisor.hpp"

namespace po = boost::program_options;

namespace
{
struct CommandLine
{
    std::optional<std::string> config_path;
    std::optional<unsigned> port;
    std::optional<unsigned> workers;
    std::optional<std::string> log_level;
    bool single_process{false};
};

std::optional<CommandLine> parse_command_line(int argc, char **argv)
{
    po::options_description options("TumorLens brain MRI classification server");
    options.add_options()
        ("help,h", "show this help")
        ("config,c", po::value<std::string>(), "JSON configuration file")
        ("port,p", po::value<unsigned>(), "listening port (overrides PORT)")
        ("workers,w", po::value<unsigned>(), "number of worker processes (overrides WORKERS)")
        ("log-level", po::value<std::string>(), "debug, info, warn, error or fatal")
        ("single-process", po::bool_switch(), "serve from this process without forking workers");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, options), vm);
    po::notify(vm);

    if (vm.count("help") != 0)
    {
        std::cout << options << std::endl;
        return std::nullopt;
    }

    CommandLine command_line;
    if (vm.count("config") != 0)
    {
        command_line.config_path = vm["config"].as<std::string>();
    }
    if (vm.count("port") != 0)
    {
        command_line.port = vm["port"].as<unsigned>();
    }
    if (vm.count("workers") != 0)
    {
        command_line.workers = vm["workers"].as<unsigned>();
    }
    if (vm.count("log-level") != 0)
    {
        command_line.log_level = vm["log-level"].as<std::string>();
    }
    command_line.single_process = vm["single-process"].as<bool>();
    return command_line;
}

tl::AppConfig build_config(const CommandLine &command_line)
{
    tl::AppConfig config = command_line.config_path ? tl::load_app_config(*command_line.config_path) : tl::AppConfig{};
    tl::apply_environment_overrides(config, tl::process_environment);

    if (command_line.port)
    {
        if (*command_line.port > 65535)
        {
            throw tl::ConfigError("--port must be between 1 and 65535");
        }
        config.server.port = static_cast<std::uint16_t>(*command_line.port);
    }
    if (command_line.workers)
    {
        config.workers.count = *command_line.workers;
    }
    if (command_line.log_level)
    {
        config.observability.log_level = *command_line.log_level;
    }

    tl::validate_app_config(config);
    return config;
}
} // namespace

int main(int argc, char **argv)
{
    std::optional<CommandLine> command_line;
    try
    {
        command_line = parse_command_line(argc, argv);
    }
    catch (const po::error &ex)
    {
        std::cerr << "Invalid command line: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    if (!command_line)
    {
        return EXIT_SUCCESS;
    }

    tl::AppConfig config;
    try
    {
        config = build_config(*command_line);
        tl::log::set_level(tl::log::parse_level(config.observability.log_level));
    }
    catch (const std::exception &ex)
    {
        tl::log::fatal(std::string("Configuration error: ") + ex.what());
        return EXIT_FAILURE;
    }

    tl::log::event(tl::log::Level::Info, "starting",
                   {{"model_path", config.model.path},
                    {"architecture", config.model.architecture},
                    {"backend", config.model.backend},
                    {"transport", tl::transport_name(config.server.transport)},
                    {"bind", config.server.bind_address + ":" + std::to_string(config.server.port)},
                    {"max_upload_bytes", config.limits.max_upload_bytes},
                    {"inference_timeout_ms", config.limits.inference_timeout_ms}});

    if (command_line->single_process)
    {
        return tl::run_worker(config);
    }

    try
    {
        const unsigned workers =
            tl::resolve_worker_count(config.workers.count, config.workers.max, std::thread::hardware_concurrency());
        tl::WorkerSupervisor supervisor(workers, [&config] { return tl::run_worker(config); });
        return supervisor.run();
    }
    catch (const std::exception &ex)
    {
        tl::log::fatal(std::string("Supervisor failed: ") + ex.what());
        return EXIT_FAILURE;
    }
}
