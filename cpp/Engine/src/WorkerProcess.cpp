#include "WorkerProcess.hpp"

#include <chrono>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>

#include "ClassificationService.hpp"
#include "ConfigLoader.hpp"
#include "ErrorReporter.hpp"
#include "HttpRouter.hpp"
#include "HttpServer.hpp"
#include "Logger.hpp"
#include "WorkerSupervisor.hpp"

#if TL_ENABLE_GRPC
#include "GrpcServer.hpp"
#endif

namespace tl
{
namespace
{
constexpr std::chrono::milliseconds kFatalFlushTimeout{2000};

std::unique_ptr<ModelHandle> load_model(const AppConfig &config)
{
    BackendOptions backend;
    try
    {
        backend.kind = parse_backend_kind(config.model.backend);
    }
    catch (const std::invalid_argument &ex)
    {
        throw ModelLoadError(LoadFailure::InvalidConfiguration, ex.what());
    }
    backend.intra_op_threads = config.model.intra_op_threads;

    const ModelLoader loader(make_backend_factory(backend), LoaderOptions{.warmup = config.model.warmup});
    return loader.load(model_source_from(config));
}

HttpServerOptions http_options_from(const AppConfig &config)
{
    return HttpServerOptions{
        .bind_address = config.server.bind_address,
        .port = config.server.port,
        .read_timeout = std::chrono::seconds(config.server.read_timeout_seconds),
        .keep_alive_timeout = std::chrono::seconds(config.server.keep_alive_timeout_seconds),
        .connection_threads = config.server.connection_threads,
        .body_limit = config.limits.max_upload_bytes + 64 * 1024,
    };
}

template <typename Server>
int run_until_stopped(Server &server, const AppConfig &config)
{
    try
    {
        server.run();
    }
    catch (const std::exception &ex)
    {
        tl::log::error(transport_name(config.server.transport) + " transport failed: " + ex.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

void log_start_failure(const AppConfig &config, const std::exception &ex)
{
    tl::log::fatal(std::string("Failed to start ") + transport_name(config.server.transport) +
                   " transport: " + ex.what());
}
} // namespace

int serve(const AppConfig &config, const ClassificationService &service)
{
    switch (config.server.transport)
    {
    case Transport::Http:
    {
        const HttpRouter router(service);
        std::unique_ptr<HttpServer> server;
        try
        {
            server = std::make_unique<HttpServer>(http_options_from(config), router);
        }
        catch (const std::exception &ex)
        {
            log_start_failure(config, ex);
            return kWorkerBootFailure;
        }
        return run_until_stopped(*server, config);
    }
    case Transport::Grpc:
    {
#if TL_ENABLE_GRPC
        std::unique_ptr<GrpcServer> server;
        try
        {
            server = std::make_unique<GrpcServer>(config.server.bind_address, config.server.port, service);
        }
        catch (const std::exception &ex)
        {
            log_start_failure(config, ex);
            return kWorkerBootFailure;
        }
        return run_until_stopped(*server, config);
#else
        tl::log::fatal("This build has no gRPC support (TL_ENABLE_GRPC=OFF)");
        return kWorkerBootFailure;
#endif
    }
    }
    tl::log::fatal("Unsupported transport: " + transport_name(config.server.transport));
    return kWorkerBootFailure;
}

ModelSource model_source_from(const AppConfig &config)
{
    return ModelSource{
        .artifact_path = config.model.path,
        .architecture = config.model.architecture,
        .labels = config.model.labels,
    };
}

int run_worker(const AppConfig &config)
{
    const auto reporter = make_error_reporter(config.observability.error_tracking_endpoint);

    // Parallelism comes from worker processes, not from threads inside one.
    cv::setNumThreads(1);

    std::unique_ptr<ModelHandle> model;
    try
    {
        model = load_model(config);
    }
    catch (const ModelLoadError &ex)
    {
        tl::log::fatal(std::string("Fatal error during model loading: ") + ex.what());
        reporter->report(ErrorEvent{
            .name = "model_load_failed",
            .level = log::Level::Fatal,
            .kind = load_failure_name(ex.reason()),
            .message = ex.what(),
            .context = {{"artifact", config.model.path}, {"architecture", config.model.architecture}},
        });
        if (!reporter->flush(kFatalFlushTimeout))
        {
            tl::log::warn("Fatal error event was not delivered before exit");
        }
        return kWorkerBootFailure;
    }

    const ClassificationService service(*model, *reporter,
                                        ServiceOptions{
                                            .max_upload_bytes = config.limits.max_upload_bytes,
                                            .inference_timeout =
                                                std::chrono::milliseconds(config.limits.inference_timeout_ms),
                                        });

    return serve(config, service);
}
} // namespace tl
