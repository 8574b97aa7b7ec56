#include "HttpServer.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "Logger.hpp"

namespace tl
{
namespace
{
void enable_socket_option(httplib::socket_t sock, int option, const char *name)
{
    const int enabled = 1;
    if (::setsockopt(sock, SOL_SOCKET, option, &enabled, sizeof(enabled)) != 0)
    {
        tl::log::warn(std::string("Failed to set ") + name + " on HTTP listener: " + std::strerror(errno));
    }
}
} // namespace

HttpServer::HttpServer(const HttpServerOptions &options, const HttpRouter &router)
    : router_(router),
      options_(options)
{
    const std::size_t threads = options_.connection_threads > 0 ? options_.connection_threads : 1;
    server_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    server_.set_socket_options([](httplib::socket_t sock) {
        enable_socket_option(sock, SO_REUSEADDR, "SO_REUSEADDR");
        enable_socket_option(sock, SO_REUSEPORT, "SO_REUSEPORT");
    });

    server_.set_read_timeout(options_.read_timeout);
    server_.set_write_timeout(options_.read_timeout);
    server_.set_keep_alive_timeout(static_cast<time_t>(options_.keep_alive_timeout.count()));
    server_.set_payload_max_length(options_.body_limit);
    server_.set_default_headers({{"Server", "TumorLens"}});

    install_routes();

    if (options_.port == 0)
    {
        const int bound = server_.bind_to_any_port(options_.bind_address);
        if (bound <= 0)
        {
            throw std::runtime_error("Failed to bind HTTP listener to " + options_.bind_address);
        }
        port_ = static_cast<std::uint16_t>(bound);
    }
    else
    {
        if (!server_.bind_to_port(options_.bind_address, options_.port))
        {
            throw std::runtime_error("Failed to bind HTTP listener to " + options_.bind_address + ":" +
                                     std::to_string(options_.port));
        }
        port_ = options_.port;
    }
}

void HttpServer::install_routes()
{
    server_.set_pre_routing_handler([this](const httplib::Request &req, httplib::Response &res) {
        return router_.pre_route(req, res) ? httplib::Server::HandlerResponse::Handled
                                           : httplib::Server::HandlerResponse::Unhandled;
    });

    // HEAD is answered by the GET handlers with the body left off.
    const auto health = [this](const httplib::Request &req, httplib::Response &res) { router_.health(req, res); };
    server_.Get("/", health);
    server_.Get("/health", health);

    server_.Post("/predict", [this](const httplib::Request &req, httplib::Response &res) {
        router_.predict(req, res);
    });

    server_.set_error_handler([this](const httplib::Request &req, httplib::Response &res) {
        return router_.transport_error(req, res);
    });
    server_.set_exception_handler([this](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        router_.unhandled_exception(req, res, ep);
    });
    server_.set_post_routing_handler([](const httplib::Request &req, httplib::Response &res) {
        apply_cors_headers(req, res);
    });
}

void HttpServer::run()
{
    tl::log::info("HTTP server listening on " + options_.bind_address + ":" + std::to_string(port_) + " (" +
                  std::to_string(options_.connection_threads) + " connection threads)");

    if (!server_.listen_after_bind())
    {
        throw std::runtime_error("HTTP listener on port " + std::to_string(port_) + " failed");
    }
}

void HttpServer::stop()
{
    server_.stop();
}

std::uint16_t HttpServer::port() const
{
    return port_;
}

bool HttpServer::is_running() const
{
    return server_.is_running();
}
} // namespace tl
