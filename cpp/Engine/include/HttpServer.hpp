#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <httplib.h>

#include "HttpRouter.hpp"

namespace tl
{
struct HttpServerOptions
{
    std::string bind_address{"0.0.0.0"};
    // 0 binds an ephemeral port.
    std::uint16_t port{8000};
    std::chrono::seconds read_timeout{30};
    std::chrono::seconds keep_alive_timeout{5};
    std::size_t connection_threads{4};
    std::size_t body_limit{5 * 1024 * 1024 + 64 * 1024};
};

// Several worker processes bind the same port; SO_REUSEPORT lets the kernel
// spread connections between them.
class HttpServer
{
public:
    // Binds the listener; throws std::runtime_error when it cannot.
    HttpServer(const HttpServerOptions &options, const HttpRouter &router);

    // Serves until stop(). Throws when the listener fails while serving.
    void run();
    void stop();

    std::uint16_t port() const;
    bool is_running() const;

private:
    void install_routes();

    httplib::Server server_;
    const HttpRouter &router_;
    HttpServerOptions options_;
    std::uint16_t port_{0};
};
} // namespace tl
