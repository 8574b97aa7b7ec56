#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tl
{
enum class Transport
{
    Http,
    Grpc
};

struct ModelConfig
{
    std::string path{"models/efficientnet_b0_brain_tumor.onnx"};
    std::string architecture{"efficientnet_b0"};
    std::vector<std::string> labels{"glioma", "meningioma", "no-tumor", "pituitary"};
    std::string backend{"onnx"};
    int intra_op_threads{1};
    bool warmup{true};
};

struct ServerConfig
{
    Transport transport{Transport::Http};
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{8000};
    int read_timeout_seconds{30};
    // Idle time a kept-alive HTTP connection may hold a connection thread.
    int keep_alive_timeout_seconds{5};
    unsigned connection_threads{4};
};

struct WorkerConfig
{
    // 0 derives the count from the number of CPU cores.
    unsigned count{0};
    unsigned max{4};
};

struct LimitsConfig
{
    std::size_t max_upload_bytes{5 * 1024 * 1024};
    unsigned inference_timeout_ms{10000};
};

struct ObservabilityConfig
{
    std::string log_level{"info"};
    std::string error_tracking_endpoint;
};

struct AppConfig
{
    ModelConfig model;
    ServerConfig server;
    WorkerConfig workers;
    LimitsConfig limits;
    ObservabilityConfig observability;
};
} // namespace tl
