#include <gtest/gtest.h>

#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <string>

#include <boost/asio.hpp>

#include "FakeErrorReporter.hpp"
#include "MockInferenceBackend.hpp"
#include "WorkerProcess.hpp"
#include "WorkerSupervisor.hpp"

namespace fs = std::filesystem;
using boost::asio::ip::tcp;
using namespace std::chrono_literals;

namespace
{
std::uint16_t unused_loopback_port()
{
    boost::asio::io_context io_context;
    tcp::acceptor acceptor(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    return acceptor.local_endpoint().port();
}

bool port_is_free(std::uint16_t port)
{
    boost::asio::io_context io_context;
    tcp::acceptor acceptor(io_context);
    boost::system::error_code ec;
    acceptor.open(tcp::v4(), ec);
    if (!ec)
    {
        acceptor.bind(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port), ec);
    }
    return !ec;
}

tl::AppConfig loopback_config(std::uint16_t port)
{
    tl::AppConfig config;
    config.server.bind_address = "127.0.0.1";
    config.server.port = port;
    return config;
}
} // namespace

TEST(WorkerProcessTest, MissingModelFailsBeforeListening)
{
    const std::uint16_t port = unused_loopback_port();
    auto config = loopback_config(port);
    config.model.path = (fs::temp_directory_path() / ("tumorlens_absent_" + std::to_string(::getpid()) + ".onnx")).string();

    const auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(tl::run_worker(config), tl::kWorkerBootFailure);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

    EXPECT_TRUE(port_is_free(port));
}

TEST(WorkerProcessTest, UnknownBackendIsBootFailure)
{
    auto config = loopback_config(unused_loopback_port());
    config.model.backend = "openvino";

    EXPECT_EQ(tl::run_worker(config), tl::kWorkerBootFailure);
}

TEST(WorkerProcessTest, OccupiedPortIsBootFailure)
{
    boost::asio::io_context io_context;
    tcp::acceptor holder(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

    auto model = make_model(make_mock_backend({1.0F, 0.0F, 0.0F, 0.0F}));
    FakeErrorReporter reporter;
    const tl::ClassificationService service(*model, reporter, tl::ServiceOptions{});

    EXPECT_EQ(tl::serve(loopback_config(holder.local_endpoint().port()), service), tl::kWorkerBootFailure);
}

#if !TL_ENABLE_GRPC
TEST(WorkerProcessTest, GrpcTransportWithoutSupportIsBootFailure)
{
    auto model = make_model(make_mock_backend({1.0F, 0.0F, 0.0F, 0.0F}));
    FakeErrorReporter reporter;
    const tl::ClassificationService service(*model, reporter, tl::ServiceOptions{});

    auto config = loopback_config(unused_loopback_port());
    config.server.transport = tl::Transport::Grpc;

    EXPECT_EQ(tl::serve(config, service), tl::kWorkerBootFailure);
}
#endif
