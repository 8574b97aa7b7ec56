#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "FakeErrorReporter.hpp"
#include "HttpServer.hpp"
#include "MockInferenceBackend.hpp"
#include "TestImages.hpp"

using namespace std::chrono_literals;
using boost::asio::ip::tcp;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace
{
constexpr std::size_t kUploadLimit = 16 * 1024;

// Reads until the server closes the connection and returns everything sent.
std::string read_until_closed(tcp::socket &socket)
{
    std::string received;
    boost::system::error_code ec;
    boost::asio::read(socket, boost::asio::dynamic_buffer(received), ec);
    return received;
}
} // namespace

class HttpServerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        model_ = make_model(make_mock_backend({0.1F, 0.2F, 3.0F, 0.3F}));
        service_ = std::make_unique<tl::ClassificationService>(
            *model_, reporter_,
            tl::ServiceOptions{.max_upload_bytes = kUploadLimit, .inference_timeout = std::chrono::milliseconds(500)});
        router_ = std::make_unique<tl::HttpRouter>(*service_);
    }

    void TearDown() override
    {
        if (server_)
        {
            server_->stop();
        }
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    void start(std::chrono::seconds read_timeout = 5s, std::chrono::seconds keep_alive_timeout = 1s)
    {
        server_ = std::make_unique<tl::HttpServer>(
            tl::HttpServerOptions{
                .bind_address = "127.0.0.1",
                .port = 0,
                .read_timeout = read_timeout,
                .keep_alive_timeout = keep_alive_timeout,
                .connection_threads = 2,
                .body_limit = kUploadLimit + 64 * 1024,
            },
            *router_);
        thread_ = std::thread([this] { server_->run(); });

        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!server_->is_running() && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(10ms);
        }
        ASSERT_TRUE(server_->is_running());
    }

    std::unique_ptr<httplib::Client> client() const
    {
        auto cli = std::make_unique<httplib::Client>("127.0.0.1", server_->port());
        cli->set_read_timeout(5s);
        return cli;
    }

    tcp::socket connect_raw()
    {
        tcp::socket socket(io_context_);
        socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), server_->port()));
        return socket;
    }

    std::unique_ptr<tl::ModelHandle> model_;
    FakeErrorReporter reporter_;
    std::unique_ptr<tl::ClassificationService> service_;
    std::unique_ptr<tl::HttpRouter> router_;
    std::unique_ptr<tl::HttpServer> server_;
    std::thread thread_;
    boost::asio::io_context io_context_;
};

TEST_F(HttpServerTest, HeadResponseLeavesConnectionInSync)
{
    start();
    auto socket = connect_raw();

    boost::asio::write(socket, boost::asio::buffer(std::string("HEAD /health HTTP/1.1\r\nHost: localhost\r\n\r\n")));
    std::string head;
    boost::asio::read_until(socket, boost::asio::dynamic_buffer(head), "\r\n\r\n");
    const auto headers_end = head.find("\r\n\r\n") + 4;
    EXPECT_THAT(head, StartsWith("HTTP/1.1 200"));
    EXPECT_THAT(head, HasSubstr("Content-Length"));

    boost::asio::write(socket, boost::asio::buffer(std::string(
                                   "GET /health HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n")));
    const std::string rest = head.substr(headers_end) + read_until_closed(socket);

    // The next bytes on the wire must be the second status line, not a body.
    EXPECT_THAT(rest, StartsWith("HTTP/1.1 200"));
    EXPECT_THAT(rest, HasSubstr("\"status\":\"healthy\""));
}

TEST_F(HttpServerTest, MultipartUploadIsClassified)
{
    start();
    const std::string boundary = "TumorLensBoundary";
    const std::string body = "--" + boundary + "\r\n" +
                             "Content-Disposition: form-data; name=\"file\"; filename=\"Te-no_0001.png\"\r\n" +
                             "Content-Type: image/png\r\n\r\n" + solid_png(64, 64, cv::Scalar(30, 30, 30)) +
                             "\r\n--" + boundary + "--\r\n";

    auto cli = client();
    const auto result = cli->Post("/predict", body, "multipart/form-data; boundary=" + boundary);

    ASSERT_TRUE(result);
    ASSERT_EQ(result->status, 200);
    const auto json = nlohmann::json::parse(result->body);
    EXPECT_EQ(json["filename"], "Te-no_0001.png");
    EXPECT_EQ(json["prediction"], "no-tumor");
    EXPECT_EQ(result->get_header_value("Server"), "TumorLens");
}

TEST_F(HttpServerTest, OversizeBodyIs413)
{
    start();
    auto cli = client();
    const auto result = cli->Post("/predict", std::string(200 * 1024, 'x'), "image/png");

    ASSERT_TRUE(result);
    EXPECT_EQ(result->status, 413);
    const auto json = nlohmann::json::parse(result->body);
    EXPECT_EQ(json["error"], "PayloadTooLarge");
    EXPECT_EQ(json["detail"], "File is too large. Max limit is 16384 bytes.");
}

TEST_F(HttpServerTest, UnknownPathAndWrongMethodAreJson)
{
    start();
    auto cli = client();

    const auto missing = cli->Get("/metrics");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);
    EXPECT_EQ(nlohmann::json::parse(missing->body)["error"], "NotFound");

    const auto wrong = cli->Get("/predict");
    ASSERT_TRUE(wrong);
    EXPECT_EQ(wrong->status, 405);
    EXPECT_EQ(wrong->get_header_value("Allow"), "POST");
}

TEST_F(HttpServerTest, CrossOriginRequestsAreAllowed)
{
    start();
    auto cli = client();

    const auto preflight = cli->Options("/predict", httplib::Headers{{"Origin", "https://viewer.example"},
                                                                    {"Access-Control-Request-Method", "POST"}});
    ASSERT_TRUE(preflight);
    EXPECT_EQ(preflight->status, 200);
    EXPECT_EQ(preflight->get_header_value("Access-Control-Allow-Origin"), "*");

    const auto health = cli->Get("/health", httplib::Headers{{"Origin", "https://viewer.example"}});
    ASSERT_TRUE(health);
    EXPECT_EQ(health->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(HttpServerTest, IdleConnectionDoesNotBlockOtherClients)
{
    start();
    auto idle = connect_raw();

    const auto started = std::chrono::steady_clock::now();
    auto cli = client();
    const auto result = cli->Get("/health");

    ASSERT_TRUE(result);
    EXPECT_EQ(result->status, 200);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
}

TEST_F(HttpServerTest, IdleKeepAliveConnectionIsClosed)
{
    start(5s, 1s);
    auto socket = connect_raw();

    boost::asio::write(socket, boost::asio::buffer(std::string("GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n")));
    const auto started = std::chrono::steady_clock::now();
    const std::string received = read_until_closed(socket);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_THAT(received, StartsWith("HTTP/1.1 200"));
    EXPECT_LT(elapsed, 4s);
}

TEST_F(HttpServerTest, StalledRequestIsClosedAfterReadTimeout)
{
    start(1s, 1s);
    auto socket = connect_raw();

    boost::asio::write(socket, boost::asio::buffer(std::string("POST /predict HTTP/1.1\r\nHost: localhost\r\n")));
    const auto started = std::chrono::steady_clock::now();
    const std::string received = read_until_closed(socket);

    EXPECT_THAT(received, ::testing::Not(HasSubstr("200 OK")));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 4s);
}

TEST(HttpServerBindTest, OccupiedPortFailsConstruction)
{
    boost::asio::io_context io_context;
    tcp::acceptor holder(io_context, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

    auto model = make_model(make_mock_backend({1.0F, 0.0F, 0.0F, 0.0F}));
    FakeErrorReporter reporter;
    const tl::ClassificationService service(*model, reporter, tl::ServiceOptions{});
    const tl::HttpRouter router(service);

    EXPECT_THROW(tl::HttpServer(tl::HttpServerOptions{.bind_address = "127.0.0.1",
                                                      .port = holder.local_endpoint().port()},
                                router),
                 std::runtime_error);
}
