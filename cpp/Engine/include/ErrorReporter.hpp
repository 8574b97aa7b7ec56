#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "Logger.hpp"

namespace tl
{
struct ErrorEvent
{
    std::string name;
    log::Level level{log::Level::Error};
    std::string kind;
    std::string message;
    nlohmann::json context = nlohmann::json::object();

    nlohmann::json to_json() const;
};

class IErrorReporter
{
public:
    virtual ~IErrorReporter() = default;

    // Must not block the caller on delivery.
    virtual void report(ErrorEvent event) = 0;

    // Waits up to `timeout` for queued events to be delivered.
    virtual bool flush(std::chrono::milliseconds timeout) = 0;
};

class LogErrorReporter : public IErrorReporter
{
public:
    void report(ErrorEvent event) override;
    bool flush(std::chrono::milliseconds timeout) override;
};

struct HttpEndpoint
{
    std::string host;
    std::string port;
    std::string target;
};

// Accepts "http://host[:port][/path]". Other schemes are rejected.
std::optional<HttpEndpoint> parse_http_endpoint(const std::string &url);

// Delivers events as JSON POSTs from a background thread. The queue is
// bounded; events arriving while it is full are counted and dropped.
class HttpErrorReporter : public IErrorReporter
{
public:
    HttpErrorReporter(HttpEndpoint endpoint,
                      std::size_t capacity = 256,
                      std::chrono::milliseconds send_timeout = std::chrono::milliseconds(2000));
    ~HttpErrorReporter() override;

    HttpErrorReporter(const HttpErrorReporter &) = delete;
    HttpErrorReporter &operator=(const HttpErrorReporter &) = delete;

    void report(ErrorEvent event) override;
    bool flush(std::chrono::milliseconds timeout) override;

    std::size_t dropped_count() const;
    std::size_t delivered_count() const;
    std::size_t failed_count() const;

private:
    void run();
    bool post(const std::string &body) const;

    HttpEndpoint endpoint_;
    std::size_t capacity_;
    std::chrono::milliseconds send_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<ErrorEvent> queue_;
    bool in_flight_{false};
    bool stopping_{false};

    std::atomic<std::size_t> dropped_{0};
    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> failed_{0};

    std::thread worker_;
};

// HttpErrorReporter when an endpoint is configured, LogErrorReporter otherwise.
std::unique_ptr<IErrorReporter> make_error_reporter(const std::string &endpoint);
} // namespace tl
