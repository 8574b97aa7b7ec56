#include "ErrorReporter.hpp"

#include <unistd.h>

#include <utility>

#include <httplib.h>

namespace tl
{
nlohmann::json ErrorEvent::to_json() const
{
    nlohmann::json payload = {
        {"event", name},
        {"level", log::level_name(level)},
        {"kind", kind},
        {"message", message},
        {"pid", static_cast<long>(::getpid())},
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count()},
    };
    if (!context.empty())
    {
        payload["context"] = context;
    }
    return payload;
}

void LogErrorReporter::report(ErrorEvent event)
{
    nlohmann::json fields = {{"kind", event.kind}, {"message", event.message}};
    if (!event.context.empty())
    {
        fields["context"] = event.context;
    }
    log::event(event.level, event.name, std::move(fields));
}

bool LogErrorReporter::flush(std::chrono::milliseconds)
{
    return true;
}

std::optional<HttpEndpoint> parse_http_endpoint(const std::string &url)
{
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0)
    {
        return std::nullopt;
    }

    const std::string rest = url.substr(scheme.size());
    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    const std::string target = (slash == std::string::npos) ? "/" : rest.substr(slash);

    if (authority.empty())
    {
        return std::nullopt;
    }

    HttpEndpoint endpoint;
    endpoint.target = target;

    const auto colon = authority.rfind(':');
    if (colon == std::string::npos)
    {
        endpoint.host = authority;
        endpoint.port = "80";
    }
    else
    {
        endpoint.host = authority.substr(0, colon);
        endpoint.port = authority.substr(colon + 1);
        if (endpoint.host.empty() || endpoint.port.empty() || endpoint.port.size() > 5 ||
            endpoint.port.find_first_not_of("0123456789") != std::string::npos || std::stoi(endpoint.port) > 65535)
        {
            return std::nullopt;
        }
    }

    return endpoint;
}

HttpErrorReporter::HttpErrorReporter(HttpEndpoint endpoint,
                                     std::size_t capacity,
                                     std::chrono::milliseconds send_timeout)
    : endpoint_(std::move(endpoint)),
      capacity_(capacity),
      send_timeout_(send_timeout)
{
    worker_ = std::thread([this] { run(); });
}

HttpErrorReporter::~HttpErrorReporter()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();

    if (worker_.joinable())
    {
        worker_.join();
    }
}

void HttpErrorReporter::report(ErrorEvent event)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_)
        {
            ++dropped_;
            return;
        }
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

bool HttpErrorReporter::flush(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !in_flight_; });
}

std::size_t HttpErrorReporter::dropped_count() const
{
    return dropped_.load();
}

std::size_t HttpErrorReporter::delivered_count() const
{
    return delivered_.load();
}

std::size_t HttpErrorReporter::failed_count() const
{
    return failed_.load();
}

void HttpErrorReporter::run()
{
    while (true)
    {
        ErrorEvent event;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty())
            {
                return;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
            in_flight_ = true;
        }

        const bool sent = post(event.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        if (sent)
        {
            ++delivered_;
        }
        else
        {
            ++failed_;
            log::debug("Error event could not be delivered to " + endpoint_.host + ":" + endpoint_.port);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_ = false;
        }
        idle_cv_.notify_all();
    }
}

bool HttpErrorReporter::post(const std::string &body) const
{
    httplib::Client client(endpoint_.host, std::stoi(endpoint_.port));
    client.set_connection_timeout(send_timeout_);
    client.set_read_timeout(send_timeout_);
    client.set_write_timeout(send_timeout_);
    client.set_default_headers({{"User-Agent", "tumorlens-error-reporter"}});

    const auto result = client.Post(endpoint_.target, body, "application/json");
    if (!result)
    {
        log::debug("Error event POST failed: " + httplib::to_string(result.error()));
        return false;
    }
    return result->status < 300;
}

std::unique_ptr<IErrorReporter> make_error_reporter(const std::string &endpoint)
{
    if (endpoint.empty())
    {
        return std::make_unique<LogErrorReporter>();
    }

    auto parsed = parse_http_endpoint(endpoint);
    if (!parsed)
    {
        log::warn("Error tracking endpoint '" + endpoint +
                  "' is not an http:// URL; error events go to the log only");
        return std::make_unique<LogErrorReporter>();
    }

    log::info("Error tracking enabled: " + parsed->host + ":" + parsed->port + parsed->target);
    return std::make_unique<HttpErrorReporter>(std::move(*parsed));
}
} // namespace tl
