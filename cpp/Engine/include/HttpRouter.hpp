#pragma once

#include <mutex>
#include <string>

#include <httplib.h>

#include <nlohmann/json.hpp>

#include "ClassificationService.hpp"

namespace tl
{
void set_json_body(httplib::Response &response, int status, const nlohmann::json &body);
void set_error_body(httplib::Response &response, const RequestError &error);

// Multipart uploads use the "file" part, else the first part that carries a
// filename. Any other body is the raw image under its own content type.
// Throws RequestFailure(BadRequest) for a form without a file part.
Upload upload_from(const httplib::Request &request);

// Cross-origin requests are allowed from any origin, without credentials.
void apply_cors_headers(const httplib::Request &request, httplib::Response &response);
bool is_cors_preflight(const httplib::Request &request);

class HttpRouter
{
public:
    explicit HttpRouter(const ClassificationService &service);

    void health(const httplib::Request &request, httplib::Response &response) const;
    void predict(const httplib::Request &request, httplib::Response &response) const;

    // Runs before the body is read. Answers CORS preflights and methods the
    // route does not accept; returns true when the response is complete.
    bool pre_route(const httplib::Request &request, httplib::Response &response) const;

    // JSON body for errors raised by the transport itself: unknown path,
    // oversize or unparseable body.
    httplib::Server::HandlerResponse transport_error(const httplib::Request &request,
                                                     httplib::Response &response) const;

    void unhandled_exception(const httplib::Request &request,
                             httplib::Response &response,
                             std::exception_ptr error) const;

private:
    const ClassificationService &service_;

    // Connections are served on several threads; inference runs one at a time.
    mutable std::mutex inference_mutex_;
};
} // namespace tl
