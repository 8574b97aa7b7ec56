#include "HttpRouter.hpp"

#include <unistd.h>

#include <exception>
#include <string>
#include <variant>

#include "Logger.hpp"

namespace tl
{
namespace
{
constexpr const char *kCorsMethods = "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT";

nlohmann::json prediction_body(const Prediction &prediction,
                               const std::string &filename,
                               const std::vector<std::string> &labels)
{
    nlohmann::json scores = nlohmann::json::object();
    for (std::size_t i = 0; i < labels.size() && i < prediction.probabilities.size(); ++i)
    {
        scores[labels[i]] = prediction.probabilities[i];
    }

    return {
        {"filename", filename},
        {"prediction", prediction.label},
        {"confidence", prediction.confidence},
        {"confidence_scores", scores},
    };
}

void method_not_allowed(httplib::Response &response, const std::string &path, const std::string &allow)
{
    set_json_body(response, 405, {{"error", "MethodNotAllowed"}, {"detail", "Use " + allow + " " + path}});
    response.set_header("Allow", allow);
}

void preflight(const httplib::Request &request, httplib::Response &response)
{
    response.status = 200;
    response.set_header("Access-Control-Allow-Origin", "*");
    response.set_header("Access-Control-Allow-Methods", kCorsMethods);
    response.set_header("Access-Control-Max-Age", "600");
    if (request.has_header("Access-Control-Request-Headers"))
    {
        response.set_header("Access-Control-Allow-Headers", request.get_header_value("Access-Control-Request-Headers"));
    }
    response.set_content("OK", "text/plain");
}

std::string content_type_of(const httplib::Request &request)
{
    return request.get_header_value("Content-Type");
}
} // namespace

void set_json_body(httplib::Response &response, int status, const nlohmann::json &body)
{
    response.status = status;
    response.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

void set_error_body(httplib::Response &response, const RequestError &error)
{
    set_json_body(response, static_cast<int>(http_status_for(error.kind)),
                  {{"error", error_kind_name(error.kind)}, {"detail", error.message}});
}

Upload upload_from(const httplib::Request &request)
{
    if (!request.is_multipart_form_data())
    {
        return Upload{
            .bytes = request.body,
            .content_type = content_type_of(request),
            .filename = "",
        };
    }

    const httplib::FormData *part = nullptr;
    const auto named = request.form.files.find("file");
    if (named != request.form.files.end())
    {
        part = &named->second;
    }
    else
    {
        for (const auto &[name, candidate] : request.form.files)
        {
            if (!candidate.filename.empty())
            {
                part = &candidate;
                break;
            }
        }
    }

    if (part == nullptr)
    {
        throw RequestFailure(ErrorKind::BadRequest, "No file part named 'file' in the upload");
    }

    return Upload{
        .bytes = part->content,
        .content_type = part->content_type.empty() ? "application/octet-stream" : part->content_type,
        .filename = part->filename,
    };
}

void apply_cors_headers(const httplib::Request &request, httplib::Response &response)
{
    if (!request.has_header("Origin") || response.has_header("Access-Control-Allow-Origin"))
    {
        return;
    }
    response.set_header("Access-Control-Allow-Origin", "*");
}

bool is_cors_preflight(const httplib::Request &request)
{
    return request.method == "OPTIONS" && request.has_header("Origin") &&
           request.has_header("Access-Control-Request-Method");
}

HttpRouter::HttpRouter(const ClassificationService &service)
    : service_(service)
{
}

bool HttpRouter::pre_route(const httplib::Request &request, httplib::Response &response) const
{
    if (is_cors_preflight(request))
    {
        preflight(request, response);
        return true;
    }

    const std::string &path = request.path;
    if ((path == "/" || path == "/health") && request.method != "GET" && request.method != "HEAD")
    {
        method_not_allowed(response, path, "GET, HEAD");
        return true;
    }
    if (path == "/predict" && request.method != "POST")
    {
        method_not_allowed(response, path, "POST");
        return true;
    }
    return false;
}

void HttpRouter::health(const httplib::Request &, httplib::Response &response) const
{
    const ModelHandle &model = service_.model();
    set_json_body(response, 200,
                  {{"status", "healthy"},
                   {"message", "Brain tumor classification service is running."},
                   {"model", model.architecture().name},
                   {"backend", model.backend_name()},
                   {"labels", model.labels()},
                   {"pid", static_cast<long>(::getpid())}});
}

void HttpRouter::predict(const httplib::Request &request, httplib::Response &response) const
{
    Upload upload;
    try
    {
        upload = upload_from(request);
    }
    catch (const RequestFailure &failure)
    {
        const Upload unparsed{
            .bytes = request.body,
            .content_type = content_type_of(request),
            .filename = "",
        };
        set_error_body(response, service_.reject(unparsed, failure.to_error()));
        return;
    }

    ClassifyOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(inference_mutex_);
        outcome = service_.classify(upload);
    }

    if (const auto *error = std::get_if<RequestError>(&outcome))
    {
        set_error_body(response, *error);
        return;
    }

    const auto &prediction = std::get<Prediction>(outcome);
    set_json_body(response, 200, prediction_body(prediction, upload.filename, service_.model().labels()));
}

httplib::Server::HandlerResponse HttpRouter::transport_error(const httplib::Request &request,
                                                             httplib::Response &response) const
{
    if (!response.body.empty())
    {
        return httplib::Server::HandlerResponse::Unhandled;
    }

    const Upload unread{
        .bytes = {},
        .content_type = content_type_of(request),
        .filename = "",
    };

    switch (response.status)
    {
    case 404:
        set_json_body(response, 404, {{"error", "NotFound"}, {"detail", "No route for " + request.path}});
        break;
    case 413:
        set_error_body(response,
                       service_.reject(unread, RequestValidator(service_.max_upload_bytes()).oversize_error()));
        break;
    case 400:
        set_error_body(response, service_.reject(unread, RequestError{
                                                             .kind = ErrorKind::BadRequest,
                                                             .message = "Malformed request body",
                                                         }));
        break;
    default:
        set_json_body(response, response.status,
                      {{"error", "HttpError"}, {"detail", httplib::status_message(response.status)}});
        break;
    }
    return httplib::Server::HandlerResponse::Handled;
}

void HttpRouter::unhandled_exception(const httplib::Request &request,
                                     httplib::Response &response,
                                     std::exception_ptr error) const
{
    std::string message = "unknown exception";
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception &ex)
    {
        message = ex.what();
    }
    catch (...)
    {
        // Not a std::exception; the generic message stands.
    }

    const Upload unread{
        .bytes = {},
        .content_type = content_type_of(request),
        .filename = "",
    };
    set_error_body(response, service_.reject(unread, RequestError{
                                                         .kind = ErrorKind::Internal,
                                                         .message = "Unhandled error on " + request.path + ": " +
                                                                    message,
                                                     }));
}
} // namespace tl
