#pragma once

#include <stdexcept>
#include <string>

namespace tl
{
enum class ErrorKind
{
    UnsupportedMediaType,
    PayloadTooLarge,
    MalformedImage,
    BadRequest,
    InferenceTimeout,
    Internal
};

const char *error_kind_name(ErrorKind kind);
unsigned http_status_for(ErrorKind kind);
bool is_client_error(ErrorKind kind);

struct RequestError
{
    ErrorKind kind;
    std::string message;
};

// Thrown from the preprocessing and inference stages; the service turns it
// back into a RequestError at the top of the request path.
class RequestFailure : public std::runtime_error
{
public:
    RequestFailure(ErrorKind kind, const std::string &message);

    ErrorKind kind() const noexcept;
    RequestError to_error() const;

private:
    ErrorKind kind_;
};
} // namespace tl
