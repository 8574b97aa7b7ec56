#include "RequestError.hpp"

namespace tl
{
const char *error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::UnsupportedMediaType:
        return "UnsupportedMediaType";
    case ErrorKind::PayloadTooLarge:
        return "PayloadTooLarge";
    case ErrorKind::MalformedImage:
        return "MalformedImage";
    case ErrorKind::BadRequest:
        return "BadRequest";
    case ErrorKind::InferenceTimeout:
        return "InferenceTimeout";
    case ErrorKind::Internal:
        return "Internal";
    }

    return "Internal";
}

unsigned http_status_for(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::UnsupportedMediaType:
        return 415;
    case ErrorKind::PayloadTooLarge:
        return 413;
    case ErrorKind::MalformedImage:
    case ErrorKind::BadRequest:
        return 400;
    case ErrorKind::InferenceTimeout:
        return 504;
    case ErrorKind::Internal:
        return 500;
    }

    return 500;
}

bool is_client_error(ErrorKind kind)
{
    return http_status_for(kind) < 500;
}

RequestFailure::RequestFailure(ErrorKind kind, const std::string &message)
    : std::runtime_error(message),
      kind_(kind)
{
}

ErrorKind RequestFailure::kind() const noexcept
{
    return kind_;
}

RequestError RequestFailure::to_error() const
{
    return RequestError{
        .kind = kind_,
        .message = what(),
    };
}
} // namespace tl
