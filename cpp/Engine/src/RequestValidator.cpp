#include "RequestValidator.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace tl
{
namespace
{
constexpr std::array<std::string_view, 7> kAcceptedMediaTypes{
    "image/jpeg", "image/jpg", "image/png", "image/bmp", "image/gif", "image/tiff", "image/webp",
};

bool starts_with(std::string_view bytes, std::string_view prefix)
{
    return bytes.size() >= prefix.size() && bytes.compare(0, prefix.size(), prefix) == 0;
}

std::string trim(const std::string &value)
{
    const auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos)
    {
        return {};
    }
    const auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

std::string format_bytes(std::size_t bytes)
{
    if (bytes % (1024 * 1024) == 0)
    {
        return std::to_string(bytes / (1024 * 1024)) + " MiB";
    }
    return std::to_string(bytes) + " bytes";
}
} // namespace

ImageFormat detect_image_format(std::string_view bytes)
{
    using namespace std::string_view_literals;

    if (starts_with(bytes, "\xFF\xD8\xFF"sv))
    {
        return ImageFormat::Jpeg;
    }
    if (starts_with(bytes, "\x89PNG\r\n\x1A\n"sv))
    {
        return ImageFormat::Png;
    }
    if (starts_with(bytes, "GIF87a"sv) || starts_with(bytes, "GIF89a"sv))
    {
        return ImageFormat::Gif;
    }
    if (starts_with(bytes, "II*\0"sv) || starts_with(bytes, "MM\0*"sv))
    {
        return ImageFormat::Tiff;
    }
    if (bytes.size() >= 12 && starts_with(bytes, "RIFF"sv) && bytes.substr(8, 4) == "WEBP"sv)
    {
        return ImageFormat::Webp;
    }
    // "BM" alone is too weak; the BMP file header is 14 bytes plus a DIB header.
    if (bytes.size() >= 26 && starts_with(bytes, "BM"sv))
    {
        return ImageFormat::Bmp;
    }

    return ImageFormat::Unknown;
}

const char *image_format_name(ImageFormat format)
{
    switch (format)
    {
    case ImageFormat::Jpeg:
        return "jpeg";
    case ImageFormat::Png:
        return "png";
    case ImageFormat::Bmp:
        return "bmp";
    case ImageFormat::Gif:
        return "gif";
    case ImageFormat::Tiff:
        return "tiff";
    case ImageFormat::Webp:
        return "webp";
    case ImageFormat::Unknown:
        break;
    }
    return "unknown";
}

std::string normalize_media_type(const std::string &content_type)
{
    std::string value = trim(content_type.substr(0, content_type.find(';')));
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

RequestValidator::RequestValidator(std::size_t max_upload_bytes)
    : max_upload_bytes_(max_upload_bytes)
{
}

std::optional<RequestError> RequestValidator::validate(const Upload &upload) const
{
    if (!is_accepted_media_type(upload.content_type))
    {
        return RequestError{
            .kind = ErrorKind::UnsupportedMediaType,
            .message = "Invalid file type '" + upload.content_type +
                       "'. Supported types are: JPEG, PNG, BMP, GIF, TIFF, WEBP.",
        };
    }

    if (upload.bytes.size() > max_upload_bytes_)
    {
        return oversize_error();
    }

    if (detect_image_format(upload.bytes) == ImageFormat::Unknown)
    {
        return RequestError{
            .kind = ErrorKind::MalformedImage,
            .message = "The file is not a valid image.",
        };
    }

    return std::nullopt;
}

RequestError RequestValidator::oversize_error() const
{
    return RequestError{
        .kind = ErrorKind::PayloadTooLarge,
        .message = "File is too large. Max limit is " + format_bytes(max_upload_bytes_) + ".",
    };
}

std::size_t RequestValidator::max_upload_bytes() const
{
    return max_upload_bytes_;
}

bool RequestValidator::is_accepted_media_type(const std::string &content_type)
{
    const std::string media_type = normalize_media_type(content_type);
    return std::find(kAcceptedMediaTypes.begin(), kAcceptedMediaTypes.end(), media_type) !=
           kAcceptedMediaTypes.end();
}
} // namespace tl
