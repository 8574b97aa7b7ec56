#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "RequestError.hpp"

namespace tl
{
enum class ImageFormat
{
    Unknown,
    Jpeg,
    Png,
    Bmp,
    Gif,
    Tiff,
    Webp
};

struct Upload
{
    std::string_view bytes;
    std::string content_type;
    std::string filename;
};

ImageFormat detect_image_format(std::string_view bytes);
const char *image_format_name(ImageFormat format);

// Lower-cased media type without parameters: "Image/PNG; q=1" -> "image/png".
std::string normalize_media_type(const std::string &content_type);

class RequestValidator
{
public:
    explicit RequestValidator(std::size_t max_upload_bytes);

    // Checks run in order: media type, size ceiling, image signature. The first
    // failing check decides the error.
    std::optional<RequestError> validate(const Upload &upload) const;

    RequestError oversize_error() const;
    std::size_t max_upload_bytes() const;
    static bool is_accepted_media_type(const std::string &content_type);

private:
    std::size_t max_upload_bytes_;
};
} // namespace tl
