#include "ImagePreprocessor.hpp"

#include <utility>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "RequestError.hpp"

namespace tl
{
ImagePreprocessor::ImagePreprocessor(ArchitectureSpec architecture)
    : architecture_(std::move(architecture))
{
}

Tensor ImagePreprocessor::preprocess(std::string_view image_bytes) const
{
    if (image_bytes.empty())
    {
        throw RequestFailure(ErrorKind::MalformedImage, "Image processing failed: the upload is empty.");
    }

    const cv::Mat encoded(1, static_cast<int>(image_bytes.size()), CV_8UC1,
                          const_cast<char *>(image_bytes.data()));

    cv::Mat decoded;
    try
    {
        // IMREAD_COLOR expands grayscale and drops alpha, always 3 channels.
        decoded = cv::imdecode(encoded, cv::IMREAD_COLOR);
    }
    catch (const cv::Exception &ex)
    {
        throw RequestFailure(ErrorKind::MalformedImage,
                             std::string("Image processing failed: ") + ex.what());
    }

    if (decoded.empty())
    {
        throw RequestFailure(ErrorKind::MalformedImage,
                             "Image processing failed. The file might be corrupted or not a valid image.");
    }

    return preprocess(decoded);
}

Tensor ImagePreprocessor::preprocess(const cv::Mat &bgr_image) const
{
    if (bgr_image.empty() || bgr_image.type() != CV_8UC3)
    {
        throw RequestFailure(ErrorKind::MalformedImage, "Image processing failed: expected an 8-bit colour image.");
    }

    const int height = architecture_.input_height;
    const int width = architecture_.input_width;

    cv::Mat resized;
    cv::resize(bgr_image, resized, cv::Size(width, height), 0.0, 0.0, cv::INTER_LINEAR);

    cv::Mat rgb;
    cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);

    cv::Mat scaled;
    rgb.convertTo(scaled, CV_32FC3, 1.0 / 255.0);

    Tensor tensor;
    tensor.shape = architecture_.input_shape();
    tensor.data.resize(architecture_.input_elements());

    // HWC -> CHW with (x - mean) / std per channel.
    const std::size_t plane = static_cast<std::size_t>(height) * static_cast<std::size_t>(width);
    for (int y = 0; y < height; ++y)
    {
        const auto *row = scaled.ptr<cv::Vec3f>(y);
        for (int x = 0; x < width; ++x)
        {
            const std::size_t offset = static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                                       static_cast<std::size_t>(x);
            for (int c = 0; c < 3; ++c)
            {
                tensor.data[static_cast<std::size_t>(c) * plane + offset] =
                    (row[x][c] - architecture_.mean[c]) / architecture_.std[c];
            }
        }
    }

    return tensor;
}
} // namespace tl
