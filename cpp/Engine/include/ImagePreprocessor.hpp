#pragma once

#include <string_view>

#include <opencv2/core.hpp>

#include "Architecture.hpp"
#include "Tensor.hpp"

namespace tl
{
class ImagePreprocessor
{
public:
    explicit ImagePreprocessor(ArchitectureSpec architecture);

    // Decodes, resizes to the architecture's input resolution (aspect ratio is
    // not preserved), converts to RGB and normalises per channel. Throws
    // RequestFailure(MalformedImage) when the bytes do not decode.
    Tensor preprocess(std::string_view image_bytes) const;

    // Same pipeline for an already decoded 8-bit BGR image.
    Tensor preprocess(const cv::Mat &bgr_image) const;

private:
    ArchitectureSpec architecture_;
};
} // namespace tl
