#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

inline std::string encode_image(const cv::Mat &image, const std::string &extension = ".png")
{
    std::vector<uchar> buffer;
    cv::imencode(extension, image, buffer);
    return std::string(buffer.begin(), buffer.end());
}

inline std::string solid_png(int width, int height, const cv::Scalar &bgr)
{
    return encode_image(cv::Mat(height, width, CV_8UC3, bgr));
}
