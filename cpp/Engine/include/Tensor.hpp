#pragma once

#include <cstdint>
#include <vector>

namespace tl
{
// Dense float tensor in NCHW order.
struct Tensor
{
    std::vector<float> data;
    std::vector<int64_t> shape;
};
} // namespace tl
