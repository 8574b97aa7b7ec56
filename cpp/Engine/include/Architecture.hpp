#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace tl
{
struct ArchitectureSpec
{
    std::string name;
    int input_height;
    int input_width;
    // RGB order, applied after scaling pixels to [0, 1].
    std::array<float, 3> mean;
    std::array<float, 3> std;

    std::vector<int64_t> input_shape() const;
    std::size_t input_elements() const;
};

// Throws ModelLoadError(UnknownArchitecture) for names outside the registry.
const ArchitectureSpec &find_architecture(const std::string &name);
std::vector<std::string> known_architectures();
} // namespace tl
