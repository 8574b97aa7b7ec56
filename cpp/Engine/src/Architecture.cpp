#include "Architecture.hpp"

#include <algorithm>

#include "ModelLoadError.hpp"

namespace tl
{
namespace
{
constexpr std::array<float, 3> kImageNetMean{0.485F, 0.456F, 0.406F};
constexpr std::array<float, 3> kImageNetStd{0.229F, 0.224F, 0.225F};

const std::vector<ArchitectureSpec> &registry()
{
    static const std::vector<ArchitectureSpec> specs{
        {"efficientnet_b0", 224, 224, kImageNetMean, kImageNetStd},
        {"efficientnet_b1", 240, 240, kImageNetMean, kImageNetStd},
        {"efficientnet_b2", 260, 260, kImageNetMean, kImageNetStd},
        {"efficientnet_b3", 300, 300, kImageNetMean, kImageNetStd},
        {"resnet18", 224, 224, kImageNetMean, kImageNetStd},
        {"resnet50", 224, 224, kImageNetMean, kImageNetStd},
        {"mobilenetv3_large_100", 224, 224, kImageNetMean, kImageNetStd},
        {"convnext_tiny", 224, 224, kImageNetMean, kImageNetStd},
    };
    return specs;
}
} // namespace

std::vector<int64_t> ArchitectureSpec::input_shape() const
{
    return {1, 3, input_height, input_width};
}

std::size_t ArchitectureSpec::input_elements() const
{
    return static_cast<std::size_t>(3) * static_cast<std::size_t>(input_height) *
           static_cast<std::size_t>(input_width);
}

const ArchitectureSpec &find_architecture(const std::string &name)
{
    const auto &specs = registry();
    const auto it = std::find_if(specs.begin(), specs.end(), [&name](const ArchitectureSpec &spec) {
        return spec.name == name;
    });

    if (it == specs.end())
    {
        std::string supported;
        for (const auto &spec : specs)
        {
            supported += supported.empty() ? spec.name : ", " + spec.name;
        }
        throw ModelLoadError(LoadFailure::UnknownArchitecture,
                             "Unsupported architecture: " + name + " (supported: " + supported + ")");
    }

    return *it;
}

std::vector<std::string> known_architectures()
{
    std::vector<std::string> names;
    for (const auto &spec : registry())
    {
        names.push_back(spec.name);
    }
    return names;
}
} // namespace tl
