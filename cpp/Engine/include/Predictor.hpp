#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "ModelHandle.hpp"
#include "Tensor.hpp"

namespace tl
{
struct Prediction
{
    std::string label;
    std::size_t class_index;
    float confidence;
    // Indexed like ModelHandle::labels().
    std::vector<float> probabilities;
};

std::vector<float> softmax(const std::vector<float> &logits);

class Predictor
{
public:
    Predictor(const ModelHandle &model, std::chrono::milliseconds timeout);

    // One forward pass. Throws RequestFailure(InferenceTimeout) on deadline
    // expiry and RequestFailure(Internal) on unusable model output.
    Prediction predict(const Tensor &tensor) const;

    const ModelHandle &model() const;

private:
    const ModelHandle &model_;
    std::chrono::milliseconds timeout_;
};
} // namespace tl
