#include "Predictor.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include "RequestError.hpp"

namespace tl
{
std::vector<float> softmax(const std::vector<float> &logits)
{
    if (logits.empty())
    {
        return {};
    }

    const float max_logit = *std::max_element(logits.begin(), logits.end());

    std::vector<float> probabilities(logits.size());
    double sum = 0.0;
    for (std::size_t i = 0; i < logits.size(); ++i)
    {
        const double value = std::exp(static_cast<double>(logits[i]) - static_cast<double>(max_logit));
        probabilities[i] = static_cast<float>(value);
        sum += value;
    }

    for (auto &probability : probabilities)
    {
        probability = static_cast<float>(static_cast<double>(probability) / sum);
    }

    return probabilities;
}

Predictor::Predictor(const ModelHandle &model, std::chrono::milliseconds timeout)
    : model_(model),
      timeout_(timeout)
{
}

Prediction Predictor::predict(const Tensor &tensor) const
{
    std::vector<float> logits;
    try
    {
        logits = model_.forward(tensor, timeout_);
    }
    catch (const InferenceTimeout &ex)
    {
        throw RequestFailure(ErrorKind::InferenceTimeout, ex.what());
    }

    if (logits.size() != model_.class_count())
    {
        throw RequestFailure(ErrorKind::Internal,
                             "Model returned " + std::to_string(logits.size()) + " outputs, expected " +
                                 std::to_string(model_.class_count()));
    }

    const bool finite = std::all_of(logits.begin(), logits.end(), [](float value) {
        return std::isfinite(value);
    });
    if (!finite)
    {
        throw RequestFailure(ErrorKind::Internal, "Model returned non-finite logits");
    }

    auto probabilities = softmax(logits);
    const auto best = std::max_element(probabilities.begin(), probabilities.end());
    const auto index = static_cast<std::size_t>(std::distance(probabilities.begin(), best));
    const float confidence = std::clamp(*best, 0.0F, 1.0F);

    return Prediction{
        .label = model_.labels()[index],
        .class_index = index,
        .confidence = confidence,
        .probabilities = std::move(probabilities),
    };
}

const ModelHandle &Predictor::model() const
{
    return model_;
}
} // namespace tl
