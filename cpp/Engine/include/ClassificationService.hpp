#pragma once

#include <chrono>
#include <variant>

#include "ErrorReporter.hpp"
#include "ImagePreprocessor.hpp"
#include "ModelHandle.hpp"
#include "Predictor.hpp"
#include "RequestError.hpp"
#include "RequestValidator.hpp"

namespace tl
{
using ClassifyOutcome = std::variant<Prediction, RequestError>;

struct ServiceOptions
{
    std::size_t max_upload_bytes{5 * 1024 * 1024};
    std::chrono::milliseconds inference_timeout{10000};
};

// Per-request pipeline: validate, preprocess, predict. Every failure comes
// back as a RequestError; nothing thrown inside escapes classify().
class ClassificationService
{
public:
    ClassificationService(const ModelHandle &model, IErrorReporter &reporter, ServiceOptions options);

    ClassifyOutcome classify(const Upload &upload) const;

    // Reports a failed request and returns the error as the caller may see it.
    // Server-side details are replaced with a generic message.
    RequestError reject(const Upload &upload, RequestError error) const;

    const ModelHandle &model() const;
    std::size_t max_upload_bytes() const;

private:
    const ModelHandle &model_;
    IErrorReporter &reporter_;
    RequestValidator validator_;
    ImagePreprocessor preprocessor_;
    Predictor predictor_;
};
} // namespace tl
