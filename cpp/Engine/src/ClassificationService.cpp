#include "ClassificationService.hpp"

#include <utility>

#include "Logger.hpp"

namespace tl
{
ClassificationService::ClassificationService(const ModelHandle &model,
                                             IErrorReporter &reporter,
                                             ServiceOptions options)
    : model_(model),
      reporter_(reporter),
      validator_(options.max_upload_bytes),
      preprocessor_(model.architecture()),
      predictor_(model, options.inference_timeout)
{
}

ClassifyOutcome ClassificationService::classify(const Upload &upload) const
{
    if (auto rejection = validator_.validate(upload))
    {
        return reject(upload, std::move(*rejection));
    }

    try
    {
        const auto started = std::chrono::steady_clock::now();
        const Tensor tensor = preprocessor_.preprocess(upload.bytes);
        Prediction prediction = predictor_.predict(tensor);
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);

        log::info("Prediction successful for file: " + upload.filename + " -> " + prediction.label +
                  " (" + std::to_string(prediction.confidence) + ", " +
                  std::to_string(elapsed.count() / 1000.0) + " ms)");
        return prediction;
    }
    catch (const RequestFailure &failure)
    {
        return reject(upload, failure.to_error());
    }
    catch (const std::exception &ex)
    {
        return reject(upload, RequestError{
                                  .kind = ErrorKind::Internal,
                                  .message = std::string("Unexpected error during prediction: ") + ex.what(),
                              });
    }
}

const ModelHandle &ClassificationService::model() const
{
    return model_;
}

std::size_t ClassificationService::max_upload_bytes() const
{
    return validator_.max_upload_bytes();
}

RequestError ClassificationService::reject(const Upload &upload, RequestError error) const
{
    const bool client_error = is_client_error(error.kind);

    reporter_.report(ErrorEvent{
        .name = "request_failed",
        .level = client_error ? log::Level::Warn : log::Level::Error,
        .kind = error_kind_name(error.kind),
        .message = error.message,
        .context = {{"filename", upload.filename},
                    {"content_type", upload.content_type},
                    {"bytes", upload.bytes.size()}},
    });

    // Internal details stay in the log; the caller only sees the generic text.
    if (!client_error)
    {
        log::error("Request for file '" + upload.filename + "' failed (" + error_kind_name(error.kind) +
                   "): " + error.message);
        error.message = (error.kind == ErrorKind::InferenceTimeout)
                            ? "Inference did not complete in time."
                            : "An internal server error occurred processing your request.";
    }

    return error;
}
} // namespace tl
