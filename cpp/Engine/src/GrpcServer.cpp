#include "GrpcServer.hpp"

#include <unistd.h>

#include <grpcpp/grpcpp.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "Logger.hpp"
#include "classifier.grpc.pb.h"

namespace tl
{
namespace
{
class ClassifierServiceImpl final : public tumorlens::v1::ClassifierService::Service
{
public:
    explicit ClassifierServiceImpl(const ClassificationService &service)
        : service_(service)
    {
    }

    grpc::Status Classify(grpc::ServerContext *context,
                          const tumorlens::v1::ClassifyRequest *request,
                          tumorlens::v1::ClassifyResponse *response) override
    {
        tl::log::debug("Classify request from " + context->peer());

        const Upload upload{
            .bytes = request->image(),
            .content_type = request->content_type(),
            .filename = request->filename(),
        };

        // gRPC dispatches on a thread pool; a worker runs one inference at a time.
        ClassifyOutcome outcome;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            outcome = service_.classify(upload);
        }

        if (const auto *error = std::get_if<RequestError>(&outcome))
        {
            return grpc::Status(grpc_status_for(error->kind),
                                std::string(error_kind_name(error->kind)) + ": " + error->message);
        }

        const auto &prediction = std::get<Prediction>(outcome);
        const auto &labels = service_.model().labels();

        response->set_filename(request->filename());
        response->set_label(prediction.label);
        response->set_confidence(prediction.confidence);
        for (std::size_t i = 0; i < labels.size() && i < prediction.probabilities.size(); ++i)
        {
            auto *score = response->add_scores();
            score->set_label(labels[i]);
            score->set_probability(prediction.probabilities[i]);
        }

        return grpc::Status::OK;
    }

    grpc::Status Health(grpc::ServerContext *,
                        const tumorlens::v1::HealthRequest *,
                        tumorlens::v1::HealthResponse *response) override
    {
        response->set_status("healthy");
        response->set_model(service_.model().architecture().name);
        for (const auto &label : service_.model().labels())
        {
            response->add_labels(label);
        }
        response->set_pid(static_cast<int64_t>(::getpid()));
        return grpc::Status::OK;
    }

private:
    const ClassificationService &service_;
    std::mutex mutex_;
};
} // namespace

grpc::StatusCode grpc_status_for(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::UnsupportedMediaType:
    case ErrorKind::MalformedImage:
    case ErrorKind::BadRequest:
        return grpc::StatusCode::INVALID_ARGUMENT;
    case ErrorKind::PayloadTooLarge:
        return grpc::StatusCode::RESOURCE_EXHAUSTED;
    case ErrorKind::InferenceTimeout:
        return grpc::StatusCode::DEADLINE_EXCEEDED;
    case ErrorKind::Internal:
        break;
    }
    return grpc::StatusCode::INTERNAL;
}

GrpcServer::GrpcServer(const std::string &bind_address, std::uint16_t port, const ClassificationService &service)
    : address_(bind_address + ":" + std::to_string(port)),
      service_(std::make_unique<ClassifierServiceImpl>(service))
{
    grpc::ServerBuilder builder;
    int selected_port = 0;
    builder.AddListeningPort(address_, grpc::InsecureServerCredentials(), &selected_port);
    builder.RegisterService(service_.get());
    builder.AddChannelArgument(GRPC_ARG_ALLOW_REUSEPORT, 1);
    // The transport limit sits above the upload ceiling so oversized images
    // reach the validator and get a PayloadTooLarge answer.
    builder.SetMaxReceiveMessageSize(static_cast<int>(service.max_upload_bytes() + 64 * 1024));

    server_ = builder.BuildAndStart();
    if (server_ == nullptr || selected_port == 0)
    {
        throw std::runtime_error("Failed to start gRPC server on " + address_);
    }
}

GrpcServer::~GrpcServer()
{
    if (server_ != nullptr)
    {
        server_->Shutdown();
    }
}

void GrpcServer::run()
{
    tl::log::info("gRPC server listening on " + address_);
    server_->Wait();
}
} // namespace tl
