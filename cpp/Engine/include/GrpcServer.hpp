#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "ClassificationService.hpp"

namespace tl
{
grpc::StatusCode grpc_status_for(ErrorKind kind);

class GrpcServer
{
public:
    // Starts listening; throws std::runtime_error when the port cannot be bound.
    GrpcServer(const std::string &bind_address, std::uint16_t port, const ClassificationService &service);
    ~GrpcServer();

    // Blocks until the server shuts down.
    void run();

private:
    std::string address_;
    std::unique_ptr<grpc::Service> service_;
    std::unique_ptr<grpc::Server> server_;
};
} // namespace tl
