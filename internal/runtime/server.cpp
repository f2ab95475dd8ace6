#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace escrow::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
               std::chrono::milliseconds shutdown_grace)
    : bind_address_(std::move(bind_address)), services_(std::move(services)), shutdown_grace_(shutdown_grace) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) {
    throw std::logic_error("server already started on " + bind_address_);
  }

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &bound_port_);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_) {
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }
  // BuildAndStart succeeds even when the bind itself failed
  if (bound_port_ == 0) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
    throw std::runtime_error("failed to bind " + bind_address_);
  }

  ESCROW_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_),
                                            observability::IntField("port", bound_port_),
                                            observability::UintField("services", services_.size())});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) {
    return;
  }
  ESCROW_LOG_INFO("gRPC server draining", {observability::IntField("grace_ms", shutdown_grace_.count())});
  grpc_server_->Shutdown(std::chrono::system_clock::now() + shutdown_grace_);
  grpc_server_.reset();
}

} // namespace escrow::runtime
