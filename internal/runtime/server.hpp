#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace escrow::runtime {

/*
  Owns the gRPC server hosting the ledger services.

  Stop() refuses new calls and gives in-flight ones until the grace
  deadline, so a mutation that already entered the ledger either commits
  or rolls back before the process exits.
*/
class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
         std::chrono::milliseconds shutdown_grace = std::chrono::milliseconds(5000));
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Actual port after Start(); differs from the configured one when it was 0.
  int BoundPort() const { return bound_port_; }

private:
  std::string                                   bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::chrono::milliseconds                     shutdown_grace_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           bound_port_ = 0;
};

} // namespace escrow::runtime
