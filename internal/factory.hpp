#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

namespace escrow::db { class Repository; }
namespace escrow::asset { class AssetLedger; }
namespace escrow::core { class EscrowManager; }

namespace escrow::factory {

constexpr const char* kDefaultBindAddress    = "0.0.0.0:50061";
constexpr const char* kDefaultCustodyAccount = "escrow-custody";
constexpr uint32_t    kDefaultPlatformFeeBps = 250;

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>     repository;
  std::shared_ptr<asset::AssetLedger> assets;
  std::shared_ptr<core::EscrowManager> manager;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config and initialises
  the ledger (admin set, fee policy) on first start.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and asset types.
*/
Application Build(const escrow::runtime::config::RuntimeConfig& config);

} // namespace escrow::factory
