#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/asset/memory_asset_ledger.hpp"
#include "internal/core/escrow_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/escrow_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/escrow_service.hpp"
#include "internal/service/service_context.hpp"
#if ESCROW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace escrow::factory {

using namespace escrow;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const escrow::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ESCROW_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    ESCROW_LOG_INFO("using sqlite ledger", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  ESCROW_LOG_INFO("using in-memory ledger");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<asset::MemoryAssetLedger> BuildAssetLedger(const escrow::runtime::config::RuntimeConfig& config) {
  const auto& asset_config = config.asset();
  const auto  custody      = asset_config.custody_account().empty() ? std::string(kDefaultCustodyAccount) : asset_config.custody_account();

  auto ledger = std::make_shared<asset::MemoryAssetLedger>(custody);
  for (const auto& [account, amount] : asset_config.initial_balances()) {
    if (account == custody) {
      throw std::runtime_error("asset.initial_balances must not seed the custody account");
    }
    ledger->Mint(account, amount);
  }
  return ledger;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const escrow::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Ledger state + asset
  // ------------------------------------------------------------------
  app.repository   = BuildRepository(config);
  auto asset_ledger = BuildAssetLedger(config);
  app.assets        = asset_ledger;

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  const auto& escrow_config = config.escrow();
  const auto  fee_bps       = escrow_config.has_platform_fee_bps() ? escrow_config.platform_fee_bps() : kDefaultPlatformFeeBps;
  const auto  fee_recipient = escrow_config.fee_recipient().empty() ? escrow_config.initial_admin() : escrow_config.fee_recipient();

  app.manager = std::make_shared<core::EscrowManager>(app.repository, app.assets);
  app.manager->Initialize(escrow_config.initial_admin(), fee_bps, fee_recipient);

  // The built-in asset lives in process memory; a persistent ledger
  // reopened here still owes the value locked in its open tasks.
  const auto stats = app.manager->Stats();
  if (stats.custody_balance < stats.value_locked) {
    asset_ledger->Mint(asset_ledger->CustodyAccount(), stats.value_locked - stats.custody_balance);
    ESCROW_LOG_WARN("restored custody balance from persisted ledger",
                    {observability::UintField("value_locked", stats.value_locked)});
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager = app.manager;

  auto escrow_service = std::make_shared<service::EscrowService>(ctx);
  auto admin_service  = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::EscrowServer>(escrow_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace escrow::factory
