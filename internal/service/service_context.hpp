#pragma once

#include <memory>

namespace escrow::core { class EscrowManager; }

namespace escrow::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<escrow::core::EscrowManager> manager;
};

}
