#include "internal/core/reentrancy_guard.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace escrow::core {

ReentrancyGuard::Scope::Scope(ReentrancyGuard& guard, const char* operation) : guard_(guard) {
  if (guard_.HeldByCurrentThread()) {
    throw util::ReentrantCall(std::string(operation) + " called while another ledger mutation is in progress");
  }
  guard_.mutex_.lock();
  guard_.owner_.store(std::this_thread::get_id());
}

ReentrancyGuard::Scope::~Scope() {
  guard_.owner_.store(std::thread::id{});
  guard_.mutex_.unlock();
}

bool ReentrancyGuard::HeldByCurrentThread() const {
  return owner_.load() == std::this_thread::get_id();
}

} // namespace escrow::core
