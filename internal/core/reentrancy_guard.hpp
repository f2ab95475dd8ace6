#pragma once

#include <atomic>
#include <mutex>
#include <thread>

namespace escrow::core {

/*
  Non-reentrant execution lock.

  One Scope is held for the whole of every mutating ledger call. A second
  Scope requested by the thread that already owns the guard (a callback
  into the ledger from inside a transfer) throws util::ReentrantCall
  instead of deadlocking. Other threads block until the owner leaves.
*/
class ReentrancyGuard {
 public:
  class Scope {
   public:
    Scope(ReentrancyGuard& guard, const char* operation);
    ~Scope();

    Scope(const Scope&)            = delete;
    Scope& operator=(const Scope&) = delete;

   private:
    ReentrancyGuard& guard_;
  };

  bool HeldByCurrentThread() const;

 private:
  std::mutex                   mutex_;
  std::atomic<std::thread::id> owner_{};
};

} // namespace escrow::core
