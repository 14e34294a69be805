#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace alo::db::memory {

/*
  Transaction = exclusive lock + undo log.

  Writes go straight to the shared state while the lock is held; each
  mutation registers an undo step that Rollback() replays in reverse.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const;

  void OnRollback(std::function<void()> undo);

 private:
  void Release();

  MemoryRepository&                  repo_;
  std::unique_lock<std::mutex>       lock_;
  std::vector<std::function<void()>> undo_;
  bool                               committed_   = false;
  bool                               rolled_back_ = false;
};

} // namespace alo::db::memory
