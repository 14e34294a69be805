#include "memory_tx.hpp"

#include <stdexcept>
#include <thread>

namespace alo::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  if (repo_.owner_.load() == std::this_thread::get_id()) {
    throw std::logic_error("memory repository: nested transaction on the same thread");
  }
  lock_ = std::unique_lock<std::mutex>(repo_.mutex_);
  repo_.owner_.store(std::this_thread::get_id());
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!lock_.owns_lock()) {
    throw std::logic_error("memory repository: transaction already finished");
  }
  return repo_.state_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  if (!lock_.owns_lock()) {
    throw std::logic_error("memory repository: transaction already finished");
  }
  return repo_.state_;
}

void MemoryTransaction::OnRollback(std::function<void()> undo) {
  undo_.push_back(std::move(undo));
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory repository: transaction already finished");
  }
  undo_.clear();
  committed_ = true;
  Release();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) {
    return;
  }
  for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
    (*it)();
  }
  undo_.clear();
  rolled_back_ = true;
  Release();
}

void MemoryTransaction::Release() {
  if (lock_.owns_lock()) {
    repo_.owner_.store(std::thread::id{});
    lock_.unlock();
  }
}

} // namespace alo::db::memory
