#include "memory_tx.hpp"

#include <utility>

namespace availability::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Apply(std::vector<std::string> keys, Op op) {
  op(working_);
  ops_.push_back(std::move(op));
  for (auto& key : keys) {
    keys_.insert(std::move(key));
  }
}

void MemoryTransaction::Touch(std::string key) {
  keys_.insert(std::move(key));
}

void MemoryTransaction::Commit() {
  if (ops_.empty()) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  for (const auto& key : keys_) {
    auto it = repo_.key_versions_.find(key);
    if (it != repo_.key_versions_.end() && it->second > snapshot_version_) {
      throw TransactionConflict("transaction conflict: " + key + " was modified by a concurrent transaction");
    }
  }

  for (const auto& op : ops_) {
    op(repo_.committed_);
  }
  const auto version = ++repo_.committed_version_;
  for (const auto& key : keys_) {
    repo_.key_versions_[key] = version;
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  ops_.clear();
  rolled_back_ = true;
}

} // namespace availability::db::memory
