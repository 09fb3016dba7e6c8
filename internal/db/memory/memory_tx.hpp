#pragma once

#include <functional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace availability::db::memory {

/*
  Transaction = snapshot + write set

  Reads see the snapshot taken at Begin() plus this transaction's own
  writes. Every write names the conflict keys it touches (a locked week,
  a day row, a blackout). Commit fails with TransactionConflict when any
  of those keys was committed by another transaction after the snapshot;
  otherwise the write set is replayed onto the committed state, so
  transactions on unrelated keys both commit. Read-only transactions
  always commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Op = std::function<void(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  // Applies op to the working snapshot now and to the committed state on Commit().
  void Apply(std::vector<std::string> keys, Op op);
  // Claims a key without writing anything under it.
  void Touch(std::string key);

  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::vector<Op>         ops_;
  std::set<std::string>   keys_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace availability::db::memory
