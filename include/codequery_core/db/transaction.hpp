#pragma once

#include <sqlite_modern_cpp.h>

namespace codequery_core {

// Rolls back on scope exit unless commit() was called.
class Transaction {
 public:
  explicit Transaction(sqlite::database &db) : db_(db), active_(true) {
    db_ << "BEGIN;";
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    if (active_) {
      db_ << "COMMIT;";
      active_ = false;
    }
  }

  ~Transaction() noexcept {
    if (active_) {
      try {
        db_ << "ROLLBACK;";
      } catch (const sqlite::sqlite_exception &) {
        // The original failure is already propagating; a failed rollback leaves the
        // archive to be rewritten on the next save.
      }
    }
  }

 private:
  sqlite::database &db_;
  bool active_;
};

}  // namespace codequery_core
