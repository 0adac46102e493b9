#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/node_run_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/run_tag_record.hpp"

namespace wfrun::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All row writes require a Transaction
  - Reads inside a transaction see its writes
  - LockRun never waits: a lock held by another transaction is reported
    as ErrorCode::LockConflict immediately
  - NextRunNumber is atomic and durable on its own, outside any caller
    transaction, and never yields the same value twice per workflow

  The DB is the source of truth for:
    run state
    node run history
    run tags
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TransactionMode mode = TransactionMode::kReadWrite) = 0;

  // ---------------------------------------------------------------------
  // Run numbering (per-workflow sequence)
  // ---------------------------------------------------------------------

  virtual Result NextRunNumber(int64_t workflow_id, int64_t& number) = 0;

  // ---------------------------------------------------------------------
  // Runs
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertRun(Transaction&, model::RunRecord& record) = 0;

  virtual Result UpdateRun(Transaction&, const model::RunRecord& record) = 0;

  // out is reset to nullopt when nothing matches.
  virtual Result FindRun(Transaction&, const RunSelector& selector, std::optional<model::RunRecord>& out) = 0;

  // Exclusive, non-blocking, held until the transaction ends.
  virtual Result LockRun(Transaction&, int64_t run_id) = 0;

  virtual Result CountRuns(Transaction&, const std::string& project_key, const std::string& workflow_name, int64_t& count) = 0;

  // Ordered by start time descending.
  virtual Result ListRuns(Transaction&, const std::string& project_key, const std::string& workflow_name, const Pagination& pagination,
                          std::vector<model::RunRecord>& out) = 0;

  // ---------------------------------------------------------------------
  // Node runs
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertNodeRun(Transaction&, model::NodeRunRecord& record) = 0;

  virtual Result UpdateNodeRun(Transaction&, const model::NodeRunRecord& record) = 0;

  // Ordered by sub number descending.
  virtual Result ListNodeRuns(Transaction&, int64_t run_id, std::vector<model::NodeRunRecord>& out) = 0;

  // ---------------------------------------------------------------------
  // Tags
  // ---------------------------------------------------------------------

  virtual Result DeleteRunTags(Transaction&, int64_t run_id) = 0;

  virtual Result InsertRunTags(Transaction&, const std::vector<model::RunTagRecord>& tags) = 0;

  virtual Result ListRunTags(Transaction&, int64_t run_id, std::vector<model::RunTagRecord>& out) = 0;

  // Distinct (tag, value) pairs over every run of a workflow; workflow_run_id is 0.
  virtual Result ListWorkflowTagValues(Transaction&, const std::string& project_key, const std::string& workflow_name,
                                       std::vector<model::RunTagRecord>& out) = 0;
};

} // namespace wfrun::db
