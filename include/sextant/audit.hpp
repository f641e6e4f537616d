#pragma once

// sextant/audit.hpp — Append-only audit log of run transitions.
//
// DESIGN INVARIANTS:
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a monotonically increasing sequence number.
//   3. STRUCTURED: every entry is a single-line JSON object (NDJSON).
//   4. FAIL-SAFE: write failures never affect the run; they only increment
//      failure_count().
//   5. CHAINED: each entry stores the BLAKE3 digest ("audit:" domain) of the
//      previous line, so truncation or edits are detected by verify_audit_chain().
//
// Entries are written for every run status change, every dispatched job and
// every discarded (late or duplicate) result.
//
// Configured by SEXTANT_AUDIT_LOG. Empty path = disabled (appends succeed
// without writing). Reopening an existing log continues its sequence and
// chain from the last line.

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace sextant {

struct AuditRecord {
  uint64_t sequence{0};
  std::string previous_digest;
  uint64_t run_id{0};
  std::string event;        // "run_status" | "job_dispatched" | "result_discarded"
  std::string from_status;  // run status before the transition, if any
  std::string to_status;
  std::string stage;
  uint64_t job_id{0};
  std::string detail;
  std::string trace_id;
  uint64_t timestamp_unix_ms{0};
  std::string worker_id;
  std::string node_id;
};

std::string audit_record_to_json(const AuditRecord& r);

class RunAuditLog {
 public:
  // Caller must ensure the directory exists.
  explicit RunAuditLog(const std::string& path = "");
  ~RunAuditLog();

  RunAuditLog(const RunAuditLog&) = delete;
  RunAuditLog& operator=(const RunAuditLog&) = delete;

  // Assigns sequence, previous_digest and timestamp in place. Never throws.
  bool append(AuditRecord& record);

  uint64_t entry_count() const;
  uint64_t failure_count() const;
  const std::string& path() const { return path_; }
  bool enabled() const { return file_ != nullptr; }

 private:
  std::string path_;
  std::FILE* file_{nullptr};
  mutable std::mutex mu_;
  uint64_t seq_{0};
  uint64_t entry_count_{0};
  uint64_t failure_count_{0};
  std::string last_digest_;
};

struct AuditChainReport {
  bool ok{false};
  uint64_t entries{0};
  std::string error;  // first violation, empty if ok
};

// Re-reads the log and recomputes every link.
AuditChainReport verify_audit_chain(const std::string& path);

}  // namespace sextant
