#include "sextant/audit.hpp"

#include <fstream>
#include <optional>
#include <sstream>

#include "sextant/hash.hpp"
#include "sextant/jsonlite.hpp"
#include "sextant/log.hpp"
#include "sextant/model.hpp"
#include "sextant/version.hpp"

namespace sextant {

namespace {

const std::string kGenesisDigest(64, '0');

}  // namespace

std::string audit_record_to_json(const AuditRecord& r) {
  std::ostringstream o;
  o << "{"
    << "\"seq\":" << r.sequence
    << ",\"prev\":\"" << r.previous_digest << "\""
    << ",\"v\":" << version::AUDIT_LOG_VERSION
    << ",\"run_id\":" << r.run_id
    << ",\"event\":\"" << jsonlite::escape(r.event) << "\""
    << ",\"from\":\"" << jsonlite::escape(r.from_status) << "\""
    << ",\"to\":\"" << jsonlite::escape(r.to_status) << "\""
    << ",\"stage\":\"" << jsonlite::escape(r.stage) << "\""
    << ",\"job_id\":" << r.job_id
    << ",\"detail\":\"" << jsonlite::escape(r.detail) << "\""
    << ",\"trace_id\":\"" << jsonlite::escape(r.trace_id) << "\""
    << ",\"timestamp_unix_ms\":" << r.timestamp_unix_ms
    << ",\"worker_id\":\"" << jsonlite::escape(r.worker_id) << "\""
    << ",\"node_id\":\"" << jsonlite::escape(r.node_id) << "\""
    << "}";
  return o.str();
}

RunAuditLog::RunAuditLog(const std::string& path) : path_(path), last_digest_(kGenesisDigest) {
  if (path_.empty()) return;

  // Continue an existing chain.
  {
    std::ifstream in(path_);
    std::string line, last;
    while (std::getline(in, line)) {
      if (!line.empty()) last = line;
    }
    if (!last.empty()) {
      std::optional<jsonlite::JsonError> err;
      const auto obj = jsonlite::parse(last, &err);
      if (!err) {
        seq_ = jsonlite::get_u64(obj, "seq");
        last_digest_ = audit_chain_digest(last);
      } else {
        log_warn("audit", "last audit line is unreadable, starting a new chain", {{"path", path_}});
      }
    }
  }

  file_ = std::fopen(path_.c_str(), "a");
  if (!file_) log_warn("audit", "cannot open audit log", {{"path", path_}});
}

RunAuditLog::~RunAuditLog() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool RunAuditLog::append(AuditRecord& record) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!file_) return true;

  std::fseek(file_, 0, SEEK_END);
  const long pre_write_pos = std::ftell(file_);
  if (pre_write_pos < 0) {
    ++failure_count_;
    return false;
  }

  record.sequence = ++seq_;
  record.previous_digest = last_digest_;
  record.timestamp_unix_ms = now_unix_ms();

  const std::string line = audit_record_to_json(record);
  const std::string final_line = line + "\n";
  const bool written = std::fwrite(final_line.data(), 1, final_line.size(), file_) == final_line.size();
  std::fflush(file_);

  if (!written) {
    ++failure_count_;
    return false;
  }
  const long post_write_pos = std::ftell(file_);
  if (post_write_pos >= 0 && post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
    ++failure_count_;
    return false;
  }
  last_digest_ = audit_chain_digest(line);
  ++entry_count_;
  return true;
}

uint64_t RunAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entry_count_;
}

uint64_t RunAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return failure_count_;
}

AuditChainReport verify_audit_chain(const std::string& path) {
  AuditChainReport report;
  std::ifstream in(path);
  if (!in) {
    report.error = "cannot open " + path;
    return report;
  }

  std::string expected_prev = kGenesisDigest;
  uint64_t expected_seq = 1;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(line, &err);
    if (err) {
      report.error = "entry " + std::to_string(expected_seq) + " is not valid JSON: " + err->message;
      return report;
    }
    if (jsonlite::get_u64(obj, "seq") != expected_seq) {
      report.error = "sequence gap at entry " + std::to_string(expected_seq);
      return report;
    }
    if (jsonlite::get_string(obj, "prev") != expected_prev) {
      report.error = "chain broken at entry " + std::to_string(expected_seq);
      return report;
    }
    expected_prev = audit_chain_digest(line);
    ++expected_seq;
    ++report.entries;
  }
  report.ok = true;
  return report;
}

}  // namespace sextant
