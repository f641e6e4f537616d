#include "sextant/orchestrator.hpp"

#include <algorithm>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

#include "sextant/errors.hpp"
#include "sextant/hash.hpp"
#include "sextant/worker.hpp"

namespace sextant {

namespace {

LogFields run_fields(const Run& run) {
  return {{"run_id", std::to_string(run.id)}, {"trace_id", run.trace_id}};
}

}  // namespace

OrchestratorOptions orchestrator_options_from(const EngineConfig& config) {
  OrchestratorOptions o;
  o.late_result_log_level = config.late_result_log_level;
  o.issue_severity_threshold = config.issue_severity_threshold;
  o.threads = std::max(1u, config.orchestrator_threads);
  return o;
}

SenderTable make_stage_senders(const TransportRegistry& registry) {
  SenderTable out;
  for (Stage stage : kStageOrder) {
    const Endpoint ep = endpoint_for(stage);
    out.emplace(ep, registry.create_sender(ep, transport_config_from_env(ep)));
  }
  return out;
}

Orchestrator::Orchestrator(RunRepository& runs, SenderTable senders, RunAuditLog& audit,
                           OrchestratorOptions options)
    : runs_(runs), senders_(std::move(senders)), audit_(audit), options_(options) {}

// Holds a run's mutex for one message; the last holder drops the entry.
class Orchestrator::ScopedRunLock {
 public:
  ScopedRunLock(Orchestrator& owner, Id run_id)
      : owner_(owner), run_id_(run_id), lock_(owner.acquire_run_lock(run_id).mu) {}
  ~ScopedRunLock() {
    lock_.unlock();
    owner_.release_run_lock(run_id_);
  }

  ScopedRunLock(const ScopedRunLock&) = delete;
  ScopedRunLock& operator=(const ScopedRunLock&) = delete;

 private:
  Orchestrator& owner_;
  Id run_id_;
  std::unique_lock<std::mutex> lock_;
};

Orchestrator::RunLock& Orchestrator::acquire_run_lock(Id run_id) {
  std::lock_guard<std::mutex> lk(locks_mu_);
  RunLock& entry = run_locks_[run_id];
  ++entry.users;
  return entry;
}

void Orchestrator::release_run_lock(Id run_id) {
  std::lock_guard<std::mutex> lk(locks_mu_);
  auto it = run_locks_.find(run_id);
  if (it != run_locks_.end() && --it->second.users == 0) run_locks_.erase(it);
}

size_t Orchestrator::tracked_runs() const {
  std::lock_guard<std::mutex> lk(locks_mu_);
  return run_locks_.size();
}

// ---------------------------------------------------------------------------
// Message handling
// ---------------------------------------------------------------------------

void Orchestrator::handle(const Message& message) {
  stats_.messages_handled.fetch_add(1, std::memory_order_relaxed);
  const Id run_id = payload_run_id(message.payload);
  ScopedRunLock guard(*this, run_id);

  auto run = runs_.get_run(run_id);
  if (!run) {
    log_error("orchestrator", "message for unknown run dropped",
              {{"run_id", std::to_string(run_id)}, {"type", payload_type(message.payload)}});
    return;
  }
  apply(*run, message);
}

void Orchestrator::apply(Run& run, const Message& message) {
  std::visit(
      [&](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, CreateRun>) {
          on_create(run, message.header);
        } else if constexpr (std::is_same_v<T, CancelRun>) {
          on_cancel(run);
        } else if constexpr (std::is_same_v<T, JobResult>) {
          on_result(run, p, message.header);
        } else if constexpr (std::is_same_v<T, JobError>) {
          on_error(run, p);
        } else {
          log_warn("orchestrator", "unexpected request payload at orchestrator endpoint",
                   {{"type", payload_type(message.payload)}, {"run_id", std::to_string(run.id)}});
        }
      },
      message.payload);
}

void Orchestrator::on_create(Run& run, const MessageHeader& header) {
  if (run.status != RunStatus::created) {
    discard(run, "CreateRun", Stage::config, 0, "run already started (" + to_string(run.status) + ")");
    return;
  }
  if (run.trace_id.empty()) run.trace_id = header.trace_id.empty() ? unique_token(32) : header.trace_id;

  // The active status is written together with the first job or the final
  // status; a failed write leaves the run created for the redelivery.
  run.status = RunStatus::active;
  const auto stages = run.job_configs.requested_stages();
  if (stages.empty()) {
    run.finished_ms = now_unix_ms();
    run.status = RunStatus::finished;
    runs_.store_run(run);
    stats_.runs_started.fetch_add(1, std::memory_order_relaxed);
    record_status(run, RunStatus::created, RunStatus::active, "run created");
    record_status(run, RunStatus::active, RunStatus::finished, "no stages requested");
    log_info("orchestrator", "run finished, no stages requested", run_fields(run));
    return;
  }

  const Job job = schedule(run, stages.front());
  stats_.runs_started.fetch_add(1, std::memory_order_relaxed);
  record_status(run, RunStatus::created, RunStatus::active, "run created");
  log_info("orchestrator", "run started", run_fields(run));
  send_request(run, job, header);
}

void Orchestrator::on_cancel(Run& run) {
  if (is_terminal(run.status)) {
    discard(run, "CancelRun", Stage::config, 0, "run already " + to_string(run.status));
    return;
  }
  for (auto& [stage, job] : run.jobs) {
    if (job.status == JobStatus::scheduled) {
      job.status = JobStatus::cancelled;
      job.finished_ms = now_unix_ms();
    }
  }
  stats_.runs_cancelled.fetch_add(1, std::memory_order_relaxed);
  finish(run, RunStatus::cancelled, "cancelled");
}

void Orchestrator::on_result(Run& run, const JobResult& result, const MessageHeader& header) {
  const std::string payload = stage_title(result.stage) + "Result";
  if (is_terminal(run.status)) {
    discard(run, payload, result.stage, result.job_id, "run already " + to_string(run.status));
    return;
  }
  auto it = run.jobs.find(result.stage);
  if (it == run.jobs.end()) {
    discard(run, payload, result.stage, result.job_id, "no job scheduled for stage");
    return;
  }
  Job& job = it->second;
  if (job.id != result.job_id) {
    discard(run, payload, result.stage, result.job_id,
            "job id mismatch, current job is " + std::to_string(job.id));
    return;
  }
  if (job.status != JobStatus::scheduled) {
    discard(run, payload, result.stage, result.job_id, "job already " + to_string(job.status));
    return;
  }

  job.status = JobStatus::finished;
  job.finished_ms = now_unix_ms();
  stats_.results_processed.fetch_add(1, std::memory_order_relaxed);
  if (job.finished_ms >= job.created_ms) stats_.job_latency.record(job.finished_ms - job.created_ms);

  run.issues.insert(run.issues.end(), result.issues.begin(), result.issues.end());
  if (result.resolved_job_configs) run.resolved_job_configs = result.resolved_job_configs;
  if (result.resolved_job_config_context) run.resolved_job_config_context = result.resolved_job_config_context;

  auto fields = run_fields(run);
  fields["stage"] = to_string(result.stage);
  fields["issues"] = std::to_string(result.issues.size());
  log_info("orchestrator", "stage finished", fields);

  if (auto next = next_stage(run, result.stage)) {
    dispatch(run, *next, header);
    return;
  }

  const bool has_issues = std::any_of(run.issues.begin(), run.issues.end(), [&](const Issue& i) {
    return static_cast<int>(i.severity) >= static_cast<int>(options_.issue_severity_threshold);
  });
  if (has_issues) {
    stats_.runs_finished_with_issues.fetch_add(1, std::memory_order_relaxed);
    finish(run, RunStatus::finished_with_issues, "last stage finished with issues");
  } else {
    stats_.runs_finished.fetch_add(1, std::memory_order_relaxed);
    finish(run, RunStatus::finished, "last stage finished");
  }
}

void Orchestrator::on_error(Run& run, const JobError& error) {
  const std::string payload = stage_title(error.stage) + "Error";
  if (is_terminal(run.status)) {
    discard(run, payload, error.stage, error.job_id, "run already " + to_string(run.status));
    return;
  }
  auto it = run.jobs.find(error.stage);
  if (it == run.jobs.end() || it->second.id != error.job_id || it->second.status != JobStatus::scheduled) {
    discard(run, payload, error.stage, error.job_id, "error does not match the scheduled job");
    return;
  }

  it->second.status = JobStatus::failed;
  it->second.finished_ms = now_unix_ms();
  stats_.results_processed.fetch_add(1, std::memory_order_relaxed);
  run.issues.push_back(Issue{now_unix_ms(), to_string(error.stage), error.message, Severity::error});

  auto fields = run_fields(run);
  fields["stage"] = to_string(error.stage);
  log_error("orchestrator", "stage failed: " + error.message, fields);

  stats_.runs_failed.fetch_add(1, std::memory_order_relaxed);
  finish(run, RunStatus::failed, stage_title(error.stage) + " failed: " + error.message);
}

// ---------------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------------

void Orchestrator::dispatch(Run& run, Stage stage, const MessageHeader& header) {
  const Job job = schedule(run, stage);
  send_request(run, job, header);
}

Job Orchestrator::schedule(Run& run, Stage stage) {
  Job job;
  job.id = runs_.allocate_job_id();
  job.stage = stage;
  job.status = JobStatus::scheduled;
  job.created_ms = now_unix_ms();
  run.jobs[stage] = job;
  runs_.store_run(run);
  return job;
}

void Orchestrator::send_request(Run& run, const Job& job, const MessageHeader& header) {
  const Stage stage = job.stage;
  const WorkerIdentity& self = global_worker_identity();
  AuditRecord rec;
  rec.run_id = run.id;
  rec.event = "job_dispatched";
  rec.to_status = to_string(JobStatus::scheduled);
  rec.stage = to_string(stage);
  rec.job_id = job.id;
  rec.trace_id = run.trace_id;
  rec.worker_id = self.worker_id;
  rec.node_id = self.node_id;
  audit_.append(rec);

  auto fields = run_fields(run);
  fields["stage"] = to_string(stage);
  fields["job_id"] = std::to_string(job.id);

  auto sender = senders_.find(endpoint_for(stage));
  if (sender == senders_.end() || !sender->second) {
    log_error("orchestrator", "no sender configured for stage endpoint", fields);
    run.jobs[stage].status = JobStatus::failed;
    run.issues.push_back(Issue{now_unix_ms(), "orchestrator",
                               "No transport configured for endpoint '" + to_string(endpoint_for(stage)) + "'.",
                               Severity::error});
    stats_.runs_failed.fetch_add(1, std::memory_order_relaxed);
    finish(run, RunStatus::failed, "dispatch failed");
    return;
  }

  Message request;
  request.header = MessageHeader{header.token, run.trace_id};
  request.payload = JobRequest{stage, run.id, job.id};
  try {
    sender->second->send(request);
  } catch (const TransportError& e) {
    stats_.send_failures.fetch_add(1, std::memory_order_relaxed);
    log_error("orchestrator", std::string("dispatch failed: ") + e.what(), fields);
    run.jobs[stage].status = JobStatus::failed;
    run.issues.push_back(Issue{now_unix_ms(), "orchestrator", e.what(), Severity::error});
    stats_.runs_failed.fetch_add(1, std::memory_order_relaxed);
    finish(run, RunStatus::failed, "dispatch failed");
    return;
  }
  stats_.jobs_dispatched.fetch_add(1, std::memory_order_relaxed);
  log_info("orchestrator", "job dispatched", fields);
}

void Orchestrator::finish(Run& run, RunStatus status, const std::string& detail) {
  run.finished_ms = now_unix_ms();
  set_status(run, status, detail);
  auto fields = run_fields(run);
  fields["status"] = to_string(status);
  log_info("orchestrator", "run " + to_string(status), fields);
}

void Orchestrator::set_status(Run& run, RunStatus status, const std::string& detail) {
  const RunStatus from = run.status;
  run.status = status;
  runs_.store_run(run);
  record_status(run, from, status, detail);
}

void Orchestrator::record_status(const Run& run, RunStatus from, RunStatus to, const std::string& detail) {
  const WorkerIdentity& self = global_worker_identity();
  AuditRecord rec;
  rec.run_id = run.id;
  rec.event = "run_status";
  rec.from_status = to_string(from);
  rec.to_status = to_string(to);
  rec.detail = detail;
  rec.trace_id = run.trace_id;
  rec.worker_id = self.worker_id;
  rec.node_id = self.node_id;
  if (!audit_.append(rec)) log_warn("orchestrator", "audit append failed", run_fields(run));
}

void Orchestrator::discard(const Run& run, const std::string& payload, Stage stage, Id job_id,
                           const std::string& reason) {
  stats_.results_discarded.fetch_add(1, std::memory_order_relaxed);
  auto fields = run_fields(run);
  fields["payload"] = payload;
  fields["job_id"] = std::to_string(job_id);
  fields["reason"] = reason;
  log(options_.late_result_log_level, "orchestrator", "discarding late or duplicate message", fields);

  const WorkerIdentity& self = global_worker_identity();
  AuditRecord rec;
  rec.run_id = run.id;
  rec.event = "result_discarded";
  rec.to_status = to_string(run.status);
  rec.stage = to_string(stage);
  rec.job_id = job_id;
  rec.detail = payload + ": " + reason;
  rec.trace_id = run.trace_id;
  rec.worker_id = self.worker_id;
  rec.node_id = self.node_id;
  audit_.append(rec);
}

std::optional<Stage> Orchestrator::next_stage(const Run& run, Stage after) const {
  bool seen = false;
  for (Stage s : kStageOrder) {
    if (seen && run.job_configs.requested(s)) return s;
    if (s == after) seen = true;
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Receive loops
// ---------------------------------------------------------------------------

bool Orchestrator::run_once(MessageReceiver& receiver, std::chrono::milliseconds timeout) {
  return receiver.receive_one([this](const Message& m) { handle(m); }, timeout);
}

void Orchestrator::serve(const ReceiverFactory& make_receiver) {
  stop_.store(false);
  const LogFields identity = identity_log_fields(global_worker_identity());
  const unsigned n = std::max(1u, options_.threads);
  log_info("orchestrator", "serving", {{"threads", std::to_string(n)}});

  std::vector<std::thread> workers;
  workers.reserve(n);
  for (unsigned i = 0; i < n; ++i) {
    workers.emplace_back([&, i]() {
      LogFields fields = identity;
      fields["thread"] = std::to_string(i);
      set_thread_log_fields(fields);

      std::unique_ptr<MessageReceiver> receiver;
      try {
        receiver = make_receiver();
      } catch (const Error& e) {
        log_error("orchestrator", std::string("cannot create receiver: ") + e.what());
        stop();
        return;
      }
      while (!stop_.load()) {
        try {
          run_once(*receiver, options_.poll_interval);
        } catch (const std::exception& e) {
          // The transport has already returned the message for redelivery.
          log_error("orchestrator", std::string("message handling failed: ") + e.what());
        }
      }
    });
  }
  for (auto& t : workers) t.join();
  log_info("orchestrator", "stopped", {{"stats", stats_.to_json()}});
}

}  // namespace sextant
