#pragma once

// sextant/orchestrator.hpp — Run state machine: gates and dispatches stages.
//
// STATES:
//   created --CreateRun--> active --last stage ok--> finished | finished_with_issues
//                                 --stage error----> failed
//                                 --CancelRun------> cancelled
//
// DISPATCH:
//   Requested stages run in kStageOrder. Stage N+1's request is sent only
//   while handling stage N's successful result, after that result has been
//   recorded in the run repository. There is at most one scheduled job per
//   run at any time.
//
// DISCARDED RESULTS (logged at OrchestratorOptions::late_result_log_level):
//   - the run is in a terminal state
//   - no job exists for the result's stage
//   - the job id does not match the stage's job
//   - the job is no longer scheduled (duplicate delivery)
//
// CONCURRENCY:
//   handle() may be called from several threads. Messages of the same run are
//   serialized by a per-run mutex; different runs proceed concurrently. A
//   run's mutex exists only while one of its messages is being handled.
//
// PERSISTENCE:
//   Every transition is written with a single store_run(). If that write
//   fails the run is unchanged, the exception propagates and the redelivered
//   message is applied again from the same state.

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "sextant/audit.hpp"
#include "sextant/config.hpp"
#include "sextant/log.hpp"
#include "sextant/message.hpp"
#include "sextant/observability.hpp"
#include "sextant/repositories.hpp"
#include "sextant/transport.hpp"

namespace sextant {

struct OrchestratorOptions {
  LogLevel late_result_log_level{LogLevel::warn};
  // A run with any issue at or above this severity ends finished_with_issues.
  Severity issue_severity_threshold{Severity::warning};
  unsigned threads{4};
  std::chrono::milliseconds poll_interval{200};
};

OrchestratorOptions orchestrator_options_from(const EngineConfig& config);

// One sender per stage endpoint.
using SenderTable = std::map<Endpoint, std::shared_ptr<MessageSender>>;

// Senders for every stage endpoint, configured from the environment.
SenderTable make_stage_senders(const TransportRegistry& registry);

using ReceiverFactory = std::function<std::unique_ptr<MessageReceiver>()>;

class Orchestrator {
 public:
  Orchestrator(RunRepository& runs, SenderTable senders, RunAuditLog& audit, OrchestratorOptions options = {});

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // Applies one message to its run. Store failures propagate so the
  // transport redelivers the message.
  void handle(const Message& message);

  // Receives and handles exactly one message. Returns false on timeout.
  bool run_once(MessageReceiver& receiver, std::chrono::milliseconds timeout);

  // Runs options.threads consumers, each with its own receiver, until stop().
  void serve(const ReceiverFactory& make_receiver);
  void stop() { stop_.store(true); }

  const OrchestratorStats& stats() const { return stats_; }

  // Runs with a message currently being handled.
  size_t tracked_runs() const;

 private:
  struct RunLock {
    std::mutex mu;
    unsigned users{0};
  };
  class ScopedRunLock;

  RunLock& acquire_run_lock(Id run_id);
  void release_run_lock(Id run_id);
  void apply(Run& run, const Message& message);

  void on_create(Run& run, const MessageHeader& header);
  void on_cancel(Run& run);
  void on_result(Run& run, const JobResult& result, const MessageHeader& header);
  void on_error(Run& run, const JobError& error);

  // schedule() + send_request().
  void dispatch(Run& run, Stage stage, const MessageHeader& header);
  // Adds a scheduled job for stage and persists the run, including any
  // change already applied to it in memory.
  Job schedule(Run& run, Stage stage);
  // Sends the request for a persisted job. A send failure fails the run.
  void send_request(Run& run, const Job& job, const MessageHeader& header);
  void finish(Run& run, RunStatus status, const std::string& detail);
  void set_status(Run& run, RunStatus status, const std::string& detail);
  void record_status(const Run& run, RunStatus from, RunStatus to, const std::string& detail);
  void discard(const Run& run, const std::string& payload, Stage stage, Id job_id, const std::string& reason);
  std::optional<Stage> next_stage(const Run& run, Stage after) const;

  RunRepository& runs_;
  SenderTable senders_;
  RunAuditLog& audit_;
  OrchestratorOptions options_;
  OrchestratorStats stats_;
  std::atomic<bool> stop_{false};

  mutable std::mutex locks_mu_;
  std::map<Id, RunLock> run_locks_;
};

}  // namespace sextant
