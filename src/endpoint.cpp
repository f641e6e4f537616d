#include "sextant/endpoint.hpp"

#include <variant>

#include "sextant/errors.hpp"
#include "sextant/log.hpp"
#include "sextant/worker.hpp"

namespace sextant {

WorkerEndpoint::WorkerEndpoint(Stage stage, const WorkerContextFactory& contexts, StageHandler handler,
                               MessageSender& orchestrator)
    : stage_(stage), contexts_(contexts), handler_(std::move(handler)), orchestrator_(orchestrator) {}

void WorkerEndpoint::handle(const Message& message) {
  const auto* request = std::get_if<JobRequest>(&message.payload);
  if (!request || request->stage != stage_) {
    stats_.messages_ignored.fetch_add(1, std::memory_order_relaxed);
    log_warn("endpoint", "ignoring unexpected message",
             {{"endpoint", to_string(stage_)}, {"type", payload_type(message.payload)},
              {"trace_id", message.header.trace_id}});
    return;
  }
  stats_.requests_received.fetch_add(1, std::memory_order_relaxed);

  LogFields fields{{"stage", to_string(stage_)},
                   {"run_id", std::to_string(request->run_id)},
                   {"job_id", std::to_string(request->job_id)},
                   {"trace_id", message.header.trace_id}};
  log_info("endpoint", "job received", fields);

  const uint64_t started = now_unix_ms();
  std::optional<Payload> outcome;
  bool skipped = false;
  {
    std::unique_ptr<WorkerContext> context;
    try {
      context = contexts_.create_context(request->run_id);
      if (is_terminal(context->run().status)) {
        const std::string status = to_string(context->run().status);
        fields["status"] = status;
        log_info("endpoint", "run already ended, skipping job", fields);
        skipped = true;
        outcome = JobError{stage_, request->run_id, request->job_id,
                           "Run " + std::to_string(request->run_id) + " is already " + status + "."};
      } else {
        JobResult result = handler_(*context, *request);
        result.stage = stage_;
        result.run_id = request->run_id;
        result.job_id = request->job_id;
        outcome = std::move(result);
      }
    } catch (const std::exception& e) {
      outcome = JobError{stage_, request->run_id, request->job_id, e.what()};
    }
    if (context) context->close();
  }
  stats_.handler_latency.record(now_unix_ms() - started);

  if (skipped) {
    stats_.jobs_skipped.fetch_add(1, std::memory_order_relaxed);
  } else if (const auto* err = std::get_if<JobError>(&*outcome)) {
    stats_.jobs_failed.fetch_add(1, std::memory_order_relaxed);
    log_error("endpoint", "job failed: " + err->message, fields);
  } else {
    stats_.jobs_succeeded.fetch_add(1, std::memory_order_relaxed);
    log_info("endpoint", "job finished", fields);
  }
  orchestrator_.send(Message{message.header, std::move(*outcome)});
}

bool WorkerEndpoint::run_once(MessageReceiver& receiver, std::chrono::milliseconds timeout) {
  return receiver.receive_one([this](const Message& m) { handle(m); }, timeout);
}

void WorkerEndpoint::serve(MessageReceiver& receiver, std::chrono::milliseconds poll_interval) {
  stop_.store(false);
  LogFields thread_fields = identity_log_fields(global_worker_identity());
  thread_fields["endpoint"] = to_string(stage_);
  set_thread_log_fields(thread_fields);

  log_info("endpoint", "serving");
  while (!stop_.load()) {
    try {
      run_once(receiver, poll_interval);
    } catch (const std::exception& e) {
      log_error("endpoint", std::string("message handling failed: ") + e.what());
    }
  }
  log_info("endpoint", "stopped", {{"stats", stats_.to_json()}});
}

}  // namespace sextant
