#pragma once

// sextant/endpoint.hpp — Worker endpoint loop: request -> context -> handler -> result.
//
// PER MESSAGE:
//   1. Accept only a JobRequest for this endpoint's stage; anything else is
//      logged and acknowledged.
//   2. Create a WorkerContext for the run. A run that was cancelled or has
//      otherwise ended is skipped without running the handler and answered
//      with <Stage>Error "Run <id> is already <status>.", so every request
//      gets exactly one reply.
//   3. Invoke the stage handler.
//   4. Send <Stage>Result, or <Stage>Error carrying the exception message,
//      to the orchestrator endpoint. The request header (token, trace id) is
//      echoed unchanged.
//   5. Close the context on every path.
//
// A failure to send the result propagates to the transport, which returns
// the request to the queue (at-least-once).

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>

#include "sextant/message.hpp"
#include "sextant/observability.hpp"
#include "sextant/transport.hpp"
#include "sextant/worker_context.hpp"

namespace sextant {

// Issues and resolved configuration produced by a stage. Stage, run and job
// ids are filled in by the endpoint.
using StageHandler = std::function<JobResult(WorkerContext&, const JobRequest&)>;

class StageHandlers {
 public:
  StageHandlers() = default;
  explicit StageHandlers(std::map<Stage, StageHandler> handlers) : handlers_(std::move(handlers)) {}

  // nullptr if the stage has no handler.
  const StageHandler* find(Stage stage) const {
    auto it = handlers_.find(stage);
    return it == handlers_.end() ? nullptr : &it->second;
  }

 private:
  std::map<Stage, StageHandler> handlers_;
};

class WorkerEndpoint {
 public:
  WorkerEndpoint(Stage stage, const WorkerContextFactory& contexts, StageHandler handler,
                 MessageSender& orchestrator);

  void handle(const Message& message);

  // Returns false if nothing arrived within timeout.
  bool run_once(MessageReceiver& receiver, std::chrono::milliseconds timeout);

  // Loops until stop(). Handling errors are logged; the message has already
  // been returned to the queue by the transport.
  void serve(MessageReceiver& receiver, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));
  void stop() { stop_.store(true); }

  Stage stage() const { return stage_; }
  const EndpointStats& stats() const { return stats_; }

 private:
  Stage stage_;
  const WorkerContextFactory& contexts_;
  StageHandler handler_;
  MessageSender& orchestrator_;
  EndpointStats stats_;
  std::atomic<bool> stop_{false};
};

}  // namespace sextant
