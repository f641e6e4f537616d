#pragma once

// sextant/message.hpp — Message envelope: header + typed payload, and its wire codec.
//
// WIRE FORMAT (envelope format version 1):
//   {"v":1,
//    "header":{"token":"...","traceId":"..."},
//    "payload":{"type":"AnalyzerRequest","runId":7,"jobId":12}}
//
// Payload type tags:
//   CreateRun, CancelRun                       orchestrator triggers
//   <Stage>Request                             orchestrator -> stage worker
//   <Stage>Result, <Stage>Error                stage worker -> orchestrator
// so every (stage, request|result) pair has its own tag on the wire. In
// memory the stage is a field, which keeps the variant small.
//
// INVARIANTS:
//   - decode() rejects unknown payload tags and envelope versions newer than
//     ENVELOPE_FORMAT_VERSION with TransportError(codec_failed).
//   - The header is opaque to the codec: token and traceId round-trip verbatim.

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "sextant/model.hpp"

namespace sextant {

// ---------------------------------------------------------------------------
// Endpoints
// ---------------------------------------------------------------------------
enum class Endpoint { orchestrator, config, analyzer, advisor, scanner, evaluator, reporter, notifier };

Endpoint endpoint_for(Stage stage);
std::optional<Stage> stage_for(Endpoint endpoint);
std::string to_string(Endpoint endpoint);
std::optional<Endpoint> parse_endpoint(const std::string& text);
// Environment variable prefix for transport settings: "ANALYZER".
std::string config_prefix(Endpoint endpoint);

// ---------------------------------------------------------------------------
// Payloads
// ---------------------------------------------------------------------------
struct MessageHeader {
  std::string token;
  std::string trace_id;

  bool operator==(const MessageHeader&) const = default;
};

struct CreateRun {
  Id run_id{0};
};

struct CancelRun {
  Id run_id{0};
};

struct JobRequest {
  Stage stage{Stage::config};
  Id run_id{0};
  Id job_id{0};
};

struct JobResult {
  Stage stage{Stage::config};
  Id run_id{0};
  Id job_id{0};
  std::vector<Issue> issues;
  // Only produced by the config stage.
  std::optional<std::string> resolved_job_configs;
  std::optional<std::string> resolved_job_config_context;
};

struct JobError {
  Stage stage{Stage::config};
  Id run_id{0};
  Id job_id{0};
  std::string message;
};

using Payload = std::variant<CreateRun, CancelRun, JobRequest, JobResult, JobError>;

struct Message {
  MessageHeader header;
  Payload payload;
};

std::string payload_type(const Payload& payload);
Id payload_run_id(const Payload& payload);

std::string encode(const Message& message);
Message decode(const std::string& text);

}  // namespace sextant
