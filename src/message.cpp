#include "sextant/message.hpp"

#include "sextant/errors.hpp"
#include "sextant/version.hpp"

namespace sextant {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

Endpoint endpoint_for(Stage stage) {
  switch (stage) {
    case Stage::config: return Endpoint::config;
    case Stage::analyzer: return Endpoint::analyzer;
    case Stage::advisor: return Endpoint::advisor;
    case Stage::scanner: return Endpoint::scanner;
    case Stage::evaluator: return Endpoint::evaluator;
    case Stage::reporter: return Endpoint::reporter;
    case Stage::notifier: return Endpoint::notifier;
  }
  return Endpoint::orchestrator;
}

std::optional<Stage> stage_for(Endpoint endpoint) {
  switch (endpoint) {
    case Endpoint::orchestrator: return std::nullopt;
    case Endpoint::config: return Stage::config;
    case Endpoint::analyzer: return Stage::analyzer;
    case Endpoint::advisor: return Stage::advisor;
    case Endpoint::scanner: return Stage::scanner;
    case Endpoint::evaluator: return Stage::evaluator;
    case Endpoint::reporter: return Stage::reporter;
    case Endpoint::notifier: return Stage::notifier;
  }
  return std::nullopt;
}

std::string to_string(Endpoint endpoint) {
  if (auto stage = stage_for(endpoint)) return to_string(*stage);
  return "orchestrator";
}

std::optional<Endpoint> parse_endpoint(const std::string& text) {
  if (text == "orchestrator") return Endpoint::orchestrator;
  if (auto stage = parse_stage(text)) return endpoint_for(*stage);
  return std::nullopt;
}

std::string config_prefix(Endpoint endpoint) {
  std::string s = to_string(endpoint);
  for (auto& c : s) c = static_cast<char>(c - 'a' + 'A');
  return s;
}

// ---------------------------------------------------------------------------
// Payload helpers
// ---------------------------------------------------------------------------

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

Object job_fields(Stage stage, Id run_id, Id job_id, const char* suffix) {
  Object o;
  o["type"] = Value{stage_title(stage) + suffix};
  o["runId"] = Value{run_id};
  o["jobId"] = Value{job_id};
  return o;
}

[[noreturn]] void codec_error(const std::string& message) {
  throw TransportError("envelope decode failed: " + message, ErrorCode::codec_failed);
}

// Splits "AnalyzerRequest" into (analyzer, "Request").
bool split_job_type(const std::string& type, Stage& stage, std::string& kind) {
  for (const char* suffix : {"Request", "Result", "Error"}) {
    const std::string sfx(suffix);
    if (type.size() > sfx.size() && type.compare(type.size() - sfx.size(), sfx.size(), sfx) == 0) {
      auto parsed = parse_stage(type.substr(0, type.size() - sfx.size()));
      if (!parsed) return false;
      stage = *parsed;
      kind = sfx;
      return true;
    }
  }
  return false;
}

}  // namespace

std::string payload_type(const Payload& payload) {
  return std::visit(overloaded{
      [](const CreateRun&) { return std::string("CreateRun"); },
      [](const CancelRun&) { return std::string("CancelRun"); },
      [](const JobRequest& p) { return stage_title(p.stage) + "Request"; },
      [](const JobResult& p) { return stage_title(p.stage) + "Result"; },
      [](const JobError& p) { return stage_title(p.stage) + "Error"; },
  }, payload);
}

Id payload_run_id(const Payload& payload) {
  return std::visit([](const auto& p) { return p.run_id; }, payload);
}

std::string encode(const Message& message) {
  Object payload = std::visit(overloaded{
      [](const CreateRun& p) {
        Object o;
        o["type"] = Value{"CreateRun"};
        o["runId"] = Value{p.run_id};
        return o;
      },
      [](const CancelRun& p) {
        Object o;
        o["type"] = Value{"CancelRun"};
        o["runId"] = Value{p.run_id};
        return o;
      },
      [](const JobRequest& p) { return job_fields(p.stage, p.run_id, p.job_id, "Request"); },
      [](const JobResult& p) {
        Object o = job_fields(p.stage, p.run_id, p.job_id, "Result");
        Array issues;
        for (const auto& i : p.issues) issues.push_back(to_json_value(i));
        o["issues"] = Value{std::move(issues)};
        if (p.resolved_job_configs) o["resolvedJobConfigs"] = Value{*p.resolved_job_configs};
        if (p.resolved_job_config_context) o["resolvedJobConfigContext"] = Value{*p.resolved_job_config_context};
        return o;
      },
      [](const JobError& p) {
        Object o = job_fields(p.stage, p.run_id, p.job_id, "Error");
        o["message"] = Value{p.message};
        return o;
      },
  }, message.payload);

  Object header;
  header["token"] = Value{message.header.token};
  header["traceId"] = Value{message.header.trace_id};

  Object env;
  env["v"] = Value{static_cast<std::uint64_t>(version::ENVELOPE_FORMAT_VERSION)};
  env["header"] = Value{std::move(header)};
  env["payload"] = Value{std::move(payload)};
  return jsonlite::to_json(Value{std::move(env)});
}

Message decode(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  Object env = jsonlite::parse(text, &err);
  if (err) codec_error(err->message);

  const auto v = jsonlite::get_u64(env, "v", 0);
  if (v == 0) codec_error("missing envelope version");
  if (v > version::ENVELOPE_FORMAT_VERSION) {
    codec_error("unsupported envelope version " + std::to_string(v));
  }

  const Object* header = jsonlite::get_object(env, "header");
  const Object* payload = jsonlite::get_object(env, "payload");
  if (!header) codec_error("missing header");
  if (!payload) codec_error("missing payload");

  Message m;
  m.header.token = jsonlite::get_string(*header, "token");
  m.header.trace_id = jsonlite::get_string(*header, "traceId");

  const std::string type = jsonlite::get_string(*payload, "type");
  const Id run_id = jsonlite::get_u64(*payload, "runId");
  const Id job_id = jsonlite::get_u64(*payload, "jobId");

  if (type == "CreateRun") {
    m.payload = CreateRun{run_id};
    return m;
  }
  if (type == "CancelRun") {
    m.payload = CancelRun{run_id};
    return m;
  }

  Stage stage{};
  std::string kind;
  if (!split_job_type(type, stage, kind)) codec_error("unknown payload type '" + type + "'");

  if (kind == "Request") {
    m.payload = JobRequest{stage, run_id, job_id};
  } else if (kind == "Result") {
    JobResult r;
    r.stage = stage;
    r.run_id = run_id;
    r.job_id = job_id;
    if (const Array* issues = jsonlite::get_array(*payload, "issues")) {
      for (const auto& item : *issues) {
        if (const auto* io = std::get_if<Object>(&item.v)) r.issues.push_back(issue_from_json(*io));
      }
    }
    if (payload->contains("resolvedJobConfigs")) {
      r.resolved_job_configs = jsonlite::get_string(*payload, "resolvedJobConfigs");
    }
    if (payload->contains("resolvedJobConfigContext")) {
      r.resolved_job_config_context = jsonlite::get_string(*payload, "resolvedJobConfigContext");
    }
    m.payload = std::move(r);
  } else {
    m.payload = JobError{stage, run_id, job_id, jsonlite::get_string(*payload, "message")};
  }
  return m;
}

}  // namespace sextant
