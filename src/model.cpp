#include "sextant/model.hpp"

#include <chrono>

namespace sextant {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

std::string to_string(Stage stage) {
  switch (stage) {
    case Stage::config: return "config";
    case Stage::analyzer: return "analyzer";
    case Stage::advisor: return "advisor";
    case Stage::scanner: return "scanner";
    case Stage::evaluator: return "evaluator";
    case Stage::reporter: return "reporter";
    case Stage::notifier: return "notifier";
  }
  return "config";
}

std::string stage_title(Stage stage) {
  std::string s = to_string(stage);
  s[0] = static_cast<char>(s[0] - 'a' + 'A');
  return s;
}

std::optional<Stage> parse_stage(const std::string& text) {
  for (Stage s : kStageOrder) {
    if (text == to_string(s) || text == stage_title(s)) return s;
  }
  return std::nullopt;
}

std::string to_string(RunStatus status) {
  switch (status) {
    case RunStatus::created: return "created";
    case RunStatus::active: return "active";
    case RunStatus::finished: return "finished";
    case RunStatus::failed: return "failed";
    case RunStatus::finished_with_issues: return "finished_with_issues";
    case RunStatus::cancelled: return "cancelled";
  }
  return "created";
}

std::optional<RunStatus> parse_run_status(const std::string& text) {
  if (text == "created") return RunStatus::created;
  if (text == "active") return RunStatus::active;
  if (text == "finished") return RunStatus::finished;
  if (text == "failed") return RunStatus::failed;
  if (text == "finished_with_issues") return RunStatus::finished_with_issues;
  if (text == "cancelled") return RunStatus::cancelled;
  return std::nullopt;
}

bool is_terminal(RunStatus status) {
  return status == RunStatus::finished || status == RunStatus::failed ||
         status == RunStatus::finished_with_issues || status == RunStatus::cancelled;
}

std::string to_string(JobStatus status) {
  switch (status) {
    case JobStatus::scheduled: return "scheduled";
    case JobStatus::finished: return "finished";
    case JobStatus::failed: return "failed";
    case JobStatus::cancelled: return "cancelled";
  }
  return "scheduled";
}

std::optional<JobStatus> parse_job_status(const std::string& text) {
  if (text == "scheduled") return JobStatus::scheduled;
  if (text == "finished") return JobStatus::finished;
  if (text == "failed") return JobStatus::failed;
  if (text == "cancelled") return JobStatus::cancelled;
  return std::nullopt;
}

std::string to_string(Severity severity) {
  switch (severity) {
    case Severity::hint: return "hint";
    case Severity::warning: return "warning";
    case Severity::error: return "error";
  }
  return "error";
}

std::optional<Severity> parse_severity(const std::string& text) {
  if (text == "hint") return Severity::hint;
  if (text == "warning") return Severity::warning;
  if (text == "error") return Severity::error;
  return std::nullopt;
}

std::string to_string(SecretScope scope) {
  switch (scope) {
    case SecretScope::organization: return "organization";
    case SecretScope::product: return "product";
    case SecretScope::repository: return "repository";
  }
  return "repository";
}

std::optional<SecretScope> parse_secret_scope(const std::string& text) {
  if (text == "organization") return SecretScope::organization;
  if (text == "product") return SecretScope::product;
  if (text == "repository") return SecretScope::repository;
  return std::nullopt;
}

std::string secret_path(SecretScope scope, Id scope_id, const std::string& name) {
  return to_string(scope) + "_" + std::to_string(scope_id) + "_" + name;
}

std::string to_string(CredentialsType type) {
  switch (type) {
    case CredentialsType::netrc_file: return "NETRC_FILE";
    case CredentialsType::git_credentials_file: return "GIT_CREDENTIALS_FILE";
  }
  return "NETRC_FILE";
}

std::optional<CredentialsType> parse_credentials_type(const std::string& text) {
  if (text == "NETRC_FILE" || text == "netrc_file") return CredentialsType::netrc_file;
  if (text == "GIT_CREDENTIALS_FILE" || text == "git_credentials_file") return CredentialsType::git_credentials_file;
  return std::nullopt;
}

const JobConfig* JobConfigs::get(Stage stage) const {
  auto it = stages.find(stage);
  return it == stages.end() ? nullptr : &it->second;
}

std::vector<Stage> JobConfigs::requested_stages() const {
  std::vector<Stage> out;
  for (Stage s : kStageOrder) {
    if (requested(s)) out.push_back(s);
  }
  return out;
}

uint64_t now_unix_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

// ---------------------------------------------------------------------------
// JSON codecs
// ---------------------------------------------------------------------------

namespace {

std::set<CredentialsType> credentials_from_json(const Object& o, const std::string& key,
                                                std::set<CredentialsType> def) {
  if (!jsonlite::get_array(o, key)) return def;
  std::set<CredentialsType> out;
  for (const auto& s : jsonlite::get_string_array(o, key)) {
    if (auto t = parse_credentials_type(s)) out.insert(*t);
  }
  return out;
}

Value credentials_to_json(const std::set<CredentialsType>& types) {
  Array a;
  for (auto t : types) a.emplace_back(to_string(t));
  return Value{std::move(a)};
}

// A secret reference inside a service is either a full object or a bare name
// that follows the path convention of the owning scope.
Secret secret_ref_from_json(const Object& service, const std::string& key,
                            std::optional<SecretScope> scope, Id scope_id) {
  if (const Object* nested = jsonlite::get_object(service, key)) return secret_from_json(*nested);
  Secret s;
  s.name = jsonlite::get_string(service, key);
  s.scope = scope.value_or(SecretScope::repository);
  s.scope_id = scope_id;
  s.path = scope ? secret_path(*scope, scope_id, s.name) : s.name;
  return s;
}

}  // namespace

Value to_json_value(const Issue& issue) {
  Object o;
  o["timestamp"] = Value{issue.timestamp_ms};
  o["source"] = Value{issue.source};
  o["message"] = Value{issue.message};
  o["severity"] = Value{to_string(issue.severity)};
  return Value{std::move(o)};
}

Issue issue_from_json(const Object& o) {
  Issue i;
  i.timestamp_ms = jsonlite::get_u64(o, "timestamp");
  i.source = jsonlite::get_string(o, "source");
  i.message = jsonlite::get_string(o, "message");
  i.severity = parse_severity(jsonlite::get_string(o, "severity")).value_or(Severity::error);
  return i;
}

Value to_json_value(const Secret& secret) {
  Object o;
  o["id"] = Value{secret.id};
  o["path"] = Value{secret.path};
  o["name"] = Value{secret.name};
  o["description"] = Value{secret.description};
  o["scope"] = Value{to_string(secret.scope)};
  o["scopeId"] = Value{secret.scope_id};
  return Value{std::move(o)};
}

Secret secret_from_json(const Object& o) {
  Secret s;
  s.id = jsonlite::get_u64(o, "id");
  s.name = jsonlite::get_string(o, "name");
  s.description = jsonlite::get_string(o, "description");
  s.scope = parse_secret_scope(jsonlite::get_string(o, "scope")).value_or(SecretScope::repository);
  s.scope_id = jsonlite::get_u64(o, "scopeId");
  s.path = jsonlite::get_string(o, "path", secret_path(s.scope, s.scope_id, s.name));
  return s;
}

Value to_json_value(const InfrastructureService& service) {
  Object o;
  o["name"] = Value{service.name};
  o["url"] = Value{service.url};
  o["description"] = Value{service.description};
  o["usernameSecret"] = to_json_value(service.username_secret);
  o["passwordSecret"] = to_json_value(service.password_secret);
  o["credentialsTypes"] = credentials_to_json(service.credentials_types);
  if (service.scope) {
    o["scope"] = Value{to_string(*service.scope)};
    o["scopeId"] = Value{service.scope_id};
  }
  return Value{std::move(o)};
}

InfrastructureService service_from_json(const Object& o) {
  InfrastructureService s;
  s.name = jsonlite::get_string(o, "name");
  s.url = jsonlite::get_string(o, "url");
  s.description = jsonlite::get_string(o, "description");
  s.scope = parse_secret_scope(jsonlite::get_string(o, "scope"));
  s.scope_id = jsonlite::get_u64(o, "scopeId");
  s.username_secret = secret_ref_from_json(o, "usernameSecret", s.scope, s.scope_id);
  s.password_secret = secret_ref_from_json(o, "passwordSecret", s.scope, s.scope_id);
  s.credentials_types = credentials_from_json(o, "credentialsTypes", s.credentials_types);
  return s;
}

Value to_json_value(const PluginConfigs& configs) {
  Object o;
  for (const auto& [name, pc] : configs) {
    Object entry;
    entry["options"] = Value{jsonlite::to_object(pc.options)};
    entry["secrets"] = Value{jsonlite::to_object(pc.secrets)};
    o[name] = Value{std::move(entry)};
  }
  return Value{std::move(o)};
}

PluginConfigs plugin_configs_from_json(const Object& o) {
  PluginConfigs out;
  for (const auto& [name, v] : o) {
    const auto* entry = std::get_if<Object>(&v.v);
    if (!entry) continue;
    PluginConfig pc;
    pc.options = jsonlite::get_string_map(*entry, "options");
    pc.secrets = jsonlite::get_string_map(*entry, "secrets");
    out[name] = std::move(pc);
  }
  return out;
}

Value to_json_value(const JobConfigs& configs) {
  Object o;
  for (const auto& [stage, jc] : configs.stages) {
    Object entry;
    entry["options"] = Value{jsonlite::to_object(jc.options)};
    if (!jc.plugin_config.empty()) entry["pluginConfig"] = to_json_value(jc.plugin_config);
    o[to_string(stage)] = Value{std::move(entry)};
  }
  return Value{std::move(o)};
}

JobConfigs job_configs_from_json(const Object& o) {
  JobConfigs out;
  for (const auto& [key, v] : o) {
    auto stage = parse_stage(key);
    const auto* entry = std::get_if<Object>(&v.v);
    if (!stage || !entry) continue;
    JobConfig jc;
    jc.options = jsonlite::get_string_map(*entry, "options");
    if (const Object* pc = jsonlite::get_object(*entry, "pluginConfig")) {
      jc.plugin_config = plugin_configs_from_json(*pc);
    }
    out.stages[*stage] = std::move(jc);
  }
  return out;
}

Value to_json_value(const EnvironmentConfig& config) {
  Object o;
  o["strict"] = Value{config.strict};

  Array services;
  for (const auto& s : config.infrastructure_services) {
    Object so;
    so["name"] = Value{s.name};
    so["url"] = Value{s.url};
    so["description"] = Value{s.description};
    so["usernameSecret"] = Value{s.username_secret};
    so["passwordSecret"] = Value{s.password_secret};
    so["credentialsTypes"] = credentials_to_json(s.credentials_types);
    services.emplace_back(std::move(so));
  }
  o["infrastructureServices"] = Value{std::move(services)};

  Object defs;
  for (const auto& [type, list] : config.environment_definitions) {
    Array a;
    for (const auto& props : list) a.emplace_back(jsonlite::to_object(props));
    defs[type] = Value{std::move(a)};
  }
  o["environmentDefinitions"] = Value{std::move(defs)};

  Array vars;
  for (const auto& v : config.environment_variables) {
    Object vo;
    vo["name"] = Value{v.name};
    if (v.secret_name) vo["secretName"] = Value{*v.secret_name};
    if (v.value) vo["value"] = Value{*v.value};
    vars.emplace_back(std::move(vo));
  }
  o["environmentVariables"] = Value{std::move(vars)};
  return Value{std::move(o)};
}

EnvironmentConfig environment_config_from_json(const Object& o) {
  EnvironmentConfig c;
  c.strict = jsonlite::get_bool(o, "strict", true);

  if (const Array* services = jsonlite::get_array(o, "infrastructureServices")) {
    for (const auto& item : *services) {
      const auto* so = std::get_if<Object>(&item.v);
      if (!so) continue;
      InfrastructureServiceDeclaration d;
      d.name = jsonlite::get_string(*so, "name");
      d.url = jsonlite::get_string(*so, "url");
      d.description = jsonlite::get_string(*so, "description");
      d.username_secret = jsonlite::get_string(*so, "usernameSecret");
      d.password_secret = jsonlite::get_string(*so, "passwordSecret");
      d.credentials_types = credentials_from_json(*so, "credentialsTypes", d.credentials_types);
      c.infrastructure_services.push_back(std::move(d));
    }
  }

  if (const Object* defs = jsonlite::get_object(o, "environmentDefinitions")) {
    for (const auto& [type, v] : *defs) {
      const auto* list = std::get_if<Array>(&v.v);
      if (!list) continue;
      auto& target = c.environment_definitions[type];
      for (const auto& item : *list) {
        const auto* props = std::get_if<Object>(&item.v);
        if (!props) continue;
        DefinitionProperties p;
        for (const auto& [k, pv] : *props) {
          if (const auto* s = std::get_if<std::string>(&pv.v)) p[k] = *s;
        }
        target.push_back(std::move(p));
      }
    }
  }

  if (const Array* vars = jsonlite::get_array(o, "environmentVariables")) {
    for (const auto& item : *vars) {
      const auto* vo = std::get_if<Object>(&item.v);
      if (!vo) continue;
      EnvironmentVariableDeclaration d;
      d.name = jsonlite::get_string(*vo, "name");
      if (vo->contains("secretName")) d.secret_name = jsonlite::get_string(*vo, "secretName");
      if (vo->contains("value")) d.value = jsonlite::get_string(*vo, "value");
      c.environment_variables.push_back(std::move(d));
    }
  }
  return c;
}

Value to_json_value(const Run& run) {
  Object o;
  o["id"] = Value{run.id};
  o["index"] = Value{run.index};
  o["repositoryId"] = Value{run.repository_id};
  o["revision"] = Value{run.revision};
  o["status"] = Value{to_string(run.status)};
  o["jobConfigs"] = to_json_value(run.job_configs);
  if (run.resolved_job_configs) o["resolvedJobConfigs"] = Value{*run.resolved_job_configs};
  o["labels"] = Value{jsonlite::to_object(run.labels)};

  Array issues;
  for (const auto& i : run.issues) issues.push_back(to_json_value(i));
  o["issues"] = Value{std::move(issues)};

  if (run.job_config_context) o["jobConfigContext"] = Value{*run.job_config_context};
  if (run.resolved_job_config_context) o["resolvedJobConfigContext"] = Value{*run.resolved_job_config_context};
  o["traceId"] = Value{run.trace_id};
  if (run.environment_config) o["environmentConfig"] = to_json_value(*run.environment_config);

  Object jobs;
  for (const auto& [stage, job] : run.jobs) {
    Object jo;
    jo["id"] = Value{job.id};
    jo["status"] = Value{to_string(job.status)};
    jo["createdAt"] = Value{job.created_ms};
    jo["finishedAt"] = Value{job.finished_ms};
    jobs[to_string(stage)] = Value{std::move(jo)};
  }
  o["jobs"] = Value{std::move(jobs)};
  o["createdAt"] = Value{run.created_ms};
  o["finishedAt"] = Value{run.finished_ms};
  return Value{std::move(o)};
}

Run run_from_json(const Object& o) {
  Run r;
  r.id = jsonlite::get_u64(o, "id");
  r.index = jsonlite::get_u64(o, "index");
  r.repository_id = jsonlite::get_u64(o, "repositoryId");
  r.revision = jsonlite::get_string(o, "revision");
  r.status = parse_run_status(jsonlite::get_string(o, "status")).value_or(RunStatus::created);
  if (const Object* jc = jsonlite::get_object(o, "jobConfigs")) r.job_configs = job_configs_from_json(*jc);
  if (o.contains("resolvedJobConfigs")) r.resolved_job_configs = jsonlite::get_string(o, "resolvedJobConfigs");
  r.labels = jsonlite::get_string_map(o, "labels");
  if (const Array* issues = jsonlite::get_array(o, "issues")) {
    for (const auto& item : *issues) {
      if (const auto* io = std::get_if<Object>(&item.v)) r.issues.push_back(issue_from_json(*io));
    }
  }
  if (o.contains("jobConfigContext")) r.job_config_context = jsonlite::get_string(o, "jobConfigContext");
  if (o.contains("resolvedJobConfigContext")) {
    r.resolved_job_config_context = jsonlite::get_string(o, "resolvedJobConfigContext");
  }
  r.trace_id = jsonlite::get_string(o, "traceId");
  if (const Object* ec = jsonlite::get_object(o, "environmentConfig")) {
    r.environment_config = environment_config_from_json(*ec);
  }
  if (const Object* jobs = jsonlite::get_object(o, "jobs")) {
    for (const auto& [key, v] : *jobs) {
      auto stage = parse_stage(key);
      const auto* jo = std::get_if<Object>(&v.v);
      if (!stage || !jo) continue;
      Job job;
      job.id = jsonlite::get_u64(*jo, "id");
      job.stage = *stage;
      job.status = parse_job_status(jsonlite::get_string(*jo, "status")).value_or(JobStatus::scheduled);
      job.created_ms = jsonlite::get_u64(*jo, "createdAt");
      job.finished_ms = jsonlite::get_u64(*jo, "finishedAt");
      r.jobs[*stage] = job;
    }
  }
  r.created_ms = jsonlite::get_u64(o, "createdAt");
  r.finished_ms = jsonlite::get_u64(o, "finishedAt");
  return r;
}

}  // namespace sextant
