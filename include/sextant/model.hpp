#pragma once

// sextant/model.hpp — Domain model: runs, stages, hierarchy, secrets, services.
//
// DESIGN:
//   Plain value types. Ownership is by value everywhere; repositories hand out
//   copies so a worker never observes a concurrent mutation of a Run.
//
// INVARIANTS:
//   - Stage order is fixed (kStageOrder). Only stages present in a run's
//     JobConfigs are executed, always in that order.
//   - Secret values never appear in these types. A Secret is a reference
//     (path) into the secret store.
//   - Hierarchy is immutable once loaded for a run.

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "sextant/jsonlite.hpp"

namespace sextant {

using Id = std::uint64_t;

// ---------------------------------------------------------------------------
// Stages
// ---------------------------------------------------------------------------
enum class Stage { config, analyzer, advisor, scanner, evaluator, reporter, notifier };

inline constexpr std::array<Stage, 7> kStageOrder{
    Stage::config,    Stage::analyzer, Stage::advisor,  Stage::scanner,
    Stage::evaluator, Stage::reporter, Stage::notifier,
};

// Lower-case endpoint/queue name: "analyzer".
std::string to_string(Stage stage);
// Capitalized name used in payload type tags: "Analyzer".
std::string stage_title(Stage stage);
std::optional<Stage> parse_stage(const std::string& text);

// ---------------------------------------------------------------------------
// Status enums
// ---------------------------------------------------------------------------
enum class RunStatus { created, active, finished, failed, finished_with_issues, cancelled };

std::string to_string(RunStatus status);
std::optional<RunStatus> parse_run_status(const std::string& text);
bool is_terminal(RunStatus status);

enum class JobStatus { scheduled, finished, failed, cancelled };

std::string to_string(JobStatus status);
std::optional<JobStatus> parse_job_status(const std::string& text);

enum class Severity { hint = 0, warning = 1, error = 2 };

std::string to_string(Severity severity);
std::optional<Severity> parse_severity(const std::string& text);

struct Issue {
  uint64_t timestamp_ms{0};
  std::string source;
  std::string message;
  Severity severity{Severity::error};

  bool operator==(const Issue&) const = default;
};

// ---------------------------------------------------------------------------
// Hierarchy, secrets, services
// ---------------------------------------------------------------------------
struct Hierarchy {
  Id organization_id{0};
  Id product_id{0};
  Id repository_id{0};

  bool operator==(const Hierarchy&) const = default;
};

enum class SecretScope { organization, product, repository };

std::string to_string(SecretScope scope);
std::optional<SecretScope> parse_secret_scope(const std::string& text);

// Storage location for a newly created secret: "{scope}_{scopeId}_{name}".
std::string secret_path(SecretScope scope, Id scope_id, const std::string& name);

struct Secret {
  Id id{0};
  std::string path;
  std::string name;
  std::string description;
  SecretScope scope{SecretScope::repository};
  Id scope_id{0};

  bool operator==(const Secret&) const = default;
};

enum class CredentialsType { netrc_file, git_credentials_file };

std::string to_string(CredentialsType type);
std::optional<CredentialsType> parse_credentials_type(const std::string& text);

struct InfrastructureService {
  std::string name;
  std::string url;
  std::string description;
  Secret username_secret;
  Secret password_secret;
  std::set<CredentialsType> credentials_types{CredentialsType::netrc_file};
  // Unset for services declared inline in an environment configuration.
  std::optional<SecretScope> scope;
  Id scope_id{0};

  bool operator==(const InfrastructureService&) const = default;
};

// ---------------------------------------------------------------------------
// Job configuration
// ---------------------------------------------------------------------------
struct PluginConfig {
  std::map<std::string, std::string> options;
  // Option name -> secret path. Replaced by values at resolution time.
  std::map<std::string, std::string> secrets;

  bool operator==(const PluginConfig&) const = default;
};

using PluginConfigs = std::map<std::string, PluginConfig>;

struct JobConfig {
  std::map<std::string, std::string> options;
  PluginConfigs plugin_config;

  bool operator==(const JobConfig&) const = default;
};

struct JobConfigs {
  std::map<Stage, JobConfig> stages;

  bool requested(Stage stage) const { return stages.contains(stage); }
  const JobConfig* get(Stage stage) const;
  // Requested stages in pipeline order.
  std::vector<Stage> requested_stages() const;
};

// ---------------------------------------------------------------------------
// Environment configuration passed at trigger time
// ---------------------------------------------------------------------------
struct InfrastructureServiceDeclaration {
  std::string name;
  std::string url;
  std::string description;
  std::string username_secret;
  std::string password_secret;
  std::set<CredentialsType> credentials_types{CredentialsType::netrc_file};
};

// Exactly one of secret_name / value is expected to be set.
struct EnvironmentVariableDeclaration {
  std::string name;
  std::optional<std::string> secret_name;
  std::optional<std::string> value;
};

using DefinitionProperties = std::map<std::string, std::string>;
using EnvironmentDefinitions = std::map<std::string, std::vector<DefinitionProperties>>;

struct EnvironmentConfig {
  bool strict{true};
  std::vector<InfrastructureServiceDeclaration> infrastructure_services;
  EnvironmentDefinitions environment_definitions;
  std::vector<EnvironmentVariableDeclaration> environment_variables;
};

// ---------------------------------------------------------------------------
// Run and Job
// ---------------------------------------------------------------------------
struct Job {
  Id id{0};
  Stage stage{Stage::config};
  JobStatus status{JobStatus::scheduled};
  uint64_t created_ms{0};
  uint64_t finished_ms{0};
};

struct Run {
  Id id{0};
  Id index{0};
  Id repository_id{0};
  std::string revision;
  RunStatus status{RunStatus::created};
  JobConfigs job_configs;
  // Opaque JSON produced by the config stage.
  std::optional<std::string> resolved_job_configs;
  std::map<std::string, std::string> labels;
  std::vector<Issue> issues;
  std::optional<std::string> job_config_context;
  std::optional<std::string> resolved_job_config_context;
  std::string trace_id;
  std::optional<EnvironmentConfig> environment_config;
  std::map<Stage, Job> jobs;
  uint64_t created_ms{0};
  uint64_t finished_ms{0};
};

uint64_t now_unix_ms();

// ---------------------------------------------------------------------------
// JSON codecs (store seed files, wire payloads, reports)
// ---------------------------------------------------------------------------
jsonlite::Value to_json_value(const Issue& issue);
Issue issue_from_json(const jsonlite::Object& o);

jsonlite::Value to_json_value(const Secret& secret);
Secret secret_from_json(const jsonlite::Object& o);

jsonlite::Value to_json_value(const InfrastructureService& service);
InfrastructureService service_from_json(const jsonlite::Object& o);

jsonlite::Value to_json_value(const PluginConfigs& configs);
PluginConfigs plugin_configs_from_json(const jsonlite::Object& o);

jsonlite::Value to_json_value(const JobConfigs& configs);
JobConfigs job_configs_from_json(const jsonlite::Object& o);

jsonlite::Value to_json_value(const EnvironmentConfig& config);
EnvironmentConfig environment_config_from_json(const jsonlite::Object& o);

jsonlite::Value to_json_value(const Run& run);
Run run_from_json(const jsonlite::Object& o);

}  // namespace sextant
