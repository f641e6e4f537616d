#pragma once

// sextant/stages.hpp — Built-in stage handlers.
//
// Analysis itself is not part of the engine; these handlers implement the
// worker-side contract around it:
//
//   config     resolve the configuration context, check that every plugin
//              secret of every requested stage resolves, return the resolved
//              context and job configs
//   analyzer   resolve the environment configuration, bind variables, write
//              a .netrc for NETRC_FILE services
//   reporter   run the configured report formats with templates fetched
//              from the configuration repository
//   others     load the context and succeed
//
// Reporter option values understand two forms of indirection:
//   @ORT_CONFIG/<path>[,@ORT_CONFIG/<path>...]  downloaded through the context
//   ${currentWorkingDir}                        the reporter's working dir

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sextant/config.hpp"
#include "sextant/endpoint.hpp"
#include "sextant/env_config.hpp"
#include "sextant/errors.hpp"
#include "sextant/worker_context.hpp"

namespace sextant {

// ---------------------------------------------------------------------------
// config
// ---------------------------------------------------------------------------

// Fails with every plugin secret that cannot be resolved.
Result<JobConfigs> validate_job_configs(WorkerContext& context, const JobConfigs& configs);

// The configurations recorded by the config stage when present, otherwise
// the ones the run was created with.
JobConfigs effective_job_configs(const Run& run);

JobResult run_config_stage(WorkerContext& context, const ConfigFileProvider& config_files);

// ---------------------------------------------------------------------------
// analyzer
// ---------------------------------------------------------------------------

struct PreparedEnvironment {
  std::map<std::string, std::string> variables;
  std::optional<std::filesystem::path> netrc;
  size_t services{0};
  size_t definitions{0};
};

// "https://user@repo.example.org:8443/x" -> "repo.example.org".
std::string host_from_url(const std::string& url);

// Resolves variable secrets and writes <temp dir>/.netrc for every distinct
// host of a service with the NETRC_FILE credentials type.
PreparedEnvironment prepare_environment(WorkerContext& context, const ResolvedEnvironmentConfig& env);

JobResult run_analyzer_stage(WorkerContext& context, const EnvironmentConfigLoader& loader);

// ---------------------------------------------------------------------------
// reporter
// ---------------------------------------------------------------------------

struct ReportInput {
  const Run& run;
  const Hierarchy& hierarchy;
  // Plugin options after template download and placeholder substitution.
  std::map<std::string, std::string> options;
  std::map<std::string, std::string> secrets;
  std::filesystem::path output_dir;
};

using Reporter = std::function<std::vector<std::filesystem::path>(const ReportInput&)>;

class ReporterRegistry {
 public:
  ReporterRegistry() = default;
  explicit ReporterRegistry(std::map<std::string, Reporter> reporters) : reporters_(std::move(reporters)) {}

  // "json": report.json with the run summary.
  // "text": report.txt, rendered from the `template` option if given.
  static ReporterRegistry builtin();

  const Reporter* find(const std::string& format) const {
    auto it = reporters_.find(format);
    return it == reporters_.end() ? nullptr : &it->second;
  }

 private:
  std::map<std::string, Reporter> reporters_;
};

constexpr const char* kConfigReferencePrefix = "@ORT_CONFIG/";
constexpr const char* kCurrentWorkingDirPlaceholder = "${currentWorkingDir}";

// Applies the two indirections above to every option value.
std::map<std::string, std::string> resolve_reporter_options(WorkerContext& context,
                                                            const std::map<std::string, std::string>& options,
                                                            const std::filesystem::path& working_dir);

// Throws Error(stage_failed) for an unknown format.
JobResult run_reporter_stage(WorkerContext& context, const ReporterRegistry& reporters,
                             const std::filesystem::path& report_dir);

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

struct StageServices {
  const ConfigFileProvider& config_files;
  const EnvironmentConfigLoader& environment;
  const ReporterRegistry& reporters;
  std::filesystem::path report_dir;
};

// Referenced services must outlive the returned handlers.
StageHandlers builtin_stage_handlers(const StageServices& services);

}  // namespace sextant
