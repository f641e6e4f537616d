#include "sextant/stages.hpp"

#include <fstream>
#include <sstream>

#include "sextant/jsonlite.hpp"
#include "sextant/log.hpp"

namespace fs = std::filesystem;

namespace sextant {

namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

std::vector<std::string> split_list(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

std::string join_list(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i) out += sep;
    out += items[i];
  }
  return out;
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
  if (from.empty()) return;
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

void write_file(const fs::path& path, const std::string& content) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) throw Error(ErrorCode::stage_failed, "cannot write " + path.string());
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!ofs) throw Error(ErrorCode::stage_failed, "cannot write " + path.string());
}

std::string read_file(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw Error(ErrorCode::stage_failed, "cannot read " + path.string());
  std::ostringstream buf;
  buf << ifs.rdbuf();
  return buf.str();
}

LogFields run_fields(const WorkerContext& context) {
  return {{"run_id", std::to_string(context.run().id)}, {"trace_id", context.run().trace_id}};
}

// ---------------------------------------------------------------------------
// Built-in reporters
// ---------------------------------------------------------------------------

std::vector<fs::path> json_reporter(const ReportInput& in) {
  jsonlite::Array issues;
  for (const auto& i : in.run.issues) issues.push_back(to_json_value(i));

  jsonlite::Object hierarchy{
      {"organizationId", jsonlite::Value(static_cast<std::uint64_t>(in.hierarchy.organization_id))},
      {"productId", jsonlite::Value(static_cast<std::uint64_t>(in.hierarchy.product_id))},
      {"repositoryId", jsonlite::Value(static_cast<std::uint64_t>(in.hierarchy.repository_id))},
  };

  jsonlite::Object report{
      {"runId", jsonlite::Value(static_cast<std::uint64_t>(in.run.id))},
      {"index", jsonlite::Value(static_cast<std::uint64_t>(in.run.index))},
      {"revision", jsonlite::Value(in.run.revision)},
      {"hierarchy", jsonlite::Value(std::move(hierarchy))},
      {"labels", jsonlite::Value(jsonlite::to_object(in.run.labels))},
      {"issues", jsonlite::Value(std::move(issues))},
      {"traceId", jsonlite::Value(in.run.trace_id)},
      {"createdAt", jsonlite::Value(static_cast<std::uint64_t>(in.run.created_ms))},
  };
  if (in.run.resolved_job_config_context) {
    report["resolvedJobConfigContext"] = jsonlite::Value(*in.run.resolved_job_config_context);
  }

  fs::create_directories(in.output_dir);
  const fs::path out = in.output_dir / "report.json";
  write_file(out, jsonlite::to_json(jsonlite::Value(std::move(report))) + "\n");
  return {out};
}

constexpr const char* kDefaultTextTemplate =
    "Run ${runId} of repository ${repositoryId} at ${revision}\n"
    "Issues: ${issueCount}\n";

std::vector<fs::path> text_reporter(const ReportInput& in) {
  std::string text = kDefaultTextTemplate;
  if (auto t = in.options.find("template"); t != in.options.end()) {
    const auto templates = split_list(t->second);
    if (!templates.empty()) text = read_file(templates.front());
  }
  replace_all(text, "${runId}", std::to_string(in.run.id));
  replace_all(text, "${repositoryId}", std::to_string(in.run.repository_id));
  replace_all(text, "${revision}", in.run.revision);
  replace_all(text, "${issueCount}", std::to_string(in.run.issues.size()));

  fs::create_directories(in.output_dir);
  const fs::path out = in.output_dir / "report.txt";
  write_file(out, text);
  return {out};
}

}  // namespace

// ---------------------------------------------------------------------------
// config
// ---------------------------------------------------------------------------

Result<JobConfigs> validate_job_configs(WorkerContext& context, const JobConfigs& configs) {
  std::vector<std::string> failures;
  for (const auto& [stage, config] : configs.stages) {
    for (const auto& [plugin, plugin_config] : config.plugin_config) {
      for (const auto& [option, path] : plugin_config.secrets) {
        Secret ref;
        ref.path = path;
        ref.name = path;
        try {
          context.resolve_secret(ref);
        } catch (const SecretResolutionError& e) {
          failures.push_back(to_string(stage) + "/" + plugin + "/" + option + ": " + e.what());
        }
      }
    }
  }
  if (!failures.empty()) {
    return Result<JobConfigs>::failure(ErrorCode::secret_unresolved,
                                       "Invalid job configuration:\n" + join_list(failures, "\n"));
  }
  return configs;
}

JobConfigs effective_job_configs(const Run& run) {
  if (!run.resolved_job_configs) return run.job_configs;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object o = jsonlite::parse(*run.resolved_job_configs, &err);
  if (err) {
    throw Error(ErrorCode::stage_failed,
                "Resolved job configurations of run " + std::to_string(run.id) + " are not valid JSON: " + err->message);
  }
  return job_configs_from_json(o);
}

JobResult run_config_stage(WorkerContext& context, const ConfigFileProvider& config_files) {
  const std::string resolved = config_files.resolve_context(context.run().job_config_context);

  Run with_context = context.run();
  with_context.resolved_job_config_context = resolved;
  DelegatingWorkerContext delegating(context, std::move(with_context));

  auto validated = validate_job_configs(delegating, delegating.run().job_configs);
  if (!validated) throw Error(validated.error().code, validated.error().message);

  auto fields = run_fields(context);
  fields["context"] = resolved;
  log_info("config", "job configuration resolved", fields);

  JobResult result;
  result.resolved_job_config_context = resolved;
  result.resolved_job_configs = jsonlite::to_json(to_json_value(validated.value()));
  return result;
}

// ---------------------------------------------------------------------------
// analyzer
// ---------------------------------------------------------------------------

std::string host_from_url(const std::string& url) {
  std::string rest = url;
  if (auto scheme = rest.find("://"); scheme != std::string::npos) rest = rest.substr(scheme + 3);
  if (auto slash = rest.find_first_of("/?#"); slash != std::string::npos) rest = rest.substr(0, slash);
  if (auto at = rest.rfind('@'); at != std::string::npos) rest = rest.substr(at + 1);
  if (auto colon = rest.find(':'); colon != std::string::npos) rest = rest.substr(0, colon);
  return rest;
}

PreparedEnvironment prepare_environment(WorkerContext& context, const ResolvedEnvironmentConfig& env) {
  PreparedEnvironment out;
  out.services = env.infrastructure_services.size();
  out.definitions = env.environment_definitions.size();

  for (const auto& binding : env.environment_variables) {
    out.variables[binding.name] = binding.secret ? context.resolve_secret(*binding.secret) : binding.value.value_or("");
  }

  // Definitions may point at product or organization services that are not
  // part of the inline list; their own credentials types apply.
  std::vector<std::pair<const InfrastructureService*, std::set<CredentialsType>>> candidates;
  for (const auto& s : env.infrastructure_services) candidates.emplace_back(&s, s.credentials_types);
  for (const auto& d : env.environment_definitions) candidates.emplace_back(&d.service, d.credentials_types);

  std::map<std::string, std::string> lines;  // host -> netrc line, first wins
  for (const auto& [service, types] : candidates) {
    if (!types.contains(CredentialsType::netrc_file)) continue;
    const std::string host = host_from_url(service->url);
    if (host.empty() || lines.contains(host)) continue;
    lines[host] = "machine " + host + " login " + context.resolve_secret(service->username_secret) +
                  " password " + context.resolve_secret(service->password_secret) + "\n";
  }

  if (!lines.empty()) {
    const fs::path netrc = context.create_temp_dir() / ".netrc";
    std::string content;
    for (const auto& [host, line] : lines) content += line;
    write_file(netrc, content);
    fs::permissions(netrc, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    out.netrc = netrc;
  }
  return out;
}

JobResult run_analyzer_stage(WorkerContext& context, const EnvironmentConfigLoader& loader) {
  const Run& run = context.run();
  const JobConfigs configs = effective_job_configs(run);
  ResolvedEnvironmentConfig env;
  if (run.environment_config) {
    env = loader.resolve(*run.environment_config, context.hierarchy());
  } else if (const JobConfig* config = configs.get(Stage::analyzer)) {
    if (auto dir = config->options.find("repositoryDir"); dir != config->options.end()) {
      env = loader.parse(dir->second, context.hierarchy());
    }
  }

  const PreparedEnvironment prepared = prepare_environment(context, env);

  auto fields = run_fields(context);
  fields["services"] = std::to_string(prepared.services);
  fields["definitions"] = std::to_string(prepared.definitions);
  fields["variables"] = std::to_string(prepared.variables.size());
  if (prepared.netrc) fields["netrc"] = prepared.netrc->string();
  log_info("analyzer", "environment prepared", fields);

  JobResult result;
  for (const auto& w : env.warnings) result.issues.push_back(Issue{now_unix_ms(), "analyzer", w, Severity::warning});
  result.issues.push_back(Issue{now_unix_ms(), "analyzer",
                                "Prepared environment with " + std::to_string(prepared.services) +
                                    " infrastructure services, " + std::to_string(prepared.definitions) +
                                    " environment definitions and " + std::to_string(prepared.variables.size()) +
                                    " variables.",
                                Severity::hint});
  return result;
}

// ---------------------------------------------------------------------------
// reporter
// ---------------------------------------------------------------------------

ReporterRegistry ReporterRegistry::builtin() {
  return ReporterRegistry({{"json", json_reporter}, {"text", text_reporter}});
}

std::map<std::string, std::string> resolve_reporter_options(WorkerContext& context,
                                                            const std::map<std::string, std::string>& options,
                                                            const fs::path& working_dir) {
  const std::string prefix = kConfigReferencePrefix;
  std::map<std::string, std::string> out;
  for (const auto& [key, value] : options) {
    if (value.rfind(prefix, 0) == 0) {
      std::vector<std::string> paths;
      for (const auto& item : split_list(value)) {
        if (item.rfind(prefix, 0) != 0) {
          paths.push_back(item);
          continue;
        }
        paths.push_back(context.download_configuration_file(item.substr(prefix.size()), working_dir).string());
      }
      out[key] = join_list(paths, ",");
    } else {
      std::string resolved = value;
      replace_all(resolved, kCurrentWorkingDirPlaceholder, working_dir.string());
      out[key] = std::move(resolved);
    }
  }
  return out;
}

JobResult run_reporter_stage(WorkerContext& context, const ReporterRegistry& reporters, const fs::path& report_dir) {
  const Run& run = context.run();
  const JobConfigs configs = effective_job_configs(run);
  const JobConfig* config = configs.get(Stage::reporter);

  std::vector<std::string> formats{"json"};
  if (config) {
    if (auto f = config->options.find("formats"); f != config->options.end()) formats = split_list(f->second);
  }

  std::vector<std::pair<std::string, const Reporter*>> selected;
  for (const auto& format : formats) {
    const Reporter* reporter = reporters.find(format);
    if (!reporter) {
      throw Error(ErrorCode::stage_failed, "No reporter found for the configured format '" + format + "'.");
    }
    selected.emplace_back(format, reporter);
  }

  const fs::path output_dir = report_dir / std::to_string(run.id);
  size_t files = 0;
  for (const auto& [format, reporter] : selected) {
    PluginConfigs plugin;
    if (config) {
      if (auto p = config->plugin_config.find(format); p != config->plugin_config.end()) plugin[format] = p->second;
    }
    PluginConfigs resolved = context.resolve_plugin_config_secrets(plugin);
    const fs::path working_dir = context.create_temp_dir();

    ReportInput input{run, context.hierarchy(),
                      resolve_reporter_options(context, resolved[format].options, working_dir),
                      resolved[format].secrets, output_dir};
    const auto written = (*reporter)(input);
    files += written.size();

    auto fields = run_fields(context);
    fields["format"] = format;
    for (const auto& w : written) {
      fields["file"] = w.string();
      log_info("reporter", "report written", fields);
    }
  }

  JobResult result;
  result.issues.push_back(Issue{now_unix_ms(), "reporter",
                                "Created " + std::to_string(files) + " report files in " + output_dir.string() + ".",
                                Severity::hint});
  return result;
}

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

StageHandlers builtin_stage_handlers(const StageServices& services) {
  std::map<Stage, StageHandler> handlers;
  handlers[Stage::config] = [&config_files = services.config_files](WorkerContext& c, const JobRequest&) {
    return run_config_stage(c, config_files);
  };
  handlers[Stage::analyzer] = [&environment = services.environment](WorkerContext& c, const JobRequest&) {
    return run_analyzer_stage(c, environment);
  };
  handlers[Stage::reporter] = [&reporters = services.reporters, dir = services.report_dir](WorkerContext& c,
                                                                                           const JobRequest&) {
    return run_reporter_stage(c, reporters, dir);
  };
  for (Stage s : {Stage::advisor, Stage::scanner, Stage::evaluator, Stage::notifier}) {
    handlers[s] = [](WorkerContext& c, const JobRequest& request) {
      log_info(to_string(request.stage), "stage has no local work", run_fields(c));
      return JobResult{};
    };
  }
  return StageHandlers(std::move(handlers));
}

}  // namespace sextant
