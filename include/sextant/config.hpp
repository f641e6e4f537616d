#pragma once

// sextant/config.hpp — Configuration file provider and engine-wide settings.
//
// A configuration "context" selects one revision of the configuration
// repository (a branch, a tag). The provider resolves a possibly symbolic
// context to a concrete one so a run reads consistent files across stages.
//
// LocalConfigFileProvider layout:
//   <root>/<context>/<path>
// A context directory that is a symlink resolves to its target's name, the
// same way a branch resolves to a commit.
// Contexts and paths are relative to the root. Absolute paths, ".." segments
// and symlinks resolving outside of the root throw ConfigFileError.

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sextant/log.hpp"
#include "sextant/model.hpp"

namespace sextant {

class ConfigFileProvider {
 public:
  virtual ~ConfigFileProvider() = default;

  // Concrete context for the requested one; nullopt selects the default.
  // Throws ConfigFileError if the context does not exist.
  virtual std::string resolve_context(const std::optional<std::string>& context) const = 0;
  virtual bool contains(const std::string& context, const std::string& path) const = 0;
  // Throws ConfigFileError if the file is missing.
  virtual std::string get_file(const std::string& context, const std::string& path) const = 0;
  // Paths (relative to the context root) of regular files directly below dir.
  virtual std::vector<std::string> list_files(const std::string& context, const std::string& dir) const = 0;
};

class LocalConfigFileProvider : public ConfigFileProvider {
 public:
  LocalConfigFileProvider(std::filesystem::path root, std::string default_context);

  std::string resolve_context(const std::optional<std::string>& context) const override;
  bool contains(const std::string& context, const std::string& path) const override;
  std::string get_file(const std::string& context, const std::string& path) const override;
  std::vector<std::string> list_files(const std::string& context, const std::string& dir) const override;

 private:
  std::filesystem::path file_path(const std::string& context, const std::string& path) const;

  std::filesystem::path root_;
  std::string default_context_;
};

// Map-backed provider. Counts get_file() calls so cache behavior is observable.
class MemoryConfigFileProvider : public ConfigFileProvider {
 public:
  explicit MemoryConfigFileProvider(std::string default_context = "main");

  void put(const std::string& context, const std::string& path, std::string content);
  // Makes `alias` resolve to `target`.
  void alias(const std::string& alias, const std::string& target);
  uint64_t fetch_count() const;

  std::string resolve_context(const std::optional<std::string>& context) const override;
  bool contains(const std::string& context, const std::string& path) const override;
  std::string get_file(const std::string& context, const std::string& path) const override;
  std::vector<std::string> list_files(const std::string& context, const std::string& dir) const override;

 private:
  mutable std::mutex mu_;
  std::string default_context_;
  std::map<std::string, std::map<std::string, std::string>> files_;
  std::map<std::string, std::string> aliases_;
  mutable uint64_t fetches_{0};
};

// ---------------------------------------------------------------------------
// Engine settings
// ---------------------------------------------------------------------------
struct EngineConfig {
  std::string config_dir{"config"};
  std::string default_config_context{"main"};
  std::string secrets_file;
  std::string store_file;
  std::string audit_log;
  std::string report_dir{"reports"};
  std::string temp_root;
  LogLevel late_result_log_level{LogLevel::warn};
  Severity issue_severity_threshold{Severity::warning};
  unsigned orchestrator_threads{4};
};

// SEXTANT_CONFIG_DIR, SEXTANT_DEFAULT_CONFIG_CONTEXT, SEXTANT_SECRETS_FILE,
// SEXTANT_STORE_FILE, SEXTANT_AUDIT_LOG, SEXTANT_REPORT_DIR, SEXTANT_TEMP_DIR,
// SEXTANT_LATE_RESULT_LOG_LEVEL, SEXTANT_ISSUE_SEVERITY_THRESHOLD,
// SEXTANT_ORCHESTRATOR_THREADS. Invalid values are logged and ignored.
EngineConfig engine_config_from_env();

// Value of an environment variable, def when unset or empty.
std::string env_or(const std::string& key, const std::string& def);

}  // namespace sextant
