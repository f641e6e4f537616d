#pragma once

// sextant/worker_context.hpp — Per-run execution handle for stage workers.
//
// DESIGN:
//   A WorkerContext is created for one stage invocation of one run and owns:
//     - the Run and its Hierarchy (loaded once at creation)
//     - a secret cache keyed by secret path
//     - a download cache keyed by (source path, target dir, target name)
//     - the temporary directories it created
//   close() releases all of them. It is idempotent and also runs from the
//   destructor, so every exit path (success, exception, cancellation)
//   removes the temp directories.
//
// CONCURRENCY:
//   A context may be used from several threads of one stage handler. Secret
//   resolution is single-flight: concurrent callers for the same path share
//   one std::shared_future, so the store is read at most once per path. A
//   failed read is not cached; the next caller retries.
//
// INVARIANTS:
//   - Cached secret values never change for the lifetime of a context, even
//     if the store's value does.
//   - Identical download tuples return the identical path without fetching
//     again; a different dir or name is a separate download.

#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "sextant/config.hpp"
#include "sextant/model.hpp"
#include "sextant/repositories.hpp"
#include "sextant/secrets.hpp"

namespace sextant {

class WorkerContext {
 public:
  virtual ~WorkerContext() = default;

  virtual const Run& run() const = 0;
  virtual const Hierarchy& hierarchy() const = 0;

  // Throws SecretResolutionError if the store has no value at the path.
  virtual std::string resolve_secret(const Secret& secret) = 0;
  // Result keyed by secret path.
  virtual std::map<std::string, std::string> resolve_secrets(const std::vector<Secret>& secrets) = 0;
  // Every secret reference replaced by its value; nullopt yields {}.
  virtual PluginConfigs resolve_plugin_config_secrets(const std::optional<PluginConfigs>& configs) = 0;

  // Writes <dir>/<target_name or file name of path>. The target name must be
  // a plain file name.
  virtual std::filesystem::path download_configuration_file(
      const std::string& path, const std::filesystem::path& dir,
      const std::optional<std::string>& target_name = std::nullopt) = 0;
  // Result keyed by source path.
  virtual std::map<std::string, std::filesystem::path> download_configuration_files(
      const std::vector<std::string>& paths, const std::filesystem::path& dir) = 0;
  virtual std::map<std::string, std::filesystem::path> download_configuration_directory(
      const std::string& path, const std::filesystem::path& dir) = 0;

  virtual std::filesystem::path create_temp_dir() = 0;

  virtual void close() = 0;
};

class DefaultWorkerContext : public WorkerContext {
 public:
  DefaultWorkerContext(Run run, Hierarchy hierarchy, SecretsProvider& secrets,
                       const ConfigFileProvider& config_files, std::filesystem::path temp_root);
  ~DefaultWorkerContext() override;

  DefaultWorkerContext(const DefaultWorkerContext&) = delete;
  DefaultWorkerContext& operator=(const DefaultWorkerContext&) = delete;

  const Run& run() const override { return run_; }
  const Hierarchy& hierarchy() const override { return hierarchy_; }

  std::string resolve_secret(const Secret& secret) override;
  std::map<std::string, std::string> resolve_secrets(const std::vector<Secret>& secrets) override;
  PluginConfigs resolve_plugin_config_secrets(const std::optional<PluginConfigs>& configs) override;

  std::filesystem::path download_configuration_file(
      const std::string& path, const std::filesystem::path& dir,
      const std::optional<std::string>& target_name = std::nullopt) override;
  std::map<std::string, std::filesystem::path> download_configuration_files(
      const std::vector<std::string>& paths, const std::filesystem::path& dir) override;
  std::map<std::string, std::filesystem::path> download_configuration_directory(
      const std::string& path, const std::filesystem::path& dir) override;

  std::filesystem::path create_temp_dir() override;

  void close() override;
  bool closed() const;

 private:
  using DownloadKey = std::tuple<std::string, std::string, std::string>;

  std::string resolve_secret_path(const std::string& path);
  // Context used for downloads: resolved, then requested, then default.
  const std::string& download_context();

  Run run_;
  Hierarchy hierarchy_;
  SecretsProvider& secrets_;
  const ConfigFileProvider& config_files_;
  std::filesystem::path temp_root_;

  std::mutex secrets_mu_;
  std::map<std::string, std::shared_future<std::string>> secret_cache_;

  std::mutex downloads_mu_;
  std::map<DownloadKey, std::filesystem::path> download_cache_;
  std::optional<std::string> download_context_;

  mutable std::mutex temp_mu_;
  std::vector<std::filesystem::path> temp_dirs_;
  bool closed_{false};
};

// Forwards everything to a delegate except run(), which returns the override.
// Non-owning: the delegate must outlive the wrapper.
class DelegatingWorkerContext : public WorkerContext {
 public:
  DelegatingWorkerContext(WorkerContext& delegate, Run run_override)
      : delegate_(delegate), run_(std::move(run_override)) {}

  const Run& run() const override { return run_; }
  const Hierarchy& hierarchy() const override { return delegate_.hierarchy(); }

  std::string resolve_secret(const Secret& secret) override { return delegate_.resolve_secret(secret); }
  std::map<std::string, std::string> resolve_secrets(const std::vector<Secret>& secrets) override {
    return delegate_.resolve_secrets(secrets);
  }
  PluginConfigs resolve_plugin_config_secrets(const std::optional<PluginConfigs>& configs) override {
    return delegate_.resolve_plugin_config_secrets(configs);
  }

  std::filesystem::path download_configuration_file(
      const std::string& path, const std::filesystem::path& dir,
      const std::optional<std::string>& target_name = std::nullopt) override {
    return delegate_.download_configuration_file(path, dir, target_name);
  }
  std::map<std::string, std::filesystem::path> download_configuration_files(
      const std::vector<std::string>& paths, const std::filesystem::path& dir) override {
    return delegate_.download_configuration_files(paths, dir);
  }
  std::map<std::string, std::filesystem::path> download_configuration_directory(
      const std::string& path, const std::filesystem::path& dir) override {
    return delegate_.download_configuration_directory(path, dir);
  }

  std::filesystem::path create_temp_dir() override { return delegate_.create_temp_dir(); }

  void close() override { delegate_.close(); }

 private:
  WorkerContext& delegate_;
  Run run_;
};

class WorkerContextFactory {
 public:
  WorkerContextFactory(const RunRepository& runs, const HierarchyRepository& hierarchies,
                       SecretsProvider& secrets, const ConfigFileProvider& config_files,
                       std::filesystem::path temp_root = {});

  // Throws RunNotFoundError for an unknown run id and
  // Error(hierarchy_not_found) if the run's repository has no hierarchy.
  std::unique_ptr<WorkerContext> create_context(Id run_id) const;

 private:
  const RunRepository& runs_;
  const HierarchyRepository& hierarchies_;
  SecretsProvider& secrets_;
  const ConfigFileProvider& config_files_;
  std::filesystem::path temp_root_;
};

}  // namespace sextant
