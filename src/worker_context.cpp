#include "sextant/worker_context.hpp"

#include <fstream>

#include "sextant/errors.hpp"
#include "sextant/hash.hpp"
#include "sextant/log.hpp"

namespace fs = std::filesystem;

namespace sextant {

DefaultWorkerContext::DefaultWorkerContext(Run run, Hierarchy hierarchy, SecretsProvider& secrets,
                                           const ConfigFileProvider& config_files, fs::path temp_root)
    : run_(std::move(run)),
      hierarchy_(hierarchy),
      secrets_(secrets),
      config_files_(config_files),
      temp_root_(temp_root.empty() ? fs::temp_directory_path() : std::move(temp_root)) {}

DefaultWorkerContext::~DefaultWorkerContext() { close(); }

// ---------------------------------------------------------------------------
// Secrets
// ---------------------------------------------------------------------------

std::string DefaultWorkerContext::resolve_secret_path(const std::string& path) {
  std::promise<std::string> promise;
  std::shared_future<std::string> future;
  bool owner = false;
  {
    std::lock_guard<std::mutex> lk(secrets_mu_);
    auto it = secret_cache_.find(path);
    if (it != secret_cache_.end()) {
      future = it->second;
    } else {
      future = promise.get_future().share();
      secret_cache_.emplace(path, future);
      owner = true;
    }
  }

  if (owner) {
    try {
      auto value = secrets_.read_secret(path);
      if (!value) throw SecretResolutionError("Secret not found: '" + path + "'");
      promise.set_value(std::move(*value));
    } catch (const std::exception&) {
      {
        std::lock_guard<std::mutex> lk(secrets_mu_);
        secret_cache_.erase(path);
      }
      promise.set_exception(std::current_exception());
    }
  }
  return future.get();
}

std::string DefaultWorkerContext::resolve_secret(const Secret& secret) {
  return resolve_secret_path(secret.path);
}

std::map<std::string, std::string> DefaultWorkerContext::resolve_secrets(const std::vector<Secret>& secrets) {
  std::map<std::string, std::string> out;
  for (const auto& s : secrets) out[s.path] = resolve_secret_path(s.path);
  return out;
}

PluginConfigs DefaultWorkerContext::resolve_plugin_config_secrets(const std::optional<PluginConfigs>& configs) {
  PluginConfigs out;
  if (!configs) return out;
  for (const auto& [plugin, config] : *configs) {
    PluginConfig resolved;
    resolved.options = config.options;
    for (const auto& [option, path] : config.secrets) resolved.secrets[option] = resolve_secret_path(path);
    out[plugin] = std::move(resolved);
  }
  return out;
}

// ---------------------------------------------------------------------------
// Configuration downloads
// ---------------------------------------------------------------------------

const std::string& DefaultWorkerContext::download_context() {
  if (!download_context_) {
    if (run_.resolved_job_config_context) download_context_ = *run_.resolved_job_config_context;
    else download_context_ = config_files_.resolve_context(run_.job_config_context);
  }
  return *download_context_;
}

fs::path DefaultWorkerContext::download_configuration_file(const std::string& path, const fs::path& dir,
                                                           const std::optional<std::string>& target_name) {
  const std::string name = target_name.value_or(fs::path(path).filename().string());
  if (name.empty() || name == "." || name == ".." || fs::path(name).filename().string() != name) {
    throw ConfigFileError("Invalid target file name '" + name + "' for configuration file '" + path + "'.");
  }
  DownloadKey key{path, dir.string(), name};

  std::lock_guard<std::mutex> lk(downloads_mu_);
  if (auto it = download_cache_.find(key); it != download_cache_.end()) return it->second;

  const std::string& context = download_context();
  const std::string content = config_files_.get_file(context, path);

  fs::create_directories(dir);
  const fs::path target = dir / name;
  std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
  if (!ofs) throw ConfigFileError("cannot write configuration file to " + target.string());
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  ofs.close();

  log_debug("context", "downloaded configuration file",
            {{"path", path}, {"target", target.string()}, {"context", context}});
  download_cache_.emplace(std::move(key), target);
  return target;
}

std::map<std::string, fs::path> DefaultWorkerContext::download_configuration_files(
    const std::vector<std::string>& paths, const fs::path& dir) {
  std::map<std::string, fs::path> out;
  for (const auto& p : paths) out[p] = download_configuration_file(p, dir);
  return out;
}

std::map<std::string, fs::path> DefaultWorkerContext::download_configuration_directory(
    const std::string& path, const fs::path& dir) {
  std::vector<std::string> files;
  {
    std::lock_guard<std::mutex> lk(downloads_mu_);
    files = config_files_.list_files(download_context(), path);
  }
  return download_configuration_files(files, dir);
}

// ---------------------------------------------------------------------------
// Temp dirs / close
// ---------------------------------------------------------------------------

fs::path DefaultWorkerContext::create_temp_dir() {
  std::lock_guard<std::mutex> lk(temp_mu_);
  if (closed_) throw Error(ErrorCode::stage_failed, "worker context is closed");
  const fs::path dir = temp_root_ / ("sextant-" + std::to_string(run_.id) + "-" + unique_token(16));
  fs::create_directories(dir);
  temp_dirs_.push_back(dir);
  return dir;
}

bool DefaultWorkerContext::closed() const {
  std::lock_guard<std::mutex> lk(temp_mu_);
  return closed_;
}

void DefaultWorkerContext::close() {
  std::vector<fs::path> dirs;
  {
    std::lock_guard<std::mutex> lk(temp_mu_);
    if (closed_) return;
    closed_ = true;
    dirs.swap(temp_dirs_);
  }

  for (const auto& d : dirs) {
    std::error_code ec;
    fs::remove_all(d, ec);
    if (ec) log_warn("context", "failed to remove temp dir: " + ec.message(), {{"dir", d.string()}});
  }

  {
    std::lock_guard<std::mutex> lk(secrets_mu_);
    secret_cache_.clear();
  }
  {
    std::lock_guard<std::mutex> lk(downloads_mu_);
    download_cache_.clear();
  }
}

// ---------------------------------------------------------------------------
// WorkerContextFactory
// ---------------------------------------------------------------------------

WorkerContextFactory::WorkerContextFactory(const RunRepository& runs, const HierarchyRepository& hierarchies,
                                           SecretsProvider& secrets, const ConfigFileProvider& config_files,
                                           fs::path temp_root)
    : runs_(runs),
      hierarchies_(hierarchies),
      secrets_(secrets),
      config_files_(config_files),
      temp_root_(std::move(temp_root)) {}

std::unique_ptr<WorkerContext> WorkerContextFactory::create_context(Id run_id) const {
  auto run = runs_.get_run(run_id);
  if (!run) throw RunNotFoundError("Could not resolve run with ID " + std::to_string(run_id) + ".");

  auto hierarchy = hierarchies_.hierarchy_for_repository(run->repository_id);
  if (!hierarchy) {
    throw Error(ErrorCode::hierarchy_not_found,
                "Could not resolve hierarchy for repository " + std::to_string(run->repository_id) + ".");
  }
  return std::make_unique<DefaultWorkerContext>(std::move(*run), *hierarchy, secrets_, config_files_, temp_root_);
}

}  // namespace sextant
