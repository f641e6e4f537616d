#include "sextant/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>

#include "sextant/errors.hpp"

namespace fs = std::filesystem;

namespace sextant {

std::string env_or(const std::string& key, const std::string& def) {
  const char* v = std::getenv(key.c_str());
  return (v && v[0]) ? std::string(v) : def;
}

// ---------------------------------------------------------------------------
// LocalConfigFileProvider
// ---------------------------------------------------------------------------

namespace {

fs::path relative_part(const std::string& part, const char* what) {
  const fs::path p = fs::path(part).lexically_normal();
  bool escapes = part.empty() || p.has_root_name() || p.has_root_directory();
  for (const auto& segment : p) escapes = escapes || segment == "..";
  if (escapes) throw ConfigFileError(std::string("Invalid configuration ") + what + " '" + part + "'.");
  return p;
}

bool is_within(const fs::path& root, const fs::path& p) {
  const fs::path rel = p.lexically_relative(root);
  return !rel.empty() && *rel.begin() != "..";
}

}  // namespace

LocalConfigFileProvider::LocalConfigFileProvider(fs::path root, std::string default_context)
    : root_(std::move(root)), default_context_(std::move(default_context)) {}

std::string LocalConfigFileProvider::resolve_context(const std::optional<std::string>& context) const {
  const std::string requested = context.value_or(default_context_);
  const fs::path dir = root_ / relative_part(requested, "context");
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw ConfigFileError("Configuration context '" + requested + "' does not exist in " + root_.string());
  }
  if (fs::is_symlink(dir, ec)) {
    const fs::path target = fs::canonical(dir, ec);
    if (!ec) return target.filename().string();
  }
  return requested;
}

fs::path LocalConfigFileProvider::file_path(const std::string& context, const std::string& path) const {
  const fs::path candidate = root_ / relative_part(context, "context") / relative_part(path, "path");
  // Symlinks below the root may point anywhere; the resolved file may not.
  std::error_code ec;
  const fs::path base = fs::weakly_canonical(root_, ec);
  const fs::path real = ec ? fs::path() : fs::weakly_canonical(candidate, ec);
  if (ec || !is_within(base, real)) {
    throw ConfigFileError("Configuration path '" + path + "' is outside of the configuration root.");
  }
  return candidate;
}

bool LocalConfigFileProvider::contains(const std::string& context, const std::string& path) const {
  std::error_code ec;
  return fs::is_regular_file(file_path(context, path), ec);
}

std::string LocalConfigFileProvider::get_file(const std::string& context, const std::string& path) const {
  std::ifstream ifs(file_path(context, path), std::ios::binary);
  if (!ifs) {
    throw ConfigFileError("Configuration file '" + path + "' not found in context '" + context + "'");
  }
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::vector<std::string> LocalConfigFileProvider::list_files(const std::string& context,
                                                             const std::string& dir) const {
  std::vector<std::string> out;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(file_path(context, dir.empty() ? "." : dir), ec)) {
    if (!entry.is_regular_file()) continue;
    out.push_back((fs::path(dir) / entry.path().filename()).generic_string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

// ---------------------------------------------------------------------------
// MemoryConfigFileProvider
// ---------------------------------------------------------------------------

MemoryConfigFileProvider::MemoryConfigFileProvider(std::string default_context)
    : default_context_(std::move(default_context)) {}

void MemoryConfigFileProvider::put(const std::string& context, const std::string& path, std::string content) {
  std::lock_guard<std::mutex> lk(mu_);
  files_[context][path] = std::move(content);
}

void MemoryConfigFileProvider::alias(const std::string& alias, const std::string& target) {
  std::lock_guard<std::mutex> lk(mu_);
  aliases_[alias] = target;
}

uint64_t MemoryConfigFileProvider::fetch_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return fetches_;
}

std::string MemoryConfigFileProvider::resolve_context(const std::optional<std::string>& context) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::string name = context.value_or(default_context_);
  if (auto it = aliases_.find(name); it != aliases_.end()) name = it->second;
  if (!files_.contains(name)) {
    throw ConfigFileError("Configuration context '" + name + "' does not exist");
  }
  return name;
}

bool MemoryConfigFileProvider::contains(const std::string& context, const std::string& path) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = files_.find(context);
  return it != files_.end() && it->second.contains(path);
}

std::string MemoryConfigFileProvider::get_file(const std::string& context, const std::string& path) const {
  std::lock_guard<std::mutex> lk(mu_);
  ++fetches_;
  auto it = files_.find(context);
  if (it == files_.end() || !it->second.contains(path)) {
    throw ConfigFileError("Configuration file '" + path + "' not found in context '" + context + "'");
  }
  return it->second.at(path);
}

std::vector<std::string> MemoryConfigFileProvider::list_files(const std::string& context,
                                                              const std::string& dir) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  auto it = files_.find(context);
  if (it == files_.end()) return out;
  const std::string prefix = dir.empty() ? "" : dir + "/";
  for (const auto& [path, _] : it->second) {
    if (path.rfind(prefix, 0) != 0) continue;
    if (path.find('/', prefix.size()) != std::string::npos) continue;  // nested
    out.push_back(path);
  }
  return out;
}

// ---------------------------------------------------------------------------
// EngineConfig
// ---------------------------------------------------------------------------

EngineConfig engine_config_from_env() {
  EngineConfig c;
  c.config_dir = env_or("SEXTANT_CONFIG_DIR", c.config_dir);
  c.default_config_context = env_or("SEXTANT_DEFAULT_CONFIG_CONTEXT", c.default_config_context);
  c.secrets_file = env_or("SEXTANT_SECRETS_FILE", "");
  c.store_file = env_or("SEXTANT_STORE_FILE", "");
  c.audit_log = env_or("SEXTANT_AUDIT_LOG", "");
  c.report_dir = env_or("SEXTANT_REPORT_DIR", c.report_dir);
  c.temp_root = env_or("SEXTANT_TEMP_DIR", "");

  const std::string late = env_or("SEXTANT_LATE_RESULT_LOG_LEVEL", "");
  if (!late.empty()) {
    if (auto lvl = parse_log_level(late)) c.late_result_log_level = *lvl;
    else log_warn("config", "ignoring invalid SEXTANT_LATE_RESULT_LOG_LEVEL", {{"value", late}});
  }

  const std::string threshold = env_or("SEXTANT_ISSUE_SEVERITY_THRESHOLD", "");
  if (!threshold.empty()) {
    if (auto sev = parse_severity(threshold)) c.issue_severity_threshold = *sev;
    else log_warn("config", "ignoring invalid SEXTANT_ISSUE_SEVERITY_THRESHOLD", {{"value", threshold}});
  }

  const std::string threads = env_or("SEXTANT_ORCHESTRATOR_THREADS", "");
  if (!threads.empty()) {
    try {
      const unsigned long n = std::stoul(threads);
      if (n > 0 && n <= 256) c.orchestrator_threads = static_cast<unsigned>(n);
      else log_warn("config", "SEXTANT_ORCHESTRATOR_THREADS out of range", {{"value", threads}});
    } catch (const std::exception&) {
      log_warn("config", "ignoring invalid SEXTANT_ORCHESTRATOR_THREADS", {{"value", threads}});
    }
  }
  return c;
}

}  // namespace sextant
