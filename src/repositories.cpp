#include "sextant/repositories.hpp"

#include <fstream>
#include <iterator>

#include "sextant/errors.hpp"
#include "sextant/hash.hpp"
#include "sextant/log.hpp"

namespace fs = std::filesystem;

namespace sextant {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

std::optional<std::string> read_text(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace

std::unique_ptr<InMemoryStore> InMemoryStore::open_file(const fs::path& path) {
  auto text = read_text(path);
  if (!text) throw ConfigFileError("store file not found: " + path.string());

  auto store = std::make_unique<InMemoryStore>();
  std::lock_guard<std::mutex> lk(store->mu_);
  store->load_json_locked(*text);
  store->backing_ = path;
  std::error_code ec;
  store->backing_mtime_ = fs::last_write_time(path, ec);
  return store;
}

void InMemoryStore::load_json(const std::string& text) {
  std::lock_guard<std::mutex> lk(mu_);
  load_json_locked(text);
}

void InMemoryStore::load_json_locked(const std::string& text) const {
  std::optional<jsonlite::JsonError> err;
  Object root = jsonlite::parse(text, &err);
  if (err) throw ConfigFileError("store data is not valid JSON: " + err->message);

  runs_.clear();
  hierarchies_.clear();
  secrets_.clear();
  services_.clear();

  if (const Array* hs = jsonlite::get_array(root, "hierarchies")) {
    for (const auto& item : *hs) {
      const auto* o = std::get_if<Object>(&item.v);
      if (!o) continue;
      Hierarchy h{jsonlite::get_u64(*o, "organizationId"), jsonlite::get_u64(*o, "productId"),
                  jsonlite::get_u64(*o, "repositoryId")};
      hierarchies_[h.repository_id] = h;
    }
  }
  if (const Array* ss = jsonlite::get_array(root, "secrets")) {
    for (const auto& item : *ss) {
      if (const auto* o = std::get_if<Object>(&item.v)) {
        Secret s = secret_from_json(*o);
        if (s.id == 0) s.id = next_secret_id_++;
        else if (s.id >= next_secret_id_) next_secret_id_ = s.id + 1;
        secrets_.push_back(std::move(s));
      }
    }
  }
  if (const Array* svcs = jsonlite::get_array(root, "services")) {
    for (const auto& item : *svcs) {
      if (const auto* o = std::get_if<Object>(&item.v)) services_.push_back(service_from_json(*o));
    }
  }
  if (const Array* rs = jsonlite::get_array(root, "runs")) {
    for (const auto& item : *rs) {
      if (const auto* o = std::get_if<Object>(&item.v)) {
        Run r = run_from_json(*o);
        runs_[r.id] = std::move(r);
      }
    }
  }
  next_job_id_ = jsonlite::get_u64(root, "nextJobId", 1);
  for (const auto& [_, run] : runs_) {
    for (const auto& [__, job] : run.jobs) {
      if (job.id >= next_job_id_) next_job_id_ = job.id + 1;
    }
  }
}

std::string InMemoryStore::to_json() const {
  std::lock_guard<std::mutex> lk(mu_);
  return to_json_locked();
}

std::string InMemoryStore::to_json_locked() const {
  Object root;

  Array hs;
  for (const auto& [_, h] : hierarchies_) {
    Object o;
    o["organizationId"] = Value{h.organization_id};
    o["productId"] = Value{h.product_id};
    o["repositoryId"] = Value{h.repository_id};
    hs.emplace_back(std::move(o));
  }
  root["hierarchies"] = Value{std::move(hs)};

  Array ss;
  for (const auto& s : secrets_) ss.push_back(to_json_value(s));
  root["secrets"] = Value{std::move(ss)};

  Array svcs;
  for (const auto& s : services_) svcs.push_back(to_json_value(s));
  root["services"] = Value{std::move(svcs)};

  Array rs;
  for (const auto& [_, r] : runs_) rs.push_back(to_json_value(r));
  root["runs"] = Value{std::move(rs)};

  root["nextJobId"] = Value{next_job_id_};
  return jsonlite::to_json(Value{std::move(root)});
}

void InMemoryStore::reload_if_changed() const {
  if (backing_.empty()) return;
  std::error_code ec;
  const auto mtime = fs::last_write_time(backing_, ec);
  if (ec || mtime == backing_mtime_) return;
  auto text = read_text(backing_);
  if (!text) return;
  try {
    load_json_locked(*text);
    backing_mtime_ = mtime;
  } catch (const ConfigFileError& e) {
    // A concurrent writer may be mid-rename; keep the last good state.
    log_warn("store", e.what(), {{"file", backing_.string()}});
  }
}

void InMemoryStore::persist_locked() const {
  if (backing_.empty()) return;
  const std::string text = to_json_locked();
  const fs::path tmp = backing_.parent_path() / ("." + backing_.filename().string() + "." + unique_token(8));
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) throw Error(ErrorCode::config_file_missing, "cannot write store file " + tmp.string());
    ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
  }
  std::error_code ec;
  fs::rename(tmp, backing_, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw Error(ErrorCode::config_file_missing, "cannot replace store file " + backing_.string());
  }
  backing_mtime_ = fs::last_write_time(backing_, ec);
}

void InMemoryStore::add_hierarchy(const Hierarchy& hierarchy) {
  std::lock_guard<std::mutex> lk(mu_);
  hierarchies_[hierarchy.repository_id] = hierarchy;
}

Secret InMemoryStore::add_secret(Secret secret) {
  std::lock_guard<std::mutex> lk(mu_);
  if (secret.id == 0) secret.id = next_secret_id_++;
  if (secret.path.empty()) secret.path = secret_path(secret.scope, secret.scope_id, secret.name);
  secrets_.push_back(secret);
  return secret;
}

void InMemoryStore::add_service(InfrastructureService service) {
  std::lock_guard<std::mutex> lk(mu_);
  services_.push_back(std::move(service));
}

std::optional<Run> InMemoryStore::get_run(Id run_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  reload_if_changed();
  auto it = runs_.find(run_id);
  if (it == runs_.end()) return std::nullopt;
  return it->second;
}

void InMemoryStore::store_run(const Run& run) {
  std::lock_guard<std::mutex> lk(mu_);
  std::optional<Run> previous;
  if (auto it = runs_.find(run.id); it != runs_.end()) previous = it->second;
  runs_[run.id] = run;
  try {
    persist_locked();
  } catch (const Error&) {
    // Readers must keep seeing what the backing file holds.
    if (previous) runs_[run.id] = std::move(*previous);
    else runs_.erase(run.id);
    throw;
  }
}

Id InMemoryStore::allocate_job_id() {
  std::lock_guard<std::mutex> lk(mu_);
  return next_job_id_++;
}

std::optional<Hierarchy> InMemoryStore::hierarchy_for_repository(Id repository_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  reload_if_changed();
  auto it = hierarchies_.find(repository_id);
  if (it == hierarchies_.end()) return std::nullopt;
  return it->second;
}

std::vector<Secret> InMemoryStore::list_secrets(SecretScope scope, Id scope_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  reload_if_changed();
  switch (scope) {
    case SecretScope::organization: ++counts_.secrets_organization; break;
    case SecretScope::product: ++counts_.secrets_product; break;
    case SecretScope::repository: ++counts_.secrets_repository; break;
  }
  std::vector<Secret> out;
  for (const auto& s : secrets_) {
    if (s.scope == scope && s.scope_id == scope_id) out.push_back(s);
  }
  return out;
}

std::vector<Secret> InMemoryStore::list_for_organization(Id organization_id) const {
  return list_secrets(SecretScope::organization, organization_id);
}

std::vector<Secret> InMemoryStore::list_for_product(Id product_id) const {
  return list_secrets(SecretScope::product, product_id);
}

std::vector<Secret> InMemoryStore::list_for_repository(Id repository_id) const {
  return list_secrets(SecretScope::repository, repository_id);
}

std::vector<InfrastructureService> InMemoryStore::list_services(SecretScope scope, Id scope_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  reload_if_changed();
  if (scope == SecretScope::organization) ++counts_.services_organization;
  else ++counts_.services_product;
  std::vector<InfrastructureService> out;
  for (const auto& s : services_) {
    if (s.scope == scope && s.scope_id == scope_id) out.push_back(s);
  }
  return out;
}

std::vector<InfrastructureService> InMemoryStore::services_for_organization(Id organization_id) const {
  return list_services(SecretScope::organization, organization_id);
}

std::vector<InfrastructureService> InMemoryStore::services_for_product(Id product_id) const {
  return list_services(SecretScope::product, product_id);
}

StoreQueryCounts InMemoryStore::query_counts() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counts_;
}

}  // namespace sextant
