#pragma once

// sextant/repositories.hpp — Persistence interfaces for runs, hierarchy, secrets and services.
//
// DESIGN:
//   The engine depends only on these interfaces. InMemoryStore implements
//   them (services through StoreServiceRepository). With a backing file it
//   reloads on external change and rewrites the file atomically after every
//   run update, which is enough to share state between the orchestrator and
//   worker processes on one host.
//
// SEED FILE FORMAT (SEXTANT_STORE_FILE):
//   {
//     "hierarchies": [{"organizationId":1,"productId":2,"repositoryId":3}],
//     "secrets":     [{"name":"user","scope":"organization","scopeId":1, ...}],
//     "services":    [{"name":"repo","url":"...","usernameSecret":"user", ...,
//                      "scope":"product","scopeId":2}],
//     "runs":        [{"id":7,"repositoryId":3,"jobConfigs":{...}, ...}],
//     "nextJobId":   1
//   }

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sextant/model.hpp"

namespace sextant {

class RunRepository {
 public:
  virtual ~RunRepository() = default;
  virtual std::optional<Run> get_run(Id run_id) const = 0;
  // All or nothing: if the write fails, throws and the previous state stays visible.
  virtual void store_run(const Run& run) = 0;
  virtual Id allocate_job_id() = 0;
};

class HierarchyRepository {
 public:
  virtual ~HierarchyRepository() = default;
  virtual std::optional<Hierarchy> hierarchy_for_repository(Id repository_id) const = 0;
};

class SecretRepository {
 public:
  virtual ~SecretRepository() = default;
  virtual std::vector<Secret> list_for_organization(Id organization_id) const = 0;
  virtual std::vector<Secret> list_for_product(Id product_id) const = 0;
  virtual std::vector<Secret> list_for_repository(Id repository_id) const = 0;
};

class InfrastructureServiceRepository {
 public:
  virtual ~InfrastructureServiceRepository() = default;
  virtual std::vector<InfrastructureService> list_for_organization(Id organization_id) const = 0;
  virtual std::vector<InfrastructureService> list_for_product(Id product_id) const = 0;
};

// Per-scope listing counters, used to observe short-circuiting lookups.
struct StoreQueryCounts {
  uint64_t secrets_repository{0};
  uint64_t secrets_product{0};
  uint64_t secrets_organization{0};
  uint64_t services_product{0};
  uint64_t services_organization{0};
};

class InMemoryStore : public RunRepository,
                      public HierarchyRepository,
                      public SecretRepository {
 public:
  InMemoryStore() = default;

  // Seed from a JSON file and keep it as backing store. Throws
  // ConfigFileError if the file is missing or malformed.
  static std::unique_ptr<InMemoryStore> open_file(const std::filesystem::path& path);

  void load_json(const std::string& text);
  std::string to_json() const;

  void add_hierarchy(const Hierarchy& hierarchy);
  // Sets path from the naming convention when empty.
  Secret add_secret(Secret secret);
  void add_service(InfrastructureService service);

  // RunRepository
  std::optional<Run> get_run(Id run_id) const override;
  void store_run(const Run& run) override;
  Id allocate_job_id() override;

  // HierarchyRepository
  std::optional<Hierarchy> hierarchy_for_repository(Id repository_id) const override;

  // SecretRepository
  std::vector<Secret> list_for_organization(Id organization_id) const override;
  std::vector<Secret> list_for_product(Id product_id) const override;
  std::vector<Secret> list_for_repository(Id repository_id) const override;

  // Exposed as InfrastructureServiceRepository via StoreServiceRepository.
  std::vector<InfrastructureService> services_for_organization(Id organization_id) const;
  std::vector<InfrastructureService> services_for_product(Id product_id) const;

  StoreQueryCounts query_counts() const;

 private:
  std::vector<InfrastructureService> list_services(SecretScope scope, Id scope_id) const;
  std::vector<Secret> list_secrets(SecretScope scope, Id scope_id) const;

  void reload_if_changed() const;
  void persist_locked() const;
  std::string to_json_locked() const;
  void load_json_locked(const std::string& text) const;

  mutable std::mutex mu_;
  // Refreshed from the backing file on read, hence mutable.
  mutable std::map<Id, Run> runs_;
  mutable std::map<Id, Hierarchy> hierarchies_;  // keyed by repository id
  mutable std::vector<Secret> secrets_;
  mutable std::vector<InfrastructureService> services_;
  mutable Id next_job_id_{1};
  mutable Id next_secret_id_{1};
  mutable StoreQueryCounts counts_;

  std::filesystem::path backing_;
  mutable std::filesystem::file_time_type backing_mtime_{};
};

// Adapter exposing an InMemoryStore through InfrastructureServiceRepository.
// The store cannot override both list_for_* families directly because the
// signatures collide.
class StoreServiceRepository : public InfrastructureServiceRepository {
 public:
  explicit StoreServiceRepository(const InMemoryStore& store) : store_(store) {}
  std::vector<InfrastructureService> list_for_organization(Id organization_id) const override {
    return store_.services_for_organization(organization_id);
  }
  std::vector<InfrastructureService> list_for_product(Id product_id) const override {
    return store_.services_for_product(product_id);
  }

 private:
  const InMemoryStore& store_;
};

}  // namespace sextant
