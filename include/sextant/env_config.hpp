#pragma once

// sextant/env_config.hpp — Environment configuration of a repository and its resolution.
//
// SOURCE:
//   Either `.ort.env.yml` at the root of the checked-out repository, or an
//   EnvironmentConfig passed when the run was triggered. Both have the same
//   shape:
//
//     strict: true
//     infrastructureServices:
//     - name: "Artifactory"
//       url: "https://repo.example.org/releases"
//       usernameSecret: "repoUser"
//       passwordSecret: "repoPassword"
//       credentialsTypes: ["NETRC_FILE"]
//     environmentDefinitions:
//       maven:
//       - service: "Artifactory"
//         id: "releases"
//     environmentVariables:
//     - name: "REPO_TOKEN"
//       secretName: "repoPassword"
//     - name: "MODE"
//       value: "ci"
//
// RESOLUTION ORDER:
//   1. Collect every secret name referenced by variables and services.
//   2. List secrets of repository, product, organization in that order; a
//      scope is queried only while names remain unresolved. Nearer scopes win.
//   3. Unresolved names: strict => EnvironmentConfigError naming all of them,
//      lenient => warning, dependents dropped.
//   4. Inline services survive only if both of their secrets resolved.
//   5. Definitions resolve `service` against inline services, then product,
//      then organization services. All failures are reported in one message
//      under the same policy.
//   6. Variables bind to resolved secrets (or literal values); failures are
//      reported in one message under the same policy.

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sextant/env_definitions.hpp"
#include "sextant/model.hpp"
#include "sextant/repositories.hpp"

namespace sextant {

struct EnvironmentVariableBinding {
  std::string name;
  // Exactly one of these is set.
  std::optional<Secret> secret;
  std::optional<std::string> value;
};

struct ResolvedEnvironmentConfig {
  std::vector<InfrastructureService> infrastructure_services;
  std::vector<EnvironmentServiceDefinition> environment_definitions;
  std::vector<EnvironmentVariableBinding> environment_variables;
  // Diagnostics recorded in lenient mode.
  std::vector<std::string> warnings;

  bool empty() const {
    return infrastructure_services.empty() && environment_definitions.empty() && environment_variables.empty();
  }
};

// Throws EnvironmentConfigError on YAML syntax errors or missing fields.
EnvironmentConfig parse_environment_config_yaml(const std::string& text);

class EnvironmentConfigLoader {
 public:
  static constexpr const char* kConfigFilePath = ".ort.env.yml";

  EnvironmentConfigLoader(const SecretRepository& secrets, const InfrastructureServiceRepository& services,
                          const EnvironmentDefinitionFactory& definitions);

  // Reads kConfigFilePath below repository_dir. A missing file yields an
  // empty result.
  ResolvedEnvironmentConfig parse(const std::filesystem::path& repository_dir, const Hierarchy& hierarchy) const;

  ResolvedEnvironmentConfig resolve(const EnvironmentConfig& config, const Hierarchy& hierarchy) const;

 private:
  std::map<std::string, Secret> resolve_secrets(const EnvironmentConfig& config, const Hierarchy& hierarchy,
                                                std::vector<std::string>& warnings) const;
  std::vector<InfrastructureService> materialize_services(const EnvironmentConfig& config,
                                                          const std::map<std::string, Secret>& secrets) const;
  std::vector<EnvironmentServiceDefinition> resolve_definitions(
      const EnvironmentConfig& config, const Hierarchy& hierarchy,
      const std::vector<InfrastructureService>& config_services, std::vector<std::string>& warnings) const;
  std::vector<EnvironmentVariableBinding> resolve_variables(const EnvironmentConfig& config,
                                                            const std::map<std::string, Secret>& secrets,
                                                            std::vector<std::string>& warnings) const;

  const SecretRepository& secrets_;
  const InfrastructureServiceRepository& services_;
  const EnvironmentDefinitionFactory& definitions_;
};

}  // namespace sextant
