#pragma once

// sextant/env_definitions.hpp — Package-manager bindings for infrastructure services.
//
// An environment definition says "use service X as a <type> repository with
// these properties". Each supported type is one DefinitionType entry in an
// immutable table built at startup:
//
//   type    mandatory                  optional
//   maven   id                         -
//   npm     -                          scope, email, authMode, alwaysAuth
//   yarn    -                          alwaysAuth, authMode
//   nuget   sourceName, sourcePath     sourceProtocolVersion, authMode
//   conan   name, url                  verifySsl
//
// Every type also accepts `service` (consumed by the resolver) and
// `credentialsTypes` (comma-separated, overrides the service's own types).

#include <map>
#include <set>
#include <string>
#include <vector>

#include "sextant/errors.hpp"
#include "sextant/model.hpp"

namespace sextant {

struct EnvironmentServiceDefinition {
  std::string type;
  InfrastructureService service;
  std::set<CredentialsType> credentials_types;
  DefinitionProperties properties;
};

struct DefinitionType {
  std::string name;
  std::set<std::string> mandatory;
  std::set<std::string> optional;
  // Property -> allowed values. Properties not listed accept anything.
  std::map<std::string, std::set<std::string>> allowed_values;
};

class EnvironmentDefinitionFactory {
 public:
  static constexpr const char* kServiceProperty = "service";
  static constexpr const char* kCredentialsTypeProperty = "credentialsTypes";

  explicit EnvironmentDefinitionFactory(std::vector<DefinitionType> types);

  // maven, npm, yarn, nuget, conan.
  static EnvironmentDefinitionFactory builtin();

  Result<EnvironmentServiceDefinition> create_definition(const std::string& type,
                                                         const InfrastructureService& service,
                                                         const DefinitionProperties& properties) const;

  bool supports(const std::string& type) const { return types_.contains(type); }

 private:
  std::map<std::string, DefinitionType> types_;
};

}  // namespace sextant
