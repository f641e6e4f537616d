#include "sextant/env_definitions.hpp"

#include <sstream>

namespace sextant {

namespace {

std::string join_names(const std::vector<std::string>& names) {
  std::ostringstream o;
  o << "[";
  for (size_t i = 0; i < names.size(); ++i) {
    if (i) o << ", ";
    o << names[i];
  }
  o << "]";
  return o.str();
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

}  // namespace

EnvironmentDefinitionFactory::EnvironmentDefinitionFactory(std::vector<DefinitionType> types) {
  for (auto& t : types) {
    std::string name = t.name;
    types_.emplace(std::move(name), std::move(t));
  }
}

EnvironmentDefinitionFactory EnvironmentDefinitionFactory::builtin() {
  const std::set<std::string> bool_values{"true", "false"};
  return EnvironmentDefinitionFactory({
      DefinitionType{"maven", {"id"}, {}, {}},
      DefinitionType{"npm", {}, {"scope", "email", "authMode", "alwaysAuth"},
                     {{"authMode", {"PASSWORD", "PASSWORD_AUTH", "TOKEN"}}, {"alwaysAuth", bool_values}}},
      DefinitionType{"yarn", {}, {"alwaysAuth", "authMode"},
                     {{"authMode", {"PASSWORD", "AUTH_IDENT", "AUTH_TOKEN"}}, {"alwaysAuth", bool_values}}},
      DefinitionType{"nuget", {"sourceName", "sourcePath"}, {"sourceProtocolVersion", "authMode"},
                     {{"authMode", {"API_KEY", "PASSWORD"}}}},
      DefinitionType{"conan", {"name", "url"}, {"verifySsl"}, {{"verifySsl", bool_values}}},
  });
}

Result<EnvironmentServiceDefinition> EnvironmentDefinitionFactory::create_definition(
    const std::string& type, const InfrastructureService& service, const DefinitionProperties& properties) const {
  auto it = types_.find(type);
  if (it == types_.end()) {
    return Result<EnvironmentServiceDefinition>::failure(
        ErrorCode::environment_config_invalid, "Unsupported type for environment definition: '" + type + "'.");
  }
  const DefinitionType& def = it->second;

  std::vector<std::string> missing;
  for (const auto& m : def.mandatory) {
    if (!properties.contains(m)) missing.push_back(m);
  }
  if (!missing.empty()) {
    return Result<EnvironmentServiceDefinition>::failure(
        ErrorCode::environment_config_invalid,
        "Missing mandatory properties for '" + type + "' definition of service '" + service.name +
            "': " + join_names(missing));
  }

  std::vector<std::string> unsupported;
  DefinitionProperties specific;
  for (const auto& [k, v] : properties) {
    if (k == kServiceProperty || k == kCredentialsTypeProperty) continue;
    if (!def.mandatory.contains(k) && !def.optional.contains(k)) {
      unsupported.push_back(k);
      continue;
    }
    if (auto av = def.allowed_values.find(k); av != def.allowed_values.end() && !av->second.contains(v)) {
      return Result<EnvironmentServiceDefinition>::failure(
          ErrorCode::environment_config_invalid,
          "Invalid value '" + v + "' for property '" + k + "' of '" + type + "' definition.");
    }
    specific[k] = v;
  }
  if (!unsupported.empty()) {
    return Result<EnvironmentServiceDefinition>::failure(
        ErrorCode::environment_config_invalid,
        "Unsupported properties for '" + type + "' definition: " + join_names(unsupported));
  }

  EnvironmentServiceDefinition out;
  out.type = type;
  out.service = service;
  out.credentials_types = service.credentials_types;
  out.properties = std::move(specific);

  if (auto ct = properties.find(kCredentialsTypeProperty); ct != properties.end()) {
    out.credentials_types.clear();
    std::stringstream ss(ct->second);
    std::string item;
    while (std::getline(ss, item, ',')) {
      item = trim(item);
      if (item.empty()) continue;
      auto parsed = parse_credentials_type(item);
      if (!parsed) {
        return Result<EnvironmentServiceDefinition>::failure(
            ErrorCode::environment_config_invalid, "Unknown credentials type '" + item + "'.");
      }
      out.credentials_types.insert(*parsed);
    }
  }
  return out;
}

}  // namespace sextant
