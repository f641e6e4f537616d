#include "sextant/env_config.hpp"

#include <fstream>
#include <set>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "sextant/errors.hpp"
#include "sextant/log.hpp"

namespace fs = std::filesystem;

namespace sextant {

namespace {

// ---------------------------------------------------------------------------
// YAML reading
// ---------------------------------------------------------------------------

std::string required_scalar(const YAML::Node& node, const char* key, const std::string& where) {
  const YAML::Node v = node[key];
  if (!v || !v.IsScalar()) {
    throw EnvironmentConfigError("Missing required field '" + std::string(key) + "' in " + where + ".");
  }
  return v.as<std::string>();
}

std::optional<std::string> optional_scalar(const YAML::Node& node, const char* key) {
  const YAML::Node v = node[key];
  if (!v || v.IsNull()) return std::nullopt;
  return v.as<std::string>();
}

// Accepts a sequence or a single scalar.
std::set<CredentialsType> read_credentials_types(const YAML::Node& node, const std::string& where) {
  std::set<CredentialsType> out;
  auto add = [&](const std::string& text) {
    auto t = parse_credentials_type(text);
    if (!t) throw EnvironmentConfigError("Unknown credentials type '" + text + "' in " + where + ".");
    out.insert(*t);
  };
  if (node.IsSequence()) {
    for (const auto& item : node) add(item.as<std::string>());
  } else if (node.IsScalar()) {
    add(node.as<std::string>());
  }
  return out;
}

std::string scalar_or_joined(const YAML::Node& node) {
  if (!node.IsSequence()) return node.as<std::string>();
  std::string out;
  for (const auto& item : node) {
    if (!out.empty()) out += ",";
    out += item.as<std::string>();
  }
  return out;
}

// Kotlin-style map rendering used in diagnostics: {a=1, b=2}.
std::string describe(const DefinitionProperties& props) {
  std::ostringstream o;
  o << "{";
  bool first = true;
  for (const auto& [k, v] : props) {
    if (!first) o << ", ";
    first = false;
    o << k << "=" << v;
  }
  o << "}";
  return o.str();
}

std::string join_sorted(const std::set<std::string>& names) {
  std::ostringstream o;
  o << "[";
  bool first = true;
  for (const auto& n : names) {
    if (!first) o << ", ";
    first = false;
    o << n;
  }
  o << "]";
  return o.str();
}

void report(bool strict, const std::string& message, std::vector<std::string>& warnings) {
  if (strict) throw EnvironmentConfigError(message);
  log_warn("env-config", message);
  warnings.push_back(message);
}

}  // namespace

EnvironmentConfig parse_environment_config_yaml(const std::string& text) {
  EnvironmentConfig config;
  try {
    const YAML::Node doc = YAML::Load(text);
    if (!doc || doc.IsNull()) return config;
    if (doc.Type() != YAML::NodeType::Map) {
      throw EnvironmentConfigError("Environment configuration must be a mapping.");
    }

    if (const auto strict = doc["strict"]) config.strict = strict.as<bool>();

    if (const auto services = doc["infrastructureServices"]) {
      size_t index = 0;
      for (const auto& s : services) {
        const std::string where = "infrastructureServices[" + std::to_string(index++) + "]";
        InfrastructureServiceDeclaration decl;
        decl.name = required_scalar(s, "name", where);
        decl.url = required_scalar(s, "url", where);
        decl.description = optional_scalar(s, "description").value_or("");
        decl.username_secret = required_scalar(s, "usernameSecret", where);
        decl.password_secret = required_scalar(s, "passwordSecret", where);
        if (const auto ct = s["credentialsTypes"]) decl.credentials_types = read_credentials_types(ct, where);
        config.infrastructure_services.push_back(std::move(decl));
      }
    }

    if (const auto defs = doc["environmentDefinitions"]) {
      if (defs.Type() != YAML::NodeType::Map) {
        throw EnvironmentConfigError("environmentDefinitions must map definition types to lists.");
      }
      for (const auto& entry : defs) {
        const std::string type = entry.first.as<std::string>();
        auto& list = config.environment_definitions[type];
        for (const auto& item : entry.second) {
          DefinitionProperties props;
          for (const auto& kv : item) props[kv.first.as<std::string>()] = scalar_or_joined(kv.second);
          list.push_back(std::move(props));
        }
      }
    }

    if (const auto vars = doc["environmentVariables"]) {
      size_t index = 0;
      for (const auto& v : vars) {
        const std::string where = "environmentVariables[" + std::to_string(index++) + "]";
        EnvironmentVariableDeclaration decl;
        decl.name = required_scalar(v, "name", where);
        decl.secret_name = optional_scalar(v, "secretName");
        decl.value = optional_scalar(v, "value");
        config.environment_variables.push_back(std::move(decl));
      }
    }
  } catch (const YAML::Exception& e) {
    throw EnvironmentConfigError("Failed to parse environment configuration: " + std::string(e.what()));
  }
  return config;
}

// ---------------------------------------------------------------------------
// EnvironmentConfigLoader
// ---------------------------------------------------------------------------

EnvironmentConfigLoader::EnvironmentConfigLoader(const SecretRepository& secrets,
                                                 const InfrastructureServiceRepository& services,
                                                 const EnvironmentDefinitionFactory& definitions)
    : secrets_(secrets), services_(services), definitions_(definitions) {}

ResolvedEnvironmentConfig EnvironmentConfigLoader::parse(const fs::path& repository_dir,
                                                         const Hierarchy& hierarchy) const {
  const fs::path file = repository_dir / kConfigFilePath;
  if (!fs::exists(file)) {
    log_debug("env-config", "no environment configuration file", {{"path", file.string()}});
    return {};
  }

  std::ifstream ifs(file, std::ios::binary);
  if (!ifs) throw EnvironmentConfigError("Cannot read environment configuration file " + file.string() + ".");
  std::ostringstream buf;
  buf << ifs.rdbuf();

  log_info("env-config", "parsing environment configuration", {{"path", file.string()}});
  return resolve(parse_environment_config_yaml(buf.str()), hierarchy);
}

ResolvedEnvironmentConfig EnvironmentConfigLoader::resolve(const EnvironmentConfig& config,
                                                           const Hierarchy& hierarchy) const {
  ResolvedEnvironmentConfig out;
  const auto secrets = resolve_secrets(config, hierarchy, out.warnings);
  out.infrastructure_services = materialize_services(config, secrets);
  out.environment_definitions = resolve_definitions(config, hierarchy, out.infrastructure_services, out.warnings);
  out.environment_variables = resolve_variables(config, secrets, out.warnings);
  return out;
}

std::map<std::string, Secret> EnvironmentConfigLoader::resolve_secrets(const EnvironmentConfig& config,
                                                                       const Hierarchy& hierarchy,
                                                                       std::vector<std::string>& warnings) const {
  std::set<std::string> pending;
  for (const auto& v : config.environment_variables) {
    if (v.secret_name) pending.insert(*v.secret_name);
  }
  for (const auto& s : config.infrastructure_services) {
    pending.insert(s.username_secret);
    pending.insert(s.password_secret);
  }

  std::map<std::string, Secret> resolved;
  auto take = [&](const std::vector<Secret>& listed) {
    for (const auto& s : listed) {
      if (pending.erase(s.name)) resolved.emplace(s.name, s);
    }
  };

  if (!pending.empty()) take(secrets_.list_for_repository(hierarchy.repository_id));
  if (!pending.empty()) take(secrets_.list_for_product(hierarchy.product_id));
  if (!pending.empty()) take(secrets_.list_for_organization(hierarchy.organization_id));

  if (!pending.empty()) {
    report(config.strict,
           "Invalid secret names. The following names cannot be resolved: " + join_sorted(pending), warnings);
  }
  return resolved;
}

std::vector<InfrastructureService> EnvironmentConfigLoader::materialize_services(
    const EnvironmentConfig& config, const std::map<std::string, Secret>& secrets) const {
  std::vector<InfrastructureService> out;
  for (const auto& decl : config.infrastructure_services) {
    auto user = secrets.find(decl.username_secret);
    auto pass = secrets.find(decl.password_secret);
    if (user == secrets.end() || pass == secrets.end()) {
      log_debug("env-config", "dropping service with unresolved secrets", {{"service", decl.name}});
      continue;
    }
    InfrastructureService s;
    s.name = decl.name;
    s.url = decl.url;
    s.description = decl.description;
    s.username_secret = user->second;
    s.password_secret = pass->second;
    s.credentials_types = decl.credentials_types;
    out.push_back(std::move(s));
  }
  return out;
}

std::vector<EnvironmentServiceDefinition> EnvironmentConfigLoader::resolve_definitions(
    const EnvironmentConfig& config, const Hierarchy& hierarchy,
    const std::vector<InfrastructureService>& config_services, std::vector<std::string>& warnings) const {
  // Product and organization services are listed at most once, and only if a
  // reference is not satisfied by a nearer source.
  std::optional<std::vector<InfrastructureService>> product_services;
  std::optional<std::vector<InfrastructureService>> organization_services;

  auto find_in = [](const std::vector<InfrastructureService>& list,
                    const std::string& name) -> const InfrastructureService* {
    for (const auto& s : list) {
      if (s.name == name) return &s;
    }
    return nullptr;
  };

  auto lookup = [&](const std::string& name) -> Result<InfrastructureService> {
    if (auto* s = find_in(config_services, name)) return *s;
    if (!product_services) product_services = services_.list_for_product(hierarchy.product_id);
    if (auto* s = find_in(*product_services, name)) return *s;
    if (!organization_services) organization_services = services_.list_for_organization(hierarchy.organization_id);
    if (auto* s = find_in(*organization_services, name)) return *s;
    return Result<InfrastructureService>::failure(ErrorCode::environment_config_invalid,
                                                  "Unknown service: '" + name + "'.");
  };

  std::vector<EnvironmentServiceDefinition> out;
  std::vector<std::string> failures;
  for (const auto& [type, entries] : config.environment_definitions) {
    for (const auto& props : entries) {
      auto ref = props.find(EnvironmentDefinitionFactory::kServiceProperty);
      if (ref == props.end()) {
        failures.push_back("Missing service reference: " + describe(props));
        continue;
      }
      auto created = lookup(ref->second).and_then([&](const InfrastructureService& service) {
        return definitions_.create_definition(type, service, props);
      });
      if (created) {
        out.push_back(std::move(created).value());
      } else {
        failures.push_back(created.error().message);
      }
    }
  }

  if (!failures.empty()) {
    std::string message = "Found invalid environment service definitions:\n";
    for (const auto& f : failures) message += f + "\n";
    report(config.strict, message, warnings);
  }
  return out;
}

std::vector<EnvironmentVariableBinding> EnvironmentConfigLoader::resolve_variables(
    const EnvironmentConfig& config, const std::map<std::string, Secret>& secrets,
    std::vector<std::string>& warnings) const {
  std::vector<EnvironmentVariableBinding> out;
  std::vector<std::string> failures;
  for (const auto& decl : config.environment_variables) {
    if (decl.secret_name && decl.value) {
      failures.push_back("Variable '" + decl.name + "' sets both secretName and value.");
      continue;
    }
    if (decl.value) {
      out.push_back(EnvironmentVariableBinding{decl.name, std::nullopt, decl.value});
      continue;
    }
    if (!decl.secret_name) {
      failures.push_back("Variable '" + decl.name + "' sets neither secretName nor value.");
      continue;
    }
    auto it = secrets.find(*decl.secret_name);
    if (it == secrets.end()) {
      failures.push_back("Variable '" + decl.name + "' references unknown secret '" + *decl.secret_name + "'.");
      continue;
    }
    out.push_back(EnvironmentVariableBinding{decl.name, it->second, std::nullopt});
  }

  if (!failures.empty()) {
    std::string message = "Found invalid environment variable definitions:\n";
    for (size_t i = 0; i < failures.size(); ++i) {
      if (i) message += "\n";
      message += failures[i];
    }
    report(config.strict, message, warnings);
  }
  return out;
}

}  // namespace sextant
