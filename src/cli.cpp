#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "sextant/audit.hpp"
#include "sextant/config.hpp"
#include "sextant/endpoint.hpp"
#include "sextant/env_config.hpp"
#include "sextant/env_definitions.hpp"
#include "sextant/errors.hpp"
#include "sextant/hash.hpp"
#include "sextant/jsonlite.hpp"
#include "sextant/log.hpp"
#include "sextant/orchestrator.hpp"
#include "sextant/repositories.hpp"
#include "sextant/secrets.hpp"
#include "sextant/stages.hpp"
#include "sextant/transport.hpp"
#include "sextant/version.hpp"
#include "sextant/worker.hpp"
#include "sextant/worker_context.hpp"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.0.0"
#endif

namespace {

std::atomic<bool> g_signalled{false};

void on_signal(int) { g_signalled.store(true); }

void install_signal_handlers() {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
}

// Calls stop() once a termination signal arrived.
template <typename Stoppable>
std::thread watch_signals(Stoppable& target, const std::atomic<bool>& done) {
  return std::thread([&target, &done]() {
    while (!done.load()) {
      if (g_signalled.load()) {
        target.stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });
}

void usage() {
  std::cerr << "usage: sextant health\n"
               "       sextant worker <stage> [--once]\n"
               "       sextant orchestrator [--once]\n"
               "       sextant trigger <run-id>\n"
               "       sextant cancel <run-id>\n";
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (flag == argv[i]) return true;
  }
  return false;
}

std::vector<std::string> positional(int argc, char** argv) {
  std::vector<std::string> out;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0) continue;
    out.emplace_back(argv[i]);
  }
  return out;
}

sextant::Id parse_id(const std::string& text) {
  size_t used = 0;
  unsigned long long v = 0;
  try {
    v = std::stoull(text, &used);
  } catch (const std::logic_error&) {
    used = 0;
  }
  if (used == 0 || used != text.size()) {
    throw sextant::Error(sextant::ErrorCode::run_not_found, "invalid run id '" + text + "'");
  }
  return v;
}

std::chrono::milliseconds receive_timeout() {
  const std::string v = sextant::env_or("SEXTANT_RECEIVE_TIMEOUT_MS", "30000");
  try {
    return std::chrono::milliseconds(std::stoll(v));
  } catch (const std::logic_error&) {
    sextant::log_warn("cli", "invalid SEXTANT_RECEIVE_TIMEOUT_MS ignored", {{"value", v}});
    return std::chrono::milliseconds(30000);
  }
}

struct Backends {
  std::unique_ptr<sextant::InMemoryStore> store;
  std::unique_ptr<sextant::SecretsProvider> secrets;
  std::unique_ptr<sextant::ConfigFileProvider> config_files;
};

Backends open_backends(const sextant::EngineConfig& cfg) {
  Backends b;
  if (!cfg.store_file.empty()) {
    b.store = sextant::InMemoryStore::open_file(cfg.store_file);
  } else {
    sextant::log_warn("cli", "SEXTANT_STORE_FILE not set, using an empty in-memory store");
    b.store = std::make_unique<sextant::InMemoryStore>();
  }
  if (!cfg.secrets_file.empty()) {
    b.secrets = std::make_unique<sextant::FileSecretsProvider>(cfg.secrets_file);
  } else {
    b.secrets = std::make_unique<sextant::InMemorySecretsProvider>();
  }
  b.config_files = std::make_unique<sextant::LocalConfigFileProvider>(cfg.config_dir, cfg.default_config_context);
  return b;
}

int cmd_health() {
  const auto manifest = sextant::version::current_manifest(PROJECT_VERSION);
  const auto registry = sextant::builtin_transport_registry();
  std::string transports;
  for (const auto& t : registry.types()) {
    if (!transports.empty()) transports += ",";
    transports += "\"" + t + "\"";
  }
  std::cout << "{\"manifest\":" << sextant::version::manifest_to_json(manifest)
            << ",\"blake3\":\"" << sextant::blake3_library_version() << "\""
            << ",\"transports\":[" << transports << "]"
            << ",\"worker\":" << sextant::worker_identity_to_json(sextant::global_worker_identity())
            << "}\n";
  return 0;
}

int cmd_worker(const std::string& stage_name, bool once) {
  const auto stage = sextant::parse_stage(stage_name);
  if (!stage) {
    std::cerr << "unknown stage '" << stage_name << "'\n";
    return 1;
  }
  sextant::init_worker_identity(sextant::to_string(*stage));
  const auto cfg = sextant::engine_config_from_env();
  Backends backends = open_backends(cfg);
  const sextant::StoreServiceRepository services(*backends.store);
  const auto definitions = sextant::EnvironmentDefinitionFactory::builtin();
  const sextant::EnvironmentConfigLoader loader(*backends.store, services, definitions);
  const auto reporters = sextant::ReporterRegistry::builtin();
  const auto handlers = sextant::builtin_stage_handlers(
      sextant::StageServices{*backends.config_files, loader, reporters, cfg.report_dir});
  const sextant::StageHandler* handler = handlers.find(*stage);
  if (!handler) {
    std::cerr << "no handler for stage '" << stage_name << "'\n";
    return 1;
  }

  const sextant::WorkerContextFactory contexts(*backends.store, *backends.store, *backends.secrets,
                                               *backends.config_files, cfg.temp_root);
  const auto registry = sextant::builtin_transport_registry();
  const auto ep = sextant::endpoint_for(*stage);
  auto receiver = registry.create_receiver(ep, sextant::transport_config_from_env(ep));
  auto results = registry.create_sender(sextant::Endpoint::orchestrator,
                                        sextant::transport_config_from_env(sextant::Endpoint::orchestrator));

  sextant::WorkerEndpoint endpoint(*stage, contexts, *handler, *results);
  if (once) {
    if (!endpoint.run_once(*receiver, receive_timeout())) {
      sextant::log_info("cli", "no message received");
      return 2;
    }
    return 0;
  }

  install_signal_handlers();
  std::atomic<bool> done{false};
  std::thread watcher = watch_signals(endpoint, done);
  endpoint.serve(*receiver);
  done.store(true);
  watcher.join();
  return 0;
}

int cmd_orchestrator(bool once) {
  sextant::init_worker_identity("orchestrator");
  const auto cfg = sextant::engine_config_from_env();
  Backends backends = open_backends(cfg);
  sextant::RunAuditLog audit(cfg.audit_log);
  const auto registry = sextant::builtin_transport_registry();

  sextant::Orchestrator orchestrator(*backends.store, sextant::make_stage_senders(registry), audit,
                                     sextant::orchestrator_options_from(cfg));
  const auto transport = sextant::transport_config_from_env(sextant::Endpoint::orchestrator);
  auto make_receiver = [&registry, transport]() {
    return registry.create_receiver(sextant::Endpoint::orchestrator, transport);
  };

  if (once) {
    auto receiver = make_receiver();
    if (!orchestrator.run_once(*receiver, receive_timeout())) {
      sextant::log_info("cli", "no message received");
      return 2;
    }
    return 0;
  }

  install_signal_handlers();
  std::atomic<bool> done{false};
  std::thread watcher = watch_signals(orchestrator, done);
  orchestrator.serve(make_receiver);
  done.store(true);
  watcher.join();
  return 0;
}

int cmd_send(const sextant::Payload& payload) {
  const auto registry = sextant::builtin_transport_registry();
  auto sender = registry.create_sender(sextant::Endpoint::orchestrator,
                                       sextant::transport_config_from_env(sextant::Endpoint::orchestrator));
  sextant::Message message;
  message.header.token = sextant::env_or("SEXTANT_TOKEN", "");
  message.header.trace_id = sextant::unique_token(32);
  message.payload = payload;
  sender->send(message);
  std::cout << "{\"type\":\"" << sextant::payload_type(payload) << "\",\"run_id\":"
            << sextant::payload_run_id(payload) << ",\"trace_id\":\"" << message.header.trace_id << "\"}\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  sextant::init_logging_from_env();
  const auto args = positional(argc, argv);
  if (args.empty()) {
    usage();
    return 1;
  }
  const std::string& cmd = args[0];
  const bool once = has_flag(argc, argv, "--once");

  try {
    if (cmd == "health") return cmd_health();
    if (cmd == "worker" && args.size() >= 2) return cmd_worker(args[1], once);
    if (cmd == "orchestrator") return cmd_orchestrator(once);
    if (cmd == "trigger" && args.size() >= 2) return cmd_send(sextant::CreateRun{parse_id(args[1])});
    if (cmd == "cancel" && args.size() >= 2) return cmd_send(sextant::CancelRun{parse_id(args[1])});
  } catch (const sextant::Error& e) {
    std::cerr << "{\"error\":\"" << sextant::to_string(e.code()) << "\",\"message\":\""
              << sextant::jsonlite::escape(e.what()) << "\"}\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "{\"error\":\"internal\",\"message\":\"" << sextant::jsonlite::escape(e.what()) << "\"}\n";
    return 2;
  }

  usage();
  return 1;
}
