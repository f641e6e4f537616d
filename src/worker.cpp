#include "sextant/worker.hpp"

#include <cstdlib>
#include <mutex>
#include <sstream>
#include <unistd.h>  // getpid, gethostname

#include "sextant/jsonlite.hpp"

namespace sextant {

namespace {

WorkerIdentity g_worker_identity;
std::mutex g_init_mu;
bool g_initialized{false};

std::string get_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0) return buf;
  return "unknown-host";
}

std::string env_nonempty(const char* key, const std::string& fallback) {
  const char* e = std::getenv(key);
  return (e && e[0]) ? std::string(e) : fallback;
}

}  // namespace

WorkerIdentity init_worker_identity(const std::string& role, const std::string& worker_id,
                                    const std::string& node_id) {
  std::lock_guard<std::mutex> lk(g_init_mu);
  g_worker_identity.role = role;
  g_worker_identity.worker_id = worker_id.empty()
      ? env_nonempty("SEXTANT_WORKER_ID", "w-" + std::to_string(static_cast<long>(::getpid())))
      : worker_id;
  g_worker_identity.node_id = node_id.empty() ? env_nonempty("SEXTANT_NODE_ID", get_hostname()) : node_id;
  g_initialized = true;
  return g_worker_identity;
}

const WorkerIdentity& global_worker_identity() {
  {
    std::lock_guard<std::mutex> lk(g_init_mu);
    if (g_initialized) return g_worker_identity;
  }
  init_worker_identity("");
  return g_worker_identity;
}

LogFields identity_log_fields(const WorkerIdentity& w) {
  LogFields f{{"worker_id", w.worker_id}, {"node_id", w.node_id}};
  if (!w.role.empty()) f["role"] = w.role;
  return f;
}

std::string worker_identity_to_json(const WorkerIdentity& w) {
  std::ostringstream o;
  o << "{"
    << "\"worker_id\":\"" << jsonlite::escape(w.worker_id) << "\""
    << ",\"node_id\":\"" << jsonlite::escape(w.node_id) << "\""
    << ",\"role\":\"" << jsonlite::escape(w.role) << "\""
    << "}";
  return o.str();
}

}  // namespace sextant
