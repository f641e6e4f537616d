#pragma once

// sextant/worker.hpp — Process identity for orchestrator and worker endpoints.
//
// Each process gets one WorkerIdentity at startup. It is attached to every
// log record emitted by endpoint and orchestrator threads and to every audit
// entry, so a run's history shows which process handled each step.
//
// Sources (in priority order):
//   1. Explicit parameters (if non-empty).
//   2. Environment: SEXTANT_WORKER_ID, SEXTANT_NODE_ID.
//   3. Defaults: worker_id = "w-<pid>", node_id = hostname.

#include <string>

#include "sextant/log.hpp"

namespace sextant {

struct WorkerIdentity {
  std::string worker_id;
  std::string node_id;
  // Endpoint served by this process ("orchestrator", "analyzer", ...).
  std::string role;
};

WorkerIdentity init_worker_identity(const std::string& role, const std::string& worker_id = "",
                                    const std::string& node_id = "");

// Returns the identity set by init_worker_identity, initializing a role-less
// one on first use.
const WorkerIdentity& global_worker_identity();

// {"worker_id": ..., "node_id": ..., "role": ...} for set_thread_log_fields.
LogFields identity_log_fields(const WorkerIdentity& w);

std::string worker_identity_to_json(const WorkerIdentity& w);

}  // namespace sextant
