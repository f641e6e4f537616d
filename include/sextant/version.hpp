#pragma once

// sextant/version.hpp — Version manifest for every persisted or wire format.
//
// PURPOSE:
//   Orchestrator and workers are deployed independently. A worker built
//   against an older envelope layout must refuse newer frames instead of
//   misreading them, so every component that reads a versioned format checks
//   the matching constant here first.
//
// INVARIANT:
//   Decoders accept versions <= their compiled constant and reject anything
//   newer with a TransportError. Never change a format without a bump.

#include <cstdint>
#include <string>

namespace sextant {
namespace version {

// ---------------------------------------------------------------------------
// ENVELOPE_FORMAT_VERSION
// JSON envelope: {"v", "header": {token, traceId}, "payload": {type, ...}}.
// Adding a required payload field or renaming a payload type requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t ENVELOPE_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// SPOOL_FORMAT_VERSION
// On-disk frame of the spool transport: one header line (JSON) followed by
// the (optionally zstd-compressed) envelope bytes.
// ---------------------------------------------------------------------------
constexpr uint32_t SPOOL_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// AUDIT_LOG_VERSION
// NDJSON run transition records with BLAKE3-chained digests.
// ---------------------------------------------------------------------------
constexpr uint32_t AUDIT_LOG_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256, hex encoded (64 chars).
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t envelope_format{ENVELOPE_FORMAT_VERSION};
  uint32_t spool_format{SPOOL_FORMAT_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string semver;           // e.g. "0.3.0" from the CMake project version
  std::string hash_primitive;   // "blake3"
  std::string build_timestamp;  // from __DATE__/__TIME__
  bool zstd_available{false};
};

VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace sextant
