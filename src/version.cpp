#include "sextant/version.hpp"

#include <sstream>

#ifndef SEXTANT_VERSION
#define SEXTANT_VERSION "0.0.0"
#endif

namespace sextant {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver = semver.empty() ? SEXTANT_VERSION : semver;
  m.hash_primitive = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
#if defined(SEXTANT_WITH_ZSTD)
  m.zstd_available = true;
#endif
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"envelope_format\":" << m.envelope_format
    << ",\"spool_format\":" << m.spool_format
    << ",\"audit_log\":" << m.audit_log
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << ",\"zstd\":" << (m.zstd_available ? "true" : "false")
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace sextant
