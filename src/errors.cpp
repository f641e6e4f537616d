#include "sextant/errors.hpp"

namespace sextant {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::run_not_found: return "run_not_found";
    case ErrorCode::hierarchy_not_found: return "hierarchy_not_found";
    case ErrorCode::environment_config_invalid: return "environment_config_invalid";
    case ErrorCode::secret_unresolved: return "secret_unresolved";
    case ErrorCode::config_file_missing: return "config_file_missing";
    case ErrorCode::transport_failed: return "transport_failed";
    case ErrorCode::codec_failed: return "codec_failed";
    case ErrorCode::stage_failed: return "stage_failed";
    case ErrorCode::cancelled: return "cancelled";
  }
  return "unknown";
}

}  // namespace sextant
