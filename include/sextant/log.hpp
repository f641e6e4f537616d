#pragma once

// sextant/log.hpp — Structured logging for orchestrator and worker processes.
//
// DESIGN:
//   Every log call produces one LogRecord (level, component, message, fields).
//   Records below the configured threshold are dropped before formatting.
//   Output goes to the registered hook if one is set, otherwise to stderr as
//   either a human-readable text line or a JSON line.
//
// CONFIGURATION (init_logging_from_env):
//   SEXTANT_LOG_LEVEL   debug | info | warn | error | off   (default info)
//   SEXTANT_LOG_FORMAT  text | json                         (default text)
//
// INVARIANTS:
//   - Secret values are never passed as fields; callers log secret paths only.
//   - A single record is written with one write call under a process mutex,
//     so lines from concurrent threads never interleave.

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace sextant {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3, off = 4 };
enum class LogFormat { text, json };

using LogFields = std::map<std::string, std::string>;

struct LogRecord {
  LogLevel level{LogLevel::info};
  std::string component;
  std::string message;
  LogFields fields;
  uint64_t unix_ms{0};
};

std::string to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(const std::string& text);

void set_log_level(LogLevel level);
LogLevel log_level();
void set_log_format(LogFormat format);
void init_logging_from_env();

// Fields attached to every record emitted from the calling thread (worker id,
// node id). Replaces any previous thread fields.
void set_thread_log_fields(LogFields fields);

using LogHook = void (*)(const LogRecord&);
void set_log_hook(LogHook hook);

void log(LogLevel level, const std::string& component, const std::string& message,
         const LogFields& fields = {});

inline void log_debug(const std::string& c, const std::string& m, const LogFields& f = {}) { log(LogLevel::debug, c, m, f); }
inline void log_info(const std::string& c, const std::string& m, const LogFields& f = {}) { log(LogLevel::info, c, m, f); }
inline void log_warn(const std::string& c, const std::string& m, const LogFields& f = {}) { log(LogLevel::warn, c, m, f); }
inline void log_error(const std::string& c, const std::string& m, const LogFields& f = {}) { log(LogLevel::error, c, m, f); }

std::string format_text(const LogRecord& record);
std::string format_json(const LogRecord& record);

}  // namespace sextant
