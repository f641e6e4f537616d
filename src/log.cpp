#include "sextant/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

#include "sextant/jsonlite.hpp"

namespace sextant {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::info)};
std::atomic<int> g_format{static_cast<int>(LogFormat::text)};
std::atomic<LogHook> g_hook{nullptr};
std::mutex g_write_mu;

thread_local LogFields t_fields;

uint64_t now_unix_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string iso_time(uint64_t unix_ms) {
  const std::time_t secs = static_cast<std::time_t>(unix_ms / 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                tm.tm_sec, static_cast<unsigned>(unix_ms % 1000));
  return buf;
}

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
    case LogLevel::off: return "off";
  }
  return "info";
}

std::optional<LogLevel> parse_log_level(const std::string& text) {
  if (text == "debug") return LogLevel::debug;
  if (text == "info") return LogLevel::info;
  if (text == "warn" || text == "warning") return LogLevel::warn;
  if (text == "error") return LogLevel::error;
  if (text == "off" || text == "none") return LogLevel::off;
  return std::nullopt;
}

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level), std::memory_order_relaxed); }
LogLevel log_level() { return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed)); }
void set_log_format(LogFormat format) { g_format.store(static_cast<int>(format), std::memory_order_relaxed); }

void init_logging_from_env() {
  if (const char* lvl = std::getenv("SEXTANT_LOG_LEVEL")) {
    if (auto parsed = parse_log_level(lvl)) set_log_level(*parsed);
  }
  if (const char* fmt = std::getenv("SEXTANT_LOG_FORMAT")) {
    set_log_format(std::string(fmt) == "json" ? LogFormat::json : LogFormat::text);
  }
}

void set_thread_log_fields(LogFields fields) { t_fields = std::move(fields); }

void set_log_hook(LogHook hook) { g_hook.store(hook, std::memory_order_release); }

std::string format_text(const LogRecord& record) {
  std::string line;
  line.reserve(128);
  line += iso_time(record.unix_ms);
  line += ' ';
  line += to_string(record.level);
  line += " [";
  line += record.component;
  line += "] ";
  line += record.message;
  for (const auto& [k, v] : record.fields) {
    line += ' ';
    line += k;
    line += '=';
    line += v;
  }
  return line;
}

std::string format_json(const LogRecord& record) {
  jsonlite::Object o;
  o["ts"] = jsonlite::Value{iso_time(record.unix_ms)};
  o["level"] = jsonlite::Value{to_string(record.level)};
  o["component"] = jsonlite::Value{record.component};
  o["msg"] = jsonlite::Value{record.message};
  if (!record.fields.empty()) o["fields"] = jsonlite::Value{jsonlite::to_object(record.fields)};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

void log(LogLevel level, const std::string& component, const std::string& message,
         const LogFields& fields) {
  if (level == LogLevel::off) return;
  if (static_cast<int>(level) < g_level.load(std::memory_order_relaxed)) return;

  LogRecord record;
  record.level = level;
  record.component = component;
  record.message = message;
  record.fields = t_fields;
  for (const auto& [k, v] : fields) record.fields[k] = v;
  record.unix_ms = now_unix_ms();

  if (LogHook hook = g_hook.load(std::memory_order_acquire)) {
    hook(record);
    return;
  }

  std::string line = static_cast<LogFormat>(g_format.load(std::memory_order_relaxed)) == LogFormat::json
                         ? format_json(record)
                         : format_text(record);
  line += '\n';
  std::lock_guard<std::mutex> lk(g_write_mu);
  std::fwrite(line.data(), 1, line.size(), stderr);
  std::fflush(stderr);
}

}  // namespace sextant
