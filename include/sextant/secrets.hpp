#pragma once

// sextant/secrets.hpp — Secret store access.
//
// The store maps a secret path to its value. The core only reads; values are
// held transiently in a WorkerContext cache and never logged.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace sextant {

class SecretsProvider {
 public:
  virtual ~SecretsProvider() = default;
  // nullopt if no secret exists at path.
  virtual std::optional<std::string> read_secret(const std::string& path) = 0;
};

class InMemorySecretsProvider : public SecretsProvider {
 public:
  void put(const std::string& path, std::string value);
  void remove(const std::string& path);

  // Simulated store latency; lets tests overlap concurrent readers.
  void set_read_delay(std::chrono::milliseconds delay) { delay_ms_.store(delay.count()); }
  uint64_t read_count() const { return reads_.load(std::memory_order_relaxed); }

  std::optional<std::string> read_secret(const std::string& path) override;

 private:
  std::mutex mu_;
  std::map<std::string, std::string> values_;
  std::atomic<uint64_t> reads_{0};
  std::atomic<long long> delay_ms_{0};
};

// JSON object file {"<path>": "<value>", ...}, loaded once at construction.
// Throws Error(config_file_missing) if the file is missing or malformed.
class FileSecretsProvider : public SecretsProvider {
 public:
  explicit FileSecretsProvider(const std::string& path);
  std::optional<std::string> read_secret(const std::string& path) override;

 private:
  std::map<std::string, std::string> values_;
};

}  // namespace sextant
