#include "sextant/secrets.hpp"

#include <fstream>
#include <iterator>
#include <thread>

#include "sextant/errors.hpp"
#include "sextant/jsonlite.hpp"

namespace sextant {

void InMemorySecretsProvider::put(const std::string& path, std::string value) {
  std::lock_guard<std::mutex> lk(mu_);
  values_[path] = std::move(value);
}

void InMemorySecretsProvider::remove(const std::string& path) {
  std::lock_guard<std::mutex> lk(mu_);
  values_.erase(path);
}

std::optional<std::string> InMemorySecretsProvider::read_secret(const std::string& path) {
  reads_.fetch_add(1, std::memory_order_relaxed);
  if (const auto delay = delay_ms_.load(); delay > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
  }
  std::lock_guard<std::mutex> lk(mu_);
  auto it = values_.find(path);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

FileSecretsProvider::FileSecretsProvider(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw ConfigFileError("secrets file not found: " + path);
  const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(text, &err);
  if (err) throw ConfigFileError("secrets file " + path + " is not valid JSON: " + err->message);
  for (const auto& [k, v] : obj) {
    if (const auto* s = std::get_if<std::string>(&v.v)) values_[k] = *s;
  }
}

std::optional<std::string> FileSecretsProvider::read_secret(const std::string& path) {
  auto it = values_.find(path);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

}  // namespace sextant
