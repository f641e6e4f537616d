#include "sextant/hash.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <fstream>
#include <random>
#include <thread>

extern "C" {
#include <blake3.h>
}

namespace sextant {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2] = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string frame_digest(std::string_view envelope_bytes) {
  return hash_domain("frame:", envelope_bytes);
}

std::string audit_chain_digest(std::string_view record_line) {
  return hash_domain("audit:", record_line);
}

std::string hash_file_hex(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return {};

  blake3_hasher hasher;
  blake3_hasher_init(&hasher);

  constexpr std::size_t buffer_size = 65536;
  std::array<char, buffer_size> buffer{};
  while (file.good()) {
    file.read(buffer.data(), buffer_size);
    const std::streamsize count = file.gcount();
    if (count > 0) {
      blake3_hasher_update(&hasher, buffer.data(), static_cast<size_t>(count));
    }
  }

  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string unique_token(std::size_t length) {
  static std::atomic<uint64_t> counter{0};
  static thread_local std::mt19937_64 rng(std::random_device{}());

  // Mix randomness, a process-wide counter and the clock so two threads
  // seeded identically still diverge.
  std::string seed = std::to_string(rng());
  seed += ':';
  seed += std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
  seed += ':';
  seed += std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
  seed += ':';
  seed += std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));

  if (length < 8) length = 8;
  if (length > 64) length = 64;
  return hash_domain("name:", seed).substr(0, length);
}

const char* blake3_library_version() {
  return blake3_version();
}

}  // namespace sextant
