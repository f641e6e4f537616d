#pragma once

// sextant/spool_transport.hpp — Filesystem spool queue for multi-process deployments.
//
// LAYOUT (one directory per queue, <server_uri>/<queue_name>):
//   tmp/   frames being written
//   new/   frames ready for delivery
//   cur/   frames claimed by a consumer, deleted on ack
//   bad/   frames that failed integrity or decoding
//
// FRAME (SPOOL_FORMAT_VERSION 1):
//   {"v":1,"encoding":"identity|zstd","size":<envelope bytes>,"digest":"<blake3>"}\n
//   <envelope bytes, possibly zstd-compressed>
//
// INVARIANTS:
//   - Send is atomic: write into tmp/, then rename into new/.
//   - A claim is an atomic rename new/x -> cur/x, so exactly one competing
//     consumer wins a frame even across processes.
//   - Frame names start with a zero-padded nanosecond timestamp; sorting names
//     yields delivery order.
//   - Claims older than the lease are moved back to new/ by any receiver
//     (redelivery after a consumer crash).
//   - The digest covers the uncompressed envelope and is checked on every read.

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "sextant/transport.hpp"

namespace sextant {

struct SpoolOptions {
  std::filesystem::path root;
  std::chrono::milliseconds lease{std::chrono::seconds(300)};
  std::chrono::milliseconds poll_interval{50};
  // "zstd" enables compression when built with SEXTANT_WITH_ZSTD.
  std::string compression;

  // root = server_uri/queue_name. Lease and compression come from
  // SEXTANT_SPOOL_LEASE_MS and SEXTANT_SPOOL_COMPRESSION.
  static SpoolOptions from_config(const TransportConfig& config);
};

std::string encode_spool_frame(const std::string& envelope, const std::string& compression);
// nullopt if the header is malformed, the encoding unsupported or the digest
// does not match.
std::optional<std::string> decode_spool_frame(const std::string& frame);

class SpoolSender : public MessageSender {
 public:
  explicit SpoolSender(SpoolOptions options);
  void send(const Message& message) override;

 private:
  SpoolOptions options_;
};

class SpoolReceiver : public MessageReceiver {
 public:
  explicit SpoolReceiver(SpoolOptions options);
  bool receive_one(const MessageHandler& handler, std::chrono::milliseconds timeout) override;

  // Moves claims older than the lease back to new/. Returns the number moved.
  size_t requeue_stale_claims();

 private:
  // Claims the oldest deliverable frame; returns its path in cur/.
  std::optional<std::filesystem::path> claim_next();
  void quarantine(const std::filesystem::path& claimed, const std::string& reason);

  SpoolOptions options_;
};

}  // namespace sextant
