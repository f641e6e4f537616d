#include "sextant/spool_transport.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

#if defined(SEXTANT_WITH_ZSTD)
#include <zstd.h>
#endif

#include "sextant/errors.hpp"
#include "sextant/hash.hpp"
#include "sextant/jsonlite.hpp"
#include "sextant/log.hpp"
#include "sextant/version.hpp"

namespace fs = std::filesystem;

namespace sextant {

namespace {

#if defined(SEXTANT_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

void ensure_layout(const fs::path& root) {
  for (const char* sub : {"tmp", "new", "cur", "bad"}) fs::create_directories(root / sub);
}

std::string frame_name() {
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%020lld", static_cast<long long>(ns));
  return std::string(buf) + "-" + unique_token(12) + ".frame";
}

bool atomic_write(const fs::path& tmp_dir, const fs::path& target, const std::string& data) {
  const fs::path tmp = tmp_dir / ("." + unique_token(16));
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::vector<fs::path> sorted_frames(const fs::path& dir) {
  std::vector<fs::path> out;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (entry.path().extension() == ".frame") out.push_back(entry.path());
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace

SpoolOptions SpoolOptions::from_config(const TransportConfig& config) {
  if (config.server_uri.empty()) {
    throw TransportError("spool transport requires a server URI (queue '" + config.queue_name + "')");
  }
  std::string base = config.server_uri;
  if (base.rfind("file://", 0) == 0) base = base.substr(7);

  SpoolOptions o;
  o.root = fs::path(base) / config.queue_name;
  if (const char* lease = std::getenv("SEXTANT_SPOOL_LEASE_MS")) {
    try {
      o.lease = std::chrono::milliseconds(std::stoll(lease));
    } catch (const std::exception&) {
      log_warn("transport.spool", "ignoring invalid SEXTANT_SPOOL_LEASE_MS", {{"value", lease}});
    }
  }
  if (const char* comp = std::getenv("SEXTANT_SPOOL_COMPRESSION")) o.compression = comp;
  return o;
}

std::string encode_spool_frame(const std::string& envelope, const std::string& compression) {
  std::string body = envelope;
  std::string encoding = "identity";
#if defined(SEXTANT_WITH_ZSTD)
  if (compression == "zstd") {
    auto c = compress_zstd(envelope);
    if (!c.empty()) {
      body = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compression;
#endif

  jsonlite::Object header;
  header["v"] = jsonlite::Value{static_cast<std::uint64_t>(version::SPOOL_FORMAT_VERSION)};
  header["encoding"] = jsonlite::Value{encoding};
  header["size"] = jsonlite::Value{static_cast<std::uint64_t>(envelope.size())};
  header["digest"] = jsonlite::Value{frame_digest(envelope)};

  std::string frame = jsonlite::to_json(jsonlite::Value{std::move(header)});
  frame += '\n';
  frame += body;
  return frame;
}

std::optional<std::string> decode_spool_frame(const std::string& frame) {
  const auto nl = frame.find('\n');
  if (nl == std::string::npos) return std::nullopt;

  std::optional<jsonlite::JsonError> err;
  auto header = jsonlite::parse(frame.substr(0, nl), &err);
  if (err) return std::nullopt;
  if (jsonlite::get_u64(header, "v", 0) > version::SPOOL_FORMAT_VERSION) return std::nullopt;

  std::string body = frame.substr(nl + 1);
  const std::string encoding = jsonlite::get_string(header, "encoding", "identity");
  if (encoding == "zstd") {
#if defined(SEXTANT_WITH_ZSTD)
    auto plain = decompress_zstd(body, static_cast<std::size_t>(jsonlite::get_u64(header, "size")));
    if (!plain) return std::nullopt;
    body = std::move(*plain);
#else
    return std::nullopt;
#endif
  } else if (encoding != "identity") {
    return std::nullopt;
  }

  if (frame_digest(body) != jsonlite::get_string(header, "digest")) return std::nullopt;
  return body;
}

// ---------------------------------------------------------------------------
// SpoolSender
// ---------------------------------------------------------------------------

SpoolSender::SpoolSender(SpoolOptions options) : options_(std::move(options)) {
  ensure_layout(options_.root);
}

void SpoolSender::send(const Message& message) {
  const std::string frame = encode_spool_frame(encode(message), options_.compression);
  const fs::path target = options_.root / "new" / frame_name();
  if (!atomic_write(options_.root / "tmp", target, frame)) {
    throw TransportError("failed to write spool frame " + target.string());
  }
  log_debug("transport.spool", "frame sent",
            {{"queue", options_.root.string()}, {"type", payload_type(message.payload)}});
}

// ---------------------------------------------------------------------------
// SpoolReceiver
// ---------------------------------------------------------------------------

SpoolReceiver::SpoolReceiver(SpoolOptions options) : options_(std::move(options)) {
  ensure_layout(options_.root);
}

size_t SpoolReceiver::requeue_stale_claims() {
  const auto now = fs::file_time_type::clock::now();
  size_t moved = 0;
  for (const auto& claimed : sorted_frames(options_.root / "cur")) {
    std::error_code ec;
    const auto mtime = fs::last_write_time(claimed, ec);
    if (ec || now - mtime < options_.lease) continue;
    fs::rename(claimed, options_.root / "new" / claimed.filename(), ec);
    if (!ec) {
      ++moved;
      log_warn("transport.spool", "requeued stale claim", {{"frame", claimed.filename().string()}});
    }
  }
  return moved;
}

std::optional<fs::path> SpoolReceiver::claim_next() {
  for (const auto& candidate : sorted_frames(options_.root / "new")) {
    std::error_code ec;
    // Refresh mtime first so the lease starts at claim time.
    fs::last_write_time(candidate, fs::file_time_type::clock::now(), ec);
    if (ec) continue;  // taken by another consumer
    const fs::path claimed = options_.root / "cur" / candidate.filename();
    fs::rename(candidate, claimed, ec);
    if (!ec) return claimed;
  }
  return std::nullopt;
}

void SpoolReceiver::quarantine(const fs::path& claimed, const std::string& reason) {
  std::error_code ec;
  fs::rename(claimed, options_.root / "bad" / claimed.filename(), ec);
  log_error("transport.spool", "quarantined frame: " + reason,
            {{"frame", claimed.filename().string()}, {"queue", options_.root.string()}});
}

bool SpoolReceiver::receive_one(const MessageHandler& handler, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    requeue_stale_claims();

    if (auto claimed = claim_next()) {
      auto raw = read_file(*claimed);
      if (!raw) {
        quarantine(*claimed, "unreadable");
        continue;
      }
      auto envelope = decode_spool_frame(*raw);
      if (!envelope) {
        quarantine(*claimed, "integrity check failed");
        continue;
      }

      Message message;
      try {
        message = decode(*envelope);
      } catch (const TransportError& e) {
        quarantine(*claimed, e.what());
        continue;
      }

      try {
        handler(message);
      } catch (const std::exception&) {
        std::error_code ec;
        fs::rename(*claimed, options_.root / "new" / claimed->filename(), ec);
        throw;
      }

      std::error_code ec;
      fs::remove(*claimed, ec);
      return true;
    }

    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(options_.poll_interval);
  }
}

}  // namespace sextant
