#pragma once

// sextant/hash.hpp — BLAKE3 hashing for frames, audit chains and unique names.
//
// Domain separation: every use site hashes under its own prefix so a digest
// computed for one purpose can never be replayed as another.
//   "frame:"  spool transport frame integrity
//   "audit:"  audit log chain links
//   "name:"   unique temp directory / frame file names

#include <string>
#include <string_view>

namespace sextant {

// Plain BLAKE3-256, 64 hex chars.
std::string blake3_hex(std::string_view payload);

// BLAKE3 of domain || payload, 64 hex chars.
std::string hash_domain(std::string_view domain, std::string_view payload);

std::string frame_digest(std::string_view envelope_bytes);
std::string audit_chain_digest(std::string_view record_line);

// Stream-hash a file. Returns "" if the file cannot be read.
std::string hash_file_hex(const std::string& path);

// Random, collision-resistant token (hex) suitable for file and directory
// names. length is clamped to [8, 64].
std::string unique_token(std::size_t length = 16);

const char* blake3_library_version();

}  // namespace sextant
