#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

namespace fidx::hasher {

// Read chunk used when streaming file contents into the digest.
constexpr size_t chunk_size = 64 * 1024;

// sha256_hex streams r through SHA-256 and returns the lowercase hex digest.
// Throws std::runtime_error if the stream cannot be read to completion.
std::string sha256_hex(std::istream& r);

// hash_file opens path in binary mode and returns its SHA-256 signature.
std::string hash_file(const std::filesystem::path& path);

// to_hex encodes bytes as lowercase hex.
std::string to_hex(const uint8_t* data, size_t size);

} // namespace fidx::hasher
