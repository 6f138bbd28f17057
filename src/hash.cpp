#include "strata/hash.hpp"

#include <array>
#include <fstream>
#include <vector>

extern "C" {
#include <blake3.h>
}

namespace strata {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

struct Blake3Hasher::State {
  blake3_hasher hasher;
};

Blake3Hasher::Blake3Hasher() : state_(std::make_unique<State>()) {
  blake3_hasher_init(&state_->hasher);
}

Blake3Hasher::~Blake3Hasher() = default;

void Blake3Hasher::update(const void* data, std::size_t len) {
  blake3_hasher_update(&state_->hasher, data, len);
}

std::string Blake3Hasher::hex_digest() const {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&state_->hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string blake3_hex(std::string_view payload) {
  Blake3Hasher hasher;
  hasher.update(payload.data(), payload.size());
  return hasher.hex_digest();
}

std::string hash_file_hex(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return {};
  }

  Blake3Hasher hasher;

  constexpr std::size_t buffer_size = 65536;
  std::vector<char> buffer(buffer_size);
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize count = file.gcount();
    if (count > 0) {
      hasher.update(buffer.data(), static_cast<std::size_t>(count));
    }
  }
  if (file.bad()) {
    return {};
  }

  return hasher.hex_digest();
}

std::string short_id(std::string_view content_hash) {
  return std::string(content_hash.substr(0, 8));
}

bool is_hex_digest(std::string_view s) {
  if (s.size() != BLAKE3_OUT_LEN * 2) return false;
  for (char c : s) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) return false;
  }
  return true;
}

std::string hash_backend_version() {
  const char* v = blake3_version();
  return v ? v : "unknown";
}

}  // namespace strata
