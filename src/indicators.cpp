#include "strata/indicators.hpp"

#include <array>
#include <cstdint>
#include <unordered_set>

namespace strata {

namespace {

constexpr std::size_t kMaxUrlLen = 2048;
constexpr std::size_t kMaxPerKind = 10000;

bool is_word(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_hex(char c) {
  return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool is_url_char(char c) { return (c >= '$' && c <= '_') || (c >= 'a' && c <= 'z') || c == '!'; }

struct Cidr {
  std::uint32_t net;
  int bits;
};

constexpr std::uint32_t ip(unsigned a, unsigned b, unsigned c, unsigned d) {
  return (a << 24) | (b << 16) | (c << 8) | d;
}

constexpr std::array<Cidr, 14> kNonPublic = {{
    {ip(0, 0, 0, 0), 8},
    {ip(10, 0, 0, 0), 8},
    {ip(100, 64, 0, 0), 10},
    {ip(127, 0, 0, 0), 8},
    {ip(169, 254, 0, 0), 16},
    {ip(172, 16, 0, 0), 12},
    {ip(192, 0, 0, 0), 24},
    {ip(192, 0, 2, 0), 24},
    {ip(192, 168, 0, 0), 16},
    {ip(198, 18, 0, 0), 15},
    {ip(198, 51, 100, 0), 24},
    {ip(203, 0, 113, 0), 24},
    {ip(224, 0, 0, 0), 4},
    {ip(240, 0, 0, 0), 4},
}};

bool in_cidr(std::uint32_t addr, const Cidr& c) {
  const std::uint32_t mask = c.bits == 0 ? 0 : ~std::uint32_t{0} << (32 - c.bits);
  return (addr & mask) == (c.net & mask);
}

// Parses a dotted quad starting at data[i]. On success sets `len` to the matched length.
bool match_quad(std::string_view data, std::size_t i, std::size_t& len) {
  std::size_t p = i;
  for (int group = 0; group < 4; ++group) {
    std::size_t digits = 0;
    while (p < data.size() && is_digit(data[p]) && digits < 4) {
      ++p;
      ++digits;
    }
    if (digits == 0 || digits > 3) return false;
    if (group < 3) {
      if (p >= data.size() || data[p] != '.') return false;
      ++p;
    }
  }
  if (p < data.size() && is_word(data[p])) return false;
  len = p - i;
  return true;
}

void add_unique(std::vector<std::string>& out, std::unordered_set<std::string>& seen,
                std::string value) {
  if (out.size() >= kMaxPerKind) return;
  if (seen.insert(value).second) out.push_back(std::move(value));
}

}  // namespace

bool is_public_ipv4(std::string_view dotted) {
  std::uint32_t addr = 0;
  std::size_t p = 0;
  for (int group = 0; group < 4; ++group) {
    const std::size_t start = p;
    unsigned value = 0;
    while (p < dotted.size() && is_digit(dotted[p])) {
      value = value * 10 + static_cast<unsigned>(dotted[p] - '0');
      if (p - start >= 3) return false;
      ++p;
    }
    const std::size_t digits = p - start;
    if (digits == 0 || value > 255) return false;
    if (digits > 1 && dotted[start] == '0') return false;
    addr = (addr << 8) | value;
    if (group < 3) {
      if (p >= dotted.size() || dotted[p] != '.') return false;
      ++p;
    }
  }
  if (p != dotted.size()) return false;
  if (addr == ip(255, 255, 255, 255)) return false;
  for (const auto& c : kNonPublic) {
    if (in_cidr(addr, c)) return false;
  }
  return true;
}

Indicators extract_indicators(std::string_view data) {
  Indicators out;
  std::unordered_set<std::string> seen_urls;
  std::unordered_set<std::string> seen_ips;

  // URLs
  for (std::size_t pos = data.find("http"); pos != std::string_view::npos;
       pos = data.find("http", pos + 1)) {
    std::size_t p = pos + 4;
    if (p < data.size() && data[p] == 's') ++p;
    if (data.substr(p, 3) != "://") continue;
    p += 3;
    const std::size_t body = p;
    while (p < data.size() && p - pos < kMaxUrlLen) {
      if (data[p] == '%' && p + 2 < data.size() && is_hex(data[p + 1]) && is_hex(data[p + 2])) {
        p += 3;
      } else if (is_url_char(data[p])) {
        ++p;
      } else {
        break;
      }
    }
    if (p == body) continue;
    add_unique(out.urls, seen_urls, std::string(data.substr(pos, p - pos)));
    pos = p - 1;
  }

  // IPv4
  std::size_t i = 0;
  while (i < data.size()) {
    if (!is_digit(data[i]) || (i > 0 && is_word(data[i - 1]))) {
      ++i;
      continue;
    }
    std::size_t len = 0;
    if (match_quad(data, i, len)) {
      const std::string candidate(data.substr(i, len));
      if (is_public_ipv4(candidate)) add_unique(out.ips, seen_ips, candidate);
      i += len;
      continue;
    }
    while (i < data.size() && is_digit(data[i])) ++i;
  }
  return out;
}

}  // namespace strata
