#pragma once

// strata/indicators.hpp — Network indicator extraction from raw bytes.
//
// URLs: "http://" or "https://" followed by a run of URL characters (letters, digits,
// the range '$'..'_', '!' and percent escapes). IPv4: four dot-separated groups of one
// to three digits on word boundaries. An IPv4 candidate is kept only when every octet
// is <= 255 without leading zeros and the address is public: private, loopback,
// link-local, documentation, benchmarking, reserved and broadcast ranges are dropped.
//
// Values are de-duplicated in first-seen order.

#include <string>
#include <string_view>
#include <vector>

namespace strata {

struct Indicators {
  std::vector<std::string> urls;
  std::vector<std::string> ips;

  bool empty() const { return urls.empty() && ips.empty(); }
};

Indicators extract_indicators(std::string_view data);

// Dotted-quad syntax check plus the public-address filter above.
bool is_public_ipv4(std::string_view dotted);

}  // namespace strata
