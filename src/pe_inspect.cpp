#include "strata/pe_inspect.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <optional>

namespace strata {

namespace {

constexpr std::uint16_t kMagicPe32 = 0x10b;
constexpr std::uint16_t kMagicPe32Plus = 0x20b;
constexpr std::size_t kSectionHeaderSize = 40;
constexpr std::size_t kImportDescriptorSize = 20;
constexpr std::size_t kMaxSections = 96;
constexpr std::size_t kMaxDescriptors = 4096;
constexpr std::size_t kMaxThunks = 65536;
constexpr std::size_t kMaxNameLen = 512;

struct Section {
  std::string name;
  std::uint32_t virtual_size;
  std::uint32_t virtual_address;
  std::uint32_t raw_size;
  std::uint32_t raw_ptr;
};

class Reader {
 public:
  explicit Reader(std::string_view b) : b_(b) {}

  bool has(std::uint64_t off, std::uint64_t len) const {
    return off <= b_.size() && len <= b_.size() - off;
  }
  std::uint16_t u16(std::uint64_t off) const {
    need(off, 2);
    return static_cast<std::uint16_t>(byte(off) | (byte(off + 1) << 8));
  }
  std::uint32_t u32(std::uint64_t off) const {
    need(off, 4);
    return static_cast<std::uint32_t>(byte(off)) | (static_cast<std::uint32_t>(byte(off + 1)) << 8) |
           (static_cast<std::uint32_t>(byte(off + 2)) << 16) |
           (static_cast<std::uint32_t>(byte(off + 3)) << 24);
  }
  std::uint64_t u64(std::uint64_t off) const {
    return static_cast<std::uint64_t>(u32(off)) | (static_cast<std::uint64_t>(u32(off + 4)) << 32);
  }
  std::string cstr(std::uint64_t off, std::size_t max_len) const {
    need(off, 1);
    std::string out;
    for (std::uint64_t i = off; i < b_.size() && out.size() < max_len; ++i) {
      if (b_[i] == '\0') return out;
      out.push_back(b_[i]);
    }
    return out;
  }
  std::string_view slice(std::uint64_t off, std::uint64_t len) const {
    if (off >= b_.size()) return {};
    return b_.substr(off, std::min<std::uint64_t>(len, b_.size() - off));
  }
  std::size_t size() const { return b_.size(); }

 private:
  unsigned byte(std::uint64_t off) const { return static_cast<unsigned char>(b_[off]); }
  void need(std::uint64_t off, std::uint64_t len) const {
    if (!has(off, len)) throw PeParseError("read past end of image at offset " + std::to_string(off));
  }

  std::string_view b_;
};

std::optional<std::uint64_t> rva_to_offset(const std::vector<Section>& sections, std::uint32_t rva) {
  for (const auto& s : sections) {
    const std::uint32_t extent = std::max(s.virtual_size, s.raw_size);
    if (rva >= s.virtual_address && rva - s.virtual_address < extent) {
      const std::uint32_t delta = rva - s.virtual_address;
      if (delta >= s.raw_size) return std::nullopt;
      return static_cast<std::uint64_t>(s.raw_ptr) + delta;
    }
  }
  return std::nullopt;
}

bool is_suspicious(const std::string& name) {
  for (const auto& d : suspicious_import_denylist()) {
    if (name.find(d) != std::string::npos) return true;
  }
  return false;
}

}  // namespace

const std::vector<std::string>& suspicious_import_denylist() {
  static const std::vector<std::string> kDenylist = {
      "VirtualAlloc",       "VirtualProtect", "CreateRemoteThread", "WriteProcessMemory",
      "NtUnmapViewOfSection", "QueueUserAPC", "SetThreadContext",
  };
  return kDenylist;
}

double shannon_entropy(std::string_view bytes) {
  if (bytes.empty()) return 0.0;
  std::array<std::uint64_t, 256> counts{};
  for (unsigned char c : bytes) ++counts[c];
  const double n = static_cast<double>(bytes.size());
  double h = 0.0;
  for (auto c : counts) {
    if (c == 0) continue;
    const double p = static_cast<double>(c) / n;
    h -= p * std::log2(p);
  }
  return h;
}

bool looks_like_pe(std::string_view bytes) {
  return bytes.size() >= 2 && bytes[0] == 'M' && bytes[1] == 'Z';
}

ExecutableFacts inspect_pe(std::string_view bytes) {
  const Reader r(bytes);
  if (!looks_like_pe(bytes) || !r.has(0, 0x40)) throw PeParseError("missing MZ header");

  const std::uint32_t pe_off = r.u32(0x3c);
  if (!r.has(pe_off, 24) || bytes.substr(pe_off, 4) != std::string_view("PE\0\0", 4)) {
    throw PeParseError("missing PE signature");
  }

  ExecutableFacts facts;
  const std::uint64_t coff = pe_off + 4ull;
  facts.machine = r.u16(coff);
  const std::uint16_t nsections = r.u16(coff + 2);
  const std::uint16_t opt_size = r.u16(coff + 16);
  if (nsections > kMaxSections) throw PeParseError("implausible section count");

  const std::uint64_t opt = coff + 20;
  const std::uint16_t magic = r.u16(opt);
  std::uint64_t rva_count_off = 0;
  std::uint64_t dirs_off = 0;
  std::size_t thunk_size = 0;
  if (magic == kMagicPe32) {
    facts.format = "PE32";
    rva_count_off = opt + 92;
    dirs_off = opt + 96;
    thunk_size = 4;
  } else if (magic == kMagicPe32Plus) {
    facts.format = "PE32+";
    rva_count_off = opt + 108;
    dirs_off = opt + 112;
    thunk_size = 8;
  } else {
    throw PeParseError("unknown optional header magic");
  }

  std::vector<Section> sections;
  const std::uint64_t table = opt + opt_size;
  for (std::uint16_t i = 0; i < nsections; ++i) {
    const std::uint64_t h = table + i * kSectionHeaderSize;
    if (!r.has(h, kSectionHeaderSize)) throw PeParseError("truncated section table");
    Section s;
    s.name = std::string(r.slice(h, 8));
    s.name = s.name.substr(0, s.name.find('\0'));
    s.virtual_size = r.u32(h + 8);
    s.virtual_address = r.u32(h + 12);
    s.raw_size = r.u32(h + 16);
    s.raw_ptr = r.u32(h + 20);
    sections.push_back(std::move(s));
  }
  facts.section_count = sections.size();

  std::uint64_t end_of_image = 0;
  for (const auto& s : sections) {
    if (s.raw_size == 0) {
      facts.is_packed = true;
      continue;
    }
    const double h = shannon_entropy(r.slice(s.raw_ptr, s.raw_size));
    if (h > kHighEntropyThreshold) facts.high_entropy_sections.push_back({s.name, h});
    end_of_image = std::max<std::uint64_t>(end_of_image, static_cast<std::uint64_t>(s.raw_ptr) + s.raw_size);
  }
  if (end_of_image > 0 && r.size() > end_of_image) {
    facts.has_overlay = true;
    facts.overlay_size = r.size() - end_of_image;
  }

  // Import directory is data directory 1.
  const std::uint32_t rva_count = r.has(rva_count_off, 4) ? r.u32(rva_count_off) : 0;
  if (rva_count < 2 || opt_size < (dirs_off - opt) + 16) return facts;
  const std::uint32_t import_rva = r.u32(dirs_off + 8);
  if (import_rva == 0) return facts;
  const auto desc_off = rva_to_offset(sections, import_rva);
  if (!desc_off) throw PeParseError("import directory outside any section");

  std::size_t thunks_seen = 0;
  for (std::size_t d = 0; d < kMaxDescriptors; ++d) {
    const std::uint64_t at = *desc_off + d * kImportDescriptorSize;
    if (!r.has(at, kImportDescriptorSize)) break;
    const std::uint32_t oft = r.u32(at);
    const std::uint32_t name_rva = r.u32(at + 12);
    const std::uint32_t ft = r.u32(at + 16);
    if (oft == 0 && name_rva == 0 && ft == 0) break;

    const auto thunk_off = rva_to_offset(sections, oft != 0 ? oft : ft);
    if (!thunk_off) continue;
    for (std::uint64_t t = *thunk_off; thunks_seen < kMaxThunks; t += thunk_size, ++thunks_seen) {
      if (!r.has(t, thunk_size)) break;
      const std::uint64_t v = thunk_size == 8 ? r.u64(t) : r.u32(t);
      if (v == 0) break;
      const bool by_ordinal = thunk_size == 8 ? (v >> 63) != 0 : (v >> 31) != 0;
      if (by_ordinal) continue;
      const auto hint_name = rva_to_offset(sections, static_cast<std::uint32_t>(v & 0x7fffffff));
      if (!hint_name || !r.has(*hint_name + 2, 1)) continue;
      const std::string fn = r.cstr(*hint_name + 2, kMaxNameLen);
      ++facts.import_count;
      if (is_suspicious(fn) &&
          std::find(facts.suspicious_imports.begin(), facts.suspicious_imports.end(), fn) ==
              facts.suspicious_imports.end()) {
        facts.suspicious_imports.push_back(fn);
      }
    }
  }
  return facts;
}

}  // namespace strata
