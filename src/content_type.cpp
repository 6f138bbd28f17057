#include "strata/content_type.hpp"

#include <magic.h>

#include <array>
#include <cstring>
#include <fstream>

#include "strata/log.hpp"

namespace strata {

namespace {

constexpr const char* kOctetStream = "application/octet-stream";

struct FamilyEntry {
  const char* mime;
  ContainerFamily family;
};

constexpr std::array<FamilyEntry, 15> kFamilies = {{
    {"application/zip", ContainerFamily::zip},
    {"application/x-zip-compressed", ContainerFamily::zip},
    {"application/x-tar", ContainerFamily::tar},
    {"application/gzip", ContainerFamily::tar},
    {"application/x-gzip", ContainerFamily::tar},
    {"application/x-bzip2", ContainerFamily::tar},
    {"application/x-xz", ContainerFamily::tar},
    {"application/zstd", ContainerFamily::tar},
    {"application/x-zstd", ContainerFamily::tar},
    {"application/x-rar-compressed", ContainerFamily::external},
    {"application/x-rar", ContainerFamily::external},
    {"application/vnd.rar", ContainerFamily::external},
    {"application/x-7z-compressed", ContainerFamily::external},
    {"application/x-ustar", ContainerFamily::tar},
    {"application/x-gtar", ContainerFamily::tar},
}};

// Leading-byte signatures for the container formats, used only when libmagic gives no
// specific answer.
std::string sniff_signature(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return kOctetStream;
  char head[512] = {};
  ifs.read(head, sizeof(head));
  const auto n = static_cast<std::size_t>(ifs.gcount());

  auto starts = [&](const char* sig, std::size_t len) {
    return n >= len && std::memcmp(head, sig, len) == 0;
  };
  if (starts("PK\x03\x04", 4) || starts("PK\x05\x06", 4)) return "application/zip";
  if (starts("Rar!\x1a\x07", 6)) return "application/x-rar";
  if (starts("7z\xbc\xaf\x27\x1c", 6)) return "application/x-7z-compressed";
  if (starts("\x1f\x8b", 2)) return "application/gzip";
  if (starts("BZh", 3)) return "application/x-bzip2";
  if (starts("\xfd" "7zXZ\x00", 6)) return "application/x-xz";
  if (n >= 262 && std::memcmp(head + 257, "ustar", 5) == 0) return "application/x-tar";
  if (starts("MZ", 2)) return "application/x-dosexec";
  return kOctetStream;
}

}  // namespace

std::string to_string(ContainerFamily family) {
  switch (family) {
    case ContainerFamily::none: return "none";
    case ContainerFamily::zip: return "zip";
    case ContainerFamily::tar: return "tar";
    case ContainerFamily::external: return "external";
  }
  return "none";
}

ContainerFamily container_family_for(const std::string& mime_type) {
  for (const auto& e : kFamilies) {
    if (mime_type == e.mime) return e.family;
  }
  return ContainerFamily::none;
}

MimeSniffer::MimeSniffer() {
  cookie_ = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
  if (!cookie_) {
    log::get("engine")->warn("magic_open failed; falling back to signature sniffing");
    return;
  }
  if (magic_load(cookie_, nullptr) != 0) {
    log::get("engine")->warn("magic_load failed ({}); falling back to signature sniffing",
                             magic_error(cookie_) ? magic_error(cookie_) : "unknown");
    return;
  }
  loaded_ = true;
}

MimeSniffer::~MimeSniffer() {
  if (cookie_) magic_close(cookie_);
}

std::string MimeSniffer::sniff(const std::string& path) const {
  std::string mime;
  if (loaded_) {
    std::lock_guard<std::mutex> lk(mu_);
    const char* m = magic_file(cookie_, path.c_str());
    if (m) mime = m;
  }
  if (mime.empty() || mime == kOctetStream) mime = sniff_signature(path);
  return mime;
}

}  // namespace strata
