#include "strata/extract.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>
#include <sstream>

#include "strata/fsutil.hpp"
#include "strata/log.hpp"
#include "strata/process.hpp"

namespace fs = std::filesystem;

namespace strata {

namespace {

std::string sanitize_stem(const std::string& stem) {
  std::string out;
  out.reserve(std::min<std::size_t>(stem.size(), 48));
  for (char c : stem) {
    if (out.size() >= 48) break;
    const bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
    out.push_back(keep ? c : '_');
  }
  if (out.empty() || out == "." || out == "..") out = "archive";
  return out;
}

std::string random_hex8() {
  static thread_local std::mt19937 rng(std::random_device{}());
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(8, '0');
  for (auto& c : out) c = kHex[rng() & 0xf];
  return out;
}

std::string member_name_to_posix(std::string name) {
  std::replace(name.begin(), name.end(), '\\', '/');
  return name;
}

std::string archive_err(struct archive* a) {
  const char* s = archive_error_string(a);
  return s ? s : "unknown archive error";
}

struct ReadArchive {
  struct archive* a{archive_read_new()};
  ReadArchive() = default;
  ReadArchive(const ReadArchive&) = delete;
  ReadArchive& operator=(const ReadArchive&) = delete;
  ~ReadArchive() {
    if (a) archive_read_free(a);
  }
};

void open_reader(ReadArchive& r, const std::string& path, ContainerFamily family) {
  if (!r.a) throw ExtractionError(ErrorCode::io_error, "archive_read_new failed");
  if (family == ContainerFamily::zip) {
    archive_read_support_format_zip(r.a);
  } else {
    archive_read_support_filter_all(r.a);
    archive_read_support_format_tar(r.a);
  }
  if (archive_read_open_filename(r.a, path.c_str(), 10240) != ARCHIVE_OK) {
    throw ExtractionError(ErrorCode::extraction_bad_container,
                          "cannot open " + path + ": " + archive_err(r.a));
  }
}

struct FdGuard {
  int fd;
  ~FdGuard() {
    if (fd >= 0) ::close(fd);
  }
};

std::string first_line(const std::string& text) {
  const auto end = text.find('\n');
  return text.substr(0, std::min<std::size_t>(end, 200));
}

bool is_rar(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  char head[6] = {};
  ifs.read(head, sizeof(head));
  return ifs.gcount() == 6 && std::memcmp(head, "Rar!\x1a\x07", 6) == 0;
}

// Member paths from `7z l -slt` output. Entries follow the "----------" separator; the
// block above it describes the archive itself.
std::vector<std::string> parse_7z_listing(const std::string& out) {
  std::vector<std::string> names;
  std::istringstream in(out);
  std::string line;
  bool in_entries = false;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line == "----------") {
      in_entries = true;
      continue;
    }
    if (in_entries && line.rfind("Path = ", 0) == 0) names.push_back(line.substr(7));
  }
  return names;
}

std::vector<std::string> parse_bare_listing(const std::string& out) {
  std::vector<std::string> names;
  std::istringstream in(out);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!line.empty()) names.push_back(line);
  }
  return names;
}

}  // namespace

// ---------------------------------------------------------------------------
// ScratchDir
// ---------------------------------------------------------------------------

ScratchDir ScratchDir::create(const fs::path& root, const std::string& stem) {
  return create_named(root, sanitize_stem(stem) + "_" + std::to_string(unix_ms_now()) + "_" +
                                random_hex8());
}

ScratchDir ScratchDir::create_named(const fs::path& root, const std::string& name) {
  const fs::path p = root / name;
  std::error_code ec;
  const bool created = fs::create_directory(p, ec);
  if (ec == std::errc::file_exists || (!ec && !created)) {
    throw ExtractionError(ErrorCode::extraction_workdir_collision,
                          "working directory already exists: " + p.string());
  }
  if (ec) {
    throw ExtractionError(ErrorCode::io_error,
                          "cannot create working directory " + p.string() + ": " + ec.message());
  }
  return ScratchDir(p);
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
  if (this != &other) {
    remove_now();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

ScratchDir::~ScratchDir() { remove_now(); }

void ScratchDir::remove_now() noexcept {
  if (path_.empty()) return;
  std::error_code ec;
  fs::remove_all(path_, ec);
  path_.clear();
}

// ---------------------------------------------------------------------------
// Path and metadata checks
// ---------------------------------------------------------------------------

bool member_path_is_safe(const fs::path& base, const std::string& member_name) {
  const std::string name = member_name_to_posix(member_name);
  if (name.empty()) return false;
  if (name.size() >= 2 && std::isalpha(static_cast<unsigned char>(name[0])) && name[1] == ':') {
    return false;
  }
  const fs::path m(name);
  if (m.is_absolute() || m.has_root_name() || m.has_root_directory()) return false;
  return is_lexically_within(base, base / m);
}

std::optional<std::uint64_t> zip_declared_entries(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary | std::ios::ate);
  if (!ifs) return std::nullopt;
  const std::streamoff size = ifs.tellg();
  constexpr std::streamoff kEocdMin = 22;
  constexpr std::streamoff kMaxComment = 0xFFFF;
  if (size < kEocdMin) return std::nullopt;

  const std::streamoff tail = std::min(size, kEocdMin + kMaxComment);
  std::string buf(static_cast<std::size_t>(tail), '\0');
  ifs.seekg(size - tail);
  ifs.read(buf.data(), tail);
  if (ifs.gcount() != tail) return std::nullopt;

  for (std::size_t i = buf.size() - kEocdMin + 1; i-- > 0;) {
    if (std::memcmp(buf.data() + i, "PK\x05\x06", 4) != 0) continue;
    const auto* p = reinterpret_cast<const unsigned char*>(buf.data() + i);
    const std::uint16_t total = static_cast<std::uint16_t>(p[10] | (p[11] << 8));
    if (total == 0xFFFF) return std::nullopt;
    return total;
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// ArchiveExtractor
// ---------------------------------------------------------------------------

ArchiveExtractor::ArchiveExtractor(fs::path scratch_root, ExtractionLimits limits)
    : scratch_root_(std::move(scratch_root)), limits_(std::move(limits)) {}

ExtractionResult ArchiveExtractor::extract(const std::string& container_path,
                                           ContainerFamily family) const {
  auto logger = log::get("extract");
  ExtractionResult res;
  try {
    if (family == ContainerFamily::none) {
      throw ExtractionError(ErrorCode::extraction_unsupported_codec,
                            "not a recognized container: " + container_path);
    }
    std::error_code ec;
    fs::create_directories(scratch_root_, ec);
    ScratchDir dir = ScratchDir::create(scratch_root_, fs::path(container_path).stem().string());

    if (family == ContainerFamily::external) {
      extract_external(container_path, dir.path());
    } else {
      extract_libarchive(container_path, family, dir.path());
    }
    res.members = verify_tree(dir.path());
    logger->debug("extracted {} member(s) of {} ({}) into {}", res.members.size(), container_path,
                  to_string(family), dir.path().string());
    res.dir.emplace(std::move(dir));
  } catch (const ExtractionError& e) {
    res.error = e.code();
    res.detail = e.what();
    res.members.clear();
  } catch (const fs::filesystem_error& e) {
    res.error = ErrorCode::io_error;
    res.detail = e.what();
    res.members.clear();
  }
  if (res.error != ErrorCode::none) {
    logger->warn("{} {}: {}", to_string(res.error), container_path, res.detail);
  }
  return res;
}

void ArchiveExtractor::extract_libarchive(const std::string& container, ContainerFamily family,
                                          const fs::path& work) const {
  if (family == ContainerFamily::zip) {
    const auto declared = zip_declared_entries(container);
    if (declared && *declared > limits_.max_members) {
      throw ExtractionError(ErrorCode::extraction_count_exceeded,
                            "archive declares " + std::to_string(*declared) + " members (limit " +
                                std::to_string(limits_.max_members) + ")");
    }
  }

  // Pass 1: headers only. Nothing touches the disk until every name and the count pass.
  {
    ReadArchive r;
    open_reader(r, container, family);
    std::size_t entries = 0;
    std::uint64_t declared_bytes = 0;
    struct archive_entry* entry = nullptr;
    while (true) {
      const int rc = archive_read_next_header(r.a, &entry);
      if (rc == ARCHIVE_EOF) break;
      if (rc < ARCHIVE_WARN) {
        throw ExtractionError(ErrorCode::extraction_bad_container, archive_err(r.a));
      }
      const char* name = archive_entry_pathname(entry);
      if (!name) throw ExtractionError(ErrorCode::extraction_bad_container, "member without a name");
      if (!member_path_is_safe(work, name)) {
        throw ExtractionError(ErrorCode::extraction_traversal_violation,
                              std::string("member escapes working directory: ") + name);
      }
      if (++entries > limits_.max_members) {
        throw ExtractionError(ErrorCode::extraction_count_exceeded,
                              "archive holds more than " + std::to_string(limits_.max_members) +
                                  " members");
      }
      if (archive_entry_is_encrypted(entry)) {
        throw ExtractionError(ErrorCode::extraction_unsupported_codec,
                              std::string("encrypted member: ") + name);
      }
      if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0) {
        declared_bytes += static_cast<std::uint64_t>(archive_entry_size(entry));
        if (declared_bytes > limits_.max_total_bytes) {
          throw ExtractionError(ErrorCode::extraction_size_exceeded,
                                "declared member sizes exceed " +
                                    std::to_string(limits_.max_total_bytes) + " bytes");
        }
      }
      if (archive_read_data_skip(r.a) < ARCHIVE_WARN) {
        throw ExtractionError(ErrorCode::extraction_bad_container, archive_err(r.a));
      }
    }
  }

  // Pass 2: materialize regular files.
  ReadArchive r;
  open_reader(r, container, family);
  const fs::path base = work.lexically_normal();
  std::uint64_t written = 0;
  struct archive_entry* entry = nullptr;
  while (true) {
    const int rc = archive_read_next_header(r.a, &entry);
    if (rc == ARCHIVE_EOF) break;
    if (rc < ARCHIVE_WARN) {
      throw ExtractionError(ErrorCode::extraction_bad_container, archive_err(r.a));
    }
    const char* raw = archive_entry_pathname(entry);
    if (!raw || !member_path_is_safe(work, raw)) {
      throw ExtractionError(ErrorCode::extraction_traversal_violation,
                            std::string("member escapes working directory: ") + (raw ? raw : ""));
    }
    const fs::path dest = (work / member_name_to_posix(raw)).lexically_normal();
    const auto type = archive_entry_filetype(entry);
    if (type == AE_IFDIR) {
      fs::create_directories(dest);
      continue;
    }
    if (type != AE_IFREG || archive_entry_hardlink(entry) != nullptr) {
      log::get("extract")->debug("skipping non-regular member {}", raw);
      continue;
    }
    if (dest == base || !dest.has_filename()) {
      throw ExtractionError(ErrorCode::extraction_bad_container,
                            std::string("member has no file name: ") + raw);
    }
    fs::create_directories(dest.parent_path());

    FdGuard out{::open(dest.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0600)};
    if (out.fd < 0) {
      throw ExtractionError(ErrorCode::io_error, "cannot create " + dest.string() + ": " +
                                                     std::strerror(errno));
    }
    const void* buf = nullptr;
    size_t len = 0;
    la_int64_t offset = 0;
    while (true) {
      const int drc = archive_read_data_block(r.a, &buf, &len, &offset);
      if (drc == ARCHIVE_EOF) break;
      if (drc < ARCHIVE_WARN) {
        throw ExtractionError(ErrorCode::extraction_bad_container,
                              std::string(raw) + ": " + archive_err(r.a));
      }
      written += len;
      if (written > limits_.max_total_bytes) {
        throw ExtractionError(ErrorCode::extraction_size_exceeded,
                              "extracted bytes exceed " + std::to_string(limits_.max_total_bytes));
      }
      if (len > 0 && ::pwrite(out.fd, buf, len, static_cast<off_t>(offset)) !=
                         static_cast<ssize_t>(len)) {
        throw ExtractionError(ErrorCode::io_error, "short write to " + dest.string());
      }
    }
  }
}

void ArchiveExtractor::extract_external(const std::string& container, const fs::path& work) const {
  const bool rar = is_rar(container);
  std::vector<std::string> candidates = {"7z", "7zz"};
  if (rar) candidates.push_back("unrar");

  std::string tool;
  std::string tool_name;
  for (const auto& c : candidates) {
    tool = find_executable(c, limits_.extractor_search_path);
    if (!tool.empty()) {
      tool_name = c;
      break;
    }
  }
  if (tool.empty()) {
    throw ExtractionError(ErrorCode::extraction_no_extractor,
                          std::string("no extractor found for ") + (rar ? "RAR" : "7z") +
                              " container " + container);
  }
  const bool use_unrar = tool_name == "unrar";

  ProcessSpec spec;
  spec.command = tool;
  spec.env = {{"PATH", limits_.extractor_search_path.empty() ? "/usr/local/bin:/usr/bin:/bin"
                                                            : limits_.extractor_search_path},
              {"LANG", "C"},
              {"LC_ALL", "C"}};
  spec.cwd = work.string();
  spec.timeout_ms = limits_.extractor_timeout_ms;
  spec.max_memory_bytes = 1ull << 31;
  spec.max_file_size_bytes = limits_.max_total_bytes;

  auto run_checked = [&](const char* phase) {
    const auto res = run_process(spec);
    if (!res.error_message.empty()) {
      throw ExtractionError(ErrorCode::io_error, tool + ": " + res.error_message);
    }
    if (res.timed_out) {
      throw ExtractionError(ErrorCode::extraction_timeout,
                            tool_name + " " + phase + " exceeded " +
                                std::to_string(limits_.extractor_timeout_ms) + " ms");
    }
    if (res.exit_code != 0) {
      throw ExtractionError(ErrorCode::extraction_bad_container,
                            tool_name + " " + phase + " exited " + std::to_string(res.exit_code) +
                                ": " + first_line(res.stderr_text.empty() ? res.stdout_text
                                                                          : res.stderr_text));
    }
    return res;
  };

  // List first so names and count are validated before any member is written.
  spec.argv = use_unrar ? std::vector<std::string>{"lb", "-p-", container}
                        : std::vector<std::string>{"l", "-slt", "--", container};
  const auto listing = run_checked("listing");
  if (listing.stdout_truncated) {
    throw ExtractionError(ErrorCode::extraction_count_exceeded, "member listing too large");
  }
  const auto names =
      use_unrar ? parse_bare_listing(listing.stdout_text) : parse_7z_listing(listing.stdout_text);
  if (names.size() > limits_.max_members) {
    throw ExtractionError(ErrorCode::extraction_count_exceeded,
                          "archive lists " + std::to_string(names.size()) + " members (limit " +
                              std::to_string(limits_.max_members) + ")");
  }
  for (const auto& n : names) {
    if (!member_path_is_safe(work, n)) {
      throw ExtractionError(ErrorCode::extraction_traversal_violation,
                            "member escapes working directory: " + n);
    }
  }

  spec.argv = use_unrar
                  ? std::vector<std::string>{"x", "-y", "-o+", "-p-", container, work.string() + "/"}
                  : std::vector<std::string>{"x", "-y", "-bd", "-o" + work.string(), "--", container};
  run_checked("extraction");
}

std::vector<fs::path> ArchiveExtractor::verify_tree(const fs::path& work) const {
  std::vector<fs::path> files;
  std::uint64_t bytes = 0;
  for (auto it = fs::recursive_directory_iterator(work); it != fs::recursive_directory_iterator();
       ++it) {
    const auto st = it->symlink_status();
    if (fs::is_symlink(st)) {
      throw ExtractionError(ErrorCode::extraction_traversal_violation,
                            "symlink on disk after extraction: " + it->path().string());
    }
    if (fs::is_directory(st)) continue;
    if (!fs::is_regular_file(st)) {
      throw ExtractionError(ErrorCode::extraction_bad_container,
                            "special file on disk after extraction: " + it->path().string());
    }
    files.push_back(it->path());
    if (files.size() > limits_.max_members) {
      throw ExtractionError(ErrorCode::extraction_count_exceeded,
                            "more than " + std::to_string(limits_.max_members) +
                                " files on disk after extraction");
    }
    bytes += it->file_size();
    if (bytes > limits_.max_total_bytes) {
      throw ExtractionError(ErrorCode::extraction_size_exceeded,
                            "extracted bytes on disk exceed " +
                                std::to_string(limits_.max_total_bytes));
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

}  // namespace strata
