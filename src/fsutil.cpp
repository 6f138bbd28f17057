#include "strata/fsutil.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <random>

#include <unistd.h>

namespace fs = std::filesystem;

namespace strata {

namespace {

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<std::uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

}  // namespace

AtomicFileWriter::AtomicFileWriter(fs::path target) : target_(std::move(target)) {
  std::error_code ec;
  if (target_.has_parent_path()) fs::create_directories(target_.parent_path(), ec);
  tmp_ = make_tmp_name(target_.has_parent_path() ? target_.parent_path() : fs::path("."));
  file_ = std::fopen(tmp_.c_str(), "wb");
  open_failed_ = file_ == nullptr;
}

AtomicFileWriter::~AtomicFileWriter() { discard(); }

void AtomicFileWriter::discard() noexcept {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
    std::remove(tmp_.c_str());
  }
}

bool AtomicFileWriter::write(const void* data, std::size_t len, std::string* error) {
  if (!file_) {
    if (error) *error = open_failed_ ? "cannot create " + tmp_ : "writer already closed";
    return false;
  }
  if (len > 0 && std::fwrite(data, 1, len, file_) != len) {
    discard();
    if (error) *error = "short write to " + tmp_;
    return false;
  }
  return true;
}

bool AtomicFileWriter::commit(std::string* error) {
  if (!file_) {
    if (error) *error = open_failed_ ? "cannot create " + tmp_ : "writer already closed";
    return false;
  }
  const bool flushed = std::fflush(file_) == 0 && ::fsync(::fileno(file_)) == 0;
  const bool closed = std::fclose(file_) == 0;
  file_ = nullptr;
  if (!flushed || !closed) {
    std::remove(tmp_.c_str());
    if (error) *error = "short write to " + tmp_;
    return false;
  }

  std::error_code ec;
  fs::rename(tmp_, target_, ec);
  if (ec) {
    std::remove(tmp_.c_str());
    if (error) *error = "rename to " + target_.string() + " failed: " + ec.message();
    return false;
  }
  return true;
}

bool atomic_write_file(const fs::path& target, const std::string& data, std::string* error) {
  AtomicFileWriter out(target);
  return out.write(data.data(), data.size(), error) && out.commit(error);
}

std::optional<std::string> read_file(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  if (ifs.bad()) return std::nullopt;
  return data;
}

bool move_file(const fs::path& from, const fs::path& to, std::string* error) {
  std::error_code ec;
  if (!fs::is_regular_file(from, ec)) {
    if (error) *error = "no such file: " + from.string();
    return false;
  }
  if (to.has_parent_path()) fs::create_directories(to.parent_path(), ec);

  fs::rename(from, to, ec);
  if (!ec) return true;
  if (ec != std::errc::cross_device_link) {
    if (error) *error = "rename " + from.string() + " -> " + to.string() + ": " + ec.message();
    return false;
  }

  ec.clear();
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    if (error) *error = "copy " + from.string() + " -> " + to.string() + ": " + ec.message();
    return false;
  }
  fs::remove(from, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(to, ignored);
    if (error) *error = "remove " + from.string() + ": " + ec.message();
    return false;
  }
  return true;
}

bool is_lexically_within(const fs::path& base, const fs::path& candidate) {
  fs::path b = base.lexically_normal();
  if (!b.has_filename() && b != b.root_path()) b = b.parent_path();
  const fs::path c = candidate.lexically_normal();
  const fs::path rel = c.lexically_relative(b);
  if (rel.empty()) return false;
  if (rel == ".") return true;
  const auto first = *rel.begin();
  return first != "..";
}

std::string utc_timestamp_iso8601() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  const std::time_t t = system_clock::to_time_t(now);
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  char buf[40];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
  return out;
}

std::uint64_t unix_ms_now() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

}  // namespace strata
