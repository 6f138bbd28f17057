#include "strata/producer.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <random>

#include "strata/fsutil.hpp"
#include "strata/hash.hpp"
#include "strata/log.hpp"

namespace fs = std::filesystem;

namespace strata {

namespace {

constexpr std::array<const char*, 16> kTempExtensions = {
    ".crdownload", ".part",     ".download", ".inprogress", "._mp",     ".partial",
    ".dms",        ".bak",      ".opdownload", ".!ut",      ".bc!",     ".xltd",
    ".filepart",   ".tmp",      ".unfinished", ".aria2",
};

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string staging_name() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return ".staging_" + std::to_string(rng());
}

}  // namespace

bool is_temp_download(const std::string& filename) {
  const std::string l = lower(filename);
  for (const char* ext : kTempExtensions) {
    if (l.ends_with(ext)) return true;
  }
  return false;
}

bool matches_file_types(const std::string& filename, const std::vector<std::string>& patterns) {
  if (patterns.empty()) return true;
  for (const auto& p : patterns) {
    if (::fnmatch(p.c_str(), filename.c_str(), 0) == 0) return true;
  }
  return false;
}

std::vector<std::string> scan_directory(const std::string& dir, bool recursive,
                                        const std::vector<std::string>& patterns) {
  std::vector<std::string> out;
  auto consider = [&](const fs::directory_entry& entry) {
    std::error_code ec;
    if (!entry.is_regular_file(ec)) return;
    const std::string name = entry.path().filename().string();
    if (is_temp_download(name) || !matches_file_types(name, patterns)) return;
    out.push_back(entry.path().string());
  };

  std::error_code ec;
  const auto opts = fs::directory_options::skip_permission_denied;
  if (recursive) {
    for (auto it = fs::recursive_directory_iterator(dir, opts, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      consider(*it);
    }
  } else {
    for (auto it = fs::directory_iterator(dir, opts, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
      consider(*it);
    }
  }
  if (ec) log::get("producer")->warn("scan of {} stopped early: {}", dir, ec.message());
  std::sort(out.begin(), out.end());
  return out;
}

Producer::Producer(const QueueStore& queue, const MimeSniffer& sniffer, std::string intake_dir)
    : queue_(queue), sniffer_(sniffer), intake_dir_(std::move(intake_dir)) {}

AddResult Producer::add(const std::string& path) const {
  auto logger = log::get("producer");
  AddResult res;

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    res.detail = "not a regular file: " + path;
    logger->warn("{}", res.detail);
    return res;
  }

  fs::create_directories(intake_dir_, ec);
  const fs::path staged = fs::path(intake_dir_) / staging_name();
  fs::copy_file(path, staged, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    res.detail = "cannot copy " + path + " into intake: " + ec.message();
    logger->error("{}", res.detail);
    return res;
  }

  auto discard_staged = [&] {
    std::error_code rm;
    fs::remove(staged, rm);
  };

  const std::string hash = hash_file_hex(staged.string());
  if (hash.empty()) {
    discard_staged();
    res.detail = "cannot hash " + path;
    logger->error("{}", res.detail);
    return res;
  }
  const std::string mime = sniffer_.sniff(staged.string());
  const std::string job_id = short_id(hash);
  const fs::path shared = fs::path(intake_dir_) / (job_id + "-" + fs::path(path).filename().string());
  const std::string original = fs::absolute(path, ec).lexically_normal().string();
  res.job_id = job_id;

  try {
    queue_.transact([&](std::vector<JobEntry>& jobs) {
      const bool dup = std::any_of(jobs.begin(), jobs.end(),
                                   [&](const JobEntry& j) { return j.content_hash == hash; });
      if (dup) {
        res.outcome = AddOutcome::duplicate;
        return false;
      }
      std::error_code rn;
      fs::rename(staged, shared, rn);
      if (rn) {
        res.detail = "cannot publish intake copy: " + rn.message();
        return false;
      }
      JobEntry job;
      job.job_id = job_id;
      job.original_path = original.empty() ? path : original;
      job.shared_path = shared.string();
      job.content_hash = hash;
      job.status = JobStatus::pending;
      job.created_at = utc_timestamp_iso8601();
      job.file_type = mime;
      jobs.push_back(std::move(job));
      res.outcome = AddOutcome::added;
      return true;
    });
  } catch (const std::exception&) {
    discard_staged();
    if (res.outcome == AddOutcome::added) {
      std::error_code rm;
      fs::remove(shared, rm);
    }
    throw;
  }

  switch (res.outcome) {
    case AddOutcome::added:
      logger->info("queued {} as job {} ({})", path, job_id, mime);
      break;
    case AddOutcome::duplicate:
      discard_staged();
      res.detail = "content already queued";
      logger->info("skipping {}: content {} already queued", path, job_id);
      break;
    case AddOutcome::rejected:
      discard_staged();
      logger->error("{}: {}", path, res.detail);
      break;
  }
  return res;
}

}  // namespace strata
