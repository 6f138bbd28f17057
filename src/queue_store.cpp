#include "strata/queue_store.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <filesystem>
#include <thread>

#include "strata/fsutil.hpp"
#include "strata/hash.hpp"
#include "strata/log.hpp"
#include "strata/version.hpp"

namespace fs = std::filesystem;

namespace strata {

namespace {

void put_if_set(jsonlite::Object& o, const char* key, const std::string& value) {
  if (!value.empty()) o[key] = jsonlite::make_string(value);
}

}  // namespace

jsonlite::Object job_to_json(const JobEntry& job) {
  jsonlite::Object o;
  o["schema_version"] = jsonlite::make_u64(version::QUEUE_FORMAT_VERSION);
  o["job_id"] = jsonlite::make_string(job.job_id);
  o["original_path"] = jsonlite::make_string(job.original_path);
  o["shared_path"] = jsonlite::make_string(job.shared_path);
  o["content_hash"] = jsonlite::make_string(job.content_hash);
  o["status"] = jsonlite::make_string(to_string(job.status));
  o["created_at"] = jsonlite::make_string(job.created_at);
  put_if_set(o, "file_type", job.file_type);
  put_if_set(o, "static_output_path", job.static_output_path);
  put_if_set(o, "report_path", job.report_path);
  put_if_set(o, "report_md_path", job.report_md_path);
  if (job.status == JobStatus::failed) {
    o["error"] = jsonlite::make_string(job.error);
    o["error_code"] = jsonlite::make_string(to_string(job.error_code));
  }
  return o;
}

std::optional<JobEntry> job_from_json(const jsonlite::Object& obj) {
  JobEntry job;
  job.content_hash = jsonlite::get_string(obj, "content_hash");
  const auto status = parse_job_status(jsonlite::get_string(obj, "status"));
  if (job.content_hash.empty() || !status) return std::nullopt;
  job.status = *status;
  job.job_id = jsonlite::get_string(obj, "job_id", short_id(job.content_hash));
  job.original_path = jsonlite::get_string(obj, "original_path");
  job.shared_path = jsonlite::get_string(obj, "shared_path");
  job.created_at = jsonlite::get_string(obj, "created_at");
  job.file_type = jsonlite::get_string(obj, "file_type");
  job.static_output_path = jsonlite::get_string(obj, "static_output_path");
  job.report_path = jsonlite::get_string(obj, "report_path");
  job.report_md_path = jsonlite::get_string(obj, "report_md_path");
  job.error = jsonlite::get_string(obj, "error");
  job.error_code = parse_error_code(jsonlite::get_string(obj, "error_code"));
  return job;
}

bool advance(JobEntry& job, JobStatus to) {
  if (!can_transition(job.status, to)) return false;
  job.status = to;
  return true;
}

std::string queue_to_json(const std::vector<JobEntry>& jobs) {
  jsonlite::Array arr;
  arr.reserve(jobs.size());
  for (const auto& j : jobs) arr.push_back(jsonlite::Value{job_to_json(j)});
  return jsonlite::to_pretty_json(jsonlite::Value{std::move(arr)});
}

// ---------------------------------------------------------------------------
// QueueLock
// ---------------------------------------------------------------------------

QueueLock::QueueLock(const std::string& lock_file, std::chrono::milliseconds timeout) {
  const fs::path p(lock_file);
  std::error_code ec;
  if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

  fd_ = ::open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0) throw std::runtime_error("cannot open queue lock " + lock_file);

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
    if (errno != EWOULDBLOCK && errno != EINTR) {
      ::close(fd_);
      fd_ = -1;
      throw std::runtime_error("flock failed on " + lock_file);
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      ::close(fd_);
      fd_ = -1;
      throw QueueLockTimeout(lock_file);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

QueueLock::~QueueLock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}

// ---------------------------------------------------------------------------
// QueueStore
// ---------------------------------------------------------------------------

QueueStore::QueueStore(std::string queue_file, std::string lock_file,
                       std::chrono::milliseconds lock_timeout)
    : queue_file_(std::move(queue_file)),
      lock_file_(std::move(lock_file)),
      lock_timeout_(lock_timeout) {}

std::vector<JobEntry> QueueStore::read_unlocked() const {
  const auto text = read_file(queue_file_);
  if (!text || text->find_first_not_of(" \t\r\n") == std::string::npos) return {};

  auto quarantine = [&](const std::string& why) {
    auto logger = log::get("queue");
    const std::string aside = queue_file_ + ".corrupt";
    std::error_code ec;
    fs::copy_file(queue_file_, aside, fs::copy_options::overwrite_existing, ec);
    logger->warn("{}: {} ({}); treating queue as empty, original kept at {}",
                 to_string(ErrorCode::queue_corruption), queue_file_, why,
                 ec ? "copy failed: " + ec.message() : aside);
    return std::vector<JobEntry>{};
  };

  std::optional<jsonlite::JsonError> err;
  const auto root = jsonlite::parse_value(*text, &err);
  if (err) return quarantine(err->code + ": " + err->message);
  const auto* arr = std::get_if<jsonlite::Array>(&root.v);
  if (!arr) return quarantine("root is not an array");

  std::vector<JobEntry> jobs;
  jobs.reserve(arr->size());
  for (const auto& item : *arr) {
    const auto* obj = std::get_if<jsonlite::Object>(&item.v);
    if (!obj) return quarantine("entry is not an object");
    auto job = job_from_json(*obj);
    if (!job) return quarantine("entry missing content_hash or status");
    jobs.push_back(std::move(*job));
  }
  return jobs;
}

void QueueStore::write_unlocked(const std::vector<JobEntry>& jobs) const {
  std::string error;
  if (!atomic_write_file(queue_file_, queue_to_json(jobs), &error)) {
    throw std::runtime_error(to_string(ErrorCode::io_error) + ": " + error);
  }
}

std::vector<JobEntry> QueueStore::load() const {
  QueueLock lock(lock_file_, lock_timeout_);
  return read_unlocked();
}

void QueueStore::save(const std::vector<JobEntry>& jobs) const {
  QueueLock lock(lock_file_, lock_timeout_);
  write_unlocked(jobs);
}

bool QueueStore::transact(const std::function<bool(std::vector<JobEntry>&)>& mutate) const {
  QueueLock lock(lock_file_, lock_timeout_);
  auto jobs = read_unlocked();
  if (!mutate(jobs)) return false;
  write_unlocked(jobs);
  return true;
}

}  // namespace strata
