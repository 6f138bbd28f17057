#include "strata/vault.hpp"

#include <zstd.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include "strata/fsutil.hpp"
#include "strata/hash.hpp"
#include "strata/jsonlite.hpp"
#include "strata/log.hpp"
#include "strata/version.hpp"

namespace fs = std::filesystem;

namespace strata {

namespace {

constexpr int kZstdLevel = 3;

struct CCtxDeleter {
  void operator()(ZSTD_CCtx* c) const { ZSTD_freeCCtx(c); }
};

std::optional<std::string> decompress_zstd(const std::string& data, std::uint64_t original_size) {
  std::string out;
  out.resize(original_size);
  const size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size) return std::nullopt;
  return out;
}

}  // namespace

SampleVault::SampleVault(std::string root) : root_(std::move(root)) {}

std::string SampleVault::object_path(const std::string& digest) const {
  return (fs::path(root_) / digest.substr(0, 2) / digest.substr(2, 2) / digest).string();
}

std::string SampleVault::meta_path(const std::string& digest) const {
  return object_path(digest) + ".meta";
}

bool SampleVault::contains(const std::string& digest) const {
  if (!is_hex_digest(digest)) return false;
  std::error_code ec;
  return fs::exists(object_path(digest), ec) && fs::exists(meta_path(digest), ec);
}

bool SampleVault::put_file(const std::string& path, const std::string& digest,
                           std::string* error) const {
  auto fail = [&](const std::string& msg) {
    if (error) *error = msg;
    return false;
  };
  if (!is_hex_digest(digest)) return fail("invalid digest: " + digest);
  if (contains(digest)) return true;

  std::ifstream in(path, std::ios::binary);
  if (!in) return fail("cannot read " + path);
  std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx(ZSTD_createCCtx());
  if (!cctx) return fail("cannot allocate zstd context");
  ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, kZstdLevel);

  // One pass: hash the input, compress it, and hash the compressed frame as it is written.
  AtomicFileWriter blob(object_path(digest));
  Blake3Hasher content_hash;
  Blake3Hasher blob_hash;
  std::uint64_t original_size = 0;
  std::uint64_t stored_size = 0;
  std::vector<char> in_buf(ZSTD_CStreamInSize());
  std::vector<char> out_buf(ZSTD_CStreamOutSize());
  std::string werr;

  auto pump = [&](ZSTD_inBuffer& input, ZSTD_EndDirective mode) {
    for (;;) {
      ZSTD_outBuffer output{out_buf.data(), out_buf.size(), 0};
      const size_t remaining = ZSTD_compressStream2(cctx.get(), &output, &input, mode);
      if (ZSTD_isError(remaining)) {
        werr = std::string("zstd compression failed: ") + ZSTD_getErrorName(remaining);
        return false;
      }
      if (output.pos > 0) {
        if (!blob.write(out_buf.data(), output.pos, &werr)) return false;
        blob_hash.update(out_buf.data(), output.pos);
        stored_size += output.pos;
      }
      const bool done = mode == ZSTD_e_end ? remaining == 0 : input.pos == input.size;
      if (done) return true;
    }
  };

  while (in) {
    in.read(in_buf.data(), static_cast<std::streamsize>(in_buf.size()));
    const auto n = static_cast<std::size_t>(in.gcount());
    if (n == 0) break;
    content_hash.update(in_buf.data(), n);
    original_size += n;
    ZSTD_inBuffer input{in_buf.data(), n, 0};
    if (!pump(input, ZSTD_e_continue)) return fail(werr);
  }
  if (in.bad()) return fail("read error on " + path);
  ZSTD_inBuffer end{nullptr, 0, 0};
  if (!pump(end, ZSTD_e_end)) return fail(werr);

  if (content_hash.hex_digest() != digest) {
    return fail("content of " + path + " does not match " + digest);
  }
  if (!blob.commit(&werr)) return fail(werr);

  jsonlite::Object meta;
  meta["schema_version"] = jsonlite::make_u64(version::VAULT_FORMAT_VERSION);
  meta["digest"] = jsonlite::make_string(digest);
  meta["encoding"] = jsonlite::make_string("zstd");
  meta["original_size"] = jsonlite::make_u64(original_size);
  meta["stored_size"] = jsonlite::make_u64(stored_size);
  meta["stored_blob_hash"] = jsonlite::make_string(blob_hash.hex_digest());
  meta["created_at"] = jsonlite::make_string(utc_timestamp_iso8601());
  if (!atomic_write_file(meta_path(digest), jsonlite::to_json(meta), &werr)) {
    std::error_code ec;
    fs::remove(object_path(digest), ec);
    return fail(werr);
  }
  log::get("vault")->debug("stored {} ({} -> {} bytes)", digest, original_size, stored_size);
  return true;
}

std::optional<VaultObjectInfo> SampleVault::info(const std::string& digest) const {
  if (!is_hex_digest(digest)) return std::nullopt;
  const auto text = read_file(meta_path(digest));
  if (!text) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;

  VaultObjectInfo inf;
  inf.digest = jsonlite::get_string(obj, "digest");
  inf.encoding = jsonlite::get_string(obj, "encoding");
  inf.original_size = jsonlite::get_u64(obj, "original_size");
  inf.stored_size = jsonlite::get_u64(obj, "stored_size");
  inf.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash");
  inf.created_at = jsonlite::get_string(obj, "created_at");
  if (inf.digest != digest) return std::nullopt;
  return inf;
}

std::optional<std::string> SampleVault::get(const std::string& digest) const {
  const auto meta = info(digest);
  if (!meta || meta->encoding != "zstd") return std::nullopt;
  const auto stored = read_file(object_path(digest));
  if (!stored) return std::nullopt;
  if (blake3_hex(*stored) != meta->stored_blob_hash) {
    log::get("vault")->warn("stored blob hash mismatch for {}", digest);
    return std::nullopt;
  }
  auto data = decompress_zstd(*stored, meta->original_size);
  if (!data || blake3_hex(*data) != digest) {
    log::get("vault")->warn("content hash mismatch for {}", digest);
    return std::nullopt;
  }
  return data;
}

}  // namespace strata
