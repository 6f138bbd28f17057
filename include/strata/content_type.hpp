#pragma once

// strata/content_type.hpp — Content-based type sniffing and container dispatch.
//
// The artifact's MIME type always comes from its bytes (libmagic), never from its name.
// The MIME type selects one ContainerFamily, which in turn selects the codec used by the
// Archive Safety Layer. Anything that is not a container is analyzed as a leaf.

#include <mutex>
#include <string>

struct magic_set;

namespace strata {

enum class ContainerFamily {
  none,      // leaf artifact
  zip,       // libarchive, zip reader
  tar,       // libarchive, tar reader behind any compression filter
  external,  // RAR / 7z via an external extractor process
};

std::string to_string(ContainerFamily family);

// Maps a MIME type onto the container family that handles it.
ContainerFamily container_family_for(const std::string& mime_type);

// libmagic handle. One per engine; calls are serialized internally because a magic
// cookie is not safe to share between threads.
class MimeSniffer {
 public:
  MimeSniffer();
  ~MimeSniffer();
  MimeSniffer(const MimeSniffer&) = delete;
  MimeSniffer& operator=(const MimeSniffer&) = delete;

  // MIME type of the file at `path`. Falls back to a signature check of the first bytes,
  // then to "application/octet-stream", when libmagic has no specific answer.
  std::string sniff(const std::string& path) const;

  bool loaded() const { return loaded_; }

 private:
  magic_set* cookie_{nullptr};
  bool loaded_{false};
  mutable std::mutex mu_;
};

}  // namespace strata
