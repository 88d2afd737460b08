#pragma once
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "ArtifactNaming.hpp"

namespace recstore {

struct ListingEntry {
  std::string  filename;
  std::string  path;
  ArtifactKind kind;
  uint64_t     bytes;
  int64_t      modified_ns;   // ordering key
  std::string  modified;      // ISO-8601 UTC
  std::string  url;           // /video/<filename>
};

// Read-only view over the storage directory, recomputed on every call.
class DirectoryLister {
public:
  explicit DirectoryLister(std::string root) : root_(std::move(root)) {}

  // .mp4 and .webm files, newest first.
  std::vector<ListingEntry> listVideos() const;

  // Newest .mp4 if any exists, else the newest .webm.
  std::optional<ListingEntry> latestVideo() const;

  std::optional<ListingEntry> latestSnapshot() const;

private:
  std::vector<ListingEntry> scan(std::initializer_list<ArtifactKind> kinds) const;

  std::string root_;
};

} // namespace recstore
