#include "DirectoryLister.hpp"
#include "core/util/Time.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace recstore {

std::vector<ListingEntry> DirectoryLister::scan(std::initializer_list<ArtifactKind> kinds) const {
  std::vector<ListingEntry> out;
  std::error_code ec;
  fs::directory_iterator it(root_, ec);
  if (ec) return out; // missing directory lists as empty

  for (const auto& e : it) {
    std::error_code fec;
    if (!e.is_regular_file(fec)) continue;
    const std::string name = e.path().filename().string();
    auto kind = classify(name);
    if (!kind || std::find(kinds.begin(), kinds.end(), *kind) == kinds.end()) continue;

    // stat() for nanosecond mtime in system-clock terms
    struct stat st{};
    if (::stat(e.path().c_str(), &st) != 0) continue; // vanished mid-scan

    ListingEntry entry;
    entry.filename    = name;
    entry.path        = e.path().string();
    entry.kind        = *kind;
    entry.bytes       = static_cast<uint64_t>(st.st_size);
    entry.modified_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
    entry.modified    = iso_utc(st.st_mtim.tv_sec);
    entry.url         = "/video/" + name;
    out.push_back(std::move(entry));
  }

  std::sort(out.begin(), out.end(), [](const ListingEntry& a, const ListingEntry& b) {
    if (a.modified_ns != b.modified_ns) return a.modified_ns > b.modified_ns;
    return a.filename < b.filename;
  });
  return out;
}

std::vector<ListingEntry> DirectoryLister::listVideos() const {
  return scan({ArtifactKind::Transcoded, ArtifactKind::Video});
}

std::optional<ListingEntry> DirectoryLister::latestVideo() const {
  auto vids = listVideos();
  if (vids.empty()) return std::nullopt;

  // newest mp4 wins over any webm; webm only when nothing was transcoded
  for (const auto& v : vids) {
    if (v.kind == ArtifactKind::Transcoded) return v;
  }
  return vids.front();
}

std::optional<ListingEntry> DirectoryLister::latestSnapshot() const {
  auto snaps = scan({ArtifactKind::Snapshot});
  if (snaps.empty()) return std::nullopt;
  return snaps.front();
}

} // namespace recstore
