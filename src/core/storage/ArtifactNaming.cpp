#include "ArtifactNaming.hpp"

namespace recstore {

namespace {

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Longest extension first so ".webm.partial" wins over ".partial"-less ".webm".
constexpr ArtifactKind kMatchOrder[] = {
  ArtifactKind::PartialVideo,
  ArtifactKind::Video,
  ArtifactKind::Transcoded,
  ArtifactKind::Snapshot,
};

} // namespace

std::string_view extensionOf(ArtifactKind kind) {
  switch (kind) {
    case ArtifactKind::PartialVideo: return ".webm.partial";
    case ArtifactKind::Video:        return ".webm";
    case ArtifactKind::Transcoded:   return ".mp4";
    case ArtifactKind::Snapshot:     return ".jpg";
  }
  return "";
}

std::string_view kindName(ArtifactKind kind) {
  switch (kind) {
    case ArtifactKind::PartialVideo: return "partial";
    case ArtifactKind::Video:        return "webm";
    case ArtifactKind::Transcoded:   return "mp4";
    case ArtifactKind::Snapshot:     return "jpg";
  }
  return "";
}

std::string artifactName(const std::string& session_id, ArtifactKind kind) {
  return session_id + std::string(extensionOf(kind));
}

bool isSafeName(std::string_view name) {
  if (name.empty() || name == "." || name == "..") return false;
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') return false;
  }
  return true;
}

std::optional<ArtifactKind> classify(std::string_view filename) {
  for (ArtifactKind kind : kMatchOrder) {
    auto ext = extensionOf(kind);
    // a bare ".webm" has no session prefix
    if (filename.size() > ext.size() && ends_with(filename, ext)) return kind;
  }
  return std::nullopt;
}

std::string contentTypeFor(std::string_view filename) {
  auto kind = classify(filename);
  if (!kind) return "application/octet-stream";
  switch (*kind) {
    case ArtifactKind::Video:      return "video/webm";
    case ArtifactKind::Transcoded: return "video/mp4";
    case ArtifactKind::Snapshot:   return "image/jpeg";
    case ArtifactKind::PartialVideo: break;
  }
  return "application/octet-stream";
}

} // namespace recstore
