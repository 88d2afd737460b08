#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace recstore {

enum class ArtifactKind {
  PartialVideo,   // <session>.webm.partial, grows while chunks arrive
  Video,          // <session>.webm, the finalized raw recording
  Transcoded,     // <session>.mp4
  Snapshot        // <session>.jpg
};

std::string_view extensionOf(ArtifactKind kind);
std::string_view kindName(ArtifactKind kind);

// File name (no directory) for a session's artifact of the given kind.
std::string artifactName(const std::string& session_id, ArtifactKind kind);

// True when the name is a single path component that stays inside the
// storage directory: non-empty, not "." or "..", no separators or NUL.
bool isSafeName(std::string_view name);

// Inverse of artifactName. nullopt for files this service does not produce.
std::optional<ArtifactKind> classify(std::string_view filename);

std::string contentTypeFor(std::string_view filename);

} // namespace recstore
