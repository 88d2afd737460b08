#include "Finalizer.hpp"

#include <spdlog/spdlog.h>
#include <exception>

#include "core/storage/LocalFSBackend.hpp"
#include "core/transcode/Transcoder.hpp"

namespace recstore {

FinalizeResult Finalizer::finalize(const std::string& session_id) {
  FinalizeResult r;

  if (fs_.exists(session_id, ArtifactKind::Video)) {
    r.status = FinalizeResult::Status::AlreadyFinalized;
    r.webm = artifactName(session_id, ArtifactKind::Video);
    if (fs_.exists(session_id, ArtifactKind::Transcoded))
      r.mp4 = artifactName(session_id, ArtifactKind::Transcoded);
    return r;
  }

  if (!fs_.exists(session_id, ArtifactKind::PartialVideo)) {
    r.status = FinalizeResult::Status::NotFound;
    return r;
  }

  fs_.promotePartial(session_id);
  spdlog::info("finalized session {}", session_id);

  r.status = FinalizeResult::Status::Finalized;
  r.webm = artifactName(session_id, ArtifactKind::Video);
  r.mp4 = tryTranscode_(session_id);
  return r;
}

std::optional<std::string> Finalizer::tryTranscode_(const std::string& session_id) {
  if (!transcoder_) return std::nullopt;
  if (!transcoder_->available()) {
    spdlog::warn("transcoder unavailable, keeping {} as-is",
                 artifactName(session_id, ArtifactKind::Video));
    return std::nullopt;
  }
  const std::string in  = fs_.pathFor(session_id, ArtifactKind::Video);
  const std::string out = fs_.pathFor(session_id, ArtifactKind::Transcoded);
  try {
    if (!transcoder_->transcode(in, out)) return std::nullopt;
  } catch (const std::exception& e) {
    spdlog::warn("transcode of {} threw: {}", in, e.what());
    return std::nullopt;
  }
  return artifactName(session_id, ArtifactKind::Transcoded);
}

} // namespace recstore
