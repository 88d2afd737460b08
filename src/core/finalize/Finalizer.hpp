#pragma once
#include <optional>
#include <string>

namespace recstore {

class LocalFSBackend;
class Transcoder;

struct FinalizeResult {
  enum class Status { Finalized, AlreadyFinalized, NotFound };

  Status status = Status::NotFound;
  std::optional<std::string> webm;   // file names, not paths
  std::optional<std::string> mp4;
};

// Turns a session's partial upload into <session>.webm and, when a
// transcoder is present and available, <session>.mp4. Callers serialize
// per session.
class Finalizer {
public:
  // transcoder may be null to disable transcoding.
  Finalizer(LocalFSBackend& fs, Transcoder* transcoder)
    : fs_(fs), transcoder_(transcoder) {}

  FinalizeResult finalize(const std::string& session_id);

private:
  std::optional<std::string> tryTranscode_(const std::string& session_id);

  LocalFSBackend& fs_;
  Transcoder* transcoder_;
};

} // namespace recstore
