#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ArtifactNaming.hpp"

namespace recstore {

// All artifacts live flat in one directory, named <session><extension>.
// Failures to open/write/rename throw std::runtime_error.
class LocalFSBackend {
public:
  explicit LocalFSBackend(std::string root) : root_(std::move(root)) {}

  const std::string& root() const { return root_; }

  // Creates the root directory if absent.
  void init() const;

  std::string pathFor(const std::string& session_id, ArtifactKind kind) const;
  bool exists(const std::string& session_id, ArtifactKind kind) const;

  // Appends bytes to <session>.webm.partial; returns its new total size.
  std::uint64_t appendChunk(const std::string& session_id, std::string_view bytes);

  // Replaces <session>.jpg with bytes; returns the file name.
  std::string putSnapshot(const std::string& session_id, std::string_view bytes);

  // Renames <session>.webm.partial to <session>.webm.
  void promotePartial(const std::string& session_id);

  // Full path of an existing regular file in the root, by exact file name.
  std::optional<std::string> resolve(std::string_view filename) const;

private:
  std::string root_;
};

} // namespace recstore
