#include "LocalFSBackend.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace recstore {

void LocalFSBackend::init() const {
  fs::create_directories(root_);
}

std::string LocalFSBackend::pathFor(const std::string& session_id, ArtifactKind kind) const {
  return (fs::path(root_) / artifactName(session_id, kind)).string();
}

bool LocalFSBackend::exists(const std::string& session_id, ArtifactKind kind) const {
  std::error_code ec;
  return fs::is_regular_file(pathFor(session_id, kind), ec);
}

std::uint64_t LocalFSBackend::appendChunk(const std::string& session_id, std::string_view bytes) {
  const std::string path = pathFor(session_id, ArtifactKind::PartialVideo);
  {
    std::ofstream os(path, std::ios::binary | std::ios::app);
    if (!os) throw std::runtime_error("cannot open for append: " + path);
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) throw std::runtime_error("append failed: " + path);
  }
  return static_cast<std::uint64_t>(fs::file_size(path));
}

std::string LocalFSBackend::putSnapshot(const std::string& session_id, std::string_view bytes) {
  const std::string path = pathFor(session_id, ArtifactKind::Snapshot);
  std::ofstream os(path, std::ios::binary | std::ios::trunc);
  if (!os) throw std::runtime_error("cannot open for write: " + path);
  os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  os.flush();
  if (!os) throw std::runtime_error("snapshot write failed: " + path);
  return artifactName(session_id, ArtifactKind::Snapshot);
}

void LocalFSBackend::promotePartial(const std::string& session_id) {
  const std::string from = pathFor(session_id, ArtifactKind::PartialVideo);
  const std::string to   = pathFor(session_id, ArtifactKind::Video);
  std::error_code ec;
  fs::rename(from, to, ec);
  if (ec) throw std::runtime_error("rename " + from + " -> " + to + " failed: " + ec.message());
}

std::optional<std::string> LocalFSBackend::resolve(std::string_view filename) const {
  if (!isSafeName(filename)) return std::nullopt;
  fs::path p = fs::path(root_) / std::string(filename);
  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) return std::nullopt;
  return p.string();
}

} // namespace recstore
