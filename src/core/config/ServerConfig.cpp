#include "ServerConfig.hpp"

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace recstore {

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static int env_int_or(const char* key, int defval, int minval) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  try {
    size_t pos = 0;
    int v = std::stoi(raw, &pos);
    if (pos == raw.size() && v >= minval) return v;
  } catch (const std::exception&) {
  }
  spdlog::warn("ignoring invalid {}={}, using {}", key, raw, defval);
  return defval;
}

ServerConfig ServerConfig::fromEnv() {
  ServerConfig c;
  c.bind           = get_env_or("RECSTORE_BIND", c.bind);
  c.port           = env_int_or("PORT", c.port, 1);
  c.videoDir       = get_env_or("RECSTORE_VIDEO_DIR", c.videoDir);
  c.dbPath         = get_env_or("RECSTORE_DB_PATH", c.dbPath);
  c.schemaPath     = get_env_or("RECSTORE_SCHEMA_PATH", "");
  c.ffmpegBinary   = get_env_or("RECSTORE_FFMPEG", c.ffmpegBinary);
  c.maxUploadBytes = static_cast<size_t>(env_int_or("RECSTORE_MAX_UPLOAD_MB", 256, 1)) * 1024 * 1024;
  c.threads        = env_int_or("RECSTORE_THREADS", c.threads, 1);
  c.logLevel       = get_env_or("RECSTORE_LOG_LEVEL", c.logLevel);
  if (c.port > 65535) {
    spdlog::warn("ignoring out-of-range PORT={}, using 5000", c.port);
    c.port = 5000;
  }
  return c;
}

std::string findSchemaPath(const ServerConfig& cfg) {
  namespace fs = std::filesystem;
  if (!cfg.schemaPath.empty()) {
    if (fs::exists(cfg.schemaPath)) return cfg.schemaPath;
    throw std::runtime_error("schema file not found: " + cfg.schemaPath);
  }
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/metadata)");
}

} // namespace recstore
