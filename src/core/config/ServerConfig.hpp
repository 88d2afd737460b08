#pragma once
#include <cstddef>
#include <string>

namespace recstore {

// Everything the process needs, resolved once at startup and handed to the
// components that use it.
struct ServerConfig {
  std::string bind         = "0.0.0.0";
  int         port         = 5000;
  std::string videoDir     = "videos";
  std::string dbPath       = "data/recstore.db";
  std::string schemaPath;                 // empty: look it up (findSchemaPath)
  std::string ffmpegBinary = "ffmpeg";    // empty disables transcoding
  size_t      maxUploadBytes = 256u * 1024 * 1024;
  int         threads      = 8;
  std::string logLevel     = "info";

  static ServerConfig fromEnv();
};

std::string get_env_or(const char* key, const std::string& defval);

// RECSTORE_SCHEMA_PATH if set, else ./schema.sql, else the source tree copy.
std::string findSchemaPath(const ServerConfig& cfg);

} // namespace recstore
