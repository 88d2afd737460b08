// src/main.cpp
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "core/config/ServerConfig.hpp"
#include "core/finalize/Finalizer.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MetadataStore.hpp"
#include "core/storage/DirectoryLister.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/storage/SessionLocks.hpp"
#include "core/transcode/FfmpegTranscoder.hpp"
#include "services/api/HttpServer.hpp"

using namespace recstore;

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade the SQLite session journal\n"
            << "  " << argv0 << " --serve       # start HTTP server (PORT or 5000)\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const ServerConfig cfg = ServerConfig::fromEnv();
    auto lvl = spdlog::level::from_str(cfg.logLevel);
    if (lvl == spdlog::level::off && cfg.logLevel != "off") lvl = spdlog::level::info;
    spdlog::set_level(lvl);

    if (argc > 1 && std::string(argv[1]) == "--init") {
      initDatabase(cfg.dbPath, findSchemaPath(cfg));
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      LocalFSBackend fs(cfg.videoDir);
      fs.init();
      DirectoryLister lister(cfg.videoDir);
      // Self-heal DB on startup (idempotent); recordings still work without it
      auto store = openJournal(cfg);
      SessionLocks locks;

      std::unique_ptr<FfmpegTranscoder> transcoder;
      if (!cfg.ffmpegBinary.empty()) {
        FfmpegOptions opts;
        opts.binary = cfg.ffmpegBinary;
        transcoder = std::make_unique<FfmpegTranscoder>(opts);
        if (transcoder->available())
          spdlog::info("transcoder: {}", cfg.ffmpegBinary);
        else
          spdlog::warn("transcoder {} not available; recordings stay .webm", cfg.ffmpegBinary);
      } else {
        spdlog::info("transcoding disabled");
      }
      Finalizer finalizer(fs, transcoder.get());

      spdlog::info("storing artifacts in {}", cfg.videoDir);
      ApiContext ctx{fs, lister, finalizer, locks, store.get()};
      return run_http_server(ctx, cfg) ? 0 : 1;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
