#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/config/ServerConfig.hpp"
#include "core/finalize/Finalizer.hpp"
#include "core/metadata/MetadataStore.hpp"
#include "core/storage/DirectoryLister.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/storage/SessionLocks.hpp"
#include "core/util/Time.hpp"
#include "services/api/CapturePage.hpp"

using nlohmann::json;

// -------- helpers --------

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void not_found(httplib::Response& res, const std::string& error) {
  send_json(res, 404, {{"ok", false}, {"error", error}});
}

// Streams a file in 64 KiB pieces instead of loading it into the response.
static void stream_file(httplib::Response& res, const std::string& path, const std::string& filename) {
  namespace fs = std::filesystem;
  const auto size = static_cast<size_t>(fs::file_size(path));
  auto in = std::make_shared<std::ifstream>(path, std::ios::binary);
  if (!*in) throw std::runtime_error("cannot open for read: " + path);

  const std::string ctype = recstore::contentTypeFor(filename);
  res.status = 200;
  res.set_content_provider(
    size, ctype.c_str(),
    [in](size_t offset, size_t length, httplib::DataSink& sink) {
      char buf[64 * 1024];
      in->clear();
      in->seekg(static_cast<std::streamoff>(offset));
      size_t remaining = length;
      while (remaining > 0) {
        in->read(buf, static_cast<std::streamsize>(std::min(remaining, sizeof(buf))));
        auto got = static_cast<size_t>(in->gcount());
        if (got == 0) return false; // file shrank underneath us
        if (!sink.write(buf, got)) return false;
        remaining -= got;
      }
      return true;
    });
}

// Turns escaping exceptions (disk full, permissions, ...) into a 500.
template <typename F>
static httplib::Server::Handler guarded(F f) {
  return [f](const httplib::Request& req, httplib::Response& res) {
    try {
      f(req, res);
    } catch (const std::exception& e) {
      spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
      send_json(res, 500, {{"ok", false}, {"error", "internal error"}});
    }
  };
}

// Journal writes are best effort: the artifact is already on disk.
static void journal(recstore::MetadataStore* store, const std::string& session_id,
                    const char* event, const json& details) {
  if (!store) return;
  try {
    store->appendHistory(session_id, event, details.dump(), recstore::now_epoch(), "api");
  } catch (const std::exception& e) {
    spdlog::warn("journal {} for {} failed: {}", event, session_id, e.what());
  }
}

// -------- server --------

namespace recstore {

void register_routes(httplib::Server& svr, ApiContext& ctx) {
  svr.set_default_headers({{"Access-Control-Allow-Origin", "*"}});

  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
  });

  // CORS preflight
  svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type, X-Chunk-Seq");
  });

  svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
    res.set_content(capture_page_html(), "text/html; charset=utf-8");
  });

  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, {{"ok", true}, {"time", now_iso()}});
  });

  // POST /upload/<session>   Body: next chunk of the recording
  svr.Post(R"(/upload/([^/]+))", guarded([&ctx](const httplib::Request& req, httplib::Response& res) {
    const std::string sid = req.matches[1];
    if (!isSafeName(sid)) { not_found(res, "invalid session"); return; }

    uint64_t total;
    {
      auto lk = ctx.locks.acquire(sid);
      total = ctx.fs.appendChunk(sid, req.body);
    }
    journal(ctx.store, sid, "CHUNK_APPENDED", {{"size", req.body.size()}, {"total", total}});

    res.set_header("X-Received-Bytes", std::to_string(total));
    res.set_header("Access-Control-Expose-Headers", "X-Received-Bytes");
    send_json(res, 200, {
      {"ok", true},
      {"file", artifactName(sid, ArtifactKind::PartialVideo)},
      {"bytes", total}
    });
  }));

  // POST /snapshot/<session>   Body: a complete JPEG; replaces the previous one
  svr.Post(R"(/snapshot/([^/]+))", guarded([&ctx](const httplib::Request& req, httplib::Response& res) {
    const std::string sid = req.matches[1];
    if (!isSafeName(sid)) { not_found(res, "invalid session"); return; }

    std::string file;
    {
      auto lk = ctx.locks.acquire(sid);
      file = ctx.fs.putSnapshot(sid, req.body);
    }
    journal(ctx.store, sid, "SNAPSHOT_STORED", {{"bytes", req.body.size()}});
    send_json(res, 200, {{"ok", true}, {"at", now_iso()}, {"file", file}});
  }));

  svr.Post(R"(/finalize/([^/]+))", guarded([&ctx](const httplib::Request& req, httplib::Response& res) {
    const std::string sid = req.matches[1];
    if (!isSafeName(sid)) { not_found(res, "invalid session"); return; }

    FinalizeResult r;
    {
      // held across transcoding so a late chunk can't start a new partial mid-rename
      auto lk = ctx.locks.acquire(sid);
      r = ctx.finalizer.finalize(sid);
    }

    if (r.status == FinalizeResult::Status::NotFound) {
      journal(ctx.store, sid, "FINALIZE_MISSING", json::object());
      not_found(res, "no recording");
      return;
    }

    json out = {{"ok", true}, {"webm", *r.webm}};
    if (r.mp4) out["mp4"] = *r.mp4;
    if (r.status == FinalizeResult::Status::Finalized) out["at"] = now_iso();

    json details = {{"webm", *r.webm},
                    {"already", r.status == FinalizeResult::Status::AlreadyFinalized}};
    if (r.mp4) details["mp4"] = *r.mp4;
    journal(ctx.store, sid, "FINALIZED", details);

    send_json(res, 200, out);
  }));

  // registered before /snapshot/<session> so "latest" is not read as a session
  svr.Get("/snapshot/latest", guarded([&ctx](const httplib::Request&, httplib::Response& res) {
    auto snap = ctx.lister.latestSnapshot();
    if (!snap) { not_found(res, "no snapshot"); return; }
    stream_file(res, snap->path, snap->filename);
  }));

  svr.Get(R"(/snapshot/([^/]+))", guarded([&ctx](const httplib::Request& req, httplib::Response& res) {
    const std::string sid = req.matches[1];
    if (!isSafeName(sid)) { not_found(res, "invalid session"); return; }
    const std::string name = artifactName(sid, ArtifactKind::Snapshot);
    auto path = ctx.fs.resolve(name);
    if (!path) { not_found(res, "no snapshot"); return; }
    stream_file(res, *path, name);
  }));

  svr.Get("/status", guarded([&ctx](const httplib::Request&, httplib::Response& res) {
    json videos = json::array();
    for (const auto& v : ctx.lister.listVideos()) {
      videos.push_back({
        {"filename", v.filename},
        {"bytes", v.bytes},
        {"modified", v.modified},
        {"url", v.url},
        {"type", std::string(kindName(v.kind))}
      });
    }
    send_json(res, 200, {{"ok", true}, {"videos", videos}, {"server_time", now_iso()}});
  }));

  svr.Get("/latest", guarded([&ctx](const httplib::Request&, httplib::Response& res) {
    auto vid = ctx.lister.latestVideo();
    if (!vid) { not_found(res, "no videos yet"); return; }
    stream_file(res, vid->path, vid->filename);
  }));

  svr.Get(R"(/video/([^/]+))", guarded([&ctx](const httplib::Request& req, httplib::Response& res) {
    const std::string filename = req.matches[1];
    auto path = ctx.fs.resolve(filename);
    if (!path) { not_found(res, "not found"); return; }
    res.set_header("Cache-Control", "no-store");
    stream_file(res, *path, filename);
  }));

  svr.Get(R"(/history/([^/]+))", guarded([&ctx](const httplib::Request& req, httplib::Response& res) {
    const std::string sid = req.matches[1];
    if (!ctx.store) { not_found(res, "no history"); return; }
    auto events = ctx.store->history(sid);
    if (events.empty()) { not_found(res, "no history"); return; }

    json arr = json::array();
    for (const auto& ev : events) {
      json details = json::parse(ev.details_json, nullptr, /*allow_exceptions*/ false);
      if (details.is_discarded()) details = ev.details_json;
      arr.push_back({
        {"event", ev.event},
        {"details", details},
        {"at", iso_utc(static_cast<std::time_t>(ev.at))},
        {"actor", ev.actor}
      });
    }
    send_json(res, 200, {{"ok", true}, {"session", sid}, {"events", arr}});
  }));

  // Fallback for unrouted paths; handlers that already wrote a body keep it
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty())
      send_json(res, 404, {{"ok", false}, {"error", "not found"}});
  });
}

bool run_http_server(ApiContext& ctx, const ServerConfig& cfg) {
  httplib::Server svr;

  const size_t threads = static_cast<size_t>(cfg.threads);
  svr.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  svr.set_payload_max_length(cfg.maxUploadBytes);

  register_routes(svr, ctx);

  spdlog::info("HTTP server listening on http://{}:{}", cfg.bind, cfg.port);
  if (!svr.listen(cfg.bind, cfg.port)) {
    spdlog::error("Failed to bind {}:{}", cfg.bind, cfg.port);
    return false;
  }
  return true;
}

} // namespace recstore
