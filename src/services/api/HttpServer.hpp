#pragma once
#include <string>

namespace httplib { class Server; }

namespace recstore {

class LocalFSBackend;
class DirectoryLister;
class Finalizer;
class SessionLocks;
class MetadataStore;
struct ServerConfig;

// Components the routes dispatch to. All owned by the caller.
// store may be null: uploads then go unjournaled and /history answers 404.
struct ApiContext {
  LocalFSBackend&  fs;
  DirectoryLister& lister;
  Finalizer&       finalizer;
  SessionLocks&    locks;
  MetadataStore*   store;
};

// Installs every endpoint, CORS headers and the JSON 404 fallback on svr.
void register_routes(httplib::Server& svr, ApiContext& ctx);

// Start a blocking HTTP server. Returns false if the port cannot be bound.
bool run_http_server(ApiContext& ctx, const ServerConfig& cfg);

} // namespace recstore
