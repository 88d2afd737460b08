#include "MetadataStore.hpp"
#include <stdexcept>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "InitDb.hpp"
#include "core/config/ServerConfig.hpp"

namespace recstore {

MetadataStore::MetadataStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db=nullptr;
  // FULLMUTEX: one connection shared by all HTTP worker threads
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr)!=SQLITE_OK) {
    std::string err = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("failed to open db " + dbPath + ": " + err);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

MetadataStore::~MetadataStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void MetadataStore::appendHistory(const std::string& session_id,
                                  const std::string& event,
                                  const std::string& details_json,
                                  int64_t at,
                                  const std::string& actor) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO session_history (session_id, event, details, at, actor)
    VALUES (?,?,?,?,?)
  )SQL";
  sqlite3_stmt* st=nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("appendHistory prepare failed: ") + sqlite3_errmsg(db));
  }
  sqlite3_bind_text(st, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, 2, event.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, 3, details_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st, 4, at);
  sqlite3_bind_text(st, 5, actor.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(st) != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("appendHistory failed: " + err);
  }
  sqlite3_finalize(st);
}

static std::string column_text(sqlite3_stmt* st, int col) {
  auto* p = sqlite3_column_text(st, col);
  return p ? reinterpret_cast<const char*>(p) : std::string();
}

std::vector<HistoryEvent> MetadataStore::history(const std::string& session_id) const {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    SELECT id, session_id, event, details, at, actor
      FROM session_history
     WHERE session_id = ?
     ORDER BY id ASC
  )SQL";
  sqlite3_stmt* st=nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("history prepare failed: ") + sqlite3_errmsg(db));
  }
  sqlite3_bind_text(st, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<HistoryEvent> out;
  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    HistoryEvent ev {
      /*id*/           sqlite3_column_int64(st, 0),
      /*session_id*/   column_text(st, 1),
      /*event*/        column_text(st, 2),
      /*details_json*/ column_text(st, 3),
      /*at*/           sqlite3_column_int64(st, 4),
      /*actor*/        column_text(st, 5)
    };
    out.push_back(std::move(ev));
  }
  if (rc != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("history query failed: " + err);
  }
  sqlite3_finalize(st);
  return out;
}

std::unique_ptr<MetadataStore> openJournal(const ServerConfig& cfg) {
  try {
    initDatabase(cfg.dbPath, findSchemaPath(cfg));
    return std::make_unique<MetadataStore>(cfg.dbPath);
  } catch (const std::exception& e) {
    spdlog::warn("session journal disabled: {}", e.what());
    return nullptr;
  }
}

} // namespace recstore
