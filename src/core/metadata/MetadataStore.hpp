#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace recstore {

struct ServerConfig;

struct HistoryEvent {
  int64_t     id;
  std::string session_id;
  std::string event;
  std::string details_json;
  int64_t     at;      // epoch seconds
  std::string actor;
};

// Append-only journal of what happened to each session, backed by SQLite.
// The database must already carry the schema (see initDatabase).
class MetadataStore {
public:
  explicit MetadataStore(const std::string& dbPath);
  ~MetadataStore();

  MetadataStore(const MetadataStore&) = delete;
  MetadataStore& operator=(const MetadataStore&) = delete;

  void appendHistory(const std::string& session_id,
                     const std::string& event,
                     const std::string& details_json,
                     int64_t at,
                     const std::string& actor);

  // Events for one session, oldest first.
  std::vector<HistoryEvent> history(const std::string& session_id) const;

private:
  void* db_; // sqlite3*
};

// Self-heals the schema and opens the journal for --serve. Returns null
// (after logging a warning) when the schema or database is unusable, so the
// service can still accept recordings without a journal.
std::unique_ptr<MetadataStore> openJournal(const ServerConfig& cfg);

} // namespace recstore
