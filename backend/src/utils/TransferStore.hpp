#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <sqlite3.h>

namespace tb::storage {

struct TransferRecord {
  std::string id;
  std::string torrent_name;
  std::string torrent_hash;
  std::string source_client;
  std::string target_client;
  std::optional<std::string> connection_name;
  std::string media_type = "unknown";
  std::optional<std::string> media_manager;
  std::optional<std::int64_t> size_bytes;
  std::int64_t bytes_transferred = 0;
  std::string status = "pending";
  std::optional<std::string> error_message;
  std::string created_at;
  std::optional<std::string> started_at;
  std::optional<std::string> completed_at;
};

struct TransferQuery {
  std::optional<std::string> status;
  std::optional<std::string> source;
  std::optional<std::string> target;
  std::optional<std::string> search;
  std::optional<std::string> start_date;
  std::optional<std::string> end_date;
  int page = 1;
  int per_page = 25;
  std::string sort = "created_at";
  std::string order = "desc";
};

struct TransferPage {
  std::vector<TransferRecord> records;
  std::int64_t total = 0;
};

struct TransferCounts {
  std::int64_t total = 0;
  std::int64_t completed = 0;
  std::int64_t failed = 0;
  std::int64_t pending = 0;
  std::int64_t transferring = 0;
  std::int64_t completed_bytes = 0;
};

// SQLite-backed table of transfer attempts. Not thread-safe on its own;
// TransferHistoryStore owns one instance and serializes access on its worker.
class Database {
public:
  explicit Database(std::filesystem::path path);
  ~Database();

  Database(Database const &) = delete;
  Database &operator=(Database const &) = delete;

  bool is_valid() const noexcept { return db_ != nullptr; }
  std::filesystem::path const &path() const noexcept { return path_; }

  bool insert_transfer(TransferRecord const &record) const;
  bool mark_started(std::string const &id, std::string const &timestamp) const;
  bool update_bytes(std::string const &id, std::int64_t bytes,
                    bool allow_decrease) const;
  bool finish_transfer(std::string const &id, std::string const &status,
                       std::optional<std::string> const &error_message,
                       std::string const &timestamp) const;
  int fail_unfinished(std::string const &message,
                      std::string const &timestamp) const;

  std::optional<TransferRecord> get_transfer(std::string const &id) const;
  TransferPage list_transfers(TransferQuery const &query) const;
  std::vector<TransferRecord> active_transfers() const;
  std::optional<TransferCounts> counts() const;

  int delete_finished(std::optional<std::string> const &status) const;
  int delete_finished_before(std::string const &cutoff) const;
  bool delete_transfer(std::string const &id) const;

  bool begin_transaction() const;
  bool commit_transaction() const;
  bool rollback_transaction() const;

private:
  bool ensure_schema();
  bool execute(std::string const &sql) const;
  bool run_migrations();
  bool ensure_schema_version_row() const;
  std::optional<int> schema_version() const;
  bool set_schema_version(int version) const;
  bool apply_migration_v1() const;
  sqlite3_stmt *prepare_cached(std::string const &sql) const;

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace tb::storage
