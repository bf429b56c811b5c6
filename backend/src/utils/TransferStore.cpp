#include "utils/TransferStore.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <format>
#include <string_view>
#include <system_error>

namespace tb::storage
{

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;
constexpr char const *kRecoverySuffix = "_old";
constexpr char const *kTransferColumns =
    "id, torrent_name, torrent_hash, source_client, target_client, "
    "connection_name, media_type, media_manager, size_bytes, "
    "bytes_transferred, status, error_message, created_at, started_at, "
    "completed_at";
constexpr char const *kFinishedStatuses = "('completed', 'failed', 'cancelled')";
constexpr char const *kActiveStatuses = "('pending', 'transferring')";
constexpr std::array<std::string_view, 5> kSortColumns = {
    {"created_at", "completed_at", "size_bytes", "bytes_transferred",
     "torrent_name"}};

std::string column_text(sqlite3_stmt *stmt, int index)
{
    auto text = reinterpret_cast<char const *>(sqlite3_column_text(stmt, index));
    return text != nullptr ? std::string(text) : std::string{};
}

std::optional<std::string> column_optional_text(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
    {
        return std::nullopt;
    }
    return column_text(stmt, index);
}

std::optional<std::int64_t> column_optional_int(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
    {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt, index));
}

void bind_optional_text(sqlite3_stmt *stmt, int index,
                        std::optional<std::string> const &value)
{
    if (value)
    {
        sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
    }
    else
    {
        sqlite3_bind_null(stmt, index);
    }
}

TransferRecord read_record(sqlite3_stmt *stmt)
{
    TransferRecord record;
    record.id = column_text(stmt, 0);
    record.torrent_name = column_text(stmt, 1);
    record.torrent_hash = column_text(stmt, 2);
    record.source_client = column_text(stmt, 3);
    record.target_client = column_text(stmt, 4);
    record.connection_name = column_optional_text(stmt, 5);
    record.media_type = column_optional_text(stmt, 6).value_or("unknown");
    record.media_manager = column_optional_text(stmt, 7);
    record.size_bytes = column_optional_int(stmt, 8);
    record.bytes_transferred = column_optional_int(stmt, 9).value_or(0);
    record.status = column_text(stmt, 10);
    record.error_message = column_optional_text(stmt, 11);
    record.created_at = column_text(stmt, 12);
    record.started_at = column_optional_text(stmt, 13);
    record.completed_at = column_optional_text(stmt, 14);
    return record;
}

} // namespace

Database::Database(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }
    auto parent = path_.parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            TB_LOG_ERROR("failed to create history directory {}: {}",
                         parent.string(), ec.message());
            return;
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        TB_LOG_ERROR("failed to open sqlite database {}: {}", path_.string(),
                     sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    char *err_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                      &err_msg);
    if (rc != SQLITE_OK && err_msg != nullptr)
    {
        TB_LOG_WARN("failed to enable WAL journal mode: {}", err_msg);
    }
    if (err_msg != nullptr)
    {
        sqlite3_free(err_msg);
    }
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!ensure_schema())
    {
        for (auto &entry : stmt_cache_)
        {
            sqlite3_finalize(entry.second);
        }
        stmt_cache_.clear();
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Database::~Database()
{
    for (auto &entry : stmt_cache_)
    {
        if (entry.second != nullptr)
        {
            sqlite3_finalize(entry.second);
        }
    }
    stmt_cache_.clear();
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::ensure_schema()
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *kSchemaVersionSql =
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "id INTEGER PRIMARY KEY CHECK(id = 1),"
        "version INTEGER NOT NULL);";
    if (!execute(kSchemaVersionSql))
    {
        return false;
    }
    return run_migrations();
}

bool Database::execute(std::string const &sql) const
{
    if (!db_)
    {
        return false;
    }
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        if (err_msg != nullptr)
        {
            TB_LOG_ERROR("sqlite error: {}", err_msg);
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

bool Database::run_migrations()
{
    if (!ensure_schema_version_row())
    {
        return false;
    }
    auto current = schema_version().value_or(0);
    struct Migration
    {
        int version;
        bool (Database::*apply)() const;
    };
    static constexpr Migration kMigrations[] = {
        {1, &Database::apply_migration_v1},
    };
    for (auto const &migration : kMigrations)
    {
        if (current >= migration.version)
        {
            continue;
        }
        if (!(this->*migration.apply)())
        {
            TB_LOG_ERROR("schema migration v{} failed on {}", migration.version,
                         path_.string());
            return false;
        }
        if (!set_schema_version(migration.version))
        {
            return false;
        }
        current = migration.version;
    }
    return true;
}

bool Database::ensure_schema_version_row() const
{
    return execute(
        "INSERT OR IGNORE INTO schema_version (id, version) VALUES (1, 0);");
}

std::optional<int> Database::schema_version() const
{
    auto *stmt =
        prepare_cached("SELECT version FROM schema_version WHERE id = 1 LIMIT 1;");
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::optional<int> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = static_cast<int>(sqlite3_column_int(stmt, 0));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return result;
}

bool Database::set_schema_version(int version) const
{
    auto *stmt = prepare_cached(
        "INSERT OR REPLACE INTO schema_version (id, version) VALUES (1, ?);");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int(stmt, 1, version);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

bool Database::apply_migration_v1() const
{
    constexpr char const *kTransfersSql =
        "CREATE TABLE IF NOT EXISTS transfers ("
        "id TEXT PRIMARY KEY,"
        "torrent_name TEXT NOT NULL,"
        "torrent_hash TEXT NOT NULL,"
        "source_client TEXT NOT NULL,"
        "target_client TEXT NOT NULL,"
        "connection_name TEXT,"
        "media_type TEXT,"
        "media_manager TEXT,"
        "size_bytes INTEGER,"
        "bytes_transferred INTEGER DEFAULT 0,"
        "status TEXT NOT NULL DEFAULT 'pending',"
        "error_message TEXT,"
        "created_at TEXT NOT NULL,"
        "started_at TEXT,"
        "completed_at TEXT);";
    constexpr char const *kIndexesSql =
        "CREATE INDEX IF NOT EXISTS idx_transfers_status ON transfers(status);"
        "CREATE INDEX IF NOT EXISTS idx_transfers_created_at ON "
        "transfers(created_at);"
        "CREATE INDEX IF NOT EXISTS idx_transfers_source ON "
        "transfers(source_client);"
        "CREATE INDEX IF NOT EXISTS idx_transfers_target ON "
        "transfers(target_client);"
        "CREATE INDEX IF NOT EXISTS idx_transfers_hash ON "
        "transfers(torrent_hash);";
    return execute(kTransfersSql) && execute(kIndexesSql);
}

sqlite3_stmt *Database::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        return nullptr;
    }
    auto it = stmt_cache_.find(sql);
    if (it != stmt_cache_.end())
    {
        sqlite3_reset(it->second);
        sqlite3_clear_bindings(it->second);
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        TB_LOG_ERROR("sqlite prepare failed: {}", sqlite3_errmsg(db_));
        if (stmt != nullptr)
        {
            sqlite3_finalize(stmt);
        }
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

bool Database::begin_transaction() const
{
    return execute("BEGIN TRANSACTION;");
}

bool Database::commit_transaction() const
{
    return execute("COMMIT;");
}

bool Database::rollback_transaction() const
{
    return execute("ROLLBACK;");
}

bool Database::insert_transfer(TransferRecord const &record) const
{
    auto *stmt = prepare_cached(
        "INSERT INTO transfers (id, torrent_name, torrent_hash, source_client, "
        "target_client, connection_name, media_type, media_manager, "
        "size_bytes, bytes_transferred, status, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.torrent_name.c_str(), -1,
                      SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.torrent_hash.c_str(), -1,
                      SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, record.source_client.c_str(), -1,
                      SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, record.target_client.c_str(), -1,
                      SQLITE_TRANSIENT);
    bind_optional_text(stmt, 6, record.connection_name);
    sqlite3_bind_text(stmt, 7, record.media_type.c_str(), -1,
                      SQLITE_TRANSIENT);
    bind_optional_text(stmt, 8, record.media_manager);
    if (record.size_bytes)
    {
        sqlite3_bind_int64(stmt, 9, *record.size_bytes);
    }
    else
    {
        sqlite3_bind_null(stmt, 9);
    }
    sqlite3_bind_int64(stmt, 10, record.bytes_transferred);
    sqlite3_bind_text(stmt, 11, record.status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 12, record.created_at.c_str(), -1,
                      SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE)
    {
        TB_LOG_ERROR("transfer insert failed: {}", sqlite3_errmsg(db_));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

bool Database::mark_started(std::string const &id,
                            std::string const &timestamp) const
{
    auto *stmt = prepare_cached(std::format(
        "UPDATE transfers SET status = 'transferring', started_at = ? "
        "WHERE id = ? AND status IN {};",
        kActiveStatuses));
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, timestamp.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

bool Database::update_bytes(std::string const &id, std::int64_t bytes,
                            bool allow_decrease) const
{
    auto sql = allow_decrease
                   ? std::format("UPDATE transfers SET bytes_transferred = ? "
                                 "WHERE id = ? AND status IN {};",
                                 kActiveStatuses)
                   : std::format("UPDATE transfers SET bytes_transferred = "
                                 "MAX(COALESCE(bytes_transferred, 0), ?) "
                                 "WHERE id = ? AND status IN {};",
                                 kActiveStatuses);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int64(stmt, 1, bytes);
    sqlite3_bind_text(stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

bool Database::finish_transfer(std::string const &id, std::string const &status,
                               std::optional<std::string> const &error_message,
                               std::string const &timestamp) const
{
    auto *stmt = prepare_cached(std::format(
        "UPDATE transfers SET status = ?, "
        "error_message = COALESCE(?, error_message), completed_at = ? "
        "WHERE id = ? AND status IN {};",
        kActiveStatuses));
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, status.c_str(), -1, SQLITE_TRANSIENT);
    bind_optional_text(stmt, 2, error_message);
    sqlite3_bind_text(stmt, 3, timestamp.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

int Database::fail_unfinished(std::string const &message,
                              std::string const &timestamp) const
{
    auto *stmt = prepare_cached(std::format(
        "UPDATE transfers SET status = 'failed', error_message = ?, "
        "completed_at = ? WHERE status IN {};",
        kActiveStatuses));
    if (stmt == nullptr)
    {
        return -1;
    }
    sqlite3_bind_text(stmt, 1, message.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, timestamp.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    if (rc != SQLITE_DONE)
    {
        return -1;
    }
    return sqlite3_changes(db_);
}

std::optional<TransferRecord>
Database::get_transfer(std::string const &id) const
{
    auto *stmt = prepare_cached(std::format(
        "SELECT {} FROM transfers WHERE id = ? LIMIT 1;", kTransferColumns));
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<TransferRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = read_record(stmt);
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return result;
}

TransferPage Database::list_transfers(TransferQuery const &query) const
{
    TransferPage page;
    std::string where;
    std::vector<std::string> params;
    auto add_condition = [&](char const *condition, std::string value)
    {
        where += where.empty() ? " WHERE " : " AND ";
        where += condition;
        params.push_back(std::move(value));
    };
    if (query.status && !query.status->empty())
    {
        add_condition("status = ?", *query.status);
    }
    if (query.source && !query.source->empty())
    {
        add_condition("source_client = ?", *query.source);
    }
    if (query.target && !query.target->empty())
    {
        add_condition("target_client = ?", *query.target);
    }
    if (query.search && !query.search->empty())
    {
        add_condition("torrent_name LIKE ?", "%" + *query.search + "%");
    }
    if (query.start_date && !query.start_date->empty())
    {
        add_condition("created_at >= ?", *query.start_date);
    }
    if (query.end_date && !query.end_date->empty())
    {
        auto end = *query.end_date;
        if (end.size() == 10)
        {
            end += "T23:59:59.999999+00:00";
        }
        add_condition("created_at <= ?", std::move(end));
    }

    std::string_view sort = "created_at";
    if (std::find(kSortColumns.begin(), kSortColumns.end(), query.sort) !=
        kSortColumns.end())
    {
        sort = query.sort;
    }
    std::string order = query.order;
    std::transform(order.begin(), order.end(), order.begin(),
                   [](unsigned char ch) { return std::tolower(ch); });
    char const *direction = order == "desc" ? "DESC" : "ASC";

    auto bind_params = [&](sqlite3_stmt *stmt)
    {
        for (std::size_t i = 0; i < params.size(); ++i)
        {
            sqlite3_bind_text(stmt, static_cast<int>(i + 1), params[i].c_str(),
                              -1, SQLITE_TRANSIENT);
        }
    };

    auto *count_stmt =
        prepare_cached(std::format("SELECT COUNT(*) FROM transfers{};", where));
    if (count_stmt == nullptr)
    {
        return page;
    }
    bind_params(count_stmt);
    if (sqlite3_step(count_stmt) == SQLITE_ROW)
    {
        page.total = static_cast<std::int64_t>(sqlite3_column_int64(count_stmt, 0));
    }
    sqlite3_reset(count_stmt);
    sqlite3_clear_bindings(count_stmt);

    auto per_page = std::max(1, query.per_page);
    auto page_number = std::max(1, query.page);
    auto *stmt = prepare_cached(
        std::format("SELECT {} FROM transfers{} ORDER BY {} {} LIMIT ? OFFSET ?;",
                    kTransferColumns, where, sort, direction));
    if (stmt == nullptr)
    {
        return page;
    }
    bind_params(stmt);
    auto next = static_cast<int>(params.size()) + 1;
    sqlite3_bind_int(stmt, next, per_page);
    sqlite3_bind_int64(stmt, next + 1,
                       static_cast<sqlite3_int64>(page_number - 1) * per_page);
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        page.records.push_back(read_record(stmt));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return page;
}

std::vector<TransferRecord> Database::active_transfers() const
{
    std::vector<TransferRecord> result;
    auto *stmt = prepare_cached(
        std::format("SELECT {} FROM transfers WHERE status IN {} "
                    "ORDER BY created_at DESC;",
                    kTransferColumns, kActiveStatuses));
    if (stmt == nullptr)
    {
        return result;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result.push_back(read_record(stmt));
    }
    sqlite3_reset(stmt);
    return result;
}

std::optional<TransferCounts> Database::counts() const
{
    auto *stmt = prepare_cached(
        "SELECT COUNT(*),"
        " SUM(CASE WHEN status = 'completed' THEN 1 ELSE 0 END),"
        " SUM(CASE WHEN status = 'failed' THEN 1 ELSE 0 END),"
        " SUM(CASE WHEN status = 'pending' THEN 1 ELSE 0 END),"
        " SUM(CASE WHEN status = 'transferring' THEN 1 ELSE 0 END),"
        " SUM(CASE WHEN status = 'completed' THEN COALESCE(size_bytes, 0)"
        " ELSE 0 END)"
        " FROM transfers;");
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::optional<TransferCounts> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        TransferCounts counts;
        counts.total = column_optional_int(stmt, 0).value_or(0);
        counts.completed = column_optional_int(stmt, 1).value_or(0);
        counts.failed = column_optional_int(stmt, 2).value_or(0);
        counts.pending = column_optional_int(stmt, 3).value_or(0);
        counts.transferring = column_optional_int(stmt, 4).value_or(0);
        counts.completed_bytes = column_optional_int(stmt, 5).value_or(0);
        result = counts;
    }
    sqlite3_reset(stmt);
    return result;
}

int Database::delete_finished(std::optional<std::string> const &status) const
{
    auto sql =
        status ? std::format("DELETE FROM transfers WHERE status = ? AND "
                             "status IN {};",
                             kFinishedStatuses)
               : std::format("DELETE FROM transfers WHERE status IN {};",
                             kFinishedStatuses);
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return -1;
    }
    if (status)
    {
        sqlite3_bind_text(stmt, 1, status->c_str(), -1, SQLITE_TRANSIENT);
    }
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    if (rc != SQLITE_DONE)
    {
        return -1;
    }
    return sqlite3_changes(db_);
}

int Database::delete_finished_before(std::string const &cutoff) const
{
    auto *stmt = prepare_cached(
        std::format("DELETE FROM transfers WHERE completed_at < ? AND "
                    "status IN {};",
                    kFinishedStatuses));
    if (stmt == nullptr)
    {
        return -1;
    }
    sqlite3_bind_text(stmt, 1, cutoff.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    if (rc != SQLITE_DONE)
    {
        return -1;
    }
    return sqlite3_changes(db_);
}

bool Database::delete_transfer(std::string const &id) const
{
    auto *stmt = prepare_cached("DELETE FROM transfers WHERE id = ?;");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

} // namespace tb::storage
