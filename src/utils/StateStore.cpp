#include "utils/StateStore.hpp"

#include "utils/Log.hpp"

#include <filesystem>
#include <system_error>

namespace hm::storage
{

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;

// Smallest string greater than every string starting with `prefix`, or an
// empty string when no such bound exists (prefix of 0xFF bytes).
std::string prefix_upper_bound(std::string prefix)
{
    while (!prefix.empty())
    {
        auto last = static_cast<unsigned char>(prefix.back());
        if (last < 0xFF)
        {
            prefix.back() = static_cast<char>(last + 1);
            return prefix;
        }
        prefix.pop_back();
    }
    return prefix;
}

std::string column_text(sqlite3_stmt *stmt, int index)
{
    auto *text = reinterpret_cast<char const *>(sqlite3_column_text(stmt, index));
    if (text == nullptr)
    {
        return {};
    }
    return std::string(text,
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
}

void bind_text(sqlite3_stmt *stmt, int index, std::string const &value)
{
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
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
            HM_LOG_ERROR("failed to create database directory {}: {}",
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
        HM_LOG_ERROR("failed to open sqlite database {}: {}", path_.string(),
                     sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    char *err_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                      &err_msg);
    if (rc != SQLITE_OK)
    {
        if (err_msg != nullptr)
        {
            HM_LOG_WARN("failed to enable WAL journal mode: {}", err_msg);
        }
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
            HM_LOG_ERROR("sqlite error: {}", err_msg);
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
            HM_LOG_ERROR("schema migration v{} failed", migration.version);
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
    constexpr char const *sql =
        "INSERT OR IGNORE INTO schema_version (id, version) VALUES (1, 0);";
    return execute(sql);
}

std::optional<int> Database::schema_version() const
{
    if (!db_)
    {
        return std::nullopt;
    }
    constexpr char const *sql =
        "SELECT version FROM schema_version WHERE id = 1 LIMIT 1;";
    auto *stmt = prepare_cached(sql);
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
    if (!db_)
    {
        return false;
    }
    constexpr char const *sql =
        "INSERT OR REPLACE INTO schema_version (id, version) VALUES (1, ?);";
    auto *stmt = prepare_cached(sql);
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
    constexpr char const *kDocumentsSql =
        "CREATE TABLE IF NOT EXISTS documents ("
        "key TEXT PRIMARY KEY,"
        "job_id TEXT NOT NULL,"
        "value TEXT NOT NULL);";
    constexpr char const *kJobIndexSql =
        "CREATE INDEX IF NOT EXISTS documents_job_id ON documents (job_id);";
    return execute(kDocumentsSql) && execute(kJobIndexSql);
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
        if (it->second != nullptr)
        {
            sqlite3_reset(it->second);
            sqlite3_clear_bindings(it->second);
        }
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        HM_LOG_ERROR("sqlite prepare failed: {}", sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

bool Database::put_document(std::string const &key, std::string const &job_id,
                            std::string const &value) const
{
    constexpr char const *sql = "INSERT OR REPLACE INTO documents "
                                "(key, job_id, value) VALUES (?, ?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, key);
    bind_text(stmt, 2, job_id);
    bind_text(stmt, 3, value);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    if (rc != SQLITE_DONE)
    {
        HM_LOG_ERROR("failed to store document {}: {}", key,
                     sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<std::string> Database::get_document(std::string const &key) const
{
    constexpr char const *sql =
        "SELECT value FROM documents WHERE key = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    bind_text(stmt, 1, key);
    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        value = column_text(stmt, 0);
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return value;
}

bool Database::delete_document(std::string const &key) const
{
    constexpr char const *sql = "DELETE FROM documents WHERE key = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, key);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

bool Database::delete_job_documents(std::string const &job_id) const
{
    constexpr char const *sql = "DELETE FROM documents WHERE job_id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    bind_text(stmt, 1, job_id);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

bool Database::delete_all_documents() const
{
    return execute("DELETE FROM documents;");
}

std::optional<bool> Database::has_job_documents(std::string const &job_id) const
{
    constexpr char const *sql =
        "SELECT 1 FROM documents WHERE job_id = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    bind_text(stmt, 1, job_id);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    if (rc == SQLITE_ROW)
    {
        return true;
    }
    if (rc == SQLITE_DONE)
    {
        return false;
    }
    return std::nullopt;
}

std::vector<StoredDocument> Database::scan_prefix(std::string const &prefix) const
{
    std::vector<StoredDocument> result;
    auto upper = prefix_upper_bound(prefix);
    // An empty upper bound means the range is open-ended.
    auto const sql = upper.empty()
                         ? std::string("SELECT key, job_id, value FROM documents "
                                       "WHERE key >= ? ORDER BY key;")
                         : std::string("SELECT key, job_id, value FROM documents "
                                       "WHERE key >= ? AND key < ? ORDER BY key;");
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return result;
    }
    bind_text(stmt, 1, prefix);
    if (!upper.empty())
    {
        bind_text(stmt, 2, upper);
    }
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        StoredDocument entry;
        entry.key = column_text(stmt, 0);
        entry.job_id = column_text(stmt, 1);
        entry.value = column_text(stmt, 2);
        result.push_back(std::move(entry));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return result;
}

} // namespace hm::storage
