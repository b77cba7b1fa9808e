#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <sqlite3.h>

namespace hm::storage {

struct StoredDocument {
  std::string key;
  std::string job_id;
  std::string value;
};

// Ordered key-value document table on top of SQLite. Keys are compared
// bytewise (BINARY collation), which makes prefix scans plain range scans.
class Database {
public:
  explicit Database(std::filesystem::path path);
  ~Database();

  Database(Database const &) = delete;
  Database &operator=(Database const &) = delete;

  bool is_valid() const noexcept { return db_ != nullptr; }
  std::filesystem::path const &path() const noexcept { return path_; }

  bool put_document(std::string const &key, std::string const &job_id,
                    std::string const &value) const;
  std::optional<std::string> get_document(std::string const &key) const;
  bool delete_document(std::string const &key) const;
  bool delete_job_documents(std::string const &job_id) const;
  bool delete_all_documents() const;
  std::optional<bool> has_job_documents(std::string const &job_id) const;
  std::vector<StoredDocument> scan_prefix(std::string const &prefix) const;

private:
  bool ensure_schema();
  bool run_migrations();
  bool ensure_schema_version_row() const;
  std::optional<int> schema_version() const;
  bool set_schema_version(int version) const;
  bool apply_migration_v1() const;
  bool execute(std::string const &sql) const;
  sqlite3_stmt *prepare_cached(std::string const &sql) const;

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace hm::storage
