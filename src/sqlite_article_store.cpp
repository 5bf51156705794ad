#include "sqlite_article_store.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <cstdint>
#include <fstream>
#include <memory>

namespace arsync {

namespace {

std::shared_ptr<spdlog::logger> store_log() {
  static auto logger = category_logger("store");
  return logger;
}

std::int64_t to_epoch(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch())
      .count();
}

TimePoint from_epoch(std::int64_t secs) {
  return TimePoint(std::chrono::seconds(secs));
}

/// Prepared statement that is finalized on every exit path.
class Statement {
public:
  Statement(sqlite3 *db, const char *sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw StorageFailureError(std::string("Failed to prepare statement: ") +
                                sqlite3_errmsg(db));
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  void bind(int index, const std::string &value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
  }

  /// Empty strings are stored as NULL.
  void bind_text_or_null(int index, const std::string &value) {
    if (value.empty()) {
      sqlite3_bind_null(stmt_, index);
    } else {
      bind(index, value);
    }
  }

  void bind(int index, std::int64_t value) {
    sqlite3_bind_int64(stmt_, index, value);
  }

  void bind(int index, const std::optional<int> &value) {
    if (value) {
      sqlite3_bind_int(stmt_, index, *value);
    } else {
      sqlite3_bind_null(stmt_, index);
    }
  }

  /// @return `true` while rows are available.
  bool step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw StorageFailureError(std::string("Statement failed: ") +
                              sqlite3_errmsg(db_));
  }

  void reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  std::string text(int column) const {
    const unsigned char *value = sqlite3_column_text(stmt_, column);
    return value ? reinterpret_cast<const char *>(value) : std::string();
  }

  std::optional<int> optional_int(int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
      return std::nullopt;
    }
    return sqlite3_column_int(stmt_, column);
  }

  std::int64_t int64(int column) const {
    return sqlite3_column_int64(stmt_, column);
  }

private:
  sqlite3 *db_;
  sqlite3_stmt *stmt_ = nullptr;
};

/// BEGIN IMMEDIATE on construction, ROLLBACK unless committed.
class Transaction {
public:
  explicit Transaction(sqlite3 *db) : db_(db) {
    if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) !=
        SQLITE_OK) {
      throw StorageFailureError(std::string("Failed to begin transaction: ") +
                                sqlite3_errmsg(db_));
    }
  }
  ~Transaction() {
    if (!done_ &&
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
      store_log()->error("Rollback failed: {}", sqlite3_errmsg(db_));
    }
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
      throw StorageFailureError(std::string("Failed to commit: ") +
                                sqlite3_errmsg(db_));
    }
    done_ = true;
  }

private:
  sqlite3 *db_;
  bool done_ = false;
};

constexpr const char *kSchema =
    "CREATE TABLE IF NOT EXISTS articles("
    "storage_key TEXT PRIMARY KEY,"
    "identifier TEXT NOT NULL UNIQUE,"
    "json_url TEXT,"
    "title TEXT NOT NULL,"
    "body TEXT NOT NULL,"
    "article_title TEXT, topic TEXT, source_url TEXT, domain TEXT,"
    "affected TEXT, published_at INTEGER,"
    "quality INTEGER, sources_quality INTEGER, argument_quality INTEGER,"
    "source_type TEXT, source_analysis TEXT, summary TEXT,"
    "critical_analysis TEXT, logical_fallacies TEXT, relation_to_topic TEXT,"
    "additional_insights TEXT, engine_stats TEXT, similar_articles TEXT,"
    "received_at INTEGER NOT NULL);"
    "CREATE TABLE IF NOT EXISTS seen_articles("
    "identifier TEXT PRIMARY KEY,"
    "storage_key TEXT,"
    "seen_at INTEGER NOT NULL);"
    "CREATE INDEX IF NOT EXISTS seen_articles_seen_at "
    "ON seen_articles(seen_at);";

} // namespace

SqliteArticleStore::SqliteArticleStore(const std::string &db_path) {
  store_log()->debug("Opening article database {}", db_path);
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw StorageFailureError("Failed to open database " + db_path + ": " +
                              msg);
  }
  sqlite3_busy_timeout(db_, 5000);
  try {
    exec(kSchema);
  } catch (const StorageFailureError &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteArticleStore::~SqliteArticleStore() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SqliteArticleStore::exec(const char *sql) {
  char *err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw StorageFailureError("SQL error: " + msg);
  }
}

std::vector<ArticleId>
SqliteArticleStore::fetch_seen_identifiers(TimePoint since) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT identifier FROM seen_articles WHERE seen_at >= ? "
                      "ORDER BY seen_at");
  stmt.bind(1, to_epoch(since));
  std::vector<ArticleId> ids;
  while (stmt.step()) {
    ids.push_back(stmt.text(0));
  }
  return ids;
}

bool SqliteArticleStore::exists(const ArticleId &id,
                                const std::string &storage_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT 1 FROM articles WHERE identifier = ?1 "
                      "OR json_url = ?1 OR storage_key = ?2 LIMIT 1");
  stmt.bind(1, id);
  stmt.bind(2, storage_key);
  return stmt.step();
}

std::unordered_set<ArticleId>
SqliteArticleStore::exists_any_of(const std::vector<ArticleId> &ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT 1 FROM articles WHERE identifier = ?1 "
                      "OR json_url = ?1 OR storage_key = ?2 LIMIT 1");
  std::unordered_set<ArticleId> found;
  for (const auto &id : ids) {
    stmt.bind(1, id);
    stmt.bind(2, derive_storage_key(id));
    if (stmt.step()) {
      found.insert(id);
    }
    stmt.reset();
  }
  return found;
}

void SqliteArticleStore::insert_atomic(const ArticleRecord &record,
                                       const std::string &storage_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  {
    Statement insert(
        db_,
        "INSERT INTO articles(storage_key, identifier, json_url, title, body,"
        " article_title, topic, source_url, domain, affected, published_at,"
        " quality, sources_quality, argument_quality, source_type,"
        " source_analysis, summary, critical_analysis, logical_fallacies,"
        " relation_to_topic, additional_insights, engine_stats,"
        " similar_articles, received_at)"
        " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)");
    int i = 1;
    insert.bind(i++, storage_key);
    insert.bind(i++, record.identifier);
    insert.bind_text_or_null(i++, record.json_url);
    insert.bind(i++, record.title);
    insert.bind(i++, record.body);
    insert.bind_text_or_null(i++, record.article_title);
    insert.bind_text_or_null(i++, record.topic);
    insert.bind_text_or_null(i++, record.source_url);
    insert.bind_text_or_null(i++, record.domain);
    insert.bind_text_or_null(i++, record.affected);
    if (record.published_at) {
      insert.bind(i++, to_epoch(*record.published_at));
    } else {
      insert.bind(i++, std::optional<int>());
    }
    insert.bind(i++, record.quality);
    insert.bind(i++, record.sources_quality);
    insert.bind(i++, record.argument_quality);
    insert.bind_text_or_null(i++, record.source_type);
    insert.bind_text_or_null(i++, record.source_analysis);
    insert.bind_text_or_null(i++, record.summary);
    insert.bind_text_or_null(i++, record.critical_analysis);
    insert.bind_text_or_null(i++, record.logical_fallacies);
    insert.bind_text_or_null(i++, record.relation_to_topic);
    insert.bind_text_or_null(i++, record.additional_insights);
    insert.bind_text_or_null(i++, record.engine_stats);
    insert.bind_text_or_null(i++, record.similar_articles);
    insert.bind(i++, to_epoch(record.received_at));
    insert.step();
  }
  {
    Statement seen(db_, "INSERT OR REPLACE INTO seen_articles(identifier,"
                        " storage_key, seen_at) VALUES(?,?,?)");
    seen.bind(1, record.identifier);
    seen.bind(2, storage_key);
    seen.bind(3, to_epoch(record.received_at));
    seen.step();
  }
  tx.commit();
  store_log()->debug("Stored article {} as {}", record.identifier, storage_key);
}

void SqliteArticleStore::mark_seen(const ArticleId &id, TimePoint when) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "INSERT OR REPLACE INTO seen_articles(identifier,"
                      " storage_key, seen_at) VALUES(?,?,?)");
  stmt.bind(1, id);
  stmt.bind(2, derive_storage_key(id));
  stmt.bind(3, to_epoch(when));
  stmt.step();
}

std::size_t SqliteArticleStore::article_count() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT COUNT(*) FROM articles");
  return stmt.step() ? static_cast<std::size_t>(stmt.int64(0)) : 0;
}

nlohmann::json SqliteArticleStore::to_json() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(
      db_, "SELECT identifier, json_url, title, body, article_title, topic,"
           " source_url, domain, affected, published_at, quality,"
           " sources_quality, argument_quality, source_type, source_analysis,"
           " summary, critical_analysis, logical_fallacies, relation_to_topic,"
           " additional_insights, engine_stats, similar_articles, received_at,"
           " storage_key FROM articles ORDER BY received_at, rowid");
  nlohmann::json out = nlohmann::json::array();
  while (stmt.step()) {
    ArticleRecord r;
    int c = 0;
    r.identifier = stmt.text(c++);
    r.json_url = stmt.text(c++);
    r.title = stmt.text(c++);
    r.body = stmt.text(c++);
    r.article_title = stmt.text(c++);
    r.topic = stmt.text(c++);
    r.source_url = stmt.text(c++);
    r.domain = stmt.text(c++);
    r.affected = stmt.text(c++);
    if (auto published = stmt.optional_int(c++)) {
      r.published_at = from_epoch(stmt.int64(c - 1));
    }
    r.quality = stmt.optional_int(c++);
    r.sources_quality = stmt.optional_int(c++);
    r.argument_quality = stmt.optional_int(c++);
    r.source_type = stmt.text(c++);
    r.source_analysis = stmt.text(c++);
    r.summary = stmt.text(c++);
    r.critical_analysis = stmt.text(c++);
    r.logical_fallacies = stmt.text(c++);
    r.relation_to_topic = stmt.text(c++);
    r.additional_insights = stmt.text(c++);
    r.engine_stats = stmt.text(c++);
    r.similar_articles = stmt.text(c++);
    r.received_at = from_epoch(stmt.int64(c++));
    auto item = arsync::to_json(r);
    item["storage_key"] = stmt.text(c++);
    out.push_back(std::move(item));
  }
  return out;
}

void SqliteArticleStore::export_json(const std::string &path) {
  auto articles = to_json();
  std::ofstream out(path);
  if (!out) {
    throw StorageFailureError("Failed to open export file " + path);
  }
  out << articles.dump(2);
  store_log()->info("Exported {} article(s) to {}", articles.size(), path);
}

} // namespace arsync
