/**
 * @file sqlite_article_store.hpp
 * @brief SQLite implementation of the article store.
 */

#ifndef ARTICLESYNC_SQLITE_ARTICLE_STORE_HPP
#define ARTICLESYNC_SQLITE_ARTICLE_STORE_HPP

#include "article_store.hpp"

#include <mutex>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <string>

namespace arsync {

/**
 * Article store backed by a single SQLite connection. Calls are serialized
 * on an internal mutex so a transaction never interleaves with another
 * worker's statements.
 */
class SqliteArticleStore : public ArticleStore {
public:
  /**
   * Open or create the database at @p db_path (`:memory:` is accepted) and
   * create the schema when missing.
   *
   * @throws StorageFailureError When the database cannot be opened.
   */
  explicit SqliteArticleStore(const std::string &db_path);
  ~SqliteArticleStore() override;

  SqliteArticleStore(const SqliteArticleStore &) = delete;
  SqliteArticleStore &operator=(const SqliteArticleStore &) = delete;

  std::vector<ArticleId> fetch_seen_identifiers(TimePoint since) override;
  bool exists(const ArticleId &id, const std::string &storage_key) override;
  std::unordered_set<ArticleId>
  exists_any_of(const std::vector<ArticleId> &ids) override;
  void insert_atomic(const ArticleRecord &record,
                     const std::string &storage_key) override;

  /// Mark @p id as seen at @p when without storing an article.
  void mark_seen(const ArticleId &id, TimePoint when);

  std::size_t article_count();

  /// All stored articles as a JSON array, oldest first.
  nlohmann::json to_json();

  /// Write to_json() to @p path.
  void export_json(const std::string &path);

private:
  void exec(const char *sql);

  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace arsync

#endif // ARTICLESYNC_SQLITE_ARTICLE_STORE_HPP
