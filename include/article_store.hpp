/**
 * @file article_store.hpp
 * @brief Contract the sync core needs from local article persistence.
 */

#ifndef ARTICLESYNC_ARTICLE_STORE_HPP
#define ARTICLESYNC_ARTICLE_STORE_HPP

#include "article.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace arsync {

/**
 * Local article persistence. Implementations provide their own transaction
 * isolation and read-after-write consistency for the caller's writes. All
 * methods may throw StorageFailureError.
 */
class ArticleStore {
public:
  virtual ~ArticleStore() = default;

  /// Identifiers marked seen at or after @p since.
  virtual std::vector<ArticleId> fetch_seen_identifiers(TimePoint since) = 0;

  /// Whether an article exists under @p id or under @p storage_key.
  virtual bool exists(const ArticleId &id, const std::string &storage_key) = 0;

  /// Subset of @p ids already stored.
  virtual std::unordered_set<ArticleId>
  exists_any_of(const std::vector<ArticleId> &ids) = 0;

  /**
   * Insert @p record together with its seen marker. Either both become
   * visible or neither does.
   */
  virtual void insert_atomic(const ArticleRecord &record,
                             const std::string &storage_key) = 0;
};

} // namespace arsync

#endif // ARTICLESYNC_ARTICLE_STORE_HPP
