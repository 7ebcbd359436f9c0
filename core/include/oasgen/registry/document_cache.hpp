// oasgen/registry/document_cache.hpp - Loaded root documents
//
#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "oasgen/basic/value.hpp"

namespace oasgen
{

/**
 * Append-only map from document path to its loaded root value.
 *
 * Stored documents keep their address for the cache's lifetime (including
 * after the cache is moved), so fragments can point into them.
 */
class DocumentCache
{
public:
  DocumentCache() = default;

  DocumentCache(const DocumentCache &) = delete;
  DocumentCache & operator=(const DocumentCache &) = delete;
  DocumentCache(DocumentCache &&) = default;
  DocumentCache & operator=(DocumentCache &&) = default;

  /// Cached document, or nullptr
  [[nodiscard]] const Value * find(const std::string & path) const;

  /**
   * Store a document. An already cached path keeps its first value.
   *
   * @return The cached document for path
   */
  const Value & insert(std::string path, Value document);

  [[nodiscard]] bool contains(const std::string & path) const
  {
    return documents_.count(path) > 0;
  }

  [[nodiscard]] std::size_t size() const noexcept { return documents_.size(); }
  [[nodiscard]] bool empty() const noexcept { return documents_.empty(); }

  /// Cached paths in insertion order
  [[nodiscard]] const std::vector<std::string> & paths() const noexcept { return paths_; }

private:
  std::unordered_map<std::string, Value> documents_;
  std::vector<std::string> paths_;
};

}  // namespace oasgen
