// oasgen/loader/content_loader.hpp - Document loading boundary
//
// Loads a root document by path into a structural Value. Loaders never
// cache; FragmentRegistry owns caching.
//
#pragma once

#include <filesystem>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>

#include "oasgen/basic/value.hpp"

namespace oasgen
{

/**
 * Loads documents by path.
 *
 * Implementations fail with LoadError when the path is unreadable or
 * unparsable, when its extension is not .json/.yaml/.yml, or when the
 * document's top-level value is not a mapping.
 */
class ContentLoader
{
public:
  virtual ~ContentLoader() = default;

  [[nodiscard]] virtual Value load_map(const std::string & path) = 0;

protected:
  ContentLoader() = default;
  ContentLoader(const ContentLoader &) = default;
  ContentLoader & operator=(const ContentLoader &) = default;
};

// ============================================================================
// Filesystem Loader
// ============================================================================

/**
 * Reads documents from disk relative to a base directory.
 *
 * The path is percent-decoded before it is opened, so document paths produced
 * by reference resolution ("my%20api.yaml") map to their file names. An
 * absolute document path is taken relative to the base directory, never to
 * the filesystem root.
 */
class FileContentLoader : public ContentLoader
{
public:
  explicit FileContentLoader(std::filesystem::path base_dir) : base_dir_(std::move(base_dir)) {}

  [[nodiscard]] Value load_map(const std::string & path) override;

  [[nodiscard]] const std::filesystem::path & base_dir() const noexcept { return base_dir_; }

private:
  std::filesystem::path base_dir_;
};

// ============================================================================
// In-Memory Loader
// ============================================================================

/**
 * Serves documents from a preloaded path -> text map.
 */
class InMemoryContentLoader : public ContentLoader
{
public:
  explicit InMemoryContentLoader(std::unordered_map<std::string, std::string> files)
  : files_(std::move(files))
  {
  }

  /// Braced path -> text pairs; `InMemoryContentLoader loader({{"a.yaml", "..."}})`
  InMemoryContentLoader(std::initializer_list<std::pair<const std::string, std::string>> files)
  : files_(files)
  {
  }

  [[nodiscard]] Value load_map(const std::string & path) override;

private:
  std::unordered_map<std::string, std::string> files_;
};

}  // namespace oasgen
