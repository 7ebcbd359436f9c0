// oasgen/registry/fragment_registry.hpp - Loading, caching and dereferencing
//
// FragmentRegistry turns References into Fragments: it loads the owning
// document once, walks the segment path, and follows "$ref" indirection
// nodes (possibly across documents) until it reaches a terminal value.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "oasgen/basic/value.hpp"
#include "oasgen/loader/content_loader.hpp"
#include "oasgen/ref/reference.hpp"
#include "oasgen/registry/document_cache.hpp"
#include "oasgen/registry/fragment.hpp"

namespace oasgen
{

struct RegistryOptions
{
  /// Maximum number of indirections followed for one request
  std::size_t max_reference_depth = 64;
};

/**
 * A dereferenced coordinate and the value stored there.
 */
struct ResolvedValue
{
  Reference reference;
  const Value * value = nullptr;
};

class FragmentRegistry
{
public:
  /// Reserved key of an indirection node
  static constexpr const char * k_reference_key = "$ref";

  /**
   * @param loader Loader used for documents not yet cached; must outlive
   *        the registry
   * @param cache Initial cache contents (e.g. documents parsed up front)
   * @param options Resolution limits
   */
  explicit FragmentRegistry(
    ContentLoader & loader, DocumentCache cache = {}, RegistryOptions options = {});

  // Fragments keep a pointer to their registry
  FragmentRegistry(const FragmentRegistry &) = delete;
  FragmentRegistry & operator=(const FragmentRegistry &) = delete;
  FragmentRegistry(FragmentRegistry &&) = delete;
  FragmentRegistry & operator=(FragmentRegistry &&) = delete;

  // ===========================================================================
  // Documents
  // ===========================================================================

  /**
   * Return the root value of a document, loading it on first use.
   *
   * @throws LoadError from the loader
   */
  const Value & load_document(const std::string & path);

  [[nodiscard]] bool is_loaded(const std::string & path) const { return cache_.contains(path); }
  [[nodiscard]] std::size_t document_count() const noexcept { return cache_.size(); }
  [[nodiscard]] const DocumentCache & cache() const noexcept { return cache_; }

  // ===========================================================================
  // Resolution
  // ===========================================================================

  /**
   * Walk the segment path without following indirection nodes.
   *
   * Empty segments are skipped. A missing key, an out-of-range index or an
   * explicit null (at the end of the path or before it) yields nullptr.
   *
   * @throws NavigationError when descending into a scalar or indexing a list
   *         with a non-numeric segment
   */
  [[nodiscard]] const Value * raw_value_at(const Reference & reference);

  /**
   * Follow indirection nodes from reference to a terminal value.
   *
   * @return nullopt when any coordinate on the chain has no value
   * @throws CircularReferenceError, ReferenceDepthError
   */
  [[nodiscard]] std::optional<ResolvedValue> resolve(const Reference & reference);

  [[nodiscard]] std::optional<Fragment> get_optional(const Reference & reference);

  /// @throws NotFoundError carrying reference
  [[nodiscard]] Fragment get(const Reference & reference);

  /// Target string when value is an indirection node, nullptr otherwise
  [[nodiscard]] static const std::string * indirection_target(const Value & value);

  [[nodiscard]] const RegistryOptions & options() const noexcept { return options_; }

private:
  std::optional<ResolvedValue> resolve_chain(
    const Reference & reference, std::vector<Reference> & chain);

  ContentLoader & loader_;
  DocumentCache cache_;
  RegistryOptions options_;
};

}  // namespace oasgen
