// oasgen/registry/fragment.hpp - Resolved values with typed navigation
//
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "oasgen/basic/value.hpp"
#include "oasgen/ref/reference.hpp"

namespace oasgen
{

class FragmentRegistry;

/**
 * A value at a fully dereferenced Reference, together with the registry that
 * produced it.
 *
 * Navigation goes back through the registry, so children that are
 * indirection nodes are resolved transparently. Identity is the Reference:
 * two fragments are equal iff their references are, whatever their values.
 *
 * A Fragment points into the registry's document cache and must not outlive
 * the registry.
 */
class Fragment
{
public:
  Fragment(FragmentRegistry & registry, Reference reference, const Value & value)
  : registry_(&registry), reference_(std::move(reference)), value_(&value)
  {
  }

  [[nodiscard]] const Reference & reference() const noexcept { return reference_; }
  [[nodiscard]] const Value & value() const noexcept { return *value_; }
  [[nodiscard]] ValueKind kind() const noexcept { return value_->kind(); }
  [[nodiscard]] FragmentRegistry & registry() const noexcept { return *registry_; }

  // ===========================================================================
  // Projections
  // ===========================================================================
  // Each throws TypeMismatchError naming this fragment's reference.

  [[nodiscard]] const Mapping & as_map() const;
  [[nodiscard]] const Sequence & as_list() const;
  [[nodiscard]] const std::string & as_string() const;

  /// Booleans, or strings read as a boolean literal ("true" in any case)
  [[nodiscard]] bool as_boolean() const;

  [[nodiscard]] int64_t as_integer() const;

  /// Integer or real scalars
  [[nodiscard]] double as_number() const;

  // ===========================================================================
  // Navigation
  // ===========================================================================

  [[nodiscard]] std::optional<Fragment> get_optional(std::string_view element) const;
  [[nodiscard]] std::optional<Fragment> get_optional(
    const std::vector<std::string> & elements) const;
  [[nodiscard]] std::optional<Fragment> get_optional(std::size_t index) const;

  /// @throws NotFoundError naming the full child coordinate
  [[nodiscard]] Fragment get(std::string_view element) const;
  [[nodiscard]] Fragment get(const std::vector<std::string> & elements) const;
  [[nodiscard]] Fragment get(std::size_t index) const;

  [[nodiscard]] Fragment operator[](std::string_view element) const { return get(element); }
  [[nodiscard]] Fragment operator[](std::size_t index) const { return get(index); }

  /**
   * Resolve the parent coordinate in the same document.
   *
   * The indirection that led to this fragment is not followed back.
   * Returns nullopt at the document root.
   */
  [[nodiscard]] std::optional<Fragment> parent() const;

  // ===========================================================================
  // Iteration
  // ===========================================================================
  // Map iteration follows insertion order, list iteration ascending index.
  // Calling the map forms on a list (or vice versa) throws TypeMismatchError.

  void for_each(const std::function<void(const std::string &, const Fragment &)> & action) const;
  void for_each_indexed(const std::function<void(std::size_t, const Fragment &)> & action) const;

  template <typename Fn>
  auto map(Fn && transform) const
  {
    using R = std::invoke_result_t<Fn &, const std::string &, const Fragment &>;
    std::vector<R> out;
    const Mapping & entries = as_map();
    out.reserve(entries.size());
    for (const auto & key : entries.keys()) {
      out.push_back(transform(key, get(key)));
    }
    return out;
  }

  template <typename Fn>
  auto map_elements(Fn && transform) const
  {
    using R = std::invoke_result_t<Fn &, const Fragment &>;
    std::vector<R> out;
    const std::size_t count = as_list().size();
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      out.push_back(transform(get(i)));
    }
    return out;
  }

  template <typename Fn>
  auto map_indexed(Fn && transform) const
  {
    using R = std::invoke_result_t<Fn &, std::size_t, const Fragment &>;
    std::vector<R> out;
    const std::size_t count = as_list().size();
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      out.push_back(transform(i, get(i)));
    }
    return out;
  }

  [[nodiscard]] bool operator==(const Fragment & other) const
  {
    return reference_ == other.reference_;
  }
  [[nodiscard]] bool operator!=(const Fragment & other) const { return !(*this == other); }

  /// "Fragment(<reference>, <kind>)"
  [[nodiscard]] std::string to_string() const;

private:
  FragmentRegistry * registry_;
  Reference reference_;
  const Value * value_;
};

}  // namespace oasgen

namespace std
{
template <>
struct hash<oasgen::Fragment>
{
  size_t operator()(const oasgen::Fragment & fragment) const noexcept
  {
    return fragment.reference().hash();
  }
};
}  // namespace std
