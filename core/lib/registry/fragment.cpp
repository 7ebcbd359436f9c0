// oasgen/registry/fragment.cpp - Typed projection and navigation
//
#include "oasgen/registry/fragment.hpp"

#include <algorithm>
#include <cctype>

#include "oasgen/basic/errors.hpp"
#include "oasgen/registry/fragment_registry.hpp"

namespace oasgen
{

namespace
{

bool equals_ignore_case(const std::string & lhs, std::string_view rhs)
{
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) ==
                  std::tolower(static_cast<unsigned char>(b));
         });
}

}  // namespace

// ============================================================================
// Projections
// ============================================================================

const Mapping & Fragment::as_map() const
{
  if (!value_->is_map()) {
    throw TypeMismatchError(reference_, ValueKind::Map, kind());
  }
  return value_->map();
}

const Sequence & Fragment::as_list() const
{
  if (!value_->is_list()) {
    throw TypeMismatchError(reference_, ValueKind::List, kind());
  }
  return value_->list();
}

const std::string & Fragment::as_string() const
{
  if (!value_->is_string()) {
    throw TypeMismatchError(reference_, ValueKind::String, kind());
  }
  return value_->string();
}

bool Fragment::as_boolean() const
{
  if (value_->is_bool()) {
    return value_->boolean();
  }
  if (value_->is_string()) {
    return equals_ignore_case(value_->string(), "true");
  }
  throw TypeMismatchError(reference_, ValueKind::Boolean, kind());
}

int64_t Fragment::as_integer() const
{
  if (!value_->is_integer()) {
    throw TypeMismatchError(reference_, "integer", *value_);
  }
  return value_->integer();
}

double Fragment::as_number() const
{
  if (value_->is_integer()) {
    return static_cast<double>(value_->integer());
  }
  if (value_->is_real()) {
    return value_->real();
  }
  throw TypeMismatchError(reference_, "number", *value_);
}

// ============================================================================
// Navigation
// ============================================================================

std::optional<Fragment> Fragment::get_optional(std::string_view element) const
{
  return registry_->get_optional(reference_.child(element));
}

std::optional<Fragment> Fragment::get_optional(const std::vector<std::string> & elements) const
{
  return registry_->get_optional(reference_.child(elements));
}

std::optional<Fragment> Fragment::get_optional(std::size_t index) const
{
  return get_optional(std::to_string(index));
}

Fragment Fragment::get(std::string_view element) const
{
  const Reference child = reference_.child(element);
  auto fragment = registry_->get_optional(child);
  if (!fragment) {
    throw NotFoundError(child);
  }
  return std::move(*fragment);
}

Fragment Fragment::get(const std::vector<std::string> & elements) const
{
  const Reference child = reference_.child(elements);
  auto fragment = registry_->get_optional(child);
  if (!fragment) {
    throw NotFoundError(child);
  }
  return std::move(*fragment);
}

Fragment Fragment::get(std::size_t index) const { return get(std::to_string(index)); }

std::optional<Fragment> Fragment::parent() const
{
  auto parent_reference = reference_.parent();
  if (!parent_reference) {
    return std::nullopt;
  }
  return registry_->get_optional(*parent_reference);
}

// ============================================================================
// Iteration
// ============================================================================

void Fragment::for_each(
  const std::function<void(const std::string &, const Fragment &)> & action) const
{
  for (const auto & key : as_map().keys()) {
    action(key, get(key));
  }
}

void Fragment::for_each_indexed(
  const std::function<void(std::size_t, const Fragment &)> & action) const
{
  const std::size_t count = as_list().size();
  for (std::size_t i = 0; i < count; ++i) {
    action(i, get(i));
  }
}

std::string Fragment::to_string() const
{
  return "Fragment(" + reference_.to_string() + ", " + oasgen::to_string(kind()) + ")";
}

}  // namespace oasgen
