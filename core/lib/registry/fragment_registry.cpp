// oasgen/registry/fragment_registry.cpp - Resolution algorithm
//
#include "oasgen/registry/fragment_registry.hpp"

#include <algorithm>
#include <charconv>

#include "oasgen/basic/errors.hpp"

namespace oasgen
{

namespace
{

/// Non-negative decimal index, nullopt for anything else
std::optional<std::size_t> parse_index(const std::string & segment)
{
  if (segment.empty() || !std::all_of(segment.begin(), segment.end(), [](char c) {
        return c >= '0' && c <= '9';
      })) {
    return std::nullopt;
  }
  std::size_t index = 0;
  const auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
  if (ec != std::errc() || ptr != segment.data() + segment.size()) {
    return std::nullopt;
  }
  return index;
}

}  // namespace

FragmentRegistry::FragmentRegistry(
  ContentLoader & loader, DocumentCache cache, RegistryOptions options)
: loader_(loader), cache_(std::move(cache)), options_(options)
{
}

// ============================================================================
// Documents
// ============================================================================

const Value & FragmentRegistry::load_document(const std::string & path)
{
  if (const Value * cached = cache_.find(path)) {
    return *cached;
  }
  return cache_.insert(path, loader_.load_map(path));
}

// ============================================================================
// Resolution
// ============================================================================

const Value * FragmentRegistry::raw_value_at(const Reference & reference)
{
  const Value * current = &load_document(reference.document_path());

  for (const auto & segment : reference.segments()) {
    if (segment.empty()) {
      continue;
    }

    switch (current->kind()) {
      case ValueKind::Map:
        current = current->map().find(segment);
        break;
      case ValueKind::List: {
        const auto index = parse_index(segment);
        if (!index) {
          throw NavigationError(reference, "invalid list index '" + segment + "'");
        }
        const Sequence & list = current->list();
        current = *index < list.size() ? &list[*index] : nullptr;
        break;
      }
      default:
        throw NavigationError(
          reference, std::string("cannot descend into ") + to_string(current->kind()) +
                       " with segment '" + segment + "'");
    }

    // Null reads the same as a missing key
    if (current == nullptr || current->is_null()) {
      return nullptr;
    }
  }

  return current;
}

const std::string * FragmentRegistry::indirection_target(const Value & value)
{
  if (!value.is_map()) {
    return nullptr;
  }
  const Value * target = value.map().find(k_reference_key);
  if (target == nullptr || !target->is_string()) {
    return nullptr;
  }
  return &target->string();
}

std::optional<ResolvedValue> FragmentRegistry::resolve(const Reference & reference)
{
  std::vector<Reference> chain;
  return resolve_chain(reference, chain);
}

std::optional<ResolvedValue> FragmentRegistry::resolve_chain(
  const Reference & reference, std::vector<Reference> & chain)
{
  if (std::find(chain.begin(), chain.end(), reference) != chain.end()) {
    throw CircularReferenceError(reference, chain);
  }
  if (chain.size() > options_.max_reference_depth) {
    throw ReferenceDepthError(chain.front(), options_.max_reference_depth);
  }

  const Value * value = raw_value_at(reference);
  if (value == nullptr) {
    return std::nullopt;
  }

  const std::string * target = indirection_target(*value);
  if (target == nullptr) {
    return ResolvedValue{reference, value};
  }

  chain.push_back(reference);
  return resolve_chain(reference.resolve(*target), chain);
}

std::optional<Fragment> FragmentRegistry::get_optional(const Reference & reference)
{
  auto resolved = resolve(reference);
  if (!resolved) {
    return std::nullopt;
  }
  return Fragment(*this, std::move(resolved->reference), *resolved->value);
}

Fragment FragmentRegistry::get(const Reference & reference)
{
  auto fragment = get_optional(reference);
  if (!fragment) {
    throw NotFoundError(reference);
  }
  return std::move(*fragment);
}

}  // namespace oasgen
