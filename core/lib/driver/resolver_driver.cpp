// oasgen/driver/resolver_driver.cpp - Resolver driver implementation
//
#include "oasgen/driver/resolver_driver.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <unordered_set>

#include "oasgen/basic/errors.hpp"
#include "oasgen/loader/content_loader.hpp"
#include "oasgen/ref/uri.hpp"
#include "oasgen/registry/fragment_registry.hpp"

namespace oasgen
{

namespace
{

constexpr const char * k_code_load = "E100";
constexpr const char * k_code_navigation = "E101";
constexpr const char * k_code_not_found = "E102";
constexpr const char * k_code_circular = "E103";
constexpr const char * k_code_depth = "E104";
constexpr const char * k_code_type = "E105";

constexpr const char * k_code_plain_ref = "W100";
constexpr const char * k_code_ignored_siblings = "W101";

/// Forwards to another loader, logging each load when verbose
class LoggingContentLoader : public ContentLoader
{
public:
  LoggingContentLoader(ContentLoader & inner, bool verbose) : inner_(inner), verbose_(verbose) {}

  [[nodiscard]] Value load_map(const std::string & path) override
  {
    if (verbose_) {
      std::cerr << "Loading: " << path << "\n";
    }
    return inner_.load_map(path);
  }

private:
  ContentLoader & inner_;
  bool verbose_;
};

const char * error_code(const Error & e)
{
  if (dynamic_cast<const LoadError *>(&e) != nullptr) {
    return k_code_load;
  }
  if (dynamic_cast<const NavigationError *>(&e) != nullptr) {
    return k_code_navigation;
  }
  if (dynamic_cast<const CircularReferenceError *>(&e) != nullptr) {
    return k_code_circular;
  }
  if (dynamic_cast<const ReferenceDepthError *>(&e) != nullptr) {
    return k_code_depth;
  }
  if (dynamic_cast<const TypeMismatchError *>(&e) != nullptr) {
    return k_code_type;
  }
  return k_code_not_found;
}

RegistryOptions registry_options(const ResolveOptions & options)
{
  RegistryOptions out;
  out.max_reference_depth = options.max_reference_depth;
  return out;
}

/// Load schema and components up front, reporting each failure
void load_roots(FragmentRegistry & registry, const ResolveOptions & options, DiagnosticBag & diags)
{
  std::vector<std::filesystem::path> files;
  files.push_back(options.schema);
  files.insert(files.end(), options.components.begin(), options.components.end());

  for (const auto & file : files) {
    try {
      (void)registry.load_document(ResolverDriver::document_key(options.base_dir, file));
    } catch (const LoadError & e) {
      diags.report_error(Reference::root(e.path()), e.what()).with_code(k_code_load);
    }
  }
}

// ============================================================================
// Check
// ============================================================================

/// Warn about "$ref" keys that do not act as a plain indirection
void check_reference_shape(const Reference & location, const Value & map, ResolveResult & result)
{
  const Value * ref = map.map().find(FragmentRegistry::k_reference_key);
  if (ref == nullptr) {
    return;
  }

  if (!ref->is_string()) {
    result.diagnostics
      .report_warning(location, "\"$ref\" is not a string and is read as plain data")
      .with_code(k_code_plain_ref)
      .with_help("quote the target: \"$ref\": \"<document>#<pointer>\"");
    return;
  }

  std::string ignored;
  for (const auto & key : map.map().keys()) {
    if (key != FragmentRegistry::k_reference_key) {
      ignored += ignored.empty() ? "" : ", ";
      ignored += key;
    }
  }
  if (!ignored.empty()) {
    result.diagnostics
      .report_warning(location, "keys next to \"$ref\" are ignored: " + ignored)
      .with_code(k_code_ignored_siblings)
      .with_help("move them into the referenced fragment");
  }
}

void check_node(
  FragmentRegistry & registry, const Reference & location, const Value & value,
  ResolveResult & result)
{
  if (value.is_map()) {
    check_reference_shape(location, value, result);
  }

  if (const std::string * target = FragmentRegistry::indirection_target(value)) {
    ++result.references_checked;
    const std::string note = "while following \"$ref\": \"" + *target + "\"";
    try {
      if (!registry.resolve(location)) {
        result.diagnostics
          .report_error(location, "reference not found: " + location.resolve(*target).to_string())
          .with_code(k_code_not_found)
          .with_note(note);
      }
    } catch (const Error & e) {
      result.diagnostics.report_error(location, e.what()).with_code(error_code(e)).with_note(note);
    }
    return;
  }

  if (value.is_map()) {
    const Mapping & map = value.map();
    for (std::size_t i = 0; i < map.size(); ++i) {
      check_node(registry, location.child(map.keys()[i]), map.value_at(i), result);
    }
  } else if (value.is_list()) {
    const Sequence & list = value.list();
    for (std::size_t i = 0; i < list.size(); ++i) {
      check_node(registry, location.child(std::to_string(i)), list[i], result);
    }
  }
}

// ============================================================================
// Dump
// ============================================================================

nlohmann::ordered_json render(
  const Fragment & fragment, std::unordered_set<const Value *> & active);

/// Null children read as absent through the registry, so they are printed from the raw value
nlohmann::ordered_json render_child(
  const Fragment & parent, const std::string & segment, const Value & raw,
  std::unordered_set<const Value *> & active)
{
  if (raw.is_null()) {
    return nullptr;
  }
  const Fragment child = parent.get(segment);
  if (active.count(&child.value()) > 0) {
    const Reference & ref = child.reference();
    return nlohmann::ordered_json{{"$ref", ref.document_path() + "#" + ref.to_pointer()}};
  }
  return render(child, active);
}

nlohmann::ordered_json render(const Fragment & fragment, std::unordered_set<const Value *> & active)
{
  const Value & value = fragment.value();

  switch (fragment.kind()) {
    case ValueKind::Map: {
      active.insert(&value);
      auto out = nlohmann::ordered_json::object();
      const Mapping & map = value.map();
      for (std::size_t i = 0; i < map.size(); ++i) {
        const std::string & key = map.keys()[i];
        out[key] = render_child(fragment, key, map.value_at(i), active);
      }
      active.erase(&value);
      return out;
    }
    case ValueKind::List: {
      active.insert(&value);
      auto out = nlohmann::ordered_json::array();
      const Sequence & list = value.list();
      for (std::size_t i = 0; i < list.size(); ++i) {
        out.push_back(render_child(fragment, std::to_string(i), list[i], active));
      }
      active.erase(&value);
      return out;
    }
    case ValueKind::String:
      return value.string();
    case ValueKind::Boolean:
      return value.boolean();
    case ValueKind::Scalar:
      break;
  }

  switch (value.scalar_kind()) {
    case ScalarKind::Integer:
      return value.integer();
    case ScalarKind::Real:
      return value.real();
    case ScalarKind::Null:
      break;
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// ResolveOptions
// ============================================================================

ResolveOptions ResolveOptions::from_config(const ProjectConfig & config)
{
  ResolveOptions options;
  options.base_dir = config.absolute_base_dir();
  options.schema = options.base_dir / config.resolver.schema;
  for (const auto & component : config.resolver.components) {
    options.components.push_back(options.base_dir / component);
  }
  options.max_reference_depth = config.resolver.max_reference_depth;
  return options;
}

// ============================================================================
// ResolverDriver
// ============================================================================

std::string ResolverDriver::document_key(
  const std::filesystem::path & base_dir, const std::filesystem::path & file)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path base = fs::weakly_canonical(fs::absolute(base_dir), ec);
  if (ec) {
    base = fs::absolute(base_dir).lexically_normal();
  }
  fs::path target = fs::weakly_canonical(fs::absolute(file), ec);
  if (ec) {
    target = fs::absolute(file).lexically_normal();
  }

  // Files outside the base directory get a leading ".." key, which the
  // loader joins back onto the base directory
  const fs::path relative = target.lexically_relative(base);
  if (relative.empty()) {
    throw LoadError(
      file.generic_string(), "not reachable from base directory " + base.generic_string());
  }

  std::string key;
  bool first = true;
  for (const auto & part : relative) {
    if (!first) {
      key += '/';
    }
    key += uri::percent_encode_segment(part.generic_string());
    first = false;
  }
  return key;
}

ResolveResult ResolverDriver::check(const ResolveOptions & options)
{
  ResolveResult result;

  FileContentLoader files(options.base_dir);
  LoggingContentLoader loader(files, options.verbose);
  FragmentRegistry registry(loader, DocumentCache{}, registry_options(options));

  load_roots(registry, options, result.diagnostics);

  // Documents reached through references are appended to the cache while
  // walking, so this also checks every document they pull in.
  for (std::size_t i = 0; i < registry.cache().paths().size(); ++i) {
    const std::string path = registry.cache().paths()[i];
    check_node(registry, Reference::root(path), registry.load_document(path), result);
  }

  result.documents_loaded = registry.document_count();
  result.success = !result.diagnostics.has_errors();
  return result;
}

ResolveResult ResolverDriver::dump(const ResolveOptions & options)
{
  ResolveResult result;

  FileContentLoader files(options.base_dir);
  LoggingContentLoader loader(files, options.verbose);
  FragmentRegistry registry(loader, DocumentCache{}, registry_options(options));

  load_roots(registry, options, result.diagnostics);
  if (result.diagnostics.has_errors()) {
    return result;
  }

  const std::string schema_key = document_key(options.base_dir, options.schema);
  const Reference start = Reference::root(schema_key).resolve("#" + options.pointer);
  try {
    const Fragment fragment = registry.get(start);
    std::unordered_set<const Value *> active;
    // Strings are not validated as UTF-8 on load; bad bytes become U+FFFD
    result.output = render(fragment, active)
                      .dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
  } catch (const Error & e) {
    result.diagnostics.report_error(start, e.what()).with_code(error_code(e));
  }

  result.documents_loaded = registry.document_count();
  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace oasgen
