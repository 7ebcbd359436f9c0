// oasgen/loader/document_parser.cpp - JSON / YAML parsing
//
// JSON goes through nlohmann::ordered_json so mapping keys keep document
// order; YAML goes through yaml-cpp. Both are converted into Value.
//
#include "oasgen/loader/document_parser.hpp"

#include <yaml-cpp/yaml.h>

#include <charconv>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>

#include "oasgen/basic/errors.hpp"

namespace oasgen
{

namespace
{

// ============================================================================
// JSON
// ============================================================================

Value from_json(const nlohmann::ordered_json & node)
{
  using value_t = nlohmann::ordered_json::value_t;

  switch (node.type()) {
    case value_t::object: {
      Mapping map;
      for (auto it = node.begin(); it != node.end(); ++it) {
        map.insert(it.key(), from_json(it.value()));
      }
      return Value::make_map(std::move(map));
    }
    case value_t::array: {
      Sequence list;
      list.reserve(node.size());
      for (const auto & item : node) {
        list.push_back(from_json(item));
      }
      return Value::make_list(std::move(list));
    }
    case value_t::string:
      return Value::make_string(node.get<std::string>());
    case value_t::boolean:
      return Value::make_bool(node.get<bool>());
    case value_t::number_integer:
      return Value::make_integer(node.get<int64_t>());
    case value_t::number_unsigned: {
      const auto value = node.get<uint64_t>();
      if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return Value::make_real(static_cast<double>(value));
      }
      return Value::make_integer(static_cast<int64_t>(value));
    }
    case value_t::number_float:
      return Value::make_real(node.get<double>());
    default:
      return Value::make_null();
  }
}

Value parse_json(std::string_view text, const std::string & path)
{
  nlohmann::ordered_json root;
  try {
    root = nlohmann::ordered_json::parse(text.begin(), text.end());
  } catch (const nlohmann::ordered_json::exception & e) {
    throw LoadError(path, std::string("invalid JSON: ") + e.what());
  }
  return from_json(root);
}

// ============================================================================
// YAML
// ============================================================================

constexpr const char * k_tag_int = "tag:yaml.org,2002:int";
constexpr const char * k_tag_float = "tag:yaml.org,2002:float";
constexpr const char * k_tag_bool = "tag:yaml.org,2002:bool";
constexpr const char * k_tag_null = "tag:yaml.org,2002:null";

std::optional<bool> parse_bool(const std::string & s)
{
  if (s == "true" || s == "True" || s == "TRUE") {
    return true;
  }
  if (s == "false" || s == "False" || s == "FALSE") {
    return false;
  }
  return std::nullopt;
}

bool is_null_literal(const std::string & s)
{
  return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

std::optional<int64_t> parse_integer(std::string_view s)
{
  int base = 10;
  bool negative = false;

  // Hex and octal forms are unsigned in the core schema
  if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'o')) {
    base = s[1] == 'x' ? 16 : 8;
    s.remove_prefix(2);
  } else if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
    negative = s.front() == '-';
    s.remove_prefix(1);
  }
  if (s.empty()) {
    return std::nullopt;
  }

  uint64_t magnitude = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), magnitude, base);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    return std::nullopt;
  }

  constexpr auto k_max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  if (negative) {
    if (magnitude > k_max + 1) {
      return std::nullopt;
    }
    return magnitude == k_max + 1 ? std::numeric_limits<int64_t>::min()
                                  : -static_cast<int64_t>(magnitude);
  }
  if (magnitude > k_max) {
    return std::nullopt;
  }
  return static_cast<int64_t>(magnitude);
}

std::optional<double> parse_real(std::string_view s)
{
  if (s == ".inf" || s == ".Inf" || s == ".INF" || s == "+.inf" || s == "+.Inf" || s == "+.INF") {
    return std::numeric_limits<double>::infinity();
  }
  if (s == "-.inf" || s == "-.Inf" || s == "-.INF") {
    return -std::numeric_limits<double>::infinity();
  }
  if (s == ".nan" || s == ".NaN" || s == ".NAN") {
    return std::numeric_limits<double>::quiet_NaN();
  }

  if (!s.empty() && s.front() == '+') {
    s.remove_prefix(1);
  }
  // Require at least one digit so "." or "e" alone stay strings
  if (s.find_first_of("0123456789") == std::string_view::npos) {
    return std::nullopt;
  }

  double value = 0.0;
  const auto [ptr, ec] =
    std::from_chars(s.data(), s.data() + s.size(), value, std::chars_format::general);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

/// YAML 1.2 core schema resolution of an untagged plain scalar
Value resolve_plain_scalar(const std::string & s)
{
  if (is_null_literal(s)) {
    return Value::make_null();
  }
  if (auto b = parse_bool(s)) {
    return Value::make_bool(*b);
  }
  if (auto i = parse_integer(s)) {
    return Value::make_integer(*i);
  }
  if (auto d = parse_real(s)) {
    return Value::make_real(*d);
  }
  return Value::make_string(s);
}

Value resolve_scalar(const YAML::Node & node, const std::string & path)
{
  const std::string & tag = node.Tag();
  const std::string & text = node.Scalar();

  if (tag == "?") {
    return resolve_plain_scalar(text);
  }
  if (tag == k_tag_int) {
    if (auto i = parse_integer(text)) {
      return Value::make_integer(*i);
    }
    throw LoadError(path, "invalid !!int scalar '" + text + "'");
  }
  if (tag == k_tag_float) {
    if (auto d = parse_real(text)) {
      return Value::make_real(*d);
    }
    throw LoadError(path, "invalid !!float scalar '" + text + "'");
  }
  if (tag == k_tag_bool) {
    if (auto b = parse_bool(text)) {
      return Value::make_bool(*b);
    }
    throw LoadError(path, "invalid !!bool scalar '" + text + "'");
  }
  if (tag == k_tag_null) {
    return Value::make_null();
  }

  // "!" (quoted), !!str and application tags
  return Value::make_string(text);
}

Value from_yaml(const YAML::Node & node, const std::string & path)
{
  switch (node.Type()) {
    case YAML::NodeType::Map: {
      Mapping map;
      for (const auto & entry : node) {
        map.insert(entry.first.Scalar(), from_yaml(entry.second, path));
      }
      return Value::make_map(std::move(map));
    }
    case YAML::NodeType::Sequence: {
      Sequence list;
      list.reserve(node.size());
      for (const auto & item : node) {
        list.push_back(from_yaml(item, path));
      }
      return Value::make_list(std::move(list));
    }
    case YAML::NodeType::Scalar:
      return resolve_scalar(node, path);
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      break;
  }
  return Value::make_null();
}

Value parse_yaml(std::string_view text, const std::string & path)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(text));
  } catch (const YAML::Exception & e) {
    throw LoadError(path, std::string("invalid YAML: ") + e.what());
  }
  return from_yaml(root, path);
}

}  // namespace

DocumentFormat format_for_path(std::string_view path)
{
  const auto dot = path.rfind('.');
  const std::string_view extension =
    dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);

  if (extension == "json") {
    return DocumentFormat::Json;
  }
  if (extension == "yaml" || extension == "yml") {
    return DocumentFormat::Yaml;
  }
  throw LoadError(std::string(path), "unsupported extension '" + std::string(extension) + "'");
}

Value parse_document(std::string_view text, DocumentFormat format, const std::string & path)
{
  Value root = format == DocumentFormat::Json ? parse_json(text, path) : parse_yaml(text, path);
  if (!root.is_map()) {
    throw LoadError(
      path, std::string("top-level value must be a map, found ") + to_string(root.kind()));
  }
  return root;
}

}  // namespace oasgen
