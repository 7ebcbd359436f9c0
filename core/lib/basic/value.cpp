// oasgen/basic/value.cpp - Structural document value implementation
//
#include "oasgen/basic/value.hpp"

#include <utility>

namespace oasgen
{

const char * to_string(ValueKind kind) noexcept
{
  switch (kind) {
    case ValueKind::Map:
      return "map";
    case ValueKind::List:
      return "list";
    case ValueKind::String:
      return "string";
    case ValueKind::Boolean:
      return "boolean";
    case ValueKind::Scalar:
      return "scalar";
  }
  return "unknown";
}

const char * to_string(ScalarKind kind) noexcept
{
  switch (kind) {
    case ScalarKind::Null:
      return "null";
    case ScalarKind::Integer:
      return "integer";
    case ScalarKind::Real:
      return "real";
  }
  return "unknown";
}

// ============================================================================
// Mapping
// ============================================================================

Mapping::Mapping() = default;
Mapping::Mapping(const Mapping & other) = default;
Mapping::Mapping(Mapping && other) noexcept = default;
Mapping & Mapping::operator=(const Mapping & other) = default;
Mapping & Mapping::operator=(Mapping && other) noexcept = default;
Mapping::~Mapping() = default;

void Mapping::insert(std::string key, Value value)
{
  auto it = index_.find(key);
  if (it != index_.end()) {
    values_[it->second] = std::move(value);
    return;
  }
  index_.emplace(key, keys_.size());
  keys_.push_back(std::move(key));
  values_.push_back(std::move(value));
}

const Value * Mapping::find(std::string_view key) const
{
  auto it = index_.find(std::string(key));
  if (it == index_.end()) {
    return nullptr;
  }
  return &values_[it->second];
}

const Value & Mapping::value_at(std::size_t index) const { return values_.at(index); }

// ============================================================================
// Value
// ============================================================================

ValueKind Value::kind() const noexcept
{
  if (is_map()) {
    return ValueKind::Map;
  }
  if (is_list()) {
    return ValueKind::List;
  }
  if (is_string()) {
    return ValueKind::String;
  }
  if (is_bool()) {
    return ValueKind::Boolean;
  }
  return ValueKind::Scalar;
}

ScalarKind Value::scalar_kind() const noexcept
{
  if (is_integer()) {
    return ScalarKind::Integer;
  }
  if (is_real()) {
    return ScalarKind::Real;
  }
  return ScalarKind::Null;
}

bool Value::operator==(const Value & other) const
{
  if (data_.index() != other.data_.index()) {
    return false;
  }

  if (is_map()) {
    const Mapping & lhs = map();
    const Mapping & rhs = other.map();
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
      const Value * match = rhs.find(lhs.keys()[i]);
      if (match == nullptr || !(lhs.value_at(i) == *match)) {
        return false;
      }
    }
    return true;
  }

  if (is_list()) {
    return list() == other.list();
  }
  if (is_string()) {
    return string() == other.string();
  }
  if (is_bool()) {
    return boolean() == other.boolean();
  }
  if (is_integer()) {
    return integer() == other.integer();
  }
  if (is_real()) {
    return real() == other.real();
  }
  return true;
}

}  // namespace oasgen
