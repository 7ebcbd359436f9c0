// oasgen/basic/value.hpp - Structural document values
//
// Closed variant over the value kinds a JSON or YAML document can hold.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace oasgen
{

class Value;

// ============================================================================
// Value Kind
// ============================================================================

/**
 * Kind of a structural value.
 */
enum class ValueKind : uint8_t {
  Map,      ///< String-keyed mapping, insertion ordered
  List,     ///< Index-ordered sequence
  String,   ///< Text scalar
  Boolean,  ///< true / false
  Scalar,   ///< Any other scalar (null, integer, real)
};

/**
 * Sub-kind of a ValueKind::Scalar value.
 */
enum class ScalarKind : uint8_t {
  Null,
  Integer,  ///< 64-bit signed integer
  Real,     ///< 64-bit floating point
};

[[nodiscard]] const char * to_string(ValueKind kind) noexcept;
[[nodiscard]] const char * to_string(ScalarKind kind) noexcept;

// ============================================================================
// Mapping
// ============================================================================

/**
 * String-keyed mapping that preserves insertion order.
 *
 * Inserting an existing key replaces its value in place.
 */
class Mapping
{
public:
  Mapping();
  Mapping(const Mapping & other);
  Mapping(Mapping && other) noexcept;
  Mapping & operator=(const Mapping & other);
  Mapping & operator=(Mapping && other) noexcept;
  ~Mapping();

  void insert(std::string key, Value value);

  /// Value stored under key, or nullptr
  [[nodiscard]] const Value * find(std::string_view key) const;

  [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

  [[nodiscard]] const std::vector<std::string> & keys() const noexcept { return keys_; }
  [[nodiscard]] const Value & value_at(std::size_t index) const;

  [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }
  [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }

private:
  std::vector<std::string> keys_;
  std::vector<Value> values_;
  std::unordered_map<std::string, std::size_t> index_;
};

using Sequence = std::vector<Value>;

// ============================================================================
// Value
// ============================================================================

/**
 * A structural value loaded from a document.
 *
 * Documents are immutable once loaded; Value offers no mutation beyond
 * construction. Every accessor is a checked match on the kind.
 */
class Value
{
public:
  /// Null scalar
  Value() = default;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value make_null() { return Value(); }

  static Value make_bool(bool value)
  {
    Value v;
    v.data_ = value;
    return v;
  }

  static Value make_integer(int64_t value)
  {
    Value v;
    v.data_ = value;
    return v;
  }

  static Value make_real(double value)
  {
    Value v;
    v.data_ = value;
    return v;
  }

  static Value make_string(std::string value)
  {
    Value v;
    v.data_ = std::move(value);
    return v;
  }

  static Value make_map(Mapping value)
  {
    Value v;
    v.data_ = std::move(value);
    return v;
  }

  static Value make_list(Sequence value)
  {
    Value v;
    v.data_ = std::move(value);
    return v;
  }

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept;

  /// Only meaningful when kind() == ValueKind::Scalar
  [[nodiscard]] ScalarKind scalar_kind() const noexcept;

  [[nodiscard]] bool is_map() const noexcept { return std::holds_alternative<Mapping>(data_); }
  [[nodiscard]] bool is_list() const noexcept { return std::holds_alternative<Sequence>(data_); }
  [[nodiscard]] bool is_string() const noexcept
  {
    return std::holds_alternative<std::string>(data_);
  }
  [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  [[nodiscard]] bool is_null() const noexcept
  {
    return std::holds_alternative<std::monostate>(data_);
  }
  [[nodiscard]] bool is_integer() const noexcept
  {
    return std::holds_alternative<int64_t>(data_);
  }
  [[nodiscard]] bool is_real() const noexcept { return std::holds_alternative<double>(data_); }

  // Unchecked accessors; callers match on kind() first.
  [[nodiscard]] const Mapping & map() const { return std::get<Mapping>(data_); }
  [[nodiscard]] const Sequence & list() const { return std::get<Sequence>(data_); }
  [[nodiscard]] const std::string & string() const { return std::get<std::string>(data_); }
  [[nodiscard]] bool boolean() const { return std::get<bool>(data_); }
  [[nodiscard]] int64_t integer() const { return std::get<int64_t>(data_); }
  [[nodiscard]] double real() const { return std::get<double>(data_); }

  /// Structural equality (mapping order is not significant)
  [[nodiscard]] bool operator==(const Value & other) const;
  [[nodiscard]] bool operator!=(const Value & other) const { return !(*this == other); }

private:
  std::variant<std::monostate, bool, int64_t, double, std::string, Sequence, Mapping> data_;
};

}  // namespace oasgen
