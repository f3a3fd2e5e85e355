// chartscan/values/value.hpp - Parsed values document representation
//
// A values document is a tree of Value nodes. Mapping and sequence children
// are owned exclusively by their parent: copying a Value copies the whole
// subtree, so two Values never share nested state.
//
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chartscan
{

// ============================================================================
// Value Kind
// ============================================================================

enum class ValueKind : uint8_t {
  Null,      ///< Explicit null (`~`, `null` or an empty value)
  Scalar,    ///< Leaf value, kept as source text
  Sequence,  ///< Ordered list of values
  Mapping,   ///< String-keyed map of values
};

/**
 * Interpretation of a scalar's text.
 *
 * Only used for presentation (typed JSON/YAML output); presence checks never
 * look at it.
 */
enum class ScalarKind : uint8_t {
  String,
  Integer,
  Float,
  Bool,
};

class Value;

/// Keys are unique; iteration is in key order.
using ValueMapping = std::map<std::string, Value, std::less<>>;
using ValueSequence = std::vector<Value>;

// ============================================================================
// Value
// ============================================================================

class Value
{
public:
  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value make_null();
  static Value make_string(std::string text);
  static Value make_integer(int64_t value);
  static Value make_float(double value);
  static Value make_bool(bool value);
  static Value make_scalar(ScalarKind kind, std::string text);
  static Value make_sequence(ValueSequence items);
  static Value make_mapping(ValueMapping entries);

  /// Default constructor creates a Null value
  Value() noexcept;
  ~Value();

  Value(const Value & other);
  Value & operator=(const Value & other);
  Value(Value && other) noexcept;
  Value & operator=(Value && other) noexcept;

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_null() const noexcept { return kind_ == ValueKind::Null; }
  [[nodiscard]] bool is_scalar() const noexcept { return kind_ == ValueKind::Scalar; }
  [[nodiscard]] bool is_sequence() const noexcept { return kind_ == ValueKind::Sequence; }
  [[nodiscard]] bool is_mapping() const noexcept { return kind_ == ValueKind::Mapping; }

  // ===========================================================================
  // Accessors
  // ===========================================================================

  /// Scalar kind (only meaningful if is_scalar())
  [[nodiscard]] ScalarKind scalar_kind() const noexcept { return scalar_kind_; }

  /// Scalar source text (empty unless is_scalar())
  [[nodiscard]] const std::string & scalar_text() const noexcept { return text_; }

  /// Sequence items (only valid if is_sequence())
  [[nodiscard]] const ValueSequence & as_sequence() const;

  /// Mapping entries (only valid if is_mapping())
  [[nodiscard]] const ValueMapping & as_mapping() const;
  [[nodiscard]] ValueMapping & as_mapping();

  /// Look up a direct child of a mapping. Returns nullptr for non-mappings.
  [[nodiscard]] const Value * find(std::string_view key) const;

  /// Number of children (0 for null and scalars)
  [[nodiscard]] size_t size() const noexcept;

  [[nodiscard]] bool operator==(const Value & other) const;
  [[nodiscard]] bool operator!=(const Value & other) const { return !(*this == other); }

private:
  ValueKind kind_ = ValueKind::Null;
  ScalarKind scalar_kind_ = ScalarKind::String;
  std::string text_;
  std::unique_ptr<ValueSequence> sequence_;
  std::unique_ptr<ValueMapping> mapping_;
};

// ============================================================================
// Scalar Helpers
// ============================================================================

/**
 * Classify the text of a plain (unquoted) YAML scalar.
 *
 * Follows the YAML 1.2 core schema: `true`/`false` in any of their three
 * spellings are booleans, decimal/octal/hex integers are Integer,
 * decimal/exponent/`.inf`/`.nan` forms are Float, everything else is String.
 */
[[nodiscard]] ScalarKind classify_plain_scalar(std::string_view text) noexcept;

/// True for the plain-scalar spellings of null (`~`, `null`, `Null`, `NULL`, empty).
[[nodiscard]] bool is_null_spelling(std::string_view text) noexcept;

}  // namespace chartscan
