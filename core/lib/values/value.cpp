// chartscan/values/value.cpp - Value implementation
//
#include "chartscan/values/value.hpp"

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace chartscan
{

// ============================================================================
// Factory Methods
// ============================================================================

Value Value::make_null() { return {}; }

Value Value::make_string(std::string text) { return make_scalar(ScalarKind::String, std::move(text)); }

Value Value::make_integer(int64_t value)
{
  return make_scalar(ScalarKind::Integer, std::to_string(value));
}

Value Value::make_float(double value)
{
  return make_scalar(ScalarKind::Float, fmt::format("{}", value));
}

Value Value::make_bool(bool value)
{
  return make_scalar(ScalarKind::Bool, value ? "true" : "false");
}

Value Value::make_scalar(ScalarKind kind, std::string text)
{
  Value v;
  v.kind_ = ValueKind::Scalar;
  v.scalar_kind_ = kind;
  v.text_ = std::move(text);
  return v;
}

Value Value::make_sequence(ValueSequence items)
{
  Value v;
  v.kind_ = ValueKind::Sequence;
  v.sequence_ = std::make_unique<ValueSequence>(std::move(items));
  return v;
}

Value Value::make_mapping(ValueMapping entries)
{
  Value v;
  v.kind_ = ValueKind::Mapping;
  v.mapping_ = std::make_unique<ValueMapping>(std::move(entries));
  return v;
}

// ============================================================================
// Special Members
// ============================================================================

Value::Value() noexcept = default;

Value::~Value() = default;

Value::Value(const Value & other)
: kind_(other.kind_), scalar_kind_(other.scalar_kind_), text_(other.text_)
{
  if (other.sequence_) {
    sequence_ = std::make_unique<ValueSequence>(*other.sequence_);
  }
  if (other.mapping_) {
    mapping_ = std::make_unique<ValueMapping>(*other.mapping_);
  }
}

Value & Value::operator=(const Value & other)
{
  if (this != &other) {
    Value copy(other);
    *this = std::move(copy);
  }
  return *this;
}

Value::Value(Value && other) noexcept
: kind_(other.kind_),
  scalar_kind_(other.scalar_kind_),
  text_(std::move(other.text_)),
  sequence_(std::move(other.sequence_)),
  mapping_(std::move(other.mapping_))
{
  other.kind_ = ValueKind::Null;
}

Value & Value::operator=(Value && other) noexcept
{
  if (this != &other) {
    kind_ = other.kind_;
    scalar_kind_ = other.scalar_kind_;
    text_ = std::move(other.text_);
    sequence_ = std::move(other.sequence_);
    mapping_ = std::move(other.mapping_);
    other.kind_ = ValueKind::Null;
  }
  return *this;
}

// ============================================================================
// Accessors
// ============================================================================

const ValueSequence & Value::as_sequence() const
{
  if (!sequence_) {
    throw std::logic_error("value is not a sequence");
  }
  return *sequence_;
}

const ValueMapping & Value::as_mapping() const
{
  if (!mapping_) {
    throw std::logic_error("value is not a mapping");
  }
  return *mapping_;
}

ValueMapping & Value::as_mapping()
{
  if (!mapping_) {
    throw std::logic_error("value is not a mapping");
  }
  return *mapping_;
}

const Value * Value::find(std::string_view key) const
{
  if (!mapping_) {
    return nullptr;
  }
  const auto it = mapping_->find(key);
  return it == mapping_->end() ? nullptr : &it->second;
}

size_t Value::size() const noexcept
{
  if (sequence_) {
    return sequence_->size();
  }
  if (mapping_) {
    return mapping_->size();
  }
  return 0;
}

bool Value::operator==(const Value & other) const
{
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
    case ValueKind::Null:
      return true;
    case ValueKind::Scalar:
      return scalar_kind_ == other.scalar_kind_ && text_ == other.text_;
    case ValueKind::Sequence:
      return *sequence_ == *other.sequence_;
    case ValueKind::Mapping:
      return *mapping_ == *other.mapping_;
  }
  return false;
}

// ============================================================================
// Scalar Helpers
// ============================================================================

namespace
{

bool all_of_digits(std::string_view s, int base)
{
  if (s.empty()) {
    return false;
  }
  for (const char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    switch (base) {
      case 8:
        if (c < '0' || c > '7') return false;
        break;
      case 16:
        if (std::isxdigit(c) == 0) return false;
        break;
      default:
        if (std::isdigit(c) == 0) return false;
        break;
    }
  }
  return true;
}

bool is_integer_spelling(std::string_view s)
{
  if (s.size() > 2 && s[0] == '0' && s[1] == 'o') {
    return all_of_digits(s.substr(2), 8);
  }
  if (s.size() > 2 && s[0] == '0' && s[1] == 'x') {
    return all_of_digits(s.substr(2), 16);
  }
  if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
    s.remove_prefix(1);
  }
  return all_of_digits(s, 10);
}

bool is_float_spelling(std::string_view s)
{
  static constexpr std::array<std::string_view, 9> k_special = {
    ".inf", ".Inf", ".INF", "+.inf", "+.Inf", "+.INF", "-.inf", "-.Inf", "-.INF",
  };
  for (const auto sp : k_special) {
    if (s == sp) return true;
  }
  if (s == ".nan" || s == ".NaN" || s == ".NAN") {
    return true;
  }

  // [-+]? ( \. [0-9]+ | [0-9]+ ( \. [0-9]* )? ) ( [eE] [-+]? [0-9]+ )?
  size_t i = 0;
  if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;

  size_t int_digits = 0;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])) != 0) {
    ++i;
    ++int_digits;
  }
  size_t frac_digits = 0;
  bool has_dot = false;
  if (i < s.size() && s[i] == '.') {
    has_dot = true;
    ++i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])) != 0) {
      ++i;
      ++frac_digits;
    }
  }
  if (int_digits == 0 && frac_digits == 0) {
    return false;
  }
  bool has_exp = false;
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    has_exp = true;
    ++i;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
    size_t exp_digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])) != 0) {
      ++i;
      ++exp_digits;
    }
    if (exp_digits == 0) {
      return false;
    }
  }
  // Plain digit runs are integers, not floats.
  return i == s.size() && (has_dot || has_exp);
}

}  // namespace

ScalarKind classify_plain_scalar(std::string_view text) noexcept
{
  if (
    text == "true" || text == "True" || text == "TRUE" || text == "false" || text == "False" ||
    text == "FALSE") {
    return ScalarKind::Bool;
  }
  if (is_integer_spelling(text)) {
    return ScalarKind::Integer;
  }
  if (is_float_spelling(text)) {
    return ScalarKind::Float;
  }
  return ScalarKind::String;
}

bool is_null_spelling(std::string_view text) noexcept
{
  return text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL";
}

}  // namespace chartscan
