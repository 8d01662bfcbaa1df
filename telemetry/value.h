#ifndef __OTEL_DERIVE_TELEMETRY_VALUE_H__
#define __OTEL_DERIVE_TELEMETRY_VALUE_H__

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "common/utilities.h"
#include "telemetry/convert.h"

namespace otel_derive {
namespace telemetry {

// A string attribute value.
class StringValue {
 public:
  explicit StringValue() = default;

  StringValue(std::string value) : value_(std::move(value)) {}  // NOLINT
  StringValue(std::string_view const value) : value_(value) {}   // NOLINT
  StringValue(char const* const value) : value_(value) {}        // NOLINT

  StringValue(StringValue const&) = default;
  StringValue& operator=(StringValue const&) = default;
  StringValue(StringValue&&) noexcept = default;
  StringValue& operator=(StringValue&&) noexcept = default;

  // Converts any value into a `StringValue` according to `Convert`.
  template <typename Source>
  static StringValue From(Source&& source) {
    return Convert<StringValue>(std::forward<Source>(source));
  }

  void swap(StringValue& other) noexcept {
    using std::swap;  // ensure ADL
    swap(value_, other.value_);
  }

  friend void swap(StringValue& lhs, StringValue& rhs) noexcept { lhs.swap(rhs); }

  friend bool operator==(StringValue const& lhs, StringValue const& rhs) {
    return lhs.value_ == rhs.value_;
  }

  friend bool operator!=(StringValue const& lhs, StringValue const& rhs) {
    return lhs.value_ != rhs.value_;
  }

  friend bool operator<(StringValue const& lhs, StringValue const& rhs) {
    return lhs.value_ < rhs.value_;
  }

  template <typename H>
  friend H AbslHashValue(H h, StringValue const& value) {
    return H::combine(std::move(h), value.value_);
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, StringValue const& value) {
    sink.Append(value.value_);
  }

  std::string_view AsString() const { return value_; }

  std::string Release() && { return std::move(value_); }

 private:
  std::string value_;
};

// A homogeneous list of attribute values.
class Array {
 public:
  using Variant = std::variant<std::vector<bool>, std::vector<int64_t>, std::vector<double>,
                               std::vector<StringValue>>;

  Array(std::vector<bool> values) : values_(std::move(values)) {}         // NOLINT
  Array(std::vector<int64_t> values) : values_(std::move(values)) {}      // NOLINT
  Array(std::vector<double> values) : values_(std::move(values)) {}       // NOLINT
  Array(std::vector<StringValue> values) : values_(std::move(values)) {}  // NOLINT

  Array(Array const&) = default;
  Array& operator=(Array const&) = default;
  Array(Array&&) noexcept = default;
  Array& operator=(Array&&) noexcept = default;

  friend bool operator==(Array const& lhs, Array const& rhs) { return lhs.values_ == rhs.values_; }
  friend bool operator!=(Array const& lhs, Array const& rhs) { return lhs.values_ != rhs.values_; }

  template <typename H>
  friend H AbslHashValue(H h, Array const& array) {
    return H::combine(std::move(h), array.values_);
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, Array const& array) {
    sink.Append(array.AsString());
  }

  Variant const& values() const { return values_; }

  // Renders the elements comma-separated in square brackets. String elements are double-quoted and
  // C-escaped, e.g. `["a","b\n"]`.
  std::string AsString() const;

 private:
  Variant values_;
};

// The payload of a telemetry attribute: a boolean, a 64-bit signed integer, a double, a string or
// an array of one of those.
//
// Integral types other than `bool` are widened (or narrowed) to `int64_t` and floating point types
// to `double`. Anything string-like becomes a `StringValue`.
class Value {
 public:
  using Variant = std::variant<bool, int64_t, double, StringValue, Array>;

  // The template prevents pointers from decaying to `bool`.
  template <typename Bool, std::enable_if_t<std::is_same_v<Bool, bool>, bool> = true>
  Value(Bool const value) : value_(std::in_place_type<bool>, value) {}  // NOLINT

  template <typename Integer,
            std::enable_if_t<otel_derive::util::IsIntegralStrictV<Integer>, bool> = true>
  Value(Integer const value)  // NOLINT
      : value_(std::in_place_type<int64_t>, static_cast<int64_t>(value)) {}

  template <typename Float, std::enable_if_t<std::is_floating_point_v<Float>, bool> = true>
  Value(Float const value)  // NOLINT
      : value_(std::in_place_type<double>, static_cast<double>(value)) {}

  Value(StringValue value) : value_(std::in_place_type<StringValue>, std::move(value)) {}  // NOLINT
  Value(std::string value) : value_(std::in_place_type<StringValue>, std::move(value)) {}  // NOLINT
  Value(std::string_view const value) : value_(std::in_place_type<StringValue>, value) {}  // NOLINT
  Value(char const* const value) : value_(std::in_place_type<StringValue>, value) {}       // NOLINT
  Value(Array value) : value_(std::in_place_type<Array>, std::move(value)) {}              // NOLINT

  Value(Value const&) = default;
  Value& operator=(Value const&) = default;
  Value(Value&&) noexcept = default;
  Value& operator=(Value&&) noexcept = default;

  // Converts any value into a `Value` according to `Convert`.
  template <typename Source>
  static Value From(Source&& source) {
    return Convert<Value>(std::forward<Source>(source));
  }

  friend bool operator==(Value const& lhs, Value const& rhs) { return lhs.value_ == rhs.value_; }
  friend bool operator!=(Value const& lhs, Value const& rhs) { return lhs.value_ != rhs.value_; }

  template <typename H>
  friend H AbslHashValue(H h, Value const& value) {
    return H::combine(std::move(h), value.value_);
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, Value const& value) {
    sink.Append(value.AsString());
  }

  Variant const& variant() const { return value_; }

  // Returns the textual rendition of the value: `true`/`false` for booleans, decimal notation for
  // numbers, the verbatim text of strings, and `Array::AsString` for arrays.
  std::string AsString() const;

 private:
  Variant value_;
};

}  // namespace telemetry
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_TELEMETRY_VALUE_H__
