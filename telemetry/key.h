#ifndef __OTEL_DERIVE_TELEMETRY_KEY_H__
#define __OTEL_DERIVE_TELEMETRY_KEY_H__

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "telemetry/convert.h"

namespace otel_derive {
namespace telemetry {

class Array;
class KeyValue;
class StringValue;

// The name of a telemetry attribute.
class Key {
 public:
  explicit Key(std::string_view const name) : name_(name) {}
  explicit Key(std::string name) : name_(std::move(name)) {}
  explicit Key(char const* const name) : name_(name) {}

  Key(Key const&) = default;
  Key& operator=(Key const&) = default;
  Key(Key&&) noexcept = default;
  Key& operator=(Key&&) noexcept = default;

  // Converts any value into a `Key` according to `Convert`.
  template <typename Source>
  static Key From(Source&& source) {
    return Convert<Key>(std::forward<Source>(source));
  }

  void swap(Key& other) noexcept {
    using std::swap;  // ensure ADL
    swap(name_, other.name_);
  }

  friend void swap(Key& lhs, Key& rhs) noexcept { lhs.swap(rhs); }

  friend bool operator==(Key const& lhs, Key const& rhs) { return lhs.name_ == rhs.name_; }
  friend bool operator!=(Key const& lhs, Key const& rhs) { return lhs.name_ != rhs.name_; }
  friend bool operator<(Key const& lhs, Key const& rhs) { return lhs.name_ < rhs.name_; }
  friend bool operator<=(Key const& lhs, Key const& rhs) { return lhs.name_ <= rhs.name_; }
  friend bool operator>(Key const& lhs, Key const& rhs) { return lhs.name_ > rhs.name_; }
  friend bool operator>=(Key const& lhs, Key const& rhs) { return lhs.name_ >= rhs.name_; }

  template <typename H>
  friend H AbslHashValue(H h, Key const& key) {
    return H::combine(std::move(h), key.name_);
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, Key const& key) {
    sink.Append(key.name_);
  }

  std::string_view AsString() const { return name_; }

  // Shorthands pairing this key with a value.
  KeyValue WithBool(bool value) const;
  KeyValue WithInt64(int64_t value) const;
  KeyValue WithDouble(double value) const;
  KeyValue WithString(StringValue value) const;
  KeyValue WithArray(Array value) const;

 private:
  std::string name_;
};

}  // namespace telemetry
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_TELEMETRY_KEY_H__
