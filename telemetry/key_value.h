#ifndef __OTEL_DERIVE_TELEMETRY_KEY_VALUE_H__
#define __OTEL_DERIVE_TELEMETRY_KEY_VALUE_H__

#include <string>
#include <utility>

#include "telemetry/convert.h"
#include "telemetry/key.h"
#include "telemetry/value.h"

namespace otel_derive {
namespace telemetry {

// A telemetry attribute: a `Key` paired with a `Value`.
class KeyValue {
 public:
  template <typename KeyArg, typename ValueArg>
  explicit KeyValue(KeyArg&& key, ValueArg&& value)
      : key_(std::forward<KeyArg>(key)), value_(std::forward<ValueArg>(value)) {}

  KeyValue(KeyValue const&) = default;
  KeyValue& operator=(KeyValue const&) = default;
  KeyValue(KeyValue&&) noexcept = default;
  KeyValue& operator=(KeyValue&&) noexcept = default;

  // Converts any value into a `KeyValue` according to `Convert`.
  template <typename Source>
  static KeyValue From(Source&& source) {
    return Convert<KeyValue>(std::forward<Source>(source));
  }

  friend bool operator==(KeyValue const& lhs, KeyValue const& rhs) {
    return lhs.key_ == rhs.key_ && lhs.value_ == rhs.value_;
  }

  friend bool operator!=(KeyValue const& lhs, KeyValue const& rhs) { return !(lhs == rhs); }

  template <typename H>
  friend H AbslHashValue(H h, KeyValue const& kv) {
    return H::combine(std::move(h), kv.key_, kv.value_);
  }

  // Renders as `key=value`.
  template <typename Sink>
  friend void AbslStringify(Sink& sink, KeyValue const& kv) {
    sink.Append(kv.key_.AsString());
    sink.Append("=");
    sink.Append(kv.value_.AsString());
  }

  Key const& key() const { return key_; }
  Value const& value() const { return value_; }

 private:
  Key key_;
  Value value_;
};

}  // namespace telemetry
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_TELEMETRY_KEY_VALUE_H__
