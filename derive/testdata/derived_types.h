#ifndef __OTEL_DERIVE_DERIVE_TESTDATA_DERIVED_TYPES_H__
#define __OTEL_DERIVE_DERIVE_TESTDATA_DERIVED_TYPES_H__

#include <cstdint>
#include <string>
#include <string_view>

#include "telemetry/telemetry.h"

struct [[otel::derive(Key)]] Auto {};

namespace app {

struct [[otel::derive(Key)]] [[otel(key = "custom")]] Overriden {};

struct [[otel::derive(Value), otel(variant = int64_t)]] Counter {
  int64_t count;
};

inline int64_t OtelDeriveConvert(::otel_derive::telemetry::ConvertTag<int64_t> /*tag*/,
                                 Counter const& value) {
  return value.count;
}

enum class [[otel::derive(StringValue)]] Method { kGet, kPost };

template <typename Sink>
void AbslStringify(Sink& sink, Method const method) {
  switch (method) {
    case Method::kGet:
      sink.Append("GET");
      break;
    case Method::kPost:
      sink.Append("POST");
      break;
  }
}

// `Key` and `Value` are written by hand, `KeyValue` is derived from them.
struct [[otel::derive(KeyValue)]] Config {
  std::string name;
  double ratio;
};

inline ::otel_derive::telemetry::Key OtelDeriveConvert(
    ::otel_derive::telemetry::ConvertTag<::otel_derive::telemetry::Key> /*tag*/,
    Config const& value) {
  return ::otel_derive::telemetry::Key(value.name);
}

inline ::otel_derive::telemetry::Value OtelDeriveConvert(
    ::otel_derive::telemetry::ConvertTag<::otel_derive::telemetry::Value> /*tag*/,
    Config const& value) {
  return value.ratio;
}

struct [[otel::derive(Key, StringValue, Value, KeyValue)]]
[[otel(key = "req", variant = StringValue)]] Request {
  std::string query;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, Request const& request) {
    sink.Append(request.query);
  }
};

class Outer {
 public:
  enum [[otel::derive(Key, StringValue)]] Inner { kInner };
};

template <typename Sink>
void AbslStringify(Sink& sink, Outer::Inner const /*inner*/) {
  sink.Append("inner");
}

namespace {

struct [[otel::derive(Key)]] Hidden {};

}  // namespace

}  // namespace app

#endif  // __OTEL_DERIVE_DERIVE_TESTDATA_DERIVED_TYPES_H__
