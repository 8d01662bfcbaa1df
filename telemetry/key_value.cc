#include "telemetry/key_value.h"

#include <cstdint>
#include <utility>

#include "telemetry/key.h"
#include "telemetry/value.h"

namespace otel_derive {
namespace telemetry {

KeyValue Key::WithBool(bool const value) const { return KeyValue(*this, value); }

KeyValue Key::WithInt64(int64_t const value) const { return KeyValue(*this, value); }

KeyValue Key::WithDouble(double const value) const { return KeyValue(*this, value); }

KeyValue Key::WithString(StringValue value) const { return KeyValue(*this, std::move(value)); }

KeyValue Key::WithArray(Array value) const { return KeyValue(*this, std::move(value)); }

}  // namespace telemetry
}  // namespace otel_derive
