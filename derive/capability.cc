#include "derive/capability.h"

#include <optional>
#include <string_view>

namespace otel_derive {
namespace derive {

std::string_view CapabilityName(Capability const capability) {
  switch (capability) {
    case Capability::kKey:
      return "Key";
    case Capability::kStringValue:
      return "StringValue";
    case Capability::kValue:
      return "Value";
    case Capability::kKeyValue:
      return "KeyValue";
  }
  return "";
}

std::optional<Capability> ParseCapabilityName(std::string_view const name) {
  for (auto const capability : kAllCapabilities) {
    if (name == CapabilityName(capability)) {
      return capability;
    }
  }
  return std::nullopt;
}

std::string_view CapabilityTargetType(Capability const capability) {
  switch (capability) {
    case Capability::kKey:
      return "::otel_derive::telemetry::Key";
    case Capability::kStringValue:
      return "::otel_derive::telemetry::StringValue";
    case Capability::kValue:
      return "::otel_derive::telemetry::Value";
    case Capability::kKeyValue:
      return "::otel_derive::telemetry::KeyValue";
  }
  return "";
}

}  // namespace derive
}  // namespace otel_derive
