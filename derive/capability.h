#ifndef __OTEL_DERIVE_DERIVE_CAPABILITY_H__
#define __OTEL_DERIVE_DERIVE_CAPABILITY_H__

#include <optional>
#include <string_view>

namespace otel_derive {
namespace derive {

// The conversions that can be derived for an annotated type. The enumerators are sorted in emission
// order: a conversion may only depend on conversions that precede it.
enum class Capability {
  kKey,
  kStringValue,
  kValue,
  kKeyValue,
};

inline Capability constexpr kAllCapabilities[] = {
    Capability::kKey,
    Capability::kStringValue,
    Capability::kValue,
    Capability::kKeyValue,
};

// Returns the name used in `otel::derive(...)`, which is also the name of the target type.
std::string_view CapabilityName(Capability capability);

// Returns an empty optional if `name` isn't a capability name.
std::optional<Capability> ParseCapabilityName(std::string_view name);

// Returns the fully qualified name of the telemetry type targeted by `capability`, e.g.
// `::otel_derive::telemetry::Key`.
std::string_view CapabilityTargetType(Capability capability);

}  // namespace derive
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_DERIVE_CAPABILITY_H__
