#ifndef __OTEL_DERIVE_TELEMETRY_CONVERT_H__
#define __OTEL_DERIVE_TELEMETRY_CONVERT_H__

#include <type_traits>
#include <utility>

namespace otel_derive {
namespace telemetry {

// Tag type selecting the target of an `OtelDeriveConvert` hook.
template <typename Target>
struct ConvertTag {
  using type = Target;
};

namespace internal {

template <typename Target, typename Source, typename = void>
struct HasConvertHook : std::false_type {};

template <typename Target, typename Source>
struct HasConvertHook<Target, Source,
                      std::void_t<decltype(OtelDeriveConvert(std::declval<ConvertTag<Target>>(),
                                                             std::declval<Source>()))>>
    : std::true_type {};

}  // namespace internal

// Indicates whether an `OtelDeriveConvert(ConvertTag<Target>, Source)` overload is visible through
// ADL. `Source` may be a reference type, in which case its value category participates in overload
// resolution.
template <typename Target, typename Source>
inline bool constexpr HasConvertHookV = internal::HasConvertHook<Target, Source>::value;

// Converts `source` into `Target`.
//
// A conversion is found in two ways:
//
//   1. an `OtelDeriveConvert` overload found by ADL, e.g.:
//
//        namespace app {
//        struct Counter {
//          int64_t count;
//        };
//        inline int64_t OtelDeriveConvert(ConvertTag<int64_t>, Counter const& value) {
//          return value.count;
//        }
//        }  // namespace app
//
//   2. failing that, `static_cast<Target>`, which picks up explicit constructors of `Target` and
//      conversion operators of the source type.
//
// The code emitted by `otel_derive_gen` only defines `OtelDeriveConvert` overloads, so derived and
// hand-written conversions compose freely.
template <typename Target, typename Source>
Target Convert(Source&& source) {
  if constexpr (HasConvertHookV<Target, Source&&>) {
    return OtelDeriveConvert(ConvertTag<Target>{}, std::forward<Source>(source));
  } else {
    return static_cast<Target>(std::forward<Source>(source));
  }
}

}  // namespace telemetry
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_TELEMETRY_CONVERT_H__
