#ifndef __OTEL_DERIVE_DERIVE_SYNTHESIZER_H__
#define __OTEL_DERIVE_DERIVE_SYNTHESIZER_H__

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "derive/capability.h"
#include "derive/options.h"
#include "derive/text_writer.h"
#include "derive/type_descriptor.h"

namespace otel_derive {
namespace derive {

// One derived capability of a type. `EmitConversion` turns it into two `OtelDeriveConvert`
// overloads: one taking the type by const reference and containing `return_expression`, and one
// taking an rvalue and forwarding to the former.
struct GeneratedConversion {
  Capability capability;

  // Fully qualified target type, e.g. `::otel_derive::telemetry::Key`.
  std::string target_type;

  // The expression returned by the by-reference overload. It refers to the converted instance as
  // `value`.
  std::string return_expression;

  // False if `return_expression` doesn't refer to `value`, in which case the parameter is left
  // unnamed.
  bool uses_value = true;

  // True if `return_expression` calls `absl::StrCat`.
  bool uses_str_cat = false;
};

// Computes the key of types deriving `Key` without a `key` option: the type name lowercased.
std::string DefaultKeyName(TypeDescriptor const& type);

// Checks that `options` carries everything `request` needs. Fails with `kMissingRequiredOption` at
// the location of the capability name otherwise. A `variant` naming `type` itself is rejected with
// `kMalformedOption` at the location of the option.
absl::Status ValidateCapability(TypeDescriptor const& type, CapabilityRequest const& request,
                                AttributeOptions const& options);

// Validates `request` and synthesizes its conversion.
absl::StatusOr<GeneratedConversion> SynthesizeConversion(TypeDescriptor const& type,
                                                         AttributeOptions const& options,
                                                         CapabilityRequest const& request);

// Synthesizes all the requested conversions of `type`, sorted in emission order so that every
// conversion is declared before those that may use it. Fails on the first invalid request.
absl::StatusOr<std::vector<GeneratedConversion>> SynthesizeConversions(
    TypeDescriptor const& type, AttributeOptions const& options,
    absl::Span<CapabilityRequest const> requests);

// Emits the by-reference and by-value overloads of `conversion`.
void EmitConversion(TypeDescriptor const& type, GeneratedConversion const& conversion,
                    internal::TextWriter* writer);

}  // namespace derive
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_DERIVE_SYNTHESIZER_H__
