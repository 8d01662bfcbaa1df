#ifndef __OTEL_DERIVE_DERIVE_OPTIONS_H__
#define __OTEL_DERIVE_DERIVE_OPTIONS_H__

#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "derive/capability.h"
#include "derive/lexer.h"
#include "derive/source_location.h"

namespace otel_derive {
namespace derive {

// The argument list of an `otel(...)` or `otel::derive(...)` attribute, as found by the scanner.
struct AttributeBlock {
  // Location of the attribute name.
  SourceLocation location;

  // Tokens between the parentheses, excluding the parentheses themselves.
  std::vector<Token> arguments;
};

struct KeyOption {
  // The decoded content of the string literal.
  std::string value;
  SourceLocation location;
};

struct VariantOption {
  // The type reference as it must be spelled in the generated code, e.g. `int64_t`,
  // `std::string` or `::otel_derive::telemetry::StringValue`.
  std::string type_name;
  SourceLocation location;
};

// The options of all `otel(...)` blocks attached to one type. Every capability derived for the type
// reads the same instance.
struct AttributeOptions {
  std::optional<KeyOption> key;
  std::optional<VariantOption> variant;
};

struct CapabilityRequest {
  Capability capability;
  SourceLocation location;
};

// Parses an `otel(...)` block with the grammar:
//
//   options := option ( ',' option )*
//   option  := 'key' '=' string-literal+
//            | 'variant' '=' type-reference
//
// and merges the result into `options`. Options that are already set in `options` are reported as
// duplicates, so calling this function on all the blocks of a type validates the whole set.
absl::Status ParseAttributeOptions(AttributeBlock const& block, AttributeOptions* options);

// Parses and merges all the `otel(...)` blocks of a type. An empty `blocks` span yields empty
// options.
absl::StatusOr<AttributeOptions> ParseAttributeOptions(absl::Span<AttributeBlock const> blocks);

// Parses the type reference of a `variant` option. `location` is used for diagnostics if `tokens`
// is empty.
absl::StatusOr<std::string> ParseTypeReference(absl::Span<Token const> tokens,
                                               SourceLocation location);

// Decodes a sequence of adjacent ordinary string literals as the C++ compiler would.
absl::StatusOr<std::string> DecodeStringLiterals(absl::Span<Token const> tokens,
                                                 SourceLocation location);

// Parses the `otel::derive(...)` blocks of a type. The result is in the order the capabilities were
// listed.
absl::StatusOr<std::vector<CapabilityRequest>> ParseCapabilityRequests(
    absl::Span<AttributeBlock const> blocks);

}  // namespace derive
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_DERIVE_OPTIONS_H__
