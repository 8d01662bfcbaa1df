#ifndef __OTEL_DERIVE_DERIVE_DIAGNOSTIC_H__
#define __OTEL_DERIVE_DERIVE_DIAGNOSTIC_H__

#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "derive/source_location.h"

namespace otel_derive {
namespace derive {

// Categories of generation failures. Every failure aborts generation for the whole input file.
enum class DiagnosticKind {
  // The annotation or the surrounding source can't be parsed.
  kSyntaxError,

  // An `otel(...)` block names an option other than `key` and `variant`, or an attribute in the
  // `otel` namespace other than `derive`.
  kUnknownOption,

  // An option value has the wrong kind, e.g. `key = 42`.
  kMalformedOption,

  // The same option is given twice for the same type.
  kDuplicateOption,

  // A capability requires an option that is absent (`variant` for `Value`).
  kMissingRequiredOption,

  // The annotated item is not a struct, class or enum definition.
  kUnsupportedItemKind,

  // `otel::derive(...)` names something other than `Key`, `Value`, `StringValue` and `KeyValue`.
  kUnknownCapability,

  // `otel::derive(...)` lists the same capability twice.
  kDuplicateCapability,

  // An `otel(...)` block is attached to a type that doesn't derive anything.
  kOrphanedOptions,
};

std::string_view DiagnosticKindName(DiagnosticKind kind);

// Builds the error status reporting a diagnostic. The status code depends on `kind`; the kind and
// the location are attached as payloads and can be retrieved with `GetDiagnosticKind` and
// `GetDiagnosticLocation`.
absl::Status MakeDiagnostic(DiagnosticKind kind, SourceLocation location, std::string_view message);

// Returns an empty optional if `status` wasn't built by `MakeDiagnostic`.
std::optional<DiagnosticKind> GetDiagnosticKind(absl::Status const& status);

// Returns an empty optional if `status` wasn't built by `MakeDiagnostic`.
std::optional<SourceLocation> GetDiagnosticLocation(absl::Status const& status);

// Renders `status` in the format used by compilers:
//
//   foo/types.h:12:18: error: unknown option "keys" [UnknownOption]
//     struct [[otel(keys = "x")]] Foo {};
//                   ^
//
// `source` is the content of the input file and is used to quote the offending line. Statuses not
// built by `MakeDiagnostic` (e.g. I/O errors) are rendered as `file: error: message`.
std::string FormatDiagnostic(std::string_view file_name, std::string_view source,
                             absl::Status const& status);

}  // namespace derive
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_DERIVE_DIAGNOSTIC_H__
