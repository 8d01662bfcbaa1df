#ifndef __OTEL_DERIVE_DERIVE_GENERATOR_H__
#define __OTEL_DERIVE_DERIVE_GENERATOR_H__

#include <cstdio>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "derive/scanner.h"
#include "derive/synthesizer.h"
#include "derive/text_writer.h"
#include "derive/type_descriptor.h"

namespace otel_derive {
namespace derive {

namespace generator {

absl::StatusOr<std::string> ReadFile(FILE* fp);
absl::Status WriteFile(FILE* fp, std::string_view data);

// Replaces the extension of `file_name` with `.otel.h`, e.g. `foo/bar.h` becomes
// `foo/bar.otel.h`.
std::string MakeHeaderFileName(std::string_view file_name);

// Returns the include guard of the header generated for `file_name`, e.g.
// `__OTEL_DERIVE_FOO_BAR_OTEL_H__` for `foo/bar.h`.
std::string GetHeaderGuardName(std::string_view file_name);

}  // namespace generator

// Generates the companion header of a C++ header containing annotated types.
//
// Example:
//
//   DEFINE_CONST_OR_RETURN(generator, Generator::Create("app/types.h", source));
//   auto const content = generator.GenerateHeaderFileContent();
//
// All validation happens in `Create`, so a successfully created generator always produces a
// header.
class Generator {
 public:
  struct Options {
    // The path the generated header uses to include the input header. Defaults to the file name
    // passed to `Create`.
    std::string include_path;
  };

  // An annotated type with its synthesized conversions.
  struct DerivedType {
    TypeDescriptor type;
    std::vector<GeneratedConversion> conversions;
  };

  // Lexes, scans and validates `source`. `file_name` is only used to name the input in the
  // generated header and must not be empty. Fails with the first diagnostic found.
  static absl::StatusOr<Generator> Create(std::string_view file_name, std::string_view source,
                                          Options const& options);

  static absl::StatusOr<Generator> Create(std::string_view const file_name,
                                          std::string_view const source) {
    return Create(file_name, source, /*options=*/{});
  }

  ~Generator() = default;

  Generator(Generator&&) noexcept = default;
  Generator& operator=(Generator&&) noexcept = default;

  absl::Span<DerivedType const> derived_types() const { return derived_types_; }

  std::string GenerateHeaderFileContent() const;

 private:
  explicit Generator(std::string include_path, std::vector<DerivedType> derived_types)
      : include_path_(std::move(include_path)), derived_types_(std::move(derived_types)) {}

  Generator(Generator const&) = delete;
  Generator& operator=(Generator const&) = delete;

  // Runs the per-item pipeline: parses the capability list and the options, describes the type,
  // then validates and synthesizes every capability.
  static absl::StatusOr<DerivedType> DeriveItem(AnnotatedItem const& item);

  bool UsesStrCat() const;

  void EmitIncludes(internal::TextWriter* writer) const;

  static void EmitNamespaceOpening(internal::TextWriter* writer,
                                   absl::Span<NamespaceComponent const> namespace_path);

  static void EmitNamespaceClosing(internal::TextWriter* writer,
                                   absl::Span<NamespaceComponent const> namespace_path);

  std::string include_path_;
  std::vector<DerivedType> derived_types_;
};

}  // namespace derive
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_DERIVE_GENERATOR_H__
