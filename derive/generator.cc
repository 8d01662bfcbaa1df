#include "derive/generator.h"

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "derive/capability.h"
#include "derive/diagnostic.h"
#include "derive/options.h"
#include "derive/scanner.h"
#include "derive/synthesizer.h"
#include "derive/text_writer.h"
#include "derive/type_descriptor.h"

namespace otel_derive {
namespace derive {

namespace {

using ::otel_derive::derive::internal::TextWriter;

std::string_view constexpr kTelemetryHeader = "telemetry/telemetry.h";
std::string_view constexpr kStrCatHeader = "absl/strings/str_cat.h";

// Returns `file_name` without its extension. Dots in directory names are not extensions.
std::string_view RemoveExtension(std::string_view file_name) {
  auto const dot = file_name.rfind('.');
  auto const slash = file_name.rfind('/');
  if (dot != std::string_view::npos && dot > 0 &&
      (slash == std::string_view::npos || dot > slash + 1)) {
    file_name.remove_suffix(file_name.size() - dot);
  }
  return file_name;
}

std::string CapabilityList(absl::Span<GeneratedConversion const> const conversions) {
  return absl::StrJoin(conversions, ", ", [](std::string* const out, auto const& conversion) {
    absl::StrAppend(out, CapabilityName(conversion.capability));
  });
}

}  // namespace

namespace generator {

absl::StatusOr<std::string> ReadFile(FILE* const fp) {
  std::string buffer;
  char temp[4096];
  while (size_t const bytes_read = ::fread(temp, 1, sizeof(temp), fp)) {
    buffer.append(temp, bytes_read);
  }
  if (::ferror(fp) != 0) {
    return absl::ErrnoToStatus(errno, "fread");
  }
  return std::move(buffer);
}

absl::Status WriteFile(FILE* const fp, std::string_view const data) {
  if (::fwrite(data.data(), 1, data.size(), fp) != data.size()) {
    return absl::ErrnoToStatus(errno, "fwrite");
  }
  return absl::OkStatus();
}

std::string MakeHeaderFileName(std::string_view const file_name) {
  return absl::StrCat(RemoveExtension(file_name), ".otel.h");
}

std::string GetHeaderGuardName(std::string_view const file_name) {
  std::string converted{RemoveExtension(file_name)};
  for (auto& ch : converted) {
    if (!absl::ascii_isalnum(static_cast<unsigned char>(ch))) {
      ch = '_';
    }
  }
  return absl::StrCat("__OTEL_DERIVE_", absl::AsciiStrToUpper(converted), "_OTEL_H__");
}

}  // namespace generator

absl::StatusOr<Generator> Generator::Create(std::string_view const file_name,
                                            std::string_view const source,
                                            Options const& options) {
  if (file_name.empty()) {
    return absl::InvalidArgumentError("the input file name must not be empty");
  }
  DEFINE_CONST_OR_RETURN(items, ScanSource(source));
  std::vector<DerivedType> derived_types;
  derived_types.reserve(items.size());
  for (auto const& item : items) {
    DEFINE_VAR_OR_RETURN(derived_type, DeriveItem(item));
    VLOG(1) << file_name << ": deriving " << CapabilityList(derived_type.conversions) << " for "
            << TypeShapeName(derived_type.type.shape) << " " << derived_type.type.FullName();
    derived_types.emplace_back(std::move(derived_type));
  }
  std::string include_path =
      options.include_path.empty() ? std::string(file_name) : options.include_path;
  return Generator(std::move(include_path), std::move(derived_types));
}

std::string Generator::GenerateHeaderFileContent() const {
  TextWriter writer;
  auto const header_guard_name = generator::GetHeaderGuardName(include_path_);
  writer.AppendUnindentedLine("#ifndef ", header_guard_name);
  writer.AppendUnindentedLine("#define ", header_guard_name);
  writer.AppendEmptyLine();
  EmitIncludes(&writer);
  absl::Span<NamespaceComponent const> current_namespace;
  bool in_namespace = false;
  for (auto const& [type, conversions] : derived_types_) {
    absl::Span<NamespaceComponent const> const type_namespace = type.namespace_path;
    if (!in_namespace || type_namespace != current_namespace) {
      if (in_namespace) {
        writer.MaybeAppendEmptyLine();
        EmitNamespaceClosing(&writer, current_namespace);
      }
      writer.MaybeAppendEmptyLine();
      EmitNamespaceOpening(&writer, type_namespace);
      current_namespace = type_namespace;
      in_namespace = true;
    }
    for (auto const& conversion : conversions) {
      writer.MaybeAppendEmptyLine();
      EmitConversion(type, conversion, &writer);
    }
  }
  if (in_namespace) {
    writer.MaybeAppendEmptyLine();
    EmitNamespaceClosing(&writer, current_namespace);
  }
  writer.MaybeAppendEmptyLine();
  writer.AppendUnindentedLine("#endif  // ", header_guard_name);
  return std::move(writer).Finish();
}

absl::StatusOr<Generator::DerivedType> Generator::DeriveItem(AnnotatedItem const& item) {
  DEFINE_CONST_OR_RETURN(requests, ParseCapabilityRequests(item.derive_blocks));
  DEFINE_CONST_OR_RETURN(options, ParseAttributeOptions(item.option_blocks));
  DEFINE_VAR_OR_RETURN(type, BuildTypeDescriptor(item));
  if (requests.empty()) {
    return MakeDiagnostic(DiagnosticKind::kOrphanedOptions, item.option_blocks.front().location,
                          absl::StrCat("\"", type.name,
                                       "\" has otel options but doesn't derive anything; add "
                                       "[[otel::derive(...)]]"));
  }
  DEFINE_VAR_OR_RETURN(conversions, SynthesizeConversions(type, options, requests));
  return DerivedType{
      .type = std::move(type),
      .conversions = std::move(conversions),
  };
}

bool Generator::UsesStrCat() const {
  for (auto const& derived_type : derived_types_) {
    for (auto const& conversion : derived_type.conversions) {
      if (conversion.uses_str_cat) {
        return true;
      }
    }
  }
  return false;
}

void Generator::EmitIncludes(TextWriter* const writer) const {
  writer->AppendUnindentedLine("#include \"", include_path_, "\"");
  writer->AppendEmptyLine();
  absl::btree_set<std::string_view> headers{kTelemetryHeader};
  if (UsesStrCat()) {
    headers.emplace(kStrCatHeader);
  }
  for (auto const header : headers) {
    writer->AppendUnindentedLine("#include \"", header, "\"");
  }
}

void Generator::EmitNamespaceOpening(TextWriter* const writer,
                                     absl::Span<NamespaceComponent const> const namespace_path) {
  for (auto const& component : namespace_path) {
    std::string_view const prefix = component.is_inline ? "inline " : "";
    if (component.name.empty()) {
      writer->AppendLine(prefix, "namespace {");
    } else {
      writer->AppendLine(prefix, "namespace ", component.name, " {");
    }
  }
}

void Generator::EmitNamespaceClosing(TextWriter* const writer,
                                     absl::Span<NamespaceComponent const> const namespace_path) {
  for (size_t i = namespace_path.size(); i > 0; --i) {
    auto const& component = namespace_path[i - 1];
    if (component.name.empty()) {
      writer->AppendLine("}  // namespace");
    } else {
      writer->AppendLine("}  // namespace ", component.name);
    }
  }
}

}  // namespace derive
}  // namespace otel_derive
