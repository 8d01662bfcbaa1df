#include "derive/synthesizer.h"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "derive/capability.h"
#include "derive/diagnostic.h"
#include "derive/options.h"
#include "derive/text_writer.h"
#include "derive/type_descriptor.h"

namespace otel_derive {
namespace derive {

namespace {

using ::otel_derive::derive::internal::TextWriter;

std::string_view constexpr kTelemetryNamespace = "::otel_derive::telemetry";

std::string ConvertCall(std::string_view const target_type, std::string_view const argument) {
  return absl::StrCat(kTelemetryNamespace, "::Convert<", target_type, ">(", argument, ")");
}

// Spells `text` as a C++ expression convertible to `std::string_view`.
std::string MakeStringLiteral(std::string_view const text) {
  if (text.find('\0') == std::string_view::npos) {
    return absl::StrCat("\"", absl::CEscape(text), "\"");
  } else {
    return absl::StrCat("::std::string_view(\"", absl::CEscape(text), "\", ", text.size(), ")");
  }
}

GeneratedConversion SynthesizeKey(TypeDescriptor const& type, AttributeOptions const& options) {
  auto const target_type = CapabilityTargetType(Capability::kKey);
  auto const key = options.key.has_value() ? options.key->value : DefaultKeyName(type);
  return GeneratedConversion{
      .capability = Capability::kKey,
      .target_type = std::string(target_type),
      .return_expression = absl::StrCat(target_type, "(", MakeStringLiteral(key), ")"),
      .uses_value = false,
  };
}

GeneratedConversion SynthesizeStringValue() {
  auto const target_type = CapabilityTargetType(Capability::kStringValue);
  return GeneratedConversion{
      .capability = Capability::kStringValue,
      .target_type = std::string(target_type),
      .return_expression = absl::StrCat(target_type, "(::absl::StrCat(value))"),
      .uses_str_cat = true,
  };
}

struct PathComponent {
  std::string_view name;
  // Inline and anonymous namespaces may be omitted when naming the type.
  bool optional;
};

bool MatchesPath(absl::Span<std::string_view const> const names,
                 absl::Span<PathComponent const> const path, bool const rooted) {
  if (names.empty()) {
    return !rooted ||
           std::all_of(path.begin(), path.end(),
                       [](PathComponent const& component) { return component.optional; });
  }
  if (path.empty()) {
    return false;
  }
  auto const& last = path.back();
  auto const parent = path.subspan(0, path.size() - 1);
  if (last.name == names.back() &&
      MatchesPath(names.subspan(0, names.size() - 1), parent, rooted)) {
    return true;
  }
  return last.optional && MatchesPath(names, parent, rooted);
}

// Indicates whether `type_name`, as spelled in the `variant` option of `type`, refers to `type`
// itself.
bool NamesType(std::string_view type_name, TypeDescriptor const& type) {
  bool const rooted = absl::ConsumePrefix(&type_name, "::");
  std::vector<std::string_view> const names = absl::StrSplit(type_name, "::");
  std::vector<PathComponent> path;
  for (auto const& component : type.namespace_path) {
    path.push_back(PathComponent{
        .name = component.name,
        .optional = component.is_inline || component.name.empty(),
    });
  }
  for (auto const& class_name : type.class_path) {
    path.push_back(PathComponent{.name = class_name, .optional = false});
  }
  path.push_back(PathComponent{.name = type.name, .optional = false});
  return MatchesPath(names, path, rooted);
}

// REQUIRES: `options.variant` must be set.
GeneratedConversion SynthesizeValue(AttributeOptions const& options) {
  auto const target_type = CapabilityTargetType(Capability::kValue);
  return GeneratedConversion{
      .capability = Capability::kValue,
      .target_type = std::string(target_type),
      .return_expression =
          ConvertCall(target_type, ConvertCall(options.variant->type_name, "value")),
  };
}

GeneratedConversion SynthesizeKeyValue() {
  auto const target_type = CapabilityTargetType(Capability::kKeyValue);
  return GeneratedConversion{
      .capability = Capability::kKeyValue,
      .target_type = std::string(target_type),
      .return_expression = absl::StrCat(
          target_type, "(", ConvertCall(CapabilityTargetType(Capability::kKey), "value"), ", ",
          ConvertCall(CapabilityTargetType(Capability::kValue), "value"), ")"),
  };
}

}  // namespace

std::string DefaultKeyName(TypeDescriptor const& type) { return absl::AsciiStrToLower(type.name); }

absl::Status ValidateCapability(TypeDescriptor const& type, CapabilityRequest const& request,
                                AttributeOptions const& options) {
  switch (request.capability) {
    case Capability::kValue:
      if (!options.variant.has_value()) {
        return MakeDiagnostic(
            DiagnosticKind::kMissingRequiredOption, request.location,
            "deriving \"Value\" requires the \"variant\" option naming the intermediate type, e.g. "
            "[[otel(variant = int64_t)]]");
      }
      if (NamesType(options.variant->type_name, type)) {
        return MakeDiagnostic(DiagnosticKind::kMalformedOption, options.variant->location,
                              absl::StrCat("\"", type.name, "\" can't be its own variant; name a ",
                                           "different type convertible to Value"));
      }
      return absl::OkStatus();
    case Capability::kKey:
    case Capability::kStringValue:
    case Capability::kKeyValue:
      return absl::OkStatus();
  }
  return absl::InternalError("unknown capability");
}

absl::StatusOr<GeneratedConversion> SynthesizeConversion(TypeDescriptor const& type,
                                                         AttributeOptions const& options,
                                                         CapabilityRequest const& request) {
  RETURN_IF_ERROR(ValidateCapability(type, request, options));
  switch (request.capability) {
    case Capability::kKey:
      return SynthesizeKey(type, options);
    case Capability::kStringValue:
      return SynthesizeStringValue();
    case Capability::kValue:
      return SynthesizeValue(options);
    case Capability::kKeyValue:
      return SynthesizeKeyValue();
  }
  return absl::InternalError("unknown capability");
}

absl::StatusOr<std::vector<GeneratedConversion>> SynthesizeConversions(
    TypeDescriptor const& type, AttributeOptions const& options,
    absl::Span<CapabilityRequest const> const requests) {
  std::vector<CapabilityRequest> sorted{requests.begin(), requests.end()};
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](CapabilityRequest const& lhs, CapabilityRequest const& rhs) {
                     return lhs.capability < rhs.capability;
                   });
  std::vector<GeneratedConversion> conversions;
  conversions.reserve(sorted.size());
  for (auto const& request : sorted) {
    DEFINE_VAR_OR_RETURN(conversion, SynthesizeConversion(type, options, request));
    conversions.emplace_back(std::move(conversion));
  }
  return std::move(conversions);
}

void EmitConversion(TypeDescriptor const& type, GeneratedConversion const& conversion,
                    TextWriter* const writer) {
  auto const type_name = type.QualifiedName();
  auto const tag_type =
      absl::StrCat(kTelemetryNamespace, "::ConvertTag<", conversion.target_type, ">");
  writer->AppendLine("inline ", conversion.target_type, " OtelDeriveConvert(");
  {
    TextWriter::IndentedScope is1{writer};
    TextWriter::IndentedScope is2{writer};
    writer->AppendLine(tag_type, " /*tag*/,");
    writer->AppendLine(type_name, " const& ", conversion.uses_value ? "value" : "/*value*/", ") {");
  }
  {
    TextWriter::IndentedScope is{writer};
    writer->AppendLine("return ", conversion.return_expression, ";");
  }
  writer->AppendLine("}");
  writer->AppendEmptyLine();
  writer->AppendLine("inline ", conversion.target_type, " OtelDeriveConvert(");
  {
    TextWriter::IndentedScope is1{writer};
    TextWriter::IndentedScope is2{writer};
    writer->AppendLine(tag_type, " const tag,");
    writer->AppendLine(type_name, "&& value) {");
  }
  {
    TextWriter::IndentedScope is{writer};
    writer->AppendLine("return OtelDeriveConvert(tag, static_cast<", type_name,
                       " const&>(value));");
  }
  writer->AppendLine("}");
}

}  // namespace derive
}  // namespace otel_derive
