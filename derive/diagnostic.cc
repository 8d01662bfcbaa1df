#include "derive/diagnostic.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "derive/source_location.h"

namespace otel_derive {
namespace derive {

namespace {

std::string_view constexpr kKindPayloadUrl = "type.otel-derive.dev/DiagnosticKind";
std::string_view constexpr kLocationPayloadUrl = "type.otel-derive.dev/SourceLocation";

DiagnosticKind constexpr kAllKinds[] = {
    DiagnosticKind::kSyntaxError,
    DiagnosticKind::kUnknownOption,
    DiagnosticKind::kMalformedOption,
    DiagnosticKind::kDuplicateOption,
    DiagnosticKind::kMissingRequiredOption,
    DiagnosticKind::kUnsupportedItemKind,
    DiagnosticKind::kUnknownCapability,
    DiagnosticKind::kDuplicateCapability,
    DiagnosticKind::kOrphanedOptions,
};

absl::StatusCode GetStatusCode(DiagnosticKind const kind) {
  switch (kind) {
    case DiagnosticKind::kDuplicateOption:
    case DiagnosticKind::kDuplicateCapability:
      return absl::StatusCode::kAlreadyExists;
    case DiagnosticKind::kMissingRequiredOption:
    case DiagnosticKind::kOrphanedOptions:
      return absl::StatusCode::kFailedPrecondition;
    case DiagnosticKind::kUnsupportedItemKind:
      return absl::StatusCode::kUnimplemented;
    default:
      return absl::StatusCode::kInvalidArgument;
  }
}

// Returns the 1-based `line_number`-th line of `source`, without the line terminator.
std::string_view GetLine(std::string_view const source, size_t const line_number) {
  size_t line = 1;
  size_t offset = 0;
  while (line < line_number) {
    auto const newline = source.find('\n', offset);
    if (newline == std::string_view::npos) {
      return "";
    }
    offset = newline + 1;
    ++line;
  }
  auto text = source.substr(offset, source.find('\n', offset) - offset);
  if (!text.empty() && text.back() == '\r') {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

std::string_view DiagnosticKindName(DiagnosticKind const kind) {
  switch (kind) {
    case DiagnosticKind::kSyntaxError:
      return "SyntaxError";
    case DiagnosticKind::kUnknownOption:
      return "UnknownOption";
    case DiagnosticKind::kMalformedOption:
      return "MalformedOption";
    case DiagnosticKind::kDuplicateOption:
      return "DuplicateOption";
    case DiagnosticKind::kMissingRequiredOption:
      return "MissingRequiredOption";
    case DiagnosticKind::kUnsupportedItemKind:
      return "UnsupportedItemKind";
    case DiagnosticKind::kUnknownCapability:
      return "UnknownCapability";
    case DiagnosticKind::kDuplicateCapability:
      return "DuplicateCapability";
    case DiagnosticKind::kOrphanedOptions:
      return "OrphanedOptions";
  }
  return "Unknown";
}

absl::Status MakeDiagnostic(DiagnosticKind const kind, SourceLocation const location,
                            std::string_view const message) {
  absl::Status status{GetStatusCode(kind), message};
  status.SetPayload(kKindPayloadUrl, absl::Cord(DiagnosticKindName(kind)));
  status.SetPayload(kLocationPayloadUrl,
                    absl::Cord(absl::StrCat(location.line, ":", location.column)));
  return status;
}

std::optional<DiagnosticKind> GetDiagnosticKind(absl::Status const& status) {
  auto const payload = status.GetPayload(kKindPayloadUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  for (auto const kind : kAllKinds) {
    if (*payload == DiagnosticKindName(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

std::optional<SourceLocation> GetDiagnosticLocation(absl::Status const& status) {
  auto const payload = status.GetPayload(kLocationPayloadUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  std::vector<std::string> const parts = absl::StrSplit(std::string(*payload), ':');
  SourceLocation location;
  if (parts.size() != 2 || !absl::SimpleAtoi(parts[0], &location.line) ||
      !absl::SimpleAtoi(parts[1], &location.column)) {
    return std::nullopt;
  }
  return location;
}

std::string FormatDiagnostic(std::string_view const file_name, std::string_view const source,
                             absl::Status const& status) {
  auto const kind = GetDiagnosticKind(status);
  auto const location = GetDiagnosticLocation(status);
  if (!kind.has_value() || !location.has_value()) {
    return absl::StrCat(file_name, ": error: ", status.message(), "\n");
  }
  std::string result =
      absl::StrCat(file_name, ":", location->line, ":", location->column, ": error: ",
                   status.message(), " [", DiagnosticKindName(*kind), "]\n");
  auto const line = GetLine(source, location->line);
  if (line.empty()) {
    return result;
  }
  absl::StrAppend(&result, "  ", line, "\n  ");
  // Tabs are copied so that the caret lines up with the quoted text.
  for (size_t i = 0; i + 1 < location->column && i < line.size(); ++i) {
    result += line[i] == '\t' ? '\t' : ' ';
  }
  absl::StrAppend(&result, "^\n");
  return result;
}

}  // namespace derive
}  // namespace otel_derive
