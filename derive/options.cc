#include "derive/options.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/escaping.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "derive/capability.h"
#include "derive/diagnostic.h"
#include "derive/lexer.h"

namespace otel_derive {
namespace derive {

namespace {

std::string_view constexpr kKeyOptionName = "key";
std::string_view constexpr kVariantOptionName = "variant";

using KeywordSet = absl::flat_hash_set<std::string_view>;
using TypeNameMap = absl::flat_hash_map<std::string_view, std::string_view>;

KeywordSet const& FundamentalTypeKeywords() {
  static gsl::owner<KeywordSet const*> const kKeywords = new KeywordSet{
      "bool",     "char",  "char8_t", "char16_t", "char32_t", "wchar_t", "short",
      "int",      "long",  "signed",  "unsigned", "float",    "double",
  };
  return *kKeywords;  // NOLINT(cppcoreguidelines-owning-memory)
}

// Keywords that can't start a component of a qualified type name.
KeywordSet const& ReservedKeywords() {
  static gsl::owner<KeywordSet const*> const kKeywords = new KeywordSet{
      "auto",   "class",   "const",    "decltype", "enum",     "struct",
      "typename", "union", "void",     "volatile", "template", "operator",
  };
  return *kKeywords;  // NOLINT(cppcoreguidelines-owning-memory)
}

// Telemetry types that may be named without qualification in `variant`.
TypeNameMap const& TelemetryTypeNames() {
  static gsl::owner<TypeNameMap const*> const kNames = new TypeNameMap{
      {"StringValue", "::otel_derive::telemetry::StringValue"},
      {"Array", "::otel_derive::telemetry::Array"},
  };
  return *kNames;  // NOLINT(cppcoreguidelines-owning-memory)
}

// Splits `tokens` at the commas that aren't nested in brackets of any kind. Each returned span
// excludes its separator. The location of each separator is stored in `comma_locations`.
std::vector<absl::Span<Token const>> SplitAtCommas(
    absl::Span<Token const> const tokens, std::vector<SourceLocation>* const comma_locations) {
  std::vector<absl::Span<Token const>> result;
  size_t depth = 0;
  size_t start = 0;
  for (size_t i = 0; i < tokens.size(); ++i) {
    auto const& token = tokens[i];
    if (token.kind != Token::Kind::kPunctuation) {
      continue;
    }
    if (token.text == "(" || token.text == "[" || token.text == "{" || token.text == "<") {
      ++depth;
    } else if (token.text == ")" || token.text == "]" || token.text == "}" || token.text == ">") {
      if (depth > 0) {
        --depth;
      }
    } else if (token.text == "," && depth == 0) {
      result.push_back(tokens.subspan(start, i - start));
      comma_locations->push_back(token.location);
      start = i + 1;
    }
  }
  result.push_back(tokens.subspan(start));
  return result;
}

absl::Status ParseKeyOption(Token const& name, absl::Span<Token const> const value,
                            AttributeOptions* const options) {
  if (options->key.has_value()) {
    return MakeDiagnostic(DiagnosticKind::kDuplicateOption, name.location,
                          absl::StrCat("duplicate option \"key\" (first given at ",
                                       options->key->location, ")"));
  }
  DEFINE_VAR_OR_RETURN(key, DecodeStringLiterals(value, name.location));
  if (key.empty()) {
    return MakeDiagnostic(DiagnosticKind::kMalformedOption, value.front().location,
                          "option \"key\" must not be empty");
  }
  options->key.emplace(KeyOption{
      .value = std::move(key),
      .location = name.location,
  });
  return absl::OkStatus();
}

absl::Status ParseVariantOption(Token const& name, absl::Span<Token const> const value,
                                AttributeOptions* const options) {
  if (options->variant.has_value()) {
    return MakeDiagnostic(DiagnosticKind::kDuplicateOption, name.location,
                          absl::StrCat("duplicate option \"variant\" (first given at ",
                                       options->variant->location, ")"));
  }
  DEFINE_VAR_OR_RETURN(type_name, ParseTypeReference(value, name.location));
  options->variant.emplace(VariantOption{
      .type_name = std::move(type_name),
      .location = name.location,
  });
  return absl::OkStatus();
}

}  // namespace

absl::Status ParseAttributeOptions(AttributeBlock const& block, AttributeOptions* const options) {
  if (block.arguments.empty()) {
    return MakeDiagnostic(DiagnosticKind::kSyntaxError, block.location,
                          "otel(...) requires at least one option");
  }
  std::vector<SourceLocation> comma_locations;
  auto const segments = SplitAtCommas(block.arguments, &comma_locations);
  for (size_t i = 0; i < segments.size(); ++i) {
    auto const segment = segments[i];
    if (segment.empty()) {
      auto const location =
          i < comma_locations.size() ? comma_locations[i] : comma_locations.back();
      return MakeDiagnostic(DiagnosticKind::kSyntaxError, location, "expected an option");
    }
    auto const& name = segment.front();
    if (!name.is_identifier()) {
      return MakeDiagnostic(DiagnosticKind::kSyntaxError, name.location,
                            absl::StrCat("expected an option name but found \"",
                                         absl::CEscape(name.text), "\""));
    }
    if (name.text != kKeyOptionName && name.text != kVariantOptionName) {
      return MakeDiagnostic(DiagnosticKind::kUnknownOption, name.location,
                            absl::StrCat("unknown option \"", name.text,
                                         "\" (expected \"key\" or \"variant\")"));
    }
    if (segment.size() < 2 || !segment[1].is_punctuation("=")) {
      auto const location = segment.size() < 2 ? name.location : segment[1].location;
      return MakeDiagnostic(DiagnosticKind::kSyntaxError, location,
                            absl::StrCat("expected \"=\" after \"", name.text, "\""));
    }
    auto const value = segment.subspan(2);
    if (value.empty()) {
      return MakeDiagnostic(DiagnosticKind::kSyntaxError, segment[1].location,
                            absl::StrCat("expected a value for option \"", name.text, "\""));
    }
    if (name.text == kKeyOptionName) {
      RETURN_IF_ERROR(ParseKeyOption(name, value, options));
    } else {
      RETURN_IF_ERROR(ParseVariantOption(name, value, options));
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<AttributeOptions> ParseAttributeOptions(
    absl::Span<AttributeBlock const> const blocks) {
  AttributeOptions options;
  for (auto const& block : blocks) {
    RETURN_IF_ERROR(ParseAttributeOptions(block, &options));
  }
  return std::move(options);
}

absl::StatusOr<std::string> ParseTypeReference(absl::Span<Token const> const tokens,
                                               SourceLocation const location) {
  if (tokens.empty()) {
    return MakeDiagnostic(DiagnosticKind::kMalformedOption, location,
                          "option \"variant\" expects a type");
  }
  auto const malformed = [&tokens](Token const& token) {
    return MakeDiagnostic(DiagnosticKind::kMalformedOption, token.location,
                          absl::StrCat("option \"variant\" expects a type but found \"",
                                       absl::CEscape(JoinTokens(tokens)), "\""));
  };
  if (tokens.size() == 1 && tokens.front().is_identifier()) {
    auto const name = tokens.front().text;
    if (name == "Value" || name == "KeyValue" || name == "Key") {
      return MakeDiagnostic(DiagnosticKind::kMalformedOption, tokens.front().location,
                            absl::StrCat("\"", name, "\" can't be used as a variant; name a ",
                                         "type convertible to Value instead"));
    }
    auto const it = TelemetryTypeNames().find(name);
    if (it != TelemetryTypeNames().end()) {
      return std::string(it->second);
    }
  }
  // Fundamental types, e.g. `unsigned long long`.
  bool all_fundamental = true;
  for (auto const& token : tokens) {
    if (!token.is_identifier() || !FundamentalTypeKeywords().contains(token.text)) {
      all_fundamental = false;
      break;
    }
  }
  if (all_fundamental) {
    return JoinTokens(tokens);
  }
  // Qualified names, optionally with template arguments, e.g. `::std::vector<int64_t>`.
  size_t i = 0;
  if (tokens[i].is_punctuation("::")) {
    ++i;
  }
  while (true) {
    if (i >= tokens.size()) {
      return malformed(tokens.back());
    }
    auto const& name = tokens[i];
    if (!name.is_identifier() || ReservedKeywords().contains(name.text) ||
        FundamentalTypeKeywords().contains(name.text)) {
      return malformed(name);
    }
    ++i;
    if (i < tokens.size() && tokens[i].is_punctuation("<")) {
      size_t angle_depth = 1;
      size_t paren_depth = 0;
      auto const& open = tokens[i++];
      while (i < tokens.size() && angle_depth > 0) {
        auto const& token = tokens[i++];
        if (token.is_punctuation("(")) {
          ++paren_depth;
        } else if (token.is_punctuation(")")) {
          if (paren_depth == 0) {
            return malformed(token);
          }
          --paren_depth;
        } else if (paren_depth == 0 && token.is_punctuation("<")) {
          ++angle_depth;
        } else if (paren_depth == 0 && token.is_punctuation(">")) {
          --angle_depth;
        }
      }
      if (angle_depth > 0) {
        return malformed(open);
      }
    }
    if (i < tokens.size() && tokens[i].is_punctuation("::")) {
      ++i;
      continue;
    }
    break;
  }
  if (i < tokens.size()) {
    return malformed(tokens[i]);
  }
  return JoinTokens(tokens);
}

absl::StatusOr<std::string> DecodeStringLiterals(absl::Span<Token const> const tokens,
                                                 SourceLocation const location) {
  if (tokens.empty()) {
    return MakeDiagnostic(DiagnosticKind::kMalformedOption, location,
                          "option \"key\" expects a string literal");
  }
  std::string result;
  for (auto const& token : tokens) {
    if (token.kind != Token::Kind::kStringLiteral) {
      return MakeDiagnostic(DiagnosticKind::kMalformedOption, token.location,
                            absl::StrCat("option \"key\" expects a string literal but found \"",
                                         absl::CEscape(token.text), "\""));
    }
    if (!absl::StartsWith(token.text, "\"") || !absl::EndsWith(token.text, "\"")) {
      return MakeDiagnostic(
          DiagnosticKind::kMalformedOption, token.location,
          "option \"key\" expects an ordinary string literal without prefix or suffix");
    }
    auto const content = token.text.substr(1, token.text.size() - 2);
    std::string decoded;
    std::string error;
    if (!absl::CUnescape(content, &decoded, &error)) {
      return MakeDiagnostic(DiagnosticKind::kMalformedOption, token.location,
                            absl::StrCat("invalid string literal: ", error));
    }
    absl::StrAppend(&result, decoded);
  }
  return std::move(result);
}

absl::StatusOr<std::vector<CapabilityRequest>> ParseCapabilityRequests(
    absl::Span<AttributeBlock const> const blocks) {
  std::vector<CapabilityRequest> requests;
  absl::flat_hash_map<Capability, SourceLocation> seen;
  for (auto const& block : blocks) {
    if (block.arguments.empty()) {
      return MakeDiagnostic(DiagnosticKind::kSyntaxError, block.location,
                            "otel::derive(...) requires at least one capability");
    }
    std::vector<SourceLocation> comma_locations;
    auto const segments = SplitAtCommas(block.arguments, &comma_locations);
    for (size_t i = 0; i < segments.size(); ++i) {
      auto const segment = segments[i];
      if (segment.empty()) {
        auto const location =
            i < comma_locations.size() ? comma_locations[i] : comma_locations.back();
        return MakeDiagnostic(DiagnosticKind::kSyntaxError, location, "expected a capability");
      }
      if (segment.size() > 1 || !segment.front().is_identifier()) {
        return MakeDiagnostic(DiagnosticKind::kSyntaxError, segment.front().location,
                              absl::StrCat("expected a capability name but found \"",
                                           absl::CEscape(JoinTokens(segment)), "\""));
      }
      auto const& name = segment.front();
      auto const capability = ParseCapabilityName(name.text);
      if (!capability.has_value()) {
        return MakeDiagnostic(
            DiagnosticKind::kUnknownCapability, name.location,
            absl::StrCat("unknown capability \"", name.text,
                         "\" (expected one of Key, Value, StringValue, KeyValue)"));
      }
      auto const [it, inserted] = seen.try_emplace(*capability, name.location);
      if (!inserted) {
        return MakeDiagnostic(DiagnosticKind::kDuplicateCapability, name.location,
                              absl::StrCat("capability \"", name.text,
                                           "\" is already derived (first listed at ", it->second,
                                           ")"));
      }
      requests.push_back(CapabilityRequest{
          .capability = *capability,
          .location = name.location,
      });
    }
  }
  return std::move(requests);
}

}  // namespace derive
}  // namespace otel_derive
