#include "derive/scanner.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "derive/diagnostic.h"
#include "derive/lexer.h"
#include "derive/options.h"

namespace otel_derive {
namespace derive {

namespace {

std::string_view constexpr kOtelNamespace = "otel";
std::string_view constexpr kDeriveAttribute = "derive";
std::string_view constexpr kOptionsAttribute = "otel";

std::string_view ClosingBracket(std::string_view const opening) {
  if (opening == "(") {
    return ")";
  } else if (opening == "[") {
    return "]";
  } else if (opening == "{") {
    return "}";
  } else if (opening == "<") {
    return ">";
  } else {
    return "";
  }
}

bool IsClosingBracket(Token const& token) {
  return token.is_punctuation(")") || token.is_punctuation("]") || token.is_punctuation("}");
}

}  // namespace

absl::StatusOr<std::vector<AnnotatedItem>> Scanner::Scan() && {
  while (!at_end()) {
    auto const& token = tokens_[offset_];
    if (token.is_identifier("namespace")) {
      RETURN_IF_ERROR(ScanNamespace());
    } else if (token.is_identifier("template")) {
      RETURN_IF_ERROR(ScanTemplateHead());
    } else if (token.is_identifier("extern") && peek(1) != nullptr &&
               peek(1)->kind == Token::Kind::kStringLiteral && PeekPunctuation("{", 2)) {
      PushScope(Scope{.kind = ScopeKind::kLinkage, .location = peek(2)->location});
      offset_ += 3;
    } else if (token.is_identifier("struct") || token.is_identifier("class") ||
               token.is_identifier("union") || token.is_identifier("enum")) {
      RETURN_IF_ERROR(ScanClassHead());
    } else if (MaybeScanAccessSpecifier()) {
      continue;
    } else if (AtAttributeSpecifier()) {
      RETURN_IF_ERROR(ScanMisplacedAttributes());
    } else if (token.is_punctuation("{")) {
      PushScope(Scope{.kind = ScopeKind::kOther, .location = token.location});
      template_pending_ = false;
      ++offset_;
    } else if (token.is_punctuation("}")) {
      RETURN_IF_ERROR(PopScope());
      template_pending_ = false;
      ++offset_;
    } else if (token.is_punctuation(";")) {
      template_pending_ = false;
      ++offset_;
    } else {
      ++offset_;
    }
  }
  if (!scopes_.empty()) {
    return MakeDiagnostic(DiagnosticKind::kSyntaxError, scopes_.back().location,
                          "unbalanced \"{\"");
  }
  return std::move(items_);
}

Token const* Scanner::peek(size_t const lookahead) const {
  auto const index = offset_ + lookahead;
  return index < tokens_.size() ? &tokens_[index] : nullptr;
}

bool Scanner::PeekPunctuation(std::string_view const punctuation, size_t const lookahead) const {
  auto const* const token = peek(lookahead);
  return token != nullptr && token->is_punctuation(punctuation);
}

bool Scanner::PeekIdentifier(std::string_view const name, size_t const lookahead) const {
  auto const* const token = peek(lookahead);
  return token != nullptr && token->is_identifier(name);
}

SourceLocation Scanner::last_location() const {
  if (tokens_.empty()) {
    return SourceLocation{.line = 1, .column = 1};
  } else {
    return tokens_.back().location;
  }
}

bool Scanner::AtAttributeSpecifier() const {
  return PeekPunctuation("[") && PeekPunctuation("[", 1);
}

absl::StatusOr<absl::Span<Token const>> Scanner::ConsumeGroup() {
  auto const& open = tokens_[offset_];
  bool const angle = open.is_punctuation("<");
  std::vector<std::string_view> expected{ClosingBracket(open.text)};
  size_t const start = ++offset_;
  while (!at_end()) {
    auto const& token = tokens_[offset_];
    if (token.kind == Token::Kind::kPunctuation) {
      if (token.text == expected.back()) {
        expected.pop_back();
        if (expected.empty()) {
          auto const group = tokens_.subspan(start, offset_ - start);
          ++offset_;
          return group;
        }
      } else if (token.text == "(" || token.text == "[" || token.text == "{") {
        expected.push_back(ClosingBracket(token.text));
      } else if (angle && token.text == "<" && expected.back() == ">") {
        expected.push_back(">");
      } else if (IsClosingBracket(token)) {
        return MakeDiagnostic(DiagnosticKind::kSyntaxError, token.location,
                              absl::StrCat("expected \"", expected.back(), "\" but found \"",
                                           token.text, "\""));
      }
    }
    ++offset_;
  }
  return MakeDiagnostic(DiagnosticKind::kSyntaxError, open.location,
                        absl::StrCat("unbalanced \"", open.text, "\""));
}

absl::Status Scanner::ConsumeAttributeSpecifiers(Attributes* const attributes) {
  while (!at_end()) {
    if (AtAttributeSpecifier()) {
      RETURN_IF_ERROR(ConsumeAttributeList(attributes));
    } else if ((PeekIdentifier("alignas") || PeekIdentifier("__attribute__") ||
                PeekIdentifier("__declspec")) &&
               PeekPunctuation("(", 1)) {
      ++offset_;
      RETURN_IF_ERROR(ConsumeGroup());
    } else {
      break;
    }
  }
  return absl::OkStatus();
}

absl::Status Scanner::ConsumeAttributeList(Attributes* const attributes) {
  ++offset_;  // outer "["
  DEFINE_CONST_OR_RETURN(group, ConsumeGroup());
  if (!PeekPunctuation("]")) {
    auto const location = at_end() ? last_location() : peek()->location;
    return MakeDiagnostic(DiagnosticKind::kSyntaxError, location,
                          "expected \"]]\" to close the attribute list");
  }
  ++offset_;
  size_t i = 0;
  std::string_view default_namespace;
  if (!group.empty() && group[0].is_identifier("using")) {
    if (group.size() < 3 || !group[1].is_identifier() || !group[2].is_punctuation(":")) {
      return MakeDiagnostic(DiagnosticKind::kSyntaxError, group[0].location,
                            "expected \"using <namespace>:\"");
    }
    default_namespace = group[1].text;
    i = 3;
  }
  while (i < group.size()) {
    if (group[i].is_punctuation(",")) {
      ++i;
      continue;
    }
    auto const& first = group[i++];
    if (!first.is_identifier()) {
      return MakeDiagnostic(DiagnosticKind::kSyntaxError, first.location,
                            absl::StrCat("expected an attribute name but found \"", first.text,
                                         "\""));
    }
    std::string_view attribute_namespace = default_namespace;
    std::string_view name = first.text;
    if (i < group.size() && group[i].is_punctuation("::")) {
      if (!default_namespace.empty()) {
        return MakeDiagnostic(DiagnosticKind::kSyntaxError, group[i].location,
                              "qualified attribute names can't follow a \"using\" prefix");
      }
      if (i + 1 >= group.size() || !group[i + 1].is_identifier()) {
        return MakeDiagnostic(DiagnosticKind::kSyntaxError, group[i].location,
                              "expected an attribute name after \"::\"");
      }
      attribute_namespace = name;
      name = group[i + 1].text;
      i += 2;
    }
    std::optional<absl::Span<Token const>> arguments;
    if (i < group.size() && group[i].is_punctuation("(")) {
      size_t depth = 0;
      size_t j = i;
      for (; j < group.size(); ++j) {
        if (group[j].is_punctuation("(")) {
          ++depth;
        } else if (group[j].is_punctuation(")") && --depth == 0) {
          break;
        }
      }
      if (j >= group.size()) {
        return MakeDiagnostic(DiagnosticKind::kSyntaxError, group[i].location,
                              "unbalanced \"(\" in attribute arguments");
      }
      arguments = group.subspan(i + 1, j - i - 1);
      i = j + 1;
    }
    while (i < group.size() && group[i].is_punctuation(".")) {
      ++i;  // pack expansion
    }
    if (i < group.size() && !group[i].is_punctuation(",")) {
      return MakeDiagnostic(DiagnosticKind::kSyntaxError, group[i].location,
                            absl::StrCat("expected \",\" or \"]]\" after attribute \"", name,
                                         "\""));
    }
    bool const is_options = attribute_namespace.empty() && name == kOptionsAttribute;
    if (!is_options && attribute_namespace != kOtelNamespace) {
      continue;
    }
    if (!is_options && name != kDeriveAttribute) {
      return MakeDiagnostic(DiagnosticKind::kUnknownOption, first.location,
                            absl::StrCat("unknown attribute \"otel::", name,
                                         "\" (expected \"otel::derive\" or \"otel\")"));
    }
    if (!arguments.has_value()) {
      return MakeDiagnostic(DiagnosticKind::kSyntaxError, first.location,
                            is_options ? "\"otel\" requires a parenthesized list of options"
                                       : "\"otel::derive\" requires a parenthesized list of "
                                         "capabilities");
    }
    if (!attributes->location.has_value()) {
      attributes->location = first.location;
    }
    AttributeBlock block{
        .location = first.location,
        .arguments = std::vector<Token>(arguments->begin(), arguments->end()),
    };
    if (is_options) {
      attributes->option_blocks.emplace_back(std::move(block));
    } else {
      attributes->derive_blocks.emplace_back(std::move(block));
    }
  }
  return absl::OkStatus();
}

absl::Status Scanner::ScanNamespace() {
  bool const after_using = offset_ > 0 && tokens_[offset_ - 1].is_identifier("using");
  bool const first_inline = offset_ > 0 && tokens_[offset_ - 1].is_identifier("inline");
  auto const& keyword = tokens_[offset_++];
  if (after_using) {
    return absl::OkStatus();
  }
  Attributes attributes;
  RETURN_IF_ERROR(ConsumeAttributeSpecifiers(&attributes));
  if (!attributes.empty()) {
    AnnotatedItem item{
        .kind = ItemKind::kOther,
        .location = attributes.location.value(),
        .name_location = attributes.location.value(),
        .option_blocks = std::move(attributes.option_blocks),
        .derive_blocks = std::move(attributes.derive_blocks),
    };
    FillScopeInfo(&item);
    items_.emplace_back(std::move(item));
  }
  std::vector<NamespaceComponent> components;
  while (true) {
    bool is_inline = components.empty() && first_inline;
    if (PeekIdentifier("inline")) {
      is_inline = true;
      ++offset_;
    }
    auto const* const token = peek();
    if (token == nullptr || !token->is_identifier()) {
      break;
    }
    components.push_back(NamespaceComponent{
        .name = std::string(token->text),
        .is_inline = is_inline,
    });
    ++offset_;
    if (!PeekPunctuation("::")) {
      break;
    }
    ++offset_;
  }
  if (PeekPunctuation("=")) {
    // Namespace alias.
    while (!at_end() && !PeekPunctuation(";")) {
      ++offset_;
    }
    return absl::OkStatus();
  }
  if (!PeekPunctuation("{")) {
    auto const location = at_end() ? keyword.location : peek()->location;
    return MakeDiagnostic(DiagnosticKind::kSyntaxError, location,
                          "expected \"{\" after the namespace name");
  }
  if (components.empty()) {
    components.push_back(NamespaceComponent{.name = "", .is_inline = first_inline});
  }
  PushScope(Scope{
      .kind = ScopeKind::kNamespace,
      .location = peek()->location,
      .namespaces = std::move(components),
  });
  ++offset_;
  return absl::OkStatus();
}

absl::Status Scanner::ScanClassHead() {
  auto const& key = tokens_[offset_++];
  ItemKind kind = ItemKind::kStruct;
  if (key.is_identifier("class")) {
    kind = ItemKind::kClass;
  } else if (key.is_identifier("union")) {
    kind = ItemKind::kUnion;
  } else if (key.is_identifier("enum")) {
    kind = ItemKind::kEnum;
    if (PeekIdentifier("class") || PeekIdentifier("struct")) {
      kind = ItemKind::kScopedEnum;
      ++offset_;
    }
  }
  bool is_template = std::exchange(template_pending_, false);
  Attributes attributes;
  RETURN_IF_ERROR(ConsumeAttributeSpecifiers(&attributes));
  std::string name;
  SourceLocation name_location = key.location;
  bool has_qualified_name = false;
  if (PeekPunctuation("::")) {
    has_qualified_name = true;
    name_location = peek()->location;
    absl::StrAppend(&name, "::");
    ++offset_;
  }
  while (!at_end() && peek()->is_identifier()) {
    auto const& component = *peek();
    if (name.empty()) {
      name_location = component.location;
    }
    absl::StrAppend(&name, component.text);
    ++offset_;
    if (PeekPunctuation("<")) {
      DEFINE_CONST_OR_RETURN(arguments, ConsumeGroup());
      is_template = true;
      absl::StrAppend(&name, "<", JoinTokens(arguments), ">");
    }
    if (!PeekPunctuation("::")) {
      break;
    }
    has_qualified_name = true;
    absl::StrAppend(&name, "::");
    ++offset_;
  }
  if (PeekIdentifier("final")) {
    ++offset_;
  }
  if (PeekPunctuation(":")) {
    // Base clause or enum base.
    size_t depth = 0;
    while (!at_end()) {
      auto const& token = *peek();
      if (token.is_punctuation("(")) {
        ++depth;
      } else if (token.is_punctuation(")")) {
        if (depth > 0) {
          --depth;
        }
      } else if (depth == 0 && (token.is_punctuation("{") || token.is_punctuation(";") ||
                                IsClosingBracket(token))) {
        break;
      }
      ++offset_;
    }
  }
  bool const has_body = PeekPunctuation("{");
  if (!attributes.empty()) {
    AnnotatedItem item{
        .kind = kind,
        .name = name,
        .location = attributes.location.value(),
        .name_location = name_location,
        .has_body = has_body,
        .has_qualified_name = has_qualified_name,
        .is_template = is_template,
        .option_blocks = std::move(attributes.option_blocks),
        .derive_blocks = std::move(attributes.derive_blocks),
    };
    FillScopeInfo(&item);
    items_.emplace_back(std::move(item));
  }
  if (has_body) {
    bool const is_class = kind == ItemKind::kStruct || kind == ItemKind::kClass ||
                          kind == ItemKind::kUnion;
    PushScope(Scope{
        .kind = is_class ? ScopeKind::kClass : ScopeKind::kOther,
        .location = peek()->location,
        .class_name = std::move(name),
        .is_template = is_template,
        .in_public_section = kind != ItemKind::kClass,
    });
    ++offset_;
  }
  return absl::OkStatus();
}

absl::Status Scanner::ScanMisplacedAttributes() {
  Attributes attributes;
  RETURN_IF_ERROR(ConsumeAttributeSpecifiers(&attributes));
  if (!attributes.empty()) {
    AnnotatedItem item{
        .kind = ItemKind::kOther,
        .location = attributes.location.value(),
        .name_location = attributes.location.value(),
        .option_blocks = std::move(attributes.option_blocks),
        .derive_blocks = std::move(attributes.derive_blocks),
    };
    FillScopeInfo(&item);
    items_.emplace_back(std::move(item));
  }
  return absl::OkStatus();
}

absl::Status Scanner::ScanTemplateHead() {
  ++offset_;
  if (PeekPunctuation("<")) {
    RETURN_IF_ERROR(ConsumeGroup());
    template_pending_ = true;
  } else if (PeekIdentifier("struct") || PeekIdentifier("class") || PeekIdentifier("union") ||
             PeekIdentifier("enum")) {
    // Explicit instantiation.
    template_pending_ = true;
  }
  return absl::OkStatus();
}

void Scanner::PushScope(Scope scope) { scopes_.emplace_back(std::move(scope)); }

bool Scanner::MaybeScanAccessSpecifier() {
  if (scopes_.empty() || scopes_.back().kind != ScopeKind::kClass || !PeekPunctuation(":", 1)) {
    return false;
  }
  auto const& token = tokens_[offset_];
  if (token.is_identifier("public")) {
    scopes_.back().in_public_section = true;
  } else if (token.is_identifier("private") || token.is_identifier("protected")) {
    scopes_.back().in_public_section = false;
  } else {
    return false;
  }
  offset_ += 2;
  return true;
}

absl::Status Scanner::PopScope() {
  if (scopes_.empty()) {
    return MakeDiagnostic(DiagnosticKind::kSyntaxError, tokens_[offset_].location,
                          "unbalanced \"}\"");
  }
  scopes_.pop_back();
  return absl::OkStatus();
}

void Scanner::FillScopeInfo(AnnotatedItem* const item) const {
  for (auto const& scope : scopes_) {
    switch (scope.kind) {
      case ScopeKind::kNamespace:
        item->namespace_path.insert(item->namespace_path.end(), scope.namespaces.begin(),
                                    scope.namespaces.end());
        break;
      case ScopeKind::kLinkage:
        break;
      case ScopeKind::kClass:
        item->class_path.push_back(scope.class_name);
        if (scope.is_template) {
          item->in_class_template = true;
        }
        if (!scope.in_public_section) {
          item->is_public = false;
        }
        break;
      case ScopeKind::kOther:
        item->is_local = true;
        break;
    }
  }
}

absl::StatusOr<std::vector<AnnotatedItem>> ScanSource(std::string_view const source) {
  DEFINE_CONST_OR_RETURN(tokens, Lexer(source).Tokenize());
  return Scanner(tokens).Scan();
}

}  // namespace derive
}  // namespace otel_derive
