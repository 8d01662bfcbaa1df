#include "derive/lexer.h"

#include <cstddef>
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

namespace otel_derive {
namespace derive {

namespace {

size_t constexpr kMaxRawStringDelimiterLength = 16;

bool IsWhitespace(char const ch) {
  return ch == ' ' || ch == '\n' || ch == '\t' || ch == '\v' || ch == '\f' || ch == '\r';
}

bool IsDigit(char const ch) { return ch >= '0' && ch <= '9'; }

bool IsIdentifierStart(char const ch) {
  return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || ch == '_' ||
         static_cast<unsigned char>(ch) >= 0x80;
}

bool IsIdentifierContinuation(char const ch) { return IsIdentifierStart(ch) || IsDigit(ch); }

bool IsEncodingPrefix(std::string_view const text) {
  return text == "u8" || text == "u" || text == "U" || text == "L";
}

bool IsRawStringPrefix(std::string_view const text) {
  return text == "R" || text == "u8R" || text == "uR" || text == "UR" || text == "LR";
}

bool IsWord(Token const& token) {
  return token.kind == Token::Kind::kIdentifier || token.kind == Token::Kind::kNumber;
}

}  // namespace

std::string JoinTokens(absl::Span<Token const> const tokens) {
  std::string result;
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (i > 0 &&
        (tokens[i - 1].is_punctuation(",") || (IsWord(tokens[i - 1]) && IsWord(tokens[i])))) {
      result += ' ';
    }
    absl::StrAppend(&result, tokens[i].text);
  }
  return result;
}

absl::StatusOr<std::vector<Token>> Lexer::Tokenize() && {
  std::vector<Token> tokens;
  while (true) {
    RETURN_IF_ERROR(SkipSeparators());
    if (at_end()) {
      break;
    }
    char const ch = peek();
    if (IsIdentifierStart(ch)) {
      auto token = LexIdentifier();
      // An identifier immediately followed by a quote may be an encoding prefix.
      if (peek() == '"' && IsRawStringPrefix(token.text)) {
        offset_ -= token.text.size();
        column_ -= token.text.size();
        DEFINE_VAR_OR_RETURN(literal, LexRawString(token.text.size()));
        tokens.emplace_back(std::move(literal));
      } else if ((peek() == '"' || peek() == '\'') && IsEncodingPrefix(token.text)) {
        offset_ -= token.text.size();
        column_ -= token.text.size();
        DEFINE_VAR_OR_RETURN(literal, LexQuoted(token.text.size(), peek(token.text.size())));
        tokens.emplace_back(std::move(literal));
      } else {
        tokens.emplace_back(std::move(token));
      }
    } else if (IsDigit(ch) || (ch == '.' && IsDigit(peek(1)))) {
      tokens.emplace_back(LexNumber());
    } else if (ch == '"' || ch == '\'') {
      DEFINE_VAR_OR_RETURN(literal, LexQuoted(/*prefix_length=*/0, ch));
      tokens.emplace_back(std::move(literal));
    } else {
      auto const start = location();
      size_t const length = (ch == ':' && peek(1) == ':') ? 2 : 1;
      tokens.push_back(Token{
          .kind = Token::Kind::kPunctuation,
          .text = input_.substr(offset_, length),
          .location = start,
      });
      Advance(length);
    }
  }
  return std::move(tokens);
}

void Lexer::Advance(size_t count) {
  while (count-- > 0 && !at_end()) {
    char const ch = input_[offset_++];
    if (ch == '\n') {
      ++line_;
      column_ = 1;
      at_line_start_ = true;
    } else {
      ++column_;
      if (!IsWhitespace(ch)) {
        at_line_start_ = false;
      }
    }
  }
}

absl::Status Lexer::SkipSeparators() {
  while (!at_end()) {
    char const ch = peek();
    if (IsWhitespace(ch)) {
      Advance();
    } else if (ch == '\\' && peek(1) == '\n') {
      Advance(2);
    } else if (ch == '#' && at_line_start_) {
      SkipPreprocessorDirective();
    } else if (ch == '/' && peek(1) == '/') {
      while (!at_end() && peek() != '\n') {
        Advance();
      }
    } else if (ch == '/' && peek(1) == '*') {
      auto const start = location();
      Advance(2);
      while (!at_end() && !(peek() == '*' && peek(1) == '/')) {
        Advance();
      }
      if (at_end()) {
        return MakeDiagnostic(DiagnosticKind::kSyntaxError, start, "unterminated comment");
      }
      Advance(2);
    } else {
      break;
    }
  }
  return absl::OkStatus();
}

void Lexer::SkipPreprocessorDirective() {
  while (!at_end() && peek() != '\n') {
    if (peek() == '\\' && peek(1) == '\n') {
      Advance(2);
    } else if (peek() == '\\' && peek(1) == '\r' && peek(2) == '\n') {
      Advance(3);
    } else {
      Advance();
    }
  }
}

Token Lexer::LexIdentifier() {
  auto const start = location();
  size_t length = 0;
  while (IsIdentifierContinuation(peek(length))) {
    ++length;
  }
  Token token{
      .kind = Token::Kind::kIdentifier,
      .text = input_.substr(offset_, length),
      .location = start,
  };
  Advance(length);
  return token;
}

Token Lexer::LexNumber() {
  auto const start = location();
  size_t length = 0;
  while (true) {
    char const ch = peek(length);
    if ((ch == 'e' || ch == 'E' || ch == 'p' || ch == 'P') &&
        (peek(length + 1) == '+' || peek(length + 1) == '-')) {
      length += 2;
    } else if (ch == '\'' && IsIdentifierContinuation(peek(length + 1))) {
      length += 2;  // digit separator
    } else if (IsIdentifierContinuation(ch) || ch == '.') {
      ++length;
    } else {
      break;
    }
  }
  Token token{
      .kind = Token::Kind::kNumber,
      .text = input_.substr(offset_, length),
      .location = start,
  };
  Advance(length);
  return token;
}

absl::StatusOr<Token> Lexer::LexQuoted(size_t const prefix_length, char const quote) {
  auto const start = location();
  size_t length = prefix_length + 1;
  while (true) {
    char const ch = peek(length);
    if (ch == '\0' && offset_ + length >= input_.size()) {
      break;
    }
    if (ch == '\n') {
      break;
    }
    if (ch == '\\') {
      length += 2;
      continue;
    }
    ++length;
    if (ch == quote) {
      // User-defined literal suffix.
      while (IsIdentifierContinuation(peek(length))) {
        ++length;
      }
      Token token{
          .kind = quote == '"' ? Token::Kind::kStringLiteral : Token::Kind::kCharLiteral,
          .text = input_.substr(offset_, length),
          .location = start,
      };
      Advance(length);
      return token;
    }
  }
  return MakeDiagnostic(
      DiagnosticKind::kSyntaxError, start,
      quote == '"' ? "unterminated string literal" : "unterminated character literal");
}

absl::StatusOr<Token> Lexer::LexRawString(size_t const prefix_length) {
  auto const start = location();
  size_t length = prefix_length + 1;  // prefix and opening quote
  size_t delimiter_length = 0;
  while (peek(length + delimiter_length) != '(') {
    char const ch = peek(length + delimiter_length);
    if (delimiter_length >= kMaxRawStringDelimiterLength || ch == '\0' || ch == ')' ||
        ch == '\\' || IsWhitespace(ch)) {
      return MakeDiagnostic(DiagnosticKind::kSyntaxError, start,
                            "invalid raw string literal delimiter");
    }
    ++delimiter_length;
  }
  auto const delimiter = input_.substr(offset_ + length, delimiter_length);
  auto const terminator = absl::StrCat(")", delimiter, "\"");
  auto const end = input_.find(terminator, offset_ + length + delimiter_length + 1);
  if (end == std::string_view::npos) {
    return MakeDiagnostic(DiagnosticKind::kSyntaxError, start, "unterminated raw string literal");
  }
  length = end + terminator.size() - offset_;
  while (IsIdentifierContinuation(peek(length))) {
    ++length;
  }
  Token token{
      .kind = Token::Kind::kStringLiteral,
      .text = input_.substr(offset_, length),
      .location = start,
  };
  Advance(length);
  return token;
}

}  // namespace derive
}  // namespace otel_derive
