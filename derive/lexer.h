#ifndef __OTEL_DERIVE_DERIVE_LEXER_H__
#define __OTEL_DERIVE_DERIVE_LEXER_H__

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "derive/source_location.h"

namespace otel_derive {
namespace derive {

struct Token {
  enum class Kind {
    kIdentifier,
    kNumber,
    kStringLiteral,
    kCharLiteral,
    kPunctuation,
  };

  Kind kind;

  // Refers to the input text, which must outlive the token. For string and character literals this
  // includes the encoding prefix (e.g. `u8`) and the quotes.
  std::string_view text;

  SourceLocation location;

  bool is_identifier() const { return kind == Kind::kIdentifier; }
  bool is_identifier(std::string_view const name) const {
    return kind == Kind::kIdentifier && text == name;
  }

  bool is_punctuation(std::string_view const punctuation) const {
    return kind == Kind::kPunctuation && text == punctuation;
  }
};

// Concatenates the texts of `tokens` the way a person would write them: words are separated by a
// space, commas are followed by one, and everything else is glued together. Used to spell type
// references and to quote offending code in diagnostics.
std::string JoinTokens(absl::Span<Token const> tokens);

// Splits C++ source text into tokens. Only the granularity needed to find annotated type
// definitions is provided: `::` is the only multi-character punctuator, everything else is returned
// one character at a time (so `>>` yields two `>` tokens). Comments and preprocessor directives are
// dropped.
class Lexer {
 public:
  explicit Lexer(std::string_view const input) : input_(input) {}

  // Returns a `kSyntaxError` diagnostic for unterminated literals and comments.
  absl::StatusOr<std::vector<Token>> Tokenize() &&;

 private:
  Lexer(Lexer const&) = delete;
  Lexer& operator=(Lexer const&) = delete;
  Lexer(Lexer&&) = delete;
  Lexer& operator=(Lexer&&) = delete;

  bool at_end() const { return offset_ >= input_.size(); }
  char peek(size_t const lookahead = 0) const {
    return offset_ + lookahead < input_.size() ? input_[offset_ + lookahead] : '\0';
  }

  SourceLocation location() const { return {.line = line_, .column = column_}; }

  void Advance(size_t count = 1);

  // Skips whitespace, comments and preprocessor directives.
  absl::Status SkipSeparators();

  void SkipPreprocessorDirective();

  Token LexIdentifier();
  Token LexNumber();

  absl::StatusOr<Token> LexQuoted(size_t prefix_length, char quote);
  absl::StatusOr<Token> LexRawString(size_t prefix_length);

  std::string_view const input_;
  size_t offset_ = 0;
  size_t line_ = 1;
  size_t column_ = 1;

  // True if only whitespace was seen since the last line break, which makes a `#` the start of a
  // preprocessor directive.
  bool at_line_start_ = true;
};

}  // namespace derive
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_DERIVE_LEXER_H__
