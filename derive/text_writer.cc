#include "derive/text_writer.h"

#include <string>

namespace otel_derive {
namespace derive {
namespace internal {

void TextWriter::Indent() {
  if (++indentation_level_ > indentation_cords_.size()) {
    indentation_cords_.emplace_back(std::string(indentation_level_ * options_.indent_width, ' '));
  }
}

void TextWriter::Dedent() {
  if (indentation_level_ > 0) {
    --indentation_level_;
  }
}

void TextWriter::AppendEmptyLine() {
  content_.Append("\n");
  new_line_ = true;
}

void TextWriter::MaybeAppendEmptyLine() {
  if (!content_.empty() && !content_.EndsWith("\n\n")) {
    AppendEmptyLine();
  }
}

std::string TextWriter::Finish() && { return std::string(content_.Flatten()); }

void TextWriter::AppendIndentation() {
  if (new_line_ && indentation_level_ > 0) {
    content_.Append(indentation_cords_[indentation_level_ - 1]);
  }
}

}  // namespace internal
}  // namespace derive
}  // namespace otel_derive
