#ifndef __OTEL_DERIVE_DERIVE_TEXT_WRITER_H__
#define __OTEL_DERIVE_DERIVE_TEXT_WRITER_H__

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace otel_derive {
namespace derive {
namespace internal {

// Accumulates indented C++ source text.
class TextWriter {
 public:
  struct Options {
    size_t indent_width = 2;
  };

  class IndentedScope final {
   public:
    explicit IndentedScope(TextWriter* const parent) : parent_(parent) { parent_->Indent(); }
    ~IndentedScope() { parent_->Dedent(); }

   private:
    IndentedScope(IndentedScope const&) = delete;
    IndentedScope& operator=(IndentedScope const&) = delete;
    IndentedScope(IndentedScope&&) = delete;
    IndentedScope& operator=(IndentedScope&&) = delete;

    TextWriter* const parent_;
  };

  explicit TextWriter(Options const& options) : options_(options) {}
  explicit TextWriter() : TextWriter(/*options=*/Options{}) {}

  void Indent();
  void Dedent();

  size_t indentation_level() const { return indentation_level_; }

  template <typename... Args>
  void Append(Args&&... args) {
    AppendIndentation();
    content_.Append(absl::StrCat(std::forward<Args>(args)...));
    new_line_ = false;
  }

  template <typename... Args>
  void AppendLine(Args&&... args) {
    AppendIndentation();
    content_.Append(absl::StrCat(std::forward<Args>(args)..., "\n"));
    new_line_ = true;
  }

  template <typename... Args>
  void FinishLine(Args&&... args) {
    content_.Append(absl::StrCat(std::forward<Args>(args)..., "\n"));
    new_line_ = true;
  }

  template <typename... Args>
  void AppendUnindentedLine(Args&&... args) {
    FinishLine(std::forward<Args>(args)...);
  }

  void AppendEmptyLine();

  // Appends an empty line unless the content is empty or already ends with one. Useful for
  // separating definitions without knowing whether something was emitted before.
  void MaybeAppendEmptyLine();

  bool empty() const { return content_.empty(); }

  std::string Finish() &&;

 private:
  void AppendIndentation();

  Options const options_;

  size_t indentation_level_ = 0;
  std::vector<absl::Cord> indentation_cords_;

  absl::Cord content_;
  bool new_line_ = true;
};

}  // namespace internal
}  // namespace derive
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_DERIVE_TEXT_WRITER_H__
