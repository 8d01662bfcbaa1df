#ifndef __OTEL_DERIVE_DERIVE_SCANNER_H__
#define __OTEL_DERIVE_DERIVE_SCANNER_H__

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "derive/lexer.h"
#include "derive/options.h"
#include "derive/source_location.h"

namespace otel_derive {
namespace derive {

// The kind of declaration an `otel` attribute appertains to.
enum class ItemKind {
  kStruct,
  kClass,
  kUnion,
  kEnum,
  kScopedEnum,  // `enum class` or `enum struct`

  // The attribute is not placed between a class-key (or enum-key) and a name, e.g. it precedes a
  // function or a variable.
  kOther,
};

struct NamespaceComponent {
  // Empty for anonymous namespaces.
  std::string name;
  bool is_inline = false;

  auto tie() const { return std::tie(name, is_inline); }

  friend bool operator==(NamespaceComponent const& lhs, NamespaceComponent const& rhs) {
    return lhs.tie() == rhs.tie();
  }
  friend bool operator!=(NamespaceComponent const& lhs, NamespaceComponent const& rhs) {
    return !operator==(lhs, rhs);
  }
};

// A declaration carrying at least one `otel` or `otel::derive` attribute. The scanner only records
// what it sees; deciding whether the item is supported is up to `BuildTypeDescriptor`.
struct AnnotatedItem {
  ItemKind kind = ItemKind::kOther;

  // The declared name as spelled, e.g. `Foo`, `Outer::Foo` or `Foo<int>`. Empty for anonymous
  // types and for `kOther` items.
  std::string name;

  // Location of the first `otel` attribute.
  SourceLocation location;

  // Location of the name, or of the class-key if the type is anonymous.
  SourceLocation name_location;

  std::vector<NamespaceComponent> namespace_path;

  // Names of the enclosing classes, outermost first. Anonymous enclosing classes have empty names.
  std::vector<std::string> class_path;

  // False for forward declarations and elaborated type specifiers.
  bool has_body = false;

  // True if the name is qualified (`struct Outer::Inner {...}`).
  bool has_qualified_name = false;

  // True if the declaration is a template, an explicit specialization or an explicit instantiation.
  bool is_template = false;

  // True if one of the enclosing classes is a template or a specialization.
  bool in_class_template = false;

  // True if the declaration is inside a function body or another non-class block.
  bool is_local = false;

  // False if the declaration, or one of its enclosing classes, is in a private or protected section
  // of its enclosing class.
  bool is_public = true;

  std::vector<AttributeBlock> option_blocks;
  std::vector<AttributeBlock> derive_blocks;
};

// Finds the annotated declarations of a tokenized C++ header.
//
// The scanner doesn't parse C++: it tracks braces to know which namespace and class every
// declaration belongs to, and recognizes class heads (`struct`, `class`, `union` and `enum`
// followed by attributes, a name, a base clause and a body). Syntax errors are only reported for
// unbalanced braces and for malformed attributes.
//
// Preprocessor directives are skipped, so both branches of an `#if`/`#else` are scanned. A type
// annotated in both branches yields two items and therefore duplicate conversions.
//
// Attributes are recognized in `[[...]]` blocks, including the `[[using otel: derive(...)]]` form.
// `otel::derive(...)` lists capabilities and `otel(...)` lists options; any other attribute in the
// `otel` namespace is an error.
class Scanner {
 public:
  explicit Scanner(absl::Span<Token const> const tokens) : tokens_(tokens) {}

  absl::StatusOr<std::vector<AnnotatedItem>> Scan() &&;

 private:
  enum class ScopeKind {
    kNamespace,
    kLinkage,  // `extern "C" {...}`, transparent
    kClass,
    kOther,
  };

  struct Scope {
    ScopeKind kind;
    SourceLocation location;

    // Only for `kNamespace`: one entry per component of `namespace a::b {`.
    std::vector<NamespaceComponent> namespaces;

    // Only for `kClass`.
    std::string class_name;
    bool is_template = false;

    // Only for `kClass`: whether the current access section is `public`. Starts out `false` for
    // `class` and `true` for `struct` and `union`.
    bool in_public_section = true;
  };

  // The `otel` attributes found in an attribute-specifier-seq.
  struct Attributes {
    std::optional<SourceLocation> location;
    std::vector<AttributeBlock> option_blocks;
    std::vector<AttributeBlock> derive_blocks;

    bool empty() const { return option_blocks.empty() && derive_blocks.empty(); }
  };

  Scanner(Scanner const&) = delete;
  Scanner& operator=(Scanner const&) = delete;
  Scanner(Scanner&&) = delete;
  Scanner& operator=(Scanner&&) = delete;

  bool at_end() const { return offset_ >= tokens_.size(); }

  // Returns the token at `offset_ + lookahead`, or nullptr past the end.
  Token const* peek(size_t lookahead = 0) const;

  bool PeekPunctuation(std::string_view punctuation, size_t lookahead = 0) const;
  bool PeekIdentifier(std::string_view name, size_t lookahead = 0) const;

  SourceLocation last_location() const;

  bool AtAttributeSpecifier() const;

  // Consumes a balanced `(...)`, `[...]`, `{...}` or `<...>` group starting at the current token.
  // Angle brackets inside parentheses are not counted. Returns the tokens between the outer
  // brackets.
  absl::StatusOr<absl::Span<Token const>> ConsumeGroup();

  // Consumes any sequence of `[[...]]`, `alignas(...)`, `__attribute__((...))` and
  // `__declspec(...)`, collecting the `otel` attributes into `attributes`.
  absl::Status ConsumeAttributeSpecifiers(Attributes* attributes);

  absl::Status ConsumeAttributeList(Attributes* attributes);

  absl::Status ScanNamespace();
  absl::Status ScanClassHead();
  absl::Status ScanMisplacedAttributes();
  absl::Status ScanTemplateHead();

  // Handles `public:`, `private:` and `protected:` in class scopes. Returns false if the current
  // tokens are not an access specifier.
  bool MaybeScanAccessSpecifier();

  void PushScope(Scope scope);
  absl::Status PopScope();

  void FillScopeInfo(AnnotatedItem* item) const;

  absl::Span<Token const> const tokens_;
  size_t offset_ = 0;

  std::vector<Scope> scopes_;

  // Set after `template <...>`, `template <>` or `template` until the declaration it applies to is
  // found.
  bool template_pending_ = false;

  std::vector<AnnotatedItem> items_;
};

// Lexes and scans `source`. The tokens in the returned items refer to `source`, which must outlive
// them.
absl::StatusOr<std::vector<AnnotatedItem>> ScanSource(std::string_view source);

}  // namespace derive
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_DERIVE_SCANNER_H__
