#ifndef __OTEL_DERIVE_DERIVE_TYPE_DESCRIPTOR_H__
#define __OTEL_DERIVE_DERIVE_TYPE_DESCRIPTOR_H__

#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "derive/scanner.h"
#include "derive/source_location.h"

namespace otel_derive {
namespace derive {

enum class TypeShape {
  kStruct,  // `struct` or `class`
  kEnum,    // `enum`, `enum class` or `enum struct`
};

std::string_view TypeShapeName(TypeShape shape);

// The part of an annotated type definition the synthesizers need. Field and enumerator lists are
// never inspected.
struct TypeDescriptor {
  std::string name;
  TypeShape shape;

  // Namespaces enclosing the definition, outermost first. The generated conversions are emitted in
  // the innermost one.
  std::vector<NamespaceComponent> namespace_path;

  // Classes enclosing the definition, outermost first.
  std::vector<std::string> class_path;

  // Location of the type name.
  SourceLocation location;

  // Returns the name of the type relative to its innermost namespace, e.g. `Outer::Inner`. This is
  // how the generated code refers to the type.
  std::string QualifiedName() const;

  // Returns the fully qualified name for diagnostics and logs, e.g. `::app::Outer::Inner`.
  // Anonymous namespaces are rendered as `(anonymous namespace)`.
  std::string FullName() const;
};

// Checks that `item` is the definition of a non-template struct, class or enum at namespace or
// class scope and describes it. Anything else fails with `kUnsupportedItemKind`.
absl::StatusOr<TypeDescriptor> BuildTypeDescriptor(AnnotatedItem const& item);

}  // namespace derive
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_DERIVE_TYPE_DESCRIPTOR_H__
