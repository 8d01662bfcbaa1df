#include "derive/type_descriptor.h"

#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "derive/diagnostic.h"
#include "derive/scanner.h"

namespace otel_derive {
namespace derive {

namespace {

absl::Status Unsupported(SourceLocation const location, std::string_view const message) {
  return MakeDiagnostic(DiagnosticKind::kUnsupportedItemKind, location, message);
}

}  // namespace

std::string_view TypeShapeName(TypeShape const shape) {
  switch (shape) {
    case TypeShape::kStruct:
      return "struct";
    case TypeShape::kEnum:
      return "enum";
  }
  return "";
}

std::string TypeDescriptor::QualifiedName() const {
  if (class_path.empty()) {
    return name;
  } else {
    return absl::StrCat(absl::StrJoin(class_path, "::"), "::", name);
  }
}

std::string TypeDescriptor::FullName() const {
  std::string result;
  for (auto const& component : namespace_path) {
    if (component.name.empty()) {
      absl::StrAppend(&result, "::(anonymous namespace)");
    } else {
      absl::StrAppend(&result, "::", component.name);
    }
  }
  absl::StrAppend(&result, "::", QualifiedName());
  return result;
}

absl::StatusOr<TypeDescriptor> BuildTypeDescriptor(AnnotatedItem const& item) {
  TypeShape shape;
  switch (item.kind) {
    case ItemKind::kStruct:
    case ItemKind::kClass:
      shape = TypeShape::kStruct;
      break;
    case ItemKind::kEnum:
    case ItemKind::kScopedEnum:
      shape = TypeShape::kEnum;
      break;
    case ItemKind::kUnion:
      return Unsupported(item.name_location,
                         "otel attributes can't be applied to unions, only to structs, classes "
                         "and enums");
    case ItemKind::kOther:
    default:
      return Unsupported(item.location,
                         "otel attributes must be placed between the class-key (or enum-key) and "
                         "the name of a struct, class or enum definition, as in "
                         "`struct [[otel::derive(Key)]] Foo {...};`");
  }
  if (!item.has_body) {
    return Unsupported(item.name_location,
                       absl::StrCat("otel attributes must be applied to the definition of \"",
                                    item.name, "\", not to a declaration"));
  }
  if (item.name.empty()) {
    return Unsupported(item.name_location, "anonymous types can't derive conversions");
  }
  if (item.is_template) {
    return Unsupported(item.name_location,
                       absl::StrCat("\"", item.name,
                                    "\" is a template or a specialization; only non-template "
                                    "types can derive conversions"));
  }
  if (item.in_class_template) {
    return Unsupported(item.name_location,
                       absl::StrCat("\"", item.name,
                                    "\" is nested in a class template; only non-template types "
                                    "can derive conversions"));
  }
  if (item.is_local) {
    return Unsupported(item.name_location,
                       absl::StrCat("\"", item.name,
                                    "\" is a local type; only types defined at namespace or class "
                                    "scope can derive conversions"));
  }
  if (item.has_qualified_name) {
    return Unsupported(item.name_location,
                       absl::StrCat("\"", item.name,
                                    "\" is defined out of line; annotate the type where it is "
                                    "defined inside its enclosing class"));
  }
  for (auto const& class_name : item.class_path) {
    if (class_name.empty()) {
      return Unsupported(item.name_location,
                         absl::StrCat("\"", item.name,
                                      "\" is nested in an anonymous class and can't be named"));
    }
  }
  if (!item.is_public) {
    return Unsupported(item.name_location,
                       absl::StrCat("\"", item.name,
                                    "\" is not accessible from namespace scope; only public nested "
                                    "types can derive conversions"));
  }
  return TypeDescriptor{
      .name = item.name,
      .shape = shape,
      .namespace_path = item.namespace_path,
      .class_path = item.class_path,
      .location = item.name_location,
  };
}

}  // namespace derive
}  // namespace otel_derive
