#ifndef __OTEL_DERIVE_DERIVE_SOURCE_LOCATION_H__
#define __OTEL_DERIVE_DERIVE_SOURCE_LOCATION_H__

#include <cstddef>
#include <tuple>
#include <utility>

#include "absl/strings/str_format.h"

namespace otel_derive {
namespace derive {

// 1-based line and column of a character in the input file. Columns count bytes, not code points.
struct SourceLocation {
  size_t line = 0;
  size_t column = 0;

  auto tie() const { return std::tie(line, column); }

  friend bool operator==(SourceLocation const& lhs, SourceLocation const& rhs) {
    return lhs.tie() == rhs.tie();
  }

  friend bool operator!=(SourceLocation const& lhs, SourceLocation const& rhs) {
    return lhs.tie() != rhs.tie();
  }

  friend bool operator<(SourceLocation const& lhs, SourceLocation const& rhs) {
    return lhs.tie() < rhs.tie();
  }

  template <typename H>
  friend H AbslHashValue(H h, SourceLocation const& location) {
    return H::combine(std::move(h), location.line, location.column);
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, SourceLocation const& location) {
    absl::Format(&sink, "%d:%d", location.line, location.column);
  }
};

}  // namespace derive
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_DERIVE_SOURCE_LOCATION_H__
