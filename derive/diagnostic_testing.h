#ifndef __OTEL_DERIVE_DERIVE_DIAGNOSTIC_TESTING_H__
#define __OTEL_DERIVE_DERIVE_DIAGNOSTIC_TESTING_H__

#include <optional>
#include <ostream>

#include "absl/status/status.h"
#include "derive/diagnostic.h"
#include "derive/source_location.h"
#include "gtest/gtest.h"

namespace otel_derive {
namespace testing {

// GoogleTest matcher for statuses built by `derive::MakeDiagnostic`. Checks the diagnostic kind
// and, optionally, the source location.
//
// Example usage:
//
//   EXPECT_THAT(ParseAttributeOptions(blocks).status(),
//               DiagnosticIs(DiagnosticKind::kUnknownOption, {.line = 1, .column = 8}));
//
class DiagnosticIs : public ::testing::MatcherInterface<absl::Status const&> {
 public:
  using is_gtest_matcher = void;

  explicit DiagnosticIs(derive::DiagnosticKind const kind) : kind_(kind) {}

  explicit DiagnosticIs(derive::DiagnosticKind const kind, derive::SourceLocation const location)
      : kind_(kind), location_(location) {}

  void DescribeTo(std::ostream* const os) const override {
    *os << "is a " << derive::DiagnosticKindName(kind_) << " diagnostic";
    if (location_.has_value()) {
      *os << " at " << location_->line << ":" << location_->column;
    }
  }

  void DescribeNegationTo(std::ostream* const os) const override {
    *os << "isn't a " << derive::DiagnosticKindName(kind_) << " diagnostic";
    if (location_.has_value()) {
      *os << " at " << location_->line << ":" << location_->column;
    }
  }

  bool MatchAndExplain(absl::Status const& status,
                       ::testing::MatchResultListener* const listener) const override {
    auto const kind = derive::GetDiagnosticKind(status);
    if (!kind.has_value()) {
      *listener << "not a diagnostic: " << status;
      return false;
    }
    if (*kind != kind_) {
      *listener << "kind is " << derive::DiagnosticKindName(*kind);
      return false;
    }
    if (!location_.has_value()) {
      return true;
    }
    auto const location = derive::GetDiagnosticLocation(status);
    if (!location.has_value()) {
      *listener << "has no location";
      return false;
    }
    if (*location != *location_) {
      *listener << "location is " << location->line << ":" << location->column;
      return false;
    }
    return true;
  }

 private:
  derive::DiagnosticKind const kind_;
  std::optional<derive::SourceLocation> const location_;
};

}  // namespace testing
}  // namespace otel_derive

#endif  // __OTEL_DERIVE_DERIVE_DIAGNOSTIC_TESTING_H__
