#include "derive/diagnostic.h"

#include <optional>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/status_matchers.h"
#include "derive/source_location.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::absl_testing::StatusIs;
using ::otel_derive::derive::DiagnosticKind;
using ::otel_derive::derive::DiagnosticKindName;
using ::otel_derive::derive::FormatDiagnostic;
using ::otel_derive::derive::GetDiagnosticKind;
using ::otel_derive::derive::GetDiagnosticLocation;
using ::otel_derive::derive::MakeDiagnostic;
using ::otel_derive::derive::SourceLocation;
using ::testing::Optional;

TEST(DiagnosticTest, KindNames) {
  EXPECT_EQ(DiagnosticKindName(DiagnosticKind::kSyntaxError), "SyntaxError");
  EXPECT_EQ(DiagnosticKindName(DiagnosticKind::kUnknownOption), "UnknownOption");
  EXPECT_EQ(DiagnosticKindName(DiagnosticKind::kMalformedOption), "MalformedOption");
  EXPECT_EQ(DiagnosticKindName(DiagnosticKind::kDuplicateOption), "DuplicateOption");
  EXPECT_EQ(DiagnosticKindName(DiagnosticKind::kMissingRequiredOption), "MissingRequiredOption");
  EXPECT_EQ(DiagnosticKindName(DiagnosticKind::kUnsupportedItemKind), "UnsupportedItemKind");
  EXPECT_EQ(DiagnosticKindName(DiagnosticKind::kUnknownCapability), "UnknownCapability");
  EXPECT_EQ(DiagnosticKindName(DiagnosticKind::kDuplicateCapability), "DuplicateCapability");
  EXPECT_EQ(DiagnosticKindName(DiagnosticKind::kOrphanedOptions), "OrphanedOptions");
}

TEST(DiagnosticTest, StatusCodes) {
  SourceLocation const location{.line = 1, .column = 1};
  EXPECT_THAT(MakeDiagnostic(DiagnosticKind::kSyntaxError, location, "lorem"),
              StatusIs(absl::StatusCode::kInvalidArgument, "lorem"));
  EXPECT_THAT(MakeDiagnostic(DiagnosticKind::kUnknownCapability, location, "lorem"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(MakeDiagnostic(DiagnosticKind::kDuplicateOption, location, "lorem"),
              StatusIs(absl::StatusCode::kAlreadyExists));
  EXPECT_THAT(MakeDiagnostic(DiagnosticKind::kDuplicateCapability, location, "lorem"),
              StatusIs(absl::StatusCode::kAlreadyExists));
  EXPECT_THAT(MakeDiagnostic(DiagnosticKind::kMissingRequiredOption, location, "lorem"),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(MakeDiagnostic(DiagnosticKind::kOrphanedOptions, location, "lorem"),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(MakeDiagnostic(DiagnosticKind::kUnsupportedItemKind, location, "lorem"),
              StatusIs(absl::StatusCode::kUnimplemented));
}

TEST(DiagnosticTest, Payloads) {
  auto const status = MakeDiagnostic(DiagnosticKind::kMalformedOption,
                                     SourceLocation{.line = 12, .column = 34}, "ipsum");
  EXPECT_THAT(GetDiagnosticKind(status), Optional(DiagnosticKind::kMalformedOption));
  EXPECT_THAT(GetDiagnosticLocation(status), Optional(SourceLocation{.line = 12, .column = 34}));
}

TEST(DiagnosticTest, NoPayloads) {
  auto const status = absl::NotFoundError("lorem");
  EXPECT_EQ(GetDiagnosticKind(status), std::nullopt);
  EXPECT_EQ(GetDiagnosticLocation(status), std::nullopt);
}

TEST(DiagnosticTest, OkStatus) {
  EXPECT_EQ(GetDiagnosticKind(absl::OkStatus()), std::nullopt);
  EXPECT_EQ(GetDiagnosticLocation(absl::OkStatus()), std::nullopt);
}

TEST(DiagnosticTest, Format) {
  std::string_view constexpr kSource =
      "#include <string>\n"
      "struct [[otel(keys = \"x\")]] Foo {};\n";
  auto const status = MakeDiagnostic(DiagnosticKind::kUnknownOption, {.line = 2, .column = 15},
                                     "unknown option \"keys\"");
  EXPECT_EQ(FormatDiagnostic("foo/types.h", kSource, status),
            "foo/types.h:2:15: error: unknown option \"keys\" [UnknownOption]\n"
            "  struct [[otel(keys = \"x\")]] Foo {};\n"
            "                ^\n");
}

TEST(DiagnosticTest, FormatFirstColumn) {
  auto const status = MakeDiagnostic(DiagnosticKind::kSyntaxError, {.line = 1, .column = 1},
                                     "unbalanced \"}\"");
  EXPECT_EQ(FormatDiagnostic("a.h", "};", status),
            "a.h:1:1: error: unbalanced \"}\" [SyntaxError]\n"
            "  };\n"
            "  ^\n");
}

TEST(DiagnosticTest, FormatKeepsTabs) {
  auto const status = MakeDiagnostic(DiagnosticKind::kSyntaxError, {.line = 1, .column = 3},
                                     "lorem");
  EXPECT_EQ(FormatDiagnostic("a.h", "\tx}", status),
            "a.h:1:3: error: lorem [SyntaxError]\n"
            "  \tx}\n"
            "  \t ^\n");
}

TEST(DiagnosticTest, FormatCarriageReturn) {
  auto const status = MakeDiagnostic(DiagnosticKind::kSyntaxError, {.line = 2, .column = 1},
                                     "lorem");
  EXPECT_EQ(FormatDiagnostic("a.h", "a\r\nb\r\n", status),
            "a.h:2:1: error: lorem [SyntaxError]\n"
            "  b\n"
            "  ^\n");
}

TEST(DiagnosticTest, FormatLineOutOfRange) {
  auto const status = MakeDiagnostic(DiagnosticKind::kSyntaxError, {.line = 5, .column = 1},
                                     "lorem");
  EXPECT_EQ(FormatDiagnostic("a.h", "a\nb", status), "a.h:5:1: error: lorem [SyntaxError]\n");
}

TEST(DiagnosticTest, FormatOtherErrors) {
  EXPECT_EQ(FormatDiagnostic("a.h", "", absl::NotFoundError("fopen(\"a.h\"): No such file")),
            "a.h: error: fopen(\"a.h\"): No such file\n");
}

}  // namespace
