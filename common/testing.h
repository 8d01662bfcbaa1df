#ifndef __OTEL_DERIVE_COMMON_TESTING_H__
#define __OTEL_DERIVE_COMMON_TESTING_H__

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"           // IWYU pragma: export
#include "absl/status/status_matchers.h"  // IWYU pragma: export
#include "absl/status/statusor.h"         // IWYU pragma: export
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace testing {

// Returns the path of the test temp directory, which is provided in the `TEST_TMPDIR` environment
// variable. Falls back to `/tmp/` if the variable is not set.
std::string GetTestTmpDir();

// Manages a temporary file created with `mkstemp` inside the test temp directory returned by
// `GetTestTmpDir`. Deletes the file automatically upon destruction.
class TestTempFile {
 public:
  // Creates the file and writes `content` to it.
  static absl::StatusOr<TestTempFile> Create(std::string_view base_name,
                                             std::string_view content = "");

  ~TestTempFile();

  TestTempFile(TestTempFile&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
  }

  TestTempFile& operator=(TestTempFile&& other) noexcept {
    swap(other);
    return *this;
  }

  void swap(TestTempFile& other) noexcept {
    using std::swap;  // ensure ADL
    swap(path_, other.path_);
  }

  friend void swap(TestTempFile& lhs, TestTempFile& rhs) noexcept { lhs.swap(rhs); }

  std::string const& path() const { return path_; }

 private:
  static std::string MakeTempFileTemplate(std::string_view base_name);

  explicit TestTempFile(std::string path) : path_(std::move(path)) {}

  TestTempFile(TestTempFile const&) = delete;
  TestTempFile& operator=(TestTempFile const&) = delete;

  std::string path_;
};

}  // namespace testing

// Macros for testing the results of functions that return absl::Status or absl::StatusOr<T> (for
// any type T).
#define EXPECT_OK(expression) EXPECT_THAT((expression), ::absl_testing::IsOk())
#define ASSERT_OK(expression) ASSERT_THAT((expression), ::absl_testing::IsOk())

#endif  // __OTEL_DERIVE_COMMON_TESTING_H__
