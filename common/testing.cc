#include "common/testing.h"

#include <errno.h>
#include <stdlib.h>
#include <unistd.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "absl/debugging/failure_signal_handler.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

namespace {

class FailureSignalHandlerInstaller {
 public:
  explicit FailureSignalHandlerInstaller() {
    absl::InitializeLog();
    absl::InstallFailureSignalHandler(absl::FailureSignalHandlerOptions());
  }
};

FailureSignalHandlerInstaller failure_signal_handler_installer;

char constexpr kTestTmpDirEnvVar[] = "TEST_TMPDIR";
std::string_view constexpr kDefaultTestTmpDir = "/tmp/";

absl::Status WriteAll(int const fd, std::string_view content) {
  while (!content.empty()) {
    auto const result = ::write(fd, content.data(), content.size());
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      return absl::ErrnoToStatus(errno, "write");
    }
    content.remove_prefix(static_cast<size_t>(result));
  }
  return absl::OkStatus();
}

}  // namespace

namespace testing {

std::string GetTestTmpDir() {
  char const* const value = ::getenv(kTestTmpDirEnvVar);
  if (value != nullptr && *value != 0) {
    return std::string(value);
  } else {
    return std::string(kDefaultTestTmpDir);
  }
}

absl::StatusOr<TestTempFile> TestTempFile::Create(std::string_view const base_name,
                                                  std::string_view const content) {
  std::string path = MakeTempFileTemplate(base_name);
  int const fd = ::mkstemp(path.data());
  if (fd < 0) {
    return absl::ErrnoToStatus(errno, "mkstemp");
  }
  TestTempFile file{std::move(path)};
  auto const status = WriteAll(fd, content);
  if (::close(fd) < 0) {
    return absl::ErrnoToStatus(errno, "close");
  }
  if (!status.ok()) {
    return status;
  }
  return std::move(file);
}

TestTempFile::~TestTempFile() {
  if (!path_.empty() && ::unlink(path_.c_str()) < 0) {
    LOG(ERROR) << absl::ErrnoToStatus(errno, "unlink");
  }
}

std::string TestTempFile::MakeTempFileTemplate(std::string_view const base_name) {
  static std::string_view constexpr kSuffix = "_XXXXXX";
  auto const directory = GetTestTmpDir();
  if (absl::EndsWith(directory, "/")) {
    return absl::StrCat(directory, base_name, kSuffix);
  } else {
    return absl::StrCat(directory, "/", base_name, kSuffix);
  }
}

}  // namespace testing
