#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "common/utilities.h"
#include "derive/diagnostic.h"
#include "derive/generator.h"

ABSL_FLAG(std::string, otel_output_directory, "",
          "The directory where all the generated headers are written. Defaults to the current "
          "working directory if unspecified.");

ABSL_FLAG(std::string, otel_source_root, "",
          "Directory the input paths are made relative to. The relative path of an input is both "
          "the path the generated header uses to include it and the location of the generated "
          "header under --otel_output_directory. Inputs outside this directory are used as given.");

namespace {

using ::otel_derive::derive::FormatDiagnostic;
using ::otel_derive::derive::Generator;
using ::otel_derive::derive::generator::MakeHeaderFileName;
using ::otel_derive::derive::generator::ReadFile;
using ::otel_derive::derive::generator::WriteFile;

class File {
 public:
  static absl::StatusOr<File> Open(std::string const& path) {
    return OpenInternal(path, /*mode=*/"r");
  }

  static absl::StatusOr<File> Create(std::string const& path) {
    return OpenInternal(path, /*mode=*/"w");
  }

  ~File() { MaybeClose(); }

  File(File const&) = delete;
  File& operator=(File const&) = delete;

  File(File&& other) noexcept : fp_(other.fp_) { other.fp_ = nullptr; }

  File& operator=(File&& other) noexcept {
    MaybeClose();
    fp_ = other.fp_;
    other.fp_ = nullptr;
    return *this;
  }

  absl::StatusOr<std::string> Read() const { return ReadFile(fp_); }

  absl::Status Write(std::string_view const content) { return WriteFile(fp_, content); }

 private:
  static absl::StatusOr<File> OpenInternal(std::string const& path, std::string const& mode) {
    gsl::owner<FILE*> const fp = ::fopen(path.c_str(), mode.c_str());
    if (fp != nullptr) {
      return File(fp);
    } else {
      return absl::ErrnoToStatus(errno, absl::StrCat("fopen(\"", path, "\")"));
    }
  }

  explicit File(gsl::owner<FILE*> const fp) : fp_(fp) {}

  void MaybeClose() {
    if (fp_ != nullptr) {
      LOG_IF(ERROR, ::fclose(fp_) < 0) << absl::ErrnoToStatus(errno, "fclose");
    }
  }

  gsl::owner<FILE*> fp_;
};

// Creates all the missing directories of `path`, which must be a directory path.
absl::Status MakeDirectories(std::string_view const path) {
  std::string prefix;
  for (std::string_view const component : absl::StrSplit(path, '/')) {
    if (!prefix.empty() || absl::StartsWith(path, "/")) {
      prefix += '/';
    }
    prefix += component;
    if (component.empty() || component == "." || component == "..") {
      continue;
    }
    if (::mkdir(prefix.c_str(), 0755) < 0 && errno != EEXIST) {
      return absl::ErrnoToStatus(errno, absl::StrCat("mkdir(\"", prefix, "\")"));
    }
  }
  return absl::OkStatus();
}

// Returns the path of `input` relative to `--otel_source_root`, or `input` itself if it's outside.
std::string GetRelativePath(std::string_view const input) {
  std::string root = absl::GetFlag(FLAGS_otel_source_root);
  if (root.empty()) {
    return std::string(input);
  }
  if (!absl::EndsWith(root, "/")) {
    root += '/';
  }
  if (absl::StartsWith(input, root)) {
    return std::string(input.substr(root.size()));
  } else {
    return std::string(input);
  }
}

absl::Status GenerateHeader(std::string_view const input_path, std::string_view const source) {
  auto const relative_path = GetRelativePath(input_path);
  DEFINE_CONST_OR_RETURN(generator, Generator::Create(relative_path, source,
                                                      Generator::Options{
                                                          .include_path = relative_path,
                                                      }));
  LOG(INFO) << "deriving conversions for " << generator.derived_types().size() << " types";
  auto const content = generator.GenerateHeaderFileContent();
  auto const& output_directory = absl::GetFlag(FLAGS_otel_output_directory);
  auto const header_name = MakeHeaderFileName(relative_path);
  auto const file_path = output_directory.empty()
                             ? header_name
                             : absl::StrCat(output_directory, "/", header_name);
  auto const slash = file_path.rfind('/');
  if (slash != std::string::npos && slash > 0) {
    RETURN_IF_ERROR(MakeDirectories(std::string_view(file_path).substr(0, slash)));
  }
  LOG(INFO) << "writing " << file_path;
  DEFINE_VAR_OR_RETURN(header_file, File::Create(file_path));
  return header_file.Write(content);
}

absl::StatusOr<std::string> ReadSource(std::string const& input_path) {
  DEFINE_CONST_OR_RETURN(file, File::Open(input_path));
  return file.Read();
}

// Prints the diagnostic on stderr if the generation fails.
absl::Status ProcessFile(std::string const& input_path) {
  LOG(INFO) << "processing " << input_path;
  auto status_or_source = ReadSource(input_path);
  std::string_view source;
  absl::Status status = status_or_source.status();
  if (status.ok()) {
    source = status_or_source.value();
    status = GenerateHeader(input_path, source);
  }
  if (!status.ok()) {
    auto const message = FormatDiagnostic(input_path, source, status);
    ::fputs(message.c_str(), stderr);
  }
  return status;
}

absl::Status Run(std::vector<char*> const& inputs) {
  LOG(INFO) << "current working directory: " << ::get_current_dir_name();
  LOG(INFO) << "output directory: " << absl::GetFlag(FLAGS_otel_output_directory);
  if (inputs.empty()) {
    return absl::InvalidArgumentError("no input files");
  }
  size_t num_failures = 0;
  for (auto const input : inputs) {
    if (!ProcessFile(input).ok()) {
      ++num_failures;
    }
  }
  LOG(INFO) << "done";
  if (num_failures > 0) {
    return absl::InvalidArgumentError(
        absl::StrCat(num_failures, " of ", inputs.size(), " input files failed"));
  }
  return absl::OkStatus();
}

}  // namespace

int main(int const argc, char* argv[]) {
  absl::InitializeLog();
  auto const arguments = absl::ParseCommandLine(argc, argv);
  // The first positional argument is the program name.
  std::vector<char*> const inputs{arguments.begin() + 1, arguments.end()};
  auto const status = Run(inputs);
  if (!status.ok()) {
    std::string const message{status.message()};
    ::fprintf(stderr, "Error: %s\n", message.c_str());  // NOLINT
    return 1;
  }
  return 0;
}
