#include "telemetry/value.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace otel_derive {
namespace telemetry {

namespace {

struct ArrayFormatter {
  void operator()(std::string* const out, bool const value) const {
    absl::StrAppend(out, value ? "true" : "false");
  }

  void operator()(std::string* const out, int64_t const value) const {
    absl::StrAppend(out, value);
  }

  void operator()(std::string* const out, double const value) const {
    absl::StrAppend(out, value);
  }

  void operator()(std::string* const out, StringValue const& value) const {
    absl::StrAppend(out, "\"", absl::CEscape(value.AsString()), "\"");
  }
};

}  // namespace

std::string Array::AsString() const {
  return std::visit(
      [](auto const& values) {
        return absl::StrCat("[", absl::StrJoin(values, ",", ArrayFormatter()), "]");
      },
      values_);
}

std::string Value::AsString() const {
  struct Visitor {
    std::string operator()(bool const value) const { return value ? "true" : "false"; }
    std::string operator()(int64_t const value) const { return absl::StrCat(value); }
    std::string operator()(double const value) const { return absl::StrCat(value); }
    std::string operator()(StringValue const& value) const { return std::string(value.AsString()); }
    std::string operator()(Array const& value) const { return value.AsString(); }
  };
  return std::visit(Visitor(), value_);
}

}  // namespace telemetry
}  // namespace otel_derive
