#ifndef __OTEL_DERIVE_COMMON_UTILITIES_H__
#define __OTEL_DERIVE_COMMON_UTILITIES_H__

#include <type_traits>
#include <utility>  // IWYU pragma: keep

#include "absl/status/status.h"
#include "absl/status/statusor.h"

// See https://clang.llvm.org/extra/clang-tidy/checks/cppcoreguidelines/owning-memory.html.
namespace gsl {
template <typename T, std::enable_if_t<std::is_pointer_v<T>, bool> = true>
using owner = T;
}  // namespace gsl

namespace otel_derive {
namespace util {

// Like `std::is_integral` but excludes booleans.
template <typename Type>
using IsIntegralStrict =
    std::conjunction<std::is_integral<Type>, std::negation<std::is_same<Type, bool>>>;

// Like `std::is_integral_v` but excludes booleans.
template <typename Type>
inline bool constexpr IsIntegralStrictV = IsIntegralStrict<Type>::value;

namespace internal {

inline absl::Status ReturnIfError_GetStatus(absl::Status const& status) { return status; }

template <typename T>
inline absl::Status ReturnIfError_GetStatus(absl::StatusOr<T> const& status_or) {
  return status_or.status();
}

}  // namespace internal

}  // namespace util
}  // namespace otel_derive

// Evaluates an expression returning `absl::Status` or `absl::StatusOr` and returns the error status
// from the enclosing function if it's not OK. The value wrapped in an OK `absl::StatusOr` is
// discarded.
//
// Example:
//
//   absl::Status Lex();
//   absl::Status Scan();
//
//   absl::Status Run() {
//     RETURN_IF_ERROR(Lex());
//     RETURN_IF_ERROR(Scan());
//     return absl::OkStatus();
//   }
#define RETURN_IF_ERROR(expression)                                          \
  do {                                                                       \
    auto status = (expression);                                              \
    if (!status.ok()) {                                                      \
      return ::otel_derive::util::internal::ReturnIfError_GetStatus(status); \
    }                                                                        \
  } while (false)

// Evaluates `expression`, which must return an `absl::StatusOr`, and binds the wrapped value to a
// new mutable reference called `name`. Returns the error status from the enclosing function if the
// result is not OK.
//
// Example:
//
//   absl::StatusOr<Token> NextToken();
//
//   absl::Status Consume() {
//     DEFINE_VAR_OR_RETURN(token, NextToken());
//     Use(std::move(token));
//     return absl::OkStatus();
//   }
//
// NOTE: the macro also defines an intermediate variable called `status_or_##name`.
#define DEFINE_VAR_OR_RETURN(name, expression)   \
  auto status_or_##name = (expression);          \
  if (!(status_or_##name).ok()) {                \
    return std::move(status_or_##name).status(); \
  }                                              \
  auto& name = status_or_##name.value();

// Like `DEFINE_VAR_OR_RETURN` but the resulting reference is const.
#define DEFINE_CONST_OR_RETURN(name, expression) \
  auto status_or_##name = (expression);          \
  if (!(status_or_##name).ok()) {                \
    return std::move(status_or_##name).status(); \
  }                                              \
  auto const& name = status_or_##name.value();

#endif  // __OTEL_DERIVE_COMMON_UTILITIES_H__
