#ifndef __WIREPB_COMMON_UTILITIES_H__
#define __WIREPB_COMMON_UTILITIES_H__

#include <cstdint>
#include <type_traits>
#include <utility>  // IWYU pragma: keep

#include "absl/base/config.h"  // IWYU pragma: keep
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// See https://clang.llvm.org/extra/clang-tidy/checks/cppcoreguidelines/owning-memory.html.
namespace gsl {
template <typename T, std::enable_if_t<std::is_pointer_v<T>, bool> = true>
using owner = T;
}  // namespace gsl

namespace wirepb {
namespace util {

// Same as `std::to_underlying`, which is only available in C++23.
template <typename Enum>
auto to_underlying(Enum const value) {
  return static_cast<std::underlying_type_t<Enum>>(value);
}

// Converts between host byte order and the little-endian order used by the fixed-width wire
// types. No-ops on little-endian hosts.
inline uint32_t LittleEndian32(uint32_t const value) {
#ifdef ABSL_IS_BIG_ENDIAN
  return ((value >> 24) & 0x000000FF) | ((value >> 8) & 0x0000FF00) | ((value << 8) & 0x00FF0000) |
         ((value << 24) & 0xFF000000);
#else   // ABSL_IS_BIG_ENDIAN
  return value;
#endif  // ABSL_IS_BIG_ENDIAN
}

inline uint64_t LittleEndian64(uint64_t const value) {
#ifdef ABSL_IS_BIG_ENDIAN
  return ((value >> 56) & 0x00000000000000FF) | ((value >> 40) & 0x000000000000FF00) |
         ((value >> 24) & 0x0000000000FF0000) | ((value >> 8) & 0x00000000FF000000) |
         ((value << 8) & 0x000000FF00000000) | ((value << 24) & 0x0000FF0000000000) |
         ((value << 40) & 0x00FF000000000000) | ((value << 56) & 0xFF00000000000000);
#else   // ABSL_IS_BIG_ENDIAN
  return value;
#endif  // ABSL_IS_BIG_ENDIAN
}

namespace internal {

inline absl::Status ReturnIfError_GetStatus(absl::Status const& status) { return status; }

template <typename T>
inline absl::Status ReturnIfError_GetStatus(absl::StatusOr<T> const& status_or) {
  return status_or.status();
}

}  // namespace internal

}  // namespace util
}  // namespace wirepb

// Evaluates an expression returning `absl::Status` or `absl::StatusOr` and returns the error
// status from the enclosing function if it's not OK. The value of an OK `absl::StatusOr` is
// discarded.
//
// Example:
//
//   absl::Status DecodeBoth(Decoder* const decoder) {
//     RETURN_IF_ERROR(first.Decode(decoder));
//     RETURN_IF_ERROR(second.Decode(decoder));
//     return absl::OkStatus();
//   }
#define RETURN_IF_ERROR(expression)                                     \
  do {                                                                  \
    auto status = (expression);                                         \
    if (!status.ok()) {                                                 \
      return ::wirepb::util::internal::ReturnIfError_GetStatus(status); \
    }                                                                   \
  } while (false)

// Evaluates an expression returning `absl::StatusOr` and binds the wrapped value to a new mutable
// reference called `name`, or returns the error status from the enclosing function.
//
// Example:
//
//   DEFINE_VAR_OR_RETURN(tag, decoder->DecodeTag());
//   tag.field_number += 1;
//
// NOTE: this macro also defines an intermediate variable called `status_or_##name`.
#define DEFINE_VAR_OR_RETURN(name, expression)   \
  auto status_or_##name = (expression);          \
  if (!(status_or_##name).ok()) {                \
    return std::move(status_or_##name).status(); \
  }                                              \
  auto& name = status_or_##name.value();

// Like `DEFINE_VAR_OR_RETURN` but the resulting variable is const.
#define DEFINE_CONST_OR_RETURN(name, expression) \
  auto status_or_##name = (expression);          \
  if (!(status_or_##name).ok()) {                \
    return std::move(status_or_##name).status(); \
  }                                              \
  auto const& name = status_or_##name.value();

#endif  // __WIREPB_COMMON_UTILITIES_H__
