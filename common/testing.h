#ifndef __WIREPB_COMMON_TESTING_H__
#define __WIREPB_COMMON_TESTING_H__

#include <ostream>
#include <type_traits>
#include <utility>

#include "absl/status/status.h"           // IWYU pragma: export
#include "absl/status/status_matchers.h"  // IWYU pragma: export
#include "absl/status/statusor.h"         // IWYU pragma: export
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace testing {

// GoogleTest's `Pointee` matcher doesn't work with smart pointers, so we deploy our own. Null
// pointers never match.
template <typename Pointer>
class Pointee2Impl : public MatcherInterface<Pointer const&> {
 public:
  using is_gtest_matcher = void;

  using Pointee = decltype(*std::declval<std::decay_t<Pointer>>());

  template <typename Inner>
  explicit Pointee2Impl(Inner&& inner)
      : inner_(SafeMatcherCast<Pointee>(std::forward<Inner>(inner))) {}

  ~Pointee2Impl() = default;

  void DescribeTo(std::ostream* const os) const override {
    *os << "points to a value that ";
    inner_.DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* const os) const override {
    *os << "is null or points to a value that ";
    inner_.DescribeNegationTo(os);
  }

  bool MatchAndExplain(Pointer const& value, MatchResultListener* const listener) const override {
    if (!value) {
      *listener << "is null";
      return false;
    }
    *listener << "points to a value that ";
    return inner_.MatchAndExplain(*value, listener);
  }

 private:
  Pointee2Impl(Pointee2Impl const&) = delete;
  Pointee2Impl& operator=(Pointee2Impl const&) = delete;
  Pointee2Impl(Pointee2Impl&&) = delete;
  Pointee2Impl& operator=(Pointee2Impl&&) = delete;

  Matcher<Pointee> inner_;
};

template <typename Inner>
class Pointee2 {
 public:
  explicit Pointee2(Inner inner) : inner_(std::move(inner)) {}

  template <typename Pointer>
  operator Matcher<Pointer>() const {  // NOLINT(google-explicit-constructor)
    return Matcher<Pointer>(new Pointee2Impl<std::decay_t<Pointer>>(inner_));
  }

 private:
  std::decay_t<Inner> inner_;
};

}  // namespace testing

// Macros for testing the results of functions that return absl::Status or absl::StatusOr<T> (for
// any type T).
#define EXPECT_OK(expression) EXPECT_THAT((expression), ::absl_testing::IsOk())
#define ASSERT_OK(expression) ASSERT_THAT((expression), ::absl_testing::IsOk())

#endif  // __WIREPB_COMMON_TESTING_H__
