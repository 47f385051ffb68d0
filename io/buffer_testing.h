#ifndef __WIREPB_IO_BUFFER_TESTING_H__
#define __WIREPB_IO_BUFFER_TESTING_H__

#include <cstdint>
#include <ostream>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/types/span.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "io/buffer.h"

namespace wirepb {
namespace testing {
namespace io {

// Matches a `Buffer` whose bytes, as an `absl::Span<uint8_t const>`, match `inner`. Typically used
// with `ElementsAre` to spell out expected wire bytes:
//
//   EXPECT_THAT(std::move(encoder).Flatten(), BufferAsBytes(ElementsAre(0x08, 0xAC, 0x02)));
template <typename Inner>
class BufferAsBytesMatcher : public ::testing::MatcherInterface<wirepb::io::Buffer const&> {
 public:
  using is_gtest_matcher = void;

  explicit BufferAsBytesMatcher(Inner inner) : inner_(std::move(inner)) {}

  void DescribeTo(std::ostream* const os) const override {
    *os << "is a buffer whose bytes ";
    ::testing::SafeMatcherCast<absl::Span<uint8_t const>>(inner_).DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* const os) const override {
    *os << "is a buffer whose bytes ";
    ::testing::SafeMatcherCast<absl::Span<uint8_t const>>(inner_).DescribeNegationTo(os);
  }

  bool MatchAndExplain(wirepb::io::Buffer const& buffer,
                       ::testing::MatchResultListener* const listener) const override {
    *listener << "whose bytes ";
    return ::testing::SafeMatcherCast<absl::Span<uint8_t const>>(inner_).MatchAndExplain(
        buffer.span(), listener);
  }

 private:
  Inner inner_;
};

template <typename Inner>
BufferAsBytesMatcher<Inner> BufferAsBytes(Inner inner) {
  return BufferAsBytesMatcher<Inner>(std::move(inner));
}

template <typename Inner>
class BufferAsStringMatcher : public ::testing::MatcherInterface<wirepb::io::Buffer const&> {
 public:
  using is_gtest_matcher = void;

  explicit BufferAsStringMatcher(Inner inner) : inner_(std::move(inner)) {}

  void DescribeTo(std::ostream* const os) const override {
    *os << "is a buffer containing a string that ";
    ::testing::SafeMatcherCast<std::string_view>(inner_).DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* const os) const override {
    *os << "is a buffer containing a string that ";
    ::testing::SafeMatcherCast<std::string_view>(inner_).DescribeNegationTo(os);
  }

  bool MatchAndExplain(wirepb::io::Buffer const& buffer,
                       ::testing::MatchResultListener* const listener) const override {
    *listener << "containing a string that ";
    return ::testing::SafeMatcherCast<std::string_view>(inner_).MatchAndExplain(
        std::string_view(buffer.as_char_array(), buffer.size()), listener);
  }

 private:
  Inner inner_;
};

template <typename Inner>
BufferAsStringMatcher<Inner> BufferAsString(Inner inner) {
  return BufferAsStringMatcher<Inner>(std::move(inner));
}

// Copies the bytes of a buffer into a vector, for feeding encoder output back into a decoder.
inline std::vector<uint8_t> BufferBytes(wirepb::io::Buffer const& buffer) {
  auto const span = buffer.span();
  return std::vector<uint8_t>(span.begin(), span.end());
}

}  // namespace io
}  // namespace testing
}  // namespace wirepb

#endif  // __WIREPB_IO_BUFFER_TESTING_H__
