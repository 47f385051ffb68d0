#include "io/buffer.h"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

#include "absl/types/span.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "io/buffer_testing.h"

namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::wirepb::io::Buffer;
using ::wirepb::testing::io::BufferAsBytes;
using ::wirepb::testing::io::BufferAsString;

TEST(BufferTest, Empty) {
  Buffer buffer;
  EXPECT_EQ(buffer.capacity(), 0);
  EXPECT_EQ(buffer.size(), 0);
  EXPECT_TRUE(buffer.empty());
  EXPECT_EQ(buffer.as_byte_array(), nullptr);
  EXPECT_THAT(buffer.span(), IsEmpty());
}

TEST(BufferTest, Preallocated) {
  Buffer buffer{42};
  EXPECT_EQ(buffer.capacity(), 42);
  EXPECT_EQ(buffer.size(), 0);
  EXPECT_TRUE(buffer.empty());
  EXPECT_NE(buffer.as_byte_array(), nullptr);
}

TEST(BufferTest, CopyFromCaller) {
  uint8_t const data[] = {0x08, 0xAC, 0x02};
  Buffer buffer{data, sizeof(data)};
  EXPECT_EQ(buffer.capacity(), 3);
  EXPECT_EQ(buffer.size(), 3);
  EXPECT_NE(buffer.as_byte_array(), data);
  EXPECT_THAT(buffer, BufferAsBytes(ElementsAre(0x08, 0xAC, 0x02)));
}

TEST(BufferTest, CopyFromSpan) {
  uint8_t const data[] = {1, 2, 3, 4};
  Buffer buffer{absl::Span<uint8_t const>(data)};
  EXPECT_THAT(buffer, BufferAsBytes(ElementsAre(1, 2, 3, 4)));
}

TEST(BufferTest, Clone) {
  Buffer b1{10};
  b1.Append<uint8_t>(12);
  b1.Append<uint8_t>(34);
  Buffer const b2 = b1.Clone();
  EXPECT_NE(b1.as_byte_array(), b2.as_byte_array());
  EXPECT_EQ(b2.capacity(), 2);
  EXPECT_THAT(b2, BufferAsBytes(ElementsAre(12, 34)));
  EXPECT_EQ(b1, b2);
}

TEST(BufferTest, CloneEmpty) {
  Buffer const b1;
  Buffer const b2 = b1.Clone();
  EXPECT_TRUE(b2.empty());
  EXPECT_EQ(b1, b2);
}

TEST(BufferTest, Equality) {
  uint8_t const data1[] = {1, 2, 3};
  uint8_t const data2[] = {1, 2, 4};
  Buffer const b1{data1, sizeof(data1)};
  Buffer const b2{data1, sizeof(data1)};
  Buffer const b3{data2, sizeof(data2)};
  Buffer const b4{data1, 2};
  EXPECT_TRUE(b1 == b2);
  EXPECT_FALSE(b1 != b2);
  EXPECT_FALSE(b1 == b3);
  EXPECT_TRUE(b1 != b3);
  EXPECT_FALSE(b1 == b4);
  EXPECT_TRUE(b1 != b4);
}

TEST(BufferTest, EqualityIgnoresCapacity) {
  Buffer b1{10};
  b1.Append<uint8_t>(42);
  Buffer b2{1};
  b2.Append<uint8_t>(42);
  EXPECT_EQ(b1, b2);
}

TEST(BufferTest, MoveConstruct) {
  Buffer b1{10};
  b1.Append<uint8_t>(12);
  b1.Append<uint8_t>(34);
  auto const data = b1.as_byte_array();
  Buffer b2{std::move(b1)};
  EXPECT_EQ(b1.capacity(), 0);  // NOLINT(bugprone-use-after-move)
  EXPECT_TRUE(b1.empty());      // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(b2.capacity(), 10);
  EXPECT_EQ(b2.as_byte_array(), data);
  EXPECT_THAT(b2, BufferAsBytes(ElementsAre(12, 34)));
}

TEST(BufferTest, MoveAssign) {
  Buffer b1;
  {
    Buffer b2{5};
    b2.Append<uint8_t>(56);
    b1 = std::move(b2);
    EXPECT_TRUE(b2.empty());  // NOLINT(bugprone-use-after-move)
  }
  EXPECT_EQ(b1.capacity(), 5);
  EXPECT_THAT(b1, BufferAsBytes(ElementsAre(56)));
}

TEST(BufferTest, AppendWords) {
  Buffer buffer{7};
  buffer.Append<uint8_t>(0xAB);
  buffer.Append<uint16_t>(0x1234);
  buffer.Append<uint32_t>(0xDEADBEEF);
  EXPECT_EQ(buffer.size(), 7);
  EXPECT_EQ(buffer.span().front(), 0xAB);
}

TEST(BufferTest, AppendBuffer) {
  Buffer b1{4};
  b1.Append<uint8_t>(1);
  b1.Append<uint8_t>(2);
  Buffer b2{2};
  b2.Append<uint8_t>(3);
  b2.Append<uint8_t>(4);
  b1.Append(b2);
  EXPECT_THAT(b1, BufferAsBytes(ElementsAre(1, 2, 3, 4)));
  EXPECT_THAT(b2, BufferAsBytes(ElementsAre(3, 4)));
}

TEST(BufferDeathTest, WordAppendOverflow) {
  Buffer buffer{10};
  buffer.Append<uint64_t>(123);
  EXPECT_DEATH(buffer.Append<uint64_t>(456), _);
}

TEST(BufferDeathTest, BufferAppendOverflow) {
  Buffer b1{10};
  b1.Append<uint64_t>(12);
  Buffer b2{10};
  b2.Append<uint64_t>(34);
  EXPECT_DEATH(b1.Append(b2), _);
}

TEST(BufferTest, MemCpy) {
  std::string_view constexpr kData = "HELLO";
  Buffer buffer{20};
  buffer.MemCpy(kData.data(), kData.size());
  buffer.MemCpy(kData.data(), 2);
  EXPECT_EQ(buffer.capacity(), 20);
  EXPECT_THAT(buffer, BufferAsString("HELLOHE"));
}

TEST(BufferTest, Release) {
  Buffer buffer{8};
  buffer.Append<uint8_t>(7);
  auto const data = buffer.as_byte_array();
  uint8_t* const released = buffer.Release();
  EXPECT_EQ(released, data);
  EXPECT_EQ(released[0], 7);
  EXPECT_TRUE(buffer.empty());
  EXPECT_EQ(buffer.as_byte_array(), nullptr);
  delete[] released;
}

}  // namespace
