#include "proto/dumper.h"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/status_matchers.h"
#include "absl/types/span.h"
#include "common/testing.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "proto/encoded_field.h"
#include "proto/wire_format.h"

namespace {

using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;
using ::testing::SizeIs;
using ::wirepb::proto::Decoder;
using ::wirepb::proto::Dumper;
using ::wirepb::proto::EncodedField;
using ::wirepb::proto::dumper::DescribeField;
using ::wirepb::proto::dumper::HexPreview;
using ::wirepb::proto::dumper::ReadFile;

EncodedField DecodeOne(absl::Span<uint8_t const> const data) {
  Decoder decoder{data};
  auto status_or_field = EncodedField::Decode(&decoder);
  CHECK_OK(status_or_field.status());
  return std::move(status_or_field).value();
}

TEST(DumperTest, HexPreview) {
  std::vector<uint8_t> const data{0xDE, 0xAD, 0xBE, 0xEF};
  EXPECT_EQ(HexPreview(data, 16), "deadbeef");
  EXPECT_EQ(HexPreview(data, 4), "deadbeef");
  EXPECT_EQ(HexPreview(data, 2), "dead...");
  EXPECT_EQ(HexPreview(data, 0), "...");
}

TEST(DumperTest, DescribeVarInt) {
  std::vector<uint8_t> const data{0x08, 0x96, 0x01};
  EXPECT_THAT(DescribeField(DecodeOne(data), 16), IsOkAndHolds("  field 1 varint: 150"));
}

TEST(DumperTest, DescribeFixed32) {
  std::vector<uint8_t> const data{0x15, 0x78, 0x56, 0x34, 0x12};
  EXPECT_THAT(DescribeField(DecodeOne(data), 16),
              IsOkAndHolds("  field 2 fixed32: 305419896 (0x12345678)"));
}

TEST(DumperTest, DescribeFixed64) {
  std::vector<uint8_t> const data{0x19, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
  EXPECT_THAT(DescribeField(DecodeOne(data), 16),
              IsOkAndHolds("  field 3 fixed64: 1 (0x0000000000000001)"));
}

TEST(DumperTest, DescribeLengthDelimited) {
  std::vector<uint8_t> const data{0x22, 0x03, 0x61, 0x62, 0x63};
  EXPECT_THAT(DescribeField(DecodeOne(data), 16),
              IsOkAndHolds("  field 4 length-delimited, 3 bytes: 616263"));
}

TEST(DumperTest, DescribeTruncatedPreview) {
  std::vector<uint8_t> const data{0x22, 0x03, 0x61, 0x62, 0x63};
  EXPECT_THAT(DescribeField(DecodeOne(data), 2),
              IsOkAndHolds("  field 4 length-delimited, 3 bytes: 6162..."));
}

TEST(DumperTest, DescribeEmptyLengthDelimited) {
  std::vector<uint8_t> const data{0x2A, 0x00};
  EXPECT_THAT(DescribeField(DecodeOne(data), 16),
              IsOkAndHolds("  field 5 length-delimited, 0 bytes"));
}

TEST(DumperTest, DumpMessage) {
  std::vector<uint8_t> const data{
      0x2A, 0x00,                    // field 5, empty
      0x08, 0x96, 0x01,              // field 1, 150
      0x15, 0x78, 0x56, 0x34, 0x12,  // field 2, 0x12345678
      0x08, 0x07,                    // field 1, 7
  };
  Dumper const dumper{Dumper::Options{}};
  EXPECT_THAT(dumper.Dump(data), IsOkAndHolds("message 0 at offset 0\n"
                                              "  field 1 varint: 150\n"
                                              "  field 1 varint: 7\n"
                                              "  field 2 fixed32: 305419896 (0x12345678)\n"
                                              "  field 5 length-delimited, 0 bytes\n"));
}

TEST(DumperTest, DumpEmptyMessage) {
  Dumper const dumper{Dumper::Options{}};
  EXPECT_THAT(dumper.Dump({}), IsOkAndHolds("message 0 at offset 0\n"));
}

TEST(DumperTest, DumpTruncatedMessage) {
  std::vector<uint8_t> const data{0x08, 0x96};
  Dumper const dumper{Dumper::Options{}};
  EXPECT_THAT(dumper.Dump(data), StatusIs(absl::StatusCode::kOutOfRange));
}

TEST(DumperTest, DumpDelimitedStream) {
  std::vector<uint8_t> const data{0x02, 0x08, 0x01, 0x00, 0x02, 0x08, 0x02};
  Dumper const dumper{Dumper::Options{.delimited = true}};
  EXPECT_THAT(dumper.Dump(data), IsOkAndHolds("message 0 at offset 0\n"
                                              "  field 1 varint: 1\n"
                                              "message 1 at offset 3\n"
                                              "message 2 at offset 4\n"
                                              "  field 1 varint: 2\n"));
}

TEST(DumperTest, MaxMessagesCutsStreamShort) {
  std::vector<uint8_t> const data{0x02, 0x08, 0x01, 0x02, 0x08, 0x02, 0x02, 0x08, 0x03};
  Dumper const dumper{Dumper::Options{.delimited = true, .max_messages = 2}};
  EXPECT_THAT(dumper.Dump(data), IsOkAndHolds("message 0 at offset 0\n"
                                              "  field 1 varint: 1\n"
                                              "message 1 at offset 3\n"
                                              "  field 1 varint: 2\n"));
}

TEST(DumperTest, DelimitedFrameLongerThanInput) {
  std::vector<uint8_t> const data{0x02, 0x08, 0x01, 0x05, 0x08};
  Dumper const dumper{Dumper::Options{.delimited = true}};
  EXPECT_THAT(dumper.Dump(data), StatusIs(absl::StatusCode::kOutOfRange));
}

TEST(DumperTest, ReadFile) {
  FILE* const fp = ::tmpfile();
  ASSERT_NE(fp, nullptr);
  std::vector<uint8_t> data(10000);
  for (size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<uint8_t>(i * 7);
  }
  ASSERT_EQ(::fwrite(data.data(), 1, data.size(), fp), data.size());
  ::rewind(fp);
  auto const status_or_data = ReadFile(fp);
  ::fclose(fp);
  ASSERT_OK(status_or_data);
  EXPECT_THAT(status_or_data.value(), SizeIs(data.size()));
  EXPECT_EQ(status_or_data.value(), data);
}

}  // namespace
