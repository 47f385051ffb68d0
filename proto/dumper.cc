#include "proto/dumper.h"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "proto/encoded_field.h"
#include "proto/message.h"
#include "proto/wire_format.h"

namespace wirepb {
namespace proto {

namespace dumper {

absl::StatusOr<std::vector<uint8_t>> ReadFile(FILE* const fp) {
  std::vector<uint8_t> data;
  uint8_t chunk[4096];
  while (true) {
    size_t const length = ::fread(chunk, 1, sizeof(chunk), fp);
    data.insert(data.end(), chunk, chunk + length);
    if (length < sizeof(chunk)) {
      if (::ferror(fp) != 0) {
        return absl::ErrnoToStatus(errno, "fread");
      }
      break;
    }
  }
  return std::move(data);
}

std::string HexPreview(absl::Span<uint8_t const> const data, size_t const max_preview) {
  size_t const preview_size = std::min(data.size(), max_preview);
  std::string hex = absl::BytesToHexString(
      std::string_view(reinterpret_cast<char const*>(data.data()), preview_size));
  if (preview_size < data.size()) {
    absl::StrAppend(&hex, "...");
  }
  return hex;
}

absl::StatusOr<std::string> DescribeField(EncodedField const& field, size_t const max_preview) {
  std::string line =
      absl::StrCat("  field ", field.field_number(), " ", WireTypeName(field.wire_type()));
  Decoder decoder{field.payload()};
  switch (field.wire_type()) {
    case WireType::kVarInt: {
      DEFINE_CONST_OR_RETURN(value, decoder.DecodeVarInt());
      absl::StrAppend(&line, ": ", value);
    } break;
    case WireType::kInt64: {
      DEFINE_CONST_OR_RETURN(value, decoder.DecodeFixed64());
      absl::StrAppend(&line, ": ", value, " (0x", absl::Hex(value, absl::kZeroPad16), ")");
    } break;
    case WireType::kLength: {
      DEFINE_CONST_OR_RETURN(data, field.GetLengthDelimitedData());
      absl::StrAppend(&line, ", ", data.size(), " bytes");
      if (!data.empty()) {
        absl::StrAppend(&line, ": ", HexPreview(data, max_preview));
      }
    } break;
    case WireType::kInt32: {
      DEFINE_CONST_OR_RETURN(value, decoder.DecodeFixed32());
      absl::StrAppend(&line, ": ", value, " (0x", absl::Hex(value, absl::kZeroPad8), ")");
    } break;
  }
  return std::move(line);
}

}  // namespace dumper

absl::StatusOr<std::string> Dumper::Dump(absl::Span<uint8_t const> const data) const {
  std::string output;
  Decoder decoder{data};
  if (!options_.delimited) {
    Message message;
    RETURN_IF_ERROR(message.Decode(&decoder));
    RETURN_IF_ERROR(DumpMessage(/*index=*/0, /*offset=*/0, message, &output));
    return std::move(output);
  }
  size_t count = 0;
  while (!decoder.at_end()) {
    if (options_.max_messages > 0 && count >= options_.max_messages) {
      LOG(INFO) << "stopping after " << count << " messages";
      break;
    }
    size_t const offset = decoder.position();
    Message message;
    auto const status = message.DecodeDelimited(&decoder);
    if (!status.ok()) {
      LOG(ERROR) << "failed to decode message " << count << " at offset " << offset;
      return status;
    }
    RETURN_IF_ERROR(DumpMessage(count++, offset, message, &output));
  }
  LOG(INFO) << "decoded " << count << " messages";
  return std::move(output);
}

absl::Status Dumper::DumpMessage(size_t const index, size_t const offset, Message const& message,
                                 std::string* const output) const {
  absl::StrAppend(output, "message ", index, " at offset ", offset, "\n");
  for (auto const& [field_number, occurrences] : message.fields()) {
    for (auto const& field : occurrences) {
      DEFINE_CONST_OR_RETURN(line, dumper::DescribeField(field, options_.max_payload_preview));
      absl::StrAppend(output, line, "\n");
    }
  }
  return absl::OkStatus();
}

}  // namespace proto
}  // namespace wirepb
