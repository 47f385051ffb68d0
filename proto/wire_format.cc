#include "proto/wire_format.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>
#include <utility>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "io/buffer.h"
#include "proto/errors.h"

namespace wirepb {
namespace proto {

bool IsValidWireType(uint64_t const bits) {
  switch (bits) {
    case 0:
    case 1:
    case 2:
    case 5:
      return true;
    default:
      return false;
  }
}

std::string_view WireTypeName(WireType const wire_type) {
  switch (wire_type) {
    case WireType::kVarInt:
      return "varint";
    case WireType::kInt64:
      return "fixed64";
    case WireType::kLength:
      return "length-delimited";
    case WireType::kInt32:
      return "fixed32";
  }
  return "unknown";
}

size_t VarIntSize(uint64_t value) {
  size_t size = 1;
  while (value > 0x7F) {
    value >>= 7;
    ++size;
  }
  return size;
}

absl::StatusOr<uint64_t> Decoder::DecodeVarInt() {
  uint64_t value = 0;
  for (size_t i = 0; i < kMaxVarIntLength; ++i) {
    if (data_.empty()) {
      return TruncatedInputError("varint");
    }
    uint8_t const byte = data_.front();
    // The 10th group sits at bit 63, so it may only be 0 or 1 and must terminate the varint.
    if (i == kMaxVarIntLength - 1 && (byte & 0xFE) != 0) {
      return VarIntOverflowError();
    }
    data_.remove_prefix(1);
    value |= (uint64_t{byte} & 0x7FULL) << (7 * i);
    if ((byte & 0x80) == 0) {
      return value;
    }
  }
  return VarIntOverflowError();
}

absl::StatusOr<FieldTag> Decoder::DecodeTag() {
  DEFINE_CONST_OR_RETURN(tag, DecodeVarInt());
  uint64_t const wire_type = tag & 7;
  if (!IsValidWireType(wire_type)) {
    return InvalidWireTypeError(absl::StrCat(wire_type, " in tag"));
  }
  uint64_t const field_number = tag >> 3;
  if (field_number < 1 || field_number > kMaxFieldNumber) {
    return SchemaMismatchError(absl::StrCat("invalid field number ", field_number));
  }
  return FieldTag{
      .field_number = field_number,
      .wire_type = static_cast<WireType>(wire_type),
  };
}

absl::StatusOr<uint32_t> Decoder::DecodeFixed32() {
  if (data_.size() < 4) {
    return TruncatedInputError("fixed32 value");
  }
  uint32_t value;
  std::memcpy(&value, data_.data(), 4);
  data_.remove_prefix(4);
  return util::LittleEndian32(value);
}

absl::StatusOr<uint64_t> Decoder::DecodeFixed64() {
  if (data_.size() < 8) {
    return TruncatedInputError("fixed64 value");
  }
  uint64_t value;
  std::memcpy(&value, data_.data(), 8);
  data_.remove_prefix(8);
  return util::LittleEndian64(value);
}

absl::StatusOr<absl::Span<uint8_t const>> Decoder::ReadBytes(size_t const length) {
  if (data_.size() < length) {
    return TruncatedInputError(absl::StrCat(length, "-byte payload"));
  }
  auto const bytes = data_.subspan(0, length);
  data_.remove_prefix(length);
  return bytes;
}

absl::StatusOr<absl::Span<uint8_t const>> Decoder::DecodeLengthDelimited() {
  DEFINE_CONST_OR_RETURN(length, DecodeVarInt());
  if (data_.size() < length) {
    return TruncatedInputError(absl::StrCat(length, "-byte length-delimited payload"));
  }
  return ReadBytes(length);
}

absl::StatusOr<absl::Span<uint8_t const>> Decoder::ReadRecordPayload(WireType const wire_type) {
  auto const start = data_;
  switch (wire_type) {
    case WireType::kVarInt:
      RETURN_IF_ERROR(DecodeVarInt());
      break;
    case WireType::kInt64:
      RETURN_IF_ERROR(ReadBytes(8));
      break;
    case WireType::kLength:
      RETURN_IF_ERROR(DecodeLengthDelimited());
      break;
    case WireType::kInt32:
      RETURN_IF_ERROR(ReadBytes(4));
      break;
    default:
      return InvalidWireTypeError(absl::StrCat(util::to_underlying(wire_type), " in record"));
  }
  return start.subspan(0, start.size() - data_.size());
}

void Encoder::EncodeVarInt(uint64_t value) {
  wirepb::io::Buffer buffer{kMaxVarIntLength};
  while (value > 0x7F) {
    buffer.Append<uint8_t>(0x80 | static_cast<uint8_t>(value & 0x7F));
    value >>= 7;
  }
  buffer.Append<uint8_t>(value & 0x7F);
  cord_.Append(std::move(buffer));
}

void Encoder::EncodeTag(FieldTag const &tag) {
  CHECK_GE(tag.field_number, 1) << "invalid field number";
  CHECK_LE(tag.field_number, kMaxFieldNumber) << "invalid field number";
  EncodeVarInt((tag.field_number << 3) | static_cast<uint64_t>(tag.wire_type));
}

void Encoder::EncodeFixed32(uint32_t const value) {
  wirepb::io::Buffer buffer{4};
  buffer.Append<uint32_t>(util::LittleEndian32(value));
  cord_.Append(std::move(buffer));
}

void Encoder::EncodeFixed64(uint64_t const value) {
  wirepb::io::Buffer buffer{8};
  buffer.Append<uint64_t>(util::LittleEndian64(value));
  cord_.Append(std::move(buffer));
}

void Encoder::EncodeRawBytes(absl::Span<uint8_t const> const bytes) {
  cord_.Append(wirepb::io::Buffer{bytes});
}

void Encoder::EncodeLengthDelimited(absl::Span<uint8_t const> const bytes) {
  EncodeVarInt(bytes.size());
  EncodeRawBytes(bytes);
}

void Encoder::EncodeLengthDelimited(Encoder &&child_encoder) {
  EncodeVarInt(child_encoder.size());
  cord_.Append(std::move(child_encoder.cord_));
}

}  // namespace proto
}  // namespace wirepb
