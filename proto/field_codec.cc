#include "proto/field_codec.h"

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "proto/errors.h"
#include "proto/wire_format.h"

namespace wirepb {
namespace proto {
namespace internal {

absl::StatusOr<int32_t> Int32Traits::DecodeValue(Decoder *const decoder) {
  DEFINE_CONST_OR_RETURN(bits, decoder->DecodeVarInt());
  int64_t const high_bits = static_cast<int64_t>(bits) >> 32;
  if (high_bits != 0 && high_bits != -1) {
    return SchemaMismatchError(absl::StrCat("int32 value ", static_cast<int64_t>(bits),
                                            " out of range"));
  }
  return static_cast<int32_t>(bits);
}

absl::StatusOr<int64_t> Int64Traits::DecodeValue(Decoder *const decoder) {
  DEFINE_CONST_OR_RETURN(bits, decoder->DecodeVarInt());
  return static_cast<int64_t>(bits);
}

absl::StatusOr<uint32_t> UInt32Traits::DecodeValue(Decoder *const decoder) {
  DEFINE_CONST_OR_RETURN(value, decoder->DecodeVarInt());
  if (value > std::numeric_limits<uint32_t>::max()) {
    return SchemaMismatchError(absl::StrCat("uint32 value ", value, " out of range"));
  }
  return static_cast<uint32_t>(value);
}

absl::StatusOr<int32_t> SInt32Traits::DecodeValue(Decoder *const decoder) {
  DEFINE_CONST_OR_RETURN(value, decoder->DecodeVarInt());
  if (value > std::numeric_limits<uint32_t>::max()) {
    return SchemaMismatchError(absl::StrCat("sint32 value ", value, " out of range"));
  }
  auto const bits = static_cast<uint32_t>(value);
  return static_cast<int32_t>((bits >> 1) ^ (~(bits & 1) + 1));
}

absl::StatusOr<int64_t> SInt64Traits::DecodeValue(Decoder *const decoder) {
  DEFINE_CONST_OR_RETURN(bits, decoder->DecodeVarInt());
  return static_cast<int64_t>((bits >> 1) ^ (~(bits & 1) + 1));
}

absl::StatusOr<bool> BoolTraits::DecodeValue(Decoder *const decoder) {
  DEFINE_CONST_OR_RETURN(value, decoder->DecodeVarInt());
  return value != 0;
}

absl::StatusOr<int32_t> SFixed32Traits::DecodeValue(Decoder *const decoder) {
  DEFINE_CONST_OR_RETURN(value, decoder->DecodeFixed32());
  return static_cast<int32_t>(value);
}

absl::StatusOr<int64_t> SFixed64Traits::DecodeValue(Decoder *const decoder) {
  DEFINE_CONST_OR_RETURN(value, decoder->DecodeFixed64());
  return static_cast<int64_t>(value);
}

void FloatTraits::EncodeValue(float const value, Encoder *const encoder) {
  uint32_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  encoder->EncodeFixed32(bits);
}

absl::StatusOr<float> FloatTraits::DecodeValue(Decoder *const decoder) {
  DEFINE_CONST_OR_RETURN(bits, decoder->DecodeFixed32());
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

void DoubleTraits::EncodeValue(double const value, Encoder *const encoder) {
  uint64_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  encoder->EncodeFixed64(bits);
}

absl::StatusOr<double> DoubleTraits::DecodeValue(Decoder *const decoder) {
  DEFINE_CONST_OR_RETURN(bits, decoder->DecodeFixed64());
  double value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

void StringTraits::EncodeValue(std::string_view const value, Encoder *const encoder) {
  encoder->EncodeLengthDelimited(
      absl::Span<uint8_t const>(reinterpret_cast<uint8_t const *>(value.data()), value.size()));
}

absl::StatusOr<std::string> StringTraits::DecodeValue(Decoder *const decoder) {
  DEFINE_CONST_OR_RETURN(data, decoder->DecodeLengthDelimited());
  return std::string(reinterpret_cast<char const *>(data.data()), data.size());
}

absl::StatusOr<std::vector<uint8_t>> BytesTraits::DecodeValue(Decoder *const decoder) {
  DEFINE_CONST_OR_RETURN(data, decoder->DecodeLengthDelimited());
  return std::vector<uint8_t>(data.begin(), data.end());
}

}  // namespace internal
}  // namespace proto
}  // namespace wirepb
