#include "proto/encoded_field.h"

#include <cstdint>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "io/buffer.h"
#include "proto/errors.h"
#include "proto/wire_format.h"

namespace wirepb {
namespace proto {

absl::StatusOr<EncodedField> EncodedField::Decode(Decoder *const decoder) {
  DEFINE_CONST_OR_RETURN(tag, decoder->DecodeTag());
  DEFINE_CONST_OR_RETURN(payload, decoder->ReadRecordPayload(tag.wire_type));
  return EncodedField(tag, wirepb::io::Buffer(payload));
}

absl::StatusOr<absl::Span<uint8_t const>> EncodedField::GetLengthDelimitedData() const {
  if (tag_.wire_type != WireType::kLength) {
    return InvalidWireTypeError(absl::StrCat(WireTypeName(tag_.wire_type), " for field ",
                                             tag_.field_number, ", expected length-delimited"));
  }
  Decoder decoder{payload_.span()};
  return decoder.DecodeLengthDelimited();
}

void EncodedField::Encode(Encoder *const encoder) const {
  encoder->EncodeTag(tag_);
  encoder->EncodeRawBytes(payload_.span());
}

}  // namespace proto
}  // namespace wirepb
