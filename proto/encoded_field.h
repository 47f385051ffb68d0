#ifndef __WIREPB_PROTO_ENCODED_FIELD_H__
#define __WIREPB_PROTO_ENCODED_FIELD_H__

#include <cstdint>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "io/buffer.h"
#include "proto/wire_format.h"

namespace wirepb {
namespace proto {

// One occurrence of a field exactly as it was read from the wire, before any type interpretation.
//
// The payload holds the bytes that followed the tag: the raw varint bytes for `kVarInt`, the 4 or 8
// little-endian bytes for the fixed types, and the varint length prefix followed by the data for
// `kLength`. Re-encoding a decoded field therefore reproduces the original bytes exactly.
//
// Encoded fields are immutable and move-only; `Clone` makes a deep copy.
class EncodedField {
 public:
  // Decodes a tag and the record that follows it.
  static absl::StatusOr<EncodedField> Decode(Decoder *decoder);

  explicit EncodedField(FieldTag const &tag, wirepb::io::Buffer payload)
      : tag_(tag), payload_(std::move(payload)) {}

  ~EncodedField() = default;

  EncodedField(EncodedField &&) noexcept = default;
  EncodedField &operator=(EncodedField &&) noexcept = default;

  EncodedField Clone() const { return EncodedField(tag_, payload_.Clone()); }

  friend bool operator==(EncodedField const &lhs, EncodedField const &rhs) {
    return lhs.tag_ == rhs.tag_ && lhs.payload_ == rhs.payload_;
  }

  friend bool operator!=(EncodedField const &lhs, EncodedField const &rhs) {
    return !(lhs == rhs);
  }

  FieldTag const &tag() const { return tag_; }
  uint64_t field_number() const { return tag_.field_number; }
  WireType wire_type() const { return tag_.wire_type; }

  absl::Span<uint8_t const> payload() const { return payload_.span(); }

  // Returns the data of a `kLength` record without its length prefix. Fails with an invalid wire
  // type error for any other wire type.
  absl::StatusOr<absl::Span<uint8_t const>> GetLengthDelimitedData() const;

  // Writes the tag and the payload verbatim.
  void Encode(Encoder *encoder) const;

 private:
  EncodedField(EncodedField const &) = delete;
  EncodedField &operator=(EncodedField const &) = delete;

  FieldTag tag_;
  wirepb::io::Buffer payload_;
};

}  // namespace proto
}  // namespace wirepb

#endif  // __WIREPB_PROTO_ENCODED_FIELD_H__
