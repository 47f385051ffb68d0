#ifndef __WIREPB_PROTO_WIRE_FORMAT_H__
#define __WIREPB_PROTO_WIRE_FORMAT_H__

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <tuple>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "io/buffer.h"
#include "io/cord.h"

namespace wirepb {
namespace proto {

// The 3-bit framing code of a record. The deprecated group codes 3 and 4 as well as 6 and 7 are
// not defined and are rejected by `Decoder::DecodeTag`.
enum class WireType : uint8_t {
  kVarInt = 0,
  kInt64 = 1,
  kLength = 2,
  kInt32 = 5,
};

// Largest field number allowed by the protobuf language.
inline uint64_t constexpr kMaxFieldNumber = (uint64_t{1} << 29) - 1;

// Longest encoding of a 64-bit varint.
inline size_t constexpr kMaxVarIntLength = 10;

// True iff `bits` is the code of a defined wire type.
bool IsValidWireType(uint64_t bits);

std::string_view WireTypeName(WireType wire_type);

struct FieldTag {
  auto tie() const { return std::tie(field_number, wire_type); }

  friend bool operator==(FieldTag const &lhs, FieldTag const &rhs) {
    return lhs.tie() == rhs.tie();
  }

  friend bool operator!=(FieldTag const &lhs, FieldTag const &rhs) {
    return lhs.tie() != rhs.tie();
  }

  friend bool operator<(FieldTag const &lhs, FieldTag const &rhs) { return lhs.tie() < rhs.tie(); }

  friend bool operator<=(FieldTag const &lhs, FieldTag const &rhs) {
    return lhs.tie() <= rhs.tie();
  }

  friend bool operator>(FieldTag const &lhs, FieldTag const &rhs) { return lhs.tie() > rhs.tie(); }

  friend bool operator>=(FieldTag const &lhs, FieldTag const &rhs) {
    return lhs.tie() >= rhs.tie();
  }

  uint64_t field_number;
  WireType wire_type;
};

// Returns the number of bytes of the varint encoding of `value`.
size_t VarIntSize(uint64_t value);

// Reads wire-format data from a contiguous byte span. Every successful call consumes the bytes it
// decoded; on error the position is unspecified and the decoder should be discarded.
class Decoder {
 public:
  explicit Decoder(absl::Span<uint8_t const> const data) : data_(data), size_(data.size()) {}

  ~Decoder() = default;

  Decoder(Decoder const &) = delete;
  Decoder &operator=(Decoder const &) = delete;

  Decoder(Decoder &&) noexcept = default;
  Decoder &operator=(Decoder &&) noexcept = default;

  size_t remaining() const { return data_.size(); }
  bool at_end() const { return data_.empty(); }

  // Number of bytes consumed so far.
  size_t position() const { return size_ - data_.size(); }

  // Decodes an unsigned base-128 varint. At most `kMaxVarIntLength` groups are accepted, and the
  // last one may only carry the 64th bit.
  absl::StatusOr<uint64_t> DecodeVarInt();

  // Decodes a varint tag and splits it into field number and wire type. Fails with an invalid wire
  // type error for undefined wire type codes and with a schema mismatch for field numbers outside
  // [1, kMaxFieldNumber].
  absl::StatusOr<FieldTag> DecodeTag();

  // Fixed-width values are stored in little-endian order.
  absl::StatusOr<uint32_t> DecodeFixed32();
  absl::StatusOr<uint64_t> DecodeFixed64();

  // Consumes exactly `length` bytes.
  absl::StatusOr<absl::Span<uint8_t const>> ReadBytes(size_t length);

  // Decodes a varint length prefix and consumes that many bytes, returning them without the
  // prefix.
  absl::StatusOr<absl::Span<uint8_t const>> DecodeLengthDelimited();

  // Consumes the payload of a record whose tag has already been decoded and returns its raw bytes
  // exactly as they appear on the wire. For `kLength` records the varint length prefix is part of
  // the returned bytes.
  absl::StatusOr<absl::Span<uint8_t const>> ReadRecordPayload(WireType wire_type);

 private:
  absl::Span<uint8_t const> data_;
  size_t size_;
};

// Writes wire-format data to a `Cord`. Length-delimited payloads are encoded with a separate child
// encoder and spliced in by `EncodeLengthDelimited`, which is how their size becomes known before
// the prefix is written.
class Encoder {
 public:
  explicit Encoder() = default;
  ~Encoder() = default;

  Encoder(Encoder const &) = delete;
  Encoder &operator=(Encoder const &) = delete;

  Encoder(Encoder &&) noexcept = default;
  Encoder &operator=(Encoder &&) noexcept = default;

  [[nodiscard]] bool empty() const { return cord_.empty(); }
  size_t size() const { return cord_.size(); }

  void EncodeVarInt(uint64_t value);

  // Check-fails if the field number is outside [1, kMaxFieldNumber].
  void EncodeTag(FieldTag const &tag);

  void EncodeFixed32(uint32_t value);
  void EncodeFixed64(uint64_t value);

  // Appends `bytes` verbatim, without any prefix.
  void EncodeRawBytes(absl::Span<uint8_t const> bytes);

  // Appends a varint length prefix followed by `bytes`.
  void EncodeLengthDelimited(absl::Span<uint8_t const> bytes);

  // Appends a varint length prefix followed by everything `child_encoder` wrote.
  void EncodeLengthDelimited(Encoder &&child_encoder);

  wirepb::io::Cord Finish() && { return std::move(cord_); }
  wirepb::io::Buffer Flatten() && { return std::move(cord_).Flatten(); }

 private:
  wirepb::io::Cord cord_;
};

}  // namespace proto
}  // namespace wirepb

#endif  // __WIREPB_PROTO_WIRE_FORMAT_H__
