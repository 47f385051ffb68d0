#ifndef __WIREPB_PROTO_MESSAGE_H__
#define __WIREPB_PROTO_MESSAGE_H__

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "io/buffer.h"
#include "proto/encoded_field.h"
#include "proto/errors.h"
#include "proto/field_codec.h"
#include "proto/wire_format.h"

namespace wirepb {
namespace proto {

// The unknown-field store of a message: every field occurrence that was decoded but not yet claimed
// by a typed accessor, grouped by field number and kept in wire order.
//
// Message types are plain classes that embed a `Message` and follow a fixed call sequence. A
// message type `M` provides:
//
//   absl::Status Decode(Decoder *decoder);  // decodes everything up to the end of `decoder`
//   void Encode(Encoder *encoder) const;
//
// Its `Decode` calls `Message::Decode` on a local store, claims each declared field from it in
// ascending field number order with the matching `DecodeUnknown*` accessor, and only then assigns
// the decoded values and moves the local store into place, so that a failed `Decode` leaves the
// object as it was. Its `Encode`
// writes each declared field with the matching codec or `EncodeMessageField` primitive and then
// calls `Message::Encode` for whatever was never claimed, so that unknown fields survive a
// round-trip. `Message` itself satisfies the same contract.
//
// Claiming is one-shot: a successful `DecodeUnknown*` call removes the occurrences from the store,
// so a second call for the same field number returns the default value. A failed call leaves the
// store untouched.
//
// Not thread-safe.
class Message {
 public:
  using FieldMap = absl::btree_map<uint64_t, std::vector<EncodedField>>;

  // Decodes a whole message from `data`.
  static absl::StatusOr<Message> Decode(absl::Span<uint8_t const> data);

  Message() = default;
  ~Message() = default;

  // Copies are deep.
  Message(Message const &other);
  Message &operator=(Message const &other);

  Message(Message &&) noexcept = default;
  Message &operator=(Message &&) noexcept = default;

  void swap(Message &other) noexcept { fields_.swap(other.fields_); }
  friend void swap(Message &lhs, Message &rhs) noexcept { lhs.swap(rhs); }

  friend bool operator==(Message const &lhs, Message const &rhs) {
    return lhs.fields_ == rhs.fields_;
  }

  friend bool operator!=(Message const &lhs, Message const &rhs) { return !(lhs == rhs); }

  [[nodiscard]] bool empty() const { return fields_.empty(); }

  // Number of distinct field numbers in the store.
  size_t num_fields() const { return fields_.size(); }

  // All unclaimed occurrences in ascending field number order.
  FieldMap const &fields() const { return fields_; }

  bool HasUnknownField(uint64_t const field_number) const {
    return fields_.contains(field_number);
  }

  // Clears the store and fills it with every record up to the end of `decoder`. On error the store
  // is left as it was.
  absl::Status Decode(Decoder *decoder);

  // Writes all unclaimed occurrences verbatim, in field number order and then wire order.
  void Encode(Encoder *encoder) const;

  wirepb::io::Buffer Encode() const;

  // Like `Encode` but prefixes the message with its size as a varint.
  void EncodeDelimited(Encoder *encoder) const;

  // Decodes a message framed by `EncodeDelimited`, leaving `decoder` right after the frame. Fails
  // with a truncated input error if the frame exceeds the input and with a schema mismatch if the
  // framed bytes don't decode.
  absl::Status DecodeDelimited(Decoder *decoder);

  // Appends deep copies of all occurrences of `other` to this store.
  void MergeFrom(Message const &other);

  void Clear() { fields_.clear(); }

  // Claims a singular scalar field. Returns the codec's default value if the field is absent.
  template <typename Traits>
  absl::StatusOr<typename FieldCodec<Traits>::Value> DecodeUnknownField(
      uint64_t const field_number, FieldCodec<Traits> const &codec) {
    auto const it = fields_.find(field_number);
    if (it == fields_.end()) {
      return codec.DefaultValue();
    }
    DEFINE_VAR_OR_RETURN(value, codec.DecodeField(it->second));
    fields_.erase(it);
    return std::move(value);
  }

  // Like `DecodeUnknownField` but returns an empty optional if the field is absent.
  template <typename Traits>
  absl::StatusOr<std::optional<typename FieldCodec<Traits>::Value>> DecodeUnknownOptionalField(
      uint64_t const field_number, FieldCodec<Traits> const &codec) {
    using Value = typename FieldCodec<Traits>::Value;
    if (!HasUnknownField(field_number)) {
      return std::optional<Value>();
    }
    DEFINE_VAR_OR_RETURN(value, DecodeUnknownField(field_number, codec));
    return std::optional<Value>(std::move(value));
  }

  // Claims a repeated scalar field, replacing the content of `values`. Packed and unpacked
  // occurrences may be mixed.
  template <typename Traits>
  absl::Status DecodeUnknownRepeatedField(
      uint64_t const field_number, FieldCodec<Traits> const &codec,
      std::vector<typename FieldCodec<Traits>::Value> *const values) {
    auto const it = fields_.find(field_number);
    if (it == fields_.end()) {
      values->clear();
      return absl::OkStatus();
    }
    std::vector<typename FieldCodec<Traits>::Value> decoded;
    RETURN_IF_ERROR(codec.DecodeRepeatedField(it->second, &decoded));
    *values = std::move(decoded);
    fields_.erase(it);
    return absl::OkStatus();
  }

  // Claims a singular embedded message field. Multiple occurrences are merged as if their payloads
  // were concatenated. Returns null if the field is absent.
  template <typename M>
  absl::StatusOr<std::unique_ptr<M>> DecodeUnknownMessageField(uint64_t const field_number) {
    auto const it = fields_.find(field_number);
    if (it == fields_.end()) {
      return std::unique_ptr<M>();
    }
    auto message = std::make_unique<M>();
    RETURN_IF_ERROR(DecodeEmbeddedMessage(it->second, message.get()));
    fields_.erase(it);
    return std::move(message);
  }

  // Like `DecodeUnknownMessageField` but stores the message inline.
  template <typename M>
  absl::StatusOr<std::optional<M>> DecodeUnknownOptionalMessageField(uint64_t const field_number) {
    auto const it = fields_.find(field_number);
    if (it == fields_.end()) {
      return std::optional<M>();
    }
    std::optional<M> message{std::in_place};
    RETURN_IF_ERROR(DecodeEmbeddedMessage(it->second, &message.value()));
    fields_.erase(it);
    return std::move(message);
  }

  // Claims a repeated embedded message field, replacing the content of `messages` with one element
  // per occurrence.
  template <typename M>
  absl::Status DecodeUnknownRepeatedMessageField(uint64_t const field_number,
                                                 std::vector<M> *const messages) {
    auto const it = fields_.find(field_number);
    if (it == fields_.end()) {
      messages->clear();
      return absl::OkStatus();
    }
    std::vector<M> decoded;
    decoded.reserve(it->second.size());
    for (auto const &field : it->second) {
      RETURN_IF_ERROR(
          DecodeEmbeddedMessage(absl::MakeConstSpan(&field, 1), &decoded.emplace_back()));
    }
    *messages = std::move(decoded);
    fields_.erase(it);
    return absl::OkStatus();
  }

 private:
  // Concatenates the data of all occurrences of a length-delimited field, without the prefixes.
  static absl::StatusOr<wirepb::io::Buffer> JoinLengthDelimitedData(
      absl::Span<EncodedField const> occurrences);

  static absl::Status EmbeddedMessageError(uint64_t field_number, absl::Status const &status);

  template <typename M>
  static absl::Status DecodeEmbeddedMessage(absl::Span<EncodedField const> const occurrences,
                                            M *const message) {
    DEFINE_CONST_OR_RETURN(data, JoinLengthDelimitedData(occurrences));
    Decoder decoder{data.span()};
    auto const status = message->Decode(&decoder);
    if (!status.ok()) {
      return EmbeddedMessageError(occurrences.front().field_number(), status);
    }
    return absl::OkStatus();
  }

  FieldMap fields_;
};

// Writes `message` as a length-delimited field. The message is encoded into a child encoder first
// so that its size is known before the prefix is written.
template <typename M>
void EncodeMessageField(uint64_t const field_number, M const &message, Encoder *const encoder) {
  Encoder child;
  message.Encode(&child);
  encoder->EncodeTag(FieldTag{.field_number = field_number, .wire_type = WireType::kLength});
  encoder->EncodeLengthDelimited(std::move(child));
}

// Writes nothing if `message` is null.
template <typename M>
void EncodeMessageField(uint64_t const field_number, std::unique_ptr<M> const &message,
                        Encoder *const encoder) {
  if (message) {
    EncodeMessageField(field_number, *message, encoder);
  }
}

// Writes nothing if `message` is empty.
template <typename M>
void EncodeMessageField(uint64_t const field_number, std::optional<M> const &message,
                        Encoder *const encoder) {
  if (message.has_value()) {
    EncodeMessageField(field_number, message.value(), encoder);
  }
}

// Writes one length-delimited record per element of `messages`, which must be an iterable container
// of message types. Messages are never packed.
template <typename Container>
void EncodeRepeatedMessageField(uint64_t const field_number, Container const &messages,
                                Encoder *const encoder) {
  for (auto const &message : messages) {
    EncodeMessageField(field_number, message, encoder);
  }
}

// Writes `message` prefixed by its size as a varint, for framing messages on a stream.
template <typename M>
void EncodeDelimited(M const &message, Encoder *const encoder) {
  Encoder child;
  message.Encode(&child);
  encoder->EncodeLengthDelimited(std::move(child));
}

// Decodes one message framed by `EncodeDelimited`, replacing the content of `message`.
template <typename M>
absl::Status DecodeDelimited(Decoder *const decoder, M *const message) {
  DEFINE_CONST_OR_RETURN(length, decoder->DecodeVarInt());
  if (decoder->remaining() < length) {
    return TruncatedInputError(absl::StrCat(length, "-byte delimited message"));
  }
  DEFINE_CONST_OR_RETURN(data, decoder->ReadBytes(length));
  Decoder child{data};
  auto const status = message->Decode(&child);
  if (!status.ok()) {
    return SchemaMismatchError(absl::StrCat("delimited message: ", status.message()));
  }
  return absl::OkStatus();
}

}  // namespace proto
}  // namespace wirepb

#endif  // __WIREPB_PROTO_MESSAGE_H__
