#include "proto/message.h"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "io/buffer.h"
#include "proto/encoded_field.h"
#include "proto/errors.h"
#include "proto/wire_format.h"

namespace wirepb {
namespace proto {

absl::StatusOr<Message> Message::Decode(absl::Span<uint8_t const> const data) {
  Message message;
  Decoder decoder{data};
  RETURN_IF_ERROR(message.Decode(&decoder));
  return std::move(message);
}

Message::Message(Message const &other) {
  for (auto const &[field_number, occurrences] : other.fields_) {
    auto &copies = fields_[field_number];
    copies.reserve(occurrences.size());
    for (auto const &field : occurrences) {
      copies.emplace_back(field.Clone());
    }
  }
}

Message &Message::operator=(Message const &other) {
  if (this != &other) {
    Message copy{other};
    swap(copy);
  }
  return *this;
}

absl::Status Message::Decode(Decoder *const decoder) {
  FieldMap fields;
  while (!decoder->at_end()) {
    DEFINE_VAR_OR_RETURN(field, EncodedField::Decode(decoder));
    auto const field_number = field.field_number();
    fields[field_number].emplace_back(std::move(field));
  }
  fields_ = std::move(fields);
  return absl::OkStatus();
}

void Message::Encode(Encoder *const encoder) const {
  for (auto const &[field_number, occurrences] : fields_) {
    for (auto const &field : occurrences) {
      field.Encode(encoder);
    }
  }
}

wirepb::io::Buffer Message::Encode() const {
  Encoder encoder;
  Encode(&encoder);
  return std::move(encoder).Flatten();
}

void Message::EncodeDelimited(Encoder *const encoder) const {
  proto::EncodeDelimited(*this, encoder);
}

absl::Status Message::DecodeDelimited(Decoder *const decoder) {
  return proto::DecodeDelimited(decoder, this);
}

void Message::MergeFrom(Message const &other) {
  if (this == &other) {
    Message const copy{other};
    MergeFrom(copy);
    return;
  }
  for (auto const &[field_number, occurrences] : other.fields_) {
    auto &dest = fields_[field_number];
    dest.reserve(dest.size() + occurrences.size());
    for (auto const &field : occurrences) {
      dest.emplace_back(field.Clone());
    }
  }
}

absl::StatusOr<wirepb::io::Buffer> Message::JoinLengthDelimitedData(
    absl::Span<EncodedField const> const occurrences) {
  std::vector<absl::Span<uint8_t const>> parts;
  parts.reserve(occurrences.size());
  size_t total_size = 0;
  for (auto const &field : occurrences) {
    DEFINE_CONST_OR_RETURN(data, field.GetLengthDelimitedData());
    parts.emplace_back(data);
    total_size += data.size();
  }
  wirepb::io::Buffer buffer{total_size};
  for (auto const part : parts) {
    buffer.MemCpy(part.data(), part.size());
  }
  return std::move(buffer);
}

absl::Status Message::EmbeddedMessageError(uint64_t const field_number,
                                           absl::Status const &status) {
  return SchemaMismatchError(
      absl::StrCat("embedded message in field ", field_number, ": ", status.message()));
}

}  // namespace proto
}  // namespace wirepb
