#ifndef __WIREPB_PROTO_FIELD_CODEC_H__
#define __WIREPB_PROTO_FIELD_CODEC_H__

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "proto/encoded_field.h"
#include "proto/errors.h"
#include "proto/wire_format.h"

namespace wirepb {
namespace proto {

namespace internal {

// Each traits struct describes how one protobuf scalar type is laid out on the wire. Members:
//
//   * `Value`: the C++ type of the field;
//   * `kName`: the protobuf type name, used in error messages;
//   * `kWireType`: the natural (unpacked) wire type;
//   * `kPackable`: whether repeated fields of this type use the packed encoding;
//   * `kFixedSize`: width in bytes of each packed element for the fixed types, 0 for varints;
//   * `EncodeValue` / `DecodeValue`: write or read one value without any tag.

struct Int32Traits {
  using Value = int32_t;
  static std::string_view constexpr kName = "int32";
  static WireType constexpr kWireType = WireType::kVarInt;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 0;

  // Negative values are sign-extended to 64 bits and always take 10 bytes.
  static void EncodeValue(int32_t const value, Encoder *const encoder) {
    encoder->EncodeVarInt(static_cast<uint64_t>(static_cast<int64_t>(value)));
  }

  static absl::StatusOr<int32_t> DecodeValue(Decoder *decoder);
};

struct Int64Traits {
  using Value = int64_t;
  static std::string_view constexpr kName = "int64";
  static WireType constexpr kWireType = WireType::kVarInt;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 0;

  static void EncodeValue(int64_t const value, Encoder *const encoder) {
    encoder->EncodeVarInt(static_cast<uint64_t>(value));
  }

  static absl::StatusOr<int64_t> DecodeValue(Decoder *decoder);
};

struct UInt32Traits {
  using Value = uint32_t;
  static std::string_view constexpr kName = "uint32";
  static WireType constexpr kWireType = WireType::kVarInt;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 0;

  static void EncodeValue(uint32_t const value, Encoder *const encoder) {
    encoder->EncodeVarInt(value);
  }

  static absl::StatusOr<uint32_t> DecodeValue(Decoder *decoder);
};

struct UInt64Traits {
  using Value = uint64_t;
  static std::string_view constexpr kName = "uint64";
  static WireType constexpr kWireType = WireType::kVarInt;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 0;

  static void EncodeValue(uint64_t const value, Encoder *const encoder) {
    encoder->EncodeVarInt(value);
  }

  static absl::StatusOr<uint64_t> DecodeValue(Decoder *const decoder) {
    return decoder->DecodeVarInt();
  }
};

// ZigZag encoding: 0, -1, 1, -2, 2, ... map to 0, 1, 2, 3, 4, ...
struct SInt32Traits {
  using Value = int32_t;
  static std::string_view constexpr kName = "sint32";
  static WireType constexpr kWireType = WireType::kVarInt;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 0;

  static void EncodeValue(int32_t const value, Encoder *const encoder) {
    encoder->EncodeVarInt((static_cast<uint32_t>(value) << 1) ^ static_cast<uint32_t>(value >> 31));
  }

  static absl::StatusOr<int32_t> DecodeValue(Decoder *decoder);
};

struct SInt64Traits {
  using Value = int64_t;
  static std::string_view constexpr kName = "sint64";
  static WireType constexpr kWireType = WireType::kVarInt;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 0;

  static void EncodeValue(int64_t const value, Encoder *const encoder) {
    encoder->EncodeVarInt((static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63));
  }

  static absl::StatusOr<int64_t> DecodeValue(Decoder *decoder);
};

struct BoolTraits {
  using Value = bool;
  static std::string_view constexpr kName = "bool";
  static WireType constexpr kWireType = WireType::kVarInt;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 0;

  static void EncodeValue(bool const value, Encoder *const encoder) {
    encoder->EncodeVarInt(value ? 1 : 0);
  }

  // Any non-zero varint decodes to `true`.
  static absl::StatusOr<bool> DecodeValue(Decoder *decoder);
};

template <typename Enum>
struct EnumTraits {
  static_assert(std::is_enum_v<Enum>, "EnumTraits requires an enum type");

  using Value = Enum;
  using Underlying = std::underlying_type_t<Enum>;
  static std::string_view constexpr kName = "enum";
  static WireType constexpr kWireType = WireType::kVarInt;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 0;

  static void EncodeValue(Enum const value, Encoder *const encoder) {
    encoder->EncodeVarInt(static_cast<uint64_t>(static_cast<int64_t>(util::to_underlying(value))));
  }

  // Enums up to 32 bits wide read their varint the way int32 or uint32 do, so the 5-byte form of a
  // negative 32-bit value is accepted. Fails with a schema mismatch if the decoded value doesn't fit
  // the underlying type. Values that fit but don't name an enumerator are kept as they are.
  static absl::StatusOr<Enum> DecodeValue(Decoder *const decoder) {
    DEFINE_CONST_OR_RETURN(value, DecodeWideValue(decoder));
    if constexpr (std::is_signed_v<Underlying>) {
      if (value < std::numeric_limits<Underlying>::min() ||
          value > std::numeric_limits<Underlying>::max()) {
        return SchemaMismatchError(absl::StrCat("enum value ", value, " out of range"));
      }
    } else {
      if (value < 0 || static_cast<uint64_t>(value) > std::numeric_limits<Underlying>::max()) {
        return SchemaMismatchError(absl::StrCat("enum value ", value, " out of range"));
      }
    }
    return static_cast<Enum>(static_cast<Underlying>(value));
  }

 private:
  static absl::StatusOr<int64_t> DecodeWideValue(Decoder *const decoder) {
    if constexpr (sizeof(Underlying) > sizeof(int32_t)) {
      DEFINE_CONST_OR_RETURN(bits, decoder->DecodeVarInt());
      return static_cast<int64_t>(bits);
    } else if constexpr (std::is_signed_v<Underlying>) {
      return Int32Traits::DecodeValue(decoder);
    } else {
      return UInt32Traits::DecodeValue(decoder);
    }
  }
};

struct Fixed32Traits {
  using Value = uint32_t;
  static std::string_view constexpr kName = "fixed32";
  static WireType constexpr kWireType = WireType::kInt32;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 4;

  static void EncodeValue(uint32_t const value, Encoder *const encoder) {
    encoder->EncodeFixed32(value);
  }

  static absl::StatusOr<uint32_t> DecodeValue(Decoder *const decoder) {
    return decoder->DecodeFixed32();
  }
};

struct Fixed64Traits {
  using Value = uint64_t;
  static std::string_view constexpr kName = "fixed64";
  static WireType constexpr kWireType = WireType::kInt64;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 8;

  static void EncodeValue(uint64_t const value, Encoder *const encoder) {
    encoder->EncodeFixed64(value);
  }

  static absl::StatusOr<uint64_t> DecodeValue(Decoder *const decoder) {
    return decoder->DecodeFixed64();
  }
};

struct SFixed32Traits {
  using Value = int32_t;
  static std::string_view constexpr kName = "sfixed32";
  static WireType constexpr kWireType = WireType::kInt32;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 4;

  static void EncodeValue(int32_t const value, Encoder *const encoder) {
    encoder->EncodeFixed32(static_cast<uint32_t>(value));
  }

  static absl::StatusOr<int32_t> DecodeValue(Decoder *decoder);
};

struct SFixed64Traits {
  using Value = int64_t;
  static std::string_view constexpr kName = "sfixed64";
  static WireType constexpr kWireType = WireType::kInt64;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 8;

  static void EncodeValue(int64_t const value, Encoder *const encoder) {
    encoder->EncodeFixed64(static_cast<uint64_t>(value));
  }

  static absl::StatusOr<int64_t> DecodeValue(Decoder *decoder);
};

struct FloatTraits {
  using Value = float;
  static std::string_view constexpr kName = "float";
  static WireType constexpr kWireType = WireType::kInt32;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 4;

  static void EncodeValue(float value, Encoder *encoder);
  static absl::StatusOr<float> DecodeValue(Decoder *decoder);
};

struct DoubleTraits {
  using Value = double;
  static std::string_view constexpr kName = "double";
  static WireType constexpr kWireType = WireType::kInt64;
  static bool constexpr kPackable = true;
  static size_t constexpr kFixedSize = 8;

  static void EncodeValue(double value, Encoder *encoder);
  static absl::StatusOr<double> DecodeValue(Decoder *decoder);
};

struct StringTraits {
  using Value = std::string;
  static std::string_view constexpr kName = "string";
  static WireType constexpr kWireType = WireType::kLength;
  static bool constexpr kPackable = false;
  static size_t constexpr kFixedSize = 0;

  static void EncodeValue(std::string_view value, Encoder *encoder);
  static absl::StatusOr<std::string> DecodeValue(Decoder *decoder);
};

struct BytesTraits {
  using Value = std::vector<uint8_t>;
  static std::string_view constexpr kName = "bytes";
  static WireType constexpr kWireType = WireType::kLength;
  static bool constexpr kPackable = false;
  static size_t constexpr kFixedSize = 0;

  static void EncodeValue(absl::Span<uint8_t const> const value, Encoder *const encoder) {
    encoder->EncodeLengthDelimited(value);
  }

  static absl::StatusOr<std::vector<uint8_t>> DecodeValue(Decoder *decoder);
};

}  // namespace internal

// Stateless encoding strategy for one protobuf scalar type. Codecs carry no state and are used
// through the `constexpr` instances defined below, e.g.:
//
//   kUInt32Codec.EncodeField(1, 300, &encoder);  // writes 0x08 0xAC 0x02
//
// Packable codecs encode repeated fields as a single length-delimited run of concatenated values.
// When decoding, both the packed and the unpacked form are accepted for every packable type, even
// mixed within the same field.
template <typename Traits>
class FieldCodec {
 public:
  using Value = typename Traits::Value;

  static WireType constexpr kWireType = Traits::kWireType;
  static bool constexpr kPackable = Traits::kPackable;

  constexpr FieldCodec() = default;

  // The protobuf zero value of the type.
  Value DefaultValue() const { return Value{}; }

  void EncodeField(uint64_t const field_number, Value const &value, Encoder *const encoder) const {
    encoder->EncodeTag(FieldTag{.field_number = field_number, .wire_type = kWireType});
    Traits::EncodeValue(value, encoder);
  }

  // Encodes all elements of `values`, which must be an iterable container of `Value`. Nothing is
  // written if it's empty.
  template <typename Container>
  void EncodeRepeatedField(uint64_t const field_number, Container const &values,
                           Encoder *const encoder) const {
    if (values.empty()) {
      return;
    }
    if constexpr (kPackable) {
      Encoder child;
      for (auto const &value : values) {
        Traits::EncodeValue(value, &child);
      }
      encoder->EncodeTag(FieldTag{.field_number = field_number, .wire_type = WireType::kLength});
      encoder->EncodeLengthDelimited(std::move(child));
    } else {
      for (auto const &value : values) {
        EncodeField(field_number, value, encoder);
      }
    }
  }

  // Decodes a singular field from all of its occurrences. The last occurrence wins, and the
  // default value is returned if there are none. A packed occurrence contributes its last element.
  absl::StatusOr<Value> DecodeField(absl::Span<EncodedField const> const occurrences) const {
    Value result = DefaultValue();
    for (auto const &field : occurrences) {
      if (field.wire_type() == kWireType) {
        Decoder decoder{field.payload()};
        DEFINE_VAR_OR_RETURN(value, Traits::DecodeValue(&decoder));
        result = std::move(value);
      } else if (kPackable && field.wire_type() == WireType::kLength) {
        std::vector<Value> values;
        RETURN_IF_ERROR(DecodePacked(field, &values));
        if (!values.empty()) {
          result = std::move(values.back());
        }
      } else {
        return WrongWireTypeError(field);
      }
    }
    return std::move(result);
  }

  // Decodes all occurrences of a repeated field and appends the values to `values` in wire order.
  absl::Status DecodeRepeatedField(absl::Span<EncodedField const> const occurrences,
                                   std::vector<Value> *const values) const {
    for (auto const &field : occurrences) {
      if (field.wire_type() == kWireType) {
        Decoder decoder{field.payload()};
        DEFINE_VAR_OR_RETURN(value, Traits::DecodeValue(&decoder));
        values->push_back(std::move(value));
      } else if (kPackable && field.wire_type() == WireType::kLength) {
        RETURN_IF_ERROR(DecodePacked(field, values));
      } else {
        return WrongWireTypeError(field);
      }
    }
    return absl::OkStatus();
  }

 private:
  static absl::Status DecodePacked(EncodedField const &field, std::vector<Value> *const values) {
    DEFINE_CONST_OR_RETURN(data, field.GetLengthDelimitedData());
    if constexpr (Traits::kFixedSize > 0) {
      if (data.size() % Traits::kFixedSize != 0) {
        return SchemaMismatchError(absl::StrCat("packed ", Traits::kName, " field ",
                                                field.field_number(), " has a length of ",
                                                data.size(), " bytes"));
      }
    }
    Decoder decoder{data};
    while (!decoder.at_end()) {
      DEFINE_VAR_OR_RETURN(value, Traits::DecodeValue(&decoder));
      values->push_back(std::move(value));
    }
    return absl::OkStatus();
  }

  static absl::Status WrongWireTypeError(EncodedField const &field) {
    return InvalidWireTypeError(absl::StrCat(WireTypeName(field.wire_type()), " for ",
                                             Traits::kName, " field ", field.field_number()));
  }
};

using Int32Codec = FieldCodec<internal::Int32Traits>;
using Int64Codec = FieldCodec<internal::Int64Traits>;
using UInt32Codec = FieldCodec<internal::UInt32Traits>;
using UInt64Codec = FieldCodec<internal::UInt64Traits>;
using SInt32Codec = FieldCodec<internal::SInt32Traits>;
using SInt64Codec = FieldCodec<internal::SInt64Traits>;
using BoolCodec = FieldCodec<internal::BoolTraits>;
using Fixed32Codec = FieldCodec<internal::Fixed32Traits>;
using Fixed64Codec = FieldCodec<internal::Fixed64Traits>;
using SFixed32Codec = FieldCodec<internal::SFixed32Traits>;
using SFixed64Codec = FieldCodec<internal::SFixed64Traits>;
using FloatCodec = FieldCodec<internal::FloatTraits>;
using DoubleCodec = FieldCodec<internal::DoubleTraits>;
using StringCodec = FieldCodec<internal::StringTraits>;
using BytesCodec = FieldCodec<internal::BytesTraits>;

template <typename Enum>
using EnumCodec = FieldCodec<internal::EnumTraits<Enum>>;

inline Int32Codec constexpr kInt32Codec{};
inline Int64Codec constexpr kInt64Codec{};
inline UInt32Codec constexpr kUInt32Codec{};
inline UInt64Codec constexpr kUInt64Codec{};
inline SInt32Codec constexpr kSInt32Codec{};
inline SInt64Codec constexpr kSInt64Codec{};
inline BoolCodec constexpr kBoolCodec{};
inline Fixed32Codec constexpr kFixed32Codec{};
inline Fixed64Codec constexpr kFixed64Codec{};
inline SFixed32Codec constexpr kSFixed32Codec{};
inline SFixed64Codec constexpr kSFixed64Codec{};
inline FloatCodec constexpr kFloatCodec{};
inline DoubleCodec constexpr kDoubleCodec{};
inline StringCodec constexpr kStringCodec{};
inline BytesCodec constexpr kBytesCodec{};

template <typename Enum>
inline EnumCodec<Enum> constexpr kEnumCodec{};

}  // namespace proto
}  // namespace wirepb

#endif  // __WIREPB_PROTO_FIELD_CODEC_H__
