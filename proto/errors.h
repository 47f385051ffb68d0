#ifndef __WIREPB_PROTO_ERRORS_H__
#define __WIREPB_PROTO_ERRORS_H__

#include <string_view>

#include "absl/status/status.h"

namespace wirepb {
namespace proto {

// Decoding errors. Each kind maps to its own `absl::StatusCode` so that callers can tell them
// apart with the predicates below:
//
//   * truncated input -> `kOutOfRange`
//   * invalid wire type -> `kInvalidArgument`
//   * schema mismatch -> `kFailedPrecondition`
//   * varint overflow -> `kDataLoss`
//
// Encoding never fails with a status.

// The source was exhausted in the middle of a varint, a fixed-width value, or a payload.
absl::Status TruncatedInputError(std::string_view what);

// A tag carried an undefined 3-bit wire type, or a field was found with a wire type that its codec
// can't decode.
absl::Status InvalidWireTypeError(std::string_view what);

// The bytes were not produced by a compatible message type: invalid field numbers, values out of
// range for the target type, or framed payloads that don't decode.
absl::Status SchemaMismatchError(std::string_view what);

// A varint ran past 10 bytes or carried bits beyond 64.
absl::Status VarIntOverflowError();

bool IsTruncatedInputError(absl::Status const& status);
bool IsInvalidWireTypeError(absl::Status const& status);
bool IsSchemaMismatchError(absl::Status const& status);
bool IsVarIntOverflowError(absl::Status const& status);

}  // namespace proto
}  // namespace wirepb

#endif  // __WIREPB_PROTO_ERRORS_H__
