#include "proto/errors.h"

#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace wirepb {
namespace proto {

absl::Status TruncatedInputError(std::string_view const what) {
  return absl::OutOfRangeError(absl::StrCat("decoding error: reached end of input in ", what));
}

absl::Status InvalidWireTypeError(std::string_view const what) {
  return absl::InvalidArgumentError(absl::StrCat("decoding error: invalid wire type ", what));
}

absl::Status SchemaMismatchError(std::string_view const what) {
  return absl::FailedPreconditionError(absl::StrCat("decoding error: schema mismatch: ", what));
}

absl::Status VarIntOverflowError() {
  return absl::DataLossError("decoding error: varint value exceeds 64 bits");
}

bool IsTruncatedInputError(absl::Status const& status) { return absl::IsOutOfRange(status); }

bool IsInvalidWireTypeError(absl::Status const& status) {
  return absl::IsInvalidArgument(status);
}

bool IsSchemaMismatchError(absl::Status const& status) {
  return absl::IsFailedPrecondition(status);
}

bool IsVarIntOverflowError(absl::Status const& status) { return absl::IsDataLoss(status); }

}  // namespace proto
}  // namespace wirepb
