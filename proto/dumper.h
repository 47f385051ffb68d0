#ifndef __WIREPB_PROTO_DUMPER_H__
#define __WIREPB_PROTO_DUMPER_H__

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "proto/encoded_field.h"
#include "proto/message.h"

namespace wirepb {
namespace proto {

namespace dumper {

absl::StatusOr<std::vector<uint8_t>> ReadFile(FILE* fp);

// Hex of the first `max_preview` bytes of `data`, followed by "..." if anything was cut.
std::string HexPreview(absl::Span<uint8_t const> data, size_t max_preview);

// One line describing `field`, without the trailing newline. Varint and fixed-width values are
// printed in full, length-delimited payloads as their size and a hex preview.
absl::StatusOr<std::string> DescribeField(EncodedField const& field, size_t max_preview);

}  // namespace dumper

// Renders the raw field listing of a message, or of a stream of size-prefixed messages.
class Dumper {
 public:
  struct Options {
    // Treat the input as a stream of messages framed by `EncodeDelimited`.
    bool delimited = false;

    // Stop after this many messages in delimited mode. 0 means no limit.
    size_t max_messages = 0;

    // Number of bytes shown for each length-delimited payload.
    size_t max_payload_preview = 16;
  };

  explicit Dumper(Options const& options) : options_(options) {}

  absl::StatusOr<std::string> Dump(absl::Span<uint8_t const> data) const;

 private:
  absl::Status DumpMessage(size_t index, size_t offset, Message const& message,
                           std::string* output) const;

  Options options_;
};

}  // namespace proto
}  // namespace wirepb

#endif  // __WIREPB_PROTO_DUMPER_H__
