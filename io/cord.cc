#include "io/cord.h"

#include <cstddef>
#include <cstdint>
#include <utility>

#include "io/buffer.h"

namespace wirepb {
namespace io {

void Cord::Append(Buffer buffer) {
  if (!buffer.empty()) {
    size_ += buffer.size();
    pieces_.emplace_back(std::move(buffer));
  }
}

void Cord::Append(Cord other) {
  for (auto& buffer : other.pieces_) {
    size_ += buffer.size();
    pieces_.emplace_back(std::move(buffer));
  }
  other.pieces_.clear();
  other.size_ = 0;
}

Buffer Cord::Flatten() && {
  if (pieces_.empty()) {
    return Buffer();
  } else if (pieces_.size() < 2) {
    size_ = 0;
    return std::move(pieces_.front());
  } else {
    Buffer buffer{size_};
    for (auto const& piece : pieces_) {
      buffer.Append(piece);
    }
    pieces_.clear();
    size_ = 0;
    return buffer;
  }
}

}  // namespace io
}  // namespace wirepb
