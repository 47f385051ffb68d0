#ifndef __WIREPB_IO_CORD_H__
#define __WIREPB_IO_CORD_H__

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

#include "absl/container/inlined_vector.h"
#include "absl/types/span.h"
#include "io/buffer.h"

namespace wirepb {
namespace io {

// An append-only sequence of `Buffer` pieces. This is what encoders write to: a length-delimited
// payload is encoded into its own cord first, so that its size is known, and then spliced into the
// parent without copying the bytes.
class Cord {
 public:
  template <typename... Args,
            std::enable_if_t<std::conjunction_v<std::is_same<Args, Buffer>...>, bool> = true>
  explicit Cord(Args... pieces) {
    pieces_.reserve(sizeof...(pieces));
    (Append(std::move(pieces)), ...);
  }

  ~Cord() = default;

  Cord(Cord &&other) noexcept : pieces_(std::move(other.pieces_)), size_(other.size_) {
    other.pieces_.clear();
    other.size_ = 0;
  }

  Cord &operator=(Cord &&other) noexcept {
    if (this != &other) {
      pieces_ = std::move(other.pieces_);
      size_ = other.size_;
      other.pieces_.clear();
      other.size_ = 0;
    }
    return *this;
  }

  size_t size() const { return size_; }
  [[nodiscard]] bool empty() const { return size_ == 0; }

  // Appends a piece. Empty buffers are dropped.
  void Append(Buffer buffer);

  // Moves all pieces of `other` to the end of this cord.
  void Append(Cord other);

  // Concatenates all pieces into a single buffer. A cord made of a single piece is returned
  // without copying.
  Buffer Flatten() &&;

 private:
  Cord(Cord const &) = delete;
  Cord &operator=(Cord const &) = delete;

  absl::InlinedVector<Buffer, 2> pieces_;
  size_t size_ = 0;
};

}  // namespace io
}  // namespace wirepb

#endif  // __WIREPB_IO_CORD_H__
