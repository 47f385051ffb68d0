#ifndef __WIREPB_IO_BUFFER_H__
#define __WIREPB_IO_BUFFER_H__

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include <utility>

#include "absl/log/check.h"
#include "absl/types/span.h"
#include "common/utilities.h"

namespace wirepb {
namespace io {

// Manages an owned, preallocated byte buffer. Encoders fill buffers of a known capacity and splice
// them into a `Cord`, decoded payloads are copied into buffers of exactly their size.
//
// Buffers are move-only. Use `Clone` for an explicit deep copy.
class Buffer {
 public:
  // Constructs an empty `Buffer`. Nothing is allocated and both size and capacity are 0.
  explicit Buffer() = default;

  // Allocates `capacity` bytes. The initial size is 0.
  explicit Buffer(size_t const capacity)
      : capacity_(capacity), length_(0), data_(new uint8_t[capacity_]) {}

  // Allocates a buffer of exactly `size` bytes and copies `data` into it.
  explicit Buffer(void const* const data, size_t const size)
      : capacity_(size), length_(size), data_(new uint8_t[size]) {
    if (size > 0) {
      std::memcpy(data_, data, size);
    }
  }

  explicit Buffer(absl::Span<uint8_t const> const bytes) : Buffer(bytes.data(), bytes.size()) {}

  ~Buffer() { delete[] data_; }

  Buffer(Buffer&& other) noexcept
      : capacity_(other.capacity_), length_(other.length_), data_(other.Release()) {}

  Buffer& operator=(Buffer&& other) noexcept {
    if (this != &other) {
      delete[] data_;
      capacity_ = other.capacity_;
      length_ = other.length_;
      data_ = other.Release();
    }
    return *this;
  }

  // Two buffers are equal iff they hold the same bytes. Spare capacity is not compared.
  friend bool operator==(Buffer const& lhs, Buffer const& rhs) {
    return lhs.length_ == rhs.length_ &&
           (lhs.length_ == 0 || std::memcmp(lhs.data_, rhs.data_, lhs.length_) == 0);
  }

  friend bool operator!=(Buffer const& lhs, Buffer const& rhs) { return !(lhs == rhs); }

  // Returns a deep copy of the buffer. The copy has no spare capacity.
  Buffer Clone() const { return Buffer(data_, length_); }

  size_t capacity() const { return capacity_; }
  size_t size() const { return length_; }
  [[nodiscard]] bool empty() const { return length_ == 0; }

  absl::Span<uint8_t const> span() const { return absl::Span<uint8_t const>(data_, length_); }

  uint8_t* as_byte_array() { return data_; }
  uint8_t const* as_byte_array() const { return data_; }

  char const* as_char_array() const { return reinterpret_cast<char const*>(data_); }

  // Appends `word` in host byte order. Callers that write wire data must convert to little-endian
  // first (see `util::LittleEndian32` and `util::LittleEndian64`).
  //
  // Check-fails if `size() + sizeof(Word) > capacity()`.
  template <typename Word, std::enable_if_t<std::is_arithmetic_v<Word>, bool> = true>
  Buffer& Append(Word const word) {
    CHECK_LE(length_ + sizeof(Word), capacity_) << "buffer overflow";
    std::memcpy(data_ + length_, &word, sizeof(Word));
    length_ += sizeof(Word);
    return *this;
  }

  // Copies the content of `other` to the end of this buffer. Check-fails on overflow.
  Buffer& Append(Buffer const& other) {
    CHECK_LE(length_ + other.length_, capacity_) << "buffer overflow";
    if (other.length_ > 0) {
      std::memcpy(data_ + length_, other.data_, other.length_);
    }
    length_ += other.length_;
    return *this;
  }

  // Copies `length` bytes from `source` to the end of the buffer. Check-fails on overflow.
  void MemCpy(void const* const source, size_t const length) {
    CHECK_LE(length_ + length, capacity_) << "buffer overflow";
    if (length > 0) {
      std::memcpy(data_ + length_, source, length);
    }
    length_ += length;
  }

  // Releases ownership of the memory, leaving this object empty.
  gsl::owner<uint8_t*> Release() {
    gsl::owner<uint8_t*> const data = data_;
    capacity_ = 0;
    length_ = 0;
    data_ = nullptr;
    return data;
  }

 private:
  Buffer(Buffer const&) = delete;
  Buffer& operator=(Buffer const&) = delete;

  size_t capacity_ = 0;
  size_t length_ = 0;
  gsl::owner<uint8_t*> data_ = nullptr;
};

}  // namespace io
}  // namespace wirepb

#endif  // __WIREPB_IO_BUFFER_H__
