#ifndef __WIREPB_PROTO_REPEATED_FIELD_H__
#define __WIREPB_PROTO_REPEATED_FIELD_H__

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "proto/message.h"
#include "proto/wire_format.h"

namespace wirepb {
namespace proto {

// An ordered sequence of scalar values of the type handled by `Codec`, e.g.
// `RepeatedField<UInt32Codec>`. Insertion order is wire order.
//
// Packable types are encoded as a single packed record. Decoding accepts packed and unpacked
// occurrences alike.
template <typename Codec>
class RepeatedField {
 public:
  using Value = typename Codec::Value;
  using value_type = Value;
  using const_iterator = typename std::vector<Value>::const_iterator;
  using iterator = typename std::vector<Value>::iterator;

  RepeatedField() = default;
  RepeatedField(std::initializer_list<Value> const values) : values_(values) {}

  ~RepeatedField() = default;

  RepeatedField(RepeatedField const &) = default;
  RepeatedField &operator=(RepeatedField const &) = default;
  RepeatedField(RepeatedField &&) noexcept = default;
  RepeatedField &operator=(RepeatedField &&) noexcept = default;

  friend bool operator==(RepeatedField const &lhs, RepeatedField const &rhs) {
    return lhs.values_ == rhs.values_;
  }

  friend bool operator!=(RepeatedField const &lhs, RepeatedField const &rhs) {
    return lhs.values_ != rhs.values_;
  }

  size_t size() const { return values_.size(); }
  [[nodiscard]] bool empty() const { return values_.empty(); }

  decltype(auto) operator[](size_t const index) const { return values_[index]; }
  decltype(auto) operator[](size_t const index) { return values_[index]; }

  // Like `operator[]` but check-fails if `index` is out of range.
  Value at(size_t const index) const {
    CHECK_LT(index, values_.size()) << "index out of range";
    return values_[index];
  }

  const_iterator begin() const { return values_.begin(); }
  const_iterator end() const { return values_.end(); }
  iterator begin() { return values_.begin(); }
  iterator end() { return values_.end(); }

  std::vector<Value> const &values() const { return values_; }

  void Add(Value value) { values_.push_back(std::move(value)); }

  void Clear() { values_.clear(); }

  // Appends all values of `other`.
  void MergeFrom(RepeatedField const &other) {
    if (this == &other) {
      auto const copy = other.values_;
      values_.insert(values_.end(), copy.begin(), copy.end());
    } else {
      values_.insert(values_.end(), other.values_.begin(), other.values_.end());
    }
  }

  // Writes nothing if the collection is empty.
  void EncodeAsRepeatedField(uint64_t const field_number, Encoder *const encoder) const {
    Codec{}.EncodeRepeatedField(field_number, values_, encoder);
  }

  // Claims all occurrences of `field_number` from `container`, replacing the content of this
  // collection. On error the collection and the container are left unchanged.
  absl::Status DecodeAsUnknownRepeatedField(Message *const container,
                                            uint64_t const field_number) {
    return container->DecodeUnknownRepeatedField(field_number, Codec{}, &values_);
  }

 private:
  std::vector<Value> values_;
};

// An ordered sequence of embedded messages of type `M`, which must satisfy the message contract
// described in `message.h`. The collection owns its elements. Each element is encoded as its own
// length-delimited record.
template <typename M>
class RepeatedMessageField {
 public:
  using value_type = M;
  using const_iterator = typename std::vector<M>::const_iterator;
  using iterator = typename std::vector<M>::iterator;

  RepeatedMessageField() = default;
  ~RepeatedMessageField() = default;

  RepeatedMessageField(RepeatedMessageField const &) = default;
  RepeatedMessageField &operator=(RepeatedMessageField const &) = default;
  RepeatedMessageField(RepeatedMessageField &&) noexcept = default;
  RepeatedMessageField &operator=(RepeatedMessageField &&) noexcept = default;

  friend bool operator==(RepeatedMessageField const &lhs, RepeatedMessageField const &rhs) {
    return lhs.elements_ == rhs.elements_;
  }

  friend bool operator!=(RepeatedMessageField const &lhs, RepeatedMessageField const &rhs) {
    return !(lhs == rhs);
  }

  size_t size() const { return elements_.size(); }
  [[nodiscard]] bool empty() const { return elements_.empty(); }

  M const &operator[](size_t const index) const { return elements_[index]; }
  M &operator[](size_t const index) { return elements_[index]; }

  M const &at(size_t const index) const {
    CHECK_LT(index, elements_.size()) << "index out of range";
    return elements_[index];
  }

  M &at(size_t const index) {
    CHECK_LT(index, elements_.size()) << "index out of range";
    return elements_[index];
  }

  const_iterator begin() const { return elements_.begin(); }
  const_iterator end() const { return elements_.end(); }
  iterator begin() { return elements_.begin(); }
  iterator end() { return elements_.end(); }

  // Appends a default-constructed element and returns it.
  M &Add() { return elements_.emplace_back(); }

  void Add(M element) { elements_.push_back(std::move(element)); }

  void Clear() { elements_.clear(); }

  // Appends copies of all elements of `other`.
  void MergeFrom(RepeatedMessageField const &other) {
    if (this == &other) {
      auto const copy = other.elements_;
      elements_.insert(elements_.end(), copy.begin(), copy.end());
    } else {
      elements_.insert(elements_.end(), other.elements_.begin(), other.elements_.end());
    }
  }

  void EncodeAsRepeatedField(uint64_t const field_number, Encoder *const encoder) const {
    EncodeRepeatedMessageField(field_number, elements_, encoder);
  }

  // Claims all occurrences of `field_number` from `container` and decodes one element from each,
  // replacing the content of this collection. Any occurrence that is not length-delimited is an
  // invalid wire type error.
  absl::Status DecodeAsUnknownRepeatedField(Message *const container,
                                            uint64_t const field_number) {
    return container->DecodeUnknownRepeatedMessageField(field_number, &elements_);
  }

 private:
  std::vector<M> elements_;
};

}  // namespace proto
}  // namespace wirepb

#endif  // __WIREPB_PROTO_REPEATED_FIELD_H__
