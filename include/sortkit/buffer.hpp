// Mutable view used by every algorithm body: the element slots plus, when an
// index array is requested, the original position carried alongside each slot.

#pragma once

#include <cstddef>
#include <span>
#include <utility>

namespace sortkit {

template <class T> class Buffer {
public:
  // A value lifted out of the buffer together with its original position.
  struct Slot {
    T value;
    std::size_t pos;
  };

  explicit Buffer(std::span<T> values, std::span<std::size_t> index = {})
      : values_(values), index_(index) {}

  std::size_t size() const { return values_.size(); }
  bool tracks_index() const { return !index_.empty(); }

  T &operator[](std::size_t i) { return values_[i]; }
  const T &operator[](std::size_t i) const { return values_[i]; }

  void swap(std::size_t i, std::size_t j) {
    using std::swap;
    swap(values_[i], values_[j]);
    if (tracks_index())
      swap(index_[i], index_[j]);
  }

  // Shift slot src into slot dst, leaving src moved-from.
  void move(std::size_t dst, std::size_t src) {
    values_[dst] = std::move(values_[src]);
    if (tracks_index())
      index_[dst] = index_[src];
  }

  Slot take(std::size_t i) {
    return Slot{std::move(values_[i]), tracks_index() ? index_[i] : 0};
  }

  void put(std::size_t i, Slot &&s) {
    values_[i] = std::move(s.value);
    if (tracks_index())
      index_[i] = s.pos;
  }

private:
  std::span<T> values_;
  std::span<std::size_t> index_;
};

} // namespace sortkit
