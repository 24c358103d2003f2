// Binary min/max heap and the sift primitives it shares with heap sort.

#pragma once

#include "sortkit/buffer.hpp"
#include "sortkit/core.hpp"
#include "sortkit/order.hpp"

#include <cstddef>
#include <span>
#include <utility>
#include <vector>

namespace sortkit {

namespace heap_ops {

// `better(a, b)` is true when a belongs above b. Children that only tie with
// their parent stay where they are.
template <class T, class Better>
inline void sift_down(Buffer<T> &a, std::size_t i, std::size_t n,
                      const Better &better) {
  for (;;) {
    std::size_t best = i;
    const std::size_t l = 2 * i + 1;
    const std::size_t r = l + 1;
    if (l < n && better(a[l], a[best]))
      best = l;
    if (r < n && better(a[r], a[best]))
      best = r;
    if (best == i)
      return;
    a.swap(i, best);
    i = best;
  }
}

template <class T, class Better>
inline void sift_up(Buffer<T> &a, std::size_t i, const Better &better) {
  while (i > 0) {
    const std::size_t parent = (i - 1) / 2;
    if (!better(a[i], a[parent]))
      return;
    a.swap(i, parent);
    i = parent;
  }
}

// Bottom-up heap construction, O(N).
template <class T, class Better>
inline void heapify(Buffer<T> &a, const Better &better) {
  const std::size_t n = a.size();
  for (std::size_t i = n / 2; i-- > 0;)
    sift_down(a, i, n, better);
}

template <class T, class Better>
inline bool is_heap_ordered(std::span<const T> a, const Better &better) {
  for (std::size_t i = 1; i < a.size(); ++i)
    if (better(a[i], a[(i - 1) / 2]))
      return false;
  return true;
}

} // namespace heap_ops

template <class T> class BinaryHeap {
public:
  explicit BinaryHeap(HeapMode mode = HeapMode::min)
      : mode_(checked(mode)), better_{mode == HeapMode::min} {}

  // Takes ownership of the initial elements and heapifies them.
  explicit BinaryHeap(std::vector<T> items, HeapMode mode = HeapMode::min)
      : mode_(checked(mode)), better_{mode == HeapMode::min},
        items_(std::move(items)) {
    Buffer<T> buf(items_);
    heap_ops::heapify(buf, better_);
  }

  void insert(T value) {
    items_.push_back(std::move(value));
    Buffer<T> buf(items_);
    heap_ops::sift_up(buf, items_.size() - 1, better_);
  }

  const T &peek_root() const {
    if (items_.empty())
      throw EmptyHeapError(std::string("peek_root on empty ") +
                           std::string(heap_mode_name(mode_)) + "-heap");
    return items_.front();
  }

  T extract_root() {
    if (items_.empty())
      throw EmptyHeapError(std::string("extract_root on empty ") +
                           std::string(heap_mode_name(mode_)) + "-heap");
    T root = std::move(items_.front());
    if (items_.size() > 1)
      items_.front() = std::move(items_.back());
    items_.pop_back();
    Buffer<T> buf(items_);
    heap_ops::sift_down(buf, 0, items_.size(), better_);
    return root;
  }

  std::size_t size() const { return items_.size(); }
  bool is_empty() const { return items_.empty(); }
  HeapMode mode() const { return mode_; }

  // Backing sequence in heap order (root first).
  const std::vector<T> &data() const { return items_; }

  bool is_valid() const {
    return heap_ops::is_heap_ordered(std::span<const T>(items_), better_);
  }

private:
  static HeapMode checked(HeapMode m) {
    check_heap_mode(m);
    return m;
  }

  HeapMode mode_;
  Order<T> better_;
  std::vector<T> items_;
};

} // namespace sortkit
