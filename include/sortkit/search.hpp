// Linear and logarithmic lookup. Both return std::nullopt when the target
// is absent, never a sentinel index.

#pragma once

#include "sortkit/order.hpp"

#include <cstddef>
#include <iterator>
#include <optional>

namespace sortkit {

struct SearchConfig {
  // When the sequence is known to be sorted in `ascending` direction the
  // scan stops as soon as it passes the place the target would occupy.
  bool sorted = false;
  bool ascending = true;
};

// First position holding `target`, scanning left to right. O(N).
template <class Seq>
std::optional<std::size_t>
sequential_search(const Seq &a, const typename Seq::value_type &target,
                  const SearchConfig &cfg = {}) {
  using T = typename Seq::value_type;
  const Order<T> before = make_order<T>(cfg.ascending);
  for (std::size_t i = 0; i < std::size(a); ++i) {
    if (a[i] == target)
      return i;
    if (cfg.sorted && before(target, a[i]))
      break;
  }
  return std::nullopt;
}

// Precondition: `a` is sorted ascending. This is not checked; on unsorted
// input the result is unspecified. With duplicates any matching position
// may be returned. O(log N).
template <class Seq>
std::optional<std::size_t>
binary_search(const Seq &a, const typename Seq::value_type &target) {
  using T = typename Seq::value_type;
  const Order<T> before = make_order<T>(true);
  std::size_t lo = 0;
  std::size_t hi = std::size(a);
  while (lo < hi) {
    const std::size_t mid = lo + (hi - lo) / 2;
    if (a[mid] == target)
      return mid;
    if (before(target, a[mid]))
      hi = mid;
    else
      lo = mid + 1;
  }
  return std::nullopt;
}

} // namespace sortkit
