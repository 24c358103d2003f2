// Classic comparison sorts over contiguous sequences.
//
// Every algorithm compares elements only through Order<T>, sorts a single
// mutable buffer (the caller's sequence when SortConfig::in_place is set, a
// copy otherwise) and, when SortConfig::build_index is set, carries the
// original positions through every swap and move.

#pragma once

#include "sortkit/buffer.hpp"
#include "sortkit/core.hpp"
#include "sortkit/heap.hpp"
#include "sortkit/order.hpp"

#include <cstddef>
#include <iterator>
#include <numeric>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace sortkit {

template <class Seq> struct SortResult {
  // Sorted copy; left default-constructed when the sort ran in place.
  Seq values;
  // index[i] is the input position of the i-th sorted element.
  std::vector<std::size_t> index;
  // The caller's sequence when the sort ran in place, otherwise null.
  Seq *target = nullptr;

  // The sorted sequence: the caller's object for in-place runs, else values.
  Seq &sorted() { return target ? *target : values; }
  const Seq &sorted() const { return target ? *target : values; }
  bool in_place() const { return target != nullptr; }
};

namespace detail {

template <class Seq, class = void> struct is_growable : std::false_type {};
template <class Seq>
struct is_growable<
    Seq, std::void_t<decltype(std::declval<Seq &>().push_back(
                         std::declval<typename Seq::value_type>())),
                     decltype(std::declval<Seq &>().reserve(0)),
                     decltype(std::declval<Seq &>().clear())>>
    : std::true_type {};

template <class Seq>
inline constexpr bool is_contiguous_v = std::is_same_v<
    decltype(std::data(std::declval<Seq &>())), typename Seq::value_type *>;

// Resolve in_place/build_index once and hand the algorithm body a buffer.
template <class Seq, class Body>
SortResult<std::remove_const_t<Seq>> run_body(Seq &data, const SortConfig &cfg,
                                              Body &&body) {
  using Out = std::remove_const_t<Seq>;
  using T = typename Out::value_type;
  static_assert(is_contiguous_v<Out>,
                "sortkit algorithms need a contiguous sequence");

  validate(cfg, std::size(data));
  SortResult<Out> out;
  Out *work = &out.values;
  if constexpr (std::is_const_v<Seq>) {
    if (cfg.in_place)
      throw InvalidParameterError(
          "in_place sort requires a mutable sequence");
    out.values = data;
  } else {
    if (cfg.in_place)
      work = out.target = &data;
    else
      out.values = data;
  }
  if (cfg.build_index) {
    out.index.resize(std::size(*work));
    std::iota(out.index.begin(), out.index.end(), std::size_t{0});
  }
  Buffer<T> buf(std::span<T>(std::data(*work), std::size(*work)),
                std::span<std::size_t>(out.index));
  body(buf, make_order<T>(cfg.ascending));
  return out;
}

template <class T>
inline void bubble(Buffer<T> &a, const Order<T> &before, bool short_circuit) {
  const std::size_t n = a.size();
  for (std::size_t pass = n; pass > 1; --pass) {
    bool swapped = false;
    for (std::size_t i = 0; i + 1 < pass; ++i) {
      if (before(a[i + 1], a[i])) {
        a.swap(i, i + 1);
        swapped = true;
      }
    }
    if (short_circuit && !swapped)
      break;
  }
}

template <class T>
inline void selection(Buffer<T> &a, const Order<T> &before) {
  const std::size_t n = a.size();
  for (std::size_t i = 0; i + 1 < n; ++i) {
    std::size_t best = i;
    for (std::size_t j = i + 1; j < n; ++j)
      if (before(a[j], a[best]))
        best = j;
    if (best != i)
      a.swap(i, best);
  }
}

// Insertion sort over the interleaved sub-sequences `gap` apart.
template <class T>
inline void gapped_insertion(Buffer<T> &a, const Order<T> &before,
                             std::size_t gap) {
  const std::size_t n = a.size();
  for (std::size_t i = gap; i < n; ++i) {
    auto key = a.take(i);
    std::size_t j = i;
    while (j >= gap && before(key.value, a[j - gap])) {
      a.move(j, j - gap);
      j -= gap;
    }
    a.put(j, std::move(key));
  }
}

template <class T>
inline void shell(Buffer<T> &a, const Order<T> &before,
                  std::optional<long long> first_gap) {
  std::size_t gap = first_gap ? static_cast<std::size_t>(*first_gap)
                              : a.size() / 2;
  if (gap == 0)
    gap = 1;
  for (; gap > 0; gap /= 2)
    gapped_insertion(a, before, gap);
}

template <class T>
inline std::size_t median_of_three(const Buffer<T> &a, const Order<T> &before,
                                   std::size_t lo, std::size_t hi) {
  const std::size_t mid = lo + (hi - lo) / 2;
  const T &x = a[lo];
  const T &y = a[mid];
  const T &z = a[hi];
  if (before(x, y)) {
    if (before(y, z))
      return mid;
    return before(x, z) ? hi : lo;
  }
  if (before(x, z))
    return lo;
  return before(y, z) ? hi : mid;
}

template <class T>
inline std::size_t choose_pivot(const Buffer<T> &a, const Order<T> &before,
                                const SortConfig &cfg, std::size_t lo,
                                std::size_t hi) {
  switch (cfg.pivot) {
  case PivotRule::first:
    return lo;
  case PivotRule::last:
    return hi;
  case PivotRule::middle:
    return lo + (hi - lo) / 2;
  case PivotRule::median_of_three:
    return median_of_three(a, before, lo, hi);
  case PivotRule::index: {
    const auto off = static_cast<std::size_t>(cfg.pivot_index.value_or(0));
    return lo + (off < hi - lo ? off : hi - lo);
  }
  case PivotRule::fraction:
    return lo + static_cast<std::size_t>(cfg.pivot_fraction *
                                         static_cast<double>(hi - lo));
  }
  return lo;
}

// Moves the pivot to lo, walks two marks towards each other and drops the
// pivot at the split point. Returns the pivot's final position.
template <class T>
inline std::size_t partition(Buffer<T> &a, const Order<T> &before,
                             std::size_t lo, std::size_t hi,
                             std::size_t pivot) {
  a.swap(lo, pivot);
  std::size_t left = lo + 1;
  std::size_t right = hi;
  for (;;) {
    while (left <= right && !before(a[lo], a[left]))
      ++left;
    while (right >= left && !before(a[right], a[lo]))
      --right;
    if (right < left) {
      a.swap(lo, right);
      return right;
    }
    a.swap(left, right);
  }
}

// Recurses into the smaller side and loops on the larger one, so the stack
// depth stays O(log N) even when every pivot is the worst choice.
template <class T>
inline void quick(Buffer<T> &a, const Order<T> &before, const SortConfig &cfg,
                  std::size_t lo, std::size_t hi) {
  while (lo < hi) {
    const std::size_t p =
        partition(a, before, lo, hi, choose_pivot(a, before, cfg, lo, hi));
    if (p - lo < hi - p) {
      if (p > lo)
        quick(a, before, cfg, lo, p - 1);
      lo = p + 1;
    } else {
      if (p < hi)
        quick(a, before, cfg, p + 1, hi);
      if (p == lo)
        break;
      hi = p - 1;
    }
  }
}

template <class T, class Scratch>
inline void merge_range(Buffer<T> &a, const Order<T> &before, Scratch &tmp,
                        std::vector<std::size_t> &tmp_index, std::size_t lo,
                        std::size_t hi) {
  if (hi - lo < 2)
    return;
  const std::size_t mid = lo + (hi - lo) / 2;
  merge_range(a, before, tmp, tmp_index, lo, mid);
  merge_range(a, before, tmp, tmp_index, mid, hi);

  tmp.clear();
  tmp_index.clear();
  auto emit = [&](std::size_t k) {
    auto s = a.take(k);
    tmp.push_back(std::move(s.value));
    if (a.tracks_index())
      tmp_index.push_back(s.pos);
  };
  std::size_t i = lo, j = mid;
  while (i < mid && j < hi) {
    // Ties go left, which keeps the sort stable.
    if (before(a[j], a[i]))
      emit(j++);
    else
      emit(i++);
  }
  while (i < mid)
    emit(i++);
  while (j < hi)
    emit(j++);
  for (std::size_t k = 0; k < tmp.size(); ++k)
    a.put(lo + k, typename Buffer<T>::Slot{
                      std::move(tmp[k]),
                      a.tracks_index() ? tmp_index[k] : 0});
}

template <class T>
inline void heap(Buffer<T> &a, const Order<T> &before) {
  // The root of a heap ordered opposite to the requested direction is the
  // element that belongs last; extract it into the shrinking tail.
  const Order<T> better{!before.ascending};
  heap_ops::heapify(a, better);
  for (std::size_t end = a.size(); end > 1; --end) {
    a.swap(0, end - 1);
    heap_ops::sift_down(a, 0, end - 1, better);
  }
}

} // namespace detail

// N-1 full passes of adjacent compare-and-swap. Stable.
template <class Seq>
SortResult<std::remove_const_t<Seq>> bubble_sort(Seq &data,
                                                 const SortConfig &cfg = {}) {
  using T = typename std::remove_const_t<Seq>::value_type;
  return detail::run_body(data, cfg, [](Buffer<T> &a, const Order<T> &o) {
    detail::bubble(a, o, false);
  });
}

// Bubble sort that stops after the first pass without swaps. Stable.
template <class Seq>
SortResult<std::remove_const_t<Seq>>
short_bubble_sort(Seq &data, const SortConfig &cfg = {}) {
  using T = typename std::remove_const_t<Seq>::value_type;
  return detail::run_body(data, cfg, [](Buffer<T> &a, const Order<T> &o) {
    detail::bubble(a, o, true);
  });
}

template <class Seq>
SortResult<std::remove_const_t<Seq>> selection_sort(Seq &data,
                                                    const SortConfig &cfg = {}) {
  using T = typename std::remove_const_t<Seq>::value_type;
  return detail::run_body(data, cfg, [](Buffer<T> &a, const Order<T> &o) {
    detail::selection(a, o);
  });
}

template <class Seq>
SortResult<std::remove_const_t<Seq>> insertion_sort(Seq &data,
                                                    const SortConfig &cfg = {}) {
  using T = typename std::remove_const_t<Seq>::value_type;
  return detail::run_body(data, cfg, [](Buffer<T> &a, const Order<T> &o) {
    detail::gapped_insertion(a, o, 1);
  });
}

// Gaps start at cfg.gap (or N/2) and halve down to 1.
template <class Seq>
SortResult<std::remove_const_t<Seq>> shell_sort(Seq &data,
                                                const SortConfig &cfg = {}) {
  using T = typename std::remove_const_t<Seq>::value_type;
  const auto gap = cfg.gap;
  return detail::run_body(data, cfg, [gap](Buffer<T> &a, const Order<T> &o) {
    detail::shell(a, o, gap);
  });
}

template <class Seq>
SortResult<std::remove_const_t<Seq>> quick_sort(Seq &data,
                                                const SortConfig &cfg = {}) {
  using T = typename std::remove_const_t<Seq>::value_type;
  return detail::run_body(data, cfg, [&cfg](Buffer<T> &a, const Order<T> &o) {
    if (a.size() > 1)
      detail::quick(a, o, cfg, 0, a.size() - 1);
  });
}

// Top-down merge sort. Needs a growable sequence for its O(N) scratch space.
template <class Seq>
SortResult<std::remove_const_t<Seq>> merge_sort(Seq &data,
                                                const SortConfig &cfg = {}) {
  using Out = std::remove_const_t<Seq>;
  using T = typename Out::value_type;
  static_assert(detail::is_growable<Out>::value,
                "merge_sort needs a growable sequence (push_back/reserve)");
  return detail::run_body(data, cfg, [](Buffer<T> &a, const Order<T> &o) {
    Out tmp;
    tmp.reserve(a.size());
    std::vector<std::size_t> tmp_index;
    if (a.tracks_index())
      tmp_index.reserve(a.size());
    detail::merge_range(a, o, tmp, tmp_index, 0, a.size());
  });
}

// Heapifies the buffer itself, so no storage beyond the sequence is used.
template <class Seq>
SortResult<std::remove_const_t<Seq>> heap_sort(Seq &data,
                                               const SortConfig &cfg = {}) {
  using T = typename std::remove_const_t<Seq>::value_type;
  return detail::run_body(data, cfg, [](Buffer<T> &a, const Order<T> &o) {
    detail::heap(a, o);
  });
}

// Dispatcher: forwards cfg unchanged to the selected algorithm.
// merge_sort rejects a fixed-size sequence at compile time; through the
// dispatcher the same request compiles and throws InvalidParameterError, since
// the method is only known at run time. Call merge_sort directly to get the
// compile-time check.
template <class Seq>
SortResult<std::remove_const_t<Seq>> sort(Method method, Seq &data,
                                          const SortConfig &cfg = {}) {
  switch (method) {
  case Method::bubble:
    return bubble_sort(data, cfg);
  case Method::short_bubble:
    return short_bubble_sort(data, cfg);
  case Method::selection:
    return selection_sort(data, cfg);
  case Method::insertion:
    return insertion_sort(data, cfg);
  case Method::shell:
    return shell_sort(data, cfg);
  case Method::quick:
    return quick_sort(data, cfg);
  case Method::merge:
    if constexpr (detail::is_growable<std::remove_const_t<Seq>>::value)
      return merge_sort(data, cfg);
    else
      throw InvalidParameterError(
          "merge sort needs a growable sequence such as std::vector");
  case Method::heap:
    return heap_sort(data, cfg);
  }
  throw UnknownMethodError("unknown sort method id " +
                           std::to_string(static_cast<int>(method)));
}

template <class Seq>
SortResult<std::remove_const_t<Seq>> sort(std::string_view method, Seq &data,
                                          const SortConfig &cfg = {}) {
  return sort(parse_method(method), data, cfg);
}

template <class Seq> void reverse(Seq &a) {
  const std::size_t n = std::size(a);
  for (std::size_t i = 0; i < n / 2; ++i) {
    using std::swap;
    swap(a[i], a[n - 1 - i]);
  }
}

// Gathers original[index[i]] for every i.
template <class Seq>
std::remove_const_t<Seq> apply_index(Seq &original,
                                     const std::vector<std::size_t> &index) {
  const std::size_t n = std::size(original);
  if (index.size() != n)
    throw InvalidParameterError("index length " + std::to_string(index.size()) +
                                " does not match sequence length " +
                                std::to_string(n));
  std::remove_const_t<Seq> out = original;
  for (std::size_t i = 0; i < n; ++i) {
    if (index[i] >= n)
      throw InvalidParameterError("index entry " + std::to_string(index[i]) +
                                  " out of range (expected 0.." +
                                  std::to_string(n - 1) + ")");
    out[i] = original[index[i]];
  }
  return out;
}

template <class Seq> bool is_sorted(const Seq &a, bool ascending = true) {
  using T = typename Seq::value_type;
  const Order<T> before = make_order<T>(ascending);
  for (std::size_t i = 1; i < std::size(a); ++i)
    if (before(a[i], a[i - 1]))
      return false;
  return true;
}

} // namespace sortkit
