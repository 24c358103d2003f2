// Sorting algorithm tests for sortkit
#include "sortkit/algorithms.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace sortkit;

static void require(bool cond, const char* msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
  }
}

template <class E, class Fn>
static void require_throws(const char* msg, Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return;
  }
  std::cerr << "FAIL: expected exception: " << msg << "\n";
  std::exit(1);
}

// Equal keys compare equal; tag records the input position.
struct Item {
  int key;
  int tag;
  bool operator<(const Item& o) const { return key < o.key; }
  bool operator==(const Item& o) const { return key == o.key && tag == o.tag; }
};

static const Method kAll[] = {Method::bubble,    Method::short_bubble,
                              Method::selection, Method::insertion,
                              Method::shell,     Method::quick,
                              Method::merge,     Method::heap};

static std::vector<int> random_ints(std::size_t n, int hi, unsigned seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> d(-hi, hi);
  std::vector<int> v(n);
  for (auto& x : v) x = d(rng);
  return v;
}

static std::vector<std::vector<int>> int_inputs() {
  std::vector<std::vector<int>> in;
  in.push_back({});
  in.push_back({42});
  in.push_back({7, 7, 7, 7, 7});
  in.push_back({1, 2, 3, 4, 5, 6});
  in.push_back({9, 8, 7, 6, 5, 4, 3});
  in.push_back({5, 3, 1, 4, 2});
  in.push_back({2, 1});
  in.push_back(random_ints(257, 1000, 1));
  in.push_back(random_ints(300, 5, 2)); // many duplicates
  return in;
}

static bool is_bijection(const std::vector<std::size_t>& idx, std::size_t n) {
  if (idx.size() != n) return false;
  std::vector<bool> seen(n, false);
  for (auto i : idx) {
    if (i >= n || seen[i]) return false;
    seen[i] = true;
  }
  return true;
}

static void test_examples() {
  std::vector<int> a{5, 3, 1, 4, 2};
  auto r = bubble_sort(a);
  require(r.values == std::vector<int>({1, 2, 3, 4, 5}), "bubble ascending example");
  require(a == std::vector<int>({5, 3, 1, 4, 2}), "copy sort leaves input untouched");

  SortConfig desc;
  desc.ascending = false;
  auto q = quick_sort(a, desc);
  require(q.values == std::vector<int>({5, 4, 3, 2, 1}), "quick descending example");
}

static void test_every_method_orders_permutation() {
  for (Method m : kAll) {
    for (bool asc : {true, false}) {
      for (const auto& input : int_inputs()) {
        std::vector<int> data = input;
        SortConfig cfg;
        cfg.ascending = asc;
        auto r = sortkit::sort(m, data, cfg);
        auto ref = input;
        std::stable_sort(ref.begin(), ref.end(), make_order<int>(asc));
        require(r.values == ref, "sorted output is the ordered permutation");
        require(sortkit::is_sorted(r.values, asc), "is_sorted agrees");
        require(data == input, "input untouched without in_place");
        require(r.index.empty(), "no index unless requested");
      }
    }
  }
}

static void test_strings() {
  const std::vector<std::string> letters{"d", "f", "a", "k", "b", "g", "z"};
  for (Method m : kAll) {
    SortConfig cfg;
    cfg.build_index = true;
    auto r = sortkit::sort(m, letters, cfg);
    require(r.values == std::vector<std::string>({"a", "b", "d", "f", "g", "k", "z"}),
            "strings ascending");
    require(r.index == std::vector<std::size_t>({2, 4, 0, 1, 5, 3, 6}),
            "string index array");
  }
}

static void test_index_array() {
  const std::vector<int> a1{54, 26, 93, 17, 77, 31, 44, 55, 20};
  for (Method m : kAll) {
    SortConfig cfg;
    cfg.build_index = true;
    cfg.gap = 3; // only shell reads it
    auto r = sortkit::sort(m, a1, cfg);
    require(r.values == std::vector<int>({17, 20, 26, 31, 44, 54, 55, 77, 93}),
            "reference list ascending");
    require(r.index == std::vector<std::size_t>({3, 8, 1, 5, 6, 0, 7, 4, 2}),
            "reference index ascending");

    cfg.ascending = false;
    auto d = sortkit::sort(m, a1, cfg);
    require(d.values == std::vector<int>({93, 77, 55, 54, 44, 31, 26, 20, 17}),
            "reference list descending");
    require(d.index == std::vector<std::size_t>({2, 4, 7, 0, 6, 5, 1, 8, 3}),
            "reference index descending");
  }

  for (Method m : kAll) {
    for (const auto& input : int_inputs()) {
      SortConfig cfg;
      cfg.build_index = true;
      auto r = sortkit::sort(m, input, cfg);
      require(is_bijection(r.index, input.size()), "index is a bijection");
      require(apply_index(input, r.index) == r.values,
              "applying the index reproduces the sorted sequence");
    }
  }
}

static void test_in_place() {
  for (Method m : kAll) {
    std::vector<int> data{54, 26, 93, 17, 77, 31, 44, 55, 20};
    const auto original = data;
    SortConfig cfg;
    cfg.in_place = true;
    cfg.build_index = true;
    auto r = sortkit::sort(m, data, cfg);
    require(sortkit::is_sorted(data), "in_place sorts the caller's sequence");
    require(r.in_place() && &r.sorted() == &data, "in_place result is the caller's sequence");
    require(r.sorted() == data, "in_place result holds the sorted sequence");
    require(r.values.empty(), "no copy is made for in_place");
    require(apply_index(original, r.index) == data, "in_place index");
  }

  // A fixed-size array's default value must not stand in for the result.
  for (Method m : {Method::quick, Method::heap, Method::shell, Method::bubble}) {
    std::array<int, 4> arr{4, 3, 2, 1};
    SortConfig cfg;
    cfg.in_place = true;
    auto r = sortkit::sort(m, arr, cfg);
    require(arr == std::array<int, 4>{1, 2, 3, 4}, "in_place sorts a std::array");
    require(r.sorted() == std::array<int, 4>{1, 2, 3, 4},
            "in_place std::array result holds the sorted sequence");
    r.sorted()[0] = 9;
    require(arr[0] == 9, "in_place result refers to the caller's array");
  }

  {
    std::vector<int> v{3, 1, 2};
    auto copy = merge_sort(v);
    require(!copy.in_place() && copy.sorted() == std::vector<int>({1, 2, 3}),
            "copy result exposes its own sorted values");
    require(v == std::vector<int>({3, 1, 2}), "copy sort leaves the caller alone");
  }

  const std::vector<int> frozen{3, 1, 2};
  SortConfig cfg;
  cfg.in_place = true;
  require_throws<InvalidParameterError>("in_place on const input",
                                        [&] { (void)insertion_sort(frozen, cfg); });
}

static void test_stability() {
  std::vector<Item> items;
  const int keys[] = {3, 1, 2, 3, 1, 2, 3, 1, 0, 2, 2, 3};
  for (int i = 0; i < 12; ++i) items.push_back(Item{keys[i], i});

  for (Method m : kAll) {
    if (!is_stable(m)) continue;
    for (bool asc : {true, false}) {
      SortConfig cfg;
      cfg.ascending = asc;
      auto r = sortkit::sort(m, items, cfg);
      auto ref = items;
      std::stable_sort(ref.begin(), ref.end(), make_order<Item>(asc));
      require(r.values == ref, "stable method keeps equal keys in input order");
    }
  }

  // All-equal input through a stable sort is the identity.
  std::vector<Item> same;
  for (int i = 0; i < 8; ++i) same.push_back(Item{5, i});
  for (Method m : {Method::bubble, Method::short_bubble, Method::insertion, Method::merge}) {
    SortConfig cfg;
    cfg.build_index = true;
    auto r = sortkit::sort(m, same, cfg);
    require(r.values == same, "all-equal stays in input order");
    for (std::size_t i = 0; i < r.index.size(); ++i)
      require(r.index[i] == i, "all-equal index is the identity");
  }
}

static void test_idempotence() {
  for (Method m : kAll) {
    auto input = random_ints(120, 50, 7);
    auto once = sortkit::sort(m, input);
    auto twice = sortkit::sort(m, once.values);
    require(once.values == twice.values, "sorting sorted input is a no-op");

    SortConfig desc;
    desc.ascending = false;
    auto d1 = sortkit::sort(m, input, desc);
    auto d2 = sortkit::sort(m, d1.values, desc);
    require(d1.values == d2.values, "descending idempotence");
  }
}

static void test_shell_gap() {
  const std::vector<int> a{54, 26, 93, 17, 77, 31, 44, 55, 20};
  for (long long gap = 1; gap <= 9; ++gap) {
    SortConfig cfg;
    cfg.gap = gap;
    auto r = shell_sort(a, cfg);
    require(sortkit::is_sorted(r.values), "every valid gap sorts");
  }
  for (long long bad : {0LL, -3LL, 10LL}) {
    SortConfig cfg;
    cfg.gap = bad;
    require_throws<InvalidParameterError>("gap outside 1..N",
                                          [&] { (void)shell_sort(a, cfg); });
  }
  std::vector<int> empty;
  SortConfig one;
  one.gap = 1;
  require(shell_sort(empty, one).values.empty(), "gap 1 on empty input");
}

static void test_quick_pivots() {
  const auto input = random_ints(200, 30, 11);
  auto ref = input;
  std::sort(ref.begin(), ref.end());
  for (PivotRule rule : {PivotRule::first, PivotRule::last, PivotRule::middle,
                         PivotRule::median_of_three}) {
    SortConfig cfg;
    cfg.pivot = rule;
    cfg.build_index = true;
    auto r = quick_sort(input, cfg);
    require(r.values == ref, "pivot rule sorts");
    require(apply_index(input, r.index) == r.values, "pivot rule index");
  }
  for (long long idx : {0LL, 1LL, 57LL, 199LL}) {
    SortConfig cfg;
    cfg.pivot = PivotRule::index;
    cfg.pivot_index = idx;
    require(quick_sort(input, cfg).values == ref, "pivot index sorts");
  }
  for (double f : {0.0, 0.25, 0.5, 1.0}) {
    SortConfig cfg;
    cfg.pivot = PivotRule::fraction;
    cfg.pivot_fraction = f;
    require(quick_sort(input, cfg).values == ref, "pivot fraction sorts");
  }

  SortConfig bad;
  bad.pivot = PivotRule::index;
  bad.pivot_index = 200;
  require_throws<InvalidParameterError>("pivot index == N",
                                        [&] { (void)quick_sort(input, bad); });
  bad.pivot_index = -1;
  require_throws<InvalidParameterError>("negative pivot index",
                                        [&] { (void)quick_sort(input, bad); });
  bad.pivot_index.reset();
  require_throws<InvalidParameterError>("index rule without index",
                                        [&] { (void)quick_sort(input, bad); });
  SortConfig frac;
  frac.pivot = PivotRule::fraction;
  frac.pivot_fraction = 1.5;
  require_throws<InvalidParameterError>("fraction above 1",
                                        [&] { (void)quick_sort(input, frac); });
}

static void test_quick_adversarial_depth() {
  // Sorted input with a first-element pivot is the worst case for the
  // partition; the sort must still finish without exhausting the stack.
  std::vector<int> sorted(10000);
  for (std::size_t i = 0; i < sorted.size(); ++i) sorted[i] = static_cast<int>(i);
  SortConfig cfg;
  cfg.pivot = PivotRule::first;
  cfg.in_place = true;
  (void)quick_sort(sorted, cfg);
  require(sortkit::is_sorted(sorted), "adversarial quick sort completes");

  std::vector<int> equal(10000, 3);
  (void)quick_sort(equal, cfg);
  require(sortkit::is_sorted(equal), "all-equal quick sort completes");
}

static void test_short_bubble_matches_bubble() {
  for (const auto& input : int_inputs()) {
    SortConfig cfg;
    cfg.build_index = true;
    auto a = bubble_sort(input, cfg);
    auto b = short_bubble_sort(input, cfg);
    require(a.values == b.values && a.index == b.index,
            "early exit does not change the result");
  }
}

static void test_fixed_size_arrays() {
  std::array<int, 6> arr{4, 6, 1, 5, 3, 2};
  SortConfig cfg;
  cfg.build_index = true;
  auto r = quick_sort(arr, cfg);
  require(r.values == std::array<int, 6>{1, 2, 3, 4, 5, 6}, "quick on std::array");
  auto h = heap_sort(arr);
  require(h.values == std::array<int, 6>{1, 2, 3, 4, 5, 6}, "heap on std::array");
  auto s = sortkit::sort(Method::selection, arr);
  require(s.values == std::array<int, 6>{1, 2, 3, 4, 5, 6}, "dispatcher on std::array");
  // merge_sort(arr) does not compile; the dispatcher reports it at run time.
  static_assert(!detail::is_growable<std::array<int, 6>>::value);
  static_assert(detail::is_growable<std::vector<int>>::value);
  require_throws<InvalidParameterError>("merge needs a growable sequence",
                                        [&] { (void)sortkit::sort(Method::merge, arr); });
}

static void test_dispatcher() {
  std::vector<int> a{5, 3, 1, 4, 2};
  SortConfig cfg;
  cfg.ascending = false;
  cfg.build_index = true;
  for (auto name : all_method_names()) {
    auto by_name = sortkit::sort(name, a, cfg);
    auto by_enum = sortkit::sort(parse_method(name), a, cfg);
    require(by_name.values == std::vector<int>({5, 4, 3, 2, 1}), "dispatch by name");
    require(by_name.values == by_enum.values && by_name.index == by_enum.index,
            "name and enum dispatch agree");
  }
  require_throws<UnknownMethodError>("unknown method name",
                                     [&] { (void)sortkit::sort("bogo", a); });
  require_throws<UnknownMethodError>("unknown method id",
                                     [&] { (void)sortkit::sort(static_cast<Method>(42), a); });
}

static void test_reverse_and_apply_index() {
  std::vector<int> v{1, 2, 3, 4, 5};
  sortkit::reverse(v);
  require(v == std::vector<int>({5, 4, 3, 2, 1}), "reverse odd length");
  std::vector<std::string> s{"a", "b"};
  sortkit::reverse(s);
  require(s == std::vector<std::string>({"b", "a"}), "reverse even length");

  std::vector<std::size_t> short_idx{0, 1};
  require_throws<InvalidParameterError>("index length mismatch",
                                        [&] { (void)apply_index(v, short_idx); });
  std::vector<std::size_t> bad_idx{0, 1, 2, 3, 9};
  require_throws<InvalidParameterError>("index entry out of range",
                                        [&] { (void)apply_index(v, bad_idx); });
}

int main() {
  try {
    test_examples();
    test_every_method_orders_permutation();
    test_strings();
    test_index_array();
    test_in_place();
    test_stability();
    test_idempotence();
    test_shell_gap();
    test_quick_pivots();
    test_quick_adversarial_depth();
    test_short_bubble_matches_bubble();
    test_fixed_size_arrays();
    test_dispatcher();
    test_reverse_and_apply_index();
  } catch (const std::exception& e) {
    std::cerr << "Unhandled exception: " << e.what() << "\n";
    return 2;
  }
  std::cout << "OK\n";
  return 0;
}
