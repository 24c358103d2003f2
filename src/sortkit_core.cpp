// sortkit core library
// Names, parameter validation and the type-erased runner used by the CLI
// and the C API.

#include "sortkit/core.hpp"
#include "sortkit/algorithms.hpp"
#include "sortkit/search.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace sortkit {

static constexpr std::array<std::string_view, 8> kMethodNames{
    "bubble", "short_bubble", "selection", "insertion",
    "shell",  "quick",        "merge",     "heap"};

static constexpr std::array<std::string_view, 6> kPivotNames{
    "first", "last", "middle", "median3", "index", "fraction"};

static inline std::string to_lower(std::string_view in) {
  std::string s(in);
  for (char &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string_view method_name(Method m) {
  int i = static_cast<int>(m);
  if (i < 0 || i >= static_cast<int>(kMethodNames.size()))
    throw UnknownMethodError("unknown sort method id " + std::to_string(i));
  return kMethodNames[static_cast<std::size_t>(i)];
}

const std::vector<std::string_view> &all_method_names() {
  static const std::vector<std::string_view> v(kMethodNames.begin(),
                                               kMethodNames.end());
  return v;
}

Method parse_method(std::string_view name) {
  std::string s = to_lower(name);
  std::replace(s.begin(), s.end(), '-', '_');
  if (s == "shortbubble")
    s = "short_bubble";
  for (std::size_t i = 0; i < kMethodNames.size(); ++i)
    if (s == kMethodNames[i])
      return static_cast<Method>(i);
  throw UnknownMethodError("unknown sort method '" + std::string(name) +
                           "'");
}

bool is_stable(Method m) {
  switch (m) {
  case Method::bubble:
  case Method::short_bubble:
  case Method::insertion:
  case Method::merge:
    return true;
  case Method::selection:
  case Method::shell:
  case Method::quick:
  case Method::heap:
    return false;
  }
  return false;
}

std::string_view pivot_rule_name(PivotRule r) {
  int i = static_cast<int>(r);
  if (i < 0 || i >= static_cast<int>(kPivotNames.size()))
    throw InvalidParameterError("invalid pivot rule id " + std::to_string(i));
  return kPivotNames[static_cast<std::size_t>(i)];
}

PivotRule parse_pivot_rule(std::string_view name) {
  std::string s = to_lower(name);
  if (s == "median_of_three" || s == "median-of-three")
    return PivotRule::median_of_three;
  for (std::size_t i = 0; i < kPivotNames.size(); ++i)
    if (s == kPivotNames[i])
      return static_cast<PivotRule>(i);
  throw InvalidParameterError("invalid pivot rule '" + std::string(name) +
                              "' (first|last|middle|median3|index|fraction)");
}

std::string_view heap_mode_name(HeapMode m) {
  switch (m) {
  case HeapMode::min:
    return "min";
  case HeapMode::max:
    return "max";
  }
  throw InvalidModeError("invalid heap mode id " +
                         std::to_string(static_cast<int>(m)));
}

HeapMode parse_heap_mode(std::string_view name) {
  std::string s = to_lower(name);
  if (s == "min")
    return HeapMode::min;
  if (s == "max")
    return HeapMode::max;
  throw InvalidModeError("invalid heap mode '" + std::string(name) +
                         "' (expected min or max)");
}

void check_heap_mode(HeapMode m) {
  if (m != HeapMode::min && m != HeapMode::max)
    throw InvalidModeError("invalid heap mode id " +
                           std::to_string(static_cast<int>(m)) +
                           " (expected min or max)");
}

void validate(const SortConfig &cfg, std::size_t n) {
  // An empty sequence still accepts gap 1 and pivot index 0.
  const long long limit =
      static_cast<long long>(std::max<std::size_t>(n, 1));
  if (cfg.gap && (*cfg.gap < 1 || *cfg.gap > limit))
    throw InvalidParameterError("invalid gap " + std::to_string(*cfg.gap) +
                                " (expected 1.." + std::to_string(limit) +
                                ")");
  switch (cfg.pivot) {
  case PivotRule::first:
  case PivotRule::last:
  case PivotRule::middle:
  case PivotRule::median_of_three:
    return;
  case PivotRule::index:
    if (!cfg.pivot_index)
      throw InvalidParameterError("pivot rule 'index' requires a pivot index");
    if (*cfg.pivot_index < 0 || *cfg.pivot_index >= limit)
      throw InvalidParameterError(
          "invalid pivot index " + std::to_string(*cfg.pivot_index) +
          " (expected 0.." + std::to_string(limit - 1) + ")");
    return;
  case PivotRule::fraction:
    if (!(cfg.pivot_fraction >= 0.0 && cfg.pivot_fraction <= 1.0))
      throw InvalidParameterError("invalid pivot fraction " +
                                  std::to_string(cfg.pivot_fraction) +
                                  " (expected 0..1)");
    return;
  }
  throw InvalidParameterError("invalid pivot rule id " +
                              std::to_string(static_cast<int>(cfg.pivot)));
}

std::string_view elem_type_name(ElemType t) {
  switch (t) {
  case ElemType::i32:
    return "i32";
  case ElemType::u32:
    return "u32";
  case ElemType::i64:
    return "i64";
  case ElemType::u64:
    return "u64";
  case ElemType::f32:
    return "f32";
  case ElemType::f64:
    return "f64";
  case ElemType::str:
    return "str";
  }
  return "i64";
}

ElemType parse_elem_type(std::string_view name) {
  std::string s = to_lower(name);
  for (ElemType t : supported_types())
    if (s == elem_type_name(t))
      return t;
  throw InvalidParameterError("invalid element type '" + std::string(name) +
                              "' (i32|u32|i64|u64|f32|f64|str)");
}

std::vector<ElemType> supported_types() {
  return {ElemType::i32, ElemType::u32, ElemType::i64, ElemType::u64,
          ElemType::f32, ElemType::f64, ElemType::str};
}

std::vector<std::string> list_methods() {
  std::vector<std::string> v;
  for (auto name : kMethodNames)
    v.emplace_back(name);
  return v;
}

// Text <-> element conversion for the runner
template <class T> static T parse_value(const std::string &tok, ElemType t) {
  if constexpr (std::is_same_v<T, std::string>) {
    (void)t;
    return tok;
  } else {
    T v{};
    const char *first = tok.data();
    const char *last = tok.data() + tok.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc() || ptr != last || tok.empty())
      throw TypeMismatchError("cannot read '" + tok + "' as " +
                              std::string(elem_type_name(t)));
    if constexpr (std::is_floating_point_v<T>) {
      if (std::isnan(v))
        throw TypeMismatchError("'" + tok + "' is not orderable (NaN)");
    }
    return v;
  }
}

template <class T> static std::string render_value(const T &v) {
  if constexpr (std::is_same_v<T, std::string>) {
    return v;
  } else {
    std::array<char, 64> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v);
    if (ec != std::errc())
      throw Error("cannot format value");
    return std::string(buf.data(), ptr);
  }
}

template <class T> static RunResult run_for_type(const RunConfig &cfg) {
  std::vector<T> original;
  original.reserve(cfg.values.size());
  for (const auto &tok : cfg.values)
    original.push_back(parse_value<T>(tok, cfg.type));

  std::vector<T> data = original;
  auto res = sortkit::sort(cfg.method, data, cfg.sort);
  const std::vector<T> &sorted = res.sorted();

  if (cfg.verify) {
    auto ref = original;
    std::stable_sort(ref.begin(), ref.end(),
                     make_order<T>(cfg.sort.ascending));
    if (!sortkit::is_sorted(sorted, cfg.sort.ascending))
      throw VerificationError("verification failed (not sorted): " +
                  std::string(method_name(cfg.method)));
    if (sorted != ref)
      throw VerificationError("verification mismatch vs std::stable_sort: " +
                  std::string(method_name(cfg.method)));
    if (cfg.sort.build_index && apply_index(original, res.index) != sorted)
      throw VerificationError("verification failed (index array): " +
                  std::string(method_name(cfg.method)));
  }

  RunResult out;
  out.method = std::string(method_name(cfg.method));
  out.type = cfg.type;
  out.ascending = cfg.sort.ascending;
  out.input = cfg.values;
  out.sorted.reserve(sorted.size());
  for (const auto &v : sorted)
    out.sorted.push_back(render_value(v));
  out.index = std::move(res.index);

  if (cfg.search) {
    const T target = parse_value<T>(*cfg.search, cfg.type);
    out.searched = true;
    if (cfg.search_kind == SearchKind::binary) {
      if (!cfg.sort.ascending)
        throw InvalidParameterError(
            "binary search requires ascending order");
      out.found = sortkit::binary_search(sorted, target);
    } else {
      out.found = sortkit::sequential_search(
          sorted, target, SearchConfig{true, cfg.sort.ascending});
    }
  }
  return out;
}

RunResult run_sort(const RunConfig &cfg) {
  switch (cfg.type) {
  case ElemType::i32:
    return run_for_type<int>(cfg);
  case ElemType::u32:
    return run_for_type<unsigned int>(cfg);
  case ElemType::i64:
    return run_for_type<long long>(cfg);
  case ElemType::u64:
    return run_for_type<unsigned long long>(cfg);
  case ElemType::f32:
    return run_for_type<float>(cfg);
  case ElemType::f64:
    return run_for_type<double>(cfg);
  case ElemType::str:
    return run_for_type<std::string>(cfg);
  }
  throw InvalidParameterError("invalid element type id " +
                              std::to_string(static_cast<int>(cfg.type)));
}

} // namespace sortkit
