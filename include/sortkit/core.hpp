// Public API for sortkit core
// Provides configuration, errors, method names and a type-erased runner
// that sorts or searches textual input without any CLI parsing or file I/O.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sortkit {

// Error taxonomy. Every error is thrown synchronously to the caller.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed configuration (gap, pivot index, pivot fraction).
class InvalidParameterError : public Error {
public:
  using Error::Error;
};

class UnknownMethodError : public Error {
public:
  using Error::Error;
};

class EmptyHeapError : public Error {
public:
  using Error::Error;
};

class InvalidModeError : public Error {
public:
  using Error::Error;
};

// Elements that cannot be brought under one order (unparsable token, NaN).
class TypeMismatchError : public Error {
public:
  using Error::Error;
};

// Raised by RunConfig::verify when an algorithm disagrees with the reference.
class VerificationError : public Error {
public:
  using Error::Error;
};

// Sorting methods understood by the dispatcher
enum class Method : int {
  bubble = 0,
  short_bubble = 1,
  selection = 2,
  insertion = 3,
  shell = 4,
  quick = 5,
  merge = 6,
  heap = 7,
};

std::string_view method_name(Method m);
const std::vector<std::string_view> &all_method_names();
// Throws UnknownMethodError for anything not in all_method_names().
Method parse_method(std::string_view name);
// True for bubble, short_bubble, insertion and merge.
bool is_stable(Method m);

// How quick sort picks the pivot of each partition
enum class PivotRule : int {
  first = 0,
  last = 1,
  middle = 2,
  median_of_three = 3,
  index = 4,    // SortConfig::pivot_index, clamped to each partition
  fraction = 5, // SortConfig::pivot_fraction of each partition
};

std::string_view pivot_rule_name(PivotRule r);
PivotRule parse_pivot_rule(std::string_view name);

enum class HeapMode : int { min = 0, max = 1 };

std::string_view heap_mode_name(HeapMode m);
// Throws InvalidModeError for anything but "min" or "max".
HeapMode parse_heap_mode(std::string_view name);
// Throws InvalidModeError if m is not one of the enumerators.
void check_heap_mode(HeapMode m);

struct SortConfig {
  bool ascending = true;
  bool in_place = false;
  bool build_index = false;
  std::optional<long long> gap;         // shell: initial gap, 1..N
  PivotRule pivot = PivotRule::first;   // quick
  std::optional<long long> pivot_index; // quick, PivotRule::index: 0..N-1
  double pivot_fraction = 0.0;          // quick, PivotRule::fraction: [0, 1]
};

// Check the algorithm-specific parameters against an input of length n.
// Throws InvalidParameterError naming the offending value.
void validate(const SortConfig &cfg, std::size_t n);

// Element types accepted by the type-erased runner
enum class ElemType : int { i32, u32, i64, u64, f32, f64, str };
std::string_view elem_type_name(ElemType t);
ElemType parse_elem_type(std::string_view name);
std::vector<ElemType> supported_types();

enum class SearchKind : int { sequential = 0, binary = 1 };

struct RunConfig {
  Method method = Method::merge;
  ElemType type = ElemType::i64;
  std::vector<std::string> values;   // input elements as text
  SortConfig sort;
  std::optional<std::string> search; // target; searched in the sorted output
  SearchKind search_kind = SearchKind::binary;
  bool verify = false;               // compare against std::stable_sort
};

struct RunResult {
  std::string method;
  ElemType type = ElemType::i64;
  bool ascending = true;
  std::vector<std::string> input;
  std::vector<std::string> sorted;
  std::vector<std::size_t> index;   // empty unless build_index
  bool searched = false;
  std::optional<std::size_t> found; // position in `sorted`
};

// Parse, sort and optionally search the configured input.
// Throws TypeMismatchError on unparsable input, InvalidParameterError on bad
// parameters, and VerificationError when verification fails.
RunResult run_sort(const RunConfig &cfg);

std::vector<std::string> list_methods();

// Formatting helpers (pure; no file I/O)
std::string to_csv(const RunResult &r, bool with_header = true);
std::string to_json(const RunResult &r, bool pretty = true);
std::string to_jsonl(const RunResult &r);

} // namespace sortkit
