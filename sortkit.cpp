#include <cctype>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "sortkit/core.hpp"

enum class OutFmt : int { csv = 0, json = 1, jsonl = 2 };

// Command-line options
struct Options {
  sortkit::RunConfig run;       // method, type, values, sort/search config
  OutFmt format = OutFmt::csv;  // output format
  bool csv_header = true;       // print header by default
  bool list = false;            // list available methods and exit
  bool demo = false;            // run the built-in examples
};

static inline std::string to_lower(std::string s) {
  for (char &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static long long parse_int(const std::string &flag, const std::string &v) {
  std::size_t pos = 0;
  long long x = 0;
  try {
    x = std::stoll(v, &pos, 10);
  } catch (const std::exception &) {
    pos = 0;
  }
  if (pos == 0 || pos != v.size())
    throw sortkit::InvalidParameterError("Invalid " + flag + ": " + v);
  return x;
}

static double parse_double(const std::string &flag, const std::string &v) {
  std::size_t pos = 0;
  double x = 0.0;
  try {
    x = std::stod(v, &pos);
  } catch (const std::exception &) {
    pos = 0;
  }
  if (pos == 0 || pos != v.size())
    throw sortkit::InvalidParameterError("Invalid " + flag + ": " + v);
  return x;
}

static void print_usage(const char *argv0) {
  std::cerr << "Usage: " << argv0
            << " [--method "
               "bubble|short_bubble|selection|insertion|shell|quick|merge|heap]"
               " [--descending] [--index] [--gap G] [--pivot RULE|N] "
               "[--pivot-frac F] [--type i32|u32|i64|u64|f32|f64|str] "
               "[--format csv|json|jsonl] [--no-header] [--search V] "
               "[--sequential] [--verify] [--list] [--demo] [values...]\n";
  std::cerr << "       values are read from stdin (whitespace separated) "
               "when none are given\n";
  std::cerr << "       --pivot first|last|middle|median3 or a start index "
               "(default first)\n";
  std::cerr << "       --pivot-frac F (pivot at fraction F of each "
               "partition, 0..1)\n";
  std::cerr << "       --search V (binary search in the sorted output; "
               "--sequential for a linear scan)\n";
  std::cerr << "       --verify (check the result against std::stable_sort; "
               "exit 4 on mismatch)\n";
}

static Options parse_args(int argc, char **argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    auto get_value_inline =
        [&](std::string_view arg,
            std::string_view key) -> std::optional<std::string> {
      if (arg.size() > key.size() + 1 && arg.substr(0, key.size()) == key &&
          arg[key.size()] == '=') {
        return std::string(arg.substr(key.size() + 1));
      }
      return std::nullopt;
    };
    auto need_value = [&](std::string_view flag) {
      if (i + 1 >= argc) {
        throw std::runtime_error(std::string("Missing value for ") +
                                 std::string(flag));
      }
      return std::string(argv[++i]);
    };
    auto value_of = [&](std::string_view key) {
      if (auto v = get_value_inline(a, key))
        return *v;
      return need_value(a);
    };
    if (a == "--method" || a == "-m" || a.rfind("--method=", 0) == 0) {
      opt.run.method = sortkit::parse_method(value_of("--method"));
    } else if (a == "--descending" || a == "-d") {
      opt.run.sort.ascending = false;
    } else if (a == "--index") {
      opt.run.sort.build_index = true;
    } else if (a == "--gap" || a.rfind("--gap=", 0) == 0) {
      opt.run.sort.gap = parse_int("--gap", value_of("--gap"));
    } else if (a == "--pivot" || a.rfind("--pivot=", 0) == 0) {
      std::string v = value_of("--pivot");
      if (!v.empty() && (std::isdigit(static_cast<unsigned char>(v[0])) ||
                         v[0] == '-')) {
        opt.run.sort.pivot = sortkit::PivotRule::index;
        opt.run.sort.pivot_index = parse_int("--pivot", v);
      } else {
        opt.run.sort.pivot = sortkit::parse_pivot_rule(v);
      }
    } else if (a == "--pivot-frac" || a.rfind("--pivot-frac=", 0) == 0) {
      opt.run.sort.pivot = sortkit::PivotRule::fraction;
      opt.run.sort.pivot_fraction =
          parse_double("--pivot-frac", value_of("--pivot-frac"));
    } else if (a == "--type" || a.rfind("--type=", 0) == 0) {
      opt.run.type = sortkit::parse_elem_type(value_of("--type"));
    } else if (a == "--format" || a.rfind("--format=", 0) == 0) {
      std::string v = to_lower(value_of("--format"));
      if (v == "csv")
        opt.format = OutFmt::csv;
      else if (v == "json")
        opt.format = OutFmt::json;
      else if (v == "jsonl")
        opt.format = OutFmt::jsonl;
      else
        throw std::runtime_error("Invalid --format (csv|json|jsonl): " + v);
    } else if (a == "--no-header") {
      opt.csv_header = false;
    } else if (a == "--search" || a.rfind("--search=", 0) == 0) {
      opt.run.search = value_of("--search");
    } else if (a == "--sequential") {
      opt.run.search_kind = sortkit::SearchKind::sequential;
    } else if (a == "--binary") {
      opt.run.search_kind = sortkit::SearchKind::binary;
    } else if (a == "--verify") {
      opt.run.verify = true;
    } else if (a == "--list") {
      opt.list = true;
    } else if (a == "--demo") {
      opt.demo = true;
    } else if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (a == "--") {
      for (++i; i < argc; ++i)
        opt.run.values.emplace_back(argv[i]);
    } else if (a.size() > 1 && a[0] == '-' && a[1] == '-') {
      std::cerr << "Unknown argument: " << a << "\n";
      print_usage(argv[0]);
      std::exit(2);
    } else {
      opt.run.values.emplace_back(a);
    }
  }
  return opt;
}

static void emit(const sortkit::RunResult &r, const Options &opt) {
  switch (opt.format) {
  case OutFmt::csv:
    std::cout << sortkit::to_csv(r, opt.csv_header);
    if (r.searched) {
      std::cout << "found,";
      if (r.found)
        std::cout << *r.found;
      std::cout << '\n';
    }
    break;
  case OutFmt::json:
    std::cout << sortkit::to_json(r, true);
    break;
  case OutFmt::jsonl:
    std::cout << sortkit::to_jsonl(r);
    break;
  }
}

// Worked examples: a small integer list through every method, a descending
// merge sort and a string list through heap sort.
static int run_demo(const Options &opt) {
  const std::vector<std::string> numbers{"54", "26", "93", "17", "77",
                                         "31", "44", "55", "20"};
  const std::vector<std::string> letters{"d", "f", "a", "k", "b", "g", "z"};

  auto show = [&](const std::string &title, sortkit::RunConfig cfg) {
    cfg.sort.build_index = true;
    cfg.verify = true;
    std::cout << "== " << title << "\n";
    emit(sortkit::run_sort(cfg), opt);
  };

  for (auto name : sortkit::all_method_names()) {
    sortkit::RunConfig cfg;
    cfg.method = sortkit::parse_method(name);
    cfg.values = numbers;
    if (cfg.method == sortkit::Method::shell)
      cfg.sort.gap = 3;
    show(std::string(name) + " sort", cfg);
  }
  {
    sortkit::RunConfig cfg;
    cfg.values = numbers;
    cfg.sort.ascending = false;
    show("merge sort, descending", cfg);
  }
  {
    sortkit::RunConfig cfg;
    cfg.method = sortkit::Method::heap;
    cfg.type = sortkit::ElemType::str;
    cfg.values = letters;
    show("heap sort, strings", cfg);
  }
  {
    sortkit::RunConfig cfg;
    cfg.method = sortkit::Method::quick;
    cfg.values = numbers;
    cfg.search = "44";
    show("quick sort + binary search for 44", cfg);
  }
  return 0;
}

int main(int argc, char **argv) {
  try {
    Options opt = parse_args(argc, argv);
    if (opt.list) {
      for (const auto &name : sortkit::list_methods())
        std::cout << name << "\n";
      return 0;
    }
    if (opt.demo)
      return run_demo(opt);
    if (opt.run.values.empty()) {
      std::string tok;
      while (std::cin >> tok)
        opt.run.values.push_back(tok);
    }
    emit(sortkit::run_sort(opt.run), opt);
  } catch (const sortkit::VerificationError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 4;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
  return 0;
}
