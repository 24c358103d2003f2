// Pure formatting helpers for RunResult
#include "sortkit/core.hpp"

#include <cstdio>
#include <sstream>
#include <string>

namespace sortkit {

static inline std::string esc_json(const std::string &s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '"': o += "\\\""; break;
    case '\\': o += "\\\\"; break;
    case '\n': o += "\\n"; break;
    case '\r': o += "\\r"; break;
    case '\t': o += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[7];
        std::snprintf(buf, sizeof(buf), "\\u%04x", (int)(unsigned char)c);
        o += buf;
      } else {
        o += c;
      }
    }
  }
  return o;
}

// Quote a CSV field only when it needs it.
static inline std::string esc_csv(const std::string &s) {
  if (s.find_first_of(",\"\n\r") == std::string::npos)
    return s;
  std::string o = "\"";
  for (char c : s) {
    if (c == '"')
      o += '"';
    o += c;
  }
  o += '"';
  return o;
}

static inline const char *direction(const RunResult &r) {
  return r.ascending ? "ascending" : "descending";
}

// Infinities have no JSON number form; they are emitted as strings.
static std::string json_value(const RunResult &r, const std::string &v) {
  if (r.type == ElemType::str || v.find("inf") != std::string::npos)
    return "\"" + esc_json(v) + "\"";
  return v;
}

static void json_found(std::ostringstream &os, const RunResult &r) {
  os << "\"found\":";
  if (r.found)
    os << *r.found;
  else
    os << "null";
}

std::string to_csv(const RunResult &r, bool with_header) {
  const bool with_index = !r.index.empty();
  std::ostringstream os;
  if (with_header) {
    os << "position,value";
    if (with_index)
      os << ",index";
    os << '\n';
  }
  for (std::size_t i = 0; i < r.sorted.size(); ++i) {
    os << i << ',' << esc_csv(r.sorted[i]);
    if (with_index)
      os << ',' << r.index[i];
    os << '\n';
  }
  return os.str();
}

std::string to_json(const RunResult &r, bool pretty) {
  std::ostringstream os;
  const char *nl = pretty ? "\n" : "";
  const char *sp = pretty ? "  " : "";
  const char *sep = pretty ? ", " : ",";
  os << "{" << nl;
  os << sp << "\"method\":\"" << esc_json(r.method) << "\"," << nl;
  os << sp << "\"type\":\"" << elem_type_name(r.type) << "\"," << nl;
  os << sp << "\"direction\":\"" << direction(r) << "\"," << nl;
  os << sp << "\"sorted\":[";
  for (std::size_t i = 0; i < r.sorted.size(); ++i) {
    if (i)
      os << sep;
    os << json_value(r, r.sorted[i]);
  }
  os << "]";
  if (!r.index.empty()) {
    os << "," << nl << sp << "\"index\":[";
    for (std::size_t i = 0; i < r.index.size(); ++i) {
      if (i)
        os << sep;
      os << r.index[i];
    }
    os << "]";
  }
  if (r.searched) {
    os << "," << nl << sp;
    json_found(os, r);
  }
  os << nl << "}" << nl;
  return os.str();
}

// One object per sorted element.
std::string to_jsonl(const RunResult &r) {
  std::ostringstream os;
  for (std::size_t i = 0; i < r.sorted.size(); ++i) {
    os << '{' << "\"position\":" << i << ",";
    os << "\"value\":" << json_value(r, r.sorted[i]);
    if (!r.index.empty())
      os << ",\"index\":" << r.index[i];
    os << "}" << '\n';
  }
  if (r.searched) {
    os << '{';
    json_found(os, r);
    os << "}" << '\n';
  }
  return os.str();
}

} // namespace sortkit
