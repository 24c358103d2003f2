#include "sortkit/core.hpp"
#include "sortkit/capi.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>
#include <vector>

using namespace sortkit;

static char* dup_cstr(const std::string& s) {
  char* p = (char*)std::malloc(s.size() + 1);
  if (!p) return nullptr;
  std::memcpy(p, s.c_str(), s.size() + 1);
  return p;
}

extern "C" char* sk_sort_json(const sk_sort_config* c, int pretty, char** err_out) {
  if (err_out) *err_out = nullptr;
  try {
    if (!c) throw InvalidParameterError("null configuration");
    RunConfig cfg;
    cfg.method = static_cast<Method>(c->method);
    method_name(cfg.method); // rejects ids outside sk_method
    cfg.type = static_cast<ElemType>(c->elem_type);
    for (int i = 0; i < c->values_len; ++i) {
      if (!c->values || !c->values[i])
        throw TypeMismatchError("null element at position " + std::to_string(i));
      cfg.values.emplace_back(c->values[i]);
    }
    cfg.sort.ascending = (c->descending == 0);
    cfg.sort.build_index = (c->build_index != 0);
    if (c->gap != 0) cfg.sort.gap = (long long)c->gap;
    cfg.sort.pivot = static_cast<PivotRule>(c->pivot);
    if (cfg.sort.pivot == PivotRule::index) cfg.sort.pivot_index = (long long)c->pivot_index;
    cfg.sort.pivot_fraction = c->pivot_fraction;
    if (c->search != SK_SEARCH_NONE) {
      if (!c->target) throw InvalidParameterError("search requested without a target");
      cfg.search = std::string(c->target);
      cfg.search_kind = (c->search == SK_SEARCH_BINARY ? SearchKind::binary : SearchKind::sequential);
    }
    cfg.verify = (c->verify != 0);

    RunResult r = run_sort(cfg);
    std::string js = to_json(r, pretty != 0);
    return dup_cstr(js);
  } catch (const std::exception& e) {
    if (err_out) *err_out = dup_cstr(std::string("error: ") + e.what());
    return nullptr;
  }
}

extern "C" char* sk_list_methods_json(char** err_out) {
  if (err_out) *err_out = nullptr;
  try {
    std::vector<std::string> names = list_methods();
    std::string js = "[";
    for (std::size_t i = 0; i < names.size(); ++i) {
      if (i) js += ",";
      js += "\"" + names[i] + "\"";
    }
    js += "]";
    return dup_cstr(js);
  } catch (const std::exception& e) {
    if (err_out) *err_out = dup_cstr(std::string("error: ") + e.what());
    return nullptr;
  }
}

extern "C" void sk_free(char* p) {
  if (p) std::free(p);
}
