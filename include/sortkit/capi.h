#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// These enum values must match sortkit::ElemType, sortkit::Method and
// sortkit::PivotRule
enum sk_elem_type {
  SK_ELEM_I32 = 0,
  SK_ELEM_U32 = 1,
  SK_ELEM_I64 = 2,
  SK_ELEM_U64 = 3,
  SK_ELEM_F32 = 4,
  SK_ELEM_F64 = 5,
  SK_ELEM_STR = 6,
};

enum sk_method {
  SK_METHOD_BUBBLE = 0,
  SK_METHOD_SHORT_BUBBLE = 1,
  SK_METHOD_SELECTION = 2,
  SK_METHOD_INSERTION = 3,
  SK_METHOD_SHELL = 4,
  SK_METHOD_QUICK = 5,
  SK_METHOD_MERGE = 6,
  SK_METHOD_HEAP = 7,
};

enum sk_pivot {
  SK_PIVOT_FIRST = 0,
  SK_PIVOT_LAST = 1,
  SK_PIVOT_MIDDLE = 2,
  SK_PIVOT_MEDIAN3 = 3,
  SK_PIVOT_INDEX = 4,
  SK_PIVOT_FRACTION = 5,
};

enum sk_search {
  SK_SEARCH_NONE = 0,
  SK_SEARCH_SEQUENTIAL = 1,
  SK_SEARCH_BINARY = 2,
};

typedef struct sk_sort_config {
  int method;          // sk_method
  int elem_type;       // sk_elem_type
  const char** values; // input elements as text
  int values_len;
  int descending;
  int build_index;
  int64_t gap;         // shell; 0 = default halving sequence
  int pivot;           // sk_pivot
  int64_t pivot_index;
  double pivot_fraction;
  int search;          // sk_search
  const char* target;
  int verify;
} sk_sort_config;

// Returns malloc-allocated JSON string on success; caller must free via sk_free.
// On error, returns NULL and sets *err_out (also needs sk_free).
char* sk_sort_json(const sk_sort_config* cfg, int pretty, char** err_out);

// Returns JSON array string of method names. Caller frees via sk_free.
char* sk_list_methods_json(char** err_out);

void sk_free(char* p);

#ifdef __cplusplus
}
#endif
