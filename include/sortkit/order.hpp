// Direction policy shared by every algorithm: the only place a raw
// comparison between elements happens.

#pragma once

namespace sortkit {

template <class T> struct Order {
  bool ascending = true;

  // True when a must come before b in the requested direction.
  bool operator()(const T &a, const T &b) const {
    return ascending ? (a < b) : (b < a);
  }
};

template <class T> inline Order<T> make_order(bool ascending) {
  return Order<T>{ascending};
}

} // namespace sortkit
