#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace tickplot::model {

// Chronologically ordered OHLC points stored as parallel arrays.
// Timestamps are epoch milliseconds (period open time).
struct PriceSeries {
  std::vector<int64_t> timestamps;
  std::vector<double>  open;
  std::vector<double>  high;
  std::vector<double>  low;
  std::vector<double>  close;

  void append(int64_t ts, double o, double h, double l, double c) {
    timestamps.push_back(ts);
    open.push_back(o);
    high.push_back(h);
    low.push_back(l);
    close.push_back(c);
  }

  // Length of the shortest array, so mismatched input never indexes past an end.
  [[nodiscard]] size_t size() const {
    size_t n = timestamps.size();
    if (open.size() < n) n = open.size();
    if (high.size() < n) n = high.size();
    if (low.size() < n) n = low.size();
    if (close.size() < n) n = close.size();
    return n;
  }
  [[nodiscard]] bool empty() const { return size() == 0; }
};

struct PriceBounds {
  double min_price{0.0};
  double max_price{0.0};
};

} // namespace tickplot::model
