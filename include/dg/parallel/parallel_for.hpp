#pragma once
// Pool-backed 1-D parallel_for (grain-aware, runs inline when nested or capped)
#include <algorithm>
#include <cstddef>
#include <utility>

#include "dg/parallel/config.hpp"
#include "dg/parallel/pool.hpp"

namespace dg { namespace parallel {

// body(i0, i1) is called on disjoint half-open ranges covering [0, n).
template <class Fn>
inline void parallel_for(std::size_t n, std::size_t grain, Fn&& body) {
  using std::size_t;
  if (n == 0) return;

  const size_t T = std::max<size_t>(1, std::min(get_max_threads(), n));
  if (T == 1 || serial_override()) {
    body(size_t{0}, n);
    return;
  }

  const size_t chunks = (grain == 0)
      ? T
      : std::max<size_t>(1, std::min(T, (n + grain - 1) / grain));
  if (chunks == 1) {
    body(size_t{0}, n);
    return;
  }

  const size_t q = n / chunks, r = n % chunks;
  for (size_t k = 0; k < chunks; ++k) {
    const size_t lo = k * q + std::min(k, r);
    const size_t hi = lo + q + (k < r ? 1 : 0);
    submit_range(lo, hi, [&body](size_t i0, size_t i1){
      if (i1 > i0) body(i0, i1);
    });
  }
  wait_for_all();
}

template <class Fn>
inline void parallel_for(std::size_t n, Fn&& body) {
  parallel_for(n, /*grain=*/0, std::forward<Fn>(body));
}

}} // namespace dg::parallel
