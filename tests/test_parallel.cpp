// tests/test_parallel.cpp
#include "test_framework.hpp"
#include "grad_check.hpp"
#include "dg/parallel/parallel_for.hpp"
#include "dg/parallel/config.hpp"
#include "dg/core/config.hpp"
#include "dg/ops/conv.hpp"
#include "dg/ops/dropout.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

using dg::parallel::parallel_for;
using dg::parallel::ScopedMaxThreads;
using dg::parallel::ScopedSerial;

namespace {

// Chunks handed to body for a loop of n with the given grain.
std::vector<std::pair<std::size_t, std::size_t>> chunks_of(std::size_t n, std::size_t grain) {
  std::mutex mu;
  std::vector<std::pair<std::size_t, std::size_t>> out;
  parallel_for(n, grain, [&](std::size_t i0, std::size_t i1) {
    std::lock_guard<std::mutex> lk(mu);
    out.emplace_back(i0, i1);
  });
  return out;
}

bool covers_exactly_once(const std::vector<int>& marks) {
  for (int m : marks) if (m != 1) return false;
  return true;
}

} // namespace

TEST("parallel/ranges_are_disjoint_and_cover") {
  ScopedMaxThreads cap(8);
  std::vector<int> marks(10'000, 0);
  parallel_for(marks.size(), /*grain=*/128, [&](std::size_t i0, std::size_t i1) {
    for (std::size_t i = i0; i < i1; ++i) marks[i] += 1;
  });
  ASSERT_TRUE(covers_exactly_once(marks));
}

TEST("parallel/chunk_count_follows_grain_and_cap") {
  ScopedMaxThreads cap(3);
  // ceil(1000/100) = 10 chunks wanted, capped at 3
  ASSERT_TRUE(chunks_of(1000, 100).size() == 3);
  // grain larger than n: a single inline call over the whole range
  auto one = chunks_of(100, 1000);
  ASSERT_TRUE(one.size() == 1 && one[0].first == 0 && one[0].second == 100);
  // grain 0: one chunk per thread
  ASSERT_TRUE(chunks_of(8'192, 0).size() == 3);
  ASSERT_TRUE(chunks_of(0, 16).empty());
}

TEST("parallel/serial_gates") {
  {
    ScopedMaxThreads cap(8);
    ScopedSerial serial;
    ASSERT_TRUE(chunks_of(20'000, 64).size() == 1);
  }
  {
    ScopedMaxThreads cap(1);
    ASSERT_TRUE(chunks_of(10'000, 64).size() == 1);
  }
}

TEST("parallel/nested_loops_run_inline_on_workers") {
  ScopedMaxThreads cap(8);
  std::vector<int> marks(4096, 0);
  std::atomic<int> inner_calls{0};
  parallel_for(marks.size(), /*grain=*/256, [&](std::size_t i0, std::size_t i1) {
    parallel_for(i1 - i0, /*grain=*/64, [&](std::size_t j0, std::size_t j1) {
      ++inner_calls;
      for (std::size_t j = j0; j < j1; ++j) marks[i0 + j] += 1;
    });
  });
  ASSERT_TRUE(covers_exactly_once(marks));
  ASSERT_TRUE(inner_calls.load() == 8); // one inline call per outer chunk
}

TEST("parallel/body_exception_reaches_caller") {
  ScopedMaxThreads cap(8);
  ASSERT_THROWS(parallel_for(10'000, /*grain=*/256, [](std::size_t i0, std::size_t) {
                  if (i0 == 0) throw std::runtime_error("boom");
                }),
                std::runtime_error);
}

// Kernels split work by output element, so results must not depend on the
// thread count.
TEST("parallel/kernels_independent_of_thread_count") {
  const dg::Tensor A = tfw::wave({37, 53}), B = tfw::wave({53, 29}, 0.4);
  const dg::Tensor X = tfw::wave({4, 3, 9, 9}), W = tfw::wave({5, 3, 3, 3}, 1.1);
  auto run = [&](std::size_t threads) {
    ScopedMaxThreads cap(threads);
    dg::UsingConfig train(dg::ConfigFlag::Train, true);
    return std::vector<dg::Tensor>{
        dg::matmul(A, B),
        dg::conv2d(dg::Variable(X), dg::Variable(W), dg::Variable(), {2, 2}, {1, 1}).data(),
        dg::pooling(dg::Variable(X), {3, 3}, {2, 2}).data(),
        dg::dropout(dg::Variable(tfw::wave({20'000})), 0.3, 42).data()};
  };
  const auto serial = run(1), threaded = run(8);
  for (std::size_t i = 0; i < serial.size(); ++i)
    tfw::expect_tensor_near(serial[i], threaded[i], 1e-12);
}
