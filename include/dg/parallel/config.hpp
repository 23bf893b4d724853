#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <thread>

#include "dg/core/log.hpp"

namespace dg { namespace parallel {

namespace detail {

inline std::size_t hardware_threads() {
  const unsigned hc = std::thread::hardware_concurrency();
  return hc ? std::size_t(hc) : std::size_t(4);
}

// DG_THREADS=<n>; anything unparsable falls back to the hardware count.
inline std::size_t threads_from_env() {
  const std::size_t hw = hardware_threads();
  const char* env = std::getenv("DG_THREADS");
  if (!env || !*env) return hw;
  char* end = nullptr;
  const unsigned long v = std::strtoul(env, &end, 10);
  if (*end != '\0') {
    DG_LOG(Warn, "DG_THREADS='%s' is not a number; using %zu", env, hw);
    return hw;
  }
  return std::max<std::size_t>(1, v);
}

inline std::atomic<std::size_t>& thread_cap() {
  static std::atomic<std::size_t> cap{threads_from_env()};
  return cap;
}

inline int& serial_depth() { static thread_local int d = 0; return d; }
inline bool& nesting_flag() { static thread_local bool f = false; return f; }

} // namespace detail

// Upper bound on the chunks a parallel_for splits into and on the size of a
// lazily created pool. Zero is clamped to one.
inline void set_max_threads(std::size_t n) {
  detail::thread_cap().store(std::max<std::size_t>(1, n), std::memory_order_relaxed);
}
inline std::size_t get_max_threads() {
  return detail::thread_cap().load(std::memory_order_relaxed);
}

// Restores the previous thread cap on scope exit.
class ScopedMaxThreads {
public:
  explicit ScopedMaxThreads(std::size_t n) : prev_(get_max_threads()) { set_max_threads(n); }
  ~ScopedMaxThreads() { set_max_threads(prev_); }
  ScopedMaxThreads(const ScopedMaxThreads&) = delete;
  ScopedMaxThreads& operator=(const ScopedMaxThreads&) = delete;
private:
  std::size_t prev_;
};

// Every parallel_for on this thread runs inline while one is alive.
struct ScopedSerial {
  ScopedSerial() { ++detail::serial_depth(); }
  ~ScopedSerial() { --detail::serial_depth(); }
  ScopedSerial(const ScopedSerial&) = delete;
  ScopedSerial& operator=(const ScopedSerial&) = delete;
  static int depth() { return detail::serial_depth(); }
};

// Set by pool workers for the duration of a task; nested loops go inline.
struct NestedParallelGuard {
  NestedParallelGuard() : prev_(detail::nesting_flag()) { detail::nesting_flag() = true; }
  ~NestedParallelGuard() { detail::nesting_flag() = prev_; }
  NestedParallelGuard(const NestedParallelGuard&) = delete;
  NestedParallelGuard& operator=(const NestedParallelGuard&) = delete;
  static bool active() { return detail::nesting_flag(); }
private:
  bool prev_;
};

inline bool serial_override() {
  return ScopedSerial::depth() > 0 || NestedParallelGuard::active() || get_max_threads() <= 1;
}

}} // namespace dg::parallel
