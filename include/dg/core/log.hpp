#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// stderr logging gated by DG_LOG_LEVEL (error|warn|info|debug, default warn)
// and a scoped wall-clock timer gated by DG_BENCH=1.

namespace dg::logging {

enum class Level : int { Error = 0, Warn = 1, Info = 2, Debug = 3 };

inline Level parse_level(const char* s, Level def) {
  if (!s || !*s) return def;
  if (!std::strcmp(s, "error") || !std::strcmp(s, "0")) return Level::Error;
  if (!std::strcmp(s, "warn")  || !std::strcmp(s, "1")) return Level::Warn;
  if (!std::strcmp(s, "info")  || !std::strcmp(s, "2")) return Level::Info;
  if (!std::strcmp(s, "debug") || !std::strcmp(s, "3")) return Level::Debug;
  return def;
}

inline std::atomic<int>& _threshold() {
  static std::atomic<int> v{static_cast<int>(parse_level(std::getenv("DG_LOG_LEVEL"), Level::Warn))};
  return v;
}

inline void set_level(Level l) { _threshold().store(static_cast<int>(l), std::memory_order_relaxed); }
inline Level level() { return static_cast<Level>(_threshold().load(std::memory_order_relaxed)); }
inline bool enabled(Level l) { return static_cast<int>(l) <= _threshold().load(std::memory_order_relaxed); }

inline const char* tag(Level l) {
  switch (l) {
    case Level::Error: return "error";
    case Level::Warn:  return "warn";
    case Level::Info:  return "info";
    case Level::Debug: return "debug";
  }
  return "?";
}

template <class... Args>
inline void write(Level l, const char* fmt, Args... args) {
  std::fprintf(stderr, "[DG][%s] ", tag(l));
  if constexpr (sizeof...(Args) == 0) {
    std::fputs(fmt, stderr);
  } else {
    std::fprintf(stderr, fmt, args...);
  }
  std::fputc('\n', stderr);
  std::fflush(stderr);
}

inline bool bench_enabled_once() {
  static std::atomic<int> cached{-1};
  int v = cached.load(std::memory_order_relaxed);
  if (v < 0) {
    const char* e = std::getenv("DG_BENCH");
    v = (e && *e && *e != '0') ? 1 : 0;
    cached.store(v, std::memory_order_relaxed);
  }
  return v == 1;
}

struct ScopedTimer {
  const char* label;
  bool on;
  std::chrono::steady_clock::time_point t0;

  explicit ScopedTimer(const char* lbl)
    : label(lbl), on(bench_enabled_once()),
      t0(std::chrono::steady_clock::now()) {}

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

  ~ScopedTimer() {
    if (!on) return;
    using namespace std::chrono;
    auto us = duration_cast<microseconds>(steady_clock::now() - t0).count();
    std::fprintf(stderr, "[DG][bench] %s | %lld us\n",
                 label ? label : "(unnamed)", static_cast<long long>(us));
    std::fflush(stderr);
  }
};

} // namespace dg::logging

#define DG_LOG(lvl, ...) \
  do { if (::dg::logging::enabled(::dg::logging::Level::lvl)) ::dg::logging::write(::dg::logging::Level::lvl, __VA_ARGS__); } while (0)

#define DG_CONCAT_TIMER(a,b) DG_CONCAT_TIMER_IMPL(a,b)
#define DG_CONCAT_TIMER_IMPL(a,b) a##b
#define DG_BENCH(label_literal) ::dg::logging::ScopedTimer DG_CONCAT_TIMER(dg_timer_, __LINE__){label_literal}
