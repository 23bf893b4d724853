#pragma once

namespace dg {

// Process-wide mode flags.
//   enable_backprop: record graph edges when operations run (DG_GRAD_ENABLED)
//   train:           training-time behaviour such as dropout (DG_TRAIN)
// Not synchronized: use from one thread, or guard externally.
struct Config {
  bool enable_backprop = true;
  bool train = true;
};

Config& config();

inline bool is_grad_enabled() { return config().enable_backprop; }
inline void set_grad_enabled(bool v) { config().enable_backprop = v; }
inline bool is_training() { return config().train; }
inline void set_training(bool v) { config().train = v; }

enum class ConfigFlag { EnableBackprop, Train };

// Sets one flag for the lifetime of the guard and restores the previous
// value on every exit path.
class UsingConfig {
public:
  UsingConfig(ConfigFlag flag, bool value);
  ~UsingConfig();

  UsingConfig(const UsingConfig&) = delete;
  UsingConfig& operator=(const UsingConfig&) = delete;

private:
  bool& slot_;
  bool prev_;
};

struct NoGradGuard : UsingConfig {
  NoGradGuard() : UsingConfig(ConfigFlag::EnableBackprop, false) {}
};

struct EvalModeGuard : UsingConfig {
  EvalModeGuard() : UsingConfig(ConfigFlag::Train, false) {}
};

} // namespace dg
