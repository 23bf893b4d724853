#include "dg/core/config.hpp"
#include <cstdlib>
#include <cstring>

namespace dg {
namespace {

bool env_bool(const char* name, bool def) {
  if (const char* s = std::getenv(name)) {
    if (!std::strcmp(s, "1") || !std::strcmp(s, "true") || !std::strcmp(s, "TRUE")) return true;
    if (!std::strcmp(s, "0") || !std::strcmp(s, "false") || !std::strcmp(s, "FALSE")) return false;
  }
  return def;
}

} // namespace

Config& config() {
  static Config cfg{env_bool("DG_GRAD_ENABLED", true), env_bool("DG_TRAIN", true)};
  return cfg;
}

static bool& flag_slot(ConfigFlag flag) {
  return flag == ConfigFlag::EnableBackprop ? config().enable_backprop : config().train;
}

UsingConfig::UsingConfig(ConfigFlag flag, bool value)
  : slot_(flag_slot(flag)), prev_(slot_) {
  slot_ = value;
}

UsingConfig::~UsingConfig() { slot_ = prev_; }

} // namespace dg
