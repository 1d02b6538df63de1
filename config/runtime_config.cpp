#include "runtime_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace {

int clamp_int(int value, int min_v, int max_v) {
  return std::max(min_v, std::min(value, max_v));
}

bool ieq(const std::string& a, const char* b) {
  std::string rhs(b);
  if (a.size() != rhs.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    char ca = static_cast<char>(std::tolower(static_cast<unsigned char>(a[i])));
    char cb = static_cast<char>(std::tolower(static_cast<unsigned char>(rhs[i])));
    if (ca != cb) return false;
  }
  return true;
}

int getenv_int(const char* name, int default_value) {
  const char* v = std::getenv(name);
  if (!v || !*v) return default_value;
  char* end = nullptr;
  long parsed = std::strtol(v, &end, 10);
  if (end == v || *end != '\0') return default_value;
  return static_cast<int>(parsed);
}

bool getenv_bool(const char* name, bool default_value) {
  const char* v = std::getenv(name);
  if (!v || !*v) return default_value;
  std::string s(v);
  if (ieq(s, "1") || ieq(s, "true") || ieq(s, "yes") || ieq(s, "on")) return true;
  if (ieq(s, "0") || ieq(s, "false") || ieq(s, "no") || ieq(s, "off")) return false;
  return default_value;
}

std::string getenv_string(const char* name, const std::string& default_value) {
  const char* v = std::getenv(name);
  return (v && *v) ? std::string(v) : default_value;
}

}  // namespace

RuntimeConfig RuntimeConfig::FromEnv() {
  RuntimeConfig cfg;

  cfg.grid_size = clamp_int(getenv_int("GRID_SIZE", cfg.grid_size), 5, 200);
  cfg.initial_tick_ms = clamp_int(getenv_int("INITIAL_TICK_MS", cfg.initial_tick_ms), 10, 5000);
  cfg.min_tick_ms = clamp_int(getenv_int("MIN_TICK_MS", cfg.min_tick_ms), 1, cfg.initial_tick_ms);
  cfg.speed_step_ms = clamp_int(getenv_int("SPEED_STEP_MS", cfg.speed_step_ms), 0, 1000);
  cfg.points_per_speed_step = clamp_int(getenv_int("POINTS_PER_SPEED_STEP", cfg.points_per_speed_step), 1, 100000);
  cfg.food_reward = clamp_int(getenv_int("FOOD_REWARD", cfg.food_reward), 1, 1000);
  cfg.spectator_tick_ms = clamp_int(getenv_int("SPECTATOR_TICK_MS", cfg.spectator_tick_ms), 10, 5000);
  cfg.spectator_turn_percent = clamp_int(getenv_int("SPECTATOR_TURN_PERCENT", cfg.spectator_turn_percent), 0, 100);
  cfg.debug_tps = getenv_bool("DEBUG_TPS", cfg.debug_tps);

  // Unknown mode strings keep the default rather than failing startup.
  const auto mode = game::ParseMode(getenv_string("DEFAULT_MODE", game::ModeName(cfg.default_mode)));
  if (mode.has_value()) cfg.default_mode = *mode;

  cfg.storage_backend = getenv_string("STORAGE_BACKEND", cfg.storage_backend);
  cfg.bind_host = getenv_string("SERVER_BIND_HOST", cfg.bind_host);
  cfg.bind_port = clamp_int(getenv_int("SERVER_BIND_PORT", cfg.bind_port), 1, 65535);

  return cfg;
}

game::SessionConfig RuntimeConfig::ToSessionConfig() const {
  game::SessionConfig out;
  out.grid_size = grid_size;
  out.food_reward = food_reward;
  out.difficulty.base_ms = initial_tick_ms;
  out.difficulty.step_ms = speed_step_ms;
  out.difficulty.points_per_step = points_per_speed_step;
  out.difficulty.min_ms = min_tick_ms;
  return out;
}

int RuntimeConfig::SpectatorIntervalMs() const {
  return std::max(1, spectator_tick_ms);
}
