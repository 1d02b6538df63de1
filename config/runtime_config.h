#pragma once

#include <string>

#include "../api/game/game_session.h"
#include "../api/game/game_types.h"

struct RuntimeConfig {
  int grid_size = 20;
  int initial_tick_ms = 150;
  int min_tick_ms = 50;
  int speed_step_ms = 5;
  int points_per_speed_step = 50;
  int food_reward = 10;
  int spectator_tick_ms = 150;
  int spectator_turn_percent = 30;
  game::Mode default_mode = game::Mode::Walls;
  bool debug_tps = false;
  std::string storage_backend = "memory";
  std::string bind_host = "127.0.0.1";
  int bind_port = 8080;

  static RuntimeConfig FromEnv();
  game::SessionConfig ToSessionConfig() const;
  int SpectatorIntervalMs() const;
};
