#include <gtest/gtest.h>

#include <cstdlib>

#include "config/runtime_config.h"

namespace {

const char* kVars[] = {"GRID_SIZE", "INITIAL_TICK_MS", "MIN_TICK_MS", "SPEED_STEP_MS",
                       "POINTS_PER_SPEED_STEP", "FOOD_REWARD", "SPECTATOR_TICK_MS",
                       "SPECTATOR_TURN_PERCENT", "DEFAULT_MODE", "DEBUG_TPS", "STORAGE_BACKEND",
                       "SERVER_BIND_HOST", "SERVER_BIND_PORT"};

class RuntimeConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearAll(); }
  void TearDown() override { ClearAll(); }

  static void ClearAll() {
    for (const char* v : kVars) unsetenv(v);
  }
};

}  // namespace

TEST_F(RuntimeConfigTest, Defaults) {
  const RuntimeConfig cfg = RuntimeConfig::FromEnv();
  EXPECT_EQ(cfg.grid_size, 20);
  EXPECT_EQ(cfg.initial_tick_ms, 150);
  EXPECT_EQ(cfg.min_tick_ms, 50);
  EXPECT_EQ(cfg.food_reward, 10);
  EXPECT_EQ(cfg.default_mode, game::Mode::Walls);
  EXPECT_FALSE(cfg.debug_tps);
  EXPECT_EQ(cfg.storage_backend, "memory");
  EXPECT_EQ(cfg.bind_port, 8080);
}

TEST_F(RuntimeConfigTest, ReadsAndClampsValues) {
  setenv("GRID_SIZE", "1000", 1);
  setenv("INITIAL_TICK_MS", "100", 1);
  setenv("MIN_TICK_MS", "400", 1);
  setenv("SPECTATOR_TURN_PERCENT", "-4", 1);
  setenv("DEBUG_TPS", "yes", 1);
  setenv("SERVER_BIND_PORT", "9090", 1);
  const RuntimeConfig cfg = RuntimeConfig::FromEnv();
  EXPECT_EQ(cfg.grid_size, 200);
  EXPECT_EQ(cfg.initial_tick_ms, 100);
  EXPECT_EQ(cfg.min_tick_ms, 100);
  EXPECT_EQ(cfg.spectator_turn_percent, 0);
  EXPECT_TRUE(cfg.debug_tps);
  EXPECT_EQ(cfg.bind_port, 9090);
}

TEST_F(RuntimeConfigTest, GarbageFallsBackToDefaults) {
  setenv("GRID_SIZE", "twenty", 1);
  setenv("DEFAULT_MODE", "spiral", 1);
  setenv("DEBUG_TPS", "maybe", 1);
  const RuntimeConfig cfg = RuntimeConfig::FromEnv();
  EXPECT_EQ(cfg.grid_size, 20);
  EXPECT_EQ(cfg.default_mode, game::Mode::Walls);
  EXPECT_FALSE(cfg.debug_tps);
}

TEST_F(RuntimeConfigTest, ModeParsingIsCaseInsensitive) {
  setenv("DEFAULT_MODE", "Pass-Through", 1);
  EXPECT_EQ(RuntimeConfig::FromEnv().default_mode, game::Mode::PassThrough);
}

TEST_F(RuntimeConfigTest, SessionConfigCarriesCurve) {
  setenv("GRID_SIZE", "30", 1);
  setenv("FOOD_REWARD", "25", 1);
  setenv("SPEED_STEP_MS", "10", 1);
  const game::SessionConfig sc = RuntimeConfig::FromEnv().ToSessionConfig();
  EXPECT_EQ(sc.grid_size, 30);
  EXPECT_EQ(sc.food_reward, 25);
  EXPECT_EQ(sc.difficulty.step_ms, 10);
  EXPECT_EQ(sc.difficulty.TickIntervalMs(50), 140);
}
