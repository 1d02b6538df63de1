#include <gtest/gtest.h>

#include "game/spectator_simulator.h"

using game::Body;
using game::Cell;
using game::Dir;
using game::GameStatus;
using game::LivePlayer;
using game::SpectatorSimulator;

namespace {

LivePlayer MakePlayer() {
  LivePlayer p;
  p.id = "user1";
  p.username = "alice";
  p.score = 20;
  p.snake = {{5, 5}, {4, 5}, {3, 5}};
  p.food = {15, 15};
  p.direction = Dir::Right;
  p.status = GameStatus::Playing;
  return p;
}

}  // namespace

TEST(SpectatorSimulatorTest, MovesOneCellWithoutTurning) {
  SpectatorSimulator sim(20, 10, 0, 1);
  const LivePlayer next = sim.Step(MakePlayer());
  EXPECT_EQ(next.snake, (Body{{6, 5}, {5, 5}, {4, 5}}));
  EXPECT_EQ(next.direction, Dir::Right);
  EXPECT_EQ(next.score, 20);
  EXPECT_EQ(next.food, (Cell{15, 15}));
}

TEST(SpectatorSimulatorTest, InputSnapshotIsNotModified) {
  SpectatorSimulator sim(20, 10, 100, 1);
  const LivePlayer in = MakePlayer();
  sim.Step(in);
  EXPECT_EQ(in.snake, (Body{{5, 5}, {4, 5}, {3, 5}}));
  EXPECT_EQ(in.direction, Dir::Right);
  EXPECT_EQ(in.score, 20);
}

TEST(SpectatorSimulatorTest, AlwaysWrapsAtEdges) {
  SpectatorSimulator sim(20, 10, 0, 1);
  LivePlayer p = MakePlayer();
  p.snake = {{0, 3}, {1, 3}};
  p.direction = Dir::Left;
  EXPECT_EQ(sim.Step(p).snake.front(), (Cell{19, 3}));

  p.snake = {{4, 19}, {4, 18}};
  p.direction = Dir::Down;
  EXPECT_EQ(sim.Step(p).snake.front(), (Cell{4, 0}));
}

TEST(SpectatorSimulatorTest, EatingGrowsAndMovesFood) {
  SpectatorSimulator sim(20, 10, 0, 1);
  LivePlayer p = MakePlayer();
  p.food = {6, 5};
  const LivePlayer next = sim.Step(p);
  EXPECT_EQ(next.snake, (Body{{6, 5}, {5, 5}, {4, 5}, {3, 5}}));
  EXPECT_EQ(next.score, 30);
  EXPECT_NE(next.food, (Cell{6, 5}));
  EXPECT_FALSE(game::Occupies(next.snake, next.food));
}

TEST(SpectatorSimulatorTest, RunningIntoItselfIsNotFatal) {
  SpectatorSimulator sim(20, 10, 0, 1);
  LivePlayer p = MakePlayer();
  p.snake = {{5, 5}, {6, 5}, {6, 6}, {5, 6}, {4, 6}};
  p.direction = Dir::Down;
  const LivePlayer next = sim.Step(p);
  EXPECT_EQ(next.status, GameStatus::Playing);
  EXPECT_EQ(next.snake.front(), (Cell{5, 6}));
}

TEST(SpectatorSimulatorTest, RandomTurnsNeverReverse) {
  SpectatorSimulator sim(20, 10, 100, 7);
  LivePlayer p = MakePlayer();
  for (int i = 0; i < 500; ++i) {
    const LivePlayer next = sim.Step(p);
    EXPECT_NE(next.direction, game::OppositeDir(p.direction));
    p = next;
  }
}

TEST(SpectatorSimulatorTest, FullTurnRateStillChangesCourse) {
  SpectatorSimulator sim(20, 10, 100, 3);
  LivePlayer p = MakePlayer();
  bool turned = false;
  for (int i = 0; i < 50 && !turned; ++i) {
    const LivePlayer next = sim.Step(p);
    turned = next.direction != p.direction;
    p = next;
  }
  EXPECT_TRUE(turned);
}

TEST(SpectatorSimulatorTest, NonPlayingSnapshotsAreFrozen) {
  SpectatorSimulator sim(20, 10, 100, 1);
  LivePlayer p = MakePlayer();
  p.status = GameStatus::Paused;
  const LivePlayer next = sim.Step(p);
  EXPECT_EQ(next.snake, p.snake);
  EXPECT_EQ(next.direction, p.direction);

  p.status = GameStatus::GameOver;
  EXPECT_EQ(sim.Step(p).snake, p.snake);
}

TEST(SpectatorSimulatorTest, SameSeedSamePlayback) {
  SpectatorSimulator a(20, 10, 30, 99);
  SpectatorSimulator b(20, 10, 30, 99);
  LivePlayer pa = MakePlayer();
  LivePlayer pb = MakePlayer();
  for (int i = 0; i < 100; ++i) {
    pa = a.Step(pa);
    pb = b.Step(pb);
    ASSERT_EQ(pa.snake, pb.snake);
    ASSERT_EQ(pa.direction, pb.direction);
  }
}
