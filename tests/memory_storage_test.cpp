#include <gtest/gtest.h>

#include "storage/memory_storage.h"
#include "storage/player_high_scores.h"

using storage::HighScore;
using storage::MemoryStorage;
using storage::ScoreEntry;
using storage::User;

namespace {

ScoreEntry MakeScore(const std::string& id, int score, const std::string& mode, int64_t created_at) {
  ScoreEntry e;
  e.score_id = id;
  e.user_id = "u-" + id;
  e.username = "name-" + id;
  e.score = score;
  e.mode = mode;
  e.created_at = created_at;
  return e;
}

}  // namespace

TEST(MemoryStorageTest, UsersByIdAndName) {
  MemoryStorage s;
  User u;
  u.user_id = "u1";
  u.username = "alice";
  u.password_hash = "pw";
  ASSERT_TRUE(s.PutUser(u));

  ASSERT_TRUE(s.GetUserById("u1").has_value());
  EXPECT_EQ(s.GetUserById("u1")->username, "alice");
  ASSERT_TRUE(s.GetUserByUsername("alice").has_value());
  EXPECT_EQ(s.GetUserByUsername("alice")->user_id, "u1");
  EXPECT_FALSE(s.GetUserByUsername("bob").has_value());
}

TEST(MemoryStorageTest, RejectsIncompleteRows) {
  MemoryStorage s;
  EXPECT_FALSE(s.PutUser(User{}));
  HighScore h;
  h.user_id = "u1";
  h.mode = "walls";
  h.score = -1;
  EXPECT_FALSE(s.PutHighScore(h));
  EXPECT_FALSE(s.AppendScore(MakeScore("", 10, "walls", 1)));
  EXPECT_FALSE(s.AppendScore(MakeScore("a", -5, "walls", 1)));
}

TEST(MemoryStorageTest, HighScoresAreKeyedByMode) {
  MemoryStorage s;
  HighScore h;
  h.user_id = "u1";
  h.mode = "walls";
  h.score = 40;
  ASSERT_TRUE(s.PutHighScore(h));
  h.score = 60;
  ASSERT_TRUE(s.PutHighScore(h));

  EXPECT_EQ(s.GetHighScore("u1", "walls").value_or(-1), 60);
  EXPECT_FALSE(s.GetHighScore("u1", "pass-through").has_value());
}

TEST(MemoryStorageTest, ListScoresRanksHighestFirst) {
  MemoryStorage s;
  s.AppendScore(MakeScore("a", 30, "walls", 1));
  s.AppendScore(MakeScore("b", 90, "walls", 2));
  s.AppendScore(MakeScore("c", 60, "pass-through", 3));

  const auto all = s.ListScores("", 10);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].score_id, "b");
  EXPECT_EQ(all[1].score_id, "c");
  EXPECT_EQ(all[2].score_id, "a");
  EXPECT_EQ(all[0].rank, 1);
  EXPECT_EQ(all[2].rank, 3);
}

TEST(MemoryStorageTest, ListScoresFiltersByModeAndLimits) {
  MemoryStorage s;
  s.AppendScore(MakeScore("a", 30, "walls", 1));
  s.AppendScore(MakeScore("b", 90, "walls", 2));
  s.AppendScore(MakeScore("c", 60, "pass-through", 3));
  s.AppendScore(MakeScore("d", 70, "walls", 4));

  const auto walls = s.ListScores("walls", 2);
  ASSERT_EQ(walls.size(), 2u);
  EXPECT_EQ(walls[0].score_id, "b");
  EXPECT_EQ(walls[1].score_id, "d");
  EXPECT_EQ(walls[1].rank, 2);
}

TEST(MemoryStorageTest, TiesGoToEarlierScore) {
  MemoryStorage s;
  s.AppendScore(MakeScore("late", 50, "walls", 20));
  s.AppendScore(MakeScore("early", 50, "walls", 10));
  const auto out = s.ListScores("walls", 10);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].score_id, "early");
  EXPECT_EQ(out[1].score_id, "late");
}

TEST(MemoryStorageTest, ResetForDevClearsEverything) {
  MemoryStorage s;
  User u;
  u.user_id = "u1";
  u.username = "alice";
  s.PutUser(u);
  s.AppendScore(MakeScore("a", 30, "walls", 1));
  EXPECT_TRUE(s.HealthCheck());
  ASSERT_TRUE(s.ResetForDev());
  EXPECT_FALSE(s.GetUserById("u1").has_value());
  EXPECT_TRUE(s.ListScores("", 10).empty());
}

TEST(PlayerHighScoresTest, ReadsZeroWhenMissingAndWritesPerMode) {
  MemoryStorage s;
  storage::PlayerHighScores scores(s, "u1");
  EXPECT_EQ(scores.ReadHighScore(game::Mode::Walls), 0);

  scores.WriteHighScore(game::Mode::PassThrough, 120);
  EXPECT_EQ(scores.ReadHighScore(game::Mode::PassThrough), 120);
  EXPECT_EQ(scores.ReadHighScore(game::Mode::Walls), 0);
  EXPECT_EQ(s.GetHighScore("u1", "pass-through").value_or(-1), 120);
}
