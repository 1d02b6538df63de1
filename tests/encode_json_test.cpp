#include <gtest/gtest.h>

#include "protocol/encode_json.h"

namespace {

game::GameSnapshot MakeSnapshot() {
  game::GameSnapshot s;
  s.snake = {{3, 4}, {2, 4}};
  s.food = {7, 1};
  s.has_food = true;
  s.direction = game::Dir::Up;
  s.status = game::GameStatus::Playing;
  s.mode = game::Mode::PassThrough;
  s.score = 20;
  s.high_score = 50;
  s.tick_interval_ms = 150;
  s.grid_size = 20;
  s.tick = 9;
  return s;
}

}  // namespace

TEST(EncodeJsonTest, GameState) {
  EXPECT_EQ(protocol::encode_game_state_json(MakeSnapshot()),
            "{\"v\":1,\"tick\":9,\"grid\":20,\"snake\":[{\"x\":3,\"y\":4},{\"x\":2,\"y\":4}],"
            "\"food\":{\"x\":7,\"y\":1},\"direction\":\"UP\",\"status\":\"playing\","
            "\"mode\":\"pass-through\",\"score\":20,\"high_score\":50,\"speed\":150}");
}

TEST(EncodeJsonTest, GameStateWithoutFood) {
  game::GameSnapshot s = MakeSnapshot();
  s.has_food = false;
  s.status = game::GameStatus::GameOver;
  const std::string out = protocol::encode_game_state_json(s);
  EXPECT_NE(out.find("\"food\":null"), std::string::npos);
  EXPECT_NE(out.find("\"status\":\"game-over\""), std::string::npos);
}

TEST(EncodeJsonTest, LivePlayersEscapesNames) {
  game::LivePlayer p;
  p.id = "u1";
  p.username = "al\"ice";
  p.score = 10;
  p.snake = {{1, 1}};
  p.food = {2, 2};
  p.viewers = 3;
  EXPECT_EQ(protocol::encode_live_players_json({p}),
            "{\"players\":[{\"id\":\"u1\",\"username\":\"al\\\"ice\",\"score\":10,\"mode\":\"walls\","
            "\"snake\":[{\"x\":1,\"y\":1}],\"food\":{\"x\":2,\"y\":2},\"direction\":\"RIGHT\","
            "\"status\":\"playing\",\"viewers\":3}]}");
  EXPECT_EQ(protocol::encode_live_players_json({}), "{\"players\":[]}");
}

TEST(EncodeJsonTest, Leaderboard) {
  storage::ScoreEntry e;
  e.score_id = "s1";
  e.rank = 1;
  e.username = "bob";
  e.score = 90;
  e.mode = "walls";
  e.created_at = 1700000000;
  EXPECT_EQ(protocol::encode_leaderboard_json({e}),
            "{\"entries\":[{\"id\":\"s1\",\"rank\":1,\"username\":\"bob\",\"score\":90,"
            "\"mode\":\"walls\",\"created_at\":1700000000}]}");
}

TEST(EncodeJsonTest, EscapesControlCharacters) {
  EXPECT_EQ(protocol::json_escape("a\nb\\c"), "a\\nb\\\\c");
  EXPECT_EQ(protocol::json_escape(std::string(1, '\x01')), "\\u0001");
}
