#pragma once

#include <string>
#include <vector>

#include "../game/game_session.h"
#include "../game/live_player.h"
#include "../storage/models.h"
#include "protocol.h"

namespace protocol {

// DO NOT change field names/types without bumping kProtocolVersion and updating
// frontend parsing code.
std::string encode_game_state_json(const game::GameSnapshot& s);
std::string encode_live_player_json(const game::LivePlayer& p);
std::string encode_live_players_json(const std::vector<game::LivePlayer>& players);
std::string encode_leaderboard_json(const std::vector<storage::ScoreEntry>& entries);

std::string json_escape(const std::string& in);

}  // namespace protocol
