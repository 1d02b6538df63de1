#include "encode_json.h"

#include <iomanip>
#include <sstream>

namespace protocol {
namespace {

void append_cell(std::ostringstream& out, const game::Cell& c) {
  out << "{\"x\":" << c.x << ",\"y\":" << c.y << "}";
}

void append_cell_array(std::ostringstream& out, const std::vector<game::Cell>& cells) {
  out << "[";
  for (size_t i = 0; i < cells.size(); ++i) {
    append_cell(out, cells[i]);
    if (i + 1 < cells.size()) out << ",";
  }
  out << "]";
}

void append_live_player(std::ostringstream& out, const game::LivePlayer& p) {
  out << "{";
  out << "\"id\":\"" << json_escape(p.id) << "\",";
  out << "\"username\":\"" << json_escape(p.username) << "\",";
  out << "\"score\":" << p.score << ",";
  out << "\"mode\":\"" << game::ModeName(p.mode) << "\",";
  out << "\"snake\":";
  append_cell_array(out, p.snake);
  out << ",";
  out << "\"food\":";
  append_cell(out, p.food);
  out << ",";
  out << "\"direction\":\"" << game::DirName(p.direction) << "\",";
  out << "\"status\":\"" << game::StatusName(p.status) << "\",";
  out << "\"viewers\":" << p.viewers;
  out << "}";
}

}  // namespace

std::string json_escape(const std::string& in) {
  std::ostringstream out;
  for (unsigned char c : in) {
    switch (c) {
      case '\"': out << "\\\""; break;
      case '\\': out << "\\\\"; break;
      case '\b': out << "\\b"; break;
      case '\f': out << "\\f"; break;
      case '\n': out << "\\n"; break;
      case '\r': out << "\\r"; break;
      case '\t': out << "\\t"; break;
      default:
        if (c < 0x20) {
          out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(c) << std::dec;
        } else {
          out << static_cast<char>(c);
        }
    }
  }
  return out.str();
}

std::string encode_game_state_json(const game::GameSnapshot& s) {
  std::ostringstream out;
  out << "{";
  out << "\"v\":" << kProtocolVersion << ",";
  out << "\"tick\":" << s.tick << ",";
  out << "\"grid\":" << s.grid_size << ",";
  out << "\"snake\":";
  append_cell_array(out, s.snake);
  out << ",";
  out << "\"food\":";
  if (s.has_food) {
    append_cell(out, s.food);
  } else {
    out << "null";
  }
  out << ",";
  out << "\"direction\":\"" << game::DirName(s.direction) << "\",";
  out << "\"status\":\"" << game::StatusName(s.status) << "\",";
  out << "\"mode\":\"" << game::ModeName(s.mode) << "\",";
  out << "\"score\":" << s.score << ",";
  out << "\"high_score\":" << s.high_score << ",";
  out << "\"speed\":" << s.tick_interval_ms;
  out << "}";
  return out.str();
}

std::string encode_live_player_json(const game::LivePlayer& p) {
  std::ostringstream out;
  append_live_player(out, p);
  return out.str();
}

std::string encode_live_players_json(const std::vector<game::LivePlayer>& players) {
  std::ostringstream out;
  out << "{\"players\":[";
  for (size_t i = 0; i < players.size(); ++i) {
    append_live_player(out, players[i]);
    if (i + 1 < players.size()) out << ",";
  }
  out << "]}";
  return out.str();
}

std::string encode_leaderboard_json(const std::vector<storage::ScoreEntry>& entries) {
  std::ostringstream out;
  out << "{\"entries\":[";
  for (size_t i = 0; i < entries.size(); ++i) {
    const auto& e = entries[i];
    out << "{";
    out << "\"id\":\"" << json_escape(e.score_id) << "\",";
    out << "\"rank\":" << e.rank << ",";
    out << "\"username\":\"" << json_escape(e.username) << "\",";
    out << "\"score\":" << e.score << ",";
    out << "\"mode\":\"" << json_escape(e.mode) << "\",";
    out << "\"created_at\":" << e.created_at;
    out << "}";
    if (i + 1 < entries.size()) out << ",";
  }
  out << "]}";
  return out.str();
}

}  // namespace protocol
