#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../storage/player_high_scores.h"
#include "../storage/storage.h"
#include "game_session.h"
#include "live_player.h"

namespace game {

// Hosts one GameSession per player for a multi-threaded server.
// Locking: mu_ guards only the player map; each entry carries its own mutex for its session,
// and no storage call is made while mu_ is held. Entries are never erased, so entry pointers
// stay valid after mu_ is released.
class SessionManager {
 public:
  using Clock = std::chrono::steady_clock;

  SessionManager(const SessionConfig& cfg, storage::IStorage& storage, Mode default_mode, uint32_t seed);

  // Creates the player's session on first use; later calls replace it with a fresh Idle one.
  GameSnapshot Reset(const std::string& player_id, const std::string& username, std::optional<Mode> mode);

  std::optional<GameSnapshot> Start(const std::string& player_id);
  std::optional<GameSnapshot> TogglePause(const std::string& player_id);
  std::optional<GameSnapshot> RequestDirection(const std::string& player_id, Dir d);
  std::optional<GameSnapshot> State(const std::string& player_id) const;

  // Ticks each Playing session whose deadline is due, once, and reschedules it from now with
  // its current interval. A session busy with a request is picked up on the next call.
  // New high scores are written to storage after the session lock is released.
  // Returns the number of ticks executed.
  int TickDue(Clock::time_point now);
  // Earliest pending deadline, for the loop's sleep.
  std::optional<Clock::time_point> NextDeadline() const;

  // Games currently in Playing, most watched first.
  std::vector<LivePlayer> LivePlayers() const;
  std::optional<LivePlayer> FindLivePlayer(const std::string& player_id) const;
  void AddViewer(const std::string& player_id);
  void RemoveViewer(const std::string& player_id);

 private:
  // Writes are queued until the caller drops the entry lock. Reads also see queued and
  // already flushed values, so a Reset right after a tick never goes back to an older score.
  class DeferredHighScores : public HighScoreStore {
   public:
    explicit DeferredHighScores(storage::PlayerHighScores& backing) : backing_(backing) {}

    int ReadHighScore(Mode mode) override {
      const int stored = backing_.ReadHighScore(mode);
      auto it = written_.find(mode);
      return it == written_.end() ? stored : std::max(stored, it->second);
    }

    void WriteHighScore(Mode mode, int value) override {
      pending_.emplace_back(mode, value);
      written_[mode] = value;
    }

    std::vector<std::pair<Mode, int>> TakePending() {
      std::vector<std::pair<Mode, int>> out;
      out.swap(pending_);
      return out;
    }

   private:
    storage::PlayerHighScores& backing_;
    std::vector<std::pair<Mode, int>> pending_;
    std::map<Mode, int> written_;
  };

  struct Entry {
    Entry(storage::IStorage& storage, const std::string& player_id)
        : high_scores(storage, player_id), deferred(high_scores) {}

    mutable std::mutex mu;
    std::string username;
    storage::PlayerHighScores high_scores;
    DeferredHighScores deferred;
    std::unique_ptr<GameSession> session;  // null until the first Reset completes
    std::optional<Clock::time_point> next_tick_at;
    int viewers = 0;
  };

  Entry* FindEntry(const std::string& player_id) const;
  std::vector<std::pair<std::string, Entry*>> AllEntries() const;
  static LivePlayer ToLivePlayer(const std::string& player_id, const Entry& e);

  SessionConfig cfg_;
  storage::IStorage& storage_;
  Mode default_mode_;

  mutable std::mutex mu_;
  std::mt19937 seeds_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

}  // namespace game
