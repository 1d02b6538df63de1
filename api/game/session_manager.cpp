#include "session_manager.h"

#include <algorithm>

namespace game {

SessionManager::SessionManager(const SessionConfig& cfg, storage::IStorage& storage, Mode default_mode, uint32_t seed)
    : cfg_(cfg), storage_(storage), default_mode_(default_mode), seeds_(seed) {}

GameSnapshot SessionManager::Reset(const std::string& player_id, const std::string& username, std::optional<Mode> mode) {
  Entry* e = nullptr;
  uint32_t seed = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto& slot = entries_[player_id];
    if (!slot) slot = std::make_unique<Entry>(storage_, player_id);
    e = slot.get();
    seed = static_cast<uint32_t>(seeds_());
  }

  // Building a session reads the high score from storage; only this player waits on it.
  std::lock_guard<std::mutex> lock(e->mu);
  if (!e->session) {
    e->session = std::make_unique<GameSession>(cfg_, mode.value_or(default_mode_), e->deferred, seed);
  } else {
    e->session->Reset(mode);
  }
  if (!username.empty()) e->username = username;
  e->next_tick_at.reset();
  return e->session->Snapshot();
}

std::optional<GameSnapshot> SessionManager::Start(const std::string& player_id) {
  Entry* e = FindEntry(player_id);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lock(e->mu);
  if (!e->session) return std::nullopt;
  e->session->Start();
  return e->session->Snapshot();
}

std::optional<GameSnapshot> SessionManager::TogglePause(const std::string& player_id) {
  Entry* e = FindEntry(player_id);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lock(e->mu);
  if (!e->session) return std::nullopt;
  e->session->TogglePause();
  // A resumed session waits a full interval before its next move.
  e->next_tick_at.reset();
  return e->session->Snapshot();
}

std::optional<GameSnapshot> SessionManager::RequestDirection(const std::string& player_id, Dir d) {
  Entry* e = FindEntry(player_id);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lock(e->mu);
  if (!e->session) return std::nullopt;
  e->session->RequestDirection(d);
  return e->session->Snapshot();
}

std::optional<GameSnapshot> SessionManager::State(const std::string& player_id) const {
  Entry* e = FindEntry(player_id);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lock(e->mu);
  if (!e->session) return std::nullopt;
  return e->session->Snapshot();
}

int SessionManager::TickDue(Clock::time_point now) {
  int ticks = 0;
  for (const auto& kv : AllEntries()) {
    Entry& e = *kv.second;
    std::vector<std::pair<Mode, int>> writes;
    {
      std::unique_lock<std::mutex> lock(e.mu, std::try_to_lock);
      if (!lock.owns_lock() || !e.session) continue;

      if (e.session->Status() != GameStatus::Playing) {
        e.next_tick_at.reset();
        continue;
      }
      if (!e.next_tick_at.has_value()) {
        e.next_tick_at = now + std::chrono::milliseconds(e.session->TickIntervalMs());
        continue;
      }
      if (now < *e.next_tick_at) continue;

      e.session->Tick();
      ++ticks;
      if (e.session->Status() == GameStatus::Playing) {
        e.next_tick_at = now + std::chrono::milliseconds(e.session->TickIntervalMs());
      } else {
        e.next_tick_at.reset();
      }
      writes = e.deferred.TakePending();
    }

    for (const auto& w : writes) {
      e.high_scores.WriteHighScore(w.first, w.second);
    }
  }
  return ticks;
}

std::optional<SessionManager::Clock::time_point> SessionManager::NextDeadline() const {
  std::optional<Clock::time_point> out;
  for (const auto& kv : AllEntries()) {
    const Entry& e = *kv.second;
    std::unique_lock<std::mutex> lock(e.mu, std::try_to_lock);
    if (!lock.owns_lock() || !e.next_tick_at.has_value()) continue;
    if (!out.has_value() || *e.next_tick_at < *out) out = e.next_tick_at;
  }
  return out;
}

std::vector<LivePlayer> SessionManager::LivePlayers() const {
  std::vector<LivePlayer> out;
  for (const auto& kv : AllEntries()) {
    const Entry& e = *kv.second;
    // Busy entries are skipped; the one held across a storage read is mid-Reset and not Playing.
    std::unique_lock<std::mutex> lock(e.mu, std::try_to_lock);
    if (!lock.owns_lock()) continue;
    if (e.session && e.session->Status() == GameStatus::Playing) {
      out.push_back(ToLivePlayer(kv.first, e));
    }
  }
  std::sort(out.begin(), out.end(), [](const LivePlayer& a, const LivePlayer& b) {
    if (a.viewers != b.viewers) return a.viewers > b.viewers;
    return a.id < b.id;
  });
  return out;
}

std::optional<LivePlayer> SessionManager::FindLivePlayer(const std::string& player_id) const {
  Entry* e = FindEntry(player_id);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lock(e->mu);
  if (!e->session || e->session->Status() != GameStatus::Playing) return std::nullopt;
  return ToLivePlayer(player_id, *e);
}

void SessionManager::AddViewer(const std::string& player_id) {
  Entry* e = FindEntry(player_id);
  if (!e) return;
  std::lock_guard<std::mutex> lock(e->mu);
  ++e->viewers;
}

void SessionManager::RemoveViewer(const std::string& player_id) {
  Entry* e = FindEntry(player_id);
  if (!e) return;
  std::lock_guard<std::mutex> lock(e->mu);
  if (e->viewers > 0) --e->viewers;
}

SessionManager::Entry* SessionManager::FindEntry(const std::string& player_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(player_id);
  return it == entries_.end() ? nullptr : it->second.get();
}

std::vector<std::pair<std::string, SessionManager::Entry*>> SessionManager::AllEntries() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::pair<std::string, Entry*>> out;
  out.reserve(entries_.size());
  for (const auto& kv : entries_) out.emplace_back(kv.first, kv.second.get());
  return out;
}

LivePlayer SessionManager::ToLivePlayer(const std::string& player_id, const Entry& e) {
  const GameSession& s = *e.session;
  LivePlayer out;
  out.id = player_id;
  out.username = e.username;
  out.score = s.Score();
  out.mode = s.CurrentMode();
  out.snake = s.SnakeBody();
  out.food = s.Food();
  out.direction = s.Direction();
  out.status = s.Status();
  out.viewers = e.viewers;
  return out;
}

}  // namespace game
