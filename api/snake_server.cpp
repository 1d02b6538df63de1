// snake_server.cpp
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <aws/core/Aws.h>

#include "auth/accounts.h"
#include "game/game_types.h"
#include "game/session_manager.h"
#include "game/spectator_simulator.h"
#include "httplib.h"
#include "protocol/encode_json.h"
#include "storage/storage_factory.h"
#include "../config/runtime_config.h"

using namespace std;

static constexpr size_t DEFAULT_LEADERBOARD_LIMIT = 10;
static constexpr size_t MAX_LEADERBOARD_LIMIT = 100;

static int64_t now_epoch_s() {
  return static_cast<int64_t>(time(nullptr));
}

static optional<string> get_json_string_field(const string& body, const string& key) {
  const string pat = "\"" + key + "\"";
  size_t p = body.find(pat);
  if (p == string::npos) return nullopt;
  p = body.find(':', p);
  if (p == string::npos) return nullopt;
  ++p;
  while (p < body.size() && isspace(static_cast<unsigned char>(body[p]))) ++p;
  if (p >= body.size() || body[p] != '"') return nullopt;
  ++p;
  size_t e = body.find('"', p);
  if (e == string::npos) return nullopt;
  return body.substr(p, e - p);
}

static optional<int> get_json_int_field(const string& body, const string& key) {
  const string pat = "\"" + key + "\"";
  size_t p = body.find(pat);
  if (p == string::npos) return nullopt;
  p = body.find(':', p);
  if (p == string::npos) return nullopt;
  ++p;
  while (p < body.size() && isspace(static_cast<unsigned char>(body[p]))) ++p;
  size_t e = p;
  if (e < body.size() && body[e] == '-') ++e;
  while (e < body.size() && isdigit(static_cast<unsigned char>(body[e]))) ++e;
  if (e == p || (e == p + 1 && body[p] == '-')) return nullopt;
  try {
    return stoi(body.substr(p, e - p));
  } catch (const exception&) {
    return nullopt;
  }
}

static optional<string> bearer_token(const httplib::Request& req) {
  auto it = req.headers.find("Authorization");
  if (it == req.headers.end()) return nullopt;
  const string& v = it->second;
  const string prefix = "Bearer ";
  if (v.rfind(prefix, 0) != 0) return nullopt;
  return v.substr(prefix.size());
}

static optional<string> require_auth_user(auth::Accounts& accounts, const httplib::Request& req) {
  auto token = bearer_token(req);
  if (!token) return nullopt;
  return accounts.UserForToken(*token);
}

static string encode_login_json(const auth::LoginResult& r) {
  ostringstream o;
  o << "{\"token\":\"" << protocol::json_escape(r.token) << "\","
    << "\"user_id\":\"" << protocol::json_escape(r.user_id) << "\","
    << "\"username\":\"" << protocol::json_escape(r.username) << "\"}";
  return o.str();
}

static void add_cors(httplib::Response& res) {
  res.set_header("Access-Control-Allow-Origin", "*");
  res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
  res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

static void send_error(httplib::Response& res, int status, const string& code) {
  res.status = status;
  res.set_content("{\"error\":\"" + protocol::json_escape(code) + "\"}", "application/json");
}

static void send_state(httplib::Response& res, const optional<game::GameSnapshot>& snap) {
  if (!snap) {
    send_error(res, 404, "no_session");
    return;
  }
  res.set_content(protocol::encode_game_state_json(*snap), "application/json");
}

static bool ensure_user(storage::IStorage& storage, const string& user_id, const string& username, const string& password) {
  auto existing = storage.GetUserById(user_id);
  if (existing.has_value()) return true;

  storage::User u;
  u.user_id = user_id;
  u.username = username;
  u.password_hash = password;
  u.created_at = now_epoch_s();
  return storage.PutUser(u);
}

static bool seed(storage::IStorage& storage) {
  if (!ensure_user(storage, "1", "user1", "pass1") || !ensure_user(storage, "2", "user2", "pass2")) {
    cerr << "Failed to seed users\n";
    return false;
  }
  cout << "Seeded users: user1/pass1, user2/pass2\n";
  return true;
}

int main(int argc, char** argv) {
  const string mode = (argc >= 2) ? argv[1] : "serve";

  Aws::SDKOptions aws_options;
  Aws::InitAPI(aws_options);

  RuntimeConfig runtime_cfg = RuntimeConfig::FromEnv();

  cout << "RuntimeConfig: "
       << "GRID_SIZE=" << runtime_cfg.grid_size
       << ", INITIAL_TICK_MS=" << runtime_cfg.initial_tick_ms
       << ", MIN_TICK_MS=" << runtime_cfg.min_tick_ms
       << ", SPEED_STEP_MS=" << runtime_cfg.speed_step_ms
       << ", POINTS_PER_SPEED_STEP=" << runtime_cfg.points_per_speed_step
       << ", FOOD_REWARD=" << runtime_cfg.food_reward
       << ", SPECTATOR_TICK_MS=" << runtime_cfg.spectator_tick_ms
       << ", DEFAULT_MODE=" << game::ModeName(runtime_cfg.default_mode)
       << ", STORAGE_BACKEND=" << runtime_cfg.storage_backend
       << ", DEBUG_TPS=" << (runtime_cfg.debug_tps ? "true" : "false")
       << "\n";

  unique_ptr<storage::IStorage> storage;
  try {
    storage = storage::CreateStorageFromEnv();
  } catch (const exception& e) {
    cerr << "Storage config error: " << e.what() << "\n";
    Aws::ShutdownAPI(aws_options);
    return 1;
  }

  if (!storage->HealthCheck()) {
    cerr << "Storage health check failed\n";
    Aws::ShutdownAPI(aws_options);
    return 1;
  }

  if (mode == "reset") {
    if (!storage->ResetForDev()) {
      cerr << "Storage reset failed\n";
      Aws::ShutdownAPI(aws_options);
      return 1;
    }
    cout << "Storage reset complete.\n";
    Aws::ShutdownAPI(aws_options);
    return 0;
  }
  if (mode == "seed") {
    const bool ok = seed(*storage);
    Aws::ShutdownAPI(aws_options);
    return ok ? 0 : 1;
  }
  if (mode != "serve") {
    cerr << "Usage: ./snake_server [serve|seed|reset]\n";
    Aws::ShutdownAPI(aws_options);
    return 1;
  }

  // The memory backend starts empty on every boot; give it the demo accounts.
  if (runtime_cfg.storage_backend == "memory" && !seed(*storage)) {
    Aws::ShutdownAPI(aws_options);
    return 1;
  }

  game::SessionManager sessions(runtime_cfg.ToSessionConfig(), *storage, runtime_cfg.default_mode,
                                static_cast<uint32_t>(random_device{}()));
  atomic<bool> running{true};

  // Sessions are rescheduled individually after each tick since their interval shrinks with score.
  thread loop([&] {
    using clock = chrono::steady_clock;

    uint64_t ticks_since_log = 0;
    auto next_log_at = clock::now() + chrono::seconds(5);

    while (running.load()) {
      auto now = clock::now();
      ticks_since_log += static_cast<uint64_t>(sessions.TickDue(now));

      if (runtime_cfg.debug_tps && now >= next_log_at) {
        cout << "[rate] ticks/5s=" << ticks_since_log << "\n";
        ticks_since_log = 0;
        next_log_at += chrono::seconds(5);
      }

      auto max_sleep_until = clock::now() + chrono::milliseconds(5);
      auto deadline = sessions.NextDeadline();
      this_thread::sleep_until(deadline ? min(*deadline, max_sleep_until) : max_sleep_until);
    }
  });

  auth::Accounts accounts(*storage);
  httplib::Server srv;

  srv.Options(R"(.*)", [&](const httplib::Request&, httplib::Response& res) {
    add_cors(res);
    res.status = 204;
  });

  srv.Get("/game/runtime", [&](const httplib::Request&, httplib::Response& res) {
    add_cors(res);
    ostringstream o;
    o << "{"
      << "\"protocol\":" << protocol::kProtocolVersion << ","
      << "\"grid_size\":" << runtime_cfg.grid_size << ","
      << "\"initial_tick_ms\":" << runtime_cfg.initial_tick_ms << ","
      << "\"min_tick_ms\":" << runtime_cfg.min_tick_ms << ","
      << "\"speed_step_ms\":" << runtime_cfg.speed_step_ms << ","
      << "\"points_per_speed_step\":" << runtime_cfg.points_per_speed_step << ","
      << "\"food_reward\":" << runtime_cfg.food_reward << ","
      << "\"spectator_tick_ms\":" << runtime_cfg.spectator_tick_ms << ","
      << "\"default_mode\":\"" << game::ModeName(runtime_cfg.default_mode) << "\""
      << "}";
    res.set_content(o.str(), "application/json");
  });

  srv.Post("/auth/login", [&](const httplib::Request& req, httplib::Response& res) {
    add_cors(res);
    auto u = get_json_string_field(req.body, "username");
    auto p = get_json_string_field(req.body, "password");
    if (!u || !p) {
      send_error(res, 400, "bad_request");
      return;
    }

    auto login = accounts.Login(*u, *p);
    if (!login) {
      send_error(res, 401, "unauthorized");
      return;
    }
    res.set_content(encode_login_json(*login), "application/json");
  });

  srv.Post("/auth/signup", [&](const httplib::Request& req, httplib::Response& res) {
    add_cors(res);
    auto u = get_json_string_field(req.body, "username");
    auto p = get_json_string_field(req.body, "password");
    if (!u || !p) {
      send_error(res, 400, "bad_request");
      return;
    }

    auth::LoginResult created;
    switch (accounts.Signup(*u, *p, created)) {
      case auth::SignupStatus::Created:
        cout << "New user: " << created.username << " (" << created.user_id << ")\n";
        res.status = 201;
        res.set_content(encode_login_json(created), "application/json");
        return;
      case auth::SignupStatus::InvalidInput:
        send_error(res, 400, "bad_credentials");
        return;
      case auth::SignupStatus::UsernameTaken:
        send_error(res, 409, "username_taken");
        return;
      case auth::SignupStatus::StorageError:
        send_error(res, 500, "user_write_failed");
        return;
    }
  });

  srv.Get("/auth/me", [&](const httplib::Request& req, httplib::Response& res) {
    add_cors(res);
    auto uid = require_auth_user(accounts, req);
    if (!uid) {
      send_error(res, 401, "unauthorized");
      return;
    }
    auto user = storage->GetUserById(*uid);
    if (!user) {
      send_error(res, 404, "user_not_found");
      return;
    }
    ostringstream o;
    o << "{\"user_id\":\"" << protocol::json_escape(user->user_id) << "\","
      << "\"username\":\"" << protocol::json_escape(user->username) << "\","
      << "\"created_at\":" << user->created_at << "}";
    res.set_content(o.str(), "application/json");
  });

  srv.Post("/auth/logout", [&](const httplib::Request& req, httplib::Response& res) {
    add_cors(res);
    auto token = bearer_token(req);
    if (!token || !accounts.Logout(*token)) {
      send_error(res, 401, "unauthorized");
      return;
    }
    res.set_content("{\"status\":\"OK\"}", "application/json");
  });

  srv.Post("/game/reset", [&](const httplib::Request& req, httplib::Response& res) {
    add_cors(res);
    auto uid = require_auth_user(accounts, req);
    if (!uid) {
      send_error(res, 401, "unauthorized");
      return;
    }

    optional<game::Mode> mode;
    if (auto m = get_json_string_field(req.body, "mode")) {
      mode = game::ParseMode(*m);
      if (!mode) {
        send_error(res, 400, "bad_mode");
        return;
      }
    }

    auto user = storage->GetUserById(*uid);
    const string username = user ? user->username : "";
    res.set_content(protocol::encode_game_state_json(sessions.Reset(*uid, username, mode)), "application/json");
  });

  srv.Post("/game/start", [&](const httplib::Request& req, httplib::Response& res) {
    add_cors(res);
    auto uid = require_auth_user(accounts, req);
    if (!uid) {
      send_error(res, 401, "unauthorized");
      return;
    }
    send_state(res, sessions.Start(*uid));
  });

  srv.Post("/game/pause", [&](const httplib::Request& req, httplib::Response& res) {
    add_cors(res);
    auto uid = require_auth_user(accounts, req);
    if (!uid) {
      send_error(res, 401, "unauthorized");
      return;
    }
    send_state(res, sessions.TogglePause(*uid));
  });

  srv.Post("/game/dir", [&](const httplib::Request& req, httplib::Response& res) {
    add_cors(res);
    auto uid = require_auth_user(accounts, req);
    if (!uid) {
      send_error(res, 401, "unauthorized");
      return;
    }

    auto d = get_json_string_field(req.body, "dir");
    auto dir = d ? game::ParseDir(*d) : nullopt;
    if (!dir) {
      send_error(res, 400, "bad_dir");
      return;
    }
    send_state(res, sessions.RequestDirection(*uid, *dir));
  });

  srv.Get("/game/state", [&](const httplib::Request& req, httplib::Response& res) {
    add_cors(res);
    auto uid = require_auth_user(accounts, req);
    if (!uid) {
      send_error(res, 401, "unauthorized");
      return;
    }
    send_state(res, sessions.State(*uid));
  });

  srv.Get("/live/players", [&](const httplib::Request&, httplib::Response& res) {
    add_cors(res);
    res.set_content(protocol::encode_live_players_json(sessions.LivePlayers()), "application/json");
  });

  srv.Get(R"(/live/players/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
    add_cors(res);
    auto player = sessions.FindLivePlayer(req.matches[1]);
    if (!player) {
      send_error(res, 404, "player_not_found");
      return;
    }
    res.set_content(protocol::encode_live_player_json(*player), "application/json");
  });

  // Each connection plays back its own copy of the player's snapshot and never writes it back.
  srv.Get(R"(/live/players/([^/]+)/stream)", [&](const httplib::Request& req, httplib::Response& res) {
    add_cors(res);
    const string player_id = req.matches[1];
    auto player = sessions.FindLivePlayer(player_id);
    if (!player) {
      send_error(res, 404, "player_not_found");
      return;
    }

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("Content-Type", "text/event-stream");

    sessions.AddViewer(player_id);
    game::SpectatorSimulator sim(runtime_cfg.grid_size, runtime_cfg.food_reward, runtime_cfg.spectator_turn_percent,
                                 static_cast<uint32_t>(random_device{}()));
    const int frame_ms = runtime_cfg.SpectatorIntervalMs();

    res.set_chunked_content_provider(
        "text/event-stream",
        [&running, frame_ms, sim, current = *player](size_t, httplib::DataSink& sink) mutable {
          while (running.load()) {
            const string payload = "event: frame\ndata: " + protocol::encode_live_player_json(current) + "\n\n";
            if (!sink.write(payload.data(), payload.size())) break;
            current = sim.Step(current);
            this_thread::sleep_for(chrono::milliseconds(frame_ms));
          }
          sink.done();
          return true;
        },
        [&sessions, player_id](bool) { sessions.RemoveViewer(player_id); });
  });

  srv.Get("/leaderboard", [&](const httplib::Request& req, httplib::Response& res) {
    add_cors(res);
    string mode_filter;
    if (req.has_param("mode")) {
      auto m = game::ParseMode(req.get_param_value("mode"));
      if (!m) {
        send_error(res, 400, "bad_mode");
        return;
      }
      mode_filter = game::ModeName(*m);
    }

    size_t limit = DEFAULT_LEADERBOARD_LIMIT;
    if (req.has_param("limit")) {
      const int parsed = atoi(req.get_param_value("limit").c_str());
      limit = static_cast<size_t>(max(1, min(static_cast<int>(MAX_LEADERBOARD_LIMIT), parsed)));
    }
    res.set_content(protocol::encode_leaderboard_json(storage->ListScores(mode_filter, limit)), "application/json");
  });

  srv.Post("/leaderboard/submit", [&](const httplib::Request& req, httplib::Response& res) {
    add_cors(res);
    auto uid = require_auth_user(accounts, req);
    if (!uid) {
      send_error(res, 401, "unauthorized");
      return;
    }

    auto score = get_json_int_field(req.body, "score");
    if (!score || *score < 0) {
      send_error(res, 400, "bad_score");
      return;
    }
    auto m = get_json_string_field(req.body, "mode");
    auto mode = m ? game::ParseMode(*m) : nullopt;
    if (!mode) {
      send_error(res, 400, "bad_mode");
      return;
    }
    auto user = storage->GetUserById(*uid);
    if (!user) {
      send_error(res, 404, "user_not_found");
      return;
    }

    storage::ScoreEntry entry;
    entry.score_id = auth::RandomToken(16);
    entry.user_id = user->user_id;
    entry.username = user->username;
    entry.score = *score;
    entry.mode = game::ModeName(*mode);
    entry.created_at = now_epoch_s();
    if (!storage->AppendScore(entry)) {
      send_error(res, 500, "score_write_failed");
      return;
    }

    ostringstream o;
    o << "{\"status\":\"OK\",\"id\":\"" << protocol::json_escape(entry.score_id) << "\"}";
    res.set_content(o.str(), "application/json");
  });

  cout << "Server on http://" << runtime_cfg.bind_host << ":" << runtime_cfg.bind_port << "\n";
  cout << "Auth:   POST /auth/signup|login|logout, GET /auth/me\n";
  cout << "Play:   POST /game/reset|start|pause|dir, GET /game/state\n";
  cout << "Watch:  GET /live/players, GET /live/players/{id}/stream\n";
  cout << "Scores: GET /leaderboard, POST /leaderboard/submit\n";

  if (!srv.listen(runtime_cfg.bind_host, runtime_cfg.bind_port)) {
    cerr << "Failed to bind " << runtime_cfg.bind_host << ":" << runtime_cfg.bind_port << "\n";
  }

  running.store(false);
  loop.join();
  Aws::ShutdownAPI(aws_options);
  return 0;
}
