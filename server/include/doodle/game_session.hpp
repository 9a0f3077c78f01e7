/*
 * 설명: 그림 맞히기 게임 세션 상태 머신(라운드 수명주기, 출제자 순환, 점수, 힌트, 재접속)을 관리한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_session_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "doodle/connection.hpp"
#include "doodle/connection_registry.hpp"
#include "doodle/hint_generator.hpp"
#include "doodle/history_buffer.hpp"
#include "doodle/message_bus.hpp"
#include "doodle/observability.hpp"
#include "doodle/protocol.hpp"
#include "doodle/scheduler.hpp"
#include "doodle/score_board.hpp"
#include "doodle/store_executor.hpp"
#include "doodle/user_store.hpp"
#include "doodle/word_store.hpp"

namespace doodle {

enum class GamePhase { kIdle, kChoosingWord, kPlaying, kCooldown };

const char* ToString(GamePhase phase);

constexpr std::size_t kQuorum = 2;

struct GameSettings {
  int max_rounds{3};
  int choose_word_time{20};
  int round_time{80};
  int cooldown_time{5};
  int intermission_time{20};
  int hint_window{30};
  int guess_time_cut{5};
  int guess_time_floor{10};
  std::size_t word_choices{3};
  std::size_t draw_history_limit{1000};
  std::size_t chat_history_limit{20};
};

struct Player {
  std::string name;
  std::weak_ptr<Connection> connection;
};

struct PlayerStatus {
  std::string name;
  int score;
  bool guessed;
};

struct GameStatus {
  GamePhase phase;
  std::string game_id;
  int rounds_played;
  int max_rounds;
  std::optional<std::string> drawer;
  int remaining_time;
  std::vector<PlayerStatus> players;
};

// 정답 비율 0이면 빨강, 1이면 초록인 "#rrggbb"
std::string RecapColor(double ratio);

class GameSession : public std::enable_shared_from_this<GameSession> {
 public:
  struct Dependencies {
    std::shared_ptr<ConnectionRegistry> registry;
    std::shared_ptr<Scheduler> scheduler;
    std::shared_ptr<StoreExecutor> store_executor;
    std::shared_ptr<WordStore> word_store;
    std::shared_ptr<UserStore> user_store;
    std::shared_ptr<Observability> observability;
  };

  GameSession(const GameSettings& settings, Dependencies deps, std::uint32_t seed = std::random_device{}());
  ~GameSession();

  GameSession(const GameSession&) = delete;
  GameSession& operator=(const GameSession&) = delete;

  // 아래 진입점은 모두 게임 루프(단일 strand)에서만 호출해야 한다.
  void HandleOpen(const std::shared_ptr<Connection>& connection);
  void HandleMessage(const std::shared_ptr<Connection>& connection, const ClientMessage& message);
  void HandleClose(const std::shared_ptr<Connection>& connection);

  bool StartGame();
  GameStatus Status() const;

  GamePhase Phase() const { return phase_; }
  const std::string& GameId() const { return game_id_; }
  int RoundsPlayed() const { return rounds_played_; }
  std::optional<std::string> Drawer() const;
  const std::optional<std::string>& CurrentWord() const { return round_.word; }
  const std::vector<std::string>& Candidates() const { return round_.candidates; }
  const std::set<std::size_t>& HintsShown() const { return round_.hints_shown; }
  std::string CurrentHint() const;
  int RemainingTime() const { return remaining_time_; }
  const std::vector<std::string>& Roster() const { return roster_; }
  const std::set<std::string>& DrawnThisRotation() const { return drawn_; }
  bool HasGuessed(const std::string& name) const;
  int Score(const std::string& name) const { return scores_.Score(name); }
  const std::map<std::string, int>& RoundLedger() const { return scores_.Ledger(); }
  std::size_t DrawHistorySize() const { return draw_history_.Size(); }
  std::size_t ChatHistorySize() const { return chat_history_.Size(); }

 private:
  struct RoundState {
    std::string drawer;
    std::optional<std::string> word;
    std::vector<std::string> candidates;
    std::set<std::size_t> hints_shown;
    // 재접속해도 같은 라운드에서 다시 점수를 얻지 못하도록 이름으로 기록한다.
    std::set<std::string> guessed;
    int guessing_time{0};
  };

  struct PendingScore {
    int score{0};
    std::string game_id;
  };

  void OnHandshake(const std::shared_ptr<Connection>& connection, const HandshakeMessage& message);
  void OnUserResolved(const std::weak_ptr<Connection>& connection, const Connection* key, std::uint64_t attempt,
                      const StoreResult<std::optional<UserRecord>>& result);
  void OnDraw(const std::string& identity, const DrawMessage& message);
  void OnChat(const std::shared_ptr<Connection>& connection, const std::string& identity, const ChatMessage& message);
  void OnWordChoice(const std::string& identity, const WordChoiceMessage& message);
  std::optional<std::string> ResolveSender(const std::shared_ptr<Connection>& connection, const char* event);

  void Join(const std::shared_ptr<Connection>& connection, const UserRecord& record);
  void Leave(const std::string& identity);
  void ReplayHistory(Connection& connection);

  void PrepareRound();
  void OnWordsFetched(std::uint64_t epoch, const StoreResult<std::vector<std::string>>& result);
  void StartRound(const std::string& word);
  bool OnRoundTick(int elapsed);
  void HandleCorrectGuess(const std::string& identity);
  void RevealHintIfDue();
  void EndRound();
  void EndGame();

  void SetPhase(GamePhase phase);
  void StartTimer(Scheduler::TickFn tick, Scheduler::DoneFn on_done);
  Scheduler::TickFn Countdown(int total);
  void CancelTimer();

  bool EveryoneGuessed() const;
  nlohmann::json PlayerJson(const std::string& name) const;
  void BroadcastPlayer(const std::string& name);
  void BroadcastTimer();
  void BroadcastSystemChat(const std::string& text, const std::string& color);
  void BroadcastSystemChatExcept(const std::string& identity, const std::string& text, const std::string& color);
  void SendSystemChat(Connection& connection, const std::string& text, const std::string& color);
  void PersistScore(const std::string& name);
  void WriteScore(const std::string& name, const PendingScore& pending);
  void OnScoreWritten(const std::string& name);

  GameSettings settings_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Scheduler> scheduler_;
  std::shared_ptr<StoreExecutor> store_executor_;
  std::shared_ptr<WordStore> word_store_;
  std::shared_ptr<UserStore> user_store_;
  std::shared_ptr<Observability> observability_;
  MessageBus bus_;
  HintGenerator hints_;
  ScoreBoard scores_;
  HistoryBuffer<nlohmann::json> draw_history_;
  HistoryBuffer<nlohmann::json> chat_history_;

  GamePhase phase_{GamePhase::kIdle};
  // 상태 전이마다 증가한다. 비동기 완료가 오래된 것인지 판별하는 데 쓴다.
  std::uint64_t epoch_{0};
  std::string game_id_;
  int rounds_played_{0};
  int remaining_time_{0};
  std::set<std::string> drawn_;
  std::vector<std::string> roster_;
  std::map<std::string, Player> players_;
  RoundState round_;
  std::shared_ptr<ScheduledTimer> timer_;
  // 토큰 조회가 진행 중인 연결과 그 조회 번호.
  std::map<const Connection*, std::uint64_t> pending_handshakes_;
  std::uint64_t handshake_seq_{0};
  // 키가 있으면 쓰기가 진행 중이다. 값은 그 뒤에 써야 할 최신 점수.
  std::map<std::string, std::optional<PendingScore>> persist_queue_;
};

}  // namespace doodle
