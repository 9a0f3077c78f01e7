/*
 * 설명: 그림 맞히기 게임 세션 상태 머신을 구현한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_session_test.cpp
 */
#include "doodle/game_session.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <utility>

#include "doodle/guess.hpp"
#include "doodle/random_token.hpp"

namespace doodle {
namespace {

constexpr const char* kSystemSender = "";
constexpr const char* kNoticeColor = "#607d8b";
constexpr const char* kSuccessColor = "#2e7d32";
constexpr const char* kCloseColor = "#f57c00";
constexpr const char* kErrorColor = "#d32f2f";
constexpr std::size_t kGameIdBytes = 8;
constexpr std::size_t kTokenLogPrefix = 6;

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// work는 저장소 스레드에서, completion은 게임 루프에서 실행된다. 예외는 StoreResult.error로 옮긴다.
template <typename T, typename Work, typename Completion>
void SubmitStoreCall(StoreExecutor& executor, Work work, Completion completion) {
  auto result = std::make_shared<StoreResult<T>>();
  executor.Submit(
      [result, work = std::move(work)]() {
        try {
          result->value.emplace(work());
        } catch (const std::exception& ex) {
          result->error = ex.what();
        }
      },
      [result, completion = std::move(completion)]() { completion(*result); });
}

nlohmann::json SystemLine(const std::string& text, const std::string& color) {
  return ToJson(ChatMessage{kSystemSender, text, color});
}

}  // namespace

const char* ToString(GamePhase phase) {
  switch (phase) {
    case GamePhase::kIdle:
      return "idle";
    case GamePhase::kChoosingWord:
      return "choosing_word";
    case GamePhase::kPlaying:
      return "playing";
    case GamePhase::kCooldown:
      return "cooldown";
  }
  return "unknown";
}

std::string RecapColor(double ratio) {
  ratio = std::clamp(ratio, 0.0, 1.0);
  const int red = static_cast<int>(std::lround(255.0 * (1.0 - ratio)));
  const int green = static_cast<int>(std::lround(255.0 * ratio));
  char buffer[8];
  std::snprintf(buffer, sizeof(buffer), "#%02x%02x00", red, green);
  return buffer;
}

GameSession::GameSession(const GameSettings& settings, Dependencies deps, std::uint32_t seed)
    : settings_(settings),
      registry_(std::move(deps.registry)),
      scheduler_(std::move(deps.scheduler)),
      store_executor_(std::move(deps.store_executor)),
      word_store_(std::move(deps.word_store)),
      user_store_(std::move(deps.user_store)),
      observability_(std::move(deps.observability)),
      bus_(registry_),
      hints_(seed),
      draw_history_(settings.draw_history_limit),
      chat_history_(settings.chat_history_limit) {
  if (!registry_ || !scheduler_ || !store_executor_ || !word_store_ || !user_store_ || !observability_) {
    throw std::invalid_argument("GameSession 의존성이 누락되었습니다");
  }
}

GameSession::~GameSession() { CancelTimer(); }

void GameSession::HandleOpen(const std::shared_ptr<Connection>& connection) {
  observability_->Log(LogLevel::kDebug, "connection.open", {{"connection", connection->Describe()}});
}

void GameSession::HandleMessage(const std::shared_ptr<Connection>& connection, const ClientMessage& message) {
  std::visit(Overloaded{
                 [&](const HandshakeMessage& msg) { OnHandshake(connection, msg); },
                 [&](const DrawMessage& msg) {
                   if (auto identity = ResolveSender(connection, "draw")) {
                     OnDraw(*identity, msg);
                   }
                 },
                 [&](const ChatMessage& msg) {
                   if (auto identity = ResolveSender(connection, "chat")) {
                     OnChat(connection, *identity, msg);
                   }
                 },
                 [&](const WordChoiceMessage& msg) {
                   if (auto identity = ResolveSender(connection, "word")) {
                     OnWordChoice(*identity, msg);
                   }
                 },
             },
             message);
}

void GameSession::HandleClose(const std::shared_ptr<Connection>& connection) {
  pending_handshakes_.erase(connection.get());
  auto identity = registry_->Unregister(connection.get());
  if (!identity) {
    observability_->Log(LogLevel::kDebug, "connection.closed_anonymous", {{"connection", connection->Describe()}});
    return;
  }
  Leave(*identity);
}

std::optional<std::string> GameSession::ResolveSender(const std::shared_ptr<Connection>& connection,
                                                      const char* event) {
  auto identity = registry_->Resolve(connection.get());
  if (!identity) {
    observability_->IncrementRejected();
    observability_->Log(LogLevel::kWarn, "message.unauthenticated",
                        {{"event", event}, {"connection", connection->Describe()}});
  }
  return identity;
}

void GameSession::OnHandshake(const std::shared_ptr<Connection>& connection, const HandshakeMessage& message) {
  if (auto existing = registry_->Resolve(connection.get())) {
    observability_->Log(LogLevel::kWarn, "handshake.duplicate", {{"player", *existing}});
    return;
  }
  // 조회가 끝나기 전에 들어온 두 번째 핸드셰이크는 버린다. 토큰도 소모하지 않는다.
  if (pending_handshakes_.count(connection.get()) > 0) {
    observability_->Log(LogLevel::kWarn, "handshake.pending", {{"connection", connection->Describe()}});
    return;
  }
  const std::uint64_t attempt = ++handshake_seq_;
  pending_handshakes_[connection.get()] = attempt;
  auto store = user_store_;
  const std::string token = message.token;
  std::weak_ptr<GameSession> weak_self = weak_from_this();
  std::weak_ptr<Connection> weak_connection = connection;
  const Connection* key = connection.get();
  observability_->Log(LogLevel::kDebug, "handshake.lookup",
                      {{"tokenPrefix", token.substr(0, kTokenLogPrefix)}, {"connection", connection->Describe()}});
  SubmitStoreCall<std::optional<UserRecord>>(
      *store_executor_, [store, token]() { return store->FindByToken(token); },
      [weak_self, weak_connection, key, attempt](const StoreResult<std::optional<UserRecord>>& result) {
        if (auto self = weak_self.lock()) {
          self->OnUserResolved(weak_connection, key, attempt, result);
        }
      });
}

void GameSession::OnUserResolved(const std::weak_ptr<Connection>& weak_connection, const Connection* key,
                                 std::uint64_t attempt, const StoreResult<std::optional<UserRecord>>& result) {
  auto pending = pending_handshakes_.find(key);
  if (pending != pending_handshakes_.end() && pending->second == attempt) {
    pending_handshakes_.erase(pending);
  }
  if (!result.ok()) {
    observability_->Log(LogLevel::kError, "handshake.lookup_failed", {{"error", result.error}});
    return;
  }
  if (!result.value->has_value()) {
    observability_->IncrementRejected();
    observability_->Log(LogLevel::kWarn, "handshake.rejected", {{"reason", "unknown_or_expired_token"}});
    return;
  }
  auto connection = weak_connection.lock();
  if (!connection || !connection->IsOpen()) {
    observability_->Log(LogLevel::kInfo, "handshake.connection_gone", {{"player", (*result.value)->identity}});
    return;
  }
  Join(connection, **result.value);
}

void GameSession::Join(const std::shared_ptr<Connection>& connection, const UserRecord& record) {
  const std::string& name = record.identity;
  const std::size_t before = roster_.size();
  const bool rejoin = players_.count(name) > 0;
  if (auto bound = registry_->Resolve(connection.get()); bound && *bound != name) {
    observability_->IncrementRejected();
    observability_->Log(LogLevel::kWarn, "handshake.identity_conflict", {{"player", *bound}, {"claimed", name}});
    return;
  }

  registry_->Register(name, connection);
  if (rejoin) {
    players_[name].connection = connection;
  } else {
    roster_.push_back(name);
    players_[name] = Player{name, connection};
  }
  if (!scores_.Has(name)) {
    const bool same_game = !game_id_.empty() && record.last_game_id == game_id_;
    scores_.EnsurePlayer(name, same_game ? record.score : 0);
  }
  observability_->Log(LogLevel::kInfo, "player.joined",
                      {{"player", name}, {"rejoin", rejoin}, {"phase", ToString(phase_)}, {"players", roster_.size()}});

  bus_.Send(*connection, MessageType::kHandshake, {{"name", name}});
  ReplayHistory(*connection);
  for (const auto& other : roster_) {
    if (other != name) {
      bus_.Send(*connection, MessageType::kPlayer, PlayerJson(other));
    }
  }
  bus_.Broadcast(MessageType::kPlayer, PlayerJson(name));

  if (phase_ == GamePhase::kPlaying && round_.word) {
    scores_.JoinRound(name);
    const bool is_drawer = name == round_.drawer;
    bus_.Send(*connection, MessageType::kStartRound,
              {{"drawer", round_.drawer},
               {"wordOrHint", is_drawer ? *round_.word : CurrentHint()},
               {"roundNumber", rounds_played_ + 1}});
    bus_.Send(*connection, MessageType::kTimer, {{"remainingTime", std::max(0, remaining_time_)}});
  } else if (phase_ == GamePhase::kChoosingWord) {
    if (name == round_.drawer && !round_.candidates.empty()) {
      bus_.Send(*connection, MessageType::kWordChoices, {{"words", round_.candidates}});
    } else {
      SendSystemChat(*connection, round_.drawer + "님이 단어를 고르고 있습니다", kNoticeColor);
    }
  }

  if (phase_ == GamePhase::kIdle && before < kQuorum && roster_.size() >= kQuorum) {
    StartGame();
  }
}

void GameSession::ReplayHistory(Connection& connection) {
  draw_history_.ForEach([&](const nlohmann::json& op) { bus_.Send(connection, MessageType::kDraw, op); });
  chat_history_.ForEach([&](const nlohmann::json& line) { bus_.Send(connection, MessageType::kChat, line); });
}

void GameSession::Leave(const std::string& identity) {
  roster_.erase(std::remove(roster_.begin(), roster_.end(), identity), roster_.end());
  players_.erase(identity);
  bus_.Broadcast(MessageType::kPlayerDisconnected, {{"name", identity}});
  observability_->Log(LogLevel::kInfo, "player.left",
                      {{"player", identity}, {"phase", ToString(phase_)}, {"players", roster_.size()}});

  if (phase_ == GamePhase::kIdle) {
    return;
  }
  if (roster_.size() < kQuorum) {
    EndGame();
    return;
  }
  const bool round_active = phase_ == GamePhase::kChoosingWord || phase_ == GamePhase::kPlaying;
  if (round_active && identity == round_.drawer) {
    EndRound();
    return;
  }
  if (phase_ == GamePhase::kPlaying && EveryoneGuessed()) {
    EndRound();
  }
}

bool GameSession::StartGame() {
  if (phase_ != GamePhase::kIdle || roster_.size() < kQuorum) {
    return false;
  }
  CancelTimer();
  scores_.ResetForGame(roster_);
  rounds_played_ = 0;
  drawn_.clear();
  game_id_ = RandomHex(kGameIdBytes);
  round_ = RoundState{};
  observability_->Log(LogLevel::kInfo, "game.start", {{"gameId", game_id_}, {"players", roster_.size()}});
  for (const auto& name : roster_) {
    BroadcastPlayer(name);
    PersistScore(name);
  }
  BroadcastSystemChat("새 게임을 시작합니다!", kNoticeColor);
  PrepareRound();
  return true;
}

void GameSession::PrepareRound() {
  if (roster_.size() < kQuorum) {
    EndGame();
    return;
  }
  auto next = std::find_if(roster_.begin(), roster_.end(),
                           [this](const std::string& name) { return drawn_.count(name) == 0; });
  if (next == roster_.end()) {
    drawn_.clear();
    ++rounds_played_;
    observability_->Log(LogLevel::kInfo, "game.rotation_complete",
                        {{"gameId", game_id_}, {"roundsPlayed", rounds_played_}});
    if (rounds_played_ >= settings_.max_rounds) {
      EndGame();
      return;
    }
    PrepareRound();
    return;
  }

  CancelTimer();
  round_ = RoundState{};
  round_.drawer = *next;
  SetPhase(GamePhase::kChoosingWord);
  const std::uint64_t epoch = epoch_;
  observability_->Log(LogLevel::kInfo, "round.prepare",
                      {{"gameId", game_id_}, {"drawer", round_.drawer}, {"roundNumber", rounds_played_ + 1}});

  auto store = word_store_;
  const std::size_t count = settings_.word_choices;
  std::weak_ptr<GameSession> weak_self = weak_from_this();
  SubmitStoreCall<std::vector<std::string>>(
      *store_executor_, [store, count]() { return store->FetchRandomWords(true, count); },
      [weak_self, epoch](const StoreResult<std::vector<std::string>>& result) {
        if (auto self = weak_self.lock()) {
          self->OnWordsFetched(epoch, result);
        }
      });
}

void GameSession::OnWordsFetched(std::uint64_t epoch, const StoreResult<std::vector<std::string>>& result) {
  if (epoch != epoch_ || phase_ != GamePhase::kChoosingWord) {
    observability_->Log(LogLevel::kDebug, "round.words_stale", {{"epoch", epoch}, {"current", epoch_}});
    return;
  }
  if (!result.ok() || result.value->empty()) {
    observability_->Log(LogLevel::kError, "round.words_unavailable",
                        {{"gameId", game_id_}, {"error", result.ok() ? "empty word list" : result.error}});
    BroadcastSystemChat("단어를 불러오지 못해 게임을 종료합니다", kErrorColor);
    EndGame();
    return;
  }
  round_.candidates = *result.value;
  bus_.SendTo(round_.drawer, MessageType::kWordChoices, {{"words", round_.candidates}});
  BroadcastSystemChatExcept(round_.drawer, round_.drawer + "님이 단어를 고르고 있습니다", kNoticeColor);
  StartTimer(Countdown(settings_.choose_word_time), [this]() {
    const std::string word = round_.candidates.front();
    observability_->Log(LogLevel::kInfo, "round.word_auto_picked", {{"drawer", round_.drawer}});
    StartRound(word);
  });
}

void GameSession::OnWordChoice(const std::string& identity, const WordChoiceMessage& message) {
  if (phase_ != GamePhase::kChoosingWord || identity != round_.drawer) {
    observability_->IncrementRejected();
    observability_->Log(LogLevel::kWarn, "round.word_choice_rejected",
                        {{"player", identity}, {"phase", ToString(phase_)}});
    return;
  }
  const std::string wanted = ToLower(message.word);
  auto it = std::find_if(round_.candidates.begin(), round_.candidates.end(),
                         [&](const std::string& candidate) { return ToLower(candidate) == wanted; });
  if (it == round_.candidates.end()) {
    observability_->IncrementRejected();
    observability_->Log(LogLevel::kWarn, "round.word_not_offered", {{"player", identity}});
    return;
  }
  const std::string word = *it;
  StartRound(word);
}

void GameSession::StartRound(const std::string& word) {
  CancelTimer();
  round_.word = word;
  round_.hints_shown.clear();
  round_.guessing_time = settings_.round_time;
  remaining_time_ = settings_.round_time;
  round_.guessed.clear();
  scores_.BeginRound(roster_);
  draw_history_.Clear();
  bus_.Broadcast(MessageType::kDraw, ToJson(DrawOp{ClearCanvas{}}));
  SetPhase(GamePhase::kPlaying);

  const std::string hint = CurrentHint();
  for (const auto& name : roster_) {
    const bool is_drawer = name == round_.drawer;
    bus_.SendTo(name, MessageType::kStartRound,
                {{"drawer", round_.drawer}, {"wordOrHint", is_drawer ? word : hint}, {"roundNumber", rounds_played_ + 1}});
  }
  for (const auto& name : roster_) {
    BroadcastPlayer(name);
  }
  observability_->Log(LogLevel::kInfo, "round.start",
                      {{"gameId", game_id_}, {"drawer", round_.drawer}, {"roundNumber", rounds_played_ + 1},
                       {"letters", HintGenerator::LetterCount(word)}});
  StartTimer([this](int elapsed) { return OnRoundTick(elapsed); }, [this]() { EndRound(); });
}

bool GameSession::OnRoundTick(int elapsed) {
  remaining_time_ = round_.guessing_time - elapsed;
  BroadcastTimer();
  RevealHintIfDue();
  return remaining_time_ <= 0;
}

void GameSession::RevealHintIfDue() {
  if (phase_ != GamePhase::kPlaying || !round_.word) {
    return;
  }
  const std::size_t max_hints = HintGenerator::MaxHints(*round_.word);
  bool revealed = false;
  while (HintGenerator::ShouldReveal(remaining_time_, settings_.hint_window, max_hints, round_.hints_shown.size())) {
    if (!hints_.RevealNext(*round_.word, round_.hints_shown)) {
      break;
    }
    revealed = true;
  }
  if (revealed) {
    bus_.BroadcastExcept(round_.drawer, MessageType::kWord, {{"word", CurrentHint()}});
  }
}

void GameSession::OnDraw(const std::string& identity, const DrawMessage& message) {
  const bool round_active = phase_ == GamePhase::kChoosingWord || phase_ == GamePhase::kPlaying;
  if (round_active && identity != round_.drawer) {
    observability_->IncrementRejected();
    observability_->Log(LogLevel::kDebug, "draw.rejected", {{"player", identity}, {"drawer", round_.drawer}});
    return;
  }
  nlohmann::json payload = ToJson(message.op);
  if (std::holds_alternative<ClearCanvas>(message.op)) {
    draw_history_.Clear();
  } else {
    draw_history_.Push(payload);
  }
  bus_.BroadcastExcept(identity, MessageType::kDraw, payload);
}

void GameSession::OnChat(const std::shared_ptr<Connection>& connection, const std::string& identity,
                         const ChatMessage& message) {
  if (!message.sender.empty() && message.sender != identity) {
    observability_->Log(LogLevel::kWarn, "chat.sender_mismatch", {{"player", identity}, {"claimed", message.sender}});
  }
  const ChatMessage line{identity, message.text, message.color};
  bool relay = true;

  if (phase_ == GamePhase::kPlaying && round_.word) {
    const GuessVerdict verdict = EvaluateGuess(message.text, *round_.word, remaining_time_);
    const bool can_guess = identity != round_.drawer && players_.count(identity) > 0 && !HasGuessed(identity);
    if (verdict == GuessVerdict::kExact) {
      // 정답 문자열은 중계도 기록도 하지 않는다. 채팅 줄 대신 공개 "맞혔습니다" 알림이 나간다.
      relay = false;
      if (can_guess) {
        HandleCorrectGuess(identity);
      } else {
        SendSystemChat(*connection, "정답은 채팅으로 공개할 수 없습니다", kNoticeColor);
      }
    } else if (can_guess && verdict == GuessVerdict::kVeryClose) {
      SendSystemChat(*connection, "'" + message.text + "' 거의 정답이에요!", kCloseColor);
    } else if (can_guess && verdict == GuessVerdict::kKindaClose) {
      SendSystemChat(*connection, "'" + message.text + "' 조금 가까워요", kCloseColor);
    }
  }

  if (!relay) {
    return;
  }
  const nlohmann::json payload = ToJson(line);
  bus_.BroadcastExcept(identity, MessageType::kChat, payload);
  chat_history_.Push(payload);
}

void GameSession::HandleCorrectGuess(const std::string& identity) {
  const int gained = scores_.ScoreCorrectGuess(remaining_time_);
  const int total = scores_.CreditRound(identity, gained);
  round_.guessed.insert(identity);
  observability_->Log(LogLevel::kInfo, "round.correct_guess",
                      {{"player", identity}, {"gained", gained}, {"score", total}, {"remaining", remaining_time_}});

  bus_.SendTo(identity, MessageType::kChat, SystemLine("정답입니다! +" + std::to_string(gained) + "점", kSuccessColor));
  BroadcastSystemChatExcept(identity, identity + "님이 정답을 맞혔습니다!", kSuccessColor);
  BroadcastPlayer(identity);

  const int cut = std::min(settings_.guess_time_cut, std::max(0, remaining_time_ - settings_.guess_time_floor));
  if (cut > 0) {
    round_.guessing_time -= cut;
    remaining_time_ -= cut;
    BroadcastTimer();
  }
  PersistScore(identity);

  if (EveryoneGuessed()) {
    EndRound();
  }
}

void GameSession::EndRound() {
  if (phase_ != GamePhase::kChoosingWord && phase_ != GamePhase::kPlaying) {
    return;
  }
  CancelTimer();
  const bool word_in_play = phase_ == GamePhase::kPlaying && round_.word.has_value();
  drawn_.insert(round_.drawer);

  int guessed = 0;
  int total = 0;
  for (const auto& name : roster_) {
    if (name == round_.drawer) {
      continue;
    }
    ++total;
    if (HasGuessed(name)) {
      ++guessed;
    }
  }
  if (word_in_play) {
    const int payout = scores_.DrawerPayout(guessed, total);
    scores_.CreditRound(round_.drawer, payout);
    PersistScore(round_.drawer);
    if (players_.count(round_.drawer) > 0) {
      BroadcastPlayer(round_.drawer);
    }
  }

  const std::string word = round_.word.value_or("");
  bus_.Broadcast(MessageType::kEndRound, {{"word", word}, {"scores", scores_.Ledger()}});
  if (word_in_play) {
    const double ratio = total > 0 ? static_cast<double>(guessed) / static_cast<double>(total) : 0.0;
    BroadcastSystemChat("정답은 '" + word + "' 였습니다 (" + std::to_string(guessed) + "/" + std::to_string(total) +
                            "명 정답)",
                        RecapColor(ratio));
  }
  observability_->Log(LogLevel::kInfo, "round.end",
                      {{"gameId", game_id_}, {"drawer", round_.drawer}, {"guessed", guessed}, {"total", total},
                       {"completed", word_in_play}});

  round_.word.reset();
  round_.candidates.clear();
  round_.hints_shown.clear();
  SetPhase(GamePhase::kCooldown);
  StartTimer(Countdown(settings_.cooldown_time), [this]() {
    if (roster_.size() >= kQuorum) {
      PrepareRound();
    } else {
      EndGame();
    }
  });
}

void GameSession::EndGame() {
  CancelTimer();
  const bool was_running = phase_ != GamePhase::kIdle;
  SetPhase(GamePhase::kIdle);
  round_ = RoundState{};
  drawn_.clear();
  bus_.Broadcast(MessageType::kGameOver, nlohmann::json::object());
  observability_->Log(LogLevel::kInfo, "game.over",
                      {{"gameId", game_id_}, {"roundsPlayed", rounds_played_}, {"wasRunning", was_running},
                       {"players", roster_.size()}});
  StartTimer(Countdown(settings_.intermission_time), [this]() {
    if (roster_.size() >= kQuorum) {
      StartGame();
    }
  });
}

GameStatus GameSession::Status() const {
  GameStatus status{phase_, game_id_, rounds_played_, settings_.max_rounds, Drawer(), remaining_time_, {}};
  for (const auto& name : roster_) {
    status.players.push_back(PlayerStatus{name, scores_.Score(name), HasGuessed(name)});
  }
  return status;
}

std::optional<std::string> GameSession::Drawer() const {
  if (phase_ == GamePhase::kIdle || round_.drawer.empty()) {
    return std::nullopt;
  }
  return round_.drawer;
}

std::string GameSession::CurrentHint() const {
  if (!round_.word) {
    return {};
  }
  return HintGenerator::BuildMask(*round_.word, round_.hints_shown);
}

bool GameSession::HasGuessed(const std::string& name) const { return round_.guessed.count(name) > 0; }

void GameSession::SetPhase(GamePhase phase) {
  if (phase_ != phase) {
    observability_->Log(LogLevel::kDebug, "game.phase",
                        {{"from", ToString(phase_)}, {"to", ToString(phase)}, {"gameId", game_id_}});
  }
  phase_ = phase;
  ++epoch_;
}

void GameSession::StartTimer(Scheduler::TickFn tick, Scheduler::DoneFn on_done) {
  CancelTimer();
  timer_ = scheduler_->Start(std::move(tick), std::move(on_done));
}

Scheduler::TickFn GameSession::Countdown(int total) {
  return [this, total](int elapsed) {
    remaining_time_ = total - elapsed;
    BroadcastTimer();
    return remaining_time_ <= 0;
  };
}

void GameSession::CancelTimer() {
  if (timer_) {
    timer_->Cancel();
    timer_.reset();
  }
}

bool GameSession::EveryoneGuessed() const {
  std::size_t guessers = 0;
  for (const auto& name : roster_) {
    if (name == round_.drawer) {
      continue;
    }
    ++guessers;
    if (!HasGuessed(name)) {
      return false;
    }
  }
  return guessers > 0;
}

nlohmann::json GameSession::PlayerJson(const std::string& name) const {
  return {{"name", name}, {"state", {{"score", scores_.Score(name)}, {"guessed", HasGuessed(name)}}}};
}

void GameSession::BroadcastPlayer(const std::string& name) { bus_.Broadcast(MessageType::kPlayer, PlayerJson(name)); }

void GameSession::BroadcastTimer() {
  bus_.Broadcast(MessageType::kTimer, {{"remainingTime", std::max(0, remaining_time_)}});
}

void GameSession::BroadcastSystemChat(const std::string& text, const std::string& color) {
  const nlohmann::json line = SystemLine(text, color);
  bus_.Broadcast(MessageType::kChat, line);
  chat_history_.Push(line);
}

void GameSession::BroadcastSystemChatExcept(const std::string& identity, const std::string& text,
                                            const std::string& color) {
  const nlohmann::json line = SystemLine(text, color);
  bus_.BroadcastExcept(identity, MessageType::kChat, line);
  chat_history_.Push(line);
}

void GameSession::SendSystemChat(Connection& connection, const std::string& text, const std::string& color) {
  bus_.Send(connection, MessageType::kChat, SystemLine(text, color));
}

// 같은 플레이어의 점수 쓰기는 한 번에 하나만 진행한다. 진행 중이면 최신 값만 남겨 두었다가 이어서 쓴다.
void GameSession::PersistScore(const std::string& name) {
  PendingScore next{scores_.Score(name), game_id_};
  auto queued = persist_queue_.find(name);
  if (queued != persist_queue_.end()) {
    queued->second = std::move(next);
    return;
  }
  persist_queue_.emplace(name, std::nullopt);
  WriteScore(name, next);
}

void GameSession::WriteScore(const std::string& name, const PendingScore& pending) {
  auto store = user_store_;
  auto observability = observability_;
  std::weak_ptr<GameSession> weak_self = weak_from_this();
  SubmitStoreCall<bool>(
      *store_executor_,
      [store, name, pending]() {
        store->PersistScore(name, pending.score, pending.game_id);
        return true;
      },
      [weak_self, observability, name](const StoreResult<bool>& result) {
        if (!result.ok()) {
          observability->Log(LogLevel::kWarn, "score.persist_failed", {{"player", name}, {"error", result.error}});
        }
        if (auto self = weak_self.lock()) {
          self->OnScoreWritten(name);
        }
      });
}

void GameSession::OnScoreWritten(const std::string& name) {
  auto queued = persist_queue_.find(name);
  if (queued == persist_queue_.end()) {
    return;
  }
  if (!queued->second) {
    persist_queue_.erase(queued);
    return;
  }
  const PendingScore next = std::move(*queued->second);
  queued->second.reset();
  WriteScore(name, next);
}

}  // namespace doodle
