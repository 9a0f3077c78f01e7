#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "doodle/game_session.hpp"
#include "support/test_doubles.hpp"

namespace {

using doodle::GamePhase;
using doodle_test::DeferredStoreExecutor;
using doodle_test::FakeConnection;
using doodle_test::InlineStoreExecutor;
using doodle_test::ManualScheduler;

class FailingWordStore : public doodle::WordStore {
 public:
  std::vector<std::string> FetchRandomWords(bool /*exclude_deleted*/, std::size_t /*count*/) override {
    throw std::runtime_error("words table unavailable");
  }
};

bool ReceivedChatFrom(const FakeConnection& conn, const std::string& sender, const std::string& text) {
  for (const auto& line : conn.Events("chat")) {
    if (line["sender"] == sender && line["text"] == text) {
      return true;
    }
  }
  return false;
}

std::size_t IndexOf(const FakeConnection& conn, const std::string& event) {
  const auto& sent = conn.Sent();
  for (std::size_t i = 0; i < sent.size(); ++i) {
    if (sent[i].first == event) {
      return i;
    }
  }
  return sent.size();
}

class GameSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    words_ = std::make_shared<doodle::InMemoryWordStore>(
        std::vector<doodle::WordEntry>{{"apple"}, {"banana"}, {"cherry"}}, 7);
    Build(std::make_shared<InlineStoreExecutor>());
  }

  void Build(std::shared_ptr<doodle::StoreExecutor> executor) {
    registry_ = std::make_shared<doodle::ConnectionRegistry>();
    scheduler_ = std::make_shared<ManualScheduler>();
    executor_ = std::move(executor);
    users_ = std::make_shared<doodle::InMemoryUserStore>();
    observability_ = std::make_shared<doodle::Observability>(doodle::LogLevel::kDebug, &log_);
    doodle::GameSession::Dependencies deps{registry_, scheduler_, executor_, words_, users_, observability_};
    session_ = std::make_shared<doodle::GameSession>(settings_, deps, 42);
  }

  std::shared_ptr<FakeConnection> Join(const std::string& name) {
    auto conn = std::make_shared<FakeConnection>(name);
    session_->HandleOpen(conn);
    session_->HandleMessage(conn, doodle::HandshakeMessage{users_->IssueToken(name)});
    conns_[name] = conn;
    return conn;
  }

  void Say(const std::shared_ptr<FakeConnection>& conn, const std::string& text) {
    session_->HandleMessage(conn, doodle::ChatMessage{conn->Label(), text, "#000000"});
  }

  void Choose(const std::shared_ptr<FakeConnection>& conn, const std::string& word) {
    session_->HandleMessage(conn, doodle::WordChoiceMessage{word});
  }

  void Draw(const std::shared_ptr<FakeConnection>& conn, double x, double y) {
    session_->HandleMessage(conn, doodle::DrawMessage{doodle::Stroke{"pen", x, y, x - 1, y - 1}});
  }

  void Leave(const std::string& name) { session_->HandleClose(conns_.at(name)); }

  // 출제자가 apple을 고르고 나머지가 모두 맞혀 라운드를 끝낸다.
  void PlayRoundWhereEveryoneGuesses() {
    ASSERT_EQ(session_->Phase(), GamePhase::kChoosingWord);
    const std::string drawer = *session_->Drawer();
    Choose(conns_.at(drawer), "apple");
    ASSERT_EQ(session_->Phase(), GamePhase::kPlaying);
    for (const auto& name : session_->Roster()) {
      if (name != drawer) {
        Say(conns_.at(name), "apple");
      }
    }
    ASSERT_EQ(session_->Phase(), GamePhase::kCooldown);
  }

  doodle::GameSettings settings_;
  std::ostringstream log_;
  std::shared_ptr<doodle::ConnectionRegistry> registry_;
  std::shared_ptr<ManualScheduler> scheduler_;
  std::shared_ptr<doodle::StoreExecutor> executor_;
  std::shared_ptr<doodle::WordStore> words_;
  std::shared_ptr<doodle::InMemoryUserStore> users_;
  std::shared_ptr<doodle::Observability> observability_;
  std::shared_ptr<doodle::GameSession> session_;
  std::map<std::string, std::shared_ptr<FakeConnection>> conns_;
};

TEST_F(GameSessionTest, SecondPlayerStartsGameAndFirstPlayerDraws) {
  auto alice = Join("alice");
  EXPECT_EQ(session_->Phase(), GamePhase::kIdle);
  auto bob = Join("bob");

  EXPECT_EQ(session_->Phase(), GamePhase::kChoosingWord);
  EXPECT_FALSE(session_->GameId().empty());
  ASSERT_TRUE(session_->Drawer().has_value());
  EXPECT_EQ(*session_->Drawer(), "alice");
  auto choices = alice->Last("word-choices");
  ASSERT_TRUE(choices.has_value());
  EXPECT_EQ((*choices)["words"].size(), 3u);
  EXPECT_EQ(bob->Count("word-choices"), 0u);
  EXPECT_EQ(alice->Events("handshake").front()["name"], "alice");
}

TEST_F(GameSessionTest, GuessWithFiftySecondsLeftScoresFortyFive) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  Choose(alice, "apple");
  ASSERT_EQ(session_->Phase(), GamePhase::kPlaying);

  scheduler_->Steps(31);
  ASSERT_EQ(session_->RemainingTime(), 50);
  Say(bob, "apple");

  EXPECT_EQ(session_->Score("bob"), 45);
  // 정답자가 한 명뿐이면 출제자는 첫 정답 점수를 그대로 받는다.
  EXPECT_EQ(session_->Score("alice"), 45);
  EXPECT_EQ(session_->Phase(), GamePhase::kCooldown);
  auto end = alice->Last("end-round");
  ASSERT_TRUE(end.has_value());
  EXPECT_EQ((*end)["word"], "apple");
  EXPECT_EQ((*end)["scores"]["bob"], 45);
  EXPECT_EQ((*end)["scores"]["alice"], 45);
  EXPECT_FALSE(ReceivedChatFrom(*alice, "bob", "apple"));
  EXPECT_TRUE(alice->SawChatContaining("bob님이 정답을 맞혔습니다"));
  EXPECT_TRUE(bob->SawChatContaining("+45"));
}

TEST_F(GameSessionTest, EveryoneGuessingEndsRoundEarlyAndCompressesTime) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  auto carol = Join("carol");
  Choose(alice, "apple");
  scheduler_->Step();
  ASSERT_EQ(session_->RemainingTime(), 80);

  Say(bob, "apple");
  EXPECT_EQ(session_->Score("bob"), 50);
  EXPECT_EQ(session_->RemainingTime(), 75);
  EXPECT_EQ(session_->Phase(), GamePhase::kPlaying);

  Say(carol, "APPLE");
  EXPECT_EQ(session_->Score("carol"), 45);
  EXPECT_EQ(session_->Score("alice"), 50);
  EXPECT_EQ(session_->Phase(), GamePhase::kCooldown);
  EXPECT_EQ(carol->Count("end-round"), 1u);
}

TEST_F(GameSessionTest, RepeatedCorrectGuessScoresOnce) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  auto carol = Join("carol");
  Choose(alice, "apple");
  scheduler_->Steps(31);

  Say(bob, "apple");
  ASSERT_EQ(session_->Score("bob"), 45);
  Say(bob, "apple");

  EXPECT_EQ(session_->Score("bob"), 45);
  EXPECT_EQ(session_->RoundLedger().at("bob"), 45);
  EXPECT_EQ(session_->Phase(), GamePhase::kPlaying);
  EXPECT_FALSE(ReceivedChatFrom(*carol, "bob", "apple"));
  EXPECT_FALSE(ReceivedChatFrom(*alice, "bob", "apple"));
}

TEST_F(GameSessionTest, DrawerTypingWordIsNotRelayed) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  Choose(alice, "apple");
  Say(alice, "apple");

  EXPECT_FALSE(ReceivedChatFrom(*bob, "alice", "apple"));
  EXPECT_EQ(session_->Score("alice"), 0);
  EXPECT_EQ(session_->Phase(), GamePhase::kPlaying);
}

TEST_F(GameSessionTest, NearMissIsHintedPrivatelyAndRelayed) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  auto carol = Join("carol");
  Choose(alice, "apple");
  Say(bob, "appla");

  EXPECT_TRUE(bob->SawChatContaining("거의 정답"));
  EXPECT_FALSE(carol->SawChatContaining("거의 정답"));
  EXPECT_TRUE(ReceivedChatFrom(*carol, "bob", "appla"));
  EXPECT_TRUE(ReceivedChatFrom(*alice, "bob", "appla"));
  EXPECT_EQ(session_->Score("bob"), 0);
}

TEST_F(GameSessionTest, NoCorrectGuessPenalizesDrawer) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  Choose(alice, "apple");
  scheduler_->StepUntil([&]() { return session_->Phase() != GamePhase::kPlaying; });

  EXPECT_EQ(session_->Phase(), GamePhase::kCooldown);
  EXPECT_EQ(session_->Score("alice"), -10);
  EXPECT_EQ(session_->Score("bob"), 0);
  auto end = bob->Last("end-round");
  ASSERT_TRUE(end.has_value());
  EXPECT_EQ((*end)["scores"]["alice"], -10);
  EXPECT_TRUE(bob->SawChatContaining("0/1"));
}

TEST_F(GameSessionTest, LastOpponentLeavingEndsGameInsteadOfNextRound) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  Choose(alice, "apple");
  Leave("alice");

  EXPECT_EQ(session_->Phase(), GamePhase::kIdle);
  EXPECT_FALSE(session_->Drawer().has_value());
  EXPECT_EQ(bob->Count("game-over"), 1u);
  auto gone = bob->Last("player-disconnected");
  ASSERT_TRUE(gone.has_value());
  EXPECT_EQ((*gone)["name"], "alice");

  // 인터미션이 끝나도 혼자서는 새 게임이 시작되지 않는다.
  scheduler_->StepUntil([]() { return false; });
  EXPECT_EQ(session_->Phase(), GamePhase::kIdle);
  EXPECT_EQ(bob->Count("start-round"), 1u);
}

TEST_F(GameSessionTest, DrawerLeavingMidRoundEndsRoundAndRotates) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  auto carol = Join("carol");
  Choose(alice, "apple");
  Leave("alice");

  EXPECT_EQ(session_->Phase(), GamePhase::kCooldown);
  EXPECT_EQ(bob->Count("end-round"), 1u);
  scheduler_->StepUntil([&]() { return session_->Phase() != GamePhase::kCooldown; });
  ASSERT_EQ(session_->Phase(), GamePhase::kChoosingWord);
  EXPECT_EQ(*session_->Drawer(), "bob");
}

TEST_F(GameSessionTest, DrawerLeavingWhileChoosingPaysNothing) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  auto carol = Join("carol");
  Leave("alice");

  EXPECT_EQ(session_->Phase(), GamePhase::kCooldown);
  EXPECT_EQ(session_->Score("alice"), 0);
  auto end = bob->Last("end-round");
  ASSERT_TRUE(end.has_value());
  EXPECT_EQ((*end)["word"], "");
}

TEST_F(GameSessionTest, EveryPlayerDrawsExactlyOncePerRotation) {
  settings_.max_rounds = 1;
  Build(std::make_shared<InlineStoreExecutor>());
  auto alice = Join("alice");
  auto bob = Join("bob");
  auto carol = Join("carol");

  std::vector<std::string> drawers;
  for (int round = 0; round < 3; ++round) {
    ASSERT_TRUE(session_->Drawer().has_value());
    drawers.push_back(*session_->Drawer());
    PlayRoundWhereEveryoneGuesses();
    scheduler_->StepUntil([&]() { return session_->Phase() != GamePhase::kCooldown; });
  }

  EXPECT_EQ(drawers, (std::vector<std::string>{"alice", "bob", "carol"}));
  EXPECT_EQ(session_->Phase(), GamePhase::kIdle);
  EXPECT_EQ(session_->RoundsPlayed(), 1);
  EXPECT_EQ(alice->Count("game-over"), 1u);
  auto starts = carol->Events("start-round");
  ASSERT_EQ(starts.size(), 3u);
  for (const auto& start : starts) {
    EXPECT_EQ(start["roundNumber"], 1);
  }
}

TEST_F(GameSessionTest, IntermissionStartsFreshGame) {
  settings_.max_rounds = 1;
  Build(std::make_shared<InlineStoreExecutor>());
  auto alice = Join("alice");
  auto bob = Join("bob");
  const std::string first_game = session_->GameId();

  PlayRoundWhereEveryoneGuesses();
  scheduler_->StepUntil([&]() { return session_->Phase() != GamePhase::kCooldown; });
  PlayRoundWhereEveryoneGuesses();
  scheduler_->StepUntil([&]() { return session_->Phase() != GamePhase::kCooldown; });
  ASSERT_EQ(session_->Phase(), GamePhase::kIdle);
  EXPECT_GT(session_->Score("bob"), 0);

  scheduler_->StepUntil([&]() { return session_->Phase() != GamePhase::kIdle; });
  EXPECT_EQ(session_->Phase(), GamePhase::kChoosingWord);
  EXPECT_NE(session_->GameId(), first_game);
  EXPECT_EQ(session_->Score("alice"), 0);
  EXPECT_EQ(session_->Score("bob"), 0);
  EXPECT_EQ(session_->RoundsPlayed(), 0);
}

TEST_F(GameSessionTest, HintsStayWithinBoundAndSkipDrawer) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  Choose(alice, "banana");
  ASSERT_EQ((*alice->Last("start-round"))["wordOrHint"], "banana");
  ASSERT_EQ((*bob->Last("start-round"))["wordOrHint"], "_ _ _ _ _ _");

  std::size_t most = 0;
  while (session_->Phase() == GamePhase::kPlaying && scheduler_->Step()) {
    most = std::max(most, session_->HintsShown().size());
    EXPECT_LE(session_->HintsShown().size(), 2u);
  }

  EXPECT_EQ(most, 2u);
  EXPECT_EQ(alice->Count("word"), 0u);
  auto hints = bob->Events("word");
  ASSERT_EQ(hints.size(), 2u);
  for (const auto& hint : hints) {
    const auto mask = hint["word"].get<std::string>();
    EXPECT_NE(mask.find('_'), std::string::npos);
  }
}

TEST_F(GameSessionTest, WordIsAutoPickedWhenChoiceTimesOut) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  const std::vector<std::string> offered = session_->Candidates();
  ASSERT_FALSE(offered.empty());

  scheduler_->StepUntil([&]() { return session_->Phase() != GamePhase::kChoosingWord; });
  ASSERT_EQ(session_->Phase(), GamePhase::kPlaying);
  EXPECT_EQ(*session_->CurrentWord(), offered.front());
}

TEST_F(GameSessionTest, WordChoiceMustComeFromDrawerAndBeOffered) {
  auto alice = Join("alice");
  auto bob = Join("bob");

  Choose(bob, "apple");
  EXPECT_EQ(session_->Phase(), GamePhase::kChoosingWord);
  Choose(alice, "durian");
  EXPECT_EQ(session_->Phase(), GamePhase::kChoosingWord);
  Choose(alice, "APPLE");
  EXPECT_EQ(session_->Phase(), GamePhase::kPlaying);
  EXPECT_EQ(*session_->CurrentWord(), "apple");
}

TEST_F(GameSessionTest, StaleWordFetchIsIgnored) {
  auto deferred = std::make_shared<DeferredStoreExecutor>();
  Build(deferred);
  auto alice = std::make_shared<FakeConnection>("alice");
  auto bob = std::make_shared<FakeConnection>("bob");
  auto carol = std::make_shared<FakeConnection>("carol");
  conns_ = {{"alice", alice}, {"bob", bob}, {"carol", carol}};
  for (const auto& [name, conn] : conns_) {
    session_->HandleMessage(conn, doodle::HandshakeMessage{users_->IssueToken(name)});
  }
  ASSERT_TRUE(deferred->RunNext());
  ASSERT_TRUE(deferred->RunNext());
  ASSERT_TRUE(deferred->RunNext());
  ASSERT_EQ(session_->Phase(), GamePhase::kChoosingWord);
  ASSERT_EQ(session_->Roster().size(), 3u);
  ASSERT_TRUE(session_->Candidates().empty());

  Leave("alice");
  ASSERT_EQ(session_->Phase(), GamePhase::kCooldown);
  deferred->RunAll();

  EXPECT_EQ(session_->Phase(), GamePhase::kCooldown);
  EXPECT_TRUE(session_->Candidates().empty());
  EXPECT_EQ(alice->Count("word-choices"), 0u);
  EXPECT_EQ(bob->Count("word-choices"), 0u);
}

TEST_F(GameSessionTest, WordStoreFailureEndsGame) {
  words_ = std::make_shared<FailingWordStore>();
  Build(std::make_shared<InlineStoreExecutor>());
  auto alice = Join("alice");
  auto bob = Join("bob");

  EXPECT_EQ(session_->Phase(), GamePhase::kIdle);
  EXPECT_EQ(bob->Count("game-over"), 1u);
  EXPECT_TRUE(bob->SawChatContaining("단어를 불러오지 못해"));
  EXPECT_NE(log_.str().find("round.words_unavailable"), std::string::npos);
}

TEST_F(GameSessionTest, JoinMidRoundReceivesHintTimerAndLedgerEntry) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  Choose(alice, "apple");
  scheduler_->Steps(5);
  auto dave = Join("dave");

  EXPECT_EQ(dave->Sent().front().first, "handshake");
  auto start = dave->Last("start-round");
  ASSERT_TRUE(start.has_value());
  EXPECT_EQ((*start)["drawer"], "alice");
  EXPECT_EQ((*start)["wordOrHint"], "_ _ _ _ _");
  EXPECT_EQ((*start)["roundNumber"], 1);
  auto timer = dave->Last("timer");
  ASSERT_TRUE(timer.has_value());
  EXPECT_EQ((*timer)["remainingTime"], 76);
  EXPECT_EQ(session_->RoundLedger().count("dave"), 1u);
  EXPECT_EQ(dave->Count("player"), 3u);
  EXPECT_EQ((*alice->Last("player"))["name"], "dave");
}

TEST_F(GameSessionTest, NewcomerReplaysDrawHistoryBeforeChatHistory) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  Choose(alice, "apple");
  Draw(alice, 10, 10);
  Draw(alice, 11, 11);
  Say(bob, "is it a ball");
  auto dave = Join("dave");

  EXPECT_EQ(dave->Count("draw"), 2u);
  EXPECT_LT(IndexOf(*dave, "draw"), IndexOf(*dave, "chat"));
  EXPECT_TRUE(ReceivedChatFrom(*dave, "bob", "is it a ball"));
}

TEST_F(GameSessionTest, OnlyDrawerMayDrawAndClearEmptiesHistory) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  Choose(alice, "apple");
  const auto alice_draws = alice->Count("draw");

  Draw(bob, 1, 1);
  EXPECT_EQ(alice->Count("draw"), alice_draws);
  EXPECT_EQ(session_->DrawHistorySize(), 0u);

  Draw(alice, 1, 1);
  Draw(alice, 2, 2);
  EXPECT_EQ(session_->DrawHistorySize(), 2u);
  EXPECT_EQ(bob->Last("draw").value()["tool"], "pen");

  session_->HandleMessage(alice, doodle::DrawMessage{doodle::ClearCanvas{}});
  EXPECT_EQ(session_->DrawHistorySize(), 0u);
  EXPECT_EQ(bob->Last("draw").value()["tool"], "clear");
}

TEST_F(GameSessionTest, SpoofedSenderIsReplacedWithResolvedIdentity) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  session_->HandleMessage(bob, doodle::ChatMessage{"alice", "hello", "#123456"});

  EXPECT_TRUE(ReceivedChatFrom(*alice, "bob", "hello"));
  EXPECT_FALSE(ReceivedChatFrom(*alice, "alice", "hello"));
  EXPECT_FALSE(ReceivedChatFrom(*bob, "bob", "hello"));
  EXPECT_NE(log_.str().find("chat.sender_mismatch"), std::string::npos);
}

TEST_F(GameSessionTest, UnknownTokenLeavesConnectionUnauthenticated) {
  auto alice = Join("alice");
  auto stranger = std::make_shared<FakeConnection>("stranger");
  session_->HandleMessage(stranger, doodle::HandshakeMessage{"not-a-token"});
  session_->HandleMessage(stranger, doodle::ChatMessage{"", "hi all", ""});

  EXPECT_EQ(stranger->Count("handshake"), 0u);
  EXPECT_EQ(session_->Roster().size(), 1u);
  EXPECT_FALSE(ReceivedChatFrom(*alice, "", "hi all"));
  EXPECT_NE(log_.str().find("handshake.rejected"), std::string::npos);
}

TEST_F(GameSessionTest, TokenIsSingleUse) {
  auto first = std::make_shared<FakeConnection>("first");
  auto second = std::make_shared<FakeConnection>("second");
  const auto token = users_->IssueToken("alice");
  session_->HandleMessage(first, doodle::HandshakeMessage{token});
  session_->HandleMessage(second, doodle::HandshakeMessage{token});

  EXPECT_EQ(first->Count("handshake"), 1u);
  EXPECT_EQ(second->Count("handshake"), 0u);
}

TEST_F(GameSessionTest, SecondHandshakeWhileLookupPendingIsDropped) {
  auto deferred = std::make_shared<DeferredStoreExecutor>();
  Build(deferred);
  auto conn = std::make_shared<FakeConnection>("shared");
  session_->HandleOpen(conn);
  session_->HandleMessage(conn, doodle::HandshakeMessage{users_->IssueToken("alice")});
  const auto bob_token = users_->IssueToken("bob");
  session_->HandleMessage(conn, doodle::HandshakeMessage{bob_token});
  EXPECT_EQ(deferred->Pending(), 1u);
  deferred->RunAll();

  EXPECT_EQ(session_->Roster(), std::vector<std::string>{"alice"});
  EXPECT_EQ(registry_->Size(), 1u);
  EXPECT_EQ(session_->Phase(), GamePhase::kIdle);
  EXPECT_EQ(conn->Count("handshake"), 1u);

  session_->HandleClose(conn);
  EXPECT_TRUE(session_->Roster().empty());
  EXPECT_EQ(registry_->Size(), 0u);

  // 버려진 핸드셰이크의 토큰은 소모되지 않았다.
  auto bob = std::make_shared<FakeConnection>("bob");
  session_->HandleMessage(bob, doodle::HandshakeMessage{bob_token});
  deferred->RunAll();
  EXPECT_EQ(bob->Count("handshake"), 1u);
}

TEST_F(GameSessionTest, HandshakeAfterLookupCompletesKeepsFirstIdentity) {
  auto alice = Join("alice");
  session_->HandleMessage(alice, doodle::HandshakeMessage{users_->IssueToken("bob")});

  EXPECT_EQ(session_->Roster(), std::vector<std::string>{"alice"});
  EXPECT_EQ(registry_->Resolve(alice.get()), std::optional<std::string>{"alice"});
  EXPECT_EQ(session_->Phase(), GamePhase::kIdle);
}

TEST_F(GameSessionTest, DuplicateLoginEvictsOlderConnection) {
  auto old_conn = Join("alice");
  auto new_conn = Join("alice");

  ASSERT_EQ(old_conn->DisconnectReasons().size(), 1u);
  EXPECT_EQ(old_conn->DisconnectReasons().front(), "replaced_by_new_login");
  EXPECT_EQ(session_->Roster().size(), 1u);

  session_->HandleClose(old_conn);
  EXPECT_EQ(session_->Roster().size(), 1u);
  EXPECT_EQ(new_conn->Count("player-disconnected"), 0u);
}

TEST_F(GameSessionTest, ReconnectWithinRoundKeepsScoreAndGuessedState) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  auto carol = Join("carol");
  Choose(alice, "apple");
  scheduler_->Steps(31);
  Say(bob, "apple");
  ASSERT_EQ(session_->Score("bob"), 45);

  Leave("bob");
  ASSERT_EQ(session_->Phase(), GamePhase::kPlaying);
  auto bob_again = Join("bob");

  EXPECT_EQ(session_->Score("bob"), 45);
  EXPECT_TRUE(session_->HasGuessed("bob"));
  Say(bob_again, "apple");
  EXPECT_EQ(session_->Score("bob"), 45);
  EXPECT_EQ(session_->Phase(), GamePhase::kPlaying);
}

TEST_F(GameSessionTest, PersistedScoreRestoredOnlyForCurrentGame) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  users_->PersistScore("dave", 30, session_->GameId());
  users_->PersistScore("erin", 70, "older-game");

  Join("dave");
  Join("erin");

  EXPECT_EQ(session_->Score("dave"), 30);
  EXPECT_EQ(session_->Score("erin"), 0);
}

TEST_F(GameSessionTest, ScoresArePersistedWithGameId) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  Choose(alice, "apple");
  scheduler_->Steps(31);
  Say(bob, "apple");

  auto record = users_->Find("bob");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->score, 45);
  EXPECT_EQ(record->last_game_id, session_->GameId());
}

TEST_F(GameSessionTest, ScoreWritesForOnePlayerLandInOrder) {
  auto deferred = std::make_shared<DeferredStoreExecutor>();
  Build(deferred);
  auto alice = Join("alice");
  ASSERT_TRUE(deferred->RunNext());
  auto bob = Join("bob");
  ASSERT_TRUE(deferred->RunNext());
  ASSERT_EQ(session_->Phase(), GamePhase::kChoosingWord);
  while (session_->Candidates().empty() && deferred->RunLast()) {
  }
  ASSERT_FALSE(session_->Candidates().empty());

  Choose(alice, "apple");
  scheduler_->Steps(31);
  Say(bob, "apple");
  ASSERT_EQ(session_->Score("bob"), 45);
  // 게임 시작 때의 0점 쓰기가 끝나기 전이라 새 점수는 아직 제출되지 않는다.
  EXPECT_EQ(deferred->Pending(), 2u);

  while (deferred->RunLast()) {
  }
  auto bob_record = users_->Find("bob");
  ASSERT_TRUE(bob_record.has_value());
  EXPECT_EQ(bob_record->score, 45);
  auto alice_record = users_->Find("alice");
  ASSERT_TRUE(alice_record.has_value());
  EXPECT_EQ(alice_record->score, session_->Score("alice"));
  EXPECT_EQ(alice_record->last_game_id, session_->GameId());
}

TEST_F(GameSessionTest, StatusReflectsRoundState) {
  auto alice = Join("alice");
  auto bob = Join("bob");
  Choose(alice, "apple");

  auto status = session_->Status();
  EXPECT_EQ(status.phase, GamePhase::kPlaying);
  ASSERT_TRUE(status.drawer.has_value());
  EXPECT_EQ(*status.drawer, "alice");
  EXPECT_EQ(status.max_rounds, 3);
  ASSERT_EQ(status.players.size(), 2u);
  EXPECT_EQ(status.players[0].name, "alice");
  EXPECT_FALSE(status.players[1].guessed);
}

TEST(RecapColorTest, InterpolatesFromRedToGreen) {
  EXPECT_EQ(doodle::RecapColor(0.0), "#ff0000");
  EXPECT_EQ(doodle::RecapColor(1.0), "#00ff00");
  EXPECT_EQ(doodle::RecapColor(0.5), "#808000");
  EXPECT_EQ(doodle::RecapColor(2.0), "#00ff00");
}

}  // namespace
