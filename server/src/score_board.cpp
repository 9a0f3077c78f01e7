/*
 * 설명: 누적 점수/라운드 원장 관리와 점수 규칙을 구현한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/score_board_test.cpp
 */
#include "doodle/score_board.hpp"

#include <algorithm>
#include <cmath>

namespace doodle {

int GuesserScore(int remaining_time, int bonus, bool first_guesser) {
  const int time_bonus = std::min(kGuessTimeBonusCap, static_cast<int>(std::lround(remaining_time * 0.5)));
  return kGuessBaseScore + time_bonus + bonus + (first_guesser ? kFirstGuessBonus : 0);
}

int DrawerScore(int winner_score, int guessed_count, int total_guessers) {
  if (guessed_count <= 0 || total_guessers <= 0) {
    return kDrawerPenalty;
  }
  const double ratio = static_cast<double>(guessed_count) / static_cast<double>(total_guessers);
  return static_cast<int>(std::lround(winner_score * ratio));
}

void ScoreBoard::ResetForGame(const std::vector<std::string>& players) {
  scores_.clear();
  ledger_.clear();
  for (const auto& player : players) {
    scores_[player] = 0;
  }
  next_bonus_ = kGuessInitialBonus;
  correct_guesses_ = 0;
  winner_score_ = 0;
}

void ScoreBoard::BeginRound(const std::vector<std::string>& players) {
  ledger_.clear();
  for (const auto& player : players) {
    ledger_[player] = 0;
    scores_.emplace(player, 0);
  }
  next_bonus_ = kGuessInitialBonus;
  correct_guesses_ = 0;
  winner_score_ = 0;
}

void ScoreBoard::JoinRound(const std::string& player) { ledger_.emplace(player, 0); }

void ScoreBoard::EnsurePlayer(const std::string& player, int initial_score) { scores_.emplace(player, initial_score); }

int ScoreBoard::CreditRound(const std::string& player, int delta) {
  ledger_[player] += delta;
  return scores_[player] += delta;
}

int ScoreBoard::ScoreCorrectGuess(int remaining_time) {
  const bool first = correct_guesses_ == 0;
  const int score = GuesserScore(remaining_time, next_bonus_, first);
  // 보너스 하한은 두지 않는다(정답자가 많으면 음수가 될 수 있다).
  --next_bonus_;
  ++correct_guesses_;
  if (first) {
    winner_score_ = score;
  }
  return score;
}

int ScoreBoard::DrawerPayout(int guessed_count, int total_guessers) const {
  return DrawerScore(winner_score_, guessed_count, total_guessers);
}

int ScoreBoard::Score(const std::string& player) const {
  auto it = scores_.find(player);
  return it == scores_.end() ? 0 : it->second;
}

}  // namespace doodle
