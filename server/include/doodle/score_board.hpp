/*
 * 설명: 플레이어 누적 점수와 라운드 점수 원장, 정답자/출제자 점수 규칙을 관리한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/score_board_test.cpp
 */
#pragma once

#include <map>
#include <string>
#include <vector>

namespace doodle {

constexpr int kGuessBaseScore = 10;
constexpr int kGuessTimeBonusCap = 30;
constexpr int kGuessInitialBonus = 6;
constexpr int kFirstGuessBonus = 4;
constexpr int kDrawerPenalty = -10;

// base + min(30, round(remaining * 0.5)) + bonus + (first ? 4 : 0)
int GuesserScore(int remaining_time, int bonus, bool first_guesser);
// 정답자가 있으면 round(winner_score * guessed / total), 없으면 고정 감점.
int DrawerScore(int winner_score, int guessed_count, int total_guessers);

class ScoreBoard {
 public:
  void ResetForGame(const std::vector<std::string>& players);
  void BeginRound(const std::vector<std::string>& players);
  // 라운드 도중 합류한 플레이어는 원장에 0점으로 추가된다.
  void JoinRound(const std::string& player);
  void EnsurePlayer(const std::string& player, int initial_score);

  int CreditRound(const std::string& player, int delta);
  // 정답 순서에 따른 보너스를 소비하고 점수를 계산한다. 적립은 CreditRound로 따로 한다.
  int ScoreCorrectGuess(int remaining_time);
  int DrawerPayout(int guessed_count, int total_guessers) const;

  bool Has(const std::string& player) const { return scores_.count(player) > 0; }
  int Score(const std::string& player) const;
  const std::map<std::string, int>& Ledger() const { return ledger_; }
  int CorrectGuesses() const { return correct_guesses_; }
  int WinnerScore() const { return winner_score_; }

 private:
  std::map<std::string, int> scores_;
  std::map<std::string, int> ledger_;
  int next_bonus_{kGuessInitialBonus};
  int correct_guesses_{0};
  int winner_score_{0};
};

}  // namespace doodle
