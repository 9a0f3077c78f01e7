/*
 * 설명: 대소문자 무시 정답 판정과 편집 거리 기반 근접 판정을 구현한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/guess_test.cpp
 */
#include "doodle/guess.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>
#include <vector>

namespace doodle {

std::string ToLower(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::size_t EditDistance(const std::string& a, const std::string& b) {
  std::vector<std::size_t> prev(b.size() + 1);
  std::vector<std::size_t> cur(b.size() + 1);
  std::iota(prev.begin(), prev.end(), 0);
  for (std::size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t substitution = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, substitution});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

GuessVerdict EvaluateGuess(const std::string& guess, const std::string& word, int remaining_time) {
  const auto lowered_guess = ToLower(guess);
  const auto lowered_word = ToLower(word);
  if (lowered_guess == lowered_word) {
    return GuessVerdict::kExact;
  }
  const auto distance = EditDistance(lowered_guess, lowered_word);
  if (distance == 1) {
    return GuessVerdict::kVeryClose;
  }
  if (distance == 2 && remaining_time <= kKindaCloseTimeLimit) {
    return GuessVerdict::kKindaClose;
  }
  return GuessVerdict::kMiss;
}

}  // namespace doodle
