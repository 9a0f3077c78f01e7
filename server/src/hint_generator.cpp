/*
 * 설명: 제시어 마스크 생성과 점진적 글자 공개를 구현한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/hint_generator_test.cpp
 */
#include "doodle/hint_generator.hpp"

#include <cctype>
#include <vector>

namespace doodle {
namespace {
bool IsLetter(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
}  // namespace

HintGenerator::HintGenerator(std::uint32_t seed) : rng_(seed) {}

std::string HintGenerator::BuildMask(const std::string& word, const std::set<std::size_t>& revealed) {
  std::string mask;
  mask.reserve(word.size() * 2);
  for (std::size_t i = 0; i < word.size(); ++i) {
    if (i > 0) {
      mask.push_back(' ');
    }
    const char c = word[i];
    if (IsLetter(c)) {
      mask.push_back(revealed.count(i) > 0 ? c : kPlaceholder);
    } else if (IsSpace(c)) {
      mask.push_back(' ');
    } else {
      mask.push_back(c);
    }
  }
  return mask;
}

std::size_t HintGenerator::LetterCount(const std::string& word) {
  std::size_t count = 0;
  for (char c : word) {
    if (IsLetter(c)) {
      ++count;
    }
  }
  return count;
}

std::size_t HintGenerator::MaxHints(const std::string& word) { return (LetterCount(word) + 2) / 3; }

bool HintGenerator::ShouldReveal(int remaining_time, int hint_window, std::size_t max_hints,
                                 std::size_t hints_shown) {
  if (max_hints == 0 || hints_shown >= max_hints) {
    return false;
  }
  const double threshold = static_cast<double>(hint_window) * static_cast<double>(max_hints - hints_shown) /
                           static_cast<double>(max_hints);
  return static_cast<double>(remaining_time) <= threshold;
}

bool HintGenerator::RevealNext(const std::string& word, std::set<std::size_t>& revealed) {
  if (revealed.size() >= MaxHints(word)) {
    return false;
  }
  std::vector<std::size_t> candidates;
  for (std::size_t i = 0; i < word.size(); ++i) {
    if (IsLetter(word[i]) && revealed.count(i) == 0) {
      candidates.push_back(i);
    }
  }
  if (candidates.empty()) {
    return false;
  }
  std::uniform_int_distribution<std::size_t> dist(0, candidates.size() - 1);
  revealed.insert(candidates[dist(rng_)]);
  return true;
}

}  // namespace doodle
