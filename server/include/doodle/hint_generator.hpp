/*
 * 설명: 제시어의 마스크 힌트를 만들고 남은 시간에 따라 글자를 하나씩 공개한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/hint_generator_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <set>
#include <string>

namespace doodle {

class HintGenerator {
 public:
  static constexpr char kPlaceholder = '_';

  explicit HintGenerator(std::uint32_t seed = std::random_device{}());

  // 글자 칸은 공백 하나로 구분하며 단어 사이 공백은 세 칸 간격으로 표시된다.
  static std::string BuildMask(const std::string& word, const std::set<std::size_t>& revealed);
  static std::size_t LetterCount(const std::string& word);
  // ceil(LetterCount / 3)
  static std::size_t MaxHints(const std::string& word);
  static bool ShouldReveal(int remaining_time, int hint_window, std::size_t max_hints, std::size_t hints_shown);

  // 공개되지 않은 글자 위치 하나를 균등하게 골라 추가한다. 상한에 도달했으면 아무것도 하지 않는다.
  bool RevealNext(const std::string& word, std::set<std::size_t>& revealed);

 private:
  std::mt19937 rng_;
};

}  // namespace doodle
