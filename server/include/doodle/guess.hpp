/*
 * 설명: 채팅 추측을 제시어와 비교해 정답/근접 여부를 판정한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/guess_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace doodle {

enum class GuessVerdict { kExact, kVeryClose, kKindaClose, kMiss };

constexpr int kKindaCloseTimeLimit = 10;

std::string ToLower(const std::string& text);
std::size_t EditDistance(const std::string& a, const std::string& b);

// 대소문자를 무시하고 비교한다. 거리 2는 남은 시간이 10 이하일 때만 근접으로 본다.
GuessVerdict EvaluateGuess(const std::string& guess, const std::string& word, int remaining_time);

}  // namespace doodle
