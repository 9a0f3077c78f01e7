/*
 * 설명: OpenSSL CSPRNG 기반 16진 토큰(로그인 토큰, 게임 ID)을 생성한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/random_token_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace doodle {

std::string RandomHex(std::size_t bytes);

}  // namespace doodle
