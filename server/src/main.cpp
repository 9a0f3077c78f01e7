/*
 * 설명: 서버 진입점으로 환경설정을 로드/검증해 실행한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include <exception>
#include <iostream>

#include "doodle/app.hpp"

int main() {
  using namespace doodle;
  try {
    AppConfig config = LoadConfigFromEnv();
    ValidateConfig(config);
    ServerApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
