/*
 * 설명: 제시어 저장소 인터페이스와 MariaDB/메모리 구현을 정의한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/word_store_test.cpp, server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "doodle/db_client.hpp"

namespace doodle {

class WordStore {
 public:
  virtual ~WordStore() = default;
  // 서로 다른 단어를 최대 count개 무작위로 반환한다. 실패 시 예외를 던진다.
  virtual std::vector<std::string> FetchRandomWords(bool exclude_deleted, std::size_t count) = 0;
};

struct WordEntry {
  std::string text;
  bool deleted{false};
};

class InMemoryWordStore : public WordStore {
 public:
  explicit InMemoryWordStore(std::vector<WordEntry> words, std::uint32_t seed = std::random_device{}());

  std::vector<std::string> FetchRandomWords(bool exclude_deleted, std::size_t count) override;

  static std::vector<WordEntry> DefaultWords();

 private:
  std::vector<WordEntry> words_;
  std::mt19937 rng_;
  std::mutex mutex_;
};

class MariaDbWordStore : public WordStore {
 public:
  explicit MariaDbWordStore(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema();
  void AddWord(const std::string& text);
  std::vector<std::string> FetchRandomWords(bool exclude_deleted, std::size_t count) override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace doodle
