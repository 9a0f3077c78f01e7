/*
 * 설명: 제시어 무작위 추출을 메모리 목록과 MariaDB words 테이블로 구현한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/word_store_test.cpp, server/tests/it/mariadb_store_it_test.cpp
 */
#include "doodle/word_store.hpp"

#include <algorithm>
#include <sstream>

namespace doodle {

InMemoryWordStore::InMemoryWordStore(std::vector<WordEntry> words, std::uint32_t seed)
    : words_(std::move(words)), rng_(seed) {}

std::vector<std::string> InMemoryWordStore::FetchRandomWords(bool exclude_deleted, std::size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> pool;
  for (const auto& entry : words_) {
    if (exclude_deleted && entry.deleted) {
      continue;
    }
    if (std::find(pool.begin(), pool.end(), entry.text) == pool.end()) {
      pool.push_back(entry.text);
    }
  }
  std::shuffle(pool.begin(), pool.end(), rng_);
  if (pool.size() > count) {
    pool.resize(count);
  }
  return pool;
}

std::vector<WordEntry> InMemoryWordStore::DefaultWords() {
  static const char* const kWords[] = {
      "apple",    "banana",   "bicycle",  "bridge",    "butterfly", "camera",    "candle",  "castle",
      "cloud",    "compass",  "dinosaur", "dragon",    "elephant",  "fireworks", "giraffe", "guitar",
      "hammer",   "helicopter", "ice cream", "island",  "kangaroo",  "ladder",    "lighthouse", "mountain",
      "octopus",  "penguin",  "pirate",   "pizza",     "rainbow",   "robot",     "rocket",  "sandwich",
      "snowman",  "spider",   "submarine", "sunflower", "telescope", "tornado",  "umbrella", "volcano",
      "waterfall", "windmill", "wizard",  "zebra"};
  std::vector<WordEntry> words;
  for (const char* word : kWords) {
    words.push_back(WordEntry{word, false});
  }
  return words;
}

MariaDbWordStore::MariaDbWordStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void MariaDbWordStore::EnsureSchema() {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn,
                        "CREATE TABLE IF NOT EXISTS words ("
                        "id INT AUTO_INCREMENT PRIMARY KEY,"
                        "text VARCHAR(64) NOT NULL UNIQUE,"
                        "deleted TINYINT(1) NOT NULL DEFAULT 0"
                        ") DEFAULT CHARSET=utf8mb4;",
                        "words 테이블 생성 실패");
  });
}

void MariaDbWordStore::AddWord(const std::string& text) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT IGNORE INTO words(text, deleted) VALUES('" << db_client_->Escape(conn, text) << "', 0);";
    db_client_->Execute(conn, oss.str(), "단어 추가 실패");
  });
}

std::vector<std::string> MariaDbWordStore::FetchRandomWords(bool exclude_deleted, std::size_t count) {
  std::vector<std::string> words;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    words.clear();
    std::ostringstream oss;
    oss << "SELECT text FROM words";
    if (exclude_deleted) {
      oss << " WHERE deleted = 0";
    }
    oss << " ORDER BY RAND() LIMIT " << count << ";";
    auto res = db_client_->Query(conn, oss.str(), "단어 조회 실패");
    while (MYSQL_ROW row = mysql_fetch_row(res.get())) {
      if (row[0]) {
        words.emplace_back(row[0]);
      }
    }
  });
  return words;
}

}  // namespace doodle
