/*
 * 설명: 서버 수명주기, 리스너, 환경설정 로딩/검증을 구현한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#include "doodle/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <csignal>
#include <stdexcept>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "doodle/http_session.hpp"

namespace doodle {

namespace {
// 상태 조회가 게임 strand를 기다리는 동안에도 다른 요청을 처리할 수 있어야 한다.
constexpr unsigned int kMinIoThreads = 2;
}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<GameService> game, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), game_(std::move(game)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->game_, self->observability_)->Run();
          } else if (ec != boost::asio::error::operation_aborted) {
            self->observability_->Log(LogLevel::kWarn, "listener.accept_failed", {{"error", ec.message()}});
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<GameService> game_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  PrepareStores();
  game_service_ = std::make_shared<GameService>(ioc_, config.game,
                                                std::chrono::milliseconds(config.game_tick_interval_ms),
                                                config.store_worker_threads, word_store_, user_store_, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::PrepareStores() {
  const auto ttl = std::chrono::seconds(config_.login_token_ttl_seconds);
  if (config_.store_backend == "memory") {
    word_store_ = std::make_shared<InMemoryWordStore>(InMemoryWordStore::DefaultWords());
    user_store_ = std::make_shared<InMemoryUserStore>(ttl);
    observability_->Log(LogLevel::kInfo, "store.ready", {{"backend", "memory"}});
    return;
  }
  DbConfig db_config{config_.db_host, config_.db_port, config_.db_user, config_.db_password, config_.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  db_client_->SetObservability(observability_);
  auto words = std::make_shared<MariaDbWordStore>(db_client_);
  auto users = std::make_shared<MariaDbUserStore>(db_client_, ttl);
  words->EnsureSchema();
  users->EnsureSchema();
  for (const auto& entry : InMemoryWordStore::DefaultWords()) {
    words->AddWord(entry.text);
  }
  word_store_ = words;
  user_store_ = users;
  observability_->Log(LogLevel::kInfo, "store.ready",
                      {{"backend", "mariadb"}, {"host", config_.db_host}, {"database", config_.db_name}});
}

void ServerApp::Run() {
  running_ = true;
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, game_service_, observability_);
  listener_->Run();
  observability_->Log(LogLevel::kInfo, "server.start",
                      {{"port", config_.port}, {"backend", config_.store_backend},
                       {"tickIntervalMs", config_.game_tick_interval_ms}});
  boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
  signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      observability_->Log(LogLevel::kInfo, "server.signal", {{"signal", signal_number}});
      ioc_.stop();
    }
  });
  RunWorkers();
  ioc_.run();
  Stop();
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(kMinIoThreads, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  observability_->Log(LogLevel::kInfo, "server.stop");
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  game_service_->Shutdown();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_size = [&](const char* key, const char* def) {
    return static_cast<std::size_t>(std::stoul(get_env(key, def)));
  };
  auto get_int = [&](const char* key, const char* def) { return std::stoi(get_env(key, def)); };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(get_int("SERVER_PORT", "8080"));
  cfg.store_backend = get_env("STORE_BACKEND", "mariadb");
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(get_int("DB_PORT", "3306"));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.login_token_ttl_seconds = get_size("LOGIN_TOKEN_TTL_SECONDS", "600");
  cfg.ws_queue_limit_messages = get_size("WS_QUEUE_LIMIT_MESSAGES", "4096");
  cfg.ws_queue_limit_bytes = get_size("WS_QUEUE_LIMIT_BYTES", "4194304");
  cfg.store_worker_threads = get_size("STORE_WORKER_THREADS", "2");
  cfg.game_tick_interval_ms = get_size("GAME_TICK_INTERVAL_MS", "1000");
  cfg.game.max_rounds = get_int("GAME_MAX_ROUNDS", "3");
  cfg.game.round_time = get_int("GAME_ROUND_SECONDS", "80");
  cfg.game.choose_word_time = get_int("GAME_CHOOSE_SECONDS", "20");
  cfg.game.cooldown_time = get_int("GAME_COOLDOWN_SECONDS", "5");
  cfg.game.intermission_time = get_int("GAME_INTERMISSION_SECONDS", "20");
  cfg.game.word_choices = get_size("GAME_WORD_CHOICES", "3");
  return cfg;
}

void ValidateConfig(const AppConfig& config) {
  if (config.store_backend != "mariadb" && config.store_backend != "memory") {
    throw std::invalid_argument("STORE_BACKEND는 mariadb 또는 memory여야 합니다: " + config.store_backend);
  }
  // 알 수 없는 로그 레벨이면 여기서 예외가 난다.
  ParseLogLevel(config.log_level);
  if (config.ws_queue_limit_messages == 0 || config.ws_queue_limit_bytes == 0) {
    throw std::invalid_argument("WS 큐 한도는 0보다 커야 합니다");
  }
  if (config.store_worker_threads == 0) {
    throw std::invalid_argument("STORE_WORKER_THREADS는 0보다 커야 합니다");
  }
  if (config.game_tick_interval_ms == 0 || config.login_token_ttl_seconds == 0) {
    throw std::invalid_argument("GAME_TICK_INTERVAL_MS와 LOGIN_TOKEN_TTL_SECONDS는 0보다 커야 합니다");
  }
  const auto& game = config.game;
  if (game.max_rounds <= 0 || game.round_time <= 0 || game.choose_word_time <= 0 || game.cooldown_time <= 0 ||
      game.intermission_time <= 0) {
    throw std::invalid_argument("게임 라운드 수와 시간 설정은 0보다 커야 합니다");
  }
  if (game.word_choices < 3 || game.word_choices > 9) {
    throw std::invalid_argument("GAME_WORD_CHOICES는 3 이상 9 이하여야 합니다");
  }
}

}  // namespace doodle
