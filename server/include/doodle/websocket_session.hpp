/*
 * 설명: WebSocket 프레임을 게임 메시지로 변환해 GameService에 넘기고 서버 이벤트를 큐를 통해 전송한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "doodle/connection.hpp"
#include "doodle/game_service.hpp"
#include "doodle/observability.hpp"

namespace doodle {

class WebSocketSession : public Connection, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::shared_ptr<GameService> game,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  ~WebSocketSession() override;

  void Run();

  // 아래 메서드는 어느 스레드에서 호출해도 되며 소켓 executor로 넘겨 처리한다.
  void SendEvent(const std::string& event, const nlohmann::json& payload) override;
  void Disconnect(const std::string& reason) override;
  bool IsOpen() const override { return open_.load(); }
  std::string Describe() const override { return description_; }

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleFrame(const std::string& data);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void CloseWith(boost::beast::websocket::close_code code, const std::string& reason);
  void NotifyClosed();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<GameService> game_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
  std::string description_;
  std::atomic<bool> open_{true};
  std::atomic<bool> close_notified_{false};
};

}  // namespace doodle
