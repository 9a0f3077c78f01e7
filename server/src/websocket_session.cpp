/*
 * 설명: WebSocket 읽기/쓰기, 백프레셔, 프로토콜 검증을 처리한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "doodle/websocket_session.hpp"

#include <utility>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

#include "doodle/api_response.hpp"
#include "doodle/protocol.hpp"

namespace doodle {
namespace {
std::atomic<std::uint64_t> next_connection_id{1};

std::string DescribeStream(boost::beast::websocket::stream<boost::beast::tcp_stream>& ws) {
  std::string description = "ws-" + std::to_string(next_connection_id.fetch_add(1));
  boost::beast::error_code ec;
  auto endpoint = ws.next_layer().socket().remote_endpoint(ec);
  if (!ec) {
    description += "@" + endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
  }
  return description;
}
}  // namespace

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<GameService> game, std::shared_ptr<Observability> observability,
                                   std::size_t max_queue_messages, std::size_t max_queue_bytes)
    : ws_(std::move(ws)), game_(std::move(game)), observability_(std::move(observability)),
      max_queue_messages_(max_queue_messages), max_queue_bytes_(max_queue_bytes),
      description_(DescribeStream(ws_)) {}

WebSocketSession::~WebSocketSession() {
  observability_->Log(LogLevel::kDebug, "connection.released", {{"connection", description_}});
}

void WebSocketSession::Run() {
  observability_->Log(LogLevel::kInfo, "connection.open", {{"connection", description_}});
  game_->Opened(shared_from_this());
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    if (ec != boost::beast::websocket::error::closed) {
      observability_->Log(LogLevel::kDebug, "connection.read_error",
                          {{"connection", description_}, {"error", ec.message()}});
    }
    NotifyClosed();
    return;
  }
  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  HandleFrame(data);
  if (closing_) {
    // 닫는 중에는 더 읽지 않는다.
    NotifyClosed();
    return;
  }
  DoRead();
}

void WebSocketSession::HandleFrame(const std::string& data) {
  nlohmann::json message = nlohmann::json::parse(data, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    observability_->IncrementRejected();
    SendError("bad_request", "JSON 파싱 오류", 0);
    return;
  }
  std::uint64_t seq = 0;
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_unsigned()) {
    seq = seq_it->get<std::uint64_t>();
  }
  auto type_it = message.find("t");
  auto event_it = message.find("event");
  if (type_it == message.end() || !type_it->is_string() || *type_it != "event" || event_it == message.end() ||
      !event_it->is_string()) {
    observability_->IncrementRejected();
    SendError("bad_request", "잘못된 메시지 형식", seq);
    return;
  }
  auto payload_it = message.find("p");
  const nlohmann::json payload = payload_it == message.end() ? nlohmann::json() : *payload_it;
  const std::string event = event_it->get<std::string>();

  ParseError error;
  auto parsed = ParseClientMessage(event, payload, error);
  if (!parsed) {
    observability_->IncrementRejected();
    observability_->Log(LogLevel::kDebug, "protocol.reject",
                        {{"connection", description_}, {"event", event}, {"code", error.code}});
    SendError(error.code, error.message, seq);
    return;
  }
  observability_->IncrementMessage();
  game_->Deliver(shared_from_this(), std::move(*parsed));
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  EnqueueMessage(MakeErrorFrame(code, message, seq));
}

void WebSocketSession::SendEvent(const std::string& event, const nlohmann::json& payload) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), frame = MakeEventFrame(event, payload)]() mutable {
    self->EnqueueMessage(std::move(frame));
  });
}

void WebSocketSession::Disconnect(const std::string& reason) {
  open_ = false;
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), reason]() {
    self->CloseWith(boost::beast::websocket::close_code::policy_error, reason);
  });
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    open_ = false;
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  observability_->Log(LogLevel::kWarn, "connection.backpressure",
                      {{"connection", description_}, {"queued", send_queue_.size()}, {"bytes", queued_bytes_}});
  CloseWith(boost::beast::websocket::close_code::policy_error, "backpressure_exceeded");
}

void WebSocketSession::CloseWith(boost::beast::websocket::close_code code, const std::string& reason) {
  if (closing_) {
    return;
  }
  closing_ = true;
  open_ = false;
  // 진행 중인 쓰기의 버퍼는 OnWrite까지 살아 있어야 한다.
  const std::size_t keep = writing_ ? 1 : 0;
  while (send_queue_.size() > keep) {
    queued_bytes_ -= send_queue_.back().size();
    send_queue_.pop_back();
  }
  observability_->Log(LogLevel::kInfo, "connection.closing", {{"connection", description_}, {"reason", reason}});
  boost::beast::websocket::close_reason close_reason{code};
  close_reason.reason = reason;
  auto self = shared_from_this();
  ws_.async_close(close_reason, [self](boost::beast::error_code) { self->NotifyClosed(); });
}

void WebSocketSession::NotifyClosed() {
  if (close_notified_.exchange(true)) {
    return;
  }
  open_ = false;
  observability_->Log(LogLevel::kInfo, "connection.close", {{"connection", description_}});
  game_->Closed(shared_from_this());
}

}  // namespace doodle
