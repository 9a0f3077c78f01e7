/*
 * 설명: HTTP 요청을 처리하고 로그인/상태/메트릭/WS 업그레이드를 분기한다.
 * 버전: v0.4.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "doodle/http_session.hpp"

#include <exception>
#include <utility>

#include <boost/beast/version.hpp>

#include "doodle/api_response.hpp"
#include "doodle/user_store.hpp"

namespace doodle {

namespace {
constexpr const char* kServerName = "doodle-server";
constexpr const char* kVersion = "v0.4.0";

nlohmann::json StatusToJson(const GameStatus& status) {
  nlohmann::json players = nlohmann::json::array();
  for (const auto& player : status.players) {
    players.push_back({{"name", player.name}, {"score", player.score}, {"guessed", player.guessed}});
  }
  return {{"phase", ToString(status.phase)},
          {"gameId", status.game_id},
          {"roundsPlayed", status.rounds_played},
          {"maxRounds", status.max_rounds},
          {"drawer", status.drawer ? nlohmann::json(*status.drawer) : nlohmann::json()},
          {"remainingTime", status.remaining_time},
          {"players", players}};
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<GameService> game, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), game_(std::move(game)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();

  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path = std::string(req_.target());
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path = path.substr(0, qpos);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    return Reply(res, http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", kVersion}}));
  }

  if (req_.method() == http::verb::post && path == "/api/login") {
    return HandleLogin(res);
  }

  if (req_.method() == http::verb::get && path == "/api/game") {
    return Reply(res, http::status::ok, MakeSuccessEnvelope(StatusToJson(game_->Status())));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    auto status = game_->Status();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"messages", {{"received", snapshot.messages_in}, {"rejected", snapshot.messages_rejected}}},
                        {"game", {{"phase", ToString(status.phase)}, {"players", status.players.size()}}}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleLogin(const std::shared_ptr<Response>& res) {
  using boost::beast::http::status;
  auto body_json = nlohmann::json::parse(req_.body(), nullptr, false);
  if (body_json.is_discarded() || !body_json.is_object() || !body_json.contains("login") ||
      !body_json["login"].is_string()) {
    return Reply(res, status::bad_request,
                 MakeErrorEnvelope("bad_request", "login 필드가 필요합니다", {{"field", "login"}}));
  }
  const std::string login = body_json["login"].get<std::string>();
  if (!IsValidLogin(login)) {
    return Reply(res, status::bad_request,
                 MakeErrorEnvelope("invalid_login", "사용할 수 없는 이름입니다",
                                   {{"field", "login"}, {"maxLength", kMaxLoginLength}}));
  }
  try {
    auto token = game_->GetUserStore()->IssueToken(login);
    observability_->Log(LogContext{trace_id_, login, std::nullopt, "login.issued", 0});
    Reply(res, status::ok, MakeSuccessEnvelope({{"token", token}}));
  } catch (const std::exception& ex) {
    observability_->Log(LogLevel::kError, "login.store_failed", {{"traceId", trace_id_}, {"error", ex.what()}});
    Reply(res, status::service_unavailable, MakeErrorEnvelope("store_unavailable", "저장소에 연결할 수 없습니다"));
  }
}

void HttpSession::Reply(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                        const nlohmann::json& body) {
  res->result(status);
  nlohmann::json envelope = body;
  // 응답과 로그를 trace id로 이어 볼 수 있게 한다.
  envelope["meta"]["traceId"] = trace_id_;
  res->body() = envelope.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability_->Log(LogContext{trace_id_, std::nullopt, std::nullopt, std::string(req_.target()), latency});
  boost::beast::http::async_write(stream_, *res,
                                  [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                                    if (ec) {
                                      return;
                                    }
                                    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
                                  });
}

void HttpSession::HandleWebSocket() {
  if (std::string(req_.target()).rfind("/ws", 0) != 0) {
    request_start_ = std::chrono::steady_clock::now();
    trace_id_ = observability_->NextTraceId();
    observability_->IncrementRequest();
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    return Reply(res, boost::beast::http::status::not_found,
                 MakeErrorEnvelope("not_found", "WS 업그레이드는 /ws에서만 지원됩니다"));
  }
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    observability_->Log(LogLevel::kWarn, "connection.upgrade_failed", {{"error", ec.message()}});
    boost::beast::error_code ignored;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), game_, observability_, config_.ws_queue_limit_messages,
                                     config_.ws_queue_limit_bytes)
      ->Run();
}

}  // namespace doodle
