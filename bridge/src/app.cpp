/*
 * 설명: 서버 수명주기와 두 리스너(WebSocket, 리소스 HTTP), 워커 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/e2e/handshake_flow_test.cpp, bridge/tests/e2e/resource_transfer_test.cpp
 */
#include "bridge/app.hpp"

#include <algorithm>
#include <chrono>
#include <string>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "bridge/motion_types.hpp"
#include "bridge/resource_ops.hpp"

namespace bridge {

// 연결마다 Session을 만들어 Run()을 호출한다. 두 포트가 같은 수락 루프를 쓴다.
template <class Session, class Context>
class Listener : public std::enable_shared_from_this<Listener<Session, Context>> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<const Context> context, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), context_(std::move(context)),
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
    auto self = this->shared_from_this();
    boost::asio::post(acceptor_.get_executor(), [self]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short Port() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = this->shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<Session>(std::move(socket), self->context_)->Run();
          } else if (ec != boost::asio::error::operation_aborted) {
            self->observability_->Warn("accept_failed", ec.message());
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const Context> context_;
  std::shared_ptr<Observability> observability_;
};

class WsListener : public Listener<HttpSession, ConnectionContext> {
 public:
  using Listener::Listener;
};

class ResourceListener : public Listener<ResourceHttpSession, ResourceEndpointContext> {
 public:
  using Listener::Listener;
};

namespace {
TtsMode ParseTtsMode(const std::string& value) {
  if (value == "local") {
    return TtsMode::kLocal;
  }
  if (value == "remote") {
    return TtsMode::kRemote;
  }
  return TtsMode::kNone;
}

boost::asio::ip::tcp::endpoint MakeEndpoint(const std::string& host, unsigned short port) {
  return {boost::asio::ip::make_address(host.empty() ? std::string{"0.0.0.0"} : host), port};
}
}  // namespace

ServerApp::ServerApp(const AppConfig& config, std::ostream* log_sink)
    : config_(config), work_guard_(boost::asio::make_work_guard(ioc_)),
      derived_base_url_(config.resource_base_url.empty()) {
  ApplyDerivedDefaults(config_);
  observability_ = std::make_shared<Observability>(ParseLogLevel(config_.log_level), log_sink);

  auto token = EnsureAuthToken(config_.auth_token, config_.data_dir);
  config_.auth_token = token.token;
  if (token.generated) {
    observability_->Warn("auth_token_generated", "AUTH_TOKEN이 비어 있어 새 토큰을 생성했습니다",
                         {{"path", config_.data_dir + "/auth_token"}});
  } else if (token.loaded_from_file) {
    observability_->Info("auth_token_loaded", "저장된 인증 토큰을 사용합니다",
                         {{"path", config_.data_dir + "/auth_token"}});
  }
  if (config_.resource_token.empty()) {
    config_.resource_token = config_.auth_token;
  }

  ResourceStoreConfig resource_config;
  resource_config.dir = config_.resource_dir;
  resource_config.max_inline_bytes = config_.resource_max_inline_bytes;
  resource_config.max_resource_bytes = config_.resource_max_bytes;
  resource_config.quota.ttl = std::chrono::seconds(config_.resource_ttl_seconds);
  resource_config.quota.max_total_bytes = config_.resource_max_total_bytes;
  resource_config.quota.max_files = config_.resource_max_files;
  resource_config.protect_recent = std::chrono::seconds(config_.resource_protect_seconds);
  resource_config.base_url = config_.resource_base_url;
  resource_config.resource_path = config_.resource_path;
  resource_config.token = config_.resource_token;
  resource_store_ = std::make_shared<ResourceStore>(resource_config, observability_);

  TempStoreConfig temp_config;
  temp_config.dir = config_.temp_dir;
  temp_config.quota.ttl = std::chrono::seconds(config_.temp_ttl_seconds);
  temp_config.quota.max_total_bytes = config_.temp_max_total_bytes;
  temp_config.quota.max_files = config_.temp_max_files;
  temp_config.protect_recent = std::chrono::seconds(config_.resource_protect_seconds);
  temp_store_ = std::make_shared<TempFileStore>(temp_config, observability_);

  output_converter_ = std::make_shared<OutputConverter>(
      config_.resource_max_inline_bytes, resource_store_, std::make_shared<KeywordMotionClassifier>(), observability_);
  input_converter_ = std::make_shared<InputConverter>(config_.max_message_length, temp_store_);
  sessions_ = std::make_shared<SessionManager>(SessionLimits{config_.max_connections, config_.kick_old}, observability_);

  OutputOptions defaults;
  defaults.tts_mode = ParseTtsMode(config_.tts_mode);
  defaults.voice = config_.tts_voice;
  defaults.auto_emotion = config_.auto_emotion;
  service_ = std::make_shared<BridgeService>(sessions_, output_converter_, defaults, config_.enable_streaming,
                                             std::chrono::milliseconds(config_.request_timeout_ms), observability_);
  service_->SetInboundSink(std::make_shared<EchoInboundSink>(service_, observability_));

  auto ws_context = std::make_shared<ConnectionContext>();
  ws_context->config = config_;
  ws_context->observability = observability_;
  ws_context->sessions = sessions_;
  ws_context->service = service_;
  ws_context->resource_store = resource_store_;
  ws_context->resource_ops = std::make_shared<ResourceOpHandler>(resource_store_, observability_);
  ws_context->input_converter = input_converter_;
  ws_context_ = ws_context;

  resource_context_ = std::make_shared<ResourceEndpointContext>(
      ResourceEndpointContext{resource_store_, temp_store_, service_, observability_});

  cleanup_ = std::make_shared<CleanupScheduler>(ioc_, std::chrono::seconds(config_.cleanup_interval_seconds),
                                                resource_store_, temp_store_, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Start() {
  if (running_.exchange(true)) {
    return;
  }
  ws_listener_ = std::make_shared<WsListener>(ioc_, MakeEndpoint(config_.ws_host, config_.ws_port), ws_context_,
                                              observability_);
  resource_listener_ = std::make_shared<ResourceListener>(
      ioc_, MakeEndpoint(config_.resource_host, config_.resource_port), resource_context_, observability_);
  if (derived_base_url_ && config_.resource_port == 0) {
    config_.resource_base_url = DefaultResourceBaseUrl(config_.resource_host, ResourcePort());
    resource_store_->SetBaseUrl(config_.resource_base_url);
  }
  ws_listener_->Run();
  resource_listener_->Run();
  cleanup_->Start();
  observability_->Info("server_start", "서버 시작",
                       {{"wsPort", WsPort()},
                        {"wsPath", config_.ws_path},
                        {"resourcePort", ResourcePort()},
                        {"resourceBaseUrl", config_.resource_base_url},
                        {"maxConnections", config_.max_connections},
                        {"streaming", config_.enable_streaming}});
  RunWorkers(std::max(1u, std::thread::hardware_concurrency()));
}

void ServerApp::Run() {
  try {
    Start();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Error("server_error", std::string("서버 실행 중 예외: ") + ex.what());
    RequestStop();
  }
}

void ServerApp::RunWorkers(std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::RequestStop() {
  work_guard_.reset();
  if (ws_listener_) {
    ws_listener_->Stop();
  }
  if (resource_listener_) {
    resource_listener_->Stop();
  }
  if (cleanup_) {
    cleanup_->Stop();
  }
  ioc_.stop();
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  RequestStop();
  for (auto& worker : workers_) {
    if (!worker.joinable()) {
      continue;
    }
    if (worker.get_id() == std::this_thread::get_id()) {
      worker.detach();
    } else {
      worker.join();
    }
  }
  workers_.clear();
  observability_->Info("server_stop", "서버 종료");
}

unsigned short ServerApp::WsPort() const { return ws_listener_ ? ws_listener_->Port() : config_.ws_port; }

unsigned short ServerApp::ResourcePort() const {
  return resource_listener_ ? resource_listener_->Port() : config_.resource_port;
}

}  // namespace bridge
