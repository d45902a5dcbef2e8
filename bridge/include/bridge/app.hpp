/*
 * 설명: 브리지 서버 전체 수명주기(두 리스너, 정리 작업, 워커 스레드)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/e2e/handshake_flow_test.cpp, bridge/tests/e2e/resource_transfer_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <ostream>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "bridge/auth.hpp"
#include "bridge/bridge_service.hpp"
#include "bridge/cleanup_scheduler.hpp"
#include "bridge/config.hpp"
#include "bridge/http_session.hpp"
#include "bridge/input_converter.hpp"
#include "bridge/observability.hpp"
#include "bridge/output_converter.hpp"
#include "bridge/resource_http_session.hpp"
#include "bridge/resource_store.hpp"
#include "bridge/session_manager.hpp"
#include "bridge/temp_store.hpp"

namespace bridge {

class WsListener;
class ResourceListener;

class ServerApp {
 public:
  // 인증 토큰을 확정하고 저장소/변환기/세션 관리자를 만든다. 토큰 저장 실패 시 std::runtime_error.
  explicit ServerApp(const AppConfig& config, std::ostream* log_sink = nullptr);
  ~ServerApp();

  // 두 포트를 열고 정리 작업과 워커 스레드를 시작한다. 바인드 실패 시 boost::beast::system_error.
  // 포트 0이면 임의 포트를 받는다.
  void Start();
  // Start 후 현재 스레드에서도 이벤트 루프를 돌린다. RequestStop까지 블록한다.
  void Run();
  // 리스너를 닫고 이벤트 루프를 멈춘다. 워커 스레드 안에서 불러도 된다.
  void RequestStop();
  // RequestStop 후 워커 스레드를 join한다.
  void Stop();

  unsigned short WsPort() const;
  unsigned short ResourcePort() const;

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<BridgeService> GetService() { return service_; }
  std::shared_ptr<SessionManager> GetSessionManager() { return sessions_; }
  std::shared_ptr<ResourceStore> GetResourceStore() { return resource_store_; }
  std::shared_ptr<TempFileStore> GetTempStore() { return temp_store_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }
  std::shared_ptr<CleanupScheduler> GetCleanupScheduler() { return cleanup_; }

 private:
  void RunWorkers(std::size_t count);

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  // resource_base_url을 설정하지 않아 리스너 포트로 만든 경우
  bool derived_base_url_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ResourceStore> resource_store_;
  std::shared_ptr<TempFileStore> temp_store_;
  std::shared_ptr<OutputConverter> output_converter_;
  std::shared_ptr<InputConverter> input_converter_;
  std::shared_ptr<SessionManager> sessions_;
  std::shared_ptr<BridgeService> service_;
  std::shared_ptr<const ConnectionContext> ws_context_;
  std::shared_ptr<const ResourceEndpointContext> resource_context_;
  std::shared_ptr<CleanupScheduler> cleanup_;
  std::shared_ptr<WsListener> ws_listener_;
  std::shared_ptr<ResourceListener> resource_listener_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace bridge
