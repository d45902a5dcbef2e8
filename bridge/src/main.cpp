/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행하고 SIGINT/SIGTERM에서 종료한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/e2e/handshake_flow_test.cpp
 */
#include <csignal>
#include <exception>
#include <iostream>

#include <boost/asio/signal_set.hpp>

#include "bridge/app.hpp"

int main() {
  using namespace bridge;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "설정 로드 실패: " << ex.what() << "\n";
    return 2;
  }

  try {
    ServerApp app(config);
    boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
    signals.async_wait([&app](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      app.GetObservability()->Info("signal_received", "종료 신호 수신, 종료를 준비합니다",
                                   {{"signal", signal_number}});
      app.RequestStop();
    });

    app.Run();
    app.Stop();
  } catch (const std::exception& ex) {
    std::cerr << "서버 초기화 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
