/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행하고 SIGINT/SIGTERM에서 종료한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/presence_flow_test.cpp
 */
#include <boost/asio/signal_set.hpp>

#include "presence/app.hpp"

int main() {
  using namespace presence;
  AppConfig config = LoadConfigFromEnv();
  ServerApp app(config);

  boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
  signals.async_wait([&app](const boost::system::error_code& ec, int /*signal*/) {
    if (!ec) {
      // 워커 스레드 join은 Run()이 반환된 뒤 메인 스레드에서 한다.
      app.GetContext().stop();
    }
  });

  app.Run();
  app.Stop();
  return 0;
}
