#include <catch2/catch.hpp>

#include <thread>

#include "../test_util/fakes.hpp"
#include "rpc_health.hpp"

namespace indexer {

TEST_CASE("probe reflects reachability") {
  test::FakeChain chain;
  StopSignal stop;
  RpcHealthMonitor health(chain, stop, 1, 4);
  CHECK(health.probe());
  chain.fail_next(1);
  CHECK_FALSE(health.probe());
  CHECK(health.probe());
}

TEST_CASE("recovery waits until the endpoint answers again") {
  test::FakeChain chain;
  StopSignal stop;
  RpcHealthMonitor health(chain, stop, 1, 4);
  chain.fail_next(3);

  int callbacks = 0;
  CHECK(health.wait_for_recovery([&]() { ++callbacks; }));
  CHECK(health.last_attempts() == 4);
  CHECK(chain.reconnects() == 4);
  CHECK(callbacks == 4);
}

TEST_CASE("stop interrupts the recovery wait") {
  test::FakeChain chain;
  StopSignal stop;
  RpcHealthMonitor health(chain, stop, 20, 100);
  chain.fail_next(1000000);

  std::thread stopper([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stop.request_stop();
  });
  CHECK_FALSE(health.wait_for_recovery());
  stopper.join();
}

TEST_CASE("stop signal wait") {
  StopSignal stop;
  CHECK(stop.wait_for(1));
  stop.request_stop();
  CHECK(stop.stop_requested());
  CHECK_FALSE(stop.wait_for(10000));
  stop.reset();
  CHECK_FALSE(stop.stop_requested());
}

} // namespace indexer
