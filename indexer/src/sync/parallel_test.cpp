#include <catch2/catch.hpp>

#include <atomic>
#include <stdexcept>
#include <system_error>

#include "parallel.hpp"

namespace indexer {

TEST_CASE("all items run before the error is rethrown") {
  std::vector<int> items = {0, 1, 2, 3, 4, 5, 6, 7};
  std::atomic<int> ran{0};
  CHECK_THROWS_AS(parallel_for_each(items,
                                    [&](int i) {
                                      ++ran;
                                      if (i == 2)
                                        throw std::runtime_error("bad item");
                                    }),
                  std::runtime_error);
  CHECK(ran == 8);
}

TEST_CASE("network errors take precedence") {
  std::vector<int> items = {0, 1, 2, 3};
  CHECK_THROWS_AS(parallel_for_each(items,
                                    [](int i) {
                                      if (i == 0)
                                        throw RpcResponseError(-32000, "boom");
                                      if (i == 3)
                                        throw RpcTransportError("timeout");
                                    }),
                  RpcTransportError);
}

TEST_CASE("resource exhaustion outranks ordinary item errors") {
  std::vector<int> items = {0, 1, 2, 3};
  CHECK_THROWS_AS(parallel_for_each(items,
                                    [](int i) {
                                      if (i == 0)
                                        throw std::runtime_error("bad item");
                                      if (i == 2)
                                        throw std::system_error(
                                            std::make_error_code(std::errc::resource_unavailable_try_again));
                                    }),
                  std::system_error);
  CHECK(aborts_block(std::make_exception_ptr(std::system_error(std::make_error_code(std::errc::not_enough_memory)))));
  CHECK(aborts_block(std::make_exception_ptr(RpcTransportError("timeout"))));
  CHECK_FALSE(aborts_block(std::make_exception_ptr(RpcResponseError(3, "execution reverted"))));
}

TEST_CASE("bounded waves stop after a failing wave") {
  std::vector<int> items = {0, 1, 2, 3, 4, 5};
  std::atomic<int> ran{0};
  CHECK_THROWS(parallel_for_each(
      items,
      [&](int i) {
        ++ran;
        if (i == 1)
          throw std::runtime_error("bad item");
      },
      2));
  CHECK(ran == 2);
}

TEST_CASE("empty input is a no-op") {
  std::vector<int> items;
  CHECK_NOTHROW(parallel_for_each(items, [](int) { throw std::runtime_error("never"); }));
}

} // namespace indexer
