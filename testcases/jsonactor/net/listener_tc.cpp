#include "stdinc.hpp"

#include "jsonactor/net/detail/listener.hpp"

#include <catch2/catch.hpp>

namespace jsonactor::net::tests {

namespace asio = boost::asio;
using std::chrono::milliseconds;

CATCH_TEST_CASE("AcceptRetryDelay", "[listener]") {
  CATCH_SECTION("aborted-connections-retry-at-once") {
    const boost::system::error_code aborted = asio::error::connection_aborted;
    for (unsigned failures = 1; failures < 20; ++failures)
      CATCH_REQUIRE(detail::accept_retry_delay(aborted, failures) == milliseconds{0});
  }

  CATCH_SECTION("persistent-errors-back-off") {
    const boost::system::error_code no_descriptors = asio::error::no_descriptors;
    CATCH_REQUIRE(detail::accept_retry_delay(no_descriptors, 1) == milliseconds{50});
    CATCH_REQUIRE(detail::accept_retry_delay(no_descriptors, 2) == milliseconds{100});
    CATCH_REQUIRE(detail::accept_retry_delay(no_descriptors, 3) == milliseconds{200});
    CATCH_REQUIRE(detail::accept_retry_delay(no_descriptors, 7) == milliseconds{2000});
    CATCH_REQUIRE(detail::accept_retry_delay(no_descriptors, 1000) == milliseconds{2000});
  }

  CATCH_SECTION("delay-never-shrinks") {
    const boost::system::error_code no_memory = asio::error::no_memory;
    auto last = milliseconds{0};
    for (unsigned failures = 1; failures < 40; ++failures) {
      const auto delay = detail::accept_retry_delay(no_memory, failures);
      CATCH_REQUIRE(delay >= last);
      CATCH_REQUIRE(delay > milliseconds{0});
      last = delay;
    }
  }
}

} // namespace jsonactor::net::tests
