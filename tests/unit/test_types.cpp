#include <catch2/catch_test_macros.hpp>
#include "core/types.hpp"

using namespace tidemark;
using namespace std::chrono_literals;

TEST_CASE("Timestamps format as UTC ISO 8601 with milliseconds", "[types]") {
    REQUIRE(Timestamp(0).to_iso_string() == "1970-01-01T00:00:00.000Z");
    REQUIRE(Timestamp(951'782'400'005).to_iso_string() == "2000-02-29T00:00:00.005Z");
    REQUIRE(Timestamp(1'700'000'000'000).to_iso_string() == "2023-11-14T22:13:20.000Z");
}

TEST_CASE("ManualClock moves only when told to", "[types]") {
    ManualClock clock(Timestamp(1000));
    REQUIRE(clock.now() == Timestamp(1000));

    clock.advance(250ms);
    REQUIRE(clock.now() == Timestamp(1250));
    REQUIRE(clock.now() - Timestamp(1000) == 250ms);

    clock.set(Timestamp(10));
    REQUIRE(clock.now() == Timestamp(10));
}
