#include "bollmaker/indicator_engine.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

using Catch::Matchers::WithinAbs;

TEST_CASE("identical closes collapse the band onto the price") {
    bollmaker::RollingBand band(21, 2.0);
    for (int i = 0; i < 25; ++i) {
        band.update(100.0);
    }

    const auto snapshot = band.snapshot();
    CHECK(band.is_ready());
    CHECK(band.size() == 21);
    CHECK_THAT(snapshot.middle, WithinAbs(100.0, 1e-12));
    CHECK_THAT(snapshot.upper, WithinAbs(100.0, 1e-12));
    CHECK_THAT(snapshot.lower, WithinAbs(100.0, 1e-12));
}

TEST_CASE("band is not ready until a full period has been observed") {
    bollmaker::RollingBand band(5, 2.0);
    for (int i = 0; i < 4; ++i) {
        band.update(10.0 + i);
        CHECK_FALSE(band.is_ready());
    }
    band.update(14.0);
    CHECK(band.is_ready());
}

TEST_CASE("band uses the population standard deviation") {
    bollmaker::RollingBand band(4, 2.0);
    for (double price : {2.0, 4.0, 4.0, 6.0}) {
        band.update(price);
    }

    // mean 4, population variance 2
    const auto snapshot = band.snapshot();
    CHECK_THAT(snapshot.middle, WithinAbs(4.0, 1e-12));
    CHECK_THAT(snapshot.upper, WithinAbs(4.0 + 2.0 * std::sqrt(2.0), 1e-12));
    CHECK_THAT(snapshot.lower, WithinAbs(4.0 - 2.0 * std::sqrt(2.0), 1e-12));
}

TEST_CASE("window evicts the oldest sample") {
    bollmaker::RollingBand band(3, 1.0);
    for (double price : {100.0, 1.0, 1.0, 1.0}) {
        band.update(price);
    }
    CHECK_THAT(band.snapshot().middle, WithinAbs(1.0, 1e-12));
}

TEST_CASE("rebuild replaces the window with the newest closes") {
    bollmaker::RollingBand band(3, 2.0);
    band.update(500.0);
    band.rebuild({1.0, 2.0, 3.0, 4.0, 5.0});
    CHECK(band.size() == 3);
    CHECK(band.is_ready());
    CHECK_THAT(band.snapshot().middle, WithinAbs(4.0, 1e-12));

    band.rebuild({7.0});
    CHECK_FALSE(band.is_ready());
}

TEST_CASE("engine is ready only when both horizons are full") {
    bollmaker::IndicatorEngine engine(4, 2.0, 2, 2.0);

    engine.refresh({1.0, 2.0}, {1.0, 2.0}, 2.0);
    CHECK_FALSE(engine.is_ready());
    CHECK(engine.short_band().ready);
    CHECK_FALSE(engine.long_band().ready);

    engine.refresh({1.0, 2.0, 3.0, 4.0}, {3.0, 4.0}, 4.0);
    CHECK(engine.is_ready());

    const auto snapshot = engine.snapshot();
    CHECK(snapshot.long_band.ready);
    CHECK(snapshot.short_band.ready);
    CHECK(snapshot.last_price == 4.0);
}

TEST_CASE("live ticks feed both windows") {
    bollmaker::IndicatorEngine engine(3, 2.0, 2, 2.0);
    engine.update(10.0);
    engine.update(10.0);
    CHECK_FALSE(engine.is_ready());
    engine.update(10.0);
    CHECK(engine.is_ready());
    CHECK(engine.last_price() == 10.0);
}

TEST_CASE("non-positive periods are rejected") {
    CHECK_THROWS_AS(bollmaker::RollingBand(0, 2.0), std::invalid_argument);
}
