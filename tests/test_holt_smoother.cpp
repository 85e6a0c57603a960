#include "rangeshift/core/errors.hpp"
#include "rangeshift/smoothing/holt_smoother.hpp"

#include "test_support.hpp"

#include <cmath>
#include <limits>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using rangeshift::smoothing::HoltParams;

TEST_CASE("holt_trajectory_matches_hand_computed_recurrence") {
    HoltParams p{0.25f, 0.01f};

    auto out = rangeshift::smoothing::smooth_trajectory({10.0f, 20.0f, 30.0f}, p);

    REQUIRE(out.size() == 3);
    REQUIRE(out[0] == Catch::Approx(10.0f).epsilon(1e-6));
    REQUIRE(out[1] == Catch::Approx(12.5f).epsilon(1e-6));
    REQUIRE(out[2] == Catch::Approx(16.89375f).margin(1e-4));
}

TEST_CASE("holt_step_carries_trend") {
    HoltParams p{0.25f, 0.01f};

    auto s0 = rangeshift::smoothing::holt_init(10.0f);
    auto s1 = rangeshift::smoothing::holt_step(s0.state, 20.0f, p);

    REQUIRE(s0.state.trend == 0.0f);
    REQUIRE(s1.state.level == Catch::Approx(12.5f));
    REQUIRE(s1.state.trend == Catch::Approx(0.025f));
}

TEST_CASE("holt_alpha_one_beta_zero_returns_raw_values") {
    HoltParams p{1.0f, 0.0f};

    auto out = rangeshift::smoothing::smooth_trajectory({3.0f, 42.0f}, p);

    REQUIRE(out[0] == Catch::Approx(3.0f));
    REQUIRE(out[1] == Catch::Approx(42.0f));
}

TEST_CASE("holt_single_observation_is_its_own_level") {
    auto out = rangeshift::smoothing::smooth_trajectory({7.5f}, HoltParams{});
    REQUIRE(out.size() == 1);
    REQUIRE(out[0] == 7.5f);
}

TEST_CASE("holt_level_is_clamped_at_zero") {
    HoltParams p{0.9f, 0.5f};

    auto init = rangeshift::smoothing::holt_init(-4.0f);
    REQUIRE(init.output == 0.0f);

    // A steep drop would push an unclamped level below zero.
    auto out = rangeshift::smoothing::smooth_trajectory({80.0f, 0.0f, 0.0f, 0.0f}, p);
    for (float v : out) {
        REQUIRE(v >= 0.0f);
    }
}

TEST_CASE("holt_nodata_propagates_through_trajectory") {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    auto out = rangeshift::smoothing::smooth_trajectory({10.0f, nan, 30.0f}, HoltParams{});

    REQUIRE(out.size() == 3);
    for (float v : out) {
        REQUIRE_FALSE(std::isfinite(v));
    }
}

TEST_CASE("smooth_series_is_non_negative_and_keeps_shape") {
    const std::vector<int> years = {2001, 2002, 2004, 2007};
    auto raw = rangeshift::testing::make_series(5, 4, years, {"AFG", "PFG", "BGR"},
                                                [](int b, int t, int x, int y) {
                                                    return static_cast<float>(((b + 1) * (t + 3) * (x + 1) * 7 + y * 11) % 41) - 20.0f;
                                                });

    auto smoothed = rangeshift::smoothing::smooth_series(raw, HoltParams{0.4f, 0.2f});

    REQUIRE(smoothed.years() == years);
    REQUIRE(smoothed.band_names() == raw.band_names());
    for (const auto& e : smoothed.epochs) {
        for (const auto& b : e.bands) {
            REQUIRE(b.rows() == 4);
            REQUIRE(b.cols() == 5);
            REQUIRE(b.minCoeff() >= 0.0f);
        }
    }
}

TEST_CASE("smooth_series_marks_pixel_with_nodata_year_in_every_year") {
    auto raw = rangeshift::testing::make_series(3, 2, {2000, 2001, 2002}, {"AFG"},
                                                [](int, int t, int x, int y) {
                                                    if (x == 1 && y == 1 && t == 2) {
                                                        return std::numeric_limits<float>::quiet_NaN();
                                                    }
                                                    return 10.0f;
                                                });

    auto smoothed = rangeshift::smoothing::smooth_series(raw, HoltParams{});

    for (const auto& e : smoothed.epochs) {
        REQUIRE_FALSE(std::isfinite(e.bands[0](1, 1)));
        REQUIRE(e.bands[0](0, 0) == Catch::Approx(10.0f));
    }
}

TEST_CASE("smooth_series_rejects_malformed_series") {
    auto raw = rangeshift::testing::make_series(2, 2, {2000, 2001}, {"AFG"},
                                                [](int, int, int, int) { return 1.0f; });

    SECTION("non_increasing_years") {
        raw.epochs[1].year = 2000;
        REQUIRE_THROWS_AS(rangeshift::smoothing::smooth_series(raw, HoltParams{}), rangeshift::ShapeError);
    }
    SECTION("missing_band") {
        raw.epochs[1].bands.clear();
        REQUIRE_THROWS_AS(rangeshift::smoothing::smooth_series(raw, HoltParams{}), rangeshift::ShapeError);
    }
    SECTION("dimension_mismatch") {
        raw.epochs[1].bands[0] = rangeshift::Matrix2Df::Zero(3, 2);
        REQUIRE_THROWS_AS(rangeshift::smoothing::smooth_series(raw, HoltParams{}), rangeshift::ShapeError);
    }
}

TEST_CASE("holt_params_reject_out_of_range_weights") {
    REQUIRE_THROWS_AS((HoltParams{0.0f, 0.1f}.validate()), rangeshift::ValidationError);
    REQUIRE_THROWS_AS((HoltParams{1.5f, 0.1f}.validate()), rangeshift::ValidationError);
    REQUIRE_THROWS_AS((HoltParams{0.5f, -0.1f}.validate()), rangeshift::ValidationError);
    REQUIRE_NOTHROW((HoltParams{1.0f, 1.0f}.validate()));
}
