#include "rangeshift/core/errors.hpp"
#include "rangeshift/sampling/training_sampler.hpp"

#include "test_support.hpp"

#include <cmath>
#include <limits>

#include <catch2/catch_test_macros.hpp>

using rangeshift::MaskMatrix;
using rangeshift::sampling::SamplerParams;

namespace {

rangeshift::TimeSeries sampler_series() {
    return rangeshift::testing::make_series(20, 16, {2000, 2001, 2002}, {"AFG", "PFG"},
                                            [](int b, int t, int x, int y) {
                                                return static_cast<float>(b * 100 + t * 10 + x + y);
                                            });
}

} // namespace

TEST_CASE("sampler_is_deterministic_for_fixed_seed") {
    auto series = sampler_series();
    SamplerParams p;
    p.sample_size = 50;
    p.oversample_factor = 1.5f;
    p.strata_rows = 2;
    p.strata_cols = 3;
    p.seed = 1234;

    auto reader = rangeshift::sampling::series_pixel_reader(series);
    auto a = rangeshift::sampling::draw_training_sample(series.grid, series.years(), series.band_names(),
                                                        MaskMatrix(), MaskMatrix(), reader, p);
    auto b = rangeshift::sampling::draw_training_sample(series.grid, series.years(), series.band_names(),
                                                        MaskMatrix(), MaskMatrix(), reader, p);

    REQUIRE(a.points.size() == 50);
    REQUIRE(b.points.size() == 50);
    for (size_t i = 0; i < a.points.size(); ++i) {
        REQUIRE(a.points[i].x == b.points[i].x);
        REQUIRE(a.points[i].y == b.points[i].y);
        REQUIRE(a.points[i].year == b.points[i].year);
        REQUIRE(a.points[i].values == b.points[i].values);
    }
}

TEST_CASE("sampler_reads_raw_values_of_the_drawn_pixel_year") {
    auto series = sampler_series();
    SamplerParams p;
    p.sample_size = 20;

    auto s = rangeshift::sampling::draw_training_sample(series.grid, series.years(), series.band_names(),
                                                        MaskMatrix(), MaskMatrix(),
                                                        rangeshift::sampling::series_pixel_reader(series), p);

    for (const auto& pt : s.points) {
        REQUIRE(pt.year == 2000 + pt.year_index);
        REQUIRE(pt.values[0] == static_cast<float>(pt.year_index * 10 + pt.x + pt.y));
        REQUIRE(pt.values[1] == static_cast<float>(100 + pt.year_index * 10 + pt.x + pt.y));
    }
    auto m = s.matrix();
    REQUIRE(m.rows() == 20);
    REQUIRE(m.cols() == 2);
}

TEST_CASE("sampler_spreads_candidates_round_robin_over_strata") {
    auto series = rangeshift::testing::make_series(10, 10, {2000}, {"AFG"},
                                                   [](int, int, int, int) { return 1.0f; });
    SamplerParams p;
    p.sample_size = 8;
    p.oversample_factor = 1.0f;
    p.strata_rows = 2;
    p.strata_cols = 2;

    auto s = rangeshift::sampling::draw_training_sample(series.grid, series.years(), series.band_names(),
                                                        MaskMatrix(), MaskMatrix(),
                                                        rangeshift::sampling::series_pixel_reader(series), p);

    REQUIRE(s.points.size() == 8);
    for (size_t i = 0; i < s.points.size(); ++i) {
        const int stratum = static_cast<int>(i % 4);
        const int sr = stratum / 2;
        const int sc = stratum % 2;
        REQUIRE(s.points[i].x >= sc * 5);
        REQUIRE(s.points[i].x < (sc + 1) * 5);
        REQUIRE(s.points[i].y >= sr * 5);
        REQUIRE(s.points[i].y < (sr + 1) * 5);
    }
}

TEST_CASE("sampler_drops_masked_and_nodata_candidates") {
    auto series = rangeshift::testing::make_series(12, 12, {2000, 2001}, {"AFG"},
                                                   [](int, int, int x, int) {
                                                       return x < 3 ? std::numeric_limits<float>::quiet_NaN() : 1.0f;
                                                   });
    MaskMatrix analysis = MaskMatrix::Ones(12, 12);
    analysis.block(0, 9, 12, 3).setZero();
    MaskMatrix study = MaskMatrix::Ones(12, 12);
    study.block(9, 0, 3, 12).setZero();

    SamplerParams p;
    p.sample_size = 30;
    p.oversample_factor = 6.0f;
    p.strata_rows = 3;
    p.strata_cols = 3;

    auto s = rangeshift::sampling::draw_training_sample(series.grid, series.years(), series.band_names(),
                                                        analysis, study,
                                                        rangeshift::sampling::series_pixel_reader(series), p);

    REQUIRE(s.points.size() == 30);
    REQUIRE(s.candidates == 180);
    for (const auto& pt : s.points) {
        REQUIRE(pt.x >= 3);
        REQUIRE(pt.x < 9);
        REQUIRE(pt.y < 9);
        REQUIRE(std::isfinite(pt.values[0]));
    }
}

TEST_CASE("sampler_refuses_undersized_sample") {
    auto series = sampler_series();
    MaskMatrix analysis = MaskMatrix::Zero(16, 20);
    analysis(3, 3) = 1;

    SamplerParams p;
    p.sample_size = 10;
    p.oversample_factor = 2.0f;

    REQUIRE_THROWS_AS(rangeshift::sampling::draw_training_sample(
                          series.grid, series.years(), series.band_names(), analysis, MaskMatrix(),
                          rangeshift::sampling::series_pixel_reader(series), p),
                      rangeshift::InsufficientDataError);
}

TEST_CASE("sampler_rejects_mask_of_wrong_size") {
    auto series = sampler_series();
    SamplerParams p;
    p.sample_size = 5;

    REQUIRE_THROWS_AS(rangeshift::sampling::draw_training_sample(
                          series.grid, series.years(), series.band_names(), MaskMatrix::Ones(4, 4),
                          MaskMatrix(), rangeshift::sampling::series_pixel_reader(series), p),
                      rangeshift::ShapeError);
}
