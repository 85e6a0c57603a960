#include "rangeshift/clustering/kmeans.hpp"
#include "rangeshift/core/errors.hpp"

#include "test_support.hpp"

#include <limits>
#include <memory>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using rangeshift::Matrix2Df;
using rangeshift::MaskMatrix;
using rangeshift::clustering::KMeansModel;
using rangeshift::clustering::KMeansParams;

namespace {

Matrix2Df two_blobs() {
    Matrix2Df m(40, 2);
    for (int i = 0; i < 20; ++i) {
        m(i, 0) = 5.0f + static_cast<float>(i % 4);
        m(i, 1) = 50.0f + static_cast<float>(i % 3);
    }
    for (int i = 20; i < 40; ++i) {
        m(i, 0) = 70.0f + static_cast<float>(i % 5);
        m(i, 1) = 8.0f + static_cast<float>(i % 2);
    }
    return m;
}

} // namespace

TEST_CASE("kmeans_separates_two_blobs_and_converges") {
    auto fit = rangeshift::clustering::fit_kmeans(two_blobs(), {"AFG", "PFG"}, KMeansParams{2, 100, 7});

    REQUIRE(fit.converged);
    REQUIRE(fit.iterations <= 100);
    REQUIRE(fit.model->k() == 2);

    const int first = fit.labels[0];
    for (int i = 0; i < 20; ++i) REQUIRE(fit.labels[i] == first);
    for (int i = 20; i < 40; ++i) REQUIRE(fit.labels[i] != first);

    REQUIRE(fit.cluster_sizes[0] == 20);
    REQUIRE(fit.cluster_sizes[1] == 20);
    REQUIRE(fit.inertia > 0.0);
}

TEST_CASE("kmeans_fit_is_deterministic_for_fixed_seed") {
    auto a = rangeshift::clustering::fit_kmeans(two_blobs(), {"AFG", "PFG"}, KMeansParams{3, 50, 11});
    auto b = rangeshift::clustering::fit_kmeans(two_blobs(), {"AFG", "PFG"}, KMeansParams{3, 50, 11});

    REQUIRE(a.model->centroids().isApprox(b.model->centroids()));
    REQUIRE(a.labels == b.labels);
}

TEST_CASE("kmeans_requires_at_least_k_samples") {
    Matrix2Df few(2, 2);
    few << 1.0f, 2.0f,
           3.0f, 4.0f;
    REQUIRE_THROWS_AS(rangeshift::clustering::fit_kmeans(few, {"AFG", "PFG"}, KMeansParams{3, 10, 1}),
                      rangeshift::InsufficientDataError);
}

TEST_CASE("kmeans_assign_breaks_ties_towards_lowest_index") {
    Matrix2Df c(2, 1);
    c << 0.0f,
         2.0f;
    KMeansModel model(c, {"AFG"});

    rangeshift::VectorXf v(1);
    v << 1.0f;
    REQUIRE(model.assign(v) == 0);

    v << 1.5f;
    REQUIRE(model.assign(v) == 1);
}

TEST_CASE("kmeans_assign_rejects_wrong_dimension") {
    Matrix2Df c(2, 2);
    c << 0.0f, 0.0f,
         1.0f, 1.0f;
    KMeansModel model(c, {"AFG", "PFG"});

    rangeshift::VectorXf v(3);
    v << 1.0f, 2.0f, 3.0f;
    REQUIRE_THROWS_AS(model.assign(v), rangeshift::ShapeError);
}

TEST_CASE("classify_without_model_is_a_model_state_error") {
    auto series = rangeshift::testing::make_invasion_series(4, 3, {2000, 2001});
    rangeshift::clustering::KMeansModelPtr none;

    REQUIRE_THROWS_AS(rangeshift::clustering::classify_epoch(none, series.epochs[0], MaskMatrix()),
                      rangeshift::ModelStateError);
    REQUIRE_THROWS_AS(rangeshift::clustering::classify_series(none, series, MaskMatrix()),
                      rangeshift::ModelStateError);
}

TEST_CASE("classify_epoch_marks_masked_and_nodata_pixels") {
    auto series = rangeshift::testing::make_invasion_series(4, 3, {2000});
    series.epochs[0].bands[1](2, 3) = std::numeric_limits<float>::quiet_NaN();

    Matrix2Df c(2, 2);
    c << 5.0f, 50.0f,
         60.0f, 10.0f;
    auto model = std::make_shared<const KMeansModel>(c, std::vector<std::string>{"AFG", "PFG"});

    MaskMatrix mask = MaskMatrix::Ones(3, 4);
    mask(0, 0) = 0;

    auto labels = rangeshift::clustering::classify_epoch(model, series.epochs[0], mask);

    REQUIRE(labels(0, 0) == rangeshift::kLabelNoData);
    REQUIRE(labels(2, 3) == rangeshift::kLabelNoData);
    REQUIRE(labels(1, 0) == 0);
}

TEST_CASE("classify_reapplied_model_gives_identical_labels") {
    auto series = rangeshift::testing::make_invasion_series(8, 6, {2000, 2001, 2002, 2003});
    auto fit = rangeshift::clustering::fit_kmeans(two_blobs(), {"AFG", "PFG"}, KMeansParams{2, 100, 3});

    auto a = rangeshift::clustering::classify_series(fit.model, series, MaskMatrix());
    auto b = rangeshift::clustering::classify_series(fit.model, series, MaskMatrix());

    REQUIRE(a.size() == 4);
    for (size_t t = 0; t < a.size(); ++t) {
        REQUIRE(a[t] == b[t]);
    }
}

TEST_CASE("classify_rejects_band_set_mismatch") {
    auto series = rangeshift::testing::make_invasion_series(2, 2, {2000});
    Matrix2Df c(2, 2);
    c << 0.0f, 0.0f,
         1.0f, 1.0f;
    auto model = std::make_shared<const KMeansModel>(c, std::vector<std::string>{"PFG", "AFG"});

    REQUIRE_THROWS_AS(rangeshift::clustering::classify_epoch(model, series.epochs[0], MaskMatrix()),
                      rangeshift::ShapeError);
}

TEST_CASE("select_target_cluster_by_max_band_or_fixed_label") {
    Matrix2Df c(3, 2);
    c << 10.0f, 40.0f,
         65.0f, 5.0f,
         65.0f, 9.0f;
    KMeansModel model(c, {"AFG", "PFG"});

    rangeshift::clustering::TargetSelection by_band;
    by_band.rule = rangeshift::clustering::TargetRule::MAX_BAND;
    by_band.band = "AFG";
    REQUIRE(rangeshift::clustering::select_target_cluster(model, by_band) == 1);

    by_band.band = "PFG";
    REQUIRE(rangeshift::clustering::select_target_cluster(model, by_band) == 0);

    rangeshift::clustering::TargetSelection fixed;
    fixed.rule = rangeshift::clustering::TargetRule::FIXED;
    fixed.fixed_label = 2;
    REQUIRE(rangeshift::clustering::select_target_cluster(model, fixed) == 2);

    fixed.fixed_label = 3;
    REQUIRE_THROWS_AS(rangeshift::clustering::select_target_cluster(model, fixed), rangeshift::ValidationError);

    by_band.band = "SHR";
    REQUIRE_THROWS_AS(rangeshift::clustering::select_target_cluster(model, by_band), rangeshift::ValidationError);
}

TEST_CASE("model_json_lists_centroids_and_target") {
    Matrix2Df c(2, 2);
    c << 1.0f, 2.0f,
         3.0f, 4.0f;
    KMeansModel model(c, {"AFG", "PFG"});

    auto j = rangeshift::clustering::model_to_json(model, 1);

    REQUIRE(j["k"] == 2);
    REQUIRE(j["target_label"] == 1);
    REQUIRE(j["band_names"][1] == "PFG");
    REQUIRE(j["centroids"][1][0].get<float>() == Catch::Approx(3.0f));
}
