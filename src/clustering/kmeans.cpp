#include "rangeshift/clustering/kmeans.hpp"
#include "rangeshift/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>

namespace rangeshift::clustering {

KMeansModel::KMeansModel(Matrix2Df centroids, std::vector<std::string> band_names)
    : centroids_(std::move(centroids)), band_names_(std::move(band_names)) {
    if (centroids_.rows() < 1) {
        throw ModelStateError("model has no centroids");
    }
    if (static_cast<int>(band_names_.size()) != centroids_.cols()) {
        throw ShapeError("model has " + std::to_string(centroids_.cols()) + " dimensions but " +
                         std::to_string(band_names_.size()) + " band names");
    }
}

int KMeansModel::assign(const float* values, int d) const {
    if (d != dims()) {
        throw ShapeError("vector has " + std::to_string(d) + " bands, model expects " +
                         std::to_string(dims()));
    }
    int best = 0;
    float best_dist = std::numeric_limits<float>::max();
    for (int j = 0; j < k(); ++j) {
        float dist = 0.0f;
        for (int b = 0; b < d; ++b) {
            const float diff = values[b] - centroids_(j, b);
            dist += diff * diff;
        }
        if (dist < best_dist) {
            best_dist = dist;
            best = j;
        }
    }
    return best;
}

int KMeansModel::assign(const VectorXf& values) const {
    return assign(values.data(), static_cast<int>(values.size()));
}

void KMeansParams::validate() const {
    if (k < 1) {
        throw ValidationError("k must be >= 1");
    }
    if (max_iterations < 1) {
        throw ValidationError("max_iterations must be >= 1");
    }
}

KMeansFit fit_kmeans(const Matrix2Df& samples,
                     const std::vector<std::string>& band_names,
                     const KMeansParams& params) {
    params.validate();

    const int n = static_cast<int>(samples.rows());
    const int d = static_cast<int>(samples.cols());
    const int k = params.k;

    if (n < k) {
        throw InsufficientDataError("k-means needs at least " + std::to_string(k) +
                                    " samples, got " + std::to_string(n));
    }
    if (static_cast<int>(band_names.size()) != d) {
        throw ShapeError("sample has " + std::to_string(d) + " bands but " +
                         std::to_string(band_names.size()) + " band names");
    }
    if (!samples.allFinite()) {
        throw ValidationError("training sample contains non-finite values");
    }

    std::mt19937 rng(params.seed);
    std::vector<int> order(static_cast<size_t>(n));
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);

    Matrix2Df centers(k, d);
    for (int j = 0; j < k; ++j) {
        centers.row(j) = samples.row(order[static_cast<size_t>(j)]);
    }

    VectorXi labels = VectorXi::Constant(n, -1);
    KMeansFit fit;

    for (int iter = 0; iter < params.max_iterations; ++iter) {
        const KMeansModel current(centers, band_names);
        bool changed = false;
        for (int i = 0; i < n; ++i) {
            const int lbl = current.assign(samples.row(i).data(), d);
            if (lbl != labels[i]) {
                labels[i] = lbl;
                changed = true;
            }
        }
        fit.iterations = iter + 1;
        if (!changed) {
            fit.converged = true;
            break;
        }

        Matrix2Dd sums = Matrix2Dd::Zero(k, d);
        std::vector<long long> counts(static_cast<size_t>(k), 0);
        for (int i = 0; i < n; ++i) {
            sums.row(labels[i]) += samples.row(i).cast<double>();
            counts[static_cast<size_t>(labels[i])]++;
        }
        for (int j = 0; j < k; ++j) {
            if (counts[static_cast<size_t>(j)] > 0) {
                centers.row(j) = (sums.row(j) / static_cast<double>(counts[static_cast<size_t>(j)])).cast<float>();
            }
        }
    }

    fit.cluster_sizes.assign(static_cast<size_t>(k), 0);
    fit.inertia = 0.0;
    for (int i = 0; i < n; ++i) {
        fit.cluster_sizes[static_cast<size_t>(labels[i])]++;
        fit.inertia += static_cast<double>((samples.row(i) - centers.row(labels[i])).squaredNorm());
    }

    fit.labels = labels;
    fit.model = std::make_shared<const KMeansModel>(centers, band_names);
    return fit;
}

LabelMatrix classify_epoch(const KMeansModelPtr& model, const EpochRaster& epoch,
                           const MaskMatrix& valid_mask) {
    if (!model) {
        throw ModelStateError("classification requested before the cluster model was fitted");
    }
    if (epoch.band_names != model->band_names()) {
        throw ShapeError("epoch " + std::to_string(epoch.year) +
                         " band set does not match the cluster model");
    }

    const int rows = epoch.rows();
    const int cols = epoch.cols();
    const int d = epoch.band_count();
    if (valid_mask.size() != 0 && (valid_mask.rows() != rows || valid_mask.cols() != cols)) {
        throw ShapeError("valid mask does not match epoch " + std::to_string(epoch.year));
    }

    LabelMatrix labels(rows, cols);
    std::vector<float> v(static_cast<size_t>(d));
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (valid_mask.size() != 0 && valid_mask(r, c) == 0) {
                labels(r, c) = kLabelNoData;
                continue;
            }
            bool finite = true;
            for (int b = 0; b < d; ++b) {
                v[static_cast<size_t>(b)] = epoch.bands[static_cast<size_t>(b)](r, c);
                if (!std::isfinite(v[static_cast<size_t>(b)])) finite = false;
            }
            labels(r, c) = finite ? model->assign(v.data(), d) : kLabelNoData;
        }
    }
    return labels;
}

std::vector<LabelMatrix> classify_series(const KMeansModelPtr& model, const TimeSeries& series,
                                         const MaskMatrix& valid_mask) {
    if (!model) {
        throw ModelStateError("classification requested before the cluster model was fitted");
    }
    std::vector<LabelMatrix> out;
    out.reserve(series.epochs.size());
    for (const auto& e : series.epochs) {
        out.push_back(classify_epoch(model, e, valid_mask));
    }
    return out;
}

TargetRule target_rule_from_string(const std::string& s) {
    if (s == "max_band") return TargetRule::MAX_BAND;
    if (s == "fixed") return TargetRule::FIXED;
    throw ValidationError("unknown target selection rule '" + s + "'");
}

int select_target_cluster(const KMeansModel& model, const TargetSelection& selection) {
    if (selection.rule == TargetRule::FIXED) {
        if (selection.fixed_label < 0 || selection.fixed_label >= model.k()) {
            throw ValidationError("target label " + std::to_string(selection.fixed_label) +
                                  " is not in [0," + std::to_string(model.k()) + ")");
        }
        return selection.fixed_label;
    }

    const auto& names = model.band_names();
    auto it = std::find(names.begin(), names.end(), selection.band);
    if (it == names.end()) {
        throw ValidationError("target band '" + selection.band + "' is not a model band");
    }
    const int b = static_cast<int>(it - names.begin());

    int best = 0;
    for (int j = 1; j < model.k(); ++j) {
        if (model.centroids()(j, b) > model.centroids()(best, b)) {
            best = j;
        }
    }
    return best;
}

nlohmann::json model_to_json(const KMeansModel& model, int target_label) {
    nlohmann::json j;
    j["k"] = model.k();
    j["band_names"] = model.band_names();
    j["target_label"] = target_label;
    nlohmann::json centroids = nlohmann::json::array();
    for (int c = 0; c < model.k(); ++c) {
        std::vector<float> row(static_cast<size_t>(model.dims()));
        for (int b = 0; b < model.dims(); ++b) {
            row[static_cast<size_t>(b)] = model.centroids()(c, b);
        }
        centroids.push_back(row);
    }
    j["centroids"] = centroids;
    return j;
}

} // namespace rangeshift::clustering
