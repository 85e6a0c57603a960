#pragma once

#include "rangeshift/core/types.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rangeshift::clustering {

// Fitted centroids in band space. Immutable once built; shared read-only
// between all classification calls of a run.
class KMeansModel {
public:
    KMeansModel(Matrix2Df centroids, std::vector<std::string> band_names);

    int k() const { return static_cast<int>(centroids_.rows()); }
    int dims() const { return static_cast<int>(centroids_.cols()); }
    const Matrix2Df& centroids() const { return centroids_; }
    const std::vector<std::string>& band_names() const { return band_names_; }

    // Nearest centroid by Euclidean distance, lowest index on ties.
    int assign(const float* values, int dims) const;
    int assign(const VectorXf& values) const;

private:
    Matrix2Df centroids_;
    std::vector<std::string> band_names_;
};

using KMeansModelPtr = std::shared_ptr<const KMeansModel>;

struct KMeansParams {
    int k = 5;
    int max_iterations = 100;
    unsigned int seed = 7;

    void validate() const;
};

struct KMeansFit {
    KMeansModelPtr model;
    int iterations = 0;
    bool converged = false;
    double inertia = 0.0;
    std::vector<long long> cluster_sizes;
    VectorXi labels;  // assignment of every training row
};

// Lloyd's algorithm. Initial centroids are k distinct rows picked by a
// seeded shuffle; a cluster that empties keeps its previous centroid.
// Stops after max_iterations or at the first pass with no label change.
KMeansFit fit_kmeans(const Matrix2Df& samples,
                     const std::vector<std::string>& band_names,
                     const KMeansParams& params);

// Labels every pixel of one epoch. Pixels outside `valid_mask` (empty = all
// valid) or with a non-finite band get kLabelNoData.
LabelMatrix classify_epoch(const KMeansModelPtr& model, const EpochRaster& epoch,
                           const MaskMatrix& valid_mask);

std::vector<LabelMatrix> classify_series(const KMeansModelPtr& model, const TimeSeries& series,
                                         const MaskMatrix& valid_mask);

enum class TargetRule { MAX_BAND, FIXED };

struct TargetSelection {
    TargetRule rule = TargetRule::MAX_BAND;
    std::string band;     // MAX_BAND: band whose centroid value is maximised
    int fixed_label = 0;  // FIXED
};

TargetRule target_rule_from_string(const std::string& s);

// Label of the cluster that represents the target state.
int select_target_cluster(const KMeansModel& model, const TargetSelection& selection);

nlohmann::json model_to_json(const KMeansModel& model, int target_label);

} // namespace rangeshift::clustering
