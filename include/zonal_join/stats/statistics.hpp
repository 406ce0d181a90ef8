#pragma once

#include "zonal_join/core/types.hpp"
#include "zonal_join/stream/cell_value_stream.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <vector>

namespace zonal_join::stats {

// Runs up to this many samples are sorted; longer runs take the one-pass path
constexpr std::int64_t kDefaultExactThreshold = 5000000;

using StatisticsMap = std::map<std::int64_t, Statistics>;

// Associative fold record for the one-pass path. merge() lets partial
// accumulators from independent partitions be combined in any order.
struct MomentAccumulator {
    float min = std::numeric_limits<float>::infinity();
    float max = -std::numeric_limits<float>::infinity();
    double sum = 0.0;
    double sum2 = 0.0;
    std::int64_t count = 0;

    void add(float x);
    void merge(const MomentAccumulator& other);

    // median, mode and quartiles are NaN; stddev carries
    // (sum2 - sum^2 / count) / count, i.e. the population variance
    Statistics finish() const;
};

// Value of the first strictly longest run of equal values in a sorted array
float find_mode(const std::vector<float>& sorted);

// Full-sort path. stddev carries the mean absolute deviation from the mean;
// quartiles are sorted[n / 4] and sorted[3n / 4] without interpolation.
Statistics exact_statistics(std::vector<float> values);

Statistics streaming_statistics(const std::vector<float>& values);

// Empty input gives the empty sentinel
Statistics compute_statistics(std::vector<float> values,
                              std::int64_t exact_threshold = kDefaultExactThreshold);

// Per-feature running state. Keeps the raw values while the run may still
// take the exact path and drops them once the count passes the threshold.
class FeatureAccumulator {
public:
    explicit FeatureAccumulator(std::int64_t exact_threshold = kDefaultExactThreshold);

    void add(float x);
    void merge(FeatureAccumulator&& other);

    std::int64_t count() const { return moments_.count; }
    bool keeps_values() const { return !overflowed_; }

    Statistics finish() const;

private:
    void overflow();

    std::int64_t exact_threshold_;
    MomentAccumulator moments_;
    std::vector<float> values_;
    bool overflowed_ = false;
};

using AccumulatorMap = std::map<std::int64_t, FeatureAccumulator>;

// Sorts samples by feature (stable) and aggregates each contiguous run.
// Every index in [0, feature_count) is present in the result; features without
// samples get the empty sentinel.
StatisticsMap aggregate(std::vector<ValueSample> samples,
                        size_t feature_count,
                        std::int64_t exact_threshold = kDefaultExactThreshold);

// Fold of a sample stream into per-feature accumulators
AccumulatorMap accumulate(stream::SampleStream& samples,
                          std::int64_t exact_threshold = kDefaultExactThreshold);

// Partition-then-merge: folds `from` into `into`
void merge_partials(AccumulatorMap& into, AccumulatorMap&& from);

StatisticsMap finish_all(const AccumulatorMap& partials, size_t feature_count);

// accumulate() followed by finish_all()
StatisticsMap aggregate(stream::SampleStream& samples,
                        size_t feature_count,
                        std::int64_t exact_threshold = kDefaultExactThreshold);

} // namespace zonal_join::stats
