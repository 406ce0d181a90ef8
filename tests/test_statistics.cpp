#include "zonal_join/stats/statistics.hpp"
#include "zonal_join/core/errors.hpp"
#include "zonal_join/core/types.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace zonal_join;

namespace {

class VectorSampleStream : public stream::SampleStream {
public:
    explicit VectorSampleStream(std::vector<ValueSample> samples) : samples_(std::move(samples)) {}

    bool next(ValueSample& out) override {
        if (pos_ >= samples_.size()) return false;
        out = samples_[pos_++];
        return true;
    }
    bool cancelled() const override { return false; }
    std::int64_t emitted() const override { return static_cast<std::int64_t>(pos_); }

private:
    std::vector<ValueSample> samples_;
    size_t pos_ = 0;
};

bool same_float(float a, float b) {
    return (std::isnan(a) && std::isnan(b)) || a == b;
}

bool same_stats(const Statistics& a, const Statistics& b) {
    return same_float(a.min, b.min) && same_float(a.max, b.max) &&
           same_float(a.median, b.median) && same_float(a.sum, b.sum) &&
           same_float(a.mode, b.mode) && same_float(a.stddev, b.stddev) &&
           a.count == b.count && same_float(a.mean, b.mean) &&
           same_float(a.lower_quart, b.lower_quart) &&
           same_float(a.upper_quart, b.upper_quart);
}

} // namespace

TEST_CASE("exact_statistics_of_one_to_five") {
    Statistics s = stats::exact_statistics({3.0f, 1.0f, 5.0f, 2.0f, 4.0f});

    REQUIRE(s.count == 5);
    REQUIRE(s.min == 1.0f);
    REQUIRE(s.max == 5.0f);
    REQUIRE(s.sum == 15.0f);
    REQUIRE(s.mean == 3.0f);
    REQUIRE(s.median == 3.0f);
    REQUIRE(s.mode == 1.0f);
    REQUIRE(s.lower_quart == 2.0f);
    REQUIRE(s.upper_quart == 4.0f);
    // Mean absolute deviation: (2 + 1 + 0 + 1 + 2) / 5
    REQUIRE(s.stddev == Catch::Approx(1.2f).epsilon(1e-6));
}

TEST_CASE("exact_statistics_median_of_even_count_averages_middle_pair") {
    Statistics s = stats::exact_statistics({4.0f, 1.0f, 3.0f, 2.0f});

    REQUIRE(s.median == 2.5f);
    REQUIRE(s.lower_quart == 2.0f);  // sorted[1]
    REQUIRE(s.upper_quart == 4.0f);  // sorted[3]
}

TEST_CASE("exact_statistics_of_single_sample") {
    Statistics s = stats::exact_statistics({7.5f});

    REQUIRE(s.count == 1);
    REQUIRE(s.min == 7.5f);
    REQUIRE(s.max == 7.5f);
    REQUIRE(s.median == 7.5f);
    REQUIRE(s.mode == 7.5f);
    REQUIRE(s.mean == 7.5f);
    REQUIRE(s.sum == 7.5f);
    REQUIRE(s.stddev == 0.0f);
    REQUIRE(s.lower_quart == 7.5f);
    REQUIRE(s.upper_quart == 7.5f);
}

TEST_CASE("find_mode_keeps_first_of_equally_long_runs") {
    REQUIRE(stats::find_mode({1.0f, 1.0f, 2.0f, 2.0f}) == 1.0f);
    REQUIRE(stats::find_mode({1.0f, 2.0f, 2.0f, 3.0f, 3.0f, 3.0f}) == 3.0f);
    REQUIRE(stats::find_mode({1.0f, 2.0f, 3.0f}) == 1.0f);
    REQUIRE(stats::find_mode({5.0f, 6.0f, 6.0f, 7.0f, 7.0f}) == 6.0f);
}

TEST_CASE("find_mode_rejects_empty_input") {
    REQUIRE_THROWS_AS(stats::find_mode({}), ValidationError);
}

TEST_CASE("mean_matches_sum_over_count") {
    std::mt19937 gen(42);
    std::uniform_real_distribution<float> dist(-1000.0f, 1000.0f);
    std::vector<float> values(1001);
    for (auto& v : values) v = dist(gen);

    Statistics exact = stats::exact_statistics(values);
    REQUIRE(exact.mean == Catch::Approx(exact.sum / static_cast<float>(exact.count)).margin(1e-3));

    Statistics streamed = stats::streaming_statistics(values);
    REQUIRE(streamed.mean == Catch::Approx(streamed.sum / static_cast<float>(streamed.count)).margin(1e-3));
}

TEST_CASE("mean_of_constant_run_equals_the_value") {
    for (float v : {-7064.88232f, 0.1f, 3.3f, 1234.567f, -0.7f, 98765.43f}) {
        for (size_t n : {3u, 7u, 10u, 1000u}) {
            std::vector<float> values(n, v);

            Statistics exact = stats::exact_statistics(values);
            REQUIRE(exact.mean == v);
            REQUIRE(exact.min <= exact.mean);
            REQUIRE(exact.mean <= exact.max);

            Statistics streamed = stats::streaming_statistics(values);
            REQUIRE(streamed.mean == v);
        }
    }
}

TEST_CASE("mean_stays_within_min_and_max") {
    std::mt19937 gen(5);
    std::uniform_real_distribution<float> dist(-9000.0f, 9000.0f);
    std::uniform_int_distribution<int> len(1, 40);
    for (int trial = 0; trial < 2000; ++trial) {
        // Narrow runs around a random centre are the ones prone to rounding out
        const float centre = dist(gen);
        std::vector<float> values(static_cast<size_t>(len(gen)));
        for (auto& x : values) {
            x = std::nextafter(centre, gen() % 2 ? 1e9f : -1e9f);
        }

        Statistics exact = stats::exact_statistics(values);
        REQUIRE(exact.min <= exact.mean);
        REQUIRE(exact.mean <= exact.max);

        Statistics streamed = stats::streaming_statistics(values);
        REQUIRE(streamed.min <= streamed.mean);
        REQUIRE(streamed.mean <= streamed.max);
    }
}

TEST_CASE("order_invariants_hold_on_random_data") {
    std::mt19937 gen(7);
    std::normal_distribution<float> dist(10.0f, 3.0f);
    std::vector<float> values(257);
    for (auto& v : values) v = dist(gen);

    Statistics s = stats::exact_statistics(values);
    REQUIRE(s.min <= s.lower_quart);
    REQUIRE(s.lower_quart <= s.median);
    REQUIRE(s.median <= s.upper_quart);
    REQUIRE(s.upper_quart <= s.max);
    REQUIRE(s.min <= s.mean);
    REQUIRE(s.mean <= s.max);
    REQUIRE(s.stddev >= 0.0f);
}

TEST_CASE("exact_statistics_is_permutation_invariant") {
    std::vector<float> values = {4.0f, 4.0f, 1.0f, 9.0f, 2.5f, 2.5f, 2.5f, -3.0f, 0.0f};
    Statistics a = stats::exact_statistics(values);

    std::mt19937 gen(3);
    for (int i = 0; i < 5; ++i) {
        std::shuffle(values.begin(), values.end(), gen);
        REQUIRE(same_stats(a, stats::exact_statistics(values)));
    }
}

TEST_CASE("streaming_statistics_reports_population_variance_in_stddev") {
    Statistics s = stats::streaming_statistics({1.0f, 2.0f, 3.0f, 4.0f, 5.0f});

    REQUIRE(s.count == 5);
    REQUIRE(s.min == 1.0f);
    REQUIRE(s.max == 5.0f);
    REQUIRE(s.sum == 15.0f);
    REQUIRE(s.mean == 3.0f);
    // (55 - 225 / 5) / 5
    REQUIRE(s.stddev == Catch::Approx(2.0f).epsilon(1e-6));
    REQUIRE(std::isnan(s.median));
    REQUIRE(std::isnan(s.mode));
    REQUIRE(std::isnan(s.lower_quart));
    REQUIRE(std::isnan(s.upper_quart));
}

TEST_CASE("compute_statistics_of_empty_input_is_sentinel") {
    Statistics s = stats::compute_statistics({});

    REQUIRE(is_empty(s));
    REQUIRE(s.count == 0);
    REQUIRE(std::isnan(s.min));
    REQUIRE(std::isnan(s.max));
    REQUIRE(std::isnan(s.mean));
    REQUIRE(std::isnan(s.sum));
    REQUIRE(std::isnan(s.stddev));
}

TEST_CASE("compute_statistics_switches_path_above_threshold") {
    std::vector<float> values = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};

    Statistics at = stats::compute_statistics(values, 5);
    REQUIRE(at.median == 3.0f);
    REQUIRE(at.stddev == Catch::Approx(1.2f).epsilon(1e-6));

    Statistics above = stats::compute_statistics(values, 4);
    REQUIRE(std::isnan(above.median));
    REQUIRE(above.stddev == Catch::Approx(2.0f).epsilon(1e-6));
    REQUIRE(above.sum == 15.0f);
}

TEST_CASE("compute_statistics_default_threshold_is_five_million") {
    REQUIRE(stats::kDefaultExactThreshold == 5000000);

    std::vector<float> values(5000000, 1.0f);
    Statistics at = stats::compute_statistics(values);
    REQUIRE(at.count == 5000000);
    REQUIRE(at.median == 1.0f);
    REQUIRE(at.mode == 1.0f);

    values.push_back(1.0f);
    Statistics above = stats::compute_statistics(values);
    REQUIRE(above.count == 5000001);
    REQUIRE(std::isnan(above.median));
    REQUIRE(above.min == 1.0f);
    REQUIRE(above.max == 1.0f);
}

TEST_CASE("feature_accumulator_merge_matches_single_pass") {
    std::vector<float> values = {5.0f, 3.0f, 3.0f, 8.0f, 1.0f, 9.0f, 3.0f};

    stats::FeatureAccumulator whole;
    for (float v : values) whole.add(v);

    stats::FeatureAccumulator left;
    stats::FeatureAccumulator right;
    for (size_t i = 0; i < values.size(); ++i) {
        (i < 3 ? left : right).add(values[i]);
    }
    right.merge(std::move(left));

    REQUIRE(right.count() == whole.count());
    REQUIRE(same_stats(right.finish(), whole.finish()));
    REQUIRE(same_stats(whole.finish(), stats::exact_statistics(values)));
}

TEST_CASE("feature_accumulator_drops_values_past_threshold") {
    stats::FeatureAccumulator acc(3);
    acc.add(1.0f);
    acc.add(2.0f);
    acc.add(3.0f);
    REQUIRE(acc.keeps_values());
    REQUIRE(acc.finish().median == 2.0f);

    acc.add(4.0f);
    REQUIRE_FALSE(acc.keeps_values());
    Statistics s = acc.finish();
    REQUIRE(s.count == 4);
    REQUIRE(std::isnan(s.median));
    REQUIRE(s.sum == 10.0f);
}

TEST_CASE("feature_accumulator_merge_overflows_combined_count") {
    stats::FeatureAccumulator a(3);
    stats::FeatureAccumulator b(3);
    a.add(1.0f);
    a.add(2.0f);
    b.add(3.0f);
    b.add(4.0f);

    a.merge(std::move(b));
    REQUIRE(a.count() == 4);
    REQUIRE_FALSE(a.keeps_values());
    REQUIRE(std::isnan(a.finish().median));
}

TEST_CASE("aggregate_groups_samples_by_feature_and_fills_sentinels") {
    std::vector<ValueSample> samples = {
        {2, 10.0f}, {0, 1.0f}, {2, 20.0f}, {0, 3.0f}, {2, 30.0f}
    };

    auto result = stats::aggregate(samples, 4);

    REQUIRE(result.size() == 4);
    REQUIRE(result.at(0).count == 2);
    REQUIRE(result.at(0).mean == 2.0f);
    REQUIRE(is_empty(result.at(1)));
    REQUIRE(result.at(2).count == 3);
    REQUIRE(result.at(2).median == 20.0f);
    REQUIRE(is_empty(result.at(3)));
}

TEST_CASE("aggregate_of_stream_matches_aggregate_of_vector") {
    std::vector<ValueSample> samples;
    std::mt19937 gen(11);
    std::uniform_int_distribution<int> feature(0, 4);
    std::uniform_int_distribution<int> value(0, 20);
    for (int i = 0; i < 500; ++i) {
        samples.push_back({feature(gen), static_cast<float>(value(gen))});
    }

    auto from_vector = stats::aggregate(samples, 6);
    VectorSampleStream stream(samples);
    auto from_stream = stats::aggregate(stream, 6);

    REQUIRE(from_vector.size() == from_stream.size());
    for (const auto& [f, s] : from_vector) {
        REQUIRE(same_stats(s, from_stream.at(f)));
    }
}

TEST_CASE("merge_partials_equals_one_accumulation") {
    std::vector<ValueSample> first = {{0, 1.0f}, {1, 5.0f}, {0, 2.0f}};
    std::vector<ValueSample> second = {{1, 6.0f}, {0, 3.0f}, {2, 9.0f}};
    std::vector<ValueSample> all = first;
    all.insert(all.end(), second.begin(), second.end());

    VectorSampleStream s1(first);
    VectorSampleStream s2(second);
    auto partials = stats::accumulate(s1);
    stats::merge_partials(partials, stats::accumulate(s2));

    auto merged = stats::finish_all(partials, 3);
    auto direct = stats::aggregate(all, 3);

    REQUIRE(merged.size() == 3);
    for (const auto& [f, s] : direct) {
        REQUIRE(same_stats(s, merged.at(f)));
    }
}
