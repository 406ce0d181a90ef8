#include "zonal_join/stats/statistics.hpp"
#include "zonal_join/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace zonal_join::stats {

void MomentAccumulator::add(float x) {
    if (x < min) min = x;
    if (x > max) max = x;
    sum += x;
    sum2 += static_cast<double>(x) * x;
    ++count;
}

void MomentAccumulator::merge(const MomentAccumulator& other) {
    min = std::min(min, other.min);
    max = std::max(max, other.max);
    sum += other.sum;
    sum2 += other.sum2;
    count += other.count;
}

Statistics MomentAccumulator::finish() const {
    if (count == 0) return empty_statistics();

    const float nan = std::numeric_limits<float>::quiet_NaN();
    const double n = static_cast<double>(count);

    Statistics s = empty_statistics();
    s.min = min;
    s.max = max;
    s.sum = static_cast<float>(sum);
    s.count = count;
    s.mean = static_cast<float>(sum / n);
    s.stddev = static_cast<float>((sum2 - sum * sum / n) / n);
    s.median = nan;
    s.mode = nan;
    s.lower_quart = nan;
    s.upper_quart = nan;
    return s;
}

float find_mode(const std::vector<float>& sorted) {
    if (sorted.empty()) {
        throw ValidationError("find_mode called on an empty array");
    }

    float mode = sorted[0];
    size_t current = 1;
    size_t longest = 1;
    for (size_t i = 1; i < sorted.size(); ++i) {
        if (sorted[i] == sorted[i - 1]) {
            ++current;
        } else {
            current = 1;
        }
        if (current > longest) {
            longest = current;
            mode = sorted[i];
        }
    }
    return mode;
}

Statistics exact_statistics(std::vector<float> values) {
    if (values.empty()) return empty_statistics();

    std::sort(values.begin(), values.end());
    const size_t n = values.size();

    double sum = 0.0;
    for (float x : values) sum += x;

    Statistics s;
    s.min = values.front();
    s.max = values.back();
    s.sum = static_cast<float>(sum);
    s.count = static_cast<std::int64_t>(n);
    // From the double sum so that min <= mean <= max survives rounding
    s.mean = static_cast<float>(sum / static_cast<double>(n));
    s.mode = find_mode(values);

    double abs_dev = 0.0;
    for (float x : values) abs_dev += std::fabs(x - s.mean);
    s.stddev = static_cast<float>(abs_dev / static_cast<double>(n));

    if (n % 2 == 0) {
        s.median = (values[n / 2 - 1] + values[n / 2]) / 2.0f;
    } else {
        s.median = values[n / 2];
    }
    s.lower_quart = values[n / 4];
    s.upper_quart = values[n * 3 / 4];
    return s;
}

Statistics streaming_statistics(const std::vector<float>& values) {
    MomentAccumulator acc;
    for (float x : values) acc.add(x);
    return acc.finish();
}

Statistics compute_statistics(std::vector<float> values, std::int64_t exact_threshold) {
    if (values.empty()) return empty_statistics();
    if (static_cast<std::int64_t>(values.size()) > exact_threshold) {
        return streaming_statistics(values);
    }
    return exact_statistics(std::move(values));
}

FeatureAccumulator::FeatureAccumulator(std::int64_t exact_threshold)
    : exact_threshold_(exact_threshold) {}

void FeatureAccumulator::overflow() {
    overflowed_ = true;
    std::vector<float>().swap(values_);
}

void FeatureAccumulator::add(float x) {
    moments_.add(x);
    if (overflowed_) return;
    if (moments_.count > exact_threshold_) {
        overflow();
    } else {
        values_.push_back(x);
    }
}

void FeatureAccumulator::merge(FeatureAccumulator&& other) {
    moments_.merge(other.moments_);
    if (overflowed_ || other.overflowed_ || moments_.count > exact_threshold_) {
        overflow();
        return;
    }
    values_.insert(values_.end(), other.values_.begin(), other.values_.end());
}

Statistics FeatureAccumulator::finish() const {
    if (moments_.count == 0) return empty_statistics();
    if (overflowed_) return moments_.finish();
    return exact_statistics(values_);
}

StatisticsMap aggregate(std::vector<ValueSample> samples,
                        size_t feature_count,
                        std::int64_t exact_threshold) {
    std::stable_sort(samples.begin(), samples.end(),
                     [](const ValueSample& a, const ValueSample& b) {
                         return a.feature < b.feature;
                     });

    StatisticsMap result;
    std::vector<float> run;
    size_t i1 = 0;
    while (i1 < samples.size()) {
        size_t i2 = i1 + 1;
        while (i2 < samples.size() && samples[i2].feature == samples[i1].feature) {
            ++i2;
        }
        run.clear();
        run.reserve(i2 - i1);
        for (size_t i = i1; i < i2; ++i) {
            run.push_back(samples[i].value);
        }
        result[samples[i1].feature] = compute_statistics(run, exact_threshold);
        i1 = i2;
    }

    for (size_t f = 0; f < feature_count; ++f) {
        result.emplace(static_cast<std::int64_t>(f), empty_statistics());
    }
    return result;
}

AccumulatorMap accumulate(stream::SampleStream& samples, std::int64_t exact_threshold) {
    AccumulatorMap partials;
    ValueSample s;
    while (samples.next(s)) {
        auto it = partials.find(s.feature);
        if (it == partials.end()) {
            it = partials.emplace(s.feature, FeatureAccumulator(exact_threshold)).first;
        }
        it->second.add(s.value);
    }
    return partials;
}

void merge_partials(AccumulatorMap& into, AccumulatorMap&& from) {
    for (auto& [feature, acc] : from) {
        auto it = into.find(feature);
        if (it == into.end()) {
            into.emplace(feature, std::move(acc));
        } else {
            it->second.merge(std::move(acc));
        }
    }
    from.clear();
}

StatisticsMap finish_all(const AccumulatorMap& partials, size_t feature_count) {
    StatisticsMap result;
    for (const auto& [feature, acc] : partials) {
        result[feature] = acc.finish();
    }
    for (size_t f = 0; f < feature_count; ++f) {
        result.emplace(static_cast<std::int64_t>(f), empty_statistics());
    }
    return result;
}

StatisticsMap aggregate(stream::SampleStream& samples,
                        size_t feature_count,
                        std::int64_t exact_threshold) {
    return finish_all(accumulate(samples, exact_threshold), feature_count);
}

} // namespace zonal_join::stats
