#include <cq/confidence_estimator.h>

#include <cq/worker_pool.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <tuple>

namespace cq {

ConfidenceEstimator::ConfidenceEstimator(BootstrapOptions options,
                                         std::size_t workers)
    : options_(options), workers_(workers) {}

ConfidenceInterval
ConfidenceEstimator::Estimate(std::vector<MetricSample> samples) const {
  ConfidenceInterval interval;
  interval.level = options_.confidence_level;
  interval.sample_count = samples.size();
  if (samples.empty()) {
    return interval;
  }

  std::sort(samples.begin(), samples.end(),
            [](const MetricSample &lhs, const MetricSample &rhs) {
              return std::tie(lhs.subject, lhs.value, lhs.metric) <
                     std::tie(rhs.subject, rhs.value, rhs.metric);
            });

  const auto n = samples.size();
  const auto resamples = static_cast<std::size_t>(options_.resamples);

  std::mt19937_64 engine(options_.seed);
  std::vector<std::vector<std::size_t>> indices(resamples);
  for (auto &draw : indices) {
    draw.resize(n);
    for (auto &index : draw) {
      index = static_cast<std::size_t>(engine() % n);
    }
  }

  std::vector<double> means(resamples, 0.0);
  ParallelFor(resamples, workers_, [&](std::size_t b) {
    double total = 0.0;
    for (const auto index : indices[b]) {
      total += samples[index].value;
    }
    means[b] = total / static_cast<double>(n);
  });
  std::sort(means.begin(), means.end());

  const auto tail = (1.0 - options_.confidence_level) / 2.0;
  const auto rank = [&](double p) {
    const auto position =
        static_cast<std::size_t>(std::floor(p * static_cast<double>(resamples - 1)));
    return means[std::min(position, resamples - 1)];
  };
  interval.low = rank(tail);
  interval.high = rank(1.0 - tail);
  return interval;
}

} // namespace cq
