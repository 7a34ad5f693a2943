#pragma once

#include <cq/config.h>
#include <cq/models.h>

#include <cstddef>
#include <vector>

namespace cq {

// Percentile bootstrap of the mean. Resample indices are drawn up front from
// a seeded mt19937_64, so the interval does not depend on the worker count or
// on the order the samples arrive in.
class ConfidenceEstimator {
public:
  ConfidenceEstimator(BootstrapOptions options, std::size_t workers);

  ConfidenceInterval Estimate(std::vector<MetricSample> samples) const;

private:
  BootstrapOptions options_;
  std::size_t workers_;
};

} // namespace cq
