#include <cq/confidence_estimator.h>

#include <algorithm>
#include <random>

#include <gtest/gtest.h>

namespace cq {
namespace {

std::vector<MetricSample> Samples() {
  std::vector<MetricSample> samples;
  for (int i = 0; i < 40; ++i) {
    samples.push_back(MetricSample{"file" + std::to_string(i) + ".cpp",
                                   "complexity", (i % 7) / 7.0 + i * 0.01});
  }
  return samples;
}

BootstrapOptions Options() {
  BootstrapOptions options;
  options.resamples = 500;
  options.confidence_level = 0.9;
  options.seed = 42;
  return options;
}

TEST(ConfidenceEstimatorTest, SerialAndParallelRunsAreIdentical) {
  const auto serial = ConfidenceEstimator(Options(), 1).Estimate(Samples());
  const auto parallel = ConfidenceEstimator(Options(), 8).Estimate(Samples());

  EXPECT_EQ(serial.low, parallel.low);
  EXPECT_EQ(serial.high, parallel.high);
  EXPECT_EQ(serial.sample_count, 40u);
  EXPECT_DOUBLE_EQ(serial.level, 0.9);
}

TEST(ConfidenceEstimatorTest, SampleArrivalOrderDoesNotMatter) {
  auto shuffled = Samples();
  std::mt19937 engine(7);
  std::shuffle(shuffled.begin(), shuffled.end(), engine);

  const ConfidenceEstimator estimator(Options(), 4);
  const auto ordered = estimator.Estimate(Samples());
  const auto reordered = estimator.Estimate(shuffled);

  EXPECT_EQ(ordered.low, reordered.low);
  EXPECT_EQ(ordered.high, reordered.high);
}

TEST(ConfidenceEstimatorTest, IntervalBracketsTheMean) {
  const auto samples = Samples();
  double mean = 0.0;
  for (const auto &sample : samples) {
    mean += sample.value;
  }
  mean /= static_cast<double>(samples.size());

  const auto interval = ConfidenceEstimator(Options(), 2).Estimate(samples);

  EXPECT_LT(interval.low, interval.high);
  EXPECT_LE(interval.low, mean);
  EXPECT_GE(interval.high, mean);
}

TEST(ConfidenceEstimatorTest, DifferentSeedsMayDiffer) {
  auto other = Options();
  other.seed = 43;

  const auto first = ConfidenceEstimator(Options(), 1).Estimate(Samples());
  const auto second = ConfidenceEstimator(other, 1).Estimate(Samples());

  EXPECT_TRUE(first.low != second.low || first.high != second.high);
}

TEST(ConfidenceEstimatorTest, ConstantSamplesCollapseTheInterval) {
  const std::vector<MetricSample> samples = {
      {"a", "grade", 80.0}, {"b", "grade", 80.0}, {"c", "grade", 80.0}};

  const auto interval = ConfidenceEstimator(Options(), 1).Estimate(samples);

  EXPECT_DOUBLE_EQ(interval.low, 80.0);
  EXPECT_DOUBLE_EQ(interval.high, 80.0);
}

TEST(ConfidenceEstimatorTest, NoSamplesGivesEmptyInterval) {
  const auto interval = ConfidenceEstimator(Options(), 1).Estimate({});

  EXPECT_EQ(interval.sample_count, 0u);
  EXPECT_DOUBLE_EQ(interval.low, 0.0);
  EXPECT_DOUBLE_EQ(interval.high, 0.0);
}

} // namespace
} // namespace cq
