#pragma once

#include <cq/config.h>
#include <cq/confidence_estimator.h>
#include <cq/models.h>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cq {

struct AggregationInput {
  std::string root_path;
  std::array<PillarScore, kPillarCount> pillars;
  std::vector<Finding> findings;
  std::vector<ClonePair> clones;
  std::vector<FileMetrics> files;
  std::vector<AbsentRelation> absent_relations;
};

// Orders by (file, line, severity, category, message).
bool FindingLess(const Finding &lhs, const Finding &rhs);
void SortFindings(std::vector<Finding> &findings);

// Moves the weight of unavailable pillars onto the available ones in
// proportion to their own weight. All zero when nothing is available.
PillarWeights
RedistributeWeights(const PillarWeights &weights,
                    const std::array<PillarScore, kPillarCount> &pillars);

// 0-100 grade of a single file over the pillars that measured it, or nothing
// when none did.
std::optional<double>
FileGrade(const FileMetrics &file,
          const std::array<PillarScore, kPillarCount> &pillars,
          const PillarWeights &weights);

class Aggregator {
public:
  Aggregator(PillarWeights weights, BootstrapOptions bootstrap,
             std::size_t workers);

  Report Aggregate(AggregationInput input) const;

private:
  PillarWeights weights_;
  ConfidenceEstimator estimator_;
};

} // namespace cq
