#pragma once

#include <cq/config.h>
#include <cq/models.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cq {

// Stable across runs and platforms: FNV-1a over kind, role and structural
// text. Display spelling and spans do not participate.
std::uint64_t TokenCode(const NormalizedToken &token);

// One polynomial rolling hash per k-gram; empty when there are fewer than k
// codes.
std::vector<std::uint64_t> KGramHashes(const std::vector<std::uint64_t> &codes,
                                       std::size_t k);

struct WinnowedHash {
  std::uint64_t hash = 0;
  std::size_t position = 0;
};

// Selects the minimum of every window of `window` consecutive hashes, ties to
// the earliest position. Consecutive windows selecting the same position
// record it once.
std::vector<WinnowedHash> Winnow(const std::vector<std::uint64_t> &hashes,
                                 std::size_t window);

// A k-gram hash seen more often than this pairs each occurrence with its
// earliest occurrence only, instead of with every other occurrence.
constexpr std::size_t kMaxPairedOccurrences = 64;

// hash -> occurrences. Filled once from per-file fingerprints in file order,
// read-only afterwards.
class FingerprintIndex {
public:
  struct Occurrence {
    std::size_t file_id = 0;
    std::size_t start = 0;
  };

  static FingerprintIndex
  Build(const std::vector<std::vector<Fingerprint>> &per_file);

  const std::vector<Occurrence> *Find(std::uint64_t hash) const;
  const std::map<std::uint64_t, std::vector<Occurrence>> &entries() const {
    return entries_;
  }
  std::size_t size() const { return entries_.size(); }

private:
  std::map<std::uint64_t, std::vector<Occurrence>> entries_;
};

struct FileDuplication {
  std::string path;
  std::size_t total_tokens = 0;
  std::size_t covered_tokens = 0;
  double ratio = 0.0;
};

struct DuplicationResult {
  std::vector<ClonePair> clones;
  // Sorted by path; parse failures are not listed.
  std::vector<FileDuplication> files;
  std::size_t total_tokens = 0;
  std::size_t covered_tokens = 0;
  double repository_ratio = 0.0;
};

class DuplicationDetector {
public:
  DuplicationDetector(DuplicationOptions options, std::size_t workers);

  std::vector<Fingerprint> Fingerprints(const NormalizedFile &file,
                                        std::size_t file_id) const;
  DuplicationResult Detect(const std::vector<NormalizedFile> &files) const;

private:
  DuplicationOptions options_;
  std::size_t workers_;
};

} // namespace cq
