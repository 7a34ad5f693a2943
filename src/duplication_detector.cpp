#include <cq/duplication_detector.h>

#include <cq/worker_pool.h>

#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <tuple>
#include <utility>

namespace cq {
namespace {

constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;
constexpr std::uint64_t kRollingBase = 1000003ULL;

std::uint64_t FnvMix(std::uint64_t hash, std::uint64_t value) {
  for (int byte = 0; byte < 8; ++byte) {
    hash ^= (value >> (byte * 8)) & 0xffU;
    hash *= kFnvPrime;
  }
  return hash;
}

struct Seed {
  std::size_t first_file = 0;
  std::size_t first_start = 0;
  std::size_t second_file = 0;
  std::size_t second_start = 0;
};

// A maximal matching run: [first_begin, first_end) in one file against
// [second_begin, second_begin + length) in the other.
struct Span {
  std::size_t first_file = 0;
  std::size_t second_file = 0;
  std::size_t first_begin = 0;
  std::size_t first_end = 0;
  std::size_t second_begin = 0;

  std::size_t Length() const { return first_end - first_begin; }
  std::size_t SecondEnd() const { return second_begin + Length(); }

  bool operator<(const Span &other) const {
    return std::tie(first_file, first_begin, second_file, second_begin,
                    first_end) <
           std::tie(other.first_file, other.first_begin, other.second_file,
                    other.second_begin, other.first_end);
  }
  bool operator==(const Span &other) const {
    return !(*this < other) && !(other < *this);
  }
};

bool Contains(const Span &outer, const Span &inner) {
  return outer.first_begin <= inner.first_begin &&
         inner.first_end <= outer.first_end &&
         outer.second_begin <= inner.second_begin &&
         inner.SecondEnd() <= outer.SecondEnd();
}

bool SameCodes(const std::vector<std::uint64_t> &lhs, std::size_t lhs_start,
               const std::vector<std::uint64_t> &rhs, std::size_t rhs_start,
               std::size_t length) {
  return std::equal(lhs.begin() + static_cast<std::ptrdiff_t>(lhs_start),
                    lhs.begin() + static_cast<std::ptrdiff_t>(lhs_start + length),
                    rhs.begin() + static_cast<std::ptrdiff_t>(rhs_start));
}

std::vector<std::uint64_t> CodesFor(const NormalizedFile &file) {
  std::vector<std::uint64_t> codes;
  codes.reserve(file.tokens.size());
  for (const auto &token : file.tokens) {
    codes.push_back(TokenCode(token));
  }
  return codes;
}

CloneSpan MakeCloneSpan(const NormalizedFile &file, std::size_t begin,
                        std::size_t end) {
  CloneSpan span;
  span.file = file.path;
  span.start_token = begin;
  span.end_token = end;
  span.start_line = file.tokens[begin].span.start_line;
  span.end_line = file.tokens[begin].span.end_line;
  for (std::size_t i = begin; i < end; ++i) {
    span.start_line = std::min(span.start_line, file.tokens[i].span.start_line);
    span.end_line = std::max(span.end_line, file.tokens[i].span.end_line);
  }
  return span;
}

} // namespace

std::uint64_t TokenCode(const NormalizedToken &token) {
  auto hash = kFnvOffsetBasis;
  hash = FnvMix(hash, static_cast<std::uint64_t>(token.kind));
  hash = FnvMix(hash, static_cast<std::uint64_t>(token.role));
  for (const auto ch : token.structural_text) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

std::vector<std::uint64_t> KGramHashes(const std::vector<std::uint64_t> &codes,
                                       std::size_t k) {
  std::vector<std::uint64_t> hashes;
  if (k == 0 || codes.size() < k) {
    return hashes;
  }
  hashes.reserve(codes.size() - k + 1);

  std::uint64_t leading_power = 1;
  std::uint64_t hash = 0;
  for (std::size_t i = 0; i < k; ++i) {
    hash = hash * kRollingBase + codes[i];
    if (i + 1 < k) {
      leading_power *= kRollingBase;
    }
  }
  hashes.push_back(hash);

  for (std::size_t i = k; i < codes.size(); ++i) {
    hash = (hash - codes[i - k] * leading_power) * kRollingBase + codes[i];
    hashes.push_back(hash);
  }
  return hashes;
}

std::vector<WinnowedHash> Winnow(const std::vector<std::uint64_t> &hashes,
                                 std::size_t window) {
  std::vector<WinnowedHash> selected;
  if (hashes.empty() || window == 0) {
    return selected;
  }
  const auto effective_window = std::min(window, hashes.size());
  bool has_previous = false;
  std::size_t previous = 0;
  for (std::size_t start = 0; start + effective_window <= hashes.size();
       ++start) {
    auto minimum = start;
    for (std::size_t i = start + 1; i < start + effective_window; ++i) {
      if (hashes[i] < hashes[minimum]) {
        minimum = i;
      }
    }
    if (!has_previous || minimum != previous) {
      selected.push_back(WinnowedHash{hashes[minimum], minimum});
      previous = minimum;
      has_previous = true;
    }
  }
  return selected;
}

FingerprintIndex
FingerprintIndex::Build(const std::vector<std::vector<Fingerprint>> &per_file) {
  FingerprintIndex index;
  for (const auto &fingerprints : per_file) {
    for (const auto &fingerprint : fingerprints) {
      index.entries_[fingerprint.hash].push_back(
          Occurrence{fingerprint.file_id, fingerprint.start});
    }
  }
  return index;
}

const std::vector<FingerprintIndex::Occurrence> *
FingerprintIndex::Find(std::uint64_t hash) const {
  const auto found = entries_.find(hash);
  return found == entries_.end() ? nullptr : &found->second;
}

DuplicationDetector::DuplicationDetector(DuplicationOptions options,
                                         std::size_t workers)
    : options_(options), workers_(workers) {}

std::vector<Fingerprint>
DuplicationDetector::Fingerprints(const NormalizedFile &file,
                                  std::size_t file_id) const {
  const auto hashes =
      KGramHashes(CodesFor(file), static_cast<std::size_t>(options_.k));
  std::vector<Fingerprint> fingerprints;
  for (const auto &selected :
       Winnow(hashes, static_cast<std::size_t>(options_.window))) {
    fingerprints.push_back(Fingerprint{selected.hash, file_id, selected.position});
  }
  return fingerprints;
}

DuplicationResult
DuplicationDetector::Detect(const std::vector<NormalizedFile> &files) const {
  const auto k = static_cast<std::size_t>(options_.k);

  std::vector<const NormalizedFile *> ordered;
  for (const auto &file : files) {
    if (!file.parse_failed) {
      ordered.push_back(&file);
    }
  }
  std::sort(ordered.begin(), ordered.end(),
            [](const NormalizedFile *lhs, const NormalizedFile *rhs) {
              return lhs->path < rhs->path;
            });

  std::vector<std::vector<std::uint64_t>> codes(ordered.size());
  std::vector<std::vector<Fingerprint>> fingerprints(ordered.size());
  ParallelFor(ordered.size(), workers_, [&](std::size_t file_id) {
    codes[file_id] = CodesFor(*ordered[file_id]);
    fingerprints[file_id] = Fingerprints(*ordered[file_id], file_id);
  });

  // Barrier: the index is complete before any matching starts.
  const auto index = FingerprintIndex::Build(fingerprints);

  std::vector<Seed> seeds;
  const auto add_seed = [&](const FingerprintIndex::Occurrence &first,
                            const FingerprintIndex::Occurrence &second) {
    if (first.file_id == second.file_id && second.start < first.start + k) {
      return;
    }
    if (!SameCodes(codes[first.file_id], first.start, codes[second.file_id],
                   second.start, k)) {
      return;
    }
    seeds.push_back(
        Seed{first.file_id, first.start, second.file_id, second.start});
  };
  // Occurrences are in (file, start) order, so every seed is canonical.
  for (const auto &entry : index.entries()) {
    const auto &occurrences = entry.second;
    if (occurrences.size() > kMaxPairedOccurrences) {
      for (std::size_t j = 1; j < occurrences.size(); ++j) {
        add_seed(occurrences.front(), occurrences[j]);
      }
      continue;
    }
    for (std::size_t i = 0; i < occurrences.size(); ++i) {
      for (std::size_t j = i + 1; j < occurrences.size(); ++j) {
        add_seed(occurrences[i], occurrences[j]);
      }
    }
  }

  // (first file, second file, diagonal) -> seed starts in the first file.
  std::map<std::tuple<std::size_t, std::size_t, std::ptrdiff_t>,
           std::vector<std::size_t>>
      diagonals;
  for (const auto &seed : seeds) {
    const auto diagonal = static_cast<std::ptrdiff_t>(seed.second_start) -
                          static_cast<std::ptrdiff_t>(seed.first_start);
    diagonals[{seed.first_file, seed.second_file, diagonal}].push_back(
        seed.first_start);
  }

  std::set<Span> spans;
  for (auto &[key, starts] : diagonals) {
    const auto first_file = std::get<0>(key);
    const auto second_file = std::get<1>(key);
    const auto diagonal = std::get<2>(key);
    const auto &lhs = codes[first_file];
    const auto &rhs = codes[second_file];
    const bool same_file = first_file == second_file;
    std::sort(starts.begin(), starts.end());

    std::vector<std::pair<std::size_t, std::size_t>> runs;
    for (const auto start : starts) {
      if (!runs.empty() && start <= runs.back().second) {
        runs.back().second = std::max(runs.back().second, start + k);
      } else {
        runs.emplace_back(start, start + k);
      }
    }

    for (const auto &run : runs) {
      auto begin = run.first;
      auto end = run.second;
      auto second_begin = static_cast<std::size_t>(
          static_cast<std::ptrdiff_t>(begin) + diagonal);
      while (begin > 0 && second_begin > 0 &&
             lhs[begin - 1] == rhs[second_begin - 1]) {
        --begin;
        --second_begin;
      }
      // A same-file run longer than its offset is periodic code; keep the
      // first period so the two sides do not overlap.
      const auto limit = same_file ? static_cast<std::size_t>(diagonal)
                                   : std::numeric_limits<std::size_t>::max();
      end = std::min(end, begin + std::min(limit, end - begin));
      while (end < lhs.size() && second_begin + (end - begin) < rhs.size() &&
             lhs[end] == rhs[second_begin + (end - begin)] &&
             end - begin < limit) {
        ++end;
      }
      if (end - begin < static_cast<std::size_t>(options_.min_clone_tokens)) {
        continue;
      }
      spans.insert(Span{first_file, second_file, begin, end, second_begin});
    }
  }

  std::map<std::pair<std::size_t, std::size_t>, std::vector<Span>> by_pair;
  for (const auto &span : spans) {
    by_pair[{span.first_file, span.second_file}].push_back(span);
  }
  std::vector<Span> survivors;
  for (auto &entry : by_pair) {
    auto &group = entry.second;
    // A container starts no later and, on equal starts, ends later.
    std::sort(group.begin(), group.end(), [](const Span &lhs, const Span &rhs) {
      return std::make_tuple(lhs.first_begin, rhs.first_end, lhs.second_begin) <
             std::make_tuple(rhs.first_begin, lhs.first_end, rhs.second_begin);
    });
    for (std::size_t i = 0; i < group.size(); ++i) {
      const auto &span = group[i];
      const bool subsumed = std::any_of(
          group.begin(), group.begin() + static_cast<std::ptrdiff_t>(i),
          [&](const Span &other) {
            return other.first_end >= span.first_end && Contains(other, span);
          });
      if (!subsumed) {
        survivors.push_back(span);
      }
    }
  }
  std::sort(survivors.begin(), survivors.end());

  DuplicationResult result;
  std::vector<std::vector<bool>> covered(ordered.size());
  for (std::size_t file_id = 0; file_id < ordered.size(); ++file_id) {
    covered[file_id].assign(ordered[file_id]->tokens.size(), false);
  }

  for (const auto &span : survivors) {
    ClonePair pair;
    pair.first = MakeCloneSpan(*ordered[span.first_file], span.first_begin,
                               span.first_end);
    pair.second = MakeCloneSpan(*ordered[span.second_file], span.second_begin,
                                span.SecondEnd());
    result.clones.push_back(std::move(pair));
    std::fill(covered[span.first_file].begin() +
                  static_cast<std::ptrdiff_t>(span.first_begin),
              covered[span.first_file].begin() +
                  static_cast<std::ptrdiff_t>(span.first_end),
              true);
    std::fill(covered[span.second_file].begin() +
                  static_cast<std::ptrdiff_t>(span.second_begin),
              covered[span.second_file].begin() +
                  static_cast<std::ptrdiff_t>(span.SecondEnd()),
              true);
  }

  for (std::size_t file_id = 0; file_id < ordered.size(); ++file_id) {
    FileDuplication file;
    file.path = ordered[file_id]->path;
    file.total_tokens = covered[file_id].size();
    file.covered_tokens = static_cast<std::size_t>(
        std::count(covered[file_id].begin(), covered[file_id].end(), true));
    file.ratio = file.total_tokens == 0
                     ? 0.0
                     : static_cast<double>(file.covered_tokens) /
                           static_cast<double>(file.total_tokens);
    result.total_tokens += file.total_tokens;
    result.covered_tokens += file.covered_tokens;
    result.files.push_back(std::move(file));
  }
  result.repository_ratio =
      result.total_tokens == 0
          ? 0.0
          : static_cast<double>(result.covered_tokens) /
                static_cast<double>(result.total_tokens);

  return result;
}

} // namespace cq
