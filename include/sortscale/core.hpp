// Public API for the sortscale core: pattern generation and the
// empirical-complexity harness. No CLI parsing, file I/O, or plotting.

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sortscale {

// Thrown for negative sizes and unknown pattern/algorithm names.
struct InvalidArgument : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Input distributions supported by the generator
enum class Pattern : int {
  random = 0,
  sorted = 1,
  reversed = 2,
  nearly_sorted = 3,
};

std::string_view pattern_name(Pattern p);
const std::vector<std::string_view> &all_pattern_names();
std::optional<Pattern> parse_pattern(std::string_view name);

// Element types the harness can run on
enum class ElemType : int { i32, i64, f64 };
std::string_view elem_type_name(ElemType t);
std::optional<ElemType> parse_elem_type(std::string_view name);

using Sequence = std::vector<int>;

// Fixed default seed used when none is given, so runs are reproducible.
std::uint64_t default_seed();

// Generate `size` elements following `pattern`. Deterministic for a given
// seed. Throws InvalidArgument for a negative size or unknown pattern name.
Sequence generate(std::int64_t size, Pattern pattern,
                  std::optional<std::uint64_t> seed = std::nullopt);
Sequence generate(std::int64_t size, std::string_view pattern,
                  std::optional<std::uint64_t> seed = std::nullopt);

// Same as generate() for other element types. Instantiated for int,
// long long and double.
template <class T>
std::vector<T> generate_as(std::int64_t size, Pattern pattern,
                           std::optional<std::uint64_t> seed = std::nullopt);

struct HarnessConfig {
  std::vector<std::int64_t> sizes;      // in request order
  std::vector<std::string> patterns;    // names (empty = all)
  std::vector<std::string> algos;       // names (empty = all)
  ElemType type = ElemType::i32;
  int repeats = 3;                      // timed runs; the minimum is reported
  int warmup = 0;                       // untimed runs before timing
  std::optional<std::uint64_t> seed;    // fixed default if not set
  // Largest size each algorithm runs on; larger sizes are skipped.
  std::map<std::string, std::int64_t> max_size;
  bool assert_sorted = false;           // check every timed output
  bool verify = false;                  // compare against std::stable_sort
  int threads = 0;                      // >1 runs trials concurrently
};

struct TimingStats {
  double min_s = 0.0;
  double median_s = 0.0;
  double mean_s = 0.0;
  double max_s = 0.0;
  double stddev_s = 0.0;
};

struct TimingRecord {
  std::string pattern;
  std::string algo;
  std::int64_t N = 0;
  double seconds = 0.0; // fastest of the timed repeats
  TimingStats stats;
  int repeats = 0;
};

struct GrowthRatio {
  std::string pattern;
  std::string algo;
  std::int64_t from_N = 0;
  std::int64_t to_N = 0;
  double ratio = 0.0; // NaN when the smaller size timed at zero
};

struct SkippedTrial {
  std::string pattern;
  std::string algo;
  std::int64_t N = 0;
  std::string reason;
};

struct FailedTrial {
  std::string pattern;
  std::string algo;
  std::int64_t N = 0;
  std::string error;
};

struct HarnessResult {
  ElemType type = ElemType::i32;
  int repeats = 0;
  std::optional<std::uint64_t> seed;
  std::vector<TimingRecord> records; // pattern, size, algo in request order
  std::vector<GrowthRatio> growth;
  std::vector<SkippedTrial> skipped;
  std::vector<FailedTrial> failures;
};

// Run every (pattern, algorithm, size) trial of the config.
// Invalid names or sizes throw InvalidArgument before any trial runs.
// Exceptions thrown by a single trial are recorded in `failures`.
HarnessResult run_benchmark(const HarnessConfig &cfg);

HarnessResult run_benchmark(const std::vector<std::int64_t> &sizes,
                            const std::vector<std::string> &patterns,
                            const std::vector<std::string> &algos);

// Growth ratios for each (pattern, algo) between consecutive entries of
// `sizes`. Pairs missing a record on either side are left out.
std::vector<GrowthRatio> compute_growth(const std::vector<TimingRecord> &records,
                                        const std::vector<std::int64_t> &sizes);

// Names of the built-in algorithms, in registry order.
std::vector<std::string> list_algorithms();

// Formatting helpers (pure; no file I/O)
std::string to_csv(const HarnessResult &r, bool with_header = true);
std::string growth_to_csv(const HarnessResult &r, bool with_header = true);
std::string to_json(const HarnessResult &r, bool pretty = true);
std::string to_jsonl(const HarnessResult &r);

} // namespace sortscale
