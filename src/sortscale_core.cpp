// sortscale core library
// Pattern generation, the algorithm registry and the timing harness.

#include "sortscale/core.hpp"
#include "sortscale/algorithms.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <functional>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace sortscale {

using Clock = std::chrono::steady_clock;
using secs = std::chrono::duration<double>;

static constexpr std::array<std::string_view, 4> kPatternNames{
    "random", "sorted", "reversed", "nearly_sorted"};

// Upper bound of values drawn for the random pattern (integral types)
static constexpr long long kRandomMax = 1000000;

std::string_view pattern_name(Pattern p) {
  int i = static_cast<int>(p);
  if (i < 0 || i >= static_cast<int>(kPatternNames.size()))
    return "random";
  return kPatternNames[static_cast<std::size_t>(i)];
}

const std::vector<std::string_view> &all_pattern_names() {
  static const std::vector<std::string_view> v(kPatternNames.begin(),
                                               kPatternNames.end());
  return v;
}

static inline std::string to_lower(std::string s) {
  for (char &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::optional<Pattern> parse_pattern(std::string_view name) {
  std::string s = to_lower(std::string(name));
  if (s == "random")
    return Pattern::random;
  if (s == "sorted")
    return Pattern::sorted;
  if (s == "reversed" || s == "reverse")
    return Pattern::reversed;
  if (s == "nearly_sorted" || s == "nearly-sorted")
    return Pattern::nearly_sorted;
  return std::nullopt;
}

std::string_view elem_type_name(ElemType t) {
  switch (t) {
  case ElemType::i32:
    return "i32";
  case ElemType::i64:
    return "i64";
  case ElemType::f64:
    return "f64";
  }
  return "i32";
}

std::optional<ElemType> parse_elem_type(std::string_view name) {
  std::string s = to_lower(std::string(name));
  if (s == "i32" || s == "int")
    return ElemType::i32;
  if (s == "i64")
    return ElemType::i64;
  if (s == "f64" || s == "double")
    return ElemType::f64;
  return std::nullopt;
}

std::uint64_t default_seed() { return 0x9E3779B97F4A7C15ULL; }

template <class T>
static std::vector<T> make_data(std::size_t n, Pattern pattern,
                                std::mt19937_64 &rng) {
  std::vector<T> v;
  v.resize(n);

  if (pattern == Pattern::reversed) {
    for (std::size_t i = 0; i < n; ++i)
      v[i] = static_cast<T>(n - 1 - i);
    return v;
  }

  if (pattern == Pattern::sorted || pattern == Pattern::nearly_sorted) {
    for (std::size_t i = 0; i < n; ++i)
      v[i] = static_cast<T>(i);
    if (pattern == Pattern::nearly_sorted) {
      // round(1% of n) swaps of two independent positions; a swap may
      // undo or overlap an earlier one
      const auto swaps = static_cast<std::size_t>(
          std::llround(0.01 * static_cast<double>(n)));
      std::uniform_int_distribution<std::size_t> d(0, n ? n - 1 : 0);
      for (std::size_t i = 0; i < swaps; ++i) {
        std::size_t a = d(rng), b = d(rng);
        std::swap(v[a], v[b]);
      }
    }
    return v;
  }

  // random
  if constexpr (std::is_integral_v<T>) {
    std::uniform_int_distribution<T> d(0, static_cast<T>(kRandomMax));
    for (std::size_t i = 0; i < n; ++i)
      v[i] = d(rng);
  } else {
    std::uniform_real_distribution<T> d(T(0), T(1));
    for (std::size_t i = 0; i < n; ++i)
      v[i] = d(rng);
  }
  return v;
}

template <class T>
std::vector<T> generate_as(std::int64_t size, Pattern pattern,
                           std::optional<std::uint64_t> seed) {
  if (size < 0)
    throw InvalidArgument("size must be non-negative, got " +
                          std::to_string(size));
  const int pi = static_cast<int>(pattern);
  if (pi < 0 || pi >= static_cast<int>(kPatternNames.size()))
    throw InvalidArgument("unknown pattern id " + std::to_string(pi));
  std::mt19937_64 rng(seed.value_or(default_seed()));
  return make_data<T>(static_cast<std::size_t>(size), pattern, rng);
}

template std::vector<int> generate_as<int>(std::int64_t, Pattern,
                                           std::optional<std::uint64_t>);
template std::vector<long long>
generate_as<long long>(std::int64_t, Pattern, std::optional<std::uint64_t>);
template std::vector<double> generate_as<double>(std::int64_t, Pattern,
                                                 std::optional<std::uint64_t>);

Sequence generate(std::int64_t size, Pattern pattern,
                  std::optional<std::uint64_t> seed) {
  return generate_as<int>(size, pattern, seed);
}

Sequence generate(std::int64_t size, std::string_view pattern,
                  std::optional<std::uint64_t> seed) {
  auto p = parse_pattern(pattern);
  if (!p)
    throw InvalidArgument("unknown pattern: " + std::string(pattern));
  return generate_as<int>(size, *p, seed);
}

// Registry
template <class T> struct AlgoT {
  std::string name;
  std::function<void(std::vector<T> &)> run;
};

template <class T> static std::vector<AlgoT<T>> build_registry_t() {
  std::vector<AlgoT<T>> regs;
  regs.push_back(
      {"insertion_sort", [](auto &v) { algos::insertion_sort(v); }});
  regs.push_back({"merge_sort", [](auto &v) { algos::merge_sort(v); }});
  regs.push_back({"hybrid_sort", [](auto &v) { algos::hybrid_sort(v); }});
  return regs;
}

std::vector<std::string> list_algorithms() {
  std::vector<std::string> v;
  for (auto &a : build_registry_t<int>())
    v.push_back(a.name);
  return v;
}

template <class T>
static double benchmark_once_t(const std::function<void(std::vector<T> &)> &fn,
                               const std::vector<T> &original,
                               std::vector<T> &work, bool check_sorted,
                               const std::string &algo_name) {
  work.resize(original.size());
  std::copy(original.begin(), original.end(), work.begin());
  auto t0 = Clock::now();
  fn(work);
  auto t1 = Clock::now();
  if (check_sorted && !std::is_sorted(work.begin(), work.end()))
    throw std::runtime_error("Assertion failed: output not sorted (algo=" +
                             algo_name + ", N=" +
                             std::to_string(work.size()) + ")");
  return std::chrono::duration_cast<secs>(t1 - t0).count();
}

static double median(std::vector<double> v) {
  if (v.empty())
    return 0.0;
  std::nth_element(v.begin(),
                   v.begin() + static_cast<std::ptrdiff_t>(v.size() / 2),
                   v.end());
  if (v.size() % 2 == 1)
    return v[v.size() / 2];
  auto a = *std::max_element(
      v.begin(), v.begin() + static_cast<std::ptrdiff_t>(v.size() / 2));
  auto b = v[v.size() / 2];
  return 0.5 * (a + b);
}

static TimingStats summarize(const std::vector<double> &times) {
  TimingStats s;
  if (times.empty())
    return s;
  s.median_s = median(times);
  auto mm = std::minmax_element(times.begin(), times.end());
  s.min_s = *mm.first;
  s.max_s = *mm.second;
  double sum = 0.0;
  for (double x : times)
    sum += x;
  s.mean_s = sum / static_cast<double>(times.size());
  if (times.size() >= 2) {
    double var = 0.0;
    for (double x : times) {
      double d = x - s.mean_s;
      var += d * d;
    }
    s.stddev_s = std::sqrt(var / static_cast<double>(times.size()));
  }
  return s;
}

// Validated view of a HarnessConfig
struct Plan {
  std::vector<std::int64_t> sizes;
  std::vector<Pattern> patterns;
  std::vector<std::size_t> algos; // registry indices
  std::vector<std::optional<std::int64_t>> limits; // per registry index
};

static Plan make_plan(const HarnessConfig &cfg,
                      const std::vector<std::string> &registry) {
  Plan plan;
  for (auto n : cfg.sizes) {
    if (n < 0)
      throw InvalidArgument("size must be non-negative, got " +
                            std::to_string(n));
    plan.sizes.push_back(n);
  }

  if (cfg.patterns.empty()) {
    for (auto name : kPatternNames)
      plan.patterns.push_back(*parse_pattern(name));
  } else {
    for (const auto &name : cfg.patterns) {
      auto p = parse_pattern(name);
      if (!p)
        throw InvalidArgument("unknown pattern: " + name);
      plan.patterns.push_back(*p);
    }
  }

  auto find_algo = [&](const std::string &name) {
    const std::string ln = to_lower(name);
    auto it = std::find(registry.begin(), registry.end(), ln);
    if (it == registry.end())
      throw InvalidArgument("unknown algorithm: " + name);
    return static_cast<std::size_t>(it - registry.begin());
  };
  if (cfg.algos.empty()) {
    for (std::size_t i = 0; i < registry.size(); ++i)
      plan.algos.push_back(i);
  } else {
    for (const auto &name : cfg.algos)
      plan.algos.push_back(find_algo(name));
  }

  plan.limits.resize(registry.size());
  for (const auto &[name, limit] : cfg.max_size) {
    if (limit < 0)
      throw InvalidArgument("size limit for " + name +
                            " must be non-negative, got " +
                            std::to_string(limit));
    plan.limits[find_algo(name)] = limit;
  }
  return plan;
}

struct Trial {
  std::size_t p = 0; // index into plan.patterns
  std::size_t s = 0; // index into plan.sizes
  std::size_t a = 0; // registry index
};

struct Outcome {
  bool ok = false;
  TimingStats stats;
  std::string error;
};

template <class T>
static Outcome run_trial_t(const AlgoT<T> &algo, const std::vector<T> &original,
                           const std::vector<T> *ref, const HarnessConfig &cfg) {
  Outcome out;
  try {
    std::vector<T> work;
    if (ref) {
      work = original;
      algo.run(work);
      if (work != *ref)
        throw std::runtime_error(
            "Verification mismatch vs std::stable_sort: " + algo.name);
    }
    for (int w = 0; w < cfg.warmup; ++w)
      (void)benchmark_once_t<T>(algo.run, original, work, cfg.assert_sorted,
                                algo.name);
    const int reps = std::max(1, cfg.repeats);
    std::vector<double> times;
    times.reserve(static_cast<std::size_t>(reps));
    for (int rep = 0; rep < reps; ++rep)
      times.push_back(benchmark_once_t<T>(algo.run, original, work,
                                          cfg.assert_sorted, algo.name));
    out.stats = summarize(times);
    out.ok = true;
  } catch (const std::exception &e) {
    out.error = e.what();
  }
  return out;
}

template <class T> static HarnessResult run_for_type_core(const HarnessConfig &cfg) {
  const auto regs = build_registry_t<T>();
  std::vector<std::string> names;
  for (const auto &a : regs)
    names.push_back(a.name);
  const Plan plan = make_plan(cfg, names);

  HarnessResult out;
  out.type = cfg.type;
  out.repeats = std::max(1, cfg.repeats);
  out.seed = cfg.seed;

  // Lay out trials in (pattern, size, algo) order; excluded ones are
  // recorded up front and never run.
  const std::size_t S = plan.sizes.size();
  std::vector<Trial> trials;
  std::vector<char> needed(plan.patterns.size() * S, 0);
  for (std::size_t p = 0; p < plan.patterns.size(); ++p) {
    for (std::size_t s = 0; s < S; ++s) {
      for (std::size_t a : plan.algos) {
        const auto &limit = plan.limits[a];
        if (limit && plan.sizes[s] > *limit) {
          out.skipped.push_back(SkippedTrial{
              std::string(pattern_name(plan.patterns[p])), names[a],
              plan.sizes[s],
              "size " + std::to_string(plan.sizes[s]) + " exceeds limit " +
                  std::to_string(*limit) + " for " + names[a]});
          continue;
        }
        trials.push_back(Trial{p, s, a});
        needed[p * S + s] = 1;
      }
    }
  }

  // One input per (pattern, size), shared read-only by all its trials.
  std::vector<std::vector<T>> inputs(needed.size());
  std::vector<std::vector<T>> refs(cfg.verify ? needed.size() : 0);
  // A failed input fails every trial that needs it; the rest still run.
  std::vector<std::string> input_errors(needed.size());
  for (std::size_t i = 0; i < needed.size(); ++i) {
    if (!needed[i])
      continue;
    try {
      inputs[i] = generate_as<T>(plan.sizes[i % S], plan.patterns[i / S],
                                 cfg.seed);
      if (cfg.verify) {
        refs[i] = inputs[i];
        std::stable_sort(refs[i].begin(), refs[i].end());
      }
    } catch (const std::exception &e) {
      input_errors[i] = std::string("input generation failed: ") + e.what();
      inputs[i].clear();
      if (cfg.verify)
        refs[i].clear();
    }
  }

  std::vector<Outcome> outcomes(trials.size());
  const auto count = static_cast<std::ptrdiff_t>(trials.size());
#ifdef _OPENMP
  const int nthreads = std::max(1, cfg.threads);
#pragma omp parallel for schedule(dynamic, 1) num_threads(nthreads) if (nthreads > 1)
#endif
  for (std::ptrdiff_t t = 0; t < count; ++t) {
    const Trial &tr = trials[static_cast<std::size_t>(t)];
    const std::size_t in = tr.p * S + tr.s;
    if (!input_errors[in].empty()) {
      outcomes[static_cast<std::size_t>(t)].error = input_errors[in];
      continue;
    }
    outcomes[static_cast<std::size_t>(t)] = run_trial_t<T>(
        regs[tr.a], inputs[in], cfg.verify ? &refs[in] : nullptr, cfg);
  }

  for (std::size_t t = 0; t < trials.size(); ++t) {
    const Trial &tr = trials[t];
    const Outcome &o = outcomes[t];
    std::string pat(pattern_name(plan.patterns[tr.p]));
    if (!o.ok) {
      out.failures.push_back(FailedTrial{std::move(pat), names[tr.a],
                                         plan.sizes[tr.s], o.error});
      continue;
    }
    TimingRecord rec;
    rec.pattern = std::move(pat);
    rec.algo = names[tr.a];
    rec.N = plan.sizes[tr.s];
    rec.seconds = o.stats.min_s;
    rec.stats = o.stats;
    rec.repeats = out.repeats;
    out.records.push_back(std::move(rec));
  }

  out.growth = compute_growth(out.records, plan.sizes);
  return out;
}

HarnessResult run_benchmark(const HarnessConfig &cfg) {
  switch (cfg.type) {
  case ElemType::i32:
    return run_for_type_core<int>(cfg);
  case ElemType::i64:
    return run_for_type_core<long long>(cfg);
  case ElemType::f64:
    return run_for_type_core<double>(cfg);
  }
  throw InvalidArgument("invalid element type");
}

HarnessResult run_benchmark(const std::vector<std::int64_t> &sizes,
                            const std::vector<std::string> &patterns,
                            const std::vector<std::string> &algos) {
  HarnessConfig cfg;
  cfg.sizes = sizes;
  cfg.patterns = patterns;
  cfg.algos = algos;
  return run_benchmark(cfg);
}

std::vector<GrowthRatio> compute_growth(const std::vector<TimingRecord> &records,
                                        const std::vector<std::int64_t> &sizes) {
  std::vector<std::pair<std::string, std::string>> keys;
  for (const auto &r : records) {
    std::pair<std::string, std::string> k{r.pattern, r.algo};
    if (std::find(keys.begin(), keys.end(), k) == keys.end())
      keys.push_back(std::move(k));
  }

  auto find = [&](const std::pair<std::string, std::string> &k,
                  std::int64_t n) -> const TimingRecord * {
    for (const auto &r : records)
      if (r.N == n && r.pattern == k.first && r.algo == k.second)
        return &r;
    return nullptr;
  };

  std::vector<GrowthRatio> out;
  for (const auto &k : keys) {
    for (std::size_t i = 1; i < sizes.size(); ++i) {
      const TimingRecord *from = find(k, sizes[i - 1]);
      const TimingRecord *to = find(k, sizes[i]);
      if (!from || !to)
        continue;
      GrowthRatio g;
      g.pattern = k.first;
      g.algo = k.second;
      g.from_N = sizes[i - 1];
      g.to_N = sizes[i];
      g.ratio = (from->seconds > 0.0)
                    ? to->seconds / from->seconds
                    : std::numeric_limits<double>::quiet_NaN();
      out.push_back(std::move(g));
    }
  }
  return out;
}

} // namespace sortscale
