// Core tests for sortscale: generator, harness, growth ratios, formatting
#include "sortscale/core.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace sortscale;

static void require(bool cond, const char *msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
  }
}

static bool contains(const std::vector<std::string> &v, const std::string &s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

template <class F> static bool throws_invalid(F &&f) {
  try {
    f();
  } catch (const InvalidArgument &) {
    return true;
  }
  return false;
}

static void test_generate_basic() {
  require(generate(5, "sorted", 1) == Sequence({0, 1, 2, 3, 4}),
          "generate(5, sorted) == 0..4");
  require(generate(4, "reversed") == Sequence({3, 2, 1, 0}),
          "generate(4, reversed) == 3..0");
  require(generate(3, Pattern::sorted) == generate(3, "SORTED"),
          "pattern names are case-insensitive");
  require(generate(6, "reverse") == generate(6, "reversed"), "alias reverse");

  for (auto name : all_pattern_names()) {
    require(generate(0, name).empty(), "size 0 is empty");
    auto one = generate(1, name, 3);
    require(one.size() == 1, "size 1 has one element");
  }
}

static void test_generate_random() {
  auto a = generate(1000, "random", 42);
  auto b = generate(1000, "random", 42);
  auto c = generate(1000, "random", 43);
  require(a == b, "random deterministic for a seed");
  require(a != c, "different seeds differ");
  require(a.size() == 1000, "random size");
  for (int x : a)
    require(x >= 0 && x <= 1000000, "random values in [0, 1e6]");
  require(generate(100, "random") == generate(100, "random", default_seed()),
          "no seed means the default seed");

  auto d = generate_as<double>(500, Pattern::random, 1);
  for (double x : d)
    require(x >= 0.0 && x < 1.0, "double random in [0, 1)");
  auto l = generate_as<long long>(10, Pattern::sorted);
  require(l.back() == 9, "i64 sorted");
}

static void test_generate_nearly_sorted() {
  const std::int64_t n = 1000;
  auto v = generate(n, "nearly_sorted", 5);
  auto sorted = generate(n, "sorted");
  std::size_t diff = 0;
  for (std::size_t i = 0; i < v.size(); ++i)
    if (v[i] != sorted[i])
      ++diff;
  // round(0.01 * 1000) = 10 swaps, each displaces at most 2 elements
  require(diff <= 20, "nearly_sorted differs in at most 2 * 10 positions");
  require(diff > 0, "nearly_sorted is perturbed");
  auto p = v;
  std::sort(p.begin(), p.end());
  require(p == sorted, "nearly_sorted is a permutation of 0..n-1");

  require(generate(40, "nearly_sorted", 5) == generate(40, "sorted"),
          "round(0.4) = 0 swaps");
}

static void test_generate_errors() {
  require(throws_invalid([] { (void)generate(-1, "sorted"); }),
          "negative size throws InvalidArgument");
  require(throws_invalid([] { (void)generate(10, "zigzag"); }),
          "unknown pattern throws InvalidArgument");
  require(throws_invalid([] { (void)generate(10, static_cast<Pattern>(99)); }),
          "out of range pattern id throws");
  require(!parse_pattern("nope").has_value(), "parse_pattern unknown");
  require(parse_pattern("nearly-sorted") == Pattern::nearly_sorted,
          "parse_pattern alias");
}

static void test_list_algorithms() {
  auto names = list_algorithms();
  require(names.size() == 3, "three algorithms");
  require(contains(names, "insertion_sort"), "insertion_sort listed");
  require(contains(names, "merge_sort"), "merge_sort listed");
  require(contains(names, "hybrid_sort"), "hybrid_sort listed");
}

static void test_run_scenario() {
  auto res = run_benchmark({1000, 2000}, {"random"}, {"insertion_sort"});
  require(res.records.size() == 2, "two timing records");
  require(res.growth.size() == 1, "one growth ratio");
  require(res.skipped.empty() && res.failures.empty(), "nothing skipped");
  require(res.records[0].N == 1000 && res.records[1].N == 2000,
          "records in size order");
  for (const auto &r : res.records) {
    require(r.pattern == "random" && r.algo == "insertion_sort", "labels");
    require(r.seconds >= 0.0, "elapsed non-negative");
    require(r.seconds == r.stats.min_s, "elapsed is the fastest repeat");
    require(r.stats.min_s <= r.stats.median_s &&
                r.stats.median_s <= r.stats.max_s,
            "min <= median <= max");
    require(r.repeats == 3, "default repeats");
  }
  const auto &g = res.growth[0];
  require(g.from_N == 1000 && g.to_N == 2000, "growth pair sizes");
  if (res.records[0].seconds > 0.0)
    require(std::abs(g.ratio - res.records[1].seconds /
                                   res.records[0].seconds) < 1e-12,
            "growth = t(2000) / t(1000)");
}

static void test_run_all_combinations() {
  HarnessConfig cfg;
  cfg.sizes = {64, 256, 512};
  cfg.repeats = 1;
  cfg.assert_sorted = true;
  cfg.verify = true;
  auto res = run_benchmark(cfg);
  // 4 patterns x 3 algos x 3 sizes
  require(res.records.size() == 36, "all combinations recorded");
  require(res.growth.size() == 4 * 3 * 2, "two ratios per pattern/algo");
  require(res.failures.empty(), "verified without failures");
  require(res.records.front().pattern == "random" &&
              res.records.front().algo == "insertion_sort" &&
              res.records.front().N == 64,
          "first record is first pattern/size/algo");
}

static void test_skip_policy() {
  HarnessConfig cfg;
  cfg.sizes = {100, 200, 400};
  cfg.patterns = {"sorted"};
  cfg.algos = {"insertion_sort", "merge_sort"};
  cfg.repeats = 1;
  cfg.max_size["insertion_sort"] = 200;
  auto res = run_benchmark(cfg);
  require(res.skipped.size() == 1, "one skipped entry");
  require(res.skipped[0].algo == "insertion_sort" && res.skipped[0].N == 400,
          "skipped insertion_sort at 400");
  require(!res.skipped[0].reason.empty(), "skip has a reason");
  require(res.failures.empty(), "a skip is not a failure");
  require(res.records.size() == 5, "2 insertion + 3 merge records");
  std::size_t ins_growth = 0;
  for (const auto &g : res.growth)
    if (g.algo == "insertion_sort")
      ++ins_growth;
  require(ins_growth == 1, "growth only over sizes that ran");
}

static void test_harness_errors() {
  require(throws_invalid([] { (void)run_benchmark({100}, {"bogus"}, {}); }),
          "unknown pattern rejected");
  require(throws_invalid([] { (void)run_benchmark({100}, {}, {"bogo_sort"}); }),
          "unknown algorithm rejected");
  require(throws_invalid([] { (void)run_benchmark({100, -3}, {}, {}); }),
          "negative size rejected");
  HarnessConfig cfg;
  cfg.sizes = {10};
  cfg.max_size["quick_sort"] = 10;
  require(throws_invalid([&] { (void)run_benchmark(cfg); }),
          "unknown algorithm in max_size rejected");
}

static void test_types_and_threads() {
  HarnessConfig cfg;
  cfg.sizes = {300, 600};
  cfg.patterns = {"random", "nearly_sorted"};
  cfg.repeats = 2;
  cfg.verify = true;
  cfg.threads = 4;
  for (auto t : {ElemType::i32, ElemType::i64, ElemType::f64}) {
    cfg.type = t;
    auto res = run_benchmark(cfg);
    require(res.records.size() == 2 * 3 * 2, "records per type");
    require(res.failures.empty(), "no failures per type");
    require(res.type == t, "type echoed");
  }
  // Same ordering regardless of thread count
  cfg.type = ElemType::i32;
  auto par = run_benchmark(cfg);
  cfg.threads = 0;
  auto seq = run_benchmark(cfg);
  require(par.records.size() == seq.records.size(), "same record count");
  for (std::size_t i = 0; i < par.records.size(); ++i)
    require(par.records[i].algo == seq.records[i].algo &&
                par.records[i].N == seq.records[i].N &&
                par.records[i].pattern == seq.records[i].pattern,
            "deterministic record order");
}

static void test_unallocatable_size_isolated() {
  // Too large for any vector<int>: generating it throws, the other size runs
  const std::int64_t huge = std::int64_t{1} << 61;
  for (int threads : {0, 2}) {
    HarnessConfig cfg;
    cfg.sizes = {100, huge};
    cfg.patterns = {"sorted"};
    cfg.algos = {"merge_sort", "hybrid_sort"};
    cfg.repeats = 1;
    cfg.verify = true;
    cfg.threads = threads;
    auto res = run_benchmark(cfg);
    require(res.records.size() == 2, "valid size still recorded");
    for (const auto &r : res.records)
      require(r.N == 100 && r.pattern == "sorted", "records are the N=100 ones");
    require(res.failures.size() == 2, "one failure per algorithm at huge N");
    require(res.failures[0].algo == "merge_sort" &&
                res.failures[1].algo == "hybrid_sort",
            "failures in request order");
    for (const auto &f : res.failures) {
      require(f.N == huge && f.pattern == "sorted", "failure names the trial");
      require(!f.error.empty(), "failure carries an error message");
    }
    require(res.growth.empty(), "no growth ratio across a failed size");
    require(res.skipped.empty(), "a failure is not a skip");
  }
}

static void test_growth_precision() {
  HarnessResult res;
  res.growth.push_back(GrowthRatio{"random", "merge_sort", 10, 20, 0.0001});
  auto csv = growth_to_csv(res, false);
  require(csv.find("random,merge_sort,10,20,0.0001") == 0,
          "small growth ratio keeps its digits in csv");
  auto js = to_json(res, false);
  require(js.find("\"growth\":0.0001") != std::string::npos,
          "small growth ratio keeps its digits in json");
}

static void test_compute_growth() {
  std::vector<TimingRecord> recs(4);
  recs[0].pattern = "random"; recs[0].algo = "merge_sort"; recs[0].N = 10; recs[0].seconds = 2.0;
  recs[1].pattern = "random"; recs[1].algo = "merge_sort"; recs[1].N = 20; recs[1].seconds = 5.0;
  recs[2].pattern = "random"; recs[2].algo = "merge_sort"; recs[2].N = 40; recs[2].seconds = 11.0;
  recs[3].pattern = "sorted"; recs[3].algo = "merge_sort"; recs[3].N = 10; recs[3].seconds = 0.0;
  auto g = compute_growth(recs, {10, 20, 40});
  require(g.size() == 2, "missing sizes produce no ratio");
  require(std::abs(g[0].ratio - 2.5) < 1e-12, "5 / 2");
  require(std::abs(g[1].ratio - 2.2) < 1e-12, "11 / 5");

  recs[1].pattern = "sorted";
  recs[1].seconds = 1.0;
  auto z = compute_growth(recs, {10, 20});
  bool saw_nan = false;
  for (const auto &r : z)
    if (r.pattern == "sorted")
      saw_nan = std::isnan(r.ratio);
  require(saw_nan, "zero denominator gives NaN");
}

static void test_formatting() {
  HarnessConfig cfg;
  cfg.sizes = {128, 256};
  cfg.patterns = {"reversed"};
  cfg.algos = {"hybrid_sort", "insertion_sort"};
  cfg.max_size["insertion_sort"] = 128;
  cfg.repeats = 1;
  auto res = run_benchmark(cfg);

  auto csv = to_csv(res, true);
  require(csv.find("pattern,algo,N,seconds") == 0, "csv header present");
  require(csv.find("reversed,hybrid_sort,256,") != std::string::npos,
          "csv row present");
  auto gcsv = growth_to_csv(res, true);
  require(gcsv.find("pattern,algo,from_N,to_N,growth") == 0,
          "growth csv header");
  require(to_csv(res, false).find("pattern,") == std::string::npos,
          "no header when disabled");

  auto js = to_json(res, true);
  require(js.find("\"records\"") != std::string::npos, "json records");
  require(js.find("\"growth\"") != std::string::npos, "json growth");
  require(js.find("\"skipped\"") != std::string::npos, "json skipped");
  require(js.find("\"failures\"") != std::string::npos, "json failures");
  require(js.find("exceeds limit") != std::string::npos, "json skip reason");

  auto jl = to_jsonl(res);
  require(jl.find("\"kind\":\"record\"") != std::string::npos, "jsonl record");
  require(jl.find("\"kind\":\"skipped\"") != std::string::npos,
          "jsonl skipped");
  require(std::count(jl.begin(), jl.end(), '\n') ==
              static_cast<long>(res.records.size() + res.growth.size() +
                                res.skipped.size() + res.failures.size()),
          "jsonl one line per entry");
}

int main() {
  try {
    test_generate_basic();
    test_generate_random();
    test_generate_nearly_sorted();
    test_generate_errors();
    test_list_algorithms();
    test_run_scenario();
    test_run_all_combinations();
    test_skip_policy();
    test_harness_errors();
    test_types_and_threads();
    test_unallocatable_size_isolated();
    test_compute_growth();
    test_growth_precision();
    test_formatting();
  } catch (const std::exception &e) {
    std::cerr << "Unhandled exception: " << e.what() << "\n";
    return 2;
  }
  std::cout << "OK\n";
  return 0;
}
