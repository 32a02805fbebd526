#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sortscale/core.hpp"

enum class OutFmt : int { csv = 0, json = 1, jsonl = 2 };

// Command-line options
struct Options {
  std::vector<std::int64_t> sizes{1000, 2000, 5000, 10000, 20000, 50000};
  std::vector<std::string> patterns; // empty = all
  std::vector<std::string> algos;    // empty = all
  int repeats = 3;                   // repeats, minimum is reported
  int warmup = 0;                    // warm-up runs (not timed)
  std::optional<std::uint64_t> seed; // seed
  sortscale::ElemType type = sortscale::ElemType::i32;
  // insertion sort only on the small sizes by default
  std::map<std::string, std::int64_t> max_size{{"insertion_sort", 5000}};
  int threads = 0;
  OutFmt format = OutFmt::csv;
  bool csv_header = true;
  bool assert_sorted = false;
  bool verify = false;
  bool list = false;
  bool help = false;
};

static inline std::string to_lower(std::string s) {
  for (char &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::int64_t parse_size_expr(const std::string &s) {
  // Accept plain integers, scientific (e-notation), and k/m suffixes
  if (s.empty())
    throw std::runtime_error("Invalid size expression: (empty)");
  char *end = nullptr;
  long long iv = std::strtoll(s.c_str(), &end, 10);
  if (end && *end == '\0')
    return static_cast<std::int64_t>(iv);
  char last =
      static_cast<char>(std::tolower(static_cast<unsigned char>(s.back())));
  double mul = 1.0;
  std::string base = s;
  if (last == 'k' || last == 'm') {
    mul = (last == 'k' ? 1e3 : 1e6);
    base = s.substr(0, s.size() - 1);
  }
  double d = std::strtod(base.c_str(), &end);
  if (!end || *end != '\0' || base.empty())
    throw std::runtime_error("Invalid size expression: " + s);
  return static_cast<std::int64_t>(std::llround(d * mul));
}

static std::vector<std::string> split_list(const std::string &v) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : v) {
    if (c == ',') {
      if (!cur.empty()) {
        out.push_back(cur);
        cur.clear();
      }
    } else
      cur.push_back(c);
  }
  if (!cur.empty())
    out.push_back(cur);
  return out;
}

static void print_usage(const char *argv0) {
  std::cerr << "Usage: " << argv0
            << " [--sizes n[,n...]] [--patterns "
               "random|sorted|reversed|nearly_sorted[,...]]"
               " [--algo insertion_sort|merge_sort|hybrid_sort[,...]]"
               " [--repeat k] [--warmup w] [--seed s] [--type i32|i64|f64]"
               " [--threads K] [--format csv|json|jsonl] [--no-header]"
               " [--assert-sorted] [--verify] [--list]\n";
  std::cerr << "       --sizes accepts 10k / 1e4 forms (default "
               "1000,2000,5000,10000,20000,50000)\n";
  std::cerr << "       --max-size ALGO=N (skip ALGO above size N; repeatable; "
               "default insertion_sort=5000)\n";
  std::cerr << "       --no-limit (drop all --max-size limits)\n";
}

static Options parse_args(int argc, char **argv) {
  Options opt;
  bool sizes_given = false;
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    auto get_value_inline =
        [&](std::string_view arg,
            std::string_view key) -> std::optional<std::string> {
      if (arg.size() > key.size() && arg.substr(0, key.size()) == key &&
          arg[key.size()] == '=') {
        if (arg.size() == key.size() + 1)
          throw std::runtime_error("Missing value for " + std::string(key));
        return std::string(arg.substr(key.size() + 1));
      }
      return std::nullopt;
    };
    auto need_value = [&](std::string_view flag) {
      if (i + 1 >= argc) {
        throw std::runtime_error(std::string("Missing value for ") +
                                 std::string(flag));
      }
      return std::string(argv[++i]);
    };
    auto value_of = [&](std::string_view key) {
      auto inl = get_value_inline(a, key);
      return inl ? *inl : need_value(a);
    };
    if (a == "--sizes" || a == "-n" || a.rfind("--sizes=", 0) == 0) {
      std::string v = value_of("--sizes");
      if (!sizes_given) {
        opt.sizes.clear();
        sizes_given = true;
      }
      for (const auto &tok : split_list(v))
        opt.sizes.push_back(parse_size_expr(tok));
    } else if (a == "--patterns" || a == "-p" ||
               a.rfind("--patterns=", 0) == 0) {
      for (const auto &tok : split_list(value_of("--patterns")))
        opt.patterns.push_back(to_lower(tok));
    } else if (a == "--algo" || a == "-a" || a.rfind("--algo=", 0) == 0) {
      for (const auto &tok : split_list(value_of("--algo")))
        opt.algos.push_back(to_lower(tok));
    } else if (a == "--repeat" || a == "-r" || a.rfind("--repeat=", 0) == 0) {
      opt.repeats = std::stoi(value_of("--repeat"));
      if (opt.repeats <= 0)
        opt.repeats = 1;
    } else if (a == "--warmup" || a.rfind("--warmup=", 0) == 0) {
      opt.warmup = std::stoi(value_of("--warmup"));
      if (opt.warmup < 0)
        opt.warmup = 0;
    } else if (a == "--seed" || a.rfind("--seed=", 0) == 0) {
      opt.seed = std::stoull(value_of("--seed"));
    } else if (a == "--type" || a.rfind("--type=", 0) == 0) {
      std::string v = value_of("--type");
      auto t = sortscale::parse_elem_type(v);
      if (!t)
        throw std::runtime_error("Invalid --type: " + v);
      opt.type = *t;
    } else if (a == "--max-size" || a.rfind("--max-size=", 0) == 0) {
      std::string v = value_of("--max-size");
      auto eq = v.find('=');
      if (eq == std::string::npos || eq == 0)
        throw std::runtime_error("Invalid --max-size (want ALGO=N): " + v);
      opt.max_size[to_lower(v.substr(0, eq))] =
          parse_size_expr(v.substr(eq + 1));
    } else if (a == "--no-limit") {
      opt.max_size.clear();
    } else if (a == "--threads" || a.rfind("--threads=", 0) == 0) {
      opt.threads = std::stoi(value_of("--threads"));
      if (opt.threads < 0)
        opt.threads = 0;
    } else if (a == "--format" || a.rfind("--format=", 0) == 0) {
      std::string v = to_lower(value_of("--format"));
      if (v == "csv")
        opt.format = OutFmt::csv;
      else if (v == "json")
        opt.format = OutFmt::json;
      else if (v == "jsonl")
        opt.format = OutFmt::jsonl;
      else
        throw std::runtime_error("Invalid --format: " + v);
    } else if (a == "--no-header") {
      opt.csv_header = false;
    } else if (a == "--assert-sorted") {
      opt.assert_sorted = true;
    } else if (a == "--verify") {
      opt.verify = true;
    } else if (a == "--list") {
      opt.list = true;
    } else if (a == "--help" || a == "-h") {
      opt.help = true;
    } else {
      std::cerr << "Unknown argument: " << a << "\n";
      print_usage(argv[0]);
      throw std::runtime_error("bad arguments");
    }
  }
  return opt;
}

// Fastest algorithm per (pattern, N), printed to stderr
static void print_winners(const sortscale::HarnessResult &r) {
  std::map<std::pair<std::string, std::int64_t>,
           const sortscale::TimingRecord *>
      best;
  std::vector<std::pair<std::string, std::int64_t>> order;
  for (const auto &rec : r.records) {
    auto key = std::make_pair(rec.pattern, rec.N);
    auto it = best.find(key);
    if (it == best.end()) {
      best.emplace(key, &rec);
      order.push_back(key);
    } else if (rec.seconds < it->second->seconds) {
      it->second = &rec;
    }
  }
  for (const auto &key : order) {
    const auto *w = best[key];
    std::cerr << "Winner (N=" << key.second << ", pattern=" << key.first
              << "): algo=" << w->algo << ", seconds=" << w->seconds << "\n";
  }
}

int main(int argc, char **argv) {
  try {
    Options opt = parse_args(argc, argv);
    if (opt.help) {
      print_usage(argv[0]);
      return 0;
    }
    if (opt.list) {
      for (const auto &n : sortscale::list_algorithms())
        std::cout << n << "\n";
      for (auto p : sortscale::all_pattern_names())
        std::cout << "pattern:" << p << "\n";
      return 0;
    }

    sortscale::HarnessConfig cfg;
    cfg.sizes = opt.sizes;
    cfg.patterns = opt.patterns;
    cfg.algos = opt.algos;
    cfg.type = opt.type;
    cfg.repeats = opt.repeats;
    cfg.warmup = opt.warmup;
    cfg.seed = opt.seed;
    cfg.max_size = opt.max_size;
    cfg.assert_sorted = opt.assert_sorted;
    cfg.verify = opt.verify;
    cfg.threads = opt.threads;

    sortscale::HarnessResult r = sortscale::run_benchmark(cfg);

    for (const auto &s : r.skipped)
      std::cerr << "Skipped: pattern=" << s.pattern << " algo=" << s.algo
                << " N=" << s.N << " (" << s.reason << ")\n";
    for (const auto &f : r.failures)
      std::cerr << "Failed: pattern=" << f.pattern << " algo=" << f.algo
                << " N=" << f.N << ": " << f.error << "\n";
    print_winners(r);

    switch (opt.format) {
    case OutFmt::csv:
      std::cout << sortscale::to_csv(r, opt.csv_header);
      std::cout << "\n" << sortscale::growth_to_csv(r, opt.csv_header);
      break;
    case OutFmt::json:
      std::cout << sortscale::to_json(r, true);
      break;
    case OutFmt::jsonl:
      std::cout << sortscale::to_jsonl(r);
      break;
    }
    return r.failures.empty() ? 0 : 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
