// Pure formatting helpers for HarnessResult
#include "sortscale/core.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <string>

namespace sortscale {

static inline std::string esc_json(const std::string &s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '"': o += "\\\""; break;
    case '\\': o += "\\\\"; break;
    case '\n': o += "\\n"; break;
    case '\r': o += "\\r"; break;
    case '\t': o += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[7];
        std::snprintf(buf, sizeof(buf), "\\u%04x", (int)(unsigned char)c);
        o += buf;
      } else {
        o += c;
      }
    }
  }
  return o;
}

// JSON has no NaN literal
static void put_ratio_json(std::ostringstream &os, double ratio) {
  if (std::isnan(ratio))
    os << "null";
  else
    os << ratio;
}

static void put_record_fields(std::ostringstream &os, const TimingRecord &r) {
  os << "\"pattern\":\"" << esc_json(r.pattern) << "\",";
  os << "\"algo\":\"" << esc_json(r.algo) << "\",";
  os << "\"N\":" << r.N << ",";
  os << std::setprecision(9);
  os << "\"seconds\":" << r.seconds << ",";
  os << "\"min_s\":" << r.stats.min_s << ",";
  os << "\"median_s\":" << r.stats.median_s << ",";
  os << "\"mean_s\":" << r.stats.mean_s << ",";
  os << "\"max_s\":" << r.stats.max_s << ",";
  os << "\"stddev_s\":" << r.stats.stddev_s << ",";
  os << "\"repeats\":" << r.repeats;
}

static void put_growth_fields(std::ostringstream &os, const GrowthRatio &g) {
  os << "\"pattern\":\"" << esc_json(g.pattern) << "\",";
  os << "\"algo\":\"" << esc_json(g.algo) << "\",";
  os << "\"from_N\":" << g.from_N << ",";
  os << "\"to_N\":" << g.to_N << ",";
  os << std::setprecision(9);
  os << "\"growth\":";
  put_ratio_json(os, g.ratio);
}

static void put_skip_fields(std::ostringstream &os, const SkippedTrial &s) {
  os << "\"pattern\":\"" << esc_json(s.pattern) << "\",";
  os << "\"algo\":\"" << esc_json(s.algo) << "\",";
  os << "\"N\":" << s.N << ",";
  os << "\"reason\":\"" << esc_json(s.reason) << "\"";
}

static void put_failure_fields(std::ostringstream &os, const FailedTrial &f) {
  os << "\"pattern\":\"" << esc_json(f.pattern) << "\",";
  os << "\"algo\":\"" << esc_json(f.algo) << "\",";
  os << "\"N\":" << f.N << ",";
  os << "\"error\":\"" << esc_json(f.error) << "\"";
}

std::string to_csv(const HarnessResult &r, bool with_header) {
  std::ostringstream os;
  if (with_header)
    os << "pattern,algo,N,seconds,min_s,median_s,mean_s,max_s,stddev_s,"
          "repeats\n";
  os.setf(std::ios::fixed);
  os << std::setprecision(9);
  for (const auto &row : r.records) {
    os << row.pattern << ',' << row.algo << ',' << row.N << ','
       << row.seconds << ',' << row.stats.min_s << ',' << row.stats.median_s
       << ',' << row.stats.mean_s << ',' << row.stats.max_s << ','
       << row.stats.stddev_s << ',' << row.repeats << '\n';
  }
  return os.str();
}

std::string growth_to_csv(const HarnessResult &r, bool with_header) {
  std::ostringstream os;
  if (with_header)
    os << "pattern,algo,from_N,to_N,growth\n";
  os.setf(std::ios::fixed);
  os << std::setprecision(9);
  for (const auto &g : r.growth) {
    os << g.pattern << ',' << g.algo << ',' << g.from_N << ',' << g.to_N
       << ',';
    if (std::isnan(g.ratio))
      os << "nan";
    else
      os << g.ratio;
    os << '\n';
  }
  return os.str();
}

template <class Row, class Put>
static void put_array(std::ostringstream &os, const char *key,
                      const std::vector<Row> &rows, Put put, bool pretty,
                      bool last) {
  const char *nl = pretty ? "\n" : "";
  os << (pretty ? "  \"" : "\"") << key << "\":[" << nl;
  for (std::size_t i = 0; i < rows.size(); ++i) {
    os << (pretty ? "    {" : "{");
    put(os, rows[i]);
    os << "}";
    if (i + 1 != rows.size())
      os << ",";
    os << nl;
  }
  os << (pretty ? "  ]" : "]");
  if (!last)
    os << ",";
  os << nl;
}

std::string to_json(const HarnessResult &r, bool pretty) {
  std::ostringstream os;
  os.setf(std::ios::fixed);
  const char *nl = pretty ? "\n" : "";
  os << "{" << nl;
  os << (pretty ? "  " : "") << "\"type\":\"" << elem_type_name(r.type)
     << "\",";
  os << "\"repeats\":" << r.repeats << ",";
  os << "\"seed\":" << r.seed.value_or(default_seed()) << "," << nl;
  put_array(os, "records", r.records, put_record_fields, pretty, false);
  put_array(os, "growth", r.growth, put_growth_fields, pretty, false);
  put_array(os, "skipped", r.skipped, put_skip_fields, pretty, false);
  put_array(os, "failures", r.failures, put_failure_fields, pretty, true);
  os << "}" << nl;
  return os.str();
}

std::string to_jsonl(const HarnessResult &r) {
  std::ostringstream os;
  os.setf(std::ios::fixed);
  for (const auto &row : r.records) {
    os << "{\"kind\":\"record\",";
    put_record_fields(os, row);
    os << "}" << '\n';
  }
  for (const auto &g : r.growth) {
    os << "{\"kind\":\"growth\",";
    put_growth_fields(os, g);
    os << "}" << '\n';
  }
  for (const auto &s : r.skipped) {
    os << "{\"kind\":\"skipped\",";
    put_skip_fields(os, s);
    os << "}" << '\n';
  }
  for (const auto &f : r.failures) {
    os << "{\"kind\":\"failure\",";
    put_failure_fields(os, f);
    os << "}" << '\n';
  }
  return os.str();
}

} // namespace sortscale
