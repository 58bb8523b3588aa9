// Copyright (c) 2024 liudegui. MIT License.
//
// qbridge bench -- time queries through the full Client path.
//
// Usage:
//   ./qbridge_bench <backend> <dsn> [iterations] [sql...]
//   ./qbridge_bench mysql "localhost:3306:root:pass:shop" 5 \
//       "SELECT COUNT(*) FROM orders" "SELECT * FROM customers LIMIT 1000"
//
// Each query runs `iterations` times (default 3). Failing queries are
// reported and skipped.

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <numeric>
#include <string>
#include <vector>

#include "qbridge/client.hpp"

struct BenchStats {
  double min_ms = 0.0;
  double avg_ms = 0.0;
  double max_ms = 0.0;
  double median_ms = 0.0;
};

static BenchStats Summarize(std::vector<double> times) {
  BenchStats stats;
  if (times.empty()) { return stats; }
  std::sort(times.begin(), times.end());
  stats.min_ms = times.front();
  stats.max_ms = times.back();
  stats.avg_ms = std::accumulate(times.begin(), times.end(), 0.0) /
                 static_cast<double>(times.size());
  size_t mid = times.size() / 2;
  stats.median_ms = (times.size() % 2 != 0)
                        ? times[mid]
                        : (times[mid - 1] + times[mid]) / 2.0;
  return stats;
}

int main(int argc, char* argv[]) {
  if (argc < 3) {
    std::fprintf(stderr, "usage: %s <backend> <dsn> [iterations] [sql...]\n",
                 argv[0]);
    return 2;
  }
  qbridge::InitLogging(qbridge::LogLevelFromEnv());

  int32_t iterations = (argc > 3) ? std::atoi(argv[3]) : 3;
  if (iterations <= 0) { iterations = 3; }

  std::vector<std::string> queries;
  for (int32_t i = 4; i < argc; ++i) { queries.emplace_back(argv[i]); }
  if (queries.empty()) { queries.emplace_back("SELECT 1"); }

  qbridge::Client client;
  qbridge::Error err;
  qbridge::ConnectParams params =
      qbridge::ParamsForBackend(argv[1], argv[2], &err);
  if (!err.ok()) {
    std::fprintf(stderr, "Bad DSN: %s\n", err.message.c_str());
    return 1;
  }
  std::string id = client.Open(argv[1], params, &err);
  if (!err.ok()) {
    std::fprintf(stderr, "Open failed [%s]: %s\n",
                 qbridge::ErrorCodeName(err.code), err.message.c_str());
    return 1;
  }

  std::printf("%-40s %5s %10s %10s %10s %10s %8s\n", "query", "runs",
              "min ms", "avg ms", "max ms", "median ms", "rows");
  int32_t failures = 0;
  for (const auto& sql : queries) {
    std::vector<double> times;
    size_t rows = 0;
    for (int32_t i = 0; i < iterations; ++i) {
      err.Clear();
      auto start = std::chrono::steady_clock::now();
      qbridge::QueryResult result = client.ExecuteQuery(id, sql, &err);
      auto elapsed = std::chrono::steady_clock::now() - start;
      if (!err.ok()) { break; }
      times.push_back(
          std::chrono::duration<double, std::milli>(elapsed).count());
      rows = result.size();
    }
    if (!err.ok()) {
      std::fprintf(stderr, "Skipping '%s': %s\n", sql.c_str(),
                   err.message.c_str());
      ++failures;
      continue;
    }

    BenchStats stats = Summarize(times);
    std::string label = sql.size() > 40 ? sql.substr(0, 37) + "..." : sql;
    std::printf("%-40s %5zu %10.3f %10.3f %10.3f %10.3f %8zu\n",
                label.c_str(), times.size(), stats.min_ms, stats.avg_ms,
                stats.max_ms, stats.median_ms, rows);
  }

  client.Close(id);
  return failures == 0 ? 0 : 1;
}
