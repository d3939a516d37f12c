#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include "time_window/parse_policy.hpp"
#include "time_window/time_parser.hpp"

using clk = std::chrono::steady_clock;

static std::vector<std::string> make_timestamps(size_t n) {
  std::vector<std::string> v; v.reserve(n);
  for (size_t i=0;i<n;++i) {
    int y = 2000 + int(i%25);
    int m = int(i%12)+1;
    int d = int(i%28)+1;
    int H = int((i*7)%24), M=int((i*11)%60), S=int((i*13)%60);
    char buf[48];
    switch (i % 5) {
      case 0: std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", y,m,d,H,M,S, int(i%1000)); break;
      case 1: std::snprintf(buf, sizeof(buf), "%lld", 1753490956LL + (long long)i); break;
      case 2: std::snprintf(buf, sizeof(buf), "%lld", 1753490956000LL + (long long)i); break;
      case 3: std::snprintf(buf, sizeof(buf), "%04d/%02d/%02d %02d:%02d:%02d", y,m,d,H,M,S); break;
      default: std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d %02d:%02d", m,d,y,H,M); break;
    }
    v.emplace_back(buf);
  }
  return v;
}

static std::vector<std::string> make_durations(size_t n) {
  std::vector<std::string> v; v.reserve(n);
  for (size_t i=0;i<n;++i) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), (i%2) ? "%d" : "%d.5", int(i%3600));
    v.emplace_back(buf);
  }
  return v;
}

static void bench_timestamps(size_t n, int iters) {
  auto data = make_timestamps(n);
  std::cout << "\n[timestamps] samples=" << n << " iters=" << iters << "\n";
  for (int k=1;k<=iters;++k) {
    std::size_t ok=0;
    auto t0 = clk::now();
    for (auto& s: data) if (tw::parse_time(s)) ++ok;
    auto t1 = clk::now();
    double sec = std::chrono::duration<double>(t1-t0).count();
    std::cout << "  iter " << k << ": ok=" << ok
              << " time=" << sec << "s  rate=" << (n/sec)/1e6 << " M/s\n";
  }
}

static void bench_durations(size_t n, int iters) {
  auto data = make_durations(n);
  tw::DurationPolicy dp;
  std::cout << "\n[durations] samples=" << n << " iters=" << iters << "\n";
  for (int k=1;k<=iters;++k) {
    std::size_t ok=0;
    auto t0 = clk::now();
    for (auto& s: data) if (dp.parse_seconds(s)) ++ok;
    auto t1 = clk::now();
    double sec = std::chrono::duration<double>(t1-t0).count();
    std::cout << "  iter " << k << ": ok=" << ok
              << " time=" << sec << "s  rate=" << (n/sec)/1e6 << " M/s\n";
  }
}

// Worst case for a backtracking matcher: long near-misses.
static void bench_adversarial(int iters) {
  std::string rep;
  for (int i = 0; i < 1000; ++i) rep += "invalid-";
  const std::vector<std::string> inputs = {
    rep, "2025-07-26T00:49:16." + std::string(5000, '1') + "ZZZZ", std::string(5000, '9'),
  };
  std::cout << "\n[adversarial] inputs=" << inputs.size() << " iters=" << iters << "\n";
  for (int k=1;k<=iters;++k) {
    auto t0 = clk::now();
    std::size_t rejected = 0;
    for (auto& s: inputs) if (!tw::parse_time(s)) ++rejected;
    auto t1 = clk::now();
    std::cout << "  iter " << k << ": rejected=" << rejected
              << " time=" << std::chrono::duration<double, std::micro>(t1-t0).count() << "us\n";
  }
}

int main(int argc, char** argv){
  size_t n = 1'000'000;
  int iters = 3;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto k = s.substr(0,eq); auto v = (eq==std::string::npos)?"":s.substr(eq+1);
    if (k=="--n") n = std::stoull(v);
    else if (k=="--iters") iters = std::stoi(v);
    else if (k=="--help"||k=="-h"){
      std::cout << "Usage: tw_bench_time_parser [--n=1000000] [--iters=3]\n";
      return 0;
    }
  }
  bench_timestamps(n, iters);
  bench_durations(n, iters);
  bench_adversarial(iters);
  return 0;
}
