/**
 * CimHwt Benchmark Tool
 *
 * Wall-clock cost of each engine's apply() across transform sizes.
 *
 * Usage:
 *   cimhwt-bench --batch 8 --iterations 20
 */

#include "cimhwt/engine.hpp"
#include "cimhwt/transform.hpp"
#include "cimhwt/types.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cimhwt;

void print_usage(const char *prog) {
  std::cout << "CimHwt Benchmark Tool v" << CIMHWT_VERSION << "\n\n";
  std::cout << "Usage: " << prog << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --min-size <n>       Smallest transform size (default: 64)\n";
  std::cout << "  --max-size <n>       Largest transform size (default: 1024)\n";
  std::cout << "  --batch <n>          Rows per apply (default: 1)\n";
  std::cout << "  --iterations <n>     Benchmark iterations (default: 10)\n";
  std::cout << "  --warmup <n>         Warmup iterations (default: 2)\n";
  std::cout << "  --seed <n>           Random seed (default: 123)\n";
  std::cout << "  --help, -h           Show this help\n";
}

struct BenchArgs {
  size_t min_size = 64;
  size_t max_size = 1024;
  size_t batch = 1;
  size_t iterations = 10;
  size_t warmup = 2;
  uint64_t seed = 123;
};

bool parse_args(int argc, char **argv, BenchArgs &args) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return false;
    } else if (arg == "--min-size") {
      if (i + 1 < argc)
        args.min_size = std::stoul(argv[++i]);
    } else if (arg == "--max-size") {
      if (i + 1 < argc)
        args.max_size = std::stoul(argv[++i]);
    } else if (arg == "--batch") {
      if (i + 1 < argc)
        args.batch = std::stoul(argv[++i]);
    } else if (arg == "--iterations") {
      if (i + 1 < argc)
        args.iterations = std::stoul(argv[++i]);
    } else if (arg == "--warmup") {
      if (i + 1 < argc)
        args.warmup = std::stoul(argv[++i]);
    } else if (arg == "--seed") {
      if (i + 1 < argc)
        args.seed = std::stoull(argv[++i]);
    }
  }

  return true;
}

// Microseconds per apply, averaged over iterations
double benchmark_engine(Engine &engine, const Signal &x, size_t warmup,
                        size_t iterations, std::string &error) {
  Signal y;
  for (size_t i = 0; i < warmup; ++i) {
    if (!engine.apply(x, y, error))
      return -1.0;
  }

  auto start = std::chrono::high_resolution_clock::now();

  for (size_t i = 0; i < iterations; ++i) {
    if (!engine.apply(x, y, error))
      return -1.0;
  }

  auto end = std::chrono::high_resolution_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start);

  return duration.count() / static_cast<double>(iterations);
}

double benchmark_ideal(const Signal &x, size_t iterations) {
  Signal y = x;
  auto start = std::chrono::high_resolution_clock::now();

  for (size_t i = 0; i < iterations; ++i) {
    std::copy(x.data.begin(), x.data.end(), y.data.begin());
    fwht_rows(y.data.data(), y.batch, y.n);
  }

  auto end = std::chrono::high_resolution_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start);

  return duration.count() / static_cast<double>(iterations);
}

int main(int argc, char **argv) {
  BenchArgs args;

  try {
    if (!parse_args(argc, argv, args)) {
      return 0;
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: bad argument value: " << e.what() << "\n";
    return 1;
  }

  if (!is_power_of_two(args.min_size) || !is_power_of_two(args.max_size) ||
      args.min_size > args.max_size || args.batch == 0 ||
      args.iterations == 0) {
    std::cerr << "Error: sizes must be powers of two with min <= max, "
                 "batch and iterations >= 1\n";
    return 1;
  }

  std::cout
      << "╔══════════════════════════════════════════════════════════════╗\n";
  std::cout
      << "║               CimHwt Benchmark Tool v1.0                     ║\n";
  std::cout
      << "╚══════════════════════════════════════════════════════════════╝\n\n";

  std::cout << "Configuration:\n";
  std::cout << "  Sizes:        " << args.min_size << " .. " << args.max_size
            << "\n";
  std::cout << "  Batch:        " << args.batch << "\n";
  std::cout << "  Iterations:   " << args.iterations << "\n";
  std::cout << "  Warmup:       " << args.warmup << "\n\n";

  std::cout << "SIMD Support:\n";
#if defined(CIMHWT_HAS_AVX2)
  std::cout << "  [✓] AVX2 (4 x f64)\n";
#else
  std::cout << "  [ ] AVX2 (4 x f64)\n";
#endif
#if defined(CIMHWT_HAS_NEON)
  std::cout << "  [✓] NEON (float64x2)\n\n";
#else
  std::cout << "  [ ] NEON (float64x2)\n\n";
#endif

  std::cout << std::left << std::setw(8) << "N" << std::setw(14) << "ideal(us)"
            << std::setw(14) << "adc(us)" << std::setw(14) << "charge(us)"
            << std::setw(14) << "xbar(us)"
            << "\n";

  Rng rng(args.seed);
  std::normal_distribution<double> dist(0.0, 1.0);
  const EngineType types[] = {EngineType::ADC, EngineType::CHARGE,
                              EngineType::XBAR};

  for (size_t n = args.min_size; n <= args.max_size; n <<= 1) {
    Signal x = args.batch == 1 ? Signal::vector(n)
                               : Signal::matrix(args.batch, n);
    for (double &v : x.data) {
      v = dist(rng);
    }

    std::cout << std::setw(8) << n << std::setw(14) << std::fixed
              << std::setprecision(1) << benchmark_ideal(x, args.iterations);

    for (EngineType type : types) {
      SimConfig config;
      config.engine = type;
      config.size = n;

      std::string error;
      std::unique_ptr<Engine> engine = create_engine(config, &rng, error);
      if (!engine) {
        std::cerr << "\nError: " << error << "\n";
        return 1;
      }

      double us =
          benchmark_engine(*engine, x, args.warmup, args.iterations, error);
      if (us < 0.0) {
        std::cerr << "\nError: " << error << "\n";
        return 1;
      }
      std::cout << std::setw(14) << us;
    }
    std::cout << "\n";
  }

  return 0;
}
