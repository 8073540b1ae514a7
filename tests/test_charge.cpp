/**
 * CimHwt: Charge Accumulator Tests
 */

#include "cimhwt/charge.hpp"
#include "cimhwt/types.hpp"
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace cimhwt;

ChargeEngineConfig noiseless_config() {
  ChargeEngineConfig config;
  config.temperature_k = 0.0;
  return config;
}

bool test_noise_sigma() {
  std::cout << "Testing kT/C noise sigma...\n";

  Rng rng;
  ChargeEngineConfig config;
  ChargeAccumulator accum(config, rng);

  double expected = std::sqrt(BOLTZMANN_K * 300.0 / 1e-12);
  if (std::abs(accum.noise_sigma() - expected) > 1e-18) {
    std::cerr << "FAIL: sigma = " << accum.noise_sigma() << ", expected "
              << expected << "\n";
    return false;
  }

  ChargeAccumulator cold(noiseless_config(), rng);
  if (cold.noise_sigma() != 0.0) {
    std::cerr << "FAIL: T=0 should give sigma 0\n";
    return false;
  }

  // Zero capacitance falls back to the floor instead of dividing by zero
  config.capacitance_f = 0.0;
  ChargeAccumulator floored(config, rng);
  if (!std::isfinite(floored.noise_sigma()) || floored.noise_sigma() <= 0.0) {
    std::cerr << "FAIL: zero capacitance sigma is not finite\n";
    return false;
  }

  std::cout << "  ✓ Noise sigma OK (" << expected << " V)\n";
  return true;
}

bool test_bitline_ramp() {
  std::cout << "Testing bitline attenuation...\n";

  Rng rng;
  ChargeEngineConfig config = noiseless_config();
  config.bitline_alpha = 0.3;
  ChargeAccumulator accum(config, rng);

  std::vector<double> ones(4, 1.0);
  std::string error;
  if (!accum.step(ones.data(), 1, 4, error)) {
    std::cerr << "FAIL: " << error << "\n";
    return false;
  }

  const double expected[] = {1.0, 0.9, 0.8, 0.7};
  for (size_t c = 0; c < 4; ++c) {
    if (std::abs(accum.readout()[c] - expected[c]) > 1e-12) {
      std::cerr << "FAIL: column " << c << " holds " << accum.readout()[c]
                << ", expected " << expected[c] << "\n";
      return false;
    }
  }

  std::cout << "  ✓ Bitline attenuation OK\n";
  return true;
}

bool test_wordline_ramp() {
  std::cout << "Testing wordline attenuation...\n";

  Rng rng;
  ChargeEngineConfig config = noiseless_config();
  config.wordline_alpha = 0.5;
  ChargeAccumulator accum(config, rng);

  std::vector<double> ones(3 * 2, 1.0);
  std::string error;
  if (!accum.step(ones.data(), 3, 2, error)) {
    std::cerr << "FAIL: " << error << "\n";
    return false;
  }

  const double expected[] = {1.0, 0.75, 0.5};
  for (size_t r = 0; r < 3; ++r) {
    for (size_t c = 0; c < 2; ++c) {
      double v = accum.readout()[r * 2 + c];
      if (std::abs(v - expected[r]) > 1e-12) {
        std::cerr << "FAIL: row " << r << " holds " << v << ", expected "
                  << expected[r] << "\n";
        return false;
      }
    }
  }

  std::cout << "  ✓ Wordline attenuation OK\n";
  return true;
}

bool test_leak_decay() {
  std::cout << "Testing leakage decay...\n";

  Rng rng;
  ChargeEngineConfig config = noiseless_config();
  config.leak_decay = 0.25;
  std::vector<double> ones(2, 1.0);
  std::string error;

  // First step on a fresh node applies no decay
  ChargeAccumulator fresh(config, rng);
  if (fresh.initialized()) {
    std::cerr << "FAIL: new accumulator should not be live\n";
    return false;
  }
  if (!fresh.step(ones.data(), 1, 2, error) || !fresh.initialized() ||
      fresh.batch() != 1 || fresh.n() != 2) {
    std::cerr << "FAIL: first step did not initialize the node\n";
    return false;
  }
  if (fresh.readout()[0] != 1.0) {
    std::cerr << "FAIL: first step decayed the input\n";
    return false;
  }

  if (!fresh.step(ones.data(), 1, 2, error)) {
    std::cerr << "FAIL: " << error << "\n";
    return false;
  }
  if (std::abs(fresh.readout()[1] - 1.75) > 1e-12) {
    std::cerr << "FAIL: second step holds " << fresh.readout()[1]
              << ", expected 1.75\n";
    return false;
  }

  // reset() zeroes the state
  fresh.reset(1, 2);
  if (fresh.readout()[0] != 0.0 || fresh.readout()[1] != 0.0) {
    std::cerr << "FAIL: reset left charge behind\n";
    return false;
  }

  std::cout << "  ✓ Leakage decay OK\n";
  return true;
}

bool test_shape_mismatch() {
  std::cout << "Testing accumulator shape mismatch...\n";

  Rng rng;
  ChargeAccumulator accum(noiseless_config(), rng);
  accum.reset(1, 4);

  std::vector<double> v(8, 1.0);
  std::string error;
  if (accum.step(v.data(), 2, 4, error) || error.empty()) {
    std::cerr << "FAIL: [2, 4] step on a [1, 4] node should fail\n";
    return false;
  }
  if (accum.readout().size() != 4 || accum.readout()[0] != 0.0) {
    std::cerr << "FAIL: failed step modified the state\n";
    return false;
  }

  error.clear();
  if (accum.step(v.data(), 0, 4, error) || error.empty()) {
    std::cerr << "FAIL: empty step should fail\n";
    return false;
  }

  std::cout << "  ✓ Shape mismatch rejected\n";
  return true;
}

bool test_zero_temperature_draws() {
  std::cout << "Testing generator use at T=0...\n";

  Rng rng(11);
  const Rng before = rng;
  ChargeAccumulator accum(noiseless_config(), rng);

  std::vector<double> v = {0.5, -0.25, 1.0, 2.0};
  std::string error;
  if (!accum.step(v.data(), 2, 2, error)) {
    std::cerr << "FAIL: " << error << "\n";
    return false;
  }
  for (size_t i = 0; i < v.size(); ++i) {
    if (accum.readout()[i] != v[i]) {
      std::cerr << "FAIL: node " << i << " holds " << accum.readout()[i]
                << ", expected " << v[i] << "\n";
      return false;
    }
  }

  // One draw per node, same as a warm accumulator
  Rng warm_rng(11);
  ChargeEngineConfig warm_config;
  ChargeAccumulator warm(warm_config, warm_rng);
  if (!warm.step(v.data(), 2, 2, error)) {
    std::cerr << "FAIL: " << error << "\n";
    return false;
  }
  if (rng == before || !(rng == warm_rng)) {
    std::cerr << "FAIL: T=0 step did not advance the generator like a "
                 "noisy step\n";
    return false;
  }

  std::cout << "  ✓ Generator advances at T=0\n";
  return true;
}

bool test_thermal_noise_statistics() {
  std::cout << "Testing thermal noise statistics...\n";

  Rng rng(5);
  ChargeEngineConfig config;
  ChargeAccumulator accum(config, rng);

  const size_t n = 8192;
  std::vector<double> zeros(n, 0.0);
  std::string error;
  if (!accum.step(zeros.data(), 1, n, error)) {
    std::cerr << "FAIL: " << error << "\n";
    return false;
  }

  double sum = 0.0;
  double sq_sum = 0.0;
  for (double v : accum.readout()) {
    sum += v;
    sq_sum += v * v;
  }
  double mean = sum / n;
  double std_dev = std::sqrt(sq_sum / n - mean * mean);
  double sigma = accum.noise_sigma();

  std::cout << "  Sample std: " << std_dev << " (sigma " << sigma << ")\n";
  if (std::abs(std_dev - sigma) > 0.05 * sigma || std::abs(mean) > 0.05 * sigma) {
    std::cerr << "FAIL: noise does not match N(0, sqrt(kT/C))\n";
    return false;
  }

  std::cout << "  ✓ Thermal noise statistics OK\n";
  return true;
}

int main() {
  std::cout
      << "╔══════════════════════════════════════════════════════════════╗\n";
  std::cout
      << "║             CimHwt Charge Accumulator Tests                  ║\n";
  std::cout
      << "╚══════════════════════════════════════════════════════════════╝\n\n";

  int passed = 0;
  int failed = 0;

  if (test_noise_sigma())
    passed++;
  else
    failed++;
  if (test_bitline_ramp())
    passed++;
  else
    failed++;
  if (test_wordline_ramp())
    passed++;
  else
    failed++;
  if (test_leak_decay())
    passed++;
  else
    failed++;
  if (test_shape_mismatch())
    passed++;
  else
    failed++;
  if (test_zero_temperature_draws())
    passed++;
  else
    failed++;
  if (test_thermal_noise_statistics())
    passed++;
  else
    failed++;

  std::cout
      << "\n═══════════════════════════════════════════════════════════════\n";
  std::cout << "Results: " << passed << " passed, " << failed << " failed\n";

  return failed > 0 ? 1 : 0;
}
