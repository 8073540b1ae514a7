#include "cimhwt/charge.hpp"
#include <algorithm>
#include <cmath>

namespace cimhwt {

ChargeAccumulator::ChargeAccumulator(const ChargeEngineConfig &config, Rng &rng)
    : wordline_alpha_(config.wordline_alpha),
      bitline_alpha_(config.bitline_alpha), leak_(config.leak_decay),
      sigma_(std::sqrt(BOLTZMANN_K * config.temperature_k /
                       std::max(config.capacitance_f, CAPACITANCE_FLOOR))),
      rng_(rng) {}

void ChargeAccumulator::reset(size_t batch, size_t n) {
  batch_ = batch;
  n_ = n;
  v_acc_.assign(batch * n, 0.0);
  initialized_ = true;
}

bool ChargeAccumulator::step(const double *v_in, size_t batch, size_t n,
                             std::string &error) {
  if (batch == 0 || n == 0) {
    error = "Accumulator step needs a non-empty input";
    return false;
  }
  if (!initialized_) {
    reset(batch, n);
  } else if (batch != batch_ || n != n_) {
    error = "Accumulator holds a [" + std::to_string(batch_) + ", " +
            std::to_string(n_) + "] state, step got [" +
            std::to_string(batch) + ", " + std::to_string(n) + "]";
    return false;
  } else {
    const double keep = 1.0 - leak_;
    for (double &v : v_acc_) {
      v *= keep;
    }
  }

  const double col_den = static_cast<double>(std::max<size_t>(1, n - 1));
  const double row_den = static_cast<double>(std::max<size_t>(1, batch - 1));

  for (size_t r = 0; r < batch; ++r) {
    double wl_scale = 1.0 - wordline_alpha_ * (static_cast<double>(r) / row_den);
    double *acc = v_acc_.data() + r * n;
    const double *in = v_in + r * n;
    for (size_t c = 0; c < n; ++c) {
      double bl_scale =
          1.0 - bitline_alpha_ * (static_cast<double>(c) / col_den);
      acc[c] += in[c] * bl_scale * wl_scale;
    }
  }

  // kT/C noise, one draw per node in row-major order. The draws happen even
  // at sigma 0 so the generator advances the same way at every temperature.
  std::normal_distribution<double> unit(0.0, 1.0);
  for (double &v : v_acc_) {
    v += sigma_ * unit(rng_);
  }
  return true;
}

} // namespace cimhwt
