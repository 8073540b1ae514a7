#include "cimhwt/cim_array.hpp"
#include "cimhwt/quantize.hpp"
#include <algorithm>
#include <cmath>

namespace cimhwt {

std::unique_ptr<CimArray> CimArray::create(const CimArrayConfig &config,
                                           Rng *rng, std::string &error) {
  if (!validate_size(config.n, error))
    return nullptr;
  if (!validate_adc_bits(config.adc_bits, error))
    return nullptr;
  return std::unique_ptr<CimArray>(new CimArray(config, rng));
}

CimArray::CimArray(const CimArrayConfig &config, Rng *rng)
    : Engine(config.n, rng), config_(config) {
  ir_scale_.resize(n_);
  const double den = static_cast<double>(std::max<size_t>(1, n_ - 1));
  for (size_t c = 0; c < n_; ++c) {
    ir_scale_[c] = 1.0 - config_.ir_drop_alpha * (static_cast<double>(c) / den);
  }
}

bool CimArray::apply(const Signal &x, Signal &y, std::string &error) {
  if (!check_signal(x, n_, error))
    return false;

  y = x;
  const size_t batch = y.batch;
  AlignedVector<double> stage(y.data.size());

  for (size_t h = 1; h < n_; h <<= 1) {
    for (size_t r = 0; r < batch; ++r) {
      const double *in = y.row(r);
      double *out = stage.data() + r * n_;
      for (size_t i = 0; i < n_; i += 2 * h) {
        for (size_t j = i; j < i + h; ++j) {
          out[j] = in[j] + in[j + h];
          out[j + h] = in[j] - in[j + h];
        }
      }
    }

    nonideal_stage(stage.data(), batch);
    std::copy(stage.begin(), stage.end(), y.data.begin());
  }

  return true;
}

void CimArray::nonideal_stage(double *stage, size_t batch) {
  const size_t count = batch * n_;

  for (size_t r = 0; r < batch; ++r) {
    double *v = stage + r * n_;
    for (size_t c = 0; c < n_; ++c) {
      v[c] = config_.gain * (v[c] * ir_scale_[c]) + config_.offset;
    }
  }

  if (config_.noise_sigma > 0.0) {
    std::normal_distribution<double> noise(0.0, config_.noise_sigma);
    for (size_t i = 0; i < count; ++i) {
      stage[i] += noise(rng());
    }
  }

  // Auto-ranging takes the full scale from this stage's values
  adc_quantize(stage, count, config_.adc_bits, config_.adc_clip);
}

} // namespace cimhwt
