#include "cimhwt/xbar_engine.hpp"
#include "cimhwt/quantize.hpp"

namespace cimhwt {

std::unique_ptr<XbarHadamard> XbarHadamard::create(const XbarConfig &config,
                                                   Rng *rng,
                                                   std::string &error) {
  if (!validate_size(config.n, error))
    return nullptr;
  if (!validate_adc_bits(config.adc_bits, error))
    return nullptr;
  if (!(config.g0 > 0.0) || !(config.dac_gain > 0.0) || !(config.rf > 0.0)) {
    error = "g0, dac_gain and rf must be > 0";
    return nullptr;
  }
  return std::unique_ptr<XbarHadamard>(new XbarHadamard(config, rng));
}

XbarHadamard::XbarHadamard(const XbarConfig &config, Rng *rng)
    : Engine(config.n, rng), config_(config) {}

bool XbarHadamard::apply(const Signal &x, Signal &y, std::string &error) {
  if (!check_signal(x, n_, error))
    return false;

  y = x;
  const size_t batch = y.batch;
  const double gain = path_gain();
  const double row1_scale = 1.0 - config_.wl_alpha;

  AlignedVector<double> v_sum(batch);
  AlignedVector<double> v_diff(batch);

  for (size_t h = 1; h < n_; h <<= 1) {
    for (size_t i = 0; i < n_; i += 2 * h) {
      for (size_t j = 0; j < h; ++j) {
        const size_t left = i + j;
        const size_t right = i + h + j;

        double scale_bl = 1.0;
        if (h > 1) {
          scale_bl = 1.0 - config_.bl_alpha * (static_cast<double>(j) /
                                               static_cast<double>(h - 1));
        }

        for (size_t r = 0; r < batch; ++r) {
          double v0 = config_.dac_gain * y.at(r, left);
          double v1 = config_.dac_gain * y.at(r, right) * row1_scale;

          double i_sum = config_.g0 * (v0 + v1) * scale_bl;
          double i_diff = config_.g0 * (v0 - v1) * scale_bl;

          v_sum[r] = i_sum * config_.rf;
          v_diff[r] = i_diff * config_.rf;
        }

        sense(v_sum.data(), batch);
        sense(v_diff.data(), batch);

        for (size_t r = 0; r < batch; ++r) {
          y.at(r, left) = v_sum[r] / gain;
          y.at(r, right) = v_diff[r] / gain;
        }
      }
    }
  }

  return true;
}

void XbarHadamard::sense(double *v, size_t batch) {
  if (config_.noise_sigma > 0.0) {
    std::normal_distribution<double> noise(0.0, config_.noise_sigma);
    for (size_t r = 0; r < batch; ++r) {
      v[r] += noise(rng());
    }
  }
  adc_quantize(v, batch, config_.adc_bits, config_.adc_clip);
}

} // namespace cimhwt
