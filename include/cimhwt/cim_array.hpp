#pragma once

/**
 * CimHwt: ADC-Crossbar Engine
 *
 * Runs the butterfly network in the numeric domain and perturbs every
 * stage's sum/diff outputs with, in order:
 *   1. IR drop: linear attenuation ramp across the column index
 *   2. Gain and offset: gain * v + offset
 *   3. Additive Gaussian noise
 *   4. ADC quantization to 2^adc_bits levels
 */

#include "engine.hpp"
#include <memory>
#include <string>

namespace cimhwt {

class CimArray : public Engine {
public:
  static std::unique_ptr<CimArray> create(const CimArrayConfig &config,
                                          Rng *rng, std::string &error);

  bool apply(const Signal &x, Signal &y, std::string &error) override;
  const char *name() const override { return "adc"; }

  const CimArrayConfig &config() const { return config_; }

private:
  CimArray(const CimArrayConfig &config, Rng *rng);

  void nonideal_stage(double *stage, size_t batch);

  CimArrayConfig config_;
  AlignedVector<double> ir_scale_; // Per-column IR drop factor
};

} // namespace cimhwt
