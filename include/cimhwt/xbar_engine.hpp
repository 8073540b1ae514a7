#pragma once

/**
 * CimHwt: Differential-Crossbar Engine
 *
 * For each butterfly pair at each stage a 2x2 crossbar block is emulated:
 * - Rows: the two inputs, driven as voltages by the DAC
 * - Columns: sum (+1, +1) and diff (+1, -1) through differential G+/G-
 *
 * Pipeline per pair:
 *   1. DAC:       V_in = dac_gain * x
 *   2. Wordline:  row 0 unscaled, row 1 scaled by (1 - wl_alpha)
 *   3. Columns:   I_sum = g0*(V0 + V1), I_diff = g0*(V0 - V1)
 *   4. Bitline:   scale by 1 - bl_alpha * j/(h-1) within the block
 *   5. TIA:       V_out = I * rf
 *   6. Noise in the sense voltage domain
 *   7. ADC quantization (auto-ranged per pair unless a clip is set)
 *   8. Back to numeric units: divide by rf * g0 * dac_gain
 *
 * Pairs are processed strictly in block-then-position order so noise draws
 * and per-pair ADC ranges follow the sequential hardware traversal.
 */

#include "engine.hpp"
#include <memory>
#include <string>

namespace cimhwt {

class XbarHadamard : public Engine {
public:
  static std::unique_ptr<XbarHadamard> create(const XbarConfig &config,
                                              Rng *rng, std::string &error);

  bool apply(const Signal &x, Signal &y, std::string &error) override;
  const char *name() const override { return "xbar"; }

  const XbarConfig &config() const { return config_; }

  // Volts at the ADC per numeric unit at the input
  double path_gain() const { return config_.rf * config_.g0 * config_.dac_gain; }

private:
  XbarHadamard(const XbarConfig &config, Rng *rng);

  void sense(double *v, size_t batch);

  XbarConfig config_;
};

} // namespace cimhwt
