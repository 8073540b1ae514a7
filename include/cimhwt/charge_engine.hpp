#pragma once

/**
 * CimHwt: Bit-Serial Charge Engine
 *
 * Workflow:
 *   1. Quantize input to fixed-point and decompose into two's-complement
 *      bit-planes.
 *   2. For each plane (LSB -> MSB) take the ideal transform of the 0/1
 *      plane, scale by the plane's signed weight, and charge it onto the
 *      accumulator.
 *   3. Read out the accumulated voltage.
 *
 * Linearity makes the weighted sum of per-plane transforms equal the
 * transform of the fixed-point input; the accumulator adds the physics.
 */

#include "charge.hpp"
#include "engine.hpp"
#include "quantize.hpp"
#include <memory>
#include <string>
#include <vector>

namespace cimhwt {

class ChargeCimHadamard : public Engine {
public:
  static std::unique_ptr<ChargeCimHadamard>
  create(const ChargeEngineConfig &config, Rng *rng, std::string &error);

  bool apply(const Signal &x, Signal &y, std::string &error) override;
  const char *name() const override { return "charge"; }

  const ChargeEngineConfig &config() const { return config_; }
  const FixedPointFormat &format() const { return format_; }
  const ChargeAccumulator &accumulator() const { return accum_; }

private:
  ChargeCimHadamard(const ChargeEngineConfig &config, Rng *rng);

  ChargeEngineConfig config_;
  FixedPointFormat format_;
  std::vector<double> weights_;
  ChargeAccumulator accum_;
};

} // namespace cimhwt
