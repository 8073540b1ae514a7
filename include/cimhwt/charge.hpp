#pragma once

/**
 * CimHwt: Charge-Sharing Accumulator
 *
 * Capacitive storage node for bit-serial compute. Each step models:
 * - Bitline attenuation across columns and wordline attenuation across rows
 * - Leakage decay of the stored voltage
 * - Thermal noise ~ N(0, sqrt(kT/C)) in the voltage domain
 */

#include "types.hpp"
#include <string>

namespace cimhwt {

class ChargeAccumulator {
public:
  /**
   * rng is not owned and must outlive the accumulator.
   */
  ChargeAccumulator(const ChargeEngineConfig &config, Rng &rng);

  /**
   * Zero the stored voltage for a [batch, n] array and mark it live.
   */
  void reset(size_t batch, size_t n);

  /**
   * Accumulate one contribution v_in of shape [batch, n] (row-major).
   *
   * On an uninitialized node the state starts at zero and no decay is
   * applied. Fails if the node is live with a different shape.
   */
  bool step(const double *v_in, size_t batch, size_t n, std::string &error);

  const AlignedVector<double> &readout() const { return v_acc_; }

  bool initialized() const { return initialized_; }
  size_t batch() const { return batch_; }
  size_t n() const { return n_; }

  double noise_sigma() const { return sigma_; }

private:
  double wordline_alpha_;
  double bitline_alpha_;
  double leak_;
  double sigma_;

  Rng &rng_;

  bool initialized_ = false;
  size_t batch_ = 0;
  size_t n_ = 0;
  AlignedVector<double> v_acc_;
};

} // namespace cimhwt
