#include "cimhwt/charge_engine.hpp"
#include "cimhwt/transform.hpp"
#include <algorithm>

namespace cimhwt {

namespace {

FixedPointFormat make_format(const ChargeEngineConfig &config) {
  FixedPointFormat format;
  format.int_bits = config.num_int_bits;
  format.frac_bits = config.num_frac_bits;
  return format;
}

} // namespace

std::unique_ptr<ChargeCimHadamard>
ChargeCimHadamard::create(const ChargeEngineConfig &config, Rng *rng,
                          std::string &error) {
  if (!validate_size(config.n, error))
    return nullptr;
  if (!make_format(config).validate(error))
    return nullptr;
  return std::unique_ptr<ChargeCimHadamard>(new ChargeCimHadamard(config, rng));
}

// accum_ binds to the engine's generator, so Engine must be built first
ChargeCimHadamard::ChargeCimHadamard(const ChargeEngineConfig &config,
                                     Rng *rng)
    : Engine(config.n, rng), config_(config), format_(make_format(config)),
      weights_(bitplane_weights(format_.total_bits(), format_.lsb())),
      accum_(config, this->rng()) {}

bool ChargeCimHadamard::apply(const Signal &x, Signal &y, std::string &error) {
  if (!check_signal(x, n_, error))
    return false;

  const size_t batch = x.batch;
  const size_t count = batch * n_;

  FixedPointCodes codes = encode_fixed_point(x, format_);
  BitPlanes bitplanes =
      decompose_to_bitplanes(codes.codes.data(), count, format_.total_bits());

  accum_.reset(batch, n_);

  AlignedVector<double> contribution(count);
  for (int b = 0; b < bitplanes.total_bits; ++b) {
    const uint8_t *plane = bitplanes.plane(b);
    std::copy(plane, plane + count, contribution.begin());

    fwht_rows(contribution.data(), batch, n_);
    for (double &v : contribution) {
      v *= weights_[b];
    }

    if (!accum_.step(contribution.data(), batch, n_, error))
      return false;
  }

  y = Signal::like(x);
  const AlignedVector<double> &v_out = accum_.readout();
  std::copy(v_out.begin(), v_out.end(), y.data.begin());
  return true;
}

} // namespace cimhwt
