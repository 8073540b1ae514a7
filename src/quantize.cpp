/**
 * CimHwt: Quantization Implementation
 */

#include "cimhwt/quantize.hpp"
#include <algorithm>
#include <cmath>

namespace cimhwt {

bool FixedPointFormat::validate(std::string &error) const {
  if (int_bits < 1) {
    error = "num_int_bits must be >= 1 (sign bit)";
    return false;
  }
  if (frac_bits < 0) {
    error = "num_frac_bits must be >= 0";
    return false;
  }
  if (total_bits() > MAX_FIXED_POINT_BITS) {
    error = "num_int_bits + num_frac_bits must be <= " +
            std::to_string(MAX_FIXED_POINT_BITS);
    return false;
  }
  return true;
}

// ============================================================================
// Fixed-Point Encoding
// ============================================================================

void encode_fixed_point(const double *x, size_t count,
                        const FixedPointFormat &format, int64_t *codes,
                        double clip) {
  const double lsb = format.lsb();
  // 2^(total_bits - 1) is exact in a double while max_code() may not be
  const double limit = std::ldexp(1.0, format.total_bits() - 1);

  for (size_t i = 0; i < count; ++i) {
    double v = x[i];
    if (std::isnan(v)) {
      codes[i] = 0;
      continue;
    }
    if (clip > 0.0) {
      v = std::max(-clip, std::min(clip, v));
    }
    double q = std::nearbyint(v / lsb);
    if (q >= limit) {
      codes[i] = format.max_code();
    } else if (q < -limit) {
      codes[i] = format.min_code();
    } else {
      codes[i] = static_cast<int64_t>(q);
    }
  }
}

FixedPointCodes encode_fixed_point(const Signal &x,
                                   const FixedPointFormat &format,
                                   double clip) {
  FixedPointCodes out;
  out.batch = x.batch;
  out.n = x.n;
  out.lsb = format.lsb();
  out.codes.resize(x.data.size());
  encode_fixed_point(x.data.data(), x.data.size(), format, out.codes.data(),
                     clip);
  return out;
}

void decode_fixed_point(const FixedPointCodes &codes, Signal &out) {
  out = Signal::matrix(codes.batch, codes.n);
  for (size_t i = 0; i < codes.codes.size(); ++i) {
    out.data[i] = static_cast<double>(codes.codes[i]) * codes.lsb;
  }
}

size_t count_saturated(const double *x, size_t count,
                       const FixedPointFormat &format) {
  // Anything rounding past the end codes saturates
  const double half = 0.5 * format.lsb();
  const double lo = format.min_real() - half;
  const double hi = format.max_real() + half;

  size_t saturated = 0;
  for (size_t i = 0; i < count; ++i) {
    if (x[i] < lo || x[i] > hi)
      saturated++;
  }
  return saturated;
}

// ============================================================================
// Bit-Planes
// ============================================================================

BitPlanes decompose_to_bitplanes(const int64_t *codes, size_t count,
                                 int total_bits) {
  BitPlanes bp;
  bp.total_bits = total_bits;
  bp.count = count;
  bp.planes.assign(static_cast<size_t>(total_bits) * count, 0);

  const uint64_t mask = total_bits >= 64
                            ? ~uint64_t(0)
                            : (uint64_t(1) << total_bits) - uint64_t(1);

  for (size_t i = 0; i < count; ++i) {
    uint64_t u = static_cast<uint64_t>(codes[i]) & mask;
    for (int b = 0; b < total_bits; ++b) {
      bp.plane(b)[i] = static_cast<uint8_t>((u >> b) & uint64_t(1));
    }
  }
  return bp;
}

std::vector<double> bitplane_weights(int total_bits, double lsb) {
  std::vector<double> weights(total_bits);
  for (int b = 0; b < total_bits; ++b) {
    weights[b] = std::ldexp(lsb, b);
  }
  if (total_bits > 0) {
    weights[total_bits - 1] = -weights[total_bits - 1];
  }
  return weights;
}

std::vector<int64_t> recompose_from_bitplanes(const BitPlanes &bitplanes) {
  std::vector<int64_t> codes(bitplanes.count, 0);
  const int msb = bitplanes.total_bits - 1;

  for (size_t i = 0; i < bitplanes.count; ++i) {
    int64_t v = 0;
    for (int b = 0; b < msb; ++b) {
      if (bitplanes.plane(b)[i])
        v += int64_t(1) << b;
    }
    if (msb >= 0 && bitplanes.plane(msb)[i])
      v -= int64_t(1) << msb;
    codes[i] = v;
  }
  return codes;
}

// ============================================================================
// ADC
// ============================================================================

double adc_auto_range(const double *values, size_t count) {
  double max_abs = 0.0;
  for (size_t i = 0; i < count; ++i) {
    max_abs = std::max(max_abs, std::abs(values[i]));
  }
  return max_abs + ADC_RANGE_EPSILON;
}

void adc_quantize(double *values, size_t count, int bits, double clip) {
  const double vmax = clip > 0.0 ? clip : adc_auto_range(values, count);
  const double levels = std::ldexp(1.0, bits);

  for (size_t i = 0; i < count; ++i) {
    values[i] = adc_quantize_sample(values[i], vmax, levels);
  }
}

} // namespace cimhwt
