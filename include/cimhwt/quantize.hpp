#pragma once

/**
 * CimHwt: Quantization Primitives
 *
 * Signed fixed-point encoding, two's-complement bit-plane decomposition
 * and the uniform ADC model shared by the crossbar engines.
 */

#include "types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace cimhwt {

// ============================================================================
// Fixed-Point Format
// ============================================================================

/**
 * Signed fixed-point format with I integer bits (sign included) and
 * F fractional bits.
 *
 * Real range: [-2^(I-1), 2^(I-1) - 2^-F], resolution lsb = 2^-F.
 */
struct FixedPointFormat {
  int int_bits = 6;
  int frac_bits = 10;

  int total_bits() const { return int_bits + frac_bits; }
  double lsb() const { return std::ldexp(1.0, -frac_bits); }

  int64_t min_code() const {
    return -(int64_t(1) << (total_bits() - 1));
  }
  int64_t max_code() const {
    return (int64_t(1) << (total_bits() - 1)) - 1;
  }

  double min_real() const { return static_cast<double>(min_code()) * lsb(); }
  double max_real() const { return static_cast<double>(max_code()) * lsb(); }

  bool validate(std::string &error) const;
};

/**
 * Integer codes for a whole signal plus the scale back to real units:
 * real ~= codes[i] * lsb
 */
struct FixedPointCodes {
  size_t batch = 0;
  size_t n = 0;
  double lsb = 1.0;
  std::vector<int64_t> codes;
};

/**
 * Encode x into signed fixed-point codes.
 *
 * If clip > 0, values are clipped to [-clip, clip] first. Codes are
 * rounded to nearest (ties to even) and saturate at the format range;
 * saturation is modeled hardware behaviour, not an error. NaN encodes to 0.
 */
void encode_fixed_point(const double *x, size_t count,
                        const FixedPointFormat &format, int64_t *codes,
                        double clip = 0.0);

FixedPointCodes encode_fixed_point(const Signal &x,
                                   const FixedPointFormat &format,
                                   double clip = 0.0);

/**
 * Decode codes back to real units (code * lsb).
 */
void decode_fixed_point(const FixedPointCodes &codes, Signal &out);

/**
 * Count samples that fall outside the encodable range and would saturate.
 */
size_t count_saturated(const double *x, size_t count,
                       const FixedPointFormat &format);

// ============================================================================
// Bit-Plane Decomposition
// ============================================================================

/**
 * Two's-complement bit-planes, shape [total_bits, count], bit 0 = LSB.
 */
struct BitPlanes {
  int total_bits = 0;
  size_t count = 0;
  std::vector<uint8_t> planes;

  const uint8_t *plane(int b) const { return planes.data() + b * count; }
  uint8_t *plane(int b) { return planes.data() + b * count; }
};

/**
 * Decompose signed codes into bit-planes.
 *
 * Codes are masked to total_bits and shifted in the unsigned domain so the
 * sign bit never propagates into higher planes.
 */
BitPlanes decompose_to_bitplanes(const int64_t *codes, size_t count,
                                 int total_bits);

/**
 * Signed weight of each plane: 2^b * lsb, with the MSB weight negated.
 */
std::vector<double> bitplane_weights(int total_bits, double lsb);

/**
 * Rebuild the signed integer codes from bit-planes.
 * Inverse of decompose_to_bitplanes for codes representable in total_bits.
 */
std::vector<int64_t> recompose_from_bitplanes(const BitPlanes &bitplanes);

// ============================================================================
// ADC Model
// ============================================================================

/**
 * Full scale of an auto-ranging ADC: max |v| + epsilon.
 */
double adc_auto_range(const double *values, size_t count);

/**
 * Uniform mid-range quantization of a single sample to 2^bits levels
 * over [-vmax, vmax]:
 *
 *   step = 2*vmax / (levels - 1)
 *   out  = round((clamp(v) + vmax) / step) * step - vmax
 */
inline double adc_quantize_sample(double v, double vmax, double levels) {
  v = std::max(-vmax, std::min(vmax, v));
  double step = 2.0 * vmax / (levels - 1.0);
  return std::nearbyint((v + vmax) / step) * step - vmax;
}

/**
 * Quantize a group of samples read out together.
 *
 * clip > 0 fixes the full scale; otherwise the group's own max |v| is used.
 */
void adc_quantize(double *values, size_t count, int bits, double clip);

inline bool validate_adc_bits(int bits, std::string &error) {
  if (bits <= 0) {
    error = "adc_bits must be > 0";
    return false;
  }
  if (bits > MAX_ADC_BITS) {
    error = "adc_bits must be <= " + std::to_string(MAX_ADC_BITS);
    return false;
  }
  return true;
}

} // namespace cimhwt
