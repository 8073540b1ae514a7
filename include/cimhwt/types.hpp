#pragma once

/**
 * CimHwt: Compute-In-Memory Hadamard Transform Simulator
 *
 * Core type definitions and configuration structures.
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <new>
#include <random>
#include <string>
#include <vector>

// Platform detection
#if defined(__AVX2__)
#define CIMHWT_HAS_AVX2 1
#endif

#if defined(__aarch64__) && (defined(__ARM_NEON) || defined(__ARM_NEON__))
#define CIMHWT_HAS_NEON 1
#endif

namespace cimhwt {

// ============================================================================
// Constants
// ============================================================================

constexpr size_t SIMD_ALIGNMENT = 64;
constexpr uint32_t CIMHWT_VERSION = 1;

constexpr double BOLTZMANN_K = 1.380649e-23;  // J/K
constexpr double CAPACITANCE_FLOOR = 1e-30;   // F, keeps kT/C finite
constexpr double ADC_RANGE_EPSILON = 1e-12;   // Added to auto-ranged full scale
constexpr double PSNR_EPSILON = 1e-12;

constexpr int MAX_ADC_BITS = 62;
constexpr int MAX_FIXED_POINT_BITS = 62;

// ============================================================================
// Basic Types
// ============================================================================

// Aligned allocator for SIMD operations
template <typename T, size_t Alignment = SIMD_ALIGNMENT>
struct AlignedAllocator {
  using value_type = T;
  using pointer = T *;
  using const_pointer = const T *;
  using reference = T &;
  using const_reference = const T &;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;

  template <typename U> struct rebind {
    using other = AlignedAllocator<U, Alignment>;
  };

  AlignedAllocator() noexcept = default;

  template <typename U>
  AlignedAllocator(const AlignedAllocator<U, Alignment> &) noexcept {}

  T *allocate(size_t n) {
    void *ptr = nullptr;
#if defined(_MSC_VER)
    ptr = _aligned_malloc(n * sizeof(T), Alignment);
#else
    if (posix_memalign(&ptr, Alignment, n * sizeof(T)) != 0) {
      ptr = nullptr;
    }
#endif
    if (!ptr)
      throw std::bad_alloc();
    return static_cast<T *>(ptr);
  }

  void deallocate(T *ptr, size_t) noexcept {
#if defined(_MSC_VER)
    _aligned_free(ptr);
#else
    free(ptr);
#endif
  }

  template <typename U>
  bool operator==(const AlignedAllocator<U, Alignment> &) const noexcept {
    return true;
  }

  template <typename U>
  bool operator!=(const AlignedAllocator<U, Alignment> &) const noexcept {
    return false;
  }
};

// Aligned vector type
template <typename T> using AlignedVector = std::vector<T, AlignedAllocator<T>>;

/**
 * Random source shared by the noisy engines.
 * A default-constructed generator uses the standard default seed.
 */
using Rng = std::mt19937_64;

/**
 * Real-valued signal of shape [N] or [batch, N], stored row-major.
 *
 * is_vector records that the caller supplied a 1D array; engines treat it
 * as a batch of one and hand back a 1D result.
 */
struct Signal {
  size_t batch = 0;
  size_t n = 0;
  bool is_vector = true;
  AlignedVector<double> data;

  Signal() = default;

  static Signal vector(size_t n) {
    Signal s;
    s.batch = 1;
    s.n = n;
    s.is_vector = true;
    s.data.assign(n, 0.0);
    return s;
  }

  static Signal matrix(size_t batch, size_t n) {
    Signal s;
    s.batch = batch;
    s.n = n;
    s.is_vector = false;
    s.data.assign(batch * n, 0.0);
    return s;
  }

  static Signal from_values(const std::vector<double> &values) {
    Signal s = vector(values.size());
    std::copy(values.begin(), values.end(), s.data.begin());
    return s;
  }

  // Same shape (and 1D/2D flavour) as other, zero-filled
  static Signal like(const Signal &other) {
    Signal s = other.is_vector ? vector(other.n) : matrix(other.batch, other.n);
    return s;
  }

  size_t size() const { return data.size(); }
  size_t ndim() const { return is_vector ? 1 : 2; }

  double *row(size_t r) { return data.data() + r * n; }
  const double *row(size_t r) const { return data.data() + r * n; }

  double &at(size_t r, size_t c) { return data[r * n + c]; }
  double at(size_t r, size_t c) const { return data[r * n + c]; }
};

// ============================================================================
// Engine Configuration
// ============================================================================

enum class EngineType { ADC = 0, CHARGE = 1, XBAR = 2 };

/**
 * ADC-style crossbar: every butterfly stage is perturbed by IR drop,
 * gain/offset, additive noise and ADC quantization.
 */
struct CimArrayConfig {
  size_t n = 256;
  double gain = 1.0;
  double offset = 0.0;
  double noise_sigma = 0.0;
  double ir_drop_alpha = 0.0;
  int adc_bits = 8;
  double adc_clip = 0.0; // Full scale; <= 0 selects auto-ranging per stage
};

/**
 * Bit-serial charge-sharing engine with fixed-point input encoding.
 */
struct ChargeEngineConfig {
  size_t n = 256;
  int num_int_bits = 6;
  int num_frac_bits = 10;
  double capacitance_f = 1e-12;
  double temperature_k = 300.0;
  double wordline_alpha = 0.0;
  double bitline_alpha = 0.0;
  double leak_decay = 0.0; // Fraction of stored charge lost per step (0..1)
};

/**
 * Explicit differential crossbar (G+/G-) with DAC, TIA and ADC per pair.
 */
struct XbarConfig {
  size_t n = 256;
  double g0 = 10e-6;       // Siemens per +1 entry
  double dac_gain = 1.0;   // Volts per numeric unit
  double rf = 100e3;       // TIA feedback, Ohms
  int adc_bits = 10;
  double adc_clip = 0.0;   // Volts; <= 0 selects auto-ranging per pair
  double noise_sigma = 0.0; // Volts, sense domain
  double wl_alpha = 0.0;
  double bl_alpha = 0.0;
};

/**
 * Run-level configuration consumed by the tools.
 */
struct SimConfig {
  EngineType engine = EngineType::ADC;
  size_t size = 256;

  CimArrayConfig adc;
  ChargeEngineConfig charge;
  XbarConfig xbar;

  size_t repeat = 1;
  uint64_t seed = 123;

  std::string input_path;  // Optional .safetensors input
  std::string tensor_name; // Tensor to load (empty = first)
  std::string report_path; // Optional JSON report
  bool verbose = false;
};

// ============================================================================
// Utility Functions
// ============================================================================

inline bool is_power_of_two(size_t n) { return n > 0 && (n & (n - 1)) == 0; }

inline size_t log2_exact(size_t n) {
  size_t k = 0;
  while ((size_t(1) << k) < n)
    ++k;
  return k;
}

inline const char *engine_type_name(EngineType type) {
  switch (type) {
  case EngineType::ADC:
    return "adc";
  case EngineType::CHARGE:
    return "charge";
  case EngineType::XBAR:
    return "xbar";
  }
  return "unknown";
}

inline bool parse_engine_type(const std::string &name, EngineType &type) {
  if (name == "adc") {
    type = EngineType::ADC;
  } else if (name == "charge") {
    type = EngineType::CHARGE;
  } else if (name == "xbar") {
    type = EngineType::XBAR;
  } else {
    return false;
  }
  return true;
}

/**
 * Check that x is a well-formed signal of width n.
 * Shared by every engine before it touches state or randomness.
 */
inline bool check_signal(const Signal &x, size_t n, std::string &error) {
  if (x.n != n) {
    error = "Input length " + std::to_string(x.n) + " must match n=" +
            std::to_string(n);
    return false;
  }
  if (x.batch == 0) {
    error = "Input batch is empty";
    return false;
  }
  if (x.data.size() != x.batch * x.n) {
    error = "Input buffer holds " + std::to_string(x.data.size()) +
            " values, expected " + std::to_string(x.batch * x.n);
    return false;
  }
  if (x.is_vector && x.batch != 1) {
    error = "1D input must have a batch of one";
    return false;
  }
  return true;
}

} // namespace cimhwt
