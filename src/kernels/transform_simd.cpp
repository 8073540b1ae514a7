#include "cimhwt/transform.hpp"
#include <algorithm>
#include <cmath>

#if defined(CIMHWT_HAS_NEON)
#include <arm_neon.h>
#endif

#if defined(CIMHWT_HAS_AVX2)
#include <immintrin.h>
#endif

namespace cimhwt {

// Helper: Scalar pass for one butterfly stride
inline void fwht_pass_scalar(double *data, size_t n, size_t h) {
  for (size_t i = 0; i < n; i += 2 * h) {
    for (size_t j = i; j < i + h; ++j) {
      double x = data[j];
      double y = data[j + h];
      data[j] = x + y;
      data[j + h] = x - y;
    }
  }
}

void fwht_inplace(double *data, size_t n) {
  // Stride 1 is scalar; wider strides process two (NEON) or four (AVX2)
  // lanes at a time. Adds and subtracts are exact per lane, so every path
  // agrees bit for bit.
  if (n < 2)
    return;
  fwht_pass_scalar(data, n, 1);

  for (size_t h = 2; h < n; h <<= 1) {
#if defined(CIMHWT_HAS_AVX2)
    if (h >= 4) {
      for (size_t i = 0; i < n; i += 2 * h) {
        for (size_t j = 0; j < h; j += 4) {
          __m256d vm = _mm256_loadu_pd(data + i + j);
          __m256d vp = _mm256_loadu_pd(data + i + h + j);

          _mm256_storeu_pd(data + i + j, _mm256_add_pd(vm, vp));
          _mm256_storeu_pd(data + i + h + j, _mm256_sub_pd(vm, vp));
        }
      }
      continue;
    }
#endif
    for (size_t i = 0; i < n; i += 2 * h) {
      for (size_t j = 0; j < h; j += 2) {
#if defined(CIMHWT_HAS_NEON)
        float64x2_t vm = vld1q_f64(data + i + j);
        float64x2_t vp = vld1q_f64(data + i + h + j);

        vst1q_f64(data + i + j, vaddq_f64(vm, vp));
        vst1q_f64(data + i + h + j, vsubq_f64(vm, vp));
#else
        for (size_t k = 0; k < 2; ++k) {
          double x = data[i + j + k];
          double y = data[i + h + j + k];
          data[i + j + k] = x + y;
          data[i + h + j + k] = x - y;
        }
#endif
      }
    }
  }
}

void fwht_rows(double *data, size_t batch, size_t n) {
  for (size_t r = 0; r < batch; ++r) {
    fwht_inplace(data + r * n, n);
  }
}

bool fwht(const Signal &x, Signal &y, std::string &error) {
  if (!is_power_of_two(x.n)) {
    error = "Length must be power of two and > 0 (got " +
            std::to_string(x.n) + ")";
    return false;
  }
  if (x.data.size() != x.batch * x.n) {
    error = "Signal buffer does not match its shape";
    return false;
  }

  y = x;
  fwht_rows(y.data.data(), y.batch, y.n);
  return true;
}

bool generate_hadamard_matrix(size_t n, std::vector<double> &matrix,
                              std::string &error) {
  if (!is_power_of_two(n)) {
    error = "n must be a power of two and > 0";
    return false;
  }

  matrix.assign(n * n, 0.0);
  matrix[0] = 1.0;

  // Grow the top-left k x k block to 2k x 2k until it covers n
  for (size_t k = 1; k < n; k <<= 1) {
    for (size_t r = 0; r < k; ++r) {
      for (size_t c = 0; c < k; ++c) {
        double v = matrix[r * n + c];
        matrix[r * n + (c + k)] = v;
        matrix[(r + k) * n + c] = v;
        matrix[(r + k) * n + (c + k)] = -v;
      }
    }
  }
  return true;
}

} // namespace cimhwt
