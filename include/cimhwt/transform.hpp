#pragma once

#include "types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace cimhwt {

/**
 * Unnormalized Fast Walsh-Hadamard Transform, in place: x -> H*x.
 *
 * n must be a power of two; callers that cannot guarantee it go through
 * fwht() which validates.
 */
void fwht_inplace(double *data, size_t n);

/**
 * Transform every row of a row-major [batch, n] buffer in place.
 */
void fwht_rows(double *data, size_t batch, size_t n);

/**
 * Ideal reference transform of a [N] or [B, N] signal.
 * Fails when N is zero or not a power of two. Applying it twice gives N*x.
 */
bool fwht(const Signal &x, Signal &y, std::string &error);

/**
 * Sylvester Hadamard matrix of order n, row-major, entries +/-1.
 * Built by block doubling [[H, H], [H, -H]]. Used for verification only.
 */
bool generate_hadamard_matrix(size_t n, std::vector<double> &matrix,
                              std::string &error);

} // namespace cimhwt
