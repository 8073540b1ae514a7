#pragma once

/**
 * CimHwt: Fidelity Metrics
 *
 * Discrepancy between a model output and the ideal transform.
 */

#include "types.hpp"
#include <string>
#include <vector>

namespace cimhwt {

struct FidelityMetrics {
  double rmse = 0.0;
  double psnr_db = 0.0; // 20*log10(max|ideal| / (rmse + eps))
  double max_abs_error = 0.0;
};

/**
 * Compare model against ideal element by element.
 * Fails if the two signals do not hold the same number of samples.
 */
bool compute_fidelity(const Signal &ideal, const Signal &model,
                      FidelityMetrics &metrics, std::string &error);

/**
 * Summary statistics of a buffer, used for run reports.
 */
struct SignalStats {
  double mean = 0.0;
  double std_dev = 0.0;
  double min_val = 0.0;
  double max_val = 0.0;

  void compute(const double *data, size_t n);
};

/**
 * Per-run metrics of a repeated experiment and their means.
 */
struct RunSummary {
  std::vector<FidelityMetrics> runs;
  double mean_rmse = 0.0;
  double mean_psnr_db = 0.0;

  void add(const FidelityMetrics &metrics);
};

} // namespace cimhwt
