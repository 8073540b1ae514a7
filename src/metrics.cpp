#include "cimhwt/metrics.hpp"
#include <algorithm>
#include <cmath>

namespace cimhwt {

bool compute_fidelity(const Signal &ideal, const Signal &model,
                      FidelityMetrics &metrics, std::string &error) {
  if (ideal.data.size() != model.data.size() || ideal.data.empty()) {
    error = "Cannot compare signals of " + std::to_string(ideal.data.size()) +
            " and " + std::to_string(model.data.size()) + " samples";
    return false;
  }

  double sq_sum = 0.0;
  double peak = 0.0;
  double max_err = 0.0;
  for (size_t i = 0; i < ideal.data.size(); ++i) {
    double diff = ideal.data[i] - model.data[i];
    sq_sum += diff * diff;
    max_err = std::max(max_err, std::abs(diff));
    peak = std::max(peak, std::abs(ideal.data[i]));
  }

  metrics.rmse = std::sqrt(sq_sum / static_cast<double>(ideal.data.size()));
  metrics.psnr_db = 20.0 * std::log10(peak / (metrics.rmse + PSNR_EPSILON));
  metrics.max_abs_error = max_err;
  return true;
}

void SignalStats::compute(const double *data, size_t n) {
  if (n == 0)
    return;

  double sum = 0.0;
  min_val = data[0];
  max_val = data[0];
  for (size_t i = 0; i < n; ++i) {
    sum += data[i];
    min_val = std::min(min_val, data[i]);
    max_val = std::max(max_val, data[i]);
  }
  mean = sum / static_cast<double>(n);

  double var_sum = 0.0;
  for (size_t i = 0; i < n; ++i) {
    double diff = data[i] - mean;
    var_sum += diff * diff;
  }
  std_dev = std::sqrt(var_sum / static_cast<double>(n));
}

void RunSummary::add(const FidelityMetrics &metrics) {
  runs.push_back(metrics);

  double rmse_sum = 0.0;
  double psnr_sum = 0.0;
  for (const auto &m : runs) {
    rmse_sum += m.rmse;
    psnr_sum += m.psnr_db;
  }
  mean_rmse = rmse_sum / static_cast<double>(runs.size());
  mean_psnr_db = psnr_sum / static_cast<double>(runs.size());
}

} // namespace cimhwt
