#pragma once

/**
 * CimHwt: Config and Report Format
 *
 * Run configuration and results as JSON:
 *
 *   {
 *     "engine": "adc", "size": 256, "repeat": 1, "seed": 123,
 *     "input": "", "tensor": "",
 *     "adc":    { "gain": 1.0, "adc_bits": 8, ... },
 *     "charge": { "num_int_bits": 6, ... },
 *     "xbar":   { "g0": 1e-05, ... }
 *   }
 *
 * Keys missing from a config file keep their defaults.
 */

#include "metrics.hpp"
#include "types.hpp"
#include <string>

namespace cimhwt {

/**
 * Parse a JSON config document over the values already in config.
 */
bool parse_sim_config(const std::string &json, SimConfig &config,
                      std::string &error);

/**
 * Load a JSON config file over the values already in config.
 */
bool load_sim_config(const std::string &path, SimConfig &config,
                     std::string &error);

std::string serialize_sim_config(const SimConfig &config);

/**
 * Write the effective config, per-run metrics and input statistics.
 */
bool save_report(const std::string &path, const SimConfig &config,
                 const RunSummary &summary, const SignalStats &input_stats,
                 std::string &error);

} // namespace cimhwt
