/**
 * CimHwt: Format Implementation
 *
 * Load/save run configs and write JSON reports.
 */

#include "cimhwt/format.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace cimhwt {

// Simple JSON serialization/deserialization helpers
namespace json {

std::string escape(const std::string &s) {
  std::string result;
  for (char c : s) {
    if (c == '"')
      result += "\\\"";
    else if (c == '\\')
      result += "\\\\";
    else if (c == '\n')
      result += "\\n";
    else if (c == '\t')
      result += "\\t";
    else
      result += c;
  }
  return result;
}

// Position of the first character of key's value, or npos if absent.
// Only a quoted key followed by ':' counts; equal string values are skipped.
size_t value_start(const std::string &json, const std::string &key) {
  const std::string quoted = "\"" + key + "\"";
  size_t key_pos = json.find(quoted);
  while (key_pos != std::string::npos) {
    size_t colon = json.find_first_not_of(" \t\n\r", key_pos + quoted.size());
    if (colon != std::string::npos && json[colon] == ':')
      return json.find_first_not_of(" \t\n\r", colon + 1);
    key_pos = json.find(quoted, key_pos + quoted.size());
  }
  return std::string::npos;
}

// Body of a nested object {...}; empty if the section is absent
std::string get_section(const std::string &json, const std::string &key) {
  size_t start = value_start(json, key);
  if (start == std::string::npos || json[start] != '{')
    return "";
  size_t end = json.find("}", start);
  if (end == std::string::npos)
    return "";
  return json.substr(start, end - start + 1);
}

// Helper to extract string value; leaves value untouched if absent
bool get_string(const std::string &json, const std::string &key,
                std::string &value, std::string &error) {
  size_t start = value_start(json, key);
  if (start == std::string::npos)
    return true;
  if (json[start] != '"') {
    error = "Expected a string for \"" + key + "\"";
    return false;
  }

  std::string result;
  for (size_t i = start + 1; i < json.size(); ++i) {
    char c = json[i];
    if (c == '"') {
      value = result;
      return true;
    }
    if (c != '\\') {
      result += c;
      continue;
    }
    if (++i == json.size())
      break;
    switch (json[i]) {
    case '"':
    case '\\':
    case '/':
      result += json[i];
      break;
    case 'n':
      result += '\n';
      break;
    case 't':
      result += '\t';
      break;
    default:
      error = "Unsupported escape in string for \"" + key + "\"";
      return false;
    }
  }
  error = "Unterminated string for \"" + key + "\"";
  return false;
}

// Helper to extract a number; leaves value untouched if absent
bool get_double(const std::string &json, const std::string &key,
                double &value, std::string &error) {
  size_t start = value_start(json, key);
  if (start == std::string::npos)
    return true;

  size_t end = json.find_first_of(",}\n\r", start);
  std::string s = json.substr(start, end - start);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    s.pop_back();

  const char *begin = s.c_str();
  char *stop = nullptr;
  errno = 0;
  double parsed = std::strtod(begin, &stop);
  if (s.empty() || stop != begin + s.size() || errno == ERANGE) {
    error = "Malformed number for \"" + key + "\": " + s;
    return false;
  }
  value = parsed;
  return true;
}

bool get_int(const std::string &json, const std::string &key, int &value,
             std::string &error) {
  double parsed = value;
  if (!get_double(json, key, parsed, error))
    return false;
  if (parsed != std::floor(parsed) || std::abs(parsed) > 1e9) {
    error = "Expected an integer for \"" + key + "\"";
    return false;
  }
  value = static_cast<int>(parsed);
  return true;
}

// Helper to extract an unsigned integer; leaves value untouched if absent
bool get_u64(const std::string &json, const std::string &key, uint64_t &value,
             std::string &error) {
  size_t start = value_start(json, key);
  if (start == std::string::npos)
    return true;

  size_t end = json.find_first_of(", \t}\n\r", start);
  std::string s = json.substr(start, end - start);

  const char *begin = s.c_str();
  char *stop = nullptr;
  errno = 0;
  unsigned long long parsed = std::strtoull(begin, &stop, 10);
  if (s.empty() || s[0] == '-' || stop != begin + s.size() || errno == ERANGE) {
    error = "Expected a non-negative integer for \"" + key + "\": " + s;
    return false;
  }
  value = static_cast<uint64_t>(parsed);
  return true;
}

bool get_size(const std::string &json, const std::string &key, size_t &value,
              std::string &error) {
  uint64_t parsed = value;
  if (!get_u64(json, key, parsed, error))
    return false;
  value = static_cast<size_t>(parsed);
  return true;
}

bool get_bool(const std::string &json, const std::string &key, bool &value,
              std::string &error) {
  size_t start = value_start(json, key);
  if (start == std::string::npos)
    return true;
  if (json.compare(start, 4, "true") == 0) {
    value = true;
  } else if (json.compare(start, 5, "false") == 0) {
    value = false;
  } else {
    error = "Expected true/false for \"" + key + "\"";
    return false;
  }
  return true;
}

std::string serialize_config(const SimConfig &config) {
  std::ostringstream ss;
  ss << std::setprecision(17);
  ss << "{\n";
  ss << "  \"engine\": \"" << engine_type_name(config.engine) << "\",\n";
  ss << "  \"size\": " << config.size << ",\n";
  ss << "  \"repeat\": " << config.repeat << ",\n";
  ss << "  \"seed\": " << config.seed << ",\n";
  ss << "  \"input\": \"" << escape(config.input_path) << "\",\n";
  ss << "  \"tensor\": \"" << escape(config.tensor_name) << "\",\n";

  const CimArrayConfig &a = config.adc;
  ss << "  \"adc\": {\n";
  ss << "    \"gain\": " << a.gain << ",\n";
  ss << "    \"offset\": " << a.offset << ",\n";
  ss << "    \"noise_sigma\": " << a.noise_sigma << ",\n";
  ss << "    \"ir_drop_alpha\": " << a.ir_drop_alpha << ",\n";
  ss << "    \"adc_bits\": " << a.adc_bits << ",\n";
  ss << "    \"adc_clip\": " << a.adc_clip << "\n";
  ss << "  },\n";

  const ChargeEngineConfig &c = config.charge;
  ss << "  \"charge\": {\n";
  ss << "    \"num_int_bits\": " << c.num_int_bits << ",\n";
  ss << "    \"num_frac_bits\": " << c.num_frac_bits << ",\n";
  ss << "    \"capacitance_f\": " << c.capacitance_f << ",\n";
  ss << "    \"temperature_k\": " << c.temperature_k << ",\n";
  ss << "    \"wordline_alpha\": " << c.wordline_alpha << ",\n";
  ss << "    \"bitline_alpha\": " << c.bitline_alpha << ",\n";
  ss << "    \"leak_decay\": " << c.leak_decay << "\n";
  ss << "  },\n";

  const XbarConfig &x = config.xbar;
  ss << "  \"xbar\": {\n";
  ss << "    \"g0\": " << x.g0 << ",\n";
  ss << "    \"dac_gain\": " << x.dac_gain << ",\n";
  ss << "    \"rf\": " << x.rf << ",\n";
  ss << "    \"adc_bits\": " << x.adc_bits << ",\n";
  ss << "    \"adc_clip\": " << x.adc_clip << ",\n";
  ss << "    \"noise_sigma\": " << x.noise_sigma << ",\n";
  ss << "    \"wl_alpha\": " << x.wl_alpha << ",\n";
  ss << "    \"bl_alpha\": " << x.bl_alpha << "\n";
  ss << "  }\n";
  ss << "}";
  return ss.str();
}

} // namespace json

bool parse_sim_config(const std::string &text, SimConfig &config,
                      std::string &error) {
  // Top-level keys are distinct from every section key, so a flat search
  // over the whole document is unambiguous.
  std::string engine = engine_type_name(config.engine);

  bool ok = json::get_string(text, "engine", engine, error) &&
            json::get_size(text, "size", config.size, error) &&
            json::get_size(text, "repeat", config.repeat, error) &&
            json::get_u64(text, "seed", config.seed, error) &&
            json::get_string(text, "input", config.input_path, error) &&
            json::get_string(text, "tensor", config.tensor_name, error) &&
            json::get_string(text, "report", config.report_path, error) &&
            json::get_bool(text, "verbose", config.verbose, error);
  if (!ok)
    return false;

  if (!parse_engine_type(engine, config.engine)) {
    error = "Unknown engine \"" + engine + "\" (expected adc, charge, xbar)";
    return false;
  }
  std::string adc = json::get_section(text, "adc");
  if (!adc.empty()) {
    CimArrayConfig &a = config.adc;
    ok = json::get_double(adc, "gain", a.gain, error) &&
         json::get_double(adc, "offset", a.offset, error) &&
         json::get_double(adc, "noise_sigma", a.noise_sigma, error) &&
         json::get_double(adc, "ir_drop_alpha", a.ir_drop_alpha, error) &&
         json::get_int(adc, "adc_bits", a.adc_bits, error) &&
         json::get_double(adc, "adc_clip", a.adc_clip, error);
    if (!ok)
      return false;
  }

  std::string charge = json::get_section(text, "charge");
  if (!charge.empty()) {
    ChargeEngineConfig &c = config.charge;
    ok = json::get_int(charge, "num_int_bits", c.num_int_bits, error) &&
         json::get_int(charge, "num_frac_bits", c.num_frac_bits, error) &&
         json::get_double(charge, "capacitance_f", c.capacitance_f, error) &&
         json::get_double(charge, "temperature_k", c.temperature_k, error) &&
         json::get_double(charge, "wordline_alpha", c.wordline_alpha, error) &&
         json::get_double(charge, "bitline_alpha", c.bitline_alpha, error) &&
         json::get_double(charge, "leak_decay", c.leak_decay, error);
    if (!ok)
      return false;
  }

  std::string xbar = json::get_section(text, "xbar");
  if (!xbar.empty()) {
    XbarConfig &x = config.xbar;
    ok = json::get_double(xbar, "g0", x.g0, error) &&
         json::get_double(xbar, "dac_gain", x.dac_gain, error) &&
         json::get_double(xbar, "rf", x.rf, error) &&
         json::get_int(xbar, "adc_bits", x.adc_bits, error) &&
         json::get_double(xbar, "adc_clip", x.adc_clip, error) &&
         json::get_double(xbar, "noise_sigma", x.noise_sigma, error) &&
         json::get_double(xbar, "wl_alpha", x.wl_alpha, error) &&
         json::get_double(xbar, "bl_alpha", x.bl_alpha, error);
    if (!ok)
      return false;
  }

  return true;
}

bool load_sim_config(const std::string &path, SimConfig &config,
                     std::string &error) {
  std::ifstream file(path);
  if (!file) {
    error = "Cannot open config file: " + path;
    return false;
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return parse_sim_config(ss.str(), config, error);
}

std::string serialize_sim_config(const SimConfig &config) {
  return json::serialize_config(config);
}

bool save_report(const std::string &path, const SimConfig &config,
                 const RunSummary &summary, const SignalStats &input_stats,
                 std::string &error) {
  std::ofstream file(path);
  if (!file) {
    error = "Cannot open report file: " + path;
    return false;
  }

  std::ostringstream ss;
  ss << std::setprecision(17);
  ss << "{\n";
  ss << "  \"version\": " << CIMHWT_VERSION << ",\n";
  ss << "  \"config\": " << json::serialize_config(config) << ",\n";
  ss << "  \"input_stats\": {\"mean\": " << input_stats.mean
     << ", \"std_dev\": " << input_stats.std_dev
     << ", \"min\": " << input_stats.min_val
     << ", \"max\": " << input_stats.max_val << "},\n";
  ss << "  \"runs\": [\n";
  for (size_t i = 0; i < summary.runs.size(); ++i) {
    const FidelityMetrics &m = summary.runs[i];
    ss << "    {\"rmse\": " << m.rmse << ", \"psnr_db\": " << m.psnr_db
       << ", \"max_abs_error\": " << m.max_abs_error << "}";
    if (i + 1 < summary.runs.size())
      ss << ",";
    ss << "\n";
  }
  ss << "  ],\n";
  ss << "  \"mean_rmse\": " << summary.mean_rmse << ",\n";
  ss << "  \"mean_psnr_db\": " << summary.mean_psnr_db << "\n";
  ss << "}\n";

  file << ss.str();
  if (!file) {
    error = "Failed writing report file: " + path;
    return false;
  }
  return true;
}

} // namespace cimhwt
