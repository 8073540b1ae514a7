/**
 * CimHwt Simulation Tool
 *
 * Run an FWHT engine against the ideal transform and report RMSE/PSNR.
 *
 * Usage:
 *   cimhwt-sim --engine charge --size 256 --repeat 10 --seed 7
 */

#include "cimhwt/engine.hpp"
#include "cimhwt/format.hpp"
#include "cimhwt/metrics.hpp"
#include "cimhwt/quantize.hpp"
#include "cimhwt/signal_io.hpp"
#include "cimhwt/transform.hpp"
#include "cimhwt/types.hpp"
#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace cimhwt;

void print_usage(const char *prog) {
  std::cout << "CimHwt Simulator v" << CIMHWT_VERSION << "\n\n";
  std::cout << "Usage: " << prog << " [options]\n\n";
  std::cout << "General:\n";
  std::cout << "  --engine <adc|charge|xbar>  Engine/model to use (default: adc)\n";
  std::cout << "  --size <n>             Transform size, power of two (default: 256)\n";
  std::cout << "  --repeat <n>           Repeat runs and average metrics (default: 1)\n";
  std::cout << "  --seed <n>             Random seed (default: 123)\n";
  std::cout << "  --config <path>        JSON config; flags given here override it\n";
  std::cout << "  --input <path>         Input signal from a .safetensors file\n";
  std::cout << "  --tensor <name>        Tensor to load (default: first)\n";
  std::cout << "  --report <path>        Write a JSON report\n";
  std::cout << "  --verbose, -v          Verbose output\n";
  std::cout << "  --help, -h             Show this help\n\n";
  std::cout << "ADC engine:\n";
  std::cout << "  --adc-bits <n>         ADC resolution (default: 8)\n";
  std::cout << "  --adc-clip <f>         ADC full scale, <= 0 auto-ranges (default: auto)\n";
  std::cout << "  --noise-sigma <f>      Additive noise sigma (default: 0)\n";
  std::cout << "  --ir-drop-alpha <f>    IR drop across columns (default: 0)\n";
  std::cout << "  --gain <f>             Gain (default: 1)\n";
  std::cout << "  --offset <f>           Offset (default: 0)\n\n";
  std::cout << "Charge engine:\n";
  std::cout << "  --int-bits <n>         Integer bits for input encoding (default: 6)\n";
  std::cout << "  --frac-bits <n>        Fractional bits for input encoding (default: 10)\n";
  std::cout << "  --cap-f <f>            Accumulator capacitance in Farads (default: 1e-12)\n";
  std::cout << "  --temp-k <f>           Temperature in Kelvin (default: 300)\n";
  std::cout << "  --wl-alpha <f>         Wordline attenuation factor (default: 0)\n";
  std::cout << "  --bl-alpha <f>         Bitline attenuation factor (default: 0)\n";
  std::cout << "  --leak <f>             Leakage decay per step, 0..1 (default: 0)\n\n";
  std::cout << "Xbar engine:\n";
  std::cout << "  --x-g0 <f>             Unit conductance per +1 entry, S (default: 1e-5)\n";
  std::cout << "  --x-dac-gain <f>       DAC gain, V per numeric unit (default: 1)\n";
  std::cout << "  --x-rf <f>             TIA feedback resistance, Ohms (default: 1e5)\n";
  std::cout << "  --x-adc-bits <n>       ADC bits in sense path (default: 10)\n";
  std::cout << "  --x-adc-clip <f>       ADC full scale, V, <= 0 auto-ranges (default: auto)\n";
  std::cout << "  --x-noise <f>          Sense voltage noise sigma, V (default: 0)\n";
  std::cout << "  --x-wl-alpha <f>       WL attenuation, row 1 scaling (default: 0)\n";
  std::cout << "  --x-bl-alpha <f>       BL attenuation across j in block (default: 0)\n";
}

struct SimArgs {
  SimConfig config;
  std::string config_path;
  bool help = false;
};

// Value following a flag; throws std::invalid_argument when missing
std::string next_value(int argc, char **argv, int &i) {
  if (i + 1 >= argc)
    throw std::invalid_argument(std::string("missing value for ") + argv[i]);
  return argv[++i];
}

bool parse_args(int argc, char **argv, SimArgs &args, std::string &error) {
  // A config file sets the base; every other flag overrides it
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") {
      args.config_path = argv[i + 1];
      if (!load_sim_config(args.config_path, args.config, error))
        return false;
    }
  }

  SimConfig &c = args.config;
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        return true;
      } else if (arg == "--config") {
        next_value(argc, argv, i);
      } else if (arg == "--engine") {
        std::string name = next_value(argc, argv, i);
        if (!parse_engine_type(name, c.engine)) {
          error = "Unknown engine: " + name + " (expected adc, charge, xbar)";
          return false;
        }
      } else if (arg == "--size") {
        c.size = std::stoul(next_value(argc, argv, i));
      } else if (arg == "--repeat") {
        c.repeat = std::stoul(next_value(argc, argv, i));
      } else if (arg == "--seed") {
        c.seed = std::stoull(next_value(argc, argv, i));
      } else if (arg == "--input") {
        c.input_path = next_value(argc, argv, i);
      } else if (arg == "--tensor") {
        c.tensor_name = next_value(argc, argv, i);
      } else if (arg == "--report") {
        c.report_path = next_value(argc, argv, i);
      } else if (arg == "--verbose" || arg == "-v") {
        c.verbose = true;
      } else if (arg == "--adc-bits") {
        c.adc.adc_bits = std::stoi(next_value(argc, argv, i));
      } else if (arg == "--adc-clip") {
        c.adc.adc_clip = std::stod(next_value(argc, argv, i));
      } else if (arg == "--noise-sigma") {
        c.adc.noise_sigma = std::stod(next_value(argc, argv, i));
      } else if (arg == "--ir-drop-alpha") {
        c.adc.ir_drop_alpha = std::stod(next_value(argc, argv, i));
      } else if (arg == "--gain") {
        c.adc.gain = std::stod(next_value(argc, argv, i));
      } else if (arg == "--offset") {
        c.adc.offset = std::stod(next_value(argc, argv, i));
      } else if (arg == "--int-bits") {
        c.charge.num_int_bits = std::stoi(next_value(argc, argv, i));
      } else if (arg == "--frac-bits") {
        c.charge.num_frac_bits = std::stoi(next_value(argc, argv, i));
      } else if (arg == "--cap-f") {
        c.charge.capacitance_f = std::stod(next_value(argc, argv, i));
      } else if (arg == "--temp-k") {
        c.charge.temperature_k = std::stod(next_value(argc, argv, i));
      } else if (arg == "--wl-alpha") {
        c.charge.wordline_alpha = std::stod(next_value(argc, argv, i));
      } else if (arg == "--bl-alpha") {
        c.charge.bitline_alpha = std::stod(next_value(argc, argv, i));
      } else if (arg == "--leak") {
        c.charge.leak_decay = std::stod(next_value(argc, argv, i));
      } else if (arg == "--x-g0") {
        c.xbar.g0 = std::stod(next_value(argc, argv, i));
      } else if (arg == "--x-dac-gain") {
        c.xbar.dac_gain = std::stod(next_value(argc, argv, i));
      } else if (arg == "--x-rf") {
        c.xbar.rf = std::stod(next_value(argc, argv, i));
      } else if (arg == "--x-adc-bits") {
        c.xbar.adc_bits = std::stoi(next_value(argc, argv, i));
      } else if (arg == "--x-adc-clip") {
        c.xbar.adc_clip = std::stod(next_value(argc, argv, i));
      } else if (arg == "--x-noise") {
        c.xbar.noise_sigma = std::stod(next_value(argc, argv, i));
      } else if (arg == "--x-wl-alpha") {
        c.xbar.wl_alpha = std::stod(next_value(argc, argv, i));
      } else if (arg == "--x-bl-alpha") {
        c.xbar.bl_alpha = std::stod(next_value(argc, argv, i));
      } else {
        error = "Unknown argument: " + arg;
        return false;
      }
    }
  } catch (const std::exception &e) {
    error = std::string("Bad argument value: ") + e.what();
    return false;
  }

  return true;
}

void draw_standard_normal(Rng &rng, Signal &x) {
  std::normal_distribution<double> dist(0.0, 1.0);
  for (double &v : x.data) {
    v = dist(rng);
  }
}

int main(int argc, char **argv) {
  SimArgs args;
  std::string error;

  if (!parse_args(argc, argv, args, error)) {
    std::cerr << "Error: " << error << "\n";
    print_usage(argv[0]);
    return 1;
  }
  if (args.help) {
    print_usage(argv[0]);
    return 0;
  }

  SimConfig &config = args.config;
  if (config.repeat == 0) {
    std::cerr << "Error: --repeat must be >= 1\n";
    return 1;
  }

  Signal loaded;
  bool from_file = !config.input_path.empty();
  if (from_file) {
    if (!load_signal_safetensors(config.input_path, config.tensor_name,
                                 loaded, error)) {
      std::cerr << "Error loading input: " << error << "\n";
      return 1;
    }
    if (loaded.n != config.size) {
      if (config.verbose) {
        std::cout << "Using size " << loaded.n << " from input tensor\n";
      }
      config.size = loaded.n;
    }
  }

  // One generator drives both the inputs and the engine's noise
  Rng rng(config.seed);

  std::unique_ptr<Engine> engine = create_engine(config, &rng, error);
  if (!engine) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  if (config.verbose) {
    std::cout << "Configuration:\n" << serialize_sim_config(config) << "\n\n";
  }

  Signal x = from_file ? loaded : Signal::vector(config.size);
  Signal y_ideal;
  Signal y_model;
  RunSummary summary;
  SignalStats input_stats;

  for (size_t run = 0; run < config.repeat; ++run) {
    if (!from_file) {
      draw_standard_normal(rng, x);
    }

    if (!fwht(x, y_ideal, error) || !engine->apply(x, y_model, error)) {
      std::cerr << "Error: " << error << "\n";
      return 1;
    }

    FidelityMetrics metrics;
    if (!compute_fidelity(y_ideal, y_model, metrics, error)) {
      std::cerr << "Error: " << error << "\n";
      return 1;
    }
    summary.add(metrics);

    if (run == 0) {
      input_stats.compute(x.data.data(), x.size());
    }

    if (config.verbose) {
      std::cout << "  run " << run << ": RMSE=" << metrics.rmse
                << " PSNR=" << metrics.psnr_db
                << " dB max_err=" << metrics.max_abs_error << "\n";
      if (config.engine == EngineType::CHARGE) {
        FixedPointFormat format;
        format.int_bits = config.charge.num_int_bits;
        format.frac_bits = config.charge.num_frac_bits;
        size_t saturated = count_saturated(x.data.data(), x.size(), format);
        if (saturated > 0) {
          std::cout << "  Warning: " << saturated
                    << " samples saturate the fixed-point range\n";
        }
      }
    }
  }

  std::printf("engine=%s N=%zu\n", engine->name(), config.size);
  std::printf("RMSE=%.6g PSNR=%.3f dB\n", summary.mean_rmse,
              summary.mean_psnr_db);

  if (!config.report_path.empty()) {
    if (!save_report(config.report_path, config, summary, input_stats, error)) {
      std::cerr << "Error: " << error << "\n";
      return 1;
    }
    if (config.verbose) {
      std::cout << "Report written to " << config.report_path << "\n";
    }
  }

  return 0;
}
