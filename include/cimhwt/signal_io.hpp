#pragma once

/**
 * CimHwt: Signal Loader
 *
 * Reads recorded tensors from .safetensors files (via safetensors-cpp) so
 * real activations can be pushed through the engines.
 */

#include "types.hpp"
#include <string>
#include <vector>

namespace cimhwt {

/**
 * Load a rank-1 ([N]) or rank-2 ([B, N]) tensor as a Signal.
 *
 * tensor_name selects the tensor; empty picks the first one in the file.
 * float32, float16, bfloat16 and float64 are converted to double.
 */
bool load_signal_safetensors(const std::string &path,
                             const std::string &tensor_name, Signal &signal,
                             std::string &error);

/**
 * Names of all tensors in a .safetensors file, in file order.
 */
bool list_safetensors(const std::string &path, std::vector<std::string> &names,
                      std::string &error);

} // namespace cimhwt
