/**
 * CimHwt: Signal Loader Implementation
 *
 * Wraps the safetensors-cpp library for signal extraction.
 */

#define SAFETENSORS_CPP_IMPLEMENTATION
#include "safetensors.hh"

#include "cimhwt/signal_io.hpp"
#include <cstring>
#include <iostream>

namespace cimhwt {

namespace {

bool open_safetensors(const std::string &path, safetensors::safetensors_t &st,
                      std::string &error) {
  std::string warn;
  if (!safetensors::mmap_from_file(path, &st, &warn, &error)) {
    if (error.empty())
      error = "Failed to read safetensors file: " + path;
    return false;
  }
  if (!warn.empty()) {
    std::cerr << "Warning: " << warn << "\n";
  }
  return true;
}

const uint8_t *data_buffer(const safetensors::safetensors_t &st) {
  return st.mmaped ? st.databuffer_addr : st.storage.data();
}

} // namespace

bool list_safetensors(const std::string &path, std::vector<std::string> &names,
                      std::string &error) {
  safetensors::safetensors_t st;
  if (!open_safetensors(path, st, error))
    return false;

  names.clear();
  for (const auto &name : st.tensors.keys()) {
    names.push_back(name);
  }
  return true;
}

bool load_signal_safetensors(const std::string &path,
                             const std::string &tensor_name, Signal &signal,
                             std::string &error) {
  safetensors::safetensors_t st;
  if (!open_safetensors(path, st, error))
    return false;

  std::vector<std::string> keys = st.tensors.keys();
  if (keys.empty()) {
    error = "No tensors in " + path;
    return false;
  }

  std::string name = tensor_name.empty() ? keys.front() : tensor_name;
  safetensors::tensor_t tensor;
  if (!st.tensors.at(name, &tensor)) {
    error = "Failed to get tensor: " + name;
    return false;
  }

  if (tensor.shape.size() == 1) {
    signal = Signal::vector(tensor.shape[0]);
  } else if (tensor.shape.size() == 2) {
    signal = Signal::matrix(tensor.shape[0], tensor.shape[1]);
  } else {
    error = "Tensor " + name + " has rank " +
            std::to_string(tensor.shape.size()) + ", expected 1 or 2";
    return false;
  }

  const size_t num_elements = signal.size();
  const uint8_t *data_ptr = data_buffer(st) + tensor.data_offsets[0];
  const size_t data_size = tensor.data_offsets[1] - tensor.data_offsets[0];

  size_t elem_bytes = 0;
  switch (tensor.dtype) {
  case safetensors::kFLOAT64:
    elem_bytes = 8;
    break;
  case safetensors::kFLOAT32:
    elem_bytes = 4;
    break;
  case safetensors::kFLOAT16:
  case safetensors::kBFLOAT16:
    elem_bytes = 2;
    break;
  default:
    error = "Unsupported dtype for tensor: " + name;
    return false;
  }
  if (data_size != num_elements * elem_bytes) {
    error = "Tensor " + name + " data size does not match its shape";
    return false;
  }

  double *out = signal.data.data();
  switch (tensor.dtype) {
  case safetensors::kFLOAT64: {
    std::memcpy(out, data_ptr, num_elements * sizeof(double));
    break;
  }
  case safetensors::kFLOAT32: {
    for (size_t i = 0; i < num_elements; ++i) {
      float v;
      std::memcpy(&v, data_ptr + i * sizeof(float), sizeof(float));
      out[i] = v;
    }
    break;
  }
  case safetensors::kFLOAT16: {
    for (size_t i = 0; i < num_elements; ++i) {
      uint16_t h;
      std::memcpy(&h, data_ptr + i * sizeof(uint16_t), sizeof(uint16_t));
      out[i] = safetensors::fp16_to_float(h);
    }
    break;
  }
  case safetensors::kBFLOAT16: {
    for (size_t i = 0; i < num_elements; ++i) {
      uint16_t h;
      std::memcpy(&h, data_ptr + i * sizeof(uint16_t), sizeof(uint16_t));
      out[i] = safetensors::bfloat16_to_float(h);
    }
    break;
  }
  default:
    break;
  }

  return true;
}

} // namespace cimhwt
