#pragma once

/**
 * CimHwt: Engine Interface
 *
 * Every hardware model reproduces the FWHT butterfly network and returns a
 * same-shaped approximation of the ideal transform.
 */

#include "types.hpp"
#include <memory>
#include <string>

namespace cimhwt {

class Engine {
public:
  virtual ~Engine() = default;

  /**
   * Transform x ([N] or [B, N]) into y with the engine's non-idealities.
   * Fails without touching state or randomness if x's width is not N.
   */
  virtual bool apply(const Signal &x, Signal &y, std::string &error) = 0;

  virtual const char *name() const = 0;

  size_t size() const { return n_; }
  Rng &rng() { return *rng_; }

protected:
  /**
   * rng may be null, in which case the engine owns a default-seeded one.
   * An injected generator is not owned and must outlive the engine.
   */
  Engine(size_t n, Rng *rng) : n_(n), rng_(rng) {
    if (!rng_) {
      owned_rng_ = std::make_unique<Rng>();
      rng_ = owned_rng_.get();
    }
  }

  size_t n_;

private:
  std::unique_ptr<Rng> owned_rng_;
  Rng *rng_;
};

inline bool validate_size(size_t n, std::string &error) {
  if (!is_power_of_two(n)) {
    error = "n must be a power of two and > 0 (got " + std::to_string(n) + ")";
    return false;
  }
  return true;
}

/**
 * Build the engine selected in config, sized to config.size.
 * Returns nullptr and fills error if the parameters are invalid.
 */
std::unique_ptr<Engine> create_engine(const SimConfig &config, Rng *rng,
                                      std::string &error);

} // namespace cimhwt
