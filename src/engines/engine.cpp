#include "cimhwt/engine.hpp"
#include "cimhwt/charge_engine.hpp"
#include "cimhwt/cim_array.hpp"
#include "cimhwt/xbar_engine.hpp"

namespace cimhwt {

std::unique_ptr<Engine> create_engine(const SimConfig &config, Rng *rng,
                                      std::string &error) {
  switch (config.engine) {
  case EngineType::ADC: {
    CimArrayConfig adc = config.adc;
    adc.n = config.size;
    return CimArray::create(adc, rng, error);
  }
  case EngineType::CHARGE: {
    ChargeEngineConfig charge = config.charge;
    charge.n = config.size;
    return ChargeCimHadamard::create(charge, rng, error);
  }
  case EngineType::XBAR: {
    XbarConfig xbar = config.xbar;
    xbar.n = config.size;
    return XbarHadamard::create(xbar, rng, error);
  }
  }
  error = "Unknown engine type";
  return nullptr;
}

} // namespace cimhwt
