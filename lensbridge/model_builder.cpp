#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

#include "lensbridge/model_builder.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;

using spdlog::debug;

namespace lensbridge_interface
{

ScopedModel build_model(
    LensingKernel& kernel,
    const CosmologicalParameters& cosmology,
    const RedshiftDistribution& redshift,
    const Settings& settings
  )
{
  static constexpr std::string_view fname = "build_model"sv;
  debug("{}: {}", fname, errbegins);
  debug("{}: Omega_m = {}, Omega_de = {}, w0 = {}, w1 = {}, h = {}", fname,
    cosmology.Omega_m, cosmology.Omega_de, cosmology.w0, cosmology.w1, 
    cosmology.h100);
  debug("{}: Omega_b = {}, Omega_nu = {}, Neff = {}, sigma_8 = {}, n_s = {}", 
    fname, cosmology.Omega_b, cosmology.Omega_nu_mass, cosmology.Neff_nu_mass, 
    cosmology.sigma_8, cosmology.n_s);
  debug("{}: {}", fname, describe(settings));

  ModelSpecification spec;
  spec.cosmology = cosmology;
  spec.redshift = redshift;
  spec.settings = settings;

  LensingKernel::model_ptr model = nullptr;
  try {
    model = kernel.create_model(spec);
  }
  catch (const KernelError& e) {
    throw ModelConstructionFailed(e.what());
  }
  if (nullptr == model) {
    throw ModelConstructionFailed("lensing kernel returned no model");
  }
  debug("{}: {}", fname, errends);
  return ScopedModel(kernel, model);
}

} // end namespace lensbridge_interface
