#include <string>
#include <string_view>
#include <vector>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// ARMADILLO LIB
#include <armadillo>

#include "lensbridge/errors.hpp"
#include "lensbridge/model_builder.hpp"
#include "lensbridge/shear_power_spectrum.hpp"
#include "lensbridge/tomography.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;

using spdlog::debug;

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

arma::Mat<double> compute_shear_power_spectrum(
    const ScopedModel& model,
    const arma::Col<double>& ell,
    const int nzbins,
    const TomoType tomo
  )
{
  static constexpr std::string_view fname = "compute_shear_power_spectrum"sv;
  debug("{}: {}", fname, errbegins);
  const int Nl = static_cast<int>(ell.n_elem);
  arma::Mat<double> power_spectrum = alloc_output(Nl, nzbins, tomo);
  const std::vector<RedshiftPair> pairs = redshift_pairs(nzbins, tomo);
  const int Nz = static_cast<int>(pairs.size());
  
  LensingKernel& kernel = model.kernel();
  for (int l=0; l<Nl; l++) {
    for (int b=0; b<Nz; b++) {
      const int i = pairs[b].first;
      const int j = pairs[b].second;
      try {
        power_spectrum(l,b) = kernel.shear_power(model.get(), ell(l), i, j);
      }
      catch (const KernelError& e) {
        spdlog::error("{}: kernel error at ell = {} (z1 = {}, z2 = {})", 
          fname, ell(l), i, j);
        throw KernelComputationFailed(std::string(e.what()));
      }
    }
  }
  debug("{}: {}", fname, errends);
  return power_spectrum;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

arma::Mat<double> shear_power_spectrum(
    LensingKernel& kernel,
    const CosmologicalParameters& cosmology,
    const RedshiftDistribution& redshift,
    const Settings& settings,
    const arma::Col<double>& ell
  )
{
  static constexpr std::string_view fname = "shear_power_spectrum"sv;
  debug("{}: {}", fname, errbegins);
  // sizing first: nothing is built when there is nothing to compute
  alloc_output(0, redshift.nzbins, settings.tomo);
  ScopedModel model = build_model(kernel, cosmology, redshift, settings);
  arma::Mat<double> result = 
    compute_shear_power_spectrum(model, ell, redshift.nzbins, settings.tomo);
  debug("{}: {}", fname, errends);
  return result;
}

} // end namespace lensbridge_interface
