#include <string>
#include <string_view>
#include <vector>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

// boost library
#include <boost/algorithm/string.hpp>

#include "lensbridge/generic_interface.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;

using spdlog::debug;

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// INIT FUNCTIONS
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

void initial_setup()
{
  static constexpr std::string_view fname = "initial_setup"sv;
  spdlog::cfg::load_env_levels();
  debug("{}: {}", fname, errbegins);
  debug("{}: {}", fname, errends);
  return;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// COMPUTE FUNCTIONS
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

arma::Mat<double> shear_power_spectrum_cpp(
    LensingKernel& kernel,
    const double Omega_m,
    const double Omega_de,
    const double w0,
    const double w1,
    const double h100,
    const double Omega_b,
    const double Omega_nu_mass,
    const double Neff_nu_mass,
    const double sigma_8,
    const double n_s,
    const int nzbins,
    const arma::Col<double>& ell,
    const arma::Col<int>& Nnz,
    const std::vector<std::string>& nofz,
    const arma::Col<double>& par_nz,
    const SettingsMap& settings
  )
{
  static constexpr std::string_view fname = "shear_power_spectrum_cpp"sv;
  debug("{}: {}", fname, errbegins);
  const CosmologicalParameters cosmology = {
    Omega_m, Omega_de, w0, w1, h100, Omega_b, 
    Omega_nu_mass, Neff_nu_mass, sigma_8, n_s
  };
  const RedshiftDistribution redshift = 
    parse_redshift_distributions(nzbins, nofz, Nnz, par_nz);
  const Settings resolved = resolve_settings(settings);
  arma::Mat<double> result = 
    shear_power_spectrum(kernel, cosmology, redshift, resolved, ell);
  debug("{}: {}", fname, errends);
  return result;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

std::vector<RedshiftPair> redshift_pairs_cpp(const int nzbins, std::string stomo)
{
  boost::trim_if(stomo, boost::is_any_of("\t "));
  return redshift_pairs(nzbins, resolve_tomography(stomo));
}

} // end namespace lensbridge_interface
