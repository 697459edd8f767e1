#include <string>
#include <vector>

// ARMADILLO LIB
#include <armadillo>

#include "lensbridge/errors.hpp"
#include "lensbridge/grid.hpp"
#include "lensbridge/kernel.hpp"
#include "lensbridge/redshift.hpp"
#include "lensbridge/settings.hpp"
#include "lensbridge/shear_power_spectrum.hpp"
#include "lensbridge/tomography.hpp"

#ifndef __LENSBRIDGE_GENERIC_INTERFACE_HPP
#define __LENSBRIDGE_GENERIC_INTERFACE_HPP

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Global Functions
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

// log levels from the SPDLOG_LEVEL environment variable
void initial_setup();

// Entry point of the high level toolkit: n(z) and settings are parsed and
// validated before the kernel model is built. Returns the (Nl x Nz) spectra.
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
  );

std::vector<RedshiftPair> redshift_pairs_cpp(const int nzbins, std::string stomo);

}  // namespace lensbridge_interface
#endif // HEADER GUARD
