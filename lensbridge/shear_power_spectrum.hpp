// ARMADILLO LIB
#include <armadillo>

#include "lensbridge/kernel.hpp"
#include "lensbridge/redshift.hpp"
#include "lensbridge/settings.hpp"

#ifndef __LENSBRIDGE_SHEAR_POWER_SPECTRUM_HPP
#define __LENSBRIDGE_SHEAR_POWER_SPECTRUM_HPP

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Tomographic shear power spectrum: output(l, b) = P(ell(l), pair b), with
// the pairs ordered as in redshift_pairs(nzbins, tomo).
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

// All or nothing: the first kernel error throws KernelComputationFailed and
// no partial output is returned.
arma::Mat<double> compute_shear_power_spectrum(
    const ScopedModel& model,
    const arma::Col<double>& ell,
    const int nzbins,
    const TomoType tomo
  );

// Builds the model, runs the loop over (ell, pairs), releases the model
arma::Mat<double> shear_power_spectrum(
    LensingKernel& kernel,
    const CosmologicalParameters& cosmology,
    const RedshiftDistribution& redshift,
    const Settings& settings,
    const arma::Col<double>& ell
  );

}  // namespace lensbridge_interface
#endif // HEADER GUARD
