#include <string>
#include <string_view>
#include <vector>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// NICAEA
extern "C" {
#include "errorlist.h"
#include "cosmo.h"
#include "lensing.h"
#include "nofz.h"
}

#include "lensbridge/nicaea_kernel.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;

using spdlog::debug;

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// AUX FUNCTIONS (PRIVATE)
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

namespace
{
// indexed by the lensbridge enumerators (same order as the vocabularies)
constexpr nofz_t nicaea_nofz[] = {ludo, jonben, ymmk, ymmk0const, hist, single};

constexpr nonlinear_t nicaea_nonlinear[] = {linear, pd96, smith03, smith03_de, 
  coyote10, coyote13, halodm, smith03_revised};

constexpr transfer_t nicaea_transfer[] = {bbks, eisenhu, eisenhu_osc, be84};

constexpr growth_t nicaea_growth[] = {heath, growth_de};

constexpr de_param_t nicaea_de_param[] = {jassal, linder, earlyDE, poly_DE};

constexpr norm_t nicaea_norm[] = {norm_s8, norm_as};

constexpr tomo_t nicaea_tomo[] = {tomo_all, tomo_auto_only, tomo_cross_only};

constexpr reduced_t nicaea_reduced[] = {reduced_none, reduced_K10};

template <typename E>
constexpr int idx(const E value)
{
  return static_cast<int>(value);
}

std::string error_to_string(error* err)
{
  char stringerr[4096];
  stringError(stringerr, err);
  return std::string(stringerr);
}

} // namespace

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

LensingKernel::model_ptr NicaeaKernel::create_model(const ModelSpecification& spec)
{
  static constexpr std::string_view fname = "NicaeaKernel::create_model"sv;
  debug("{}: {}", fname, errbegins);
  const CosmologicalParameters& c = spec.cosmology;
  const RedshiftDistribution& z = spec.redshift;
  const Settings& s = spec.settings;

  // NICAEA argument layout: int counts, nofz_t tags, mutable parameters
  std::vector<int> Nnz(z.Nnz.begin(), z.Nnz.end());
  std::vector<nofz_t> nofz;
  nofz.reserve(z.nofz.size());
  for (const NofzType t : z.nofz) {
    nofz.push_back(nicaea_nofz[idx(t)]);
  }
  std::vector<double> par_nz(z.par_nz.begin(), z.par_nz.end());

  error* myerr = NULL;
  error** err = &myerr;
  cosmo_lens* model = init_parameters_lens(
      c.Omega_m, c.Omega_de, c.w0, c.w1, NULL, 0, 
      c.h100, c.Omega_b, c.Omega_nu_mass, c.Neff_nu_mass, c.sigma_8, c.n_s,
      z.nzbins, Nnz.data(), nofz.data(), par_nz.data(),
      nicaea_nonlinear[idx(s.nonlinear)],
      nicaea_transfer[idx(s.transfer)],
      nicaea_growth[idx(s.growth)],
      nicaea_de_param[idx(s.de_param)],
      nicaea_norm[idx(s.norm)],
      nicaea_tomo[idx(s.tomo)],
      nicaea_reduced[idx(s.reduced)],
      s.q_mag_size,
      ia_none, ia_undef, spec.A_ia,
      err
    );
  if (isError(*err)) {
    const std::string msg = error_to_string(*err);
    purgeError(err);
    if (model != NULL) {
      free_parameters_lens(&model);
    }
    throw KernelError(msg);
  }
  debug("{}: {}", fname, errends);
  return static_cast<model_ptr>(model);
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

void NicaeaKernel::destroy_model(model_ptr model) noexcept
{
  cosmo_lens* self = static_cast<cosmo_lens*>(model);
  free_parameters_lens(&self);
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

double NicaeaKernel::shear_power(
    model_ptr model, 
    const double ell, 
    const int i, 
    const int j
  )
{
  error* myerr = NULL;
  error** err = &myerr;
  const double res = Pshear(static_cast<cosmo_lens*>(model), ell, i, j, err);
  if (isError(*err)) {
    const std::string msg = error_to_string(*err);
    purgeError(err);
    throw KernelError(msg);
  }
  return res;
}

} // end namespace lensbridge_interface
