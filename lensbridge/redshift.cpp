#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// ARMADILLO LIB
#include <armadillo>

#include "lensbridge/redshift.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;
static constexpr std::string_view errorsz1d = "{}: {} {} (!= {})"sv;
static constexpr std::string_view errorns2 = "{}: {} = {} not supported"sv;

using spdlog::debug;
using spdlog::critical;

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

RedshiftDistribution parse_redshift_distributions(
    const int nzbins,
    const std::vector<std::string>& nofz,
    const arma::Col<int>& Nnz,
    const arma::Col<double>& par_nz
  )
{
  static constexpr std::string_view fname = "parse_redshift_distributions"sv;
  debug("{}: {}", fname, errbegins);
  if (!(nzbins > 0)) [[unlikely]] {
    critical(errorns2, fname, "nzbins", nzbins);
    exit(1);
  }
  if (static_cast<int>(Nnz.n_elem) != nzbins) [[unlikely]] {
    critical(errorsz1d, fname, "Nnz size =", Nnz.n_elem, nzbins);
    exit(1);
  }
  if (static_cast<int>(nofz.size()) != nzbins) [[unlikely]] {
    critical(errorsz1d, fname, "nofz size =", nofz.size(), nzbins);
    exit(1);
  }
  if (Nnz.min() < 0) [[unlikely]] {
    critical("{}: negative parameter count in Nnz", fname);
    exit(1);
  }
  const arma::uword npar = static_cast<arma::uword>(arma::accu(Nnz));
  if (npar != par_nz.n_elem) [[unlikely]] {
    critical(errorsz1d, fname, "par_nz size =", par_nz.n_elem, npar);
    exit(1);
  }

  RedshiftDistribution result;
  result.nzbins = nzbins;
  result.nofz.reserve(nzbins);
  for (int i=0; i<nzbins; i++) {
    result.nofz.push_back(translate_or_throw(nofz_vocabulary, nofz[i]));
    debug("{}: bin {} n(z) type = {} ({} parameters)", fname, i, nofz[i], Nnz(i));
  }
  result.Nnz = Nnz;
  result.par_nz = par_nz;
  debug("{}: {}", fname, errends);
  return result;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

arma::Col<double> get_bin_parameters(const RedshiftDistribution& dist, const int i)
{
  static constexpr std::string_view fname = "get_bin_parameters"sv;
  if (i < 0 || i >= dist.nzbins) [[unlikely]] {
    critical("{}: idx i={} not valid (min={},max={})", fname, i, 0, dist.nzbins);
    exit(1);
  }
  if (0 == dist.Nnz(i)) {
    return arma::Col<double>();
  }
  const arma::uword start = (0 == i) ? 0 : 
    static_cast<arma::uword>(arma::accu(dist.Nnz.head(i)));
  return dist.par_nz.subvec(start, start + dist.Nnz(i) - 1);
}

} // end namespace lensbridge_interface
