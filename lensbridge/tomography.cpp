#include <cstdlib>
#include <string_view>
#include <vector>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// ARMADILLO LIB
#include <armadillo>

#include "lensbridge/errors.hpp"
#include "lensbridge/tomography.hpp"

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

std::vector<RedshiftPair> redshift_pairs(const int Nbins, const TomoType tomo)
{
  static constexpr std::string_view fname = "redshift_pairs"sv;
  if (!(Nbins > 0)) [[unlikely]] {
    critical(errorns2, fname, "Nbins", Nbins);
    exit(1);
  }
  std::vector<RedshiftPair> pairs;
  switch (tomo) {
    case TomoType::tomo_auto_only:
      pairs.reserve(Nbins);
      for (int i=0; i<Nbins; i++) {
        pairs.emplace_back(i, i);
      }
      break;
    case TomoType::tomo_cross_only:
      pairs.reserve(Nbins*(Nbins - 1)/2);
      for (int i=0; i<Nbins; i++) {
        for (int j=i+1; j<Nbins; j++) {
          pairs.emplace_back(i, j);
        }
      }
      break;
    case TomoType::tomo_all:
      pairs.reserve(Nbins*(Nbins + 1)/2);
      for (int i=0; i<Nbins; i++) {
        for (int j=i; j<Nbins; j++) {
          pairs.emplace_back(i, j);
        }
      }
      break;
  }
  return pairs;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

int count_redshift_pairs(const int Nbins, const TomoType tomo)
{
  return static_cast<int>(redshift_pairs(Nbins, tomo).size());
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

int pair_index(const int Nbins, const TomoType tomo, const int i, const int j)
{
  const std::vector<RedshiftPair> pairs = redshift_pairs(Nbins, tomo);
  for (int b=0; b<static_cast<int>(pairs.size()); b++) {
    if (pairs[b].first == i && pairs[b].second == j) {
      return b;
    }
  }
  return -1;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

arma::Mat<double> alloc_output(const int Nl, const int Nbins, const TomoType tomo)
{
  static constexpr std::string_view fname = "alloc_output"sv;
  const int Nz = count_redshift_pairs(Nbins, tomo);
  if (0 == Nz) {
    throw EmptyComputation("There is nothing to compute, you selected "
      "tomo_cross_only with only one redshift bin!!");
  }
  debug("{}: output size = ({},{})", fname, Nl, Nz);
  return arma::Mat<double>(Nl, Nz, arma::fill::zeros);
}

} // end namespace lensbridge_interface
