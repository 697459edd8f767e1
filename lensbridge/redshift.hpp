#include <string>
#include <string_view>
#include <vector>
using namespace std::literals; // enables "sv" literal

// ARMADILLO LIB
#include <armadillo>

#include "lensbridge/enum_translator.hpp"

#ifndef __LENSBRIDGE_REDSHIFT_HPP
#define __LENSBRIDGE_REDSHIFT_HPP

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Source redshift distributions n(z), one per tomographic bin
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

enum class NofzType { ludo, jonben, ymmk, ymmk0const, hist, single };

inline constexpr Vocabulary<NofzType,6> nofz_vocabulary = {{
  {"ludo"sv,       NofzType::ludo},
  {"jonben"sv,     NofzType::jonben},
  {"ymmk"sv,       NofzType::ymmk},
  {"ymmk0const"sv, NofzType::ymmk0const},
  {"hist"sv,       NofzType::hist},
  {"single"sv,     NofzType::single}
}};

struct RedshiftDistribution
{
  int nzbins = 0;
  std::vector<NofzType> nofz;
  // Nnz(i) parameters of bin i, stored contiguously in par_nz (bin 0 first)
  arma::Col<int> Nnz;
  arma::Col<double> par_nz;
};

// nzbins, Nnz and par_nz must be consistent (caller contract, fatal when
// violated). Throws UnrecognizedOption on the first unknown type.
RedshiftDistribution parse_redshift_distributions(
    const int nzbins,
    const std::vector<std::string>& nofz,
    const arma::Col<int>& Nnz,
    const arma::Col<double>& par_nz
  );

// Parameters of bin i (a copy of its slice of par_nz)
arma::Col<double> get_bin_parameters(const RedshiftDistribution& dist, const int i);

}  // namespace lensbridge_interface
#endif // HEADER GUARD
