#include <utility>
#include <vector>

// ARMADILLO LIB
#include <armadillo>

#include "lensbridge/settings.hpp"

#ifndef __LENSBRIDGE_TOMOGRAPHY_HPP
#define __LENSBRIDGE_TOMOGRAPHY_HPP

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Redshift-bin pairs computed for each tomography mode. Column b of the
// output holds pair redshift_pairs(...)[b].
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

using RedshiftPair = std::pair<int,int>;

// tomo_auto_only:  (0,0),(1,1),...
// tomo_cross_only: (0,1),(0,2),...,(1,2),...  (i<j)
// tomo_all:        (0,0),(0,1),...,(1,1),...  (i<=j)
std::vector<RedshiftPair> redshift_pairs(const int Nbins, const TomoType tomo);

int count_redshift_pairs(const int Nbins, const TomoType tomo);

// Column of the (i,j) pair, -1 if the pair is not computed in this mode
int pair_index(const int Nbins, const TomoType tomo, const int i, const int j);

// Zero filled (Nl x Nz) output. Throws EmptyComputation when there is no
// pair to compute (tomo_cross_only with one bin).
arma::Mat<double> alloc_output(const int Nl, const int Nbins, const TomoType tomo);

}  // namespace lensbridge_interface
#endif // HEADER GUARD
