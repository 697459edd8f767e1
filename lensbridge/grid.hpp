// ARMADILLO LIB
#include <armadillo>

#ifndef __LENSBRIDGE_GRID_HPP
#define __LENSBRIDGE_GRID_HPP

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Snap particles on a 3D regularly spaced grid
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

// positions: x0,y0,z0,x1,y1,z1,... (3*Npart). grid: nx*ny*nz cells, cell
// (i,j,k) at i*ny*nz + j*nz + k. Cell indices are (x - left)/size truncated
// toward zero; particles off the grid are dropped. Counts are added to grid.
int grid3d(
    const float* positions, 
    const int Npart, 
    const double leftX, 
    const double leftY, 
    const double leftZ, 
    const double sizeX, 
    const double sizeY, 
    const double sizeZ, 
    const int nx, 
    const int ny, 
    const int nz, 
    float* grid
  );

// positions: 3 x Npart. grid: nz x ny x nx, i.e. grid(k,j,i) is cell (i,j,k)
int grid3d(
    const arma::Mat<float>& positions, 
    const arma::Col<double>::fixed<3>& left, 
    const arma::Col<double>::fixed<3>& size, 
    arma::Cube<float>& grid
  );

}  // namespace lensbridge_interface
#endif // HEADER GUARD
