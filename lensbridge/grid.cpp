#include <cstdlib>
#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// ARMADILLO LIB
#include <armadillo>

#include "lensbridge/grid.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;
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
  )
{
  static constexpr std::string_view fname = "grid3d"sv;
  debug("{}: {}", fname, errbegins);
  if (Npart < 0) [[unlikely]] {
    critical(errorns2, fname, "Npart", Npart);
    exit(1);
  }
  if (nx < 0 || ny < 0 || nz < 0) [[unlikely]] {
    critical("{}: grid size ({},{},{}) not supported", fname, nx, ny, nz);
    exit(1);
  }

  int ndropped = 0;
  for (int n=0; n<Npart; n++) {
    const double qx = (positions[3*n] - leftX)/sizeX;
    const double qy = (positions[3*n + 1] - leftY)/sizeY;
    const double qz = (positions[3*n + 2] - leftZ)/sizeZ;

    // range check before the cast (NaN fails it). Truncation toward zero:
    // (-1,0) lands in cell 0
    if (qx > -1.0 && qx < nx && qy > -1.0 && qy < ny && qz > -1.0 && qz < nz) {
      const int i = static_cast<int>(qx);
      const int j = static_cast<int>(qy);
      const int k = static_cast<int>(qz);
      grid[i*ny*nz + j*nz + k] += 1.0;
    }
    else {
      ndropped++;
    }
  }
  debug("{}: {} of {} particles off the grid", fname, ndropped, Npart);
  debug("{}: {}", fname, errends);
  return 0;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

int grid3d(
    const arma::Mat<float>& positions, 
    const arma::Col<double>::fixed<3>& left, 
    const arma::Col<double>::fixed<3>& size, 
    arma::Cube<float>& grid
  )
{
  static constexpr std::string_view fname = "grid3d"sv;
  if (positions.n_elem > 0 && positions.n_rows != 3) [[unlikely]] {
    critical(errorns2, fname, "positions.n_rows", positions.n_rows);
    exit(1);
  }
  return grid3d(
      positions.memptr(), 
      static_cast<int>(positions.n_cols),
      left(0), left(1), left(2), 
      size(0), size(1), size(2),
      static_cast<int>(grid.n_slices), 
      static_cast<int>(grid.n_cols), 
      static_cast<int>(grid.n_rows),
      grid.memptr()
    );
}

} // end namespace lensbridge_interface
