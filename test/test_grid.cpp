#include <iostream>
#include <limits>
#include <vector>

#include <armadillo>

#include "lensbridge/grid.hpp"

using namespace lensbridge_interface;

static double total(const std::vector<float>& grid)
{
  double sum = 0.0;
  for (const float g : grid) sum += g;
  return sum;
}

static bool report(const bool passed)
{
  std::cout << "  Result: " << (passed ? "PASS" : "FAIL") << std::endl;
  return passed;
}

// ============================================================================
// Test 1: a particle at the origin lands in cell (0,0,0)
// ============================================================================
bool test_origin()
{
  std::cout << "\n=== Test 1: Particle at the grid origin ===" << std::endl;
  const int nx = 4, ny = 3, nz = 2;
  std::vector<float> grid(nx*ny*nz, 0.0f);
  const std::vector<float> positions = {-1.0f, 2.0f, 5.0f};
  grid3d(positions.data(), 1, -1.0, 2.0, 5.0, 1.0, 1.0, 1.0, nx, ny, nz, grid.data());
  bool passed = (grid[0] == 1.0f);
  passed &= (total(grid) == 1.0);
  return report(passed);
}

// ============================================================================
// Test 2: cell addressing i*ny*nz + j*nz + k, counts accumulate
// ============================================================================
bool test_addressing()
{
  std::cout << "\n=== Test 2: Cell addressing ===" << std::endl;
  const int nx = 4, ny = 3, nz = 5;
  std::vector<float> grid(nx*ny*nz, 0.0f);
  grid[0] = 2.0f; // pre-existing counts are kept
  const std::vector<float> positions = {
    2.5f, 1.25f, 4.75f,   // (i,j,k) = (2,1,4) with size 1.0
    2.9f, 1.01f, 4.10f,   // same cell
    0.0f, 0.0f,  0.0f     // (0,0,0)
  };
  grid3d(positions.data(), 3, 0.0, 0.0, 0.0, 1.0, 1.0, 1.0, nx, ny, nz, grid.data());
  bool passed = (grid[2*ny*nz + 1*nz + 4] == 2.0f);
  passed &= (grid[0] == 3.0f);
  passed &= (total(grid) == 5.0);
  return report(passed);
}

// ============================================================================
// Test 3: particles off the grid are dropped; truncation toward zero
// ============================================================================
bool test_out_of_bounds()
{
  std::cout << "\n=== Test 3: Out of bounds particles ===" << std::endl;
  const int nx = 2, ny = 2, nz = 2;
  std::vector<float> grid(nx*ny*nz, 0.0f);
  const std::vector<float> positions = {
    -1.5f,  0.5f,  0.5f,  // i = -1
     0.5f,  2.0f,  0.5f,  // j = ny
     0.5f,  0.5f, 99.0f,  // k >> nz
    -3.0f, -3.0f, -3.0f
  };
  grid3d(positions.data(), 4, 0.0, 0.0, 0.0, 1.0, 1.0, 1.0, nx, ny, nz, grid.data());
  bool passed = (total(grid) == 0.0);

  // (-0.5)/1.0 truncates to 0: the particle is kept in the first cell
  const std::vector<float> edge = {-0.5f, 0.5f, 0.5f};
  grid3d(edge.data(), 1, 0.0, 0.0, 0.0, 1.0, 1.0, 1.0, nx, ny, nz, grid.data());
  passed &= (grid[0*ny*nz + 0*nz + 0] == 1.0f);
  passed &= (total(grid) == 1.0);
  return report(passed);
}

// ============================================================================
// Test 4: far away and non-finite coordinates are dropped
// ============================================================================
bool test_far_and_non_finite()
{
  std::cout << "\n=== Test 4: Far away and non-finite particles ===" << std::endl;
  const int nx = 2, ny = 2, nz = 2;
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const float inf = std::numeric_limits<float>::infinity();
  std::vector<float> grid(nx*ny*nz, 0.0f);
  const std::vector<float> positions = {
     1e20f,  0.5f,  0.5f,
     0.5f, -1e20f,  0.5f,
     0.5f,  0.5f,   3e9f,
     nan,   0.5f,   0.5f,
     0.5f,  nan,    0.5f,
     0.5f,  0.5f,   inf,
    -inf,   0.5f,   0.5f
  };
  grid3d(positions.data(), 7, 0.0, 0.0, 0.0, 1.0, 1.0, 1.0, nx, ny, nz, grid.data());
  bool passed = (total(grid) == 0.0);

  // zero cell size: every quotient is +-inf or NaN
  const std::vector<float> inside = {0.5f, 0.5f, 0.5f, 0.0f, 0.0f, 0.0f};
  grid3d(inside.data(), 2, 0.0, 0.0, 0.0, 0.0, 1.0, 1.0, nx, ny, nz, grid.data());
  passed &= (total(grid) == 0.0);

  // one good particle among far away ones is still counted
  const std::vector<float> mixed = {1e20f, 1e20f, 1e20f, 1.5f, 0.5f, 1.5f};
  grid3d(mixed.data(), 2, 0.0, 0.0, 0.0, 1.0, 1.0, 1.0, nx, ny, nz, grid.data());
  passed &= (grid[1*ny*nz + 0*nz + 1] == 1.0f);
  passed &= (total(grid) == 1.0);
  return report(passed);
}

// ============================================================================
// Test 5: every in-bounds particle is counted once
// ============================================================================
bool test_particle_count()
{
  std::cout << "\n=== Test 5: Particle count conservation ===" << std::endl;
  const int nx = 8, ny = 8, nz = 8;
  const double left = -4.0, size = 0.5;
  arma::arma_rng::set_seed(42);
  arma::Mat<float> positions(3, 1000, arma::fill::randu);
  positions = positions*static_cast<float>(nx*size*0.999) + static_cast<float>(left);
  std::vector<float> grid(nx*ny*nz, 0.0f);
  grid3d(positions.memptr(), 1000, left, left, left, size, size, size, 
         nx, ny, nz, grid.data());
  bool passed = (total(grid) == 1000.0);

  // armadillo view: grid(k,j,i)
  arma::Cube<float> cube(nz, ny, nx, arma::fill::zeros);
  const arma::Col<double>::fixed<3> origin = {left, left, left};
  const arma::Col<double>::fixed<3> cell = {size, size, size};
  grid3d(positions, origin, cell, cube);
  passed &= (arma::accu(cube) == 1000.0f);
  for (int n=0; n<nx*ny*nz; n++) {
    passed &= (cube(n) == grid[n]);
  }
  return report(passed);
}

int main()
{
  std::cout << "Running grid deposition tests..." << std::endl;
  bool all_passed = true;
  all_passed &= test_origin();
  all_passed &= test_addressing();
  all_passed &= test_out_of_bounds();
  all_passed &= test_far_and_non_finite();
  all_passed &= test_particle_count();

  std::cout << "\n=== Summary ===" << std::endl;
  if (all_passed) {
    std::cout << "All tests PASSED!" << std::endl;
    return 0;
  }
  std::cout << "Some tests FAILED!" << std::endl;
  return 1;
}
