#include <string>
#include <string_view>
#include <vector>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// ARMADILLO LIB AND PYBIND WRAPPER (CARMA)
#include <carma.h>
#include <armadillo>

// Python Binding
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <pybind11/pytypes.h>
namespace py = pybind11;

#include "lensbridge/generic_interface.hpp"
#ifdef LENSBRIDGE_HAVE_NICAEA
#include "lensbridge/nicaea_kernel.hpp"
#endif

using namespace lensbridge_interface;

using farray = py::array_t<float, py::array::c_style | py::array::forcecast>;
using darray = py::array_t<double>;
using iarray = py::array_t<int, py::array::c_style | py::array::forcecast>;

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// AUX FUNCTIONS (PRIVATE)
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

namespace
{

#ifdef LENSBRIDGE_HAVE_NICAEA
py::array_t<double> shear_power_spectrum_py(
    const double Om, const double Ode, const double w0, const double w1, 
    const double H100, const double Omegab, const double Omeganu, 
    const double Neff, const double si8, const double ns, 
    const int nzbins, 
    darray ell, 
    iarray Nnz, 
    std::vector<std::string> nofz, 
    darray par_nz, 
    SettingsMap settings, 
    py::object /* extra: reserved */
  )
{
  const arma::Col<int> Nnz_col(Nnz.data(), static_cast<arma::uword>(Nnz.size()));
  const arma::Mat<double> power_spectrum = shear_power_spectrum_cpp(
      NicaeaKernel::get_instance(), 
      Om, Ode, w0, w1, H100, Omegab, Omeganu, Neff, si8, ns, nzbins, 
      carma::arr_to_col(ell), 
      Nnz_col, 
      nofz, 
      carma::arr_to_col(par_nz), 
      settings
    );
  return carma::mat_to_arr(power_spectrum);
}
#endif

int grid3d_py(
    farray positions, 
    const double leftX, const double leftY, const double leftZ,
    const double sizeX, const double sizeY, const double sizeZ,
    py::array_t<float, py::array::c_style> grid
  )
{
  static constexpr std::string_view fname = "grid3d"sv;
  if (positions.ndim() != 2 || positions.shape(1) != 3) [[unlikely]] {
    spdlog::critical("{}: positions must have shape (Npart,3)", fname);
    exit(1);
  }
  if (grid.ndim() != 3) [[unlikely]] {
    spdlog::critical("{}: grid must have 3 dimensions", fname);
    exit(1);
  }
  return grid3d(
      positions.data(), 
      static_cast<int>(positions.shape(0)), 
      leftX, leftY, leftZ, 
      sizeX, sizeY, sizeZ,
      static_cast<int>(grid.shape(0)), 
      static_cast<int>(grid.shape(1)), 
      static_cast<int>(grid.shape(2)),
      grid.mutable_data()
    );
}

} // namespace

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

PYBIND11_MODULE(_lensbridge, m)
{
  m.doc() = "Weak lensing power spectra (NICAEA) and particle gridding";

  initial_setup();

  // order matters: pybind11 tries the last registered translator first
  py::register_exception<Error>(m, "LensbridgeError", PyExc_RuntimeError);
  py::register_exception<UnrecognizedOption>(m, "UnrecognizedOption", PyExc_ValueError);
  py::register_exception<MissingSetting>(m, "MissingSetting", PyExc_ValueError);
  py::register_exception<TypeMismatch>(m, "TypeMismatch", PyExc_ValueError);
  py::register_exception<EmptyComputation>(m, "EmptyComputation", PyExc_ValueError);
  py::register_exception<ModelConstructionFailed>(m, "ModelConstructionFailed", 
    PyExc_RuntimeError);
  py::register_exception<KernelComputationFailed>(m, "KernelComputationFailed", 
    PyExc_RuntimeError);

#ifdef LENSBRIDGE_HAVE_NICAEA
  m.def("shearPowerSpectrum",
    &shear_power_spectrum_py,
    "Compute the shear power spectrum",
    py::arg("Om"), py::arg("Ode"), py::arg("w0"), py::arg("w1"), 
    py::arg("H100"), py::arg("Omegab"), py::arg("Omeganu"), py::arg("Neff"),
    py::arg("si8"), py::arg("ns"), py::arg("nzbins"), py::arg("ell"), 
    py::arg("Nnz"), py::arg("nofz"), py::arg("par_nz"), py::arg("settings"),
    py::arg("extra") = py::none()
  );
#endif

  m.def("grid3d",
    &grid3d_py,
    "Snap particles on a 3d regularly spaced grid (grid updated in place)",
    py::arg("positions"), 
    py::arg("leftX"), py::arg("leftY"), py::arg("leftZ"),
    py::arg("sizeX"), py::arg("sizeY"), py::arg("sizeZ"),
    py::arg("grid").noconvert()
  );

  m.def("options",
    &options,
    "Recognized values of a settings key ('nofz' for the n(z) types)",
    py::arg("key")
  );

  m.def("redshift_pairs",
    &redshift_pairs_cpp,
    "Redshift bin pairs (i,j) in output column order",
    py::arg("nzbins"), py::arg("stomo")
  );
}
