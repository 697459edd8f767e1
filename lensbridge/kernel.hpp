#include <utility>

#include "lensbridge/errors.hpp"
#include "lensbridge/redshift.hpp"
#include "lensbridge/settings.hpp"

#ifndef __LENSBRIDGE_KERNEL_HPP
#define __LENSBRIDGE_KERNEL_HPP

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Everything the kernel needs to build a lensing model
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

struct CosmologicalParameters
{
  double Omega_m;
  double Omega_de;
  double w0;
  double w1;
  double h100;
  double Omega_b;
  double Omega_nu_mass;
  double Neff_nu_mass;
  double sigma_8;
  double n_s;
};

enum class IAType { none };

struct ModelSpecification
{
  CosmologicalParameters cosmology;
  RedshiftDistribution redshift;
  Settings settings;
  IAType ia = IAType::none; // intrinsic alignment is not exposed
  double A_ia = 0.0;
};

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Class LensingKernel
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

class LensingKernel
{ // Seam to the external lensing code: implementations throw KernelError
  public:
    using model_ptr = void*;

    virtual ~LensingKernel() = default;

    virtual model_ptr create_model(const ModelSpecification& spec) = 0;

    virtual void destroy_model(model_ptr model) noexcept = 0;

    // shear power spectrum of the (i,j) redshift-bin pair at multipole ell
    virtual double shear_power(model_ptr model, const double ell, 
                               const int i, const int j) = 0;
};

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Class ScopedModel
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

class ScopedModel
{ // Owns a kernel model, releases it exactly once
  public:
    ScopedModel(LensingKernel& kernel, LensingKernel::model_ptr model) :
      kernel_(&kernel),
      model_(model) {
      }
    ~ScopedModel() {
      this->reset();
    }
    ScopedModel(ScopedModel&& other) noexcept :
      kernel_(other.kernel_),
      model_(std::exchange(other.model_, nullptr)) {
      }
    ScopedModel& operator=(ScopedModel&& other) noexcept {
      if (this != &other) {
        this->reset();
        this->kernel_ = other.kernel_;
        this->model_ = std::exchange(other.model_, nullptr);
      }
      return *this;
    }
    ScopedModel(ScopedModel const&) = delete;
    ScopedModel& operator=(ScopedModel const&) = delete;

    LensingKernel::model_ptr get() const {
      return this->model_;
    }
    LensingKernel& kernel() const {
      return *this->kernel_;
    }
    void reset() noexcept {
      if (this->model_ != nullptr) {
        this->kernel_->destroy_model(this->model_);
        this->model_ = nullptr;
      }
    }
  private:
    LensingKernel* kernel_;
    LensingKernel::model_ptr model_;
};

}  // namespace lensbridge_interface
#endif // HEADER GUARD
