#include "lensbridge/kernel.hpp"

#ifndef __LENSBRIDGE_NICAEA_KERNEL_HPP
#define __LENSBRIDGE_NICAEA_KERNEL_HPP

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Class NicaeaKernel (NICAEA weak lensing code by M. Kilbinger)
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

class NicaeaKernel : public LensingKernel
{ // Singleton Class: NICAEA models are plain C structs (cosmo_lens)
  public:
    static NicaeaKernel& get_instance() {
      static NicaeaKernel instance;
      return instance;
    }
    ~NicaeaKernel() override = default;

    model_ptr create_model(const ModelSpecification& spec) override;

    void destroy_model(model_ptr model) noexcept override;

    double shear_power(model_ptr model, const double ell, 
                       const int i, const int j) override;
  private:
    NicaeaKernel() = default;
    NicaeaKernel(NicaeaKernel const&) = delete;
};

}  // namespace lensbridge_interface
#endif // HEADER GUARD
