#include "lensbridge/kernel.hpp"
#include "lensbridge/redshift.hpp"
#include "lensbridge/settings.hpp"

#ifndef __LENSBRIDGE_MODEL_BUILDER_HPP
#define __LENSBRIDGE_MODEL_BUILDER_HPP

namespace lensbridge_interface
{

// Throws ModelConstructionFailed when the kernel rejects the parameters.
ScopedModel build_model(
    LensingKernel& kernel,
    const CosmologicalParameters& cosmology,
    const RedshiftDistribution& redshift,
    const Settings& settings
  );

}  // namespace lensbridge_interface
#endif // HEADER GUARD
