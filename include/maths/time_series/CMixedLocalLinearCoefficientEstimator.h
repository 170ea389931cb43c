/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_time_series_CMixedLocalLinearCoefficientEstimator_h
#define INCLUDED_mxfar_maths_time_series_CMixedLocalLinearCoefficientEstimator_h

#include <maths/time_series/CLocalCoefficientEstimator.h>

namespace mxfar {
namespace maths {
namespace time_series {

//! \brief Local linear estimation of group mean functional coefficients and
//! subject random effects.
//!
//! DESCRIPTION:\n
//! Each series i in group s is modelled as having coefficients
//! \f$\theta_s(u) + b_i(u)\f$ where the random effects \f$b_i\f$ have mean
//! zero within the group. At each reference value:
//!   -# every series is fitted separately by CLocalLinearCoefficientEstimator
//!      giving \f$\hat\beta_i\f$ and its sampling variances \f$v_i\f$,
//!   -# the group mean \f$\hat\theta_s\f$ is the average of the group's fits,
//!   -# the between series variance of each coefficient is estimated by the
//!      method of moments \f$\hat\tau^2 = \max(S^2 - \bar v, 0)\f$,
//!   -# each random effect is predicted by shrinking the series' offset from
//!      the group mean \f$\hat b_i = \lambda (\hat\beta_i - \hat\theta_s)\f$
//!      with \f$\lambda = \hat\tau^2 / (\hat\tau^2 + \bar v)\f$.
//!
//! Since the same shrinkage applies to every series of a group the
//! predicted random effects sum to zero within each group.
//!
//! The estimate fails if any series' local fit fails.
class CMixedLocalLinearCoefficientEstimator : public CLocalCoefficientEstimator {
public:
    TOptionalLocalCoefficients estimate(const CAutoregressiveDesign& design,
                                        double point,
                                        double bandwidthProportion) const override;

    std::string description() const override;
};
}
}
}

#endif // INCLUDED_mxfar_maths_time_series_CMixedLocalLinearCoefficientEstimator_h
