/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_time_series_CLocalLinearCoefficientEstimator_h
#define INCLUDED_mxfar_maths_time_series_CLocalLinearCoefficientEstimator_h

#include <maths/common/CLinearAlgebraEigen.h>

#include <maths/time_series/CLocalCoefficientEstimator.h>

#include <cstddef>
#include <optional>

namespace mxfar {
namespace maths {
namespace time_series {

//! \brief Local linear estimation of functional autoregressive coefficients.
//!
//! DESCRIPTION:\n
//! The coefficients near the reference value \f$u_0\f$ are approximated
//! as \f$\Phi(u) \approx \Phi(u_0) + (u - u_0) \Phi'(u_0)\f$. So regressing
//! y(t) on \f$[x_t, (u_t - u_0) x_t]\f$ with weights
//! \f$K((u_t - u_0) / h)\f$ estimates both the level and the slope. We use
//! the Epanechnikov kernel and a bandwidth h which is a proportion of the
//! range of the reference values of the design.
//!
//! This estimator pools every row of the design, i.e. it treats all series
//! as realisations of one process. Every group gets the same mean and all
//! subject deviations are zero.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The weighted least squares problem is solved by a column pivoting QR
//! decomposition and the fit fails if the local design is rank deficient
//! or there are no residual degrees of freedom.
class CLocalLinearCoefficientEstimator : public CLocalCoefficientEstimator {
public:
    //! \brief The result of a single local linear fit.
    struct SLocalLinearFit {
        //! The 2Kp x K solution: levels then slopes.
        common::TDenseMatrix s_Coefficients;
        //! The sampling variance of each element of s_Coefficients.
        common::TDenseMatrix s_Variances;
        //! The number of observations with positive weight.
        std::size_t s_Support;
    };
    using TOptionalLocalLinearFit = std::optional<SLocalLinearFit>;

public:
    TOptionalLocalCoefficients estimate(const CAutoregressiveDesign& design,
                                        double point,
                                        double bandwidthProportion) const override;

    std::string description() const override;

    //! Get the kernel bandwidth for \p design.
    static double bandwidth(const CAutoregressiveDesign& design, double bandwidthProportion);

    //! Fit the local linear model at \p point to the rows [\p begin, \p end)
    //! of \p design.
    //!
    //! Rows with any missing value are skipped.
    static TOptionalLocalLinearFit fit(const CAutoregressiveDesign& design,
                                       std::size_t begin,
                                       std::size_t end,
                                       double point,
                                       double bandwidth);

    //! Get the K x Kp level block of \p coefficients.
    static common::TDenseMatrix levels(const common::TDenseMatrix& coefficients);

    //! Get the K x Kp slope block of \p coefficients.
    static common::TDenseMatrix slopes(const common::TDenseMatrix& coefficients);

    //! The Epanechnikov kernel.
    static double kernel(double x);
};
}
}
}

#endif // INCLUDED_mxfar_maths_time_series_CLocalLinearCoefficientEstimator_h
