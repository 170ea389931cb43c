/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_time_series_CFarEstimator_h
#define INCLUDED_mxfar_maths_time_series_CFarEstimator_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <maths/time_series/CFarParameters.h>
#include <maths/time_series/CFunctionalCoefficientField.h>
#include <maths/time_series/CPartialDirectedCoherence.h>

#include <optional>
#include <vector>

namespace mxfar {
namespace maths {
namespace time_series {
class CLocalCoefficientEstimator;

//! \brief Estimates a functional coefficient autoregressive model.
//!
//! DESCRIPTION:\n
//! A FAR(p, d) model of a K dimensional series y with reference signal u is
//! <pre class="fragment">
//!   \f$y(t) = \sum_{l=1}^p \Phi_l(u(t-d)) y(t-l) + e(t)\f$
//! </pre>
//! The coefficient functions are estimated at the evaluation points of a
//! grid over the range of u and each observation is predicted with the
//! coefficients of the grid cell containing its reference value.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The local estimation method is a strategy which defaults to local linear
//! regression. Cells where local estimation fails are missing and the
//! predictions and residuals of observations in those cells are NaN.
class CFarEstimator : private core::CNonInstantiatable {
public:
    using TDoubleVec = std::vector<double>;

    //! \brief The PDC of a coefficient field.
    struct SCoherence {
        //! The frequencies.
        TDoubleVec s_Frequencies;
        //! The PDC of each cell or nothing if the cell is missing.
        CPartialDirectedCoherence::TOptionalDenseMatrixVecVec s_Cells;
    };
    using TOptionalCoherence = std::optional<SCoherence>;

    //! \brief The estimated model.
    struct SEstimate {
        //! The grid cut points.
        TDoubleVec s_CutPoints;
        //! The grid evaluation points.
        TDoubleVec s_EvaluationPoints;
        //! The K x Kp coefficients at each evaluation point.
        CFunctionalCoefficientField s_Coefficients;
        //! The (T - max(p, d)) x K one step predictions.
        common::TDenseMatrix s_Predictions;
        //! The (T - max(p, d)) x K residuals.
        common::TDenseMatrix s_Residuals;
        //! The functional PDC if requested.
        TOptionalCoherence s_Coherence;
    };

public:
    //! Estimate the model of the T x K series \p y with reference signal
    //! \p u using local linear regression.
    //!
    //! \throws std::invalid_argument if the input is inconsistent.
    static SEstimate estimate(const common::TDenseMatrix& y,
                              const common::TDenseVector& u,
                              const SFarParameters& params,
                              bool computeCoherence = false);

    //! Estimate the model using \p estimator for the local coefficients.
    static SEstimate estimate(const common::TDenseMatrix& y,
                              const common::TDenseVector& u,
                              const SFarParameters& params,
                              bool computeCoherence,
                              const CLocalCoefficientEstimator& estimator);
};
}
}
}

#endif // INCLUDED_mxfar_maths_time_series_CFarEstimator_h
