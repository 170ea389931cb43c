/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_time_series_CVectorAutoregression_h
#define INCLUDED_mxfar_maths_time_series_CVectorAutoregression_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <cstddef>
#include <optional>

namespace mxfar {
namespace maths {
namespace time_series {

//! \brief Least squares fit of a linear vector autoregression.
//!
//! DESCRIPTION:\n
//! Fits y(t) = Phi_1 y(t-1) + ... + Phi_p y(t-p) + e(t) without intercept.
//! This is the linear null model of the nonlinearity test.
//!
//! Rows whose response or lagged values are missing are dropped from the
//! least squares problem. The fitted values and residuals keep one row for
//! every time t = p, ..., T - 1 and are missing wherever their inputs are.
class CVectorAutoregression : private core::CNonInstantiatable {
public:
    //! \brief The fitted model.
    struct SFit {
        //! The K x Kp coefficients [Phi_1 ... Phi_p].
        common::TDenseMatrix s_Coefficients;
        //! The (T - p) x K fitted values for t = p, ..., T - 1.
        common::TDenseMatrix s_Fitted;
        //! The (T - p) x K residuals for t = p, ..., T - 1.
        common::TDenseMatrix s_Residuals;
    };
    using TOptionalFit = std::optional<SFit>;

public:
    //! Fit an order \p order model to the T x K series \p y.
    //!
    //! \return Nothing if \p y has too few rows without missing values or
    //! the least squares problem is rank deficient.
    static TOptionalFit fit(const common::TDenseMatrix& y, std::size_t order);
};
}
}
}

#endif // INCLUDED_mxfar_maths_time_series_CVectorAutoregression_h
