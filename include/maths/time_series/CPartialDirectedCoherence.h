/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_time_series_CPartialDirectedCoherence_h
#define INCLUDED_mxfar_maths_time_series_CPartialDirectedCoherence_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace mxfar {
namespace maths {
namespace time_series {
class CFunctionalCoefficientField;

//! \brief Partial directed coherence of autoregressive coefficients.
//!
//! DESCRIPTION:\n
//! For coefficients \f$\Phi_1, ..., \Phi_p\f$ and frequency f this computes
//! <pre class="fragment">
//!   \f$A(f) = I - \sum_l \Phi_l e^{-2\pi i f l}\f$
//! </pre>
//! and the PDC from series j to series i is \f$|A_{ij}| / \|A_{.j}\|\f$.
//! Each column of the result therefore has unit sum of squares. A column
//! of A which is identically zero gives NaN.
//!
//! The functional variant applies this at every cell of a coefficient field.
class CPartialDirectedCoherence : private core::CNonInstantiatable {
public:
    using TDoubleVec = std::vector<double>;
    using TDenseMatrixVec = common::TDenseMatrixVec;
    using TOptionalDenseMatrixVec = std::optional<TDenseMatrixVec>;
    using TOptionalDenseMatrixVecVec = std::vector<TOptionalDenseMatrixVec>;

public:
    //! Get the Fourier frequencies 1/T, 2/T, ..., floor(T/2)/T of a series
    //! of length \p length.
    static TDoubleVec fourierFrequencies(std::size_t length);

    //! Compute the PDC of the K x K lag matrices \p lags.
    //!
    //! \return One K x K matrix for each of \p frequencies.
    static TDenseMatrixVec pdc(const TDenseMatrixVec& lags, const TDoubleVec& frequencies);

    //! Compute the PDC of the horizontally stacked K x Kp lag matrices
    //! \p coefficients.
    static TDenseMatrixVec pdcStacked(const common::TDenseMatrix& coefficients,
                                      const TDoubleVec& frequencies);

    //! Compute the PDC of every cell of \p field.
    //!
    //! Missing cells have no PDC.
    static TOptionalDenseMatrixVecVec fpdc(const CFunctionalCoefficientField& field,
                                           const TDoubleVec& frequencies);
};
}
}
}

#endif // INCLUDED_mxfar_maths_time_series_CPartialDirectedCoherence_h
