/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_time_series_CFunctionalCoefficientField_h
#define INCLUDED_mxfar_maths_time_series_CFunctionalCoefficientField_h

#include <maths/common/CLinearAlgebraEigen.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace mxfar {
namespace maths {
namespace time_series {

//! \brief Autoregressive coefficients evaluated on the cells of a grid.
//!
//! DESCRIPTION:\n
//! Holds one K x Kp coefficient matrix per grid cell. A cell whose local
//! estimate failed is missing and predictions using it are NaN.
//!
//! The field is immutable once constructed.
class CFunctionalCoefficientField {
public:
    using TOptionalDenseMatrix = std::optional<common::TDenseMatrix>;
    using TOptionalDenseMatrixVec = std::vector<TOptionalDenseMatrix>;

public:
    CFunctionalCoefficientField() = default;
    CFunctionalCoefficientField(std::size_t dimension, TOptionalDenseMatrixVec coefficients);

    //! Get the series dimension K.
    std::size_t dimension() const;

    //! Get the number of cells.
    std::size_t size() const;

    //! Get the number of cells without coefficients.
    std::size_t numberMissing() const;

    //! Check if \p cell has no coefficients.
    bool missing(std::size_t cell) const;

    //! Get the coefficients of \p cell.
    const TOptionalDenseMatrix& operator[](std::size_t cell) const;

    //! Get the lag \p lag block of the coefficients of \p cell.
    //!
    //! \note \p lag is one based and \p cell must not be missing.
    common::TDenseMatrix lag(std::size_t cell, std::size_t lag) const;

    //! Predict the response for predictors \p x using the coefficients
    //! of \p cell. This is NaN if the cell is missing.
    common::TDenseVector predict(std::size_t cell, const common::TDenseVector::TBase& x) const;

private:
    std::size_t m_Dimension{0};
    TOptionalDenseMatrixVec m_Coefficients;
};
}
}
}

#endif // INCLUDED_mxfar_maths_time_series_CFunctionalCoefficientField_h
