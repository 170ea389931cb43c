/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_common_CMathsFuncs_h
#define INCLUDED_mxfar_maths_common_CMathsFuncs_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CLinearAlgebraEigen.h>

namespace mxfar {
namespace maths {
namespace common {

//! \brief
//! Portable maths functions.
//!
//! DESCRIPTION:\n
//! Missing values are represented by NaN throughout the estimation code
//! so we need consistent checks for them on scalars and matrices.
class CMathsFuncs : private core::CNonInstantiatable {
public:
    //! Check if \p value is NaN.
    static bool isNan(double value);
    //! Check if any element of \p value is NaN.
    static bool isNan(const TDenseMatrix::TBase& value);
    //! Check if any element of \p value is NaN.
    static bool isNan(const TDenseVector::TBase& value);

    //! Check if \p value is positive or negative infinity.
    static bool isInf(double value);

    //! Check if \p value is neither NaN nor infinite.
    static bool isFinite(double value);
    //! Check if every element of \p value is finite.
    static bool isFinite(const TDenseMatrix::TBase& value);
    //! Check if every element of \p value is finite.
    static bool isFinite(const TDenseVector::TBase& value);
};
}
}
}

#endif // INCLUDED_mxfar_maths_common_CMathsFuncs_h
