/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_common_CLinearAlgebraEigen_h
#define INCLUDED_mxfar_maths_common_CLinearAlgebraEigen_h

#include <Eigen/Core>

#include <complex>
#include <cstddef>
#include <limits>
#include <vector>

namespace mxfar {
namespace maths {
namespace common {

//! \brief Decorates an Eigen dense matrix with some useful methods.
template<typename SCALAR>
class CDenseMatrix : public Eigen::Matrix<SCALAR, Eigen::Dynamic, Eigen::Dynamic> {
public:
    using TBase = Eigen::Matrix<SCALAR, Eigen::Dynamic, Eigen::Dynamic>;

public:
    //! Forwarding constructor.
    template<typename... ARGS>
    CDenseMatrix(ARGS&&... args) : TBase(std::forward<ARGS>(args)...) {}

    //! \name Copy and Move Semantics
    //@{
    CDenseMatrix(const CDenseMatrix& other) = default;
    CDenseMatrix(CDenseMatrix&& other) = default;
    CDenseMatrix& operator=(const CDenseMatrix& other) = default;
    CDenseMatrix& operator=(CDenseMatrix&& other) = default;
    //@}

    //! Get a matrix of \p rows rows and \p columns columns filled with NaN.
    static CDenseMatrix missing(std::ptrdiff_t rows, std::ptrdiff_t columns) {
        return TBase::Constant(rows, columns, std::numeric_limits<SCALAR>::quiet_NaN());
    }

    //! Copy the rows [\p start, \p end) of \p other into a new matrix.
    static CDenseMatrix rowRange(const TBase& other, std::ptrdiff_t start, std::ptrdiff_t end) {
        return other.middleRows(start, end - start);
    }
};

//! \brief Decorates an Eigen column vector with some useful methods.
template<typename SCALAR>
class CDenseVector : public Eigen::Matrix<SCALAR, Eigen::Dynamic, 1> {
public:
    using TBase = Eigen::Matrix<SCALAR, Eigen::Dynamic, 1>;

public:
    //! Forwarding constructor.
    template<typename... ARGS>
    CDenseVector(ARGS&&... args) : TBase(std::forward<ARGS>(args)...) {}

    //! \name Copy and Move Semantics
    //@{
    CDenseVector(const CDenseVector& other) = default;
    CDenseVector(CDenseVector&& other) = default;
    CDenseVector& operator=(const CDenseVector& other) = default;
    CDenseVector& operator=(CDenseVector&& other) = default;
    //@}
};

//! Create a dense vector from a std::vector.
template<typename SCALAR>
CDenseVector<SCALAR> fromStdVector(const std::vector<SCALAR>& vector) {
    CDenseVector<SCALAR> result(vector.size());
    for (std::size_t i = 0; i < vector.size(); ++i) {
        result(i) = vector[i];
    }
    return result;
}

using TDenseMatrix = CDenseMatrix<double>;
using TDenseVector = CDenseVector<double>;
using TComplexMatrix = CDenseMatrix<std::complex<double>>;
using TDenseMatrixVec = std::vector<TDenseMatrix>;
}
}
}

#endif // INCLUDED_mxfar_maths_common_CLinearAlgebraEigen_h
