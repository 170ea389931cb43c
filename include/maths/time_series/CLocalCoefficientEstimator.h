/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_time_series_CLocalCoefficientEstimator_h
#define INCLUDED_mxfar_maths_time_series_CLocalCoefficientEstimator_h

#include <maths/common/CLinearAlgebraEigen.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mxfar {
namespace maths {
namespace time_series {
class CAutoregressiveDesign;

//! \brief The coefficients of a local fit at a single reference value.
//!
//! DESCRIPTION:\n
//! Every block is a K x Kp matrix laid out like the design predictors, so
//! the one step prediction for a row x of a series in group s is
//! \f$(\theta_s + b_i) x\f$. The derivative blocks hold the slopes of the
//! coefficients with respect to the reference value.
struct SLocalCoefficients {
    //! Get the effective coefficients of \p series which is in \p group.
    common::TDenseMatrix subjectCoefficients(std::size_t series, std::size_t group) const;

    //! Get the coefficients packed into one K x 2Kp(g + N) matrix.
    //!
    //! The slab for group s occupies columns 2Kp s, ..., 2Kp (s + 1) - 1 with
    //! the mean in the first Kp columns and the derivative in the last Kp
    //! columns. The slab of series j follows at slab index g + j.
    common::TDenseMatrix packed() const;

    //! The group mean coefficients theta.
    common::TDenseMatrixVec s_GroupMeans;
    //! The derivative of the group mean coefficients.
    common::TDenseMatrixVec s_GroupDerivatives;
    //! The deviation b of each series from its group mean.
    common::TDenseMatrixVec s_SubjectDeviations;
    //! The deviation of each series' derivative from its group's.
    common::TDenseMatrixVec s_SubjectDerivativeDeviations;
};

//! \brief Interface for estimating autoregressive coefficients local to a
//! reference value.
//!
//! DESCRIPTION:\n
//! The coefficient field estimators call this once for each grid point.
//! Implementations must be thread safe since the grid points are estimated
//! in parallel.
//!
//! An estimate can fail, for example because too few observations have a
//! reference value near the point or the local design is singular. This
//! is reported by returning an empty optional, never by throwing.
class CLocalCoefficientEstimator {
public:
    using TOptionalLocalCoefficients = std::optional<SLocalCoefficients>;

public:
    virtual ~CLocalCoefficientEstimator() = default;

    //! Estimate the coefficients at \p point.
    //!
    //! \param[in] design The regression design.
    //! \param[in] point The reference value at which to estimate.
    //! \param[in] bandwidthProportion The kernel bandwidth as a proportion
    //! of the range of the design's reference values.
    virtual TOptionalLocalCoefficients estimate(const CAutoregressiveDesign& design,
                                                double point,
                                                double bandwidthProportion) const = 0;

    //! Get a short description of the estimator for logging.
    virtual std::string description() const = 0;
};
}
}
}

#endif // INCLUDED_mxfar_maths_time_series_CLocalCoefficientEstimator_h
