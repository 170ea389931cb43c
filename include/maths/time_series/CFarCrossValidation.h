/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_time_series_CFarCrossValidation_h
#define INCLUDED_mxfar_maths_time_series_CFarCrossValidation_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <maths/time_series/CFarParameters.h>

#include <cstddef>
#include <vector>

namespace mxfar {
namespace maths {
namespace time_series {

//! \brief Out of sample prediction error of FAR models.
//!
//! DESCRIPTION:\n
//! The accumulated prediction error for horizon r and Q folds refits the
//! model of each series on its first T - q r values, for q = 1, ..., Q,
//! and sums the squared errors of the one step predictions of the r values
//! which follow. The bandwidth is inflated by \f$(T / (T - q r))^{1/5}\f$
//! to account for the shorter series. This can be used to choose the
//! model order, reference lag and bandwidth.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The grid of each fold is built from the truncated reference signal so
//! no information from the held out values is used for fitting. Missing
//! predictions don't contribute to the error.
class CFarCrossValidation : private core::CNonInstantiatable {
public:
    using TSizeVec = std::vector<std::size_t>;

public:
    //! Get the mean over series of the accumulated prediction error.
    //!
    //! \param[in] groupSizes The number of series in each group.
    //! \param[in] seriesLength The common length T of the series.
    //! \param[in] y The stacked N T x K series.
    //! \param[in] u The stacked reference signals.
    //! \param[in] horizon The number r of values predicted per fold.
    //! \param[in] folds The number of folds Q.
    //! \throws std::invalid_argument if the input is inconsistent or the
    //! series are too short for \p folds folds of \p horizon values.
    static double accumulatedPredictionError(const TSizeVec& groupSizes,
                                             std::size_t seriesLength,
                                             const common::TDenseMatrix& y,
                                             const common::TDenseVector& u,
                                             const SFarParameters& params,
                                             std::size_t horizon,
                                             std::size_t folds);

    //! Get the accumulated prediction error of the single series \p y.
    static double seriesPredictionError(const common::TDenseMatrix& y,
                                        const common::TDenseVector& u,
                                        const SFarParameters& params,
                                        std::size_t horizon,
                                        std::size_t folds);
};
}
}
}

#endif // INCLUDED_mxfar_maths_time_series_CFarCrossValidation_h
