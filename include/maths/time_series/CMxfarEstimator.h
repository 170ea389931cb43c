/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_time_series_CMxfarEstimator_h
#define INCLUDED_mxfar_maths_time_series_CMxfarEstimator_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <maths/time_series/CFarEstimator.h>
#include <maths/time_series/CFarParameters.h>
#include <maths/time_series/CFunctionalCoefficientField.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace mxfar {
namespace maths {
namespace time_series {
class CLocalCoefficientEstimator;

//! \brief Estimates a mixed effects functional coefficient autoregressive
//! model of groups of series.
//!
//! DESCRIPTION:\n
//! Every series i in group s follows a FAR(p, d) model whose coefficient
//! functions are the group's mean functions plus a random deviation
//! <pre class="fragment">
//!   \f$\Phi_{i,l}(u) = \Theta_{s,l}(u) + B_{i,l}(u)\f$
//! </pre>
//! The series are stacked in order, group by group, and share one grid
//! built from the stacked reference signals. The local estimator is called
//! once per evaluation point on the whole stacked design.
class CMxfarEstimator : private core::CNonInstantiatable {
public:
    using TSizeVec = std::vector<std::size_t>;
    using TDoubleVec = std::vector<double>;
    using TFieldVec = std::vector<CFunctionalCoefficientField>;
    using TCoherenceVec = std::vector<CFarEstimator::SCoherence>;
    using TOptionalCoherenceVec = std::optional<TCoherenceVec>;

    //! \brief The estimated model.
    struct SEstimate {
        //! The grid cut points.
        TDoubleVec s_CutPoints;
        //! The grid evaluation points.
        TDoubleVec s_EvaluationPoints;
        //! The group mean coefficient field of each group.
        TFieldVec s_GroupCoefficients;
        //! The effective coefficient field of each series.
        TFieldVec s_SubjectCoefficients;
        //! The stacked N (T - max(p, d)) x K one step predictions.
        common::TDenseMatrix s_Predictions;
        //! The stacked N (T - max(p, d)) x K residuals.
        common::TDenseMatrix s_Residuals;
        //! The functional PDC of each group mean field if requested.
        TOptionalCoherenceVec s_GroupCoherence;
        //! The functional PDC of each series' field if requested.
        TOptionalCoherenceVec s_SubjectCoherence;
    };

public:
    //! Estimate the model using mixed effects local linear regression.
    //!
    //! \param[in] groupSizes The number of series in each group.
    //! \param[in] seriesLength The common length T of the series.
    //! \param[in] y The stacked N T x K series.
    //! \param[in] u The stacked reference signals.
    //! \throws std::invalid_argument if the input is inconsistent.
    static SEstimate estimate(const TSizeVec& groupSizes,
                              std::size_t seriesLength,
                              const common::TDenseMatrix& y,
                              const common::TDenseVector& u,
                              const SFarParameters& params,
                              bool computeCoherence = false);

    //! Estimate the model using \p estimator for the local coefficients.
    static SEstimate estimate(const TSizeVec& groupSizes,
                              std::size_t seriesLength,
                              const common::TDenseMatrix& y,
                              const common::TDenseVector& u,
                              const SFarParameters& params,
                              bool computeCoherence,
                              const CLocalCoefficientEstimator& estimator);
};
}
}
}

#endif // INCLUDED_mxfar_maths_time_series_CMxfarEstimator_h
