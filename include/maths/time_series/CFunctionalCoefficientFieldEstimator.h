/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_time_series_CFunctionalCoefficientFieldEstimator_h
#define INCLUDED_mxfar_maths_time_series_CFunctionalCoefficientFieldEstimator_h

#include <maths/common/CLinearAlgebraEigen.h>

#include <maths/time_series/CFunctionalCoefficientField.h>
#include <maths/time_series/CLocalCoefficientEstimator.h>

#include <cstddef>
#include <vector>

namespace mxfar {
namespace maths {
namespace time_series {
class CAutoregressiveDesign;
class CReferenceSignalGrid;

//! \brief Estimates functional coefficients on every cell of a grid.
//!
//! DESCRIPTION:\n
//! Runs a CLocalCoefficientEstimator at each evaluation point of a grid
//! and extracts coefficient fields for groups and series from the local
//! estimates. Observations are then routed to the cell containing their
//! reference value to get one step predictions.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The evaluation points are independent so they are estimated in parallel
//! with core::parallel_for_each. Each task writes only its own slot of the
//! result. A failed local estimate leaves its slot empty and never stops
//! estimation of the other points.
class CFunctionalCoefficientFieldEstimator {
public:
    using TOptionalLocalCoefficients = CLocalCoefficientEstimator::TOptionalLocalCoefficients;
    using TOptionalLocalCoefficientsVec = std::vector<TOptionalLocalCoefficients>;

public:
    explicit CFunctionalCoefficientFieldEstimator(const CLocalCoefficientEstimator& estimator);

    //! Estimate local coefficients at every evaluation point of \p grid.
    TOptionalLocalCoefficientsVec estimate(const CAutoregressiveDesign& design,
                                           const CReferenceSignalGrid& grid,
                                           double bandwidthProportion) const;

    //! Extract the field of group \p group's mean coefficients.
    static CFunctionalCoefficientField groupField(const TOptionalLocalCoefficientsVec& local,
                                                  std::size_t dimension,
                                                  std::size_t group);

    //! Extract the field of the effective coefficients of \p series which
    //! belongs to \p group.
    static CFunctionalCoefficientField subjectField(const TOptionalLocalCoefficientsVec& local,
                                                    std::size_t dimension,
                                                    std::size_t series,
                                                    std::size_t group);

    //! Predict the design rows [\p begin, \p end) using the coefficients of
    //! the cell of \p grid containing each row's reference value.
    //!
    //! \return A (\p end - \p begin) x K matrix with NaN rows where the cell
    //! is missing or the row has a missing value.
    static common::TDenseMatrix predict(const CAutoregressiveDesign& design,
                                        std::size_t begin,
                                        std::size_t end,
                                        const CReferenceSignalGrid& grid,
                                        const CFunctionalCoefficientField& field);

private:
    const CLocalCoefficientEstimator& m_Estimator;
};
}
}
}

#endif // INCLUDED_mxfar_maths_time_series_CFunctionalCoefficientFieldEstimator_h
