/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_time_series_CReferenceSignalGrid_h
#define INCLUDED_mxfar_maths_time_series_CReferenceSignalGrid_h

#include <maths/common/CLinearAlgebraEigen.h>

#include <cstddef>
#include <vector>

namespace mxfar {
namespace maths {
namespace time_series {

//! \brief A discretisation of the range of a reference signal.
//!
//! DESCRIPTION:\n
//! The functional coefficients are only estimated at a finite set of
//! reference signal values. This chooses n cut points equally spaced
//! between the 5% and 95% empirical quantiles of the signal. The cut
//! points partition the real line into n + 1 right closed cells
//! \f$(-\infty, c_1], (c_1, c_2], ..., (c_n, \infty)\f$ and each cell has
//! one evaluation point: the midpoints of adjacent cut points extended
//! by one extrapolated point at each end.
//!
//! Cells are indexed from zero, so the cell index of a value is also the
//! index of its evaluation point and of its coefficients in any field
//! estimated on this grid.
class CReferenceSignalGrid {
public:
    using TDoubleVec = std::vector<double>;

public:
    static constexpr double LOWER_QUANTILE{0.05};
    static constexpr double UPPER_QUANTILE{0.95};

public:
    //! \param[in] reference The reference signal. Non-finite values are ignored.
    //! \param[in] numberPoints The number of cut points n.
    //! \throws std::invalid_argument if \p numberPoints < 2 or \p reference
    //! has no finite values.
    CReferenceSignalGrid(const common::TDenseVector::TBase& reference, std::size_t numberPoints);

    //! Get the number of cut points.
    std::size_t numberCutPoints() const;

    //! Get the number of cells, which equals the number of evaluation points.
    std::size_t numberCells() const;

    //! Get the cut points.
    const TDoubleVec& cutPoints() const;

    //! Get the evaluation points.
    const TDoubleVec& evaluationPoints() const;

    //! Get the index of the cell containing \p x.
    //!
    //! \note This is monotone non-decreasing in \p x and a value equal to
    //! a cut point belongs to the cell on its left.
    //! \note NaN maps to cell zero. Callers must check for missing values.
    std::size_t cell(double x) const;

private:
    TDoubleVec m_CutPoints;
    TDoubleVec m_EvaluationPoints;
};
}
}
}

#endif // INCLUDED_mxfar_maths_time_series_CReferenceSignalGrid_h
