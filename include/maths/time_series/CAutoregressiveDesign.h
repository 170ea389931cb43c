/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_time_series_CAutoregressiveDesign_h
#define INCLUDED_mxfar_maths_time_series_CAutoregressiveDesign_h

#include <maths/common/CLinearAlgebraEigen.h>

#include <cstddef>
#include <vector>

namespace mxfar {
namespace maths {
namespace time_series {

//! \brief The regression design of a functional-coefficient autoregression.
//!
//! DESCRIPTION:\n
//! For a K dimensional series y of length T, order p and reference lag d
//! there is one row for each time t = m, ..., T - 1 where m = max(p, d).
//! Row t comprises:
//!   -# the response y(t),
//!   -# the predictors [y(t-1), y(t-2), ..., y(t-p)] where the block for
//!      lag l occupies columns K(l-1), ..., Kl-1,
//!   -# the reference value u(t-d).
//!
//! A stacked design concatenates the designs of several equal length
//! series, which are partitioned into consecutive groups, and records the
//! rows and group of each series.
class CAutoregressiveDesign {
public:
    using TSizeVec = std::vector<std::size_t>;

    //! \brief The rows of one series in the design.
    struct SSeriesRows {
        std::size_t s_Begin;
        std::size_t s_End;
        std::size_t s_Group;
    };
    using TSeriesRowsVec = std::vector<SSeriesRows>;

public:
    //! Build the design of a single series.
    //!
    //! \param[in] y The T x K series.
    //! \param[in] u The reference signal of length T.
    //! \throws std::invalid_argument if the inputs' shapes are inconsistent
    //! or the series is too short.
    static CAutoregressiveDesign build(const common::TDenseMatrix& y,
                                       const common::TDenseVector& u,
                                       std::size_t order,
                                       std::size_t referenceLag);

    //! Build the design of the series stacked in \p y and \p u.
    //!
    //! \param[in] groupSizes The number of series in each group. Series are
    //! assigned to groups in order.
    //! \param[in] seriesLength The common length T of every series.
    //! \param[in] y The stacked (N T) x K series.
    //! \param[in] u The stacked reference signals of length N T.
    //! \throws std::invalid_argument if the inputs' shapes are inconsistent.
    static CAutoregressiveDesign buildStacked(const TSizeVec& groupSizes,
                                              std::size_t seriesLength,
                                              const common::TDenseMatrix& y,
                                              const common::TDenseVector& u,
                                              std::size_t order,
                                              std::size_t referenceLag);

    //! Get the series dimension K.
    std::size_t dimension() const;
    //! Get the autoregressive order p.
    std::size_t order() const;
    //! Get the reference lag d.
    std::size_t referenceLag() const;
    //! Get the number of rows.
    std::size_t numberRows() const;
    //! Get the number of series.
    std::size_t numberSeries() const;
    //! Get the number of groups.
    std::size_t numberGroups() const;
    //! Get the rows of the \p i'th series.
    const SSeriesRows& series(std::size_t i) const;

    //! Get the responses, one row per design row.
    const common::TDenseMatrix& responses() const;
    //! Get the predictors, one row per design row.
    const common::TDenseMatrix& predictors() const;
    //! Get the reference values, one per design row.
    const common::TDenseVector& references() const;

private:
    CAutoregressiveDesign(std::size_t dimension,
                          std::size_t order,
                          std::size_t referenceLag,
                          std::size_t numberRows);

    //! Fill in the rows for the series starting at \p offset in \p y.
    void addSeries(const common::TDenseMatrix& y,
                   const common::TDenseVector& u,
                   std::size_t offset,
                   std::size_t length,
                   std::size_t group);

private:
    std::size_t m_Order;
    std::size_t m_ReferenceLag;
    std::size_t m_NumberGroups;
    common::TDenseMatrix m_Responses;
    common::TDenseMatrix m_Predictors;
    common::TDenseVector m_References;
    TSeriesRowsVec m_Series;
};
}
}
}

#endif // INCLUDED_mxfar_maths_time_series_CAutoregressiveDesign_h
