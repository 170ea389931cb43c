/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_test_CFarSimulator_h
#define INCLUDED_mxfar_test_CFarSimulator_h

#include <maths/common/CLinearAlgebraEigen.h>
#include <maths/common/CPRNG.h>

#include <cstddef>
#include <functional>
#include <vector>

namespace mxfar {
namespace test {

//! \brief Simulates series from FAR and mixed effects FAR models.
//!
//! DESCRIPTION:\n
//! The coefficients are a function of the lagged reference value and a
//! vector of random effects which returns one K x K matrix per lag. The
//! reference signal is either exogenous standard normal noise or one of
//! the simulated series. Every simulation starts from all ones and the
//! first \p burnin values are discarded.
class CFarSimulator {
public:
    using TDoubleVec = std::vector<double>;
    using TSizeVec = std::vector<std::size_t>;
    using TDenseMatrixVec = maths::common::TDenseMatrixVec;
    using TCoefficientFunc = std::function<TDenseMatrixVec(double, const TDoubleVec&)>;
    using TGenerator = maths::common::CPRNG::CXorOShiro128Plus;

    //! Use exogenous standard normal noise as the reference signal.
    static constexpr std::size_t EXOGENOUS_REFERENCE{0};
    static constexpr std::size_t DEFAULT_BURNIN{500};

    //! \brief A simulated series and its reference signal.
    struct SSeries {
        maths::common::TDenseMatrix s_Y;
        maths::common::TDenseVector s_U;
    };

public:
    //! \param[in] referenceLag The lag d of the reference signal.
    //! \param[in] referenceSeries The one based index of the series to use
    //! as the reference signal or EXOGENOUS_REFERENCE.
    //! \param[in] coefficients The coefficient function.
    //! \param[in] noiseVariances The variance of the noise of each series.
    CFarSimulator(std::size_t referenceLag,
                  std::size_t referenceSeries,
                  TCoefficientFunc coefficients,
                  TDoubleVec noiseVariances,
                  std::size_t burnin = DEFAULT_BURNIN);

    //! Get the bivariate exponential autoregression of order one with
    //! coefficients
    //! <pre class="fragment">
    //!   \f$f_{11} = -0.3, f_{12} = 0.6 e^{-0.3 x^2}, f_{21} = -0.2, f_{22} = -0.4 e^{-0.45 x^2}\f$
    //! </pre>
    //! in exogenous standard normal noise x lagged by two. The four random
    //! effects, if supplied, are added to -0.3, 0.3, -0.2 and 0.45 in turn.
    static CFarSimulator exponentialAutoregression();

    //! Simulate \p length values with random effects \p effects.
    SSeries simulate(TGenerator& rng, std::size_t length, const TDoubleVec& effects) const;

    //! Simulate a stacked collection of series with independent normal
    //! random effects with variances \p effectVariances.
    SSeries simulateStacked(TGenerator& rng,
                            std::size_t numberSeries,
                            std::size_t length,
                            const TDoubleVec& effectVariances) const;

private:
    std::size_t m_ReferenceLag;
    std::size_t m_ReferenceSeries;
    TCoefficientFunc m_Coefficients;
    TDoubleVec m_NoiseVariances;
    std::size_t m_Burnin;
};
}
}

#endif // INCLUDED_mxfar_test_CFarSimulator_h
