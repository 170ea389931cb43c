/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_common_CSampling_h
#define INCLUDED_mxfar_maths_common_CSampling_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CPRNG.h>

#include <cstddef>
#include <vector>

namespace mxfar {
namespace maths {
namespace common {

//! \brief Sampling functionality.
//!
//! DESCRIPTION:\n
//! Every function takes the random number generator explicitly. There is
//! no shared default generator so results are reproducible regardless of
//! how work is scheduled on threads.
class CSampling : private core::CNonInstantiatable {
public:
    using TDoubleVec = std::vector<double>;
    using TSizeVec = std::vector<std::size_t>;

public:
    //! \name Uniform Sampling
    //!
    //! Sample uniformly from the interval [\p a, \p b) for floating point
    //! types and the set {\p a, \p a + 1, ..., \p b - 1} for integer types.
    //@{
    static std::size_t uniformSample(CPRNG::CXorOShiro128Plus& rng, std::size_t a, std::size_t b);
    static double uniformSample(CPRNG::CXorOShiro128Plus& rng, double a, double b);
    static void uniformSample(CPRNG::CXorOShiro128Plus& rng,
                              std::size_t a,
                              std::size_t b,
                              std::size_t n,
                              TSizeVec& result);
    //@}

    //! Sample \p n indices from {0, 1, ..., \p size - 1} with replacement.
    static void resample(CPRNG::CXorOShiro128Plus& rng, std::size_t size, std::size_t n, TSizeVec& result);

    //! \name Normal Sampling
    //!
    //! Sample from the normal distribution with mean \p mean and variance
    //! \p variance.
    //@{
    static double normalSample(CPRNG::CXorOShiro128Plus& rng, double mean, double variance);
    static void normalSample(CPRNG::CXorOShiro128Plus& rng,
                             double mean,
                             double variance,
                             std::size_t n,
                             TDoubleVec& result);
    //@}
};
}
}
}

#endif // INCLUDED_mxfar_maths_common_CSampling_h
