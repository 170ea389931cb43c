/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_time_series_CFarParameters_h
#define INCLUDED_mxfar_maths_time_series_CFarParameters_h

#include <cstddef>
#include <iosfwd>

namespace mxfar {
namespace maths {
namespace time_series {

//! \brief The parameters of a functional-coefficient autoregressive fit.
struct SFarParameters {
    static constexpr double DEFAULT_BANDWIDTH_PROPORTION{0.1};
    static constexpr std::size_t DEFAULT_NUMBER_POINTS{50};

    SFarParameters(std::size_t order,
                   std::size_t referenceLag,
                   double bandwidthProportion = DEFAULT_BANDWIDTH_PROPORTION,
                   std::size_t numberPoints = DEFAULT_NUMBER_POINTS);

    //! Check the parameters are usable.
    //!
    //! \throws std::invalid_argument if they aren't.
    void validate() const;

    //! The number of leading observations without a complete lag history,
    //! i.e. max(order, reference lag).
    std::size_t maximumLag() const;

    //! The autoregressive order p.
    std::size_t s_Order;
    //! The lag d of the reference signal.
    std::size_t s_ReferenceLag;
    //! The kernel bandwidth as a proportion of the reference signal range.
    double s_BandwidthProportion;
    //! The number of grid cut points.
    std::size_t s_NumberPoints;
};

std::ostream& operator<<(std::ostream& strm, const SFarParameters& params);
}
}
}

#endif // INCLUDED_mxfar_maths_time_series_CFarParameters_h
