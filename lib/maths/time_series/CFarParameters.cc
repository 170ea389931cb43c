/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/time_series/CFarParameters.h>

#include <algorithm>
#include <cmath>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace mxfar {
namespace maths {
namespace time_series {

SFarParameters::SFarParameters(std::size_t order,
                               std::size_t referenceLag,
                               double bandwidthProportion,
                               std::size_t numberPoints)
    : s_Order{order}, s_ReferenceLag{referenceLag},
      s_BandwidthProportion{bandwidthProportion}, s_NumberPoints{numberPoints} {
}

void SFarParameters::validate() const {
    std::ostringstream error;
    if (s_Order == 0) {
        error << "order must be positive";
    } else if (s_ReferenceLag == 0) {
        error << "reference lag must be positive";
    } else if (!(s_BandwidthProportion > 0.0 && s_BandwidthProportion <= 1.0)) {
        error << "bandwidth proportion " << s_BandwidthProportion << " not in (0, 1]";
    } else if (s_NumberPoints < 2) {
        error << "need at least 2 grid points, got " << s_NumberPoints;
    } else {
        return;
    }
    throw std::invalid_argument("Input error: " + error.str());
}

std::size_t SFarParameters::maximumLag() const {
    return std::max(s_Order, s_ReferenceLag);
}

std::ostream& operator<<(std::ostream& strm, const SFarParameters& params) {
    return strm << "{p = " << params.s_Order << ", d = " << params.s_ReferenceLag
                << ", bwp = " << params.s_BandwidthProportion
                << ", numpoints = " << params.s_NumberPoints << "}";
}
}
}
}
