/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/time_series/CLocalCoefficientEstimator.h>

namespace mxfar {
namespace maths {
namespace time_series {

common::TDenseMatrix SLocalCoefficients::subjectCoefficients(std::size_t series,
                                                             std::size_t group) const {
    return s_GroupMeans[group] + s_SubjectDeviations[series];
}

common::TDenseMatrix SLocalCoefficients::packed() const {
    if (s_GroupMeans.empty()) {
        return {};
    }
    std::ptrdiff_t k{s_GroupMeans[0].rows()};
    std::ptrdiff_t kp{s_GroupMeans[0].cols()};
    std::ptrdiff_t slabs{static_cast<std::ptrdiff_t>(s_GroupMeans.size() +
                                                     s_SubjectDeviations.size())};
    common::TDenseMatrix result(k, 2 * kp * slabs);
    std::ptrdiff_t column{0};
    for (std::size_t s = 0; s < s_GroupMeans.size(); ++s, column += 2 * kp) {
        result.block(0, column, k, kp) = s_GroupMeans[s];
        result.block(0, column + kp, k, kp) = s_GroupDerivatives[s];
    }
    for (std::size_t j = 0; j < s_SubjectDeviations.size(); ++j, column += 2 * kp) {
        result.block(0, column, k, kp) = s_SubjectDeviations[j];
        result.block(0, column + kp, k, kp) = s_SubjectDerivativeDeviations[j];
    }
    return result;
}
}
}
}
