/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/common/CSampling.h>

#include <core/CLogger.h>

#include <boost/random/normal_distribution.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>

#include <cmath>

namespace mxfar {
namespace maths {
namespace common {

std::size_t CSampling::uniformSample(CPRNG::CXorOShiro128Plus& rng, std::size_t a, std::size_t b) {
    if (b <= a) {
        return a;
    }
    boost::random::uniform_int_distribution<std::size_t> uniform{a, b - 1};
    return uniform(rng);
}

double CSampling::uniformSample(CPRNG::CXorOShiro128Plus& rng, double a, double b) {
    if (b <= a) {
        return a;
    }
    boost::random::uniform_real_distribution<double> uniform{a, b};
    return uniform(rng);
}

void CSampling::uniformSample(CPRNG::CXorOShiro128Plus& rng,
                              std::size_t a,
                              std::size_t b,
                              std::size_t n,
                              TSizeVec& result) {
    result.clear();
    if (b <= a) {
        result.assign(n, a);
        return;
    }
    result.reserve(n);
    boost::random::uniform_int_distribution<std::size_t> uniform{a, b - 1};
    for (std::size_t i = 0; i < n; ++i) {
        result.push_back(uniform(rng));
    }
}

void CSampling::resample(CPRNG::CXorOShiro128Plus& rng, std::size_t size, std::size_t n, TSizeVec& result) {
    if (size == 0) {
        LOG_ERROR(<< "Can't resample from an empty collection");
        result.clear();
        return;
    }
    uniformSample(rng, std::size_t{0}, size, n, result);
}

double CSampling::normalSample(CPRNG::CXorOShiro128Plus& rng, double mean, double variance) {
    if (variance < 0.0) {
        LOG_ERROR(<< "Invalid variance " << variance);
        return mean;
    }
    if (variance == 0.0) {
        return mean;
    }
    boost::random::normal_distribution<double> normal{mean, std::sqrt(variance)};
    return normal(rng);
}

void CSampling::normalSample(CPRNG::CXorOShiro128Plus& rng,
                             double mean,
                             double variance,
                             std::size_t n,
                             TDoubleVec& result) {
    result.clear();
    if (variance < 0.0) {
        LOG_ERROR(<< "Invalid variance " << variance);
        return;
    }
    if (variance == 0.0) {
        result.assign(n, mean);
        return;
    }
    result.reserve(n);
    boost::random::normal_distribution<double> normal{mean, std::sqrt(variance)};
    for (std::size_t i = 0; i < n; ++i) {
        result.push_back(normal(rng));
    }
}
}
}
}
