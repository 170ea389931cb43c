/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/common/CMathsFuncs.h>

#include <cmath>

namespace mxfar {
namespace maths {
namespace common {

bool CMathsFuncs::isNan(double value) {
    return std::isnan(value);
}

bool CMathsFuncs::isNan(const TDenseMatrix::TBase& value) {
    return value.array().isNaN().any();
}

bool CMathsFuncs::isNan(const TDenseVector::TBase& value) {
    return value.array().isNaN().any();
}

bool CMathsFuncs::isInf(double value) {
    return std::isinf(value);
}

bool CMathsFuncs::isFinite(double value) {
    return std::isfinite(value);
}

bool CMathsFuncs::isFinite(const TDenseMatrix::TBase& value) {
    return value.allFinite();
}

bool CMathsFuncs::isFinite(const TDenseVector::TBase& value) {
    return value.allFinite();
}
}
}
}
