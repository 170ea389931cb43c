/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/common/CBasicStatistics.h>

#include <maths/common/CMathsFuncs.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace mxfar {
namespace maths {
namespace common {

double CBasicStatistics::quantile(TDoubleVec values, double p) {
    if (!(p >= 0.0 && p <= 1.0)) {
        std::ostringstream message;
        message << "Input error: quantile " << p << " out of range [0, 1]";
        throw std::invalid_argument(message.str());
    }
    values.erase(std::remove_if(values.begin(), values.end(),
                                [](double x) { return CMathsFuncs::isFinite(x) == false; }),
                 values.end());
    if (values.empty()) {
        throw std::invalid_argument("Input error: no finite values for quantile");
    }

    double h{static_cast<double>(values.size() - 1) * p};
    std::size_t k{static_cast<std::size_t>(std::floor(h))};
    std::nth_element(values.begin(), values.begin() + k, values.end());
    double lower{values[k]};
    if (k + 1 >= values.size()) {
        return lower;
    }
    double upper{*std::min_element(values.begin() + k + 1, values.end())};
    return lower + (h - static_cast<double>(k)) * (upper - lower);
}

double CBasicStatistics::sumOfSquares(const TDenseMatrix::TBase& values) {
    double result{0.0};
    for (std::ptrdiff_t j = 0; j < values.cols(); ++j) {
        for (std::ptrdiff_t i = 0; i < values.rows(); ++i) {
            double x{values(i, j)};
            if (CMathsFuncs::isNan(x) == false) {
                result += x * x;
            }
        }
    }
    return result;
}

std::size_t CBasicStatistics::countNonMissing(const TDenseMatrix::TBase& values) {
    return static_cast<std::size_t>(values.size() - values.array().isNaN().count());
}

TDenseVector CBasicStatistics::columnMeans(const TDenseMatrix::TBase& values) {
    TDenseVector result(values.cols());
    for (std::ptrdiff_t j = 0; j < values.cols(); ++j) {
        SSampleMean<double>::TAccumulator moments;
        for (std::ptrdiff_t i = 0; i < values.rows(); ++i) {
            if (CMathsFuncs::isNan(values(i, j)) == false) {
                moments.add(values(i, j));
            }
        }
        result(j) = count(moments) > 0.0 ? mean(moments)
                                         : std::numeric_limits<double>::quiet_NaN();
    }
    return result;
}
}
}
}
