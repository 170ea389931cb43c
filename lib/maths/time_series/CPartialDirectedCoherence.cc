/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/time_series/CPartialDirectedCoherence.h>

#include <maths/time_series/CFunctionalCoefficientField.h>

#include <boost/math/constants/constants.hpp>

#include <complex>
#include <stdexcept>
#include <string>

namespace mxfar {
namespace maths {
namespace time_series {
namespace {
using TComplex = std::complex<double>;

common::TDenseMatrix coherence(const common::TComplexMatrix& a) {
    std::ptrdiff_t k{a.rows()};
    common::TDenseMatrix result(k, k);
    for (std::ptrdiff_t j = 0; j < k; ++j) {
        double norm{a.col(j).norm()};
        for (std::ptrdiff_t i = 0; i < k; ++i) {
            result(i, j) = std::abs(a(i, j)) / norm;
        }
    }
    return result;
}
}

CPartialDirectedCoherence::TDoubleVec
CPartialDirectedCoherence::fourierFrequencies(std::size_t length) {
    TDoubleVec result;
    result.reserve(length / 2);
    for (std::size_t i = 1; i <= length / 2; ++i) {
        result.push_back(static_cast<double>(i) / static_cast<double>(length));
    }
    return result;
}

CPartialDirectedCoherence::TDenseMatrixVec
CPartialDirectedCoherence::pdc(const TDenseMatrixVec& lags, const TDoubleVec& frequencies) {
    if (lags.empty()) {
        throw std::invalid_argument{"Input error: no lag coefficients"};
    }
    std::ptrdiff_t k{lags[0].rows()};
    for (const auto& lag : lags) {
        if (lag.rows() != k || lag.cols() != k) {
            throw std::invalid_argument{"Input error: lag coefficients must be " +
                                        std::to_string(k) + " x " + std::to_string(k)};
        }
    }

    const double twoPi{boost::math::double_constants::two_pi};

    TDenseMatrixVec result;
    result.reserve(frequencies.size());
    for (auto f : frequencies) {
        common::TComplexMatrix a{common::TComplexMatrix::TBase::Identity(k, k)};
        for (std::size_t l = 0; l < lags.size(); ++l) {
            TComplex phase{std::polar(1.0, -twoPi * f * static_cast<double>(l + 1))};
            a -= phase * lags[l].cast<TComplex>();
        }
        result.push_back(coherence(a));
    }
    return result;
}

CPartialDirectedCoherence::TDenseMatrixVec
CPartialDirectedCoherence::pdcStacked(const common::TDenseMatrix& coefficients,
                                      const TDoubleVec& frequencies) {
    std::ptrdiff_t k{coefficients.rows()};
    if (k == 0 || coefficients.cols() % k != 0) {
        throw std::invalid_argument{"Input error: stacked coefficients have " +
                                    std::to_string(coefficients.cols()) +
                                    " columns which isn't a multiple of " +
                                    std::to_string(k)};
    }
    TDenseMatrixVec lags;
    lags.reserve(static_cast<std::size_t>(coefficients.cols() / k));
    for (std::ptrdiff_t l = 0; l < coefficients.cols(); l += k) {
        lags.emplace_back(coefficients.middleCols(l, k));
    }
    return pdc(lags, frequencies);
}

CPartialDirectedCoherence::TOptionalDenseMatrixVecVec
CPartialDirectedCoherence::fpdc(const CFunctionalCoefficientField& field,
                                const TDoubleVec& frequencies) {
    TOptionalDenseMatrixVecVec result(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field.missing(i) == false) {
            result[i] = pdcStacked(*field[i], frequencies);
        }
    }
    return result;
}
}
}
}
