/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/time_series/CVectorAutoregression.h>

#include <core/CLogger.h>

#include <Eigen/QR>

#include <vector>

namespace mxfar {
namespace maths {
namespace time_series {

CVectorAutoregression::TOptionalFit
CVectorAutoregression::fit(const common::TDenseMatrix& y, std::size_t order) {

    std::ptrdiff_t k{y.cols()};
    std::ptrdiff_t p{static_cast<std::ptrdiff_t>(order)};
    std::ptrdiff_t n{y.rows() - p};

    if (order == 0 || k == 0 || n <= k * p) {
        LOG_DEBUG(<< "Too few values " << y.rows() << " to fit VAR(" << order << ")");
        return std::nullopt;
    }

    common::TDenseMatrix x(n, k * p);
    for (std::ptrdiff_t l = 0; l < p; ++l) {
        x.middleCols(k * l, k) = y.middleRows(p - l - 1, n);
    }
    common::TDenseMatrix responses{y.bottomRows(n)};

    std::vector<std::ptrdiff_t> complete;
    complete.reserve(static_cast<std::size_t>(n));
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        if (x.row(i).allFinite() && responses.row(i).allFinite()) {
            complete.push_back(i);
        }
    }
    auto numberComplete = static_cast<std::ptrdiff_t>(complete.size());
    if (numberComplete <= k * p) {
        LOG_DEBUG(<< "Only " << numberComplete << " of " << n
                  << " rows have no missing values, too few to fit VAR(" << order << ")");
        return std::nullopt;
    }
    if (numberComplete < n) {
        LOG_TRACE(<< "Dropping " << n - numberComplete << " rows with missing values");
    }

    common::TDenseMatrix xc(numberComplete, k * p);
    common::TDenseMatrix yc(numberComplete, k);
    for (std::ptrdiff_t i = 0; i < numberComplete; ++i) {
        xc.row(i) = x.row(complete[i]);
        yc.row(i) = responses.row(complete[i]);
    }

    Eigen::ColPivHouseholderQR<common::TDenseMatrix::TBase> qr{xc};
    if (qr.rank() < xc.cols()) {
        LOG_DEBUG(<< "VAR(" << order << ") design is rank deficient, rank = "
                  << qr.rank() << " columns = " << xc.cols());
        return std::nullopt;
    }

    common::TDenseMatrix solution{qr.solve(yc)};
    SFit result;
    result.s_Coefficients = solution.transpose();
    // Rows with missing lags get missing fitted values and rows with a
    // missing response get missing residuals.
    result.s_Fitted = x * solution;
    result.s_Residuals = responses - result.s_Fitted;
    return result;
}
}
}
}
