/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/time_series/CLocalLinearCoefficientEstimator.h>

#include <core/CLogger.h>

#include <maths/common/CMathsFuncs.h>

#include <maths/time_series/CAutoregressiveDesign.h>

#include <Eigen/Cholesky>
#include <Eigen/QR>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace mxfar {
namespace maths {
namespace time_series {
namespace {
using TSizeVec = std::vector<std::size_t>;
using TDoubleVec = std::vector<double>;
}

CLocalLinearCoefficientEstimator::TOptionalLocalCoefficients
CLocalLinearCoefficientEstimator::estimate(const CAutoregressiveDesign& design,
                                           double point,
                                           double bandwidthProportion) const {
    auto localFit = fit(design, 0, design.numberRows(), point,
                        bandwidth(design, bandwidthProportion));
    if (localFit == std::nullopt) {
        return std::nullopt;
    }

    common::TDenseMatrix mean{levels(localFit->s_Coefficients)};
    common::TDenseMatrix derivative{slopes(localFit->s_Coefficients)};
    common::TDenseMatrix zero{common::TDenseMatrix::Zero(mean.rows(), mean.cols())};

    SLocalCoefficients result;
    result.s_GroupMeans.assign(design.numberGroups(), mean);
    result.s_GroupDerivatives.assign(design.numberGroups(), derivative);
    result.s_SubjectDeviations.assign(design.numberSeries(), zero);
    result.s_SubjectDerivativeDeviations.assign(design.numberSeries(), zero);
    return result;
}

std::string CLocalLinearCoefficientEstimator::description() const {
    return "local linear";
}

double CLocalLinearCoefficientEstimator::bandwidth(const CAutoregressiveDesign& design,
                                                   double bandwidthProportion) {
    double a{std::numeric_limits<double>::max()};
    double b{std::numeric_limits<double>::lowest()};
    const auto& references = design.references();
    for (std::ptrdiff_t i = 0; i < references.size(); ++i) {
        if (common::CMathsFuncs::isFinite(references(i))) {
            a = std::min(a, references(i));
            b = std::max(b, references(i));
        }
    }
    return b > a ? bandwidthProportion * (b - a) : 0.0;
}

CLocalLinearCoefficientEstimator::TOptionalLocalLinearFit
CLocalLinearCoefficientEstimator::fit(const CAutoregressiveDesign& design,
                                      std::size_t begin,
                                      std::size_t end,
                                      double point,
                                      double bandwidth) {

    if (!(bandwidth > 0.0) || common::CMathsFuncs::isFinite(bandwidth) == false) {
        LOG_TRACE(<< "Degenerate bandwidth " << bandwidth);
        return std::nullopt;
    }

    const auto& responses = design.responses();
    const auto& predictors = design.predictors();
    const auto& references = design.references();
    std::ptrdiff_t k{responses.cols()};
    std::ptrdiff_t kp{predictors.cols()};
    std::ptrdiff_t m{2 * kp};

    TSizeVec rows;
    TDoubleVec weights;
    for (std::size_t row = begin; row < end; ++row) {
        double u{references(row)};
        if (common::CMathsFuncs::isNan(u)) {
            continue;
        }
        double weight{kernel((u - point) / bandwidth)};
        if (weight > 0.0 && responses.row(row).allFinite() &&
            predictors.row(row).allFinite()) {
            rows.push_back(row);
            weights.push_back(weight);
        }
    }

    std::ptrdiff_t n{static_cast<std::ptrdiff_t>(rows.size())};
    if (n <= m) {
        LOG_TRACE(<< "Insufficient support " << n << " at " << point);
        return std::nullopt;
    }

    common::TDenseMatrix z(n, m);
    common::TDenseMatrix y(n, k);
    for (std::ptrdiff_t i = 0; i < n; ++i) {
        std::size_t row{rows[i]};
        double scale{std::sqrt(weights[i])};
        double offset{references(row) - point};
        z.block(i, 0, 1, kp) = scale * predictors.row(row);
        z.block(i, kp, 1, kp) = (scale * offset) * predictors.row(row);
        y.row(i) = scale * responses.row(row);
    }

    Eigen::ColPivHouseholderQR<common::TDenseMatrix::TBase> qr{z};
    if (qr.rank() < m) {
        LOG_TRACE(<< "Rank deficient local design at " << point);
        return std::nullopt;
    }

    SLocalLinearFit result;
    result.s_Coefficients = qr.solve(y);
    result.s_Support = static_cast<std::size_t>(n);

    Eigen::LDLT<common::TDenseMatrix::TBase> gram{z.transpose() * z};
    if (gram.info() != Eigen::Success) {
        LOG_TRACE(<< "Failed to invert local Gram matrix at " << point);
        return std::nullopt;
    }
    common::TDenseMatrix inverse{gram.solve(common::TDenseMatrix::TBase::Identity(m, m))};
    common::TDenseVector precision{inverse.diagonal()};
    common::TDenseMatrix residuals{y - z * result.s_Coefficients};
    double dof{static_cast<double>(n - m)};
    result.s_Variances.resize(m, k);
    for (std::ptrdiff_t j = 0; j < k; ++j) {
        result.s_Variances.col(j) = (residuals.col(j).squaredNorm() / dof) * precision;
    }

    return result;
}

common::TDenseMatrix CLocalLinearCoefficientEstimator::levels(const common::TDenseMatrix& coefficients) {
    return coefficients.topRows(coefficients.rows() / 2).transpose();
}

common::TDenseMatrix CLocalLinearCoefficientEstimator::slopes(const common::TDenseMatrix& coefficients) {
    return coefficients.bottomRows(coefficients.rows() / 2).transpose();
}

double CLocalLinearCoefficientEstimator::kernel(double x) {
    return std::fabs(x) < 1.0 ? 0.75 * (1.0 - x * x) : 0.0;
}
}
}
}
