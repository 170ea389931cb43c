/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/time_series/CMixedLocalLinearCoefficientEstimator.h>

#include <core/CLogger.h>

#include <maths/time_series/CAutoregressiveDesign.h>
#include <maths/time_series/CLocalLinearCoefficientEstimator.h>

#include <algorithm>
#include <vector>

namespace mxfar {
namespace maths {
namespace time_series {
namespace {
using TSizeVec = std::vector<std::size_t>;
using TLocalLinearFitVec = std::vector<CLocalLinearCoefficientEstimator::SLocalLinearFit>;

//! Compute the shrinkage factor of each coefficient of the fits \p members.
common::TDenseMatrix shrinkage(const TLocalLinearFitVec& fits,
                               const TSizeVec& members,
                               const common::TDenseMatrix& mean) {
    const auto& first = fits[members[0]].s_Coefficients;
    common::TDenseMatrix result{common::TDenseMatrix::Zero(first.rows(), first.cols())};
    if (members.size() < 2) {
        return result;
    }

    double n{static_cast<double>(members.size())};
    common::TDenseMatrix between{common::TDenseMatrix::Zero(first.rows(), first.cols())};
    common::TDenseMatrix within{common::TDenseMatrix::Zero(first.rows(), first.cols())};
    for (auto i : members) {
        between += (fits[i].s_Coefficients - mean).cwiseAbs2();
        within += fits[i].s_Variances;
    }
    between /= (n - 1.0);
    within /= n;

    for (std::ptrdiff_t j = 0; j < result.cols(); ++j) {
        for (std::ptrdiff_t i = 0; i < result.rows(); ++i) {
            double tau2{std::max(between(i, j) - within(i, j), 0.0)};
            double total{tau2 + within(i, j)};
            result(i, j) = total > 0.0 ? tau2 / total : 0.0;
        }
    }
    return result;
}
}

CMixedLocalLinearCoefficientEstimator::TOptionalLocalCoefficients
CMixedLocalLinearCoefficientEstimator::estimate(const CAutoregressiveDesign& design,
                                                double point,
                                                double bandwidthProportion) const {

    double bandwidth{CLocalLinearCoefficientEstimator::bandwidth(design, bandwidthProportion)};

    TLocalLinearFitVec fits;
    fits.reserve(design.numberSeries());
    for (std::size_t i = 0; i < design.numberSeries(); ++i) {
        const auto& rows = design.series(i);
        auto fit = CLocalLinearCoefficientEstimator::fit(design, rows.s_Begin,
                                                         rows.s_End, point, bandwidth);
        if (fit == std::nullopt) {
            LOG_TRACE(<< "Failed to fit series " << i << " at " << point);
            return std::nullopt;
        }
        fits.push_back(std::move(*fit));
    }

    SLocalCoefficients result;
    result.s_GroupMeans.resize(design.numberGroups());
    result.s_GroupDerivatives.resize(design.numberGroups());
    result.s_SubjectDeviations.resize(design.numberSeries());
    result.s_SubjectDerivativeDeviations.resize(design.numberSeries());

    for (std::size_t s = 0; s < design.numberGroups(); ++s) {
        TSizeVec members;
        for (std::size_t i = 0; i < design.numberSeries(); ++i) {
            if (design.series(i).s_Group == s) {
                members.push_back(i);
            }
        }

        common::TDenseMatrix mean{common::TDenseMatrix::Zero(
            fits[members[0]].s_Coefficients.rows(), fits[members[0]].s_Coefficients.cols())};
        for (auto i : members) {
            mean += fits[i].s_Coefficients;
        }
        mean /= static_cast<double>(members.size());

        common::TDenseMatrix lambda{shrinkage(fits, members, mean)};
        LOG_TRACE(<< "group " << s << " shrinkage at " << point << " = "
                  << lambda.mean());

        result.s_GroupMeans[s] = CLocalLinearCoefficientEstimator::levels(mean);
        result.s_GroupDerivatives[s] = CLocalLinearCoefficientEstimator::slopes(mean);
        for (auto i : members) {
            common::TDenseMatrix deviation{
                lambda.cwiseProduct(fits[i].s_Coefficients - mean)};
            result.s_SubjectDeviations[i] = CLocalLinearCoefficientEstimator::levels(deviation);
            result.s_SubjectDerivativeDeviations[i] =
                CLocalLinearCoefficientEstimator::slopes(deviation);
        }
    }

    return result;
}

std::string CMixedLocalLinearCoefficientEstimator::description() const {
    return "mixed effects local linear";
}
}
}
}
