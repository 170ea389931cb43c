/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/time_series/CFunctionalCoefficientFieldEstimator.h>

#include <core/CLogger.h>
#include <core/Concurrency.h>

#include <maths/common/CMathsFuncs.h>

#include <maths/time_series/CAutoregressiveDesign.h>
#include <maths/time_series/CReferenceSignalGrid.h>

#include <algorithm>
#include <limits>

namespace mxfar {
namespace maths {
namespace time_series {

CFunctionalCoefficientFieldEstimator::CFunctionalCoefficientFieldEstimator(const CLocalCoefficientEstimator& estimator)
    : m_Estimator{estimator} {
}

CFunctionalCoefficientFieldEstimator::TOptionalLocalCoefficientsVec
CFunctionalCoefficientFieldEstimator::estimate(const CAutoregressiveDesign& design,
                                               const CReferenceSignalGrid& grid,
                                               double bandwidthProportion) const {

    const auto& points = grid.evaluationPoints();
    TOptionalLocalCoefficientsVec result(points.size());

    core::parallel_for_each(0, points.size(), [&](std::size_t i) {
        result[i] = m_Estimator.estimate(design, points[i], bandwidthProportion);
    });

    std::size_t failed{static_cast<std::size_t>(
        std::count(result.begin(), result.end(), std::nullopt))};
    if (failed == result.size()) {
        LOG_WARN(<< "No " << m_Estimator.description() << " estimate succeeded on "
                 << points.size() << " grid points");
    } else {
        LOG_DEBUG(<< m_Estimator.description() << " estimation failed at " << failed
                  << " of " << points.size() << " grid points");
    }

    return result;
}

CFunctionalCoefficientField
CFunctionalCoefficientFieldEstimator::groupField(const TOptionalLocalCoefficientsVec& local,
                                                 std::size_t dimension,
                                                 std::size_t group) {
    CFunctionalCoefficientField::TOptionalDenseMatrixVec coefficients(local.size());
    for (std::size_t i = 0; i < local.size(); ++i) {
        if (local[i] != std::nullopt) {
            coefficients[i] = local[i]->s_GroupMeans[group];
        }
    }
    return CFunctionalCoefficientField(dimension, std::move(coefficients));
}

CFunctionalCoefficientField
CFunctionalCoefficientFieldEstimator::subjectField(const TOptionalLocalCoefficientsVec& local,
                                                   std::size_t dimension,
                                                   std::size_t series,
                                                   std::size_t group) {
    CFunctionalCoefficientField::TOptionalDenseMatrixVec coefficients(local.size());
    for (std::size_t i = 0; i < local.size(); ++i) {
        if (local[i] != std::nullopt) {
            coefficients[i] = local[i]->subjectCoefficients(series, group);
        }
    }
    return CFunctionalCoefficientField(dimension, std::move(coefficients));
}

common::TDenseMatrix
CFunctionalCoefficientFieldEstimator::predict(const CAutoregressiveDesign& design,
                                              std::size_t begin,
                                              std::size_t end,
                                              const CReferenceSignalGrid& grid,
                                              const CFunctionalCoefficientField& field) {
    const auto& predictors = design.predictors();
    const auto& references = design.references();
    common::TDenseMatrix result{common::TDenseMatrix::missing(
        static_cast<std::ptrdiff_t>(end - begin), static_cast<std::ptrdiff_t>(design.dimension()))};
    for (std::size_t row = begin; row < end; ++row) {
        double u{references(row)};
        if (common::CMathsFuncs::isNan(u)) {
            continue;
        }
        common::TDenseVector x{predictors.row(row).transpose()};
        result.row(row - begin) = field.predict(grid.cell(u), x).transpose();
    }
    return result;
}
}
}
}
