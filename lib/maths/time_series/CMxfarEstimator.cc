/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/time_series/CMxfarEstimator.h>

#include <core/CLogger.h>

#include <maths/time_series/CAutoregressiveDesign.h>
#include <maths/time_series/CFunctionalCoefficientFieldEstimator.h>
#include <maths/time_series/CMixedLocalLinearCoefficientEstimator.h>
#include <maths/time_series/CPartialDirectedCoherence.h>
#include <maths/time_series/CReferenceSignalGrid.h>

namespace mxfar {
namespace maths {
namespace time_series {
namespace {
CMxfarEstimator::TCoherenceVec coherences(const CMxfarEstimator::TFieldVec& fields,
                                          const CMxfarEstimator::TDoubleVec& frequencies) {
    CMxfarEstimator::TCoherenceVec result;
    result.reserve(fields.size());
    for (const auto& field : fields) {
        CFarEstimator::SCoherence coherence;
        coherence.s_Frequencies = frequencies;
        coherence.s_Cells = CPartialDirectedCoherence::fpdc(field, frequencies);
        result.push_back(std::move(coherence));
    }
    return result;
}
}

CMxfarEstimator::SEstimate CMxfarEstimator::estimate(const TSizeVec& groupSizes,
                                                     std::size_t seriesLength,
                                                     const common::TDenseMatrix& y,
                                                     const common::TDenseVector& u,
                                                     const SFarParameters& params,
                                                     bool computeCoherence) {
    CMixedLocalLinearCoefficientEstimator estimator;
    return estimate(groupSizes, seriesLength, y, u, params, computeCoherence, estimator);
}

CMxfarEstimator::SEstimate CMxfarEstimator::estimate(const TSizeVec& groupSizes,
                                                     std::size_t seriesLength,
                                                     const common::TDenseMatrix& y,
                                                     const common::TDenseVector& u,
                                                     const SFarParameters& params,
                                                     bool computeCoherence,
                                                     const CLocalCoefficientEstimator& estimator) {
    params.validate();

    CAutoregressiveDesign design{CAutoregressiveDesign::buildStacked(
        groupSizes, seriesLength, y, u, params.s_Order, params.s_ReferenceLag)};

    LOG_DEBUG(<< "Estimating MXFAR " << params << " for " << design.numberSeries()
              << " series in " << design.numberGroups() << " groups");

    CReferenceSignalGrid grid{u, params.s_NumberPoints};

    CFunctionalCoefficientFieldEstimator fieldEstimator{estimator};
    auto local = fieldEstimator.estimate(design, grid, params.s_BandwidthProportion);

    std::size_t k{design.dimension()};

    SEstimate result;
    result.s_CutPoints = grid.cutPoints();
    result.s_EvaluationPoints = grid.evaluationPoints();
    result.s_GroupCoefficients.reserve(design.numberGroups());
    for (std::size_t s = 0; s < design.numberGroups(); ++s) {
        result.s_GroupCoefficients.push_back(
            CFunctionalCoefficientFieldEstimator::groupField(local, k, s));
    }

    result.s_SubjectCoefficients.reserve(design.numberSeries());
    result.s_Predictions = common::TDenseMatrix::missing(
        static_cast<std::ptrdiff_t>(design.numberRows()), static_cast<std::ptrdiff_t>(k));
    for (std::size_t i = 0; i < design.numberSeries(); ++i) {
        const auto& rows = design.series(i);
        result.s_SubjectCoefficients.push_back(
            CFunctionalCoefficientFieldEstimator::subjectField(local, k, i, rows.s_Group));
        result.s_Predictions.middleRows(
            static_cast<std::ptrdiff_t>(rows.s_Begin),
            static_cast<std::ptrdiff_t>(rows.s_End - rows.s_Begin)) =
            CFunctionalCoefficientFieldEstimator::predict(
                design, rows.s_Begin, rows.s_End, grid, result.s_SubjectCoefficients.back());
    }
    result.s_Residuals = design.responses() - result.s_Predictions;

    if (computeCoherence) {
        TDoubleVec frequencies{CPartialDirectedCoherence::fourierFrequencies(seriesLength)};
        result.s_GroupCoherence = coherences(result.s_GroupCoefficients, frequencies);
        result.s_SubjectCoherence = coherences(result.s_SubjectCoefficients, frequencies);
    }

    return result;
}
}
}
}
