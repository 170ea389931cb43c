/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/time_series/CFarEstimator.h>

#include <core/CLogger.h>

#include <maths/time_series/CAutoregressiveDesign.h>
#include <maths/time_series/CFunctionalCoefficientFieldEstimator.h>
#include <maths/time_series/CLocalLinearCoefficientEstimator.h>
#include <maths/time_series/CReferenceSignalGrid.h>

namespace mxfar {
namespace maths {
namespace time_series {

CFarEstimator::SEstimate CFarEstimator::estimate(const common::TDenseMatrix& y,
                                                 const common::TDenseVector& u,
                                                 const SFarParameters& params,
                                                 bool computeCoherence) {
    CLocalLinearCoefficientEstimator estimator;
    return estimate(y, u, params, computeCoherence, estimator);
}

CFarEstimator::SEstimate CFarEstimator::estimate(const common::TDenseMatrix& y,
                                                 const common::TDenseVector& u,
                                                 const SFarParameters& params,
                                                 bool computeCoherence,
                                                 const CLocalCoefficientEstimator& estimator) {
    params.validate();

    LOG_DEBUG(<< "Estimating FAR " << params << " for " << y.rows() << " x "
              << y.cols() << " series");

    CAutoregressiveDesign design{CAutoregressiveDesign::build(
        y, u, params.s_Order, params.s_ReferenceLag)};
    CReferenceSignalGrid grid{u, params.s_NumberPoints};

    CFunctionalCoefficientFieldEstimator fieldEstimator{estimator};
    auto local = fieldEstimator.estimate(design, grid, params.s_BandwidthProportion);

    SEstimate result;
    result.s_CutPoints = grid.cutPoints();
    result.s_EvaluationPoints = grid.evaluationPoints();
    result.s_Coefficients = CFunctionalCoefficientFieldEstimator::groupField(
        local, design.dimension(), 0);
    result.s_Predictions = CFunctionalCoefficientFieldEstimator::predict(
        design, 0, design.numberRows(), grid, result.s_Coefficients);
    result.s_Residuals = design.responses() - result.s_Predictions;

    LOG_DEBUG(<< result.s_Coefficients.numberMissing() << " of "
              << result.s_Coefficients.size() << " cells missing");

    if (computeCoherence) {
        SCoherence coherence;
        coherence.s_Frequencies =
            CPartialDirectedCoherence::fourierFrequencies(static_cast<std::size_t>(y.rows()));
        coherence.s_Cells = CPartialDirectedCoherence::fpdc(result.s_Coefficients,
                                                           coherence.s_Frequencies);
        result.s_Coherence = std::move(coherence);
    }

    return result;
}
}
}
}
