/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/time_series/CFarCrossValidation.h>

#include <core/CLogger.h>
#include <core/Concurrency.h>

#include <maths/common/CBasicStatistics.h>

#include <maths/time_series/CAutoregressiveDesign.h>
#include <maths/time_series/CFunctionalCoefficientFieldEstimator.h>
#include <maths/time_series/CLocalLinearCoefficientEstimator.h>
#include <maths/time_series/CReferenceSignalGrid.h>

#include <cmath>
#include <stdexcept>
#include <string>

namespace mxfar {
namespace maths {
namespace time_series {
namespace {
using TMeanAccumulator = common::CBasicStatistics::SSampleMean<double>::TAccumulator;

void checkFolds(std::size_t seriesLength,
                const SFarParameters& params,
                std::size_t horizon,
                std::size_t folds) {
    if (horizon == 0) {
        throw std::invalid_argument{"Input error: prediction horizon must be positive"};
    }
    if (folds == 0) {
        throw std::invalid_argument{"Input error: number of folds must be positive"};
    }
    if (folds * horizon >= seriesLength ||
        seriesLength - folds * horizon <= params.maximumLag()) {
        throw std::invalid_argument{
            "Input error: series of length " + std::to_string(seriesLength) +
            " is too short for " + std::to_string(folds) + " folds of " +
            std::to_string(horizon) + " values with maximum lag " +
            std::to_string(params.maximumLag())};
    }
}

//! Accumulate the prediction error of the series in rows [\p begin, \p end)
//! of \p design whose values are \p y and \p u.
double predictionError(const CAutoregressiveDesign& design,
                       std::size_t begin,
                       const common::TDenseMatrix& y,
                       const common::TDenseVector& u,
                       const SFarParameters& params,
                       std::size_t horizon,
                       std::size_t folds) {

    std::size_t length{static_cast<std::size_t>(y.rows())};
    std::size_t m{params.maximumLag()};
    CLocalLinearCoefficientEstimator estimator;
    CFunctionalCoefficientFieldEstimator fieldEstimator{estimator};

    double result{0.0};
    for (std::size_t q = 1; q <= folds; ++q) {
        std::size_t truncated{length - q * horizon};
        double bandwidthProportion{
            params.s_BandwidthProportion *
            std::pow(static_cast<double>(length) / static_cast<double>(truncated), 0.2)};

        common::TDenseMatrix yq{common::TDenseMatrix::rowRange(
            y, 0, static_cast<std::ptrdiff_t>(truncated))};
        common::TDenseVector uq{u.head(static_cast<std::ptrdiff_t>(truncated))};

        CAutoregressiveDesign designq{CAutoregressiveDesign::build(
            yq, uq, params.s_Order, params.s_ReferenceLag)};
        CReferenceSignalGrid grid{uq, params.s_NumberPoints};
        auto field = CFunctionalCoefficientFieldEstimator::groupField(
            fieldEstimator.estimate(designq, grid, bandwidthProportion),
            design.dimension(), 0);

        std::size_t first{begin + truncated - m};
        common::TDenseMatrix predictions{CFunctionalCoefficientFieldEstimator::predict(
            design, first, first + horizon, grid, field)};
        common::TDenseMatrix errors{
            design.responses().middleRows(static_cast<std::ptrdiff_t>(first),
                                          static_cast<std::ptrdiff_t>(horizon)) -
            predictions};

        double error{common::CBasicStatistics::sumOfSquares(errors)};
        LOG_TRACE(<< "fold " << q << " bandwidth = " << bandwidthProportion
                  << " error = " << error);
        result += error;
    }
    return result;
}
}

double CFarCrossValidation::accumulatedPredictionError(const TSizeVec& groupSizes,
                                                       std::size_t seriesLength,
                                                       const common::TDenseMatrix& y,
                                                       const common::TDenseVector& u,
                                                       const SFarParameters& params,
                                                       std::size_t horizon,
                                                       std::size_t folds) {
    params.validate();
    checkFolds(seriesLength, params, horizon, folds);

    CAutoregressiveDesign design{CAutoregressiveDesign::buildStacked(
        groupSizes, seriesLength, y, u, params.s_Order, params.s_ReferenceLag)};

    LOG_DEBUG(<< "Computing APE for " << design.numberSeries() << " series with horizon "
              << horizon << " and " << folds << " folds");

    std::vector<double> errors(design.numberSeries(), 0.0);
    core::parallel_for_each(0, design.numberSeries(), [&](std::size_t i) {
        auto offset = static_cast<std::ptrdiff_t>(i * seriesLength);
        auto length = static_cast<std::ptrdiff_t>(seriesLength);
        common::TDenseMatrix yi{common::TDenseMatrix::rowRange(y, offset, offset + length)};
        common::TDenseVector ui{u.segment(offset, length)};
        errors[i] = predictionError(design, design.series(i).s_Begin, yi, ui,
                                    params, horizon, folds);
    });

    TMeanAccumulator result;
    for (auto error : errors) {
        result.add(error);
    }
    return common::CBasicStatistics::mean(result);
}

double CFarCrossValidation::seriesPredictionError(const common::TDenseMatrix& y,
                                                  const common::TDenseVector& u,
                                                  const SFarParameters& params,
                                                  std::size_t horizon,
                                                  std::size_t folds) {
    params.validate();
    checkFolds(static_cast<std::size_t>(y.rows()), params, horizon, folds);

    CAutoregressiveDesign design{CAutoregressiveDesign::build(
        y, u, params.s_Order, params.s_ReferenceLag)};
    return predictionError(design, 0, y, u, params, horizon, folds);
}
}
}
}
