/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CMxfarAnalysisRunner.h>

#include <core/CLogger.h>

#include <api/CMxfarJsonOutputWriter.h>

#include <maths/time_series/CFarCrossValidation.h>
#include <maths/time_series/CFarEstimator.h>
#include <maths/time_series/CMxfarEstimator.h>

#include <numeric>
#include <sstream>
#include <stdexcept>

namespace mxfar {
namespace api {
namespace {
const std::string ESTIMATE{"estimate"};
const std::string MXFAR{"mxfar"};
const std::string APE{"ape"};
const std::string NLTEST{"nltest"};
}

CMxfarAnalysisRunner::SConfig::SConfig() : s_Parameters{1, 1} {
}

CMxfarAnalysisRunner::CMxfarAnalysisRunner(SConfig config, CMxfarJsonOutputWriter& writer)
    : m_Config{std::move(config)}, m_Writer{writer} {
}

void CMxfarAnalysisRunner::run(const CStackedSeriesCsvParser::SStackedSeries& series) const {
    auto rows = static_cast<std::size_t>(series.s_Y.rows());
    TSizeVec groupSizes{m_Config.s_GroupSizes};
    std::size_t seriesLength{m_Config.s_SeriesLength};
    resolveLayout(rows, groupSizes, seriesLength);

    const auto& params = m_Config.s_Parameters;
    LOG_INFO(<< "Running " << analysisToString(m_Config.s_Analysis) << " " << params
             << " on " << rows / seriesLength << " series of length " << seriesLength);

    switch (m_Config.s_Analysis) {
    case E_Estimate: {
        if (rows != seriesLength) {
            std::ostringstream error;
            error << "Input error: estimate expects a single series but got "
                  << rows / seriesLength << " series";
            throw std::invalid_argument(error.str());
        }
        auto estimate = maths::time_series::CFarEstimator::estimate(
            series.s_Y, series.s_U, params, m_Config.s_ComputeCoherence);
        if (estimate.s_Coefficients.numberMissing() > 0) {
            LOG_INFO(<< estimate.s_Coefficients.numberMissing() << " of "
                     << estimate.s_Coefficients.size() << " grid cells have no estimate");
        }
        m_Writer.writeFarEstimate(params, series.s_DimensionNames, estimate);
        break;
    }
    case E_Mxfar: {
        auto estimate = maths::time_series::CMxfarEstimator::estimate(
            groupSizes, seriesLength, series.s_Y, series.s_U, params,
            m_Config.s_ComputeCoherence);
        m_Writer.writeMxfarEstimate(params, series.s_DimensionNames, estimate);
        break;
    }
    case E_PredictionError: {
        double error{maths::time_series::CFarCrossValidation::accumulatedPredictionError(
            groupSizes, seriesLength, series.s_Y, series.s_U, params,
            m_Config.s_Horizon, m_Config.s_Folds)};
        LOG_INFO(<< "APE = " << error);
        m_Writer.writePredictionError(params, m_Config.s_Horizon, m_Config.s_Folds, error);
        break;
    }
    case E_NonlinearityTest: {
        auto result = maths::time_series::CFarNonlinearityTest::test(
            groupSizes, seriesLength, series.s_Y, series.s_U, params,
            m_Config.s_TestParameters);
        if (result.s_PValue != std::nullopt) {
            LOG_INFO(<< "Nonlinearity statistic = " << result.s_Statistic
                     << ", p-value = " << *result.s_PValue);
        } else {
            LOG_WARN(<< "No bootstrap replicate succeeded so there is no p-value");
        }
        m_Writer.writeNonlinearityTest(params, result);
        break;
    }
    }
}

bool CMxfarAnalysisRunner::analysisFromString(const std::string& name, EAnalysis& analysis) {
    if (name == ESTIMATE) {
        analysis = E_Estimate;
    } else if (name == MXFAR) {
        analysis = E_Mxfar;
    } else if (name == APE) {
        analysis = E_PredictionError;
    } else if (name == NLTEST) {
        analysis = E_NonlinearityTest;
    } else {
        LOG_ERROR(<< "Unknown analysis '" << name << "'");
        return false;
    }
    return true;
}

const std::string& CMxfarAnalysisRunner::analysisToString(EAnalysis analysis) {
    switch (analysis) {
    case E_Estimate:
        return ESTIMATE;
    case E_Mxfar:
        return MXFAR;
    case E_PredictionError:
        return APE;
    case E_NonlinearityTest:
        break;
    }
    return NLTEST;
}

void CMxfarAnalysisRunner::resolveLayout(std::size_t numberRows,
                                         TSizeVec& groupSizes,
                                         std::size_t& seriesLength) {
    if (numberRows == 0) {
        throw std::invalid_argument("Input error: no rows");
    }
    std::size_t numberSeries{std::accumulate(groupSizes.begin(), groupSizes.end(),
                                             std::size_t{0})};
    if (groupSizes.empty() == false && numberSeries == 0) {
        throw std::invalid_argument("Input error: group sizes sum to zero");
    }

    if (seriesLength == 0) {
        std::size_t n{groupSizes.empty() ? 1 : numberSeries};
        if (numberRows % n != 0) {
            std::ostringstream error;
            error << "Input error: " << numberRows << " rows can't be split into "
                  << n << " series of equal length";
            throw std::invalid_argument(error.str());
        }
        seriesLength = numberRows / n;
    }
    if (groupSizes.empty()) {
        if (numberRows % seriesLength != 0) {
            std::ostringstream error;
            error << "Input error: " << numberRows
                  << " rows isn't a multiple of the series length " << seriesLength;
            throw std::invalid_argument(error.str());
        }
        groupSizes.push_back(numberRows / seriesLength);
        numberSeries = groupSizes.back();
    }
    if (numberSeries * seriesLength != numberRows) {
        std::ostringstream error;
        error << "Input error: " << numberSeries << " series of length " << seriesLength
              << " need " << numberSeries * seriesLength << " rows but got " << numberRows;
        throw std::invalid_argument(error.str());
    }
}
}
}
