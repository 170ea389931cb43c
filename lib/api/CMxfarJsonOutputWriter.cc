/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CMxfarJsonOutputWriter.h>

#include <core/CLogger.h>

#include <maths/common/CMathsFuncs.h>

#include <ostream>

namespace json = boost::json;
namespace mxfar {
namespace api {
namespace {
using TDoubleVec = CMxfarJsonOutputWriter::TDoubleVec;
using TStrVec = CMxfarJsonOutputWriter::TStrVec;

json::array toArray(const TDoubleVec& values) {
    json::array result;
    result.reserve(values.size());
    for (auto value : values) {
        result.push_back(CMxfarJsonOutputWriter::toJson(value));
    }
    return result;
}

json::array toArray(const TStrVec& values) {
    json::array result;
    result.reserve(values.size());
    for (const auto& value : values) {
        result.emplace_back(value);
    }
    return result;
}
}

const std::string CMxfarJsonOutputWriter::ANALYSIS{"analysis"};
const std::string CMxfarJsonOutputWriter::PARAMETERS{"parameters"};
const std::string CMxfarJsonOutputWriter::ORDER{"order"};
const std::string CMxfarJsonOutputWriter::REFERENCE_LAG{"reference_lag"};
const std::string CMxfarJsonOutputWriter::BANDWIDTH_PROPORTION{"bandwidth_proportion"};
const std::string CMxfarJsonOutputWriter::NUMBER_POINTS{"number_points"};
const std::string CMxfarJsonOutputWriter::DIMENSIONS{"dimensions"};
const std::string CMxfarJsonOutputWriter::CUT_POINTS{"cut_points"};
const std::string CMxfarJsonOutputWriter::EVALUATION_POINTS{"evaluation_points"};
const std::string CMxfarJsonOutputWriter::COEFFICIENTS{"coefficients"};
const std::string CMxfarJsonOutputWriter::GROUP_COEFFICIENTS{"group_coefficients"};
const std::string CMxfarJsonOutputWriter::SUBJECT_COEFFICIENTS{"subject_coefficients"};
const std::string CMxfarJsonOutputWriter::PREDICTIONS{"predictions"};
const std::string CMxfarJsonOutputWriter::RESIDUALS{"residuals"};
const std::string CMxfarJsonOutputWriter::COHERENCE{"coherence"};
const std::string CMxfarJsonOutputWriter::GROUP_COHERENCE{"group_coherence"};
const std::string CMxfarJsonOutputWriter::SUBJECT_COHERENCE{"subject_coherence"};
const std::string CMxfarJsonOutputWriter::FREQUENCIES{"frequencies"};
const std::string CMxfarJsonOutputWriter::CELLS{"cells"};
const std::string CMxfarJsonOutputWriter::HORIZON{"horizon"};
const std::string CMxfarJsonOutputWriter::FOLDS{"folds"};
const std::string CMxfarJsonOutputWriter::PREDICTION_ERROR{"prediction_error"};
const std::string CMxfarJsonOutputWriter::STATISTIC{"statistic"};
const std::string CMxfarJsonOutputWriter::BOOTSTRAP_STATISTICS{"bootstrap_statistics"};
const std::string CMxfarJsonOutputWriter::P_VALUE{"p_value"};

CMxfarJsonOutputWriter::CMxfarJsonOutputWriter(std::ostream& strmOut)
    : m_StrmOut{strmOut} {
}

void CMxfarJsonOutputWriter::writeFarEstimate(const maths::time_series::SFarParameters& params,
                                              const TStrVec& dimensionNames,
                                              const maths::time_series::CFarEstimator::SEstimate& estimate) {
    auto doc = document("far", params);
    doc[DIMENSIONS] = toArray(dimensionNames);
    doc[CUT_POINTS] = toArray(estimate.s_CutPoints);
    doc[EVALUATION_POINTS] = toArray(estimate.s_EvaluationPoints);
    doc[COEFFICIENTS] = toJson(estimate.s_Coefficients);
    doc[PREDICTIONS] = toJson(estimate.s_Predictions);
    doc[RESIDUALS] = toJson(estimate.s_Residuals);
    if (estimate.s_Coherence != std::nullopt) {
        doc[COHERENCE] = toJson(*estimate.s_Coherence);
    }
    this->write(doc);
}

void CMxfarJsonOutputWriter::writeMxfarEstimate(const maths::time_series::SFarParameters& params,
                                                const TStrVec& dimensionNames,
                                                const maths::time_series::CMxfarEstimator::SEstimate& estimate) {
    auto doc = document("mxfar", params);
    doc[DIMENSIONS] = toArray(dimensionNames);
    doc[CUT_POINTS] = toArray(estimate.s_CutPoints);
    doc[EVALUATION_POINTS] = toArray(estimate.s_EvaluationPoints);

    json::array groups;
    for (const auto& field : estimate.s_GroupCoefficients) {
        groups.push_back(toJson(field));
    }
    doc[GROUP_COEFFICIENTS] = std::move(groups);

    json::array subjects;
    for (const auto& field : estimate.s_SubjectCoefficients) {
        subjects.push_back(toJson(field));
    }
    doc[SUBJECT_COEFFICIENTS] = std::move(subjects);

    doc[PREDICTIONS] = toJson(estimate.s_Predictions);
    doc[RESIDUALS] = toJson(estimate.s_Residuals);

    if (estimate.s_GroupCoherence != std::nullopt) {
        json::array coherence;
        for (const auto& group : *estimate.s_GroupCoherence) {
            coherence.push_back(toJson(group));
        }
        doc[GROUP_COHERENCE] = std::move(coherence);
    }
    if (estimate.s_SubjectCoherence != std::nullopt) {
        json::array coherence;
        for (const auto& subject : *estimate.s_SubjectCoherence) {
            coherence.push_back(toJson(subject));
        }
        doc[SUBJECT_COHERENCE] = std::move(coherence);
    }
    this->write(doc);
}

void CMxfarJsonOutputWriter::writePredictionError(const maths::time_series::SFarParameters& params,
                                                  std::size_t horizon,
                                                  std::size_t folds,
                                                  double error) {
    auto doc = document("ape", params);
    doc[HORIZON] = horizon;
    doc[FOLDS] = folds;
    doc[PREDICTION_ERROR] = toJson(error);
    this->write(doc);
}

void CMxfarJsonOutputWriter::writeNonlinearityTest(
    const maths::time_series::SFarParameters& params,
    const maths::time_series::CFarNonlinearityTest::SResult& result) {
    auto doc = document("nltest", params);
    doc[STATISTIC] = toJson(result.s_Statistic);
    json::array bootstrap;
    bootstrap.reserve(result.s_BootstrapStatistics.size());
    for (const auto& statistic : result.s_BootstrapStatistics) {
        bootstrap.push_back(statistic != std::nullopt ? toJson(*statistic) : json::value{});
    }
    doc[BOOTSTRAP_STATISTICS] = std::move(bootstrap);
    doc[P_VALUE] = result.s_PValue != std::nullopt ? toJson(*result.s_PValue) : json::value{};
    this->write(doc);
}

json::value CMxfarJsonOutputWriter::toJson(double value) {
    if (maths::common::CMathsFuncs::isFinite(value) == false) {
        return nullptr;
    }
    return value;
}

json::array CMxfarJsonOutputWriter::toJson(const maths::common::TDenseMatrix::TBase& matrix) {
    json::array result;
    result.reserve(static_cast<std::size_t>(matrix.rows()));
    for (std::ptrdiff_t i = 0; i < matrix.rows(); ++i) {
        json::array row;
        row.reserve(static_cast<std::size_t>(matrix.cols()));
        for (std::ptrdiff_t j = 0; j < matrix.cols(); ++j) {
            row.push_back(toJson(matrix(i, j)));
        }
        result.push_back(std::move(row));
    }
    return result;
}

json::array CMxfarJsonOutputWriter::toJson(const maths::time_series::CFunctionalCoefficientField& field) {
    json::array result;
    result.reserve(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field.missing(i)) {
            result.emplace_back(nullptr);
        } else {
            result.push_back(toJson(*field[i]));
        }
    }
    return result;
}

json::object CMxfarJsonOutputWriter::toJson(const maths::time_series::CFarEstimator::SCoherence& coherence) {
    json::object result;
    result[FREQUENCIES] = toArray(coherence.s_Frequencies);
    json::array cells;
    cells.reserve(coherence.s_Cells.size());
    for (const auto& cell : coherence.s_Cells) {
        if (cell == std::nullopt) {
            cells.emplace_back(nullptr);
            continue;
        }
        json::array pdcs;
        pdcs.reserve(cell->size());
        for (const auto& pdc : *cell) {
            pdcs.push_back(toJson(pdc));
        }
        cells.push_back(std::move(pdcs));
    }
    result[CELLS] = std::move(cells);
    return result;
}

json::object CMxfarJsonOutputWriter::document(const std::string& analysis,
                                              const maths::time_series::SFarParameters& params) {
    json::object parameters;
    parameters[ORDER] = params.s_Order;
    parameters[REFERENCE_LAG] = params.s_ReferenceLag;
    parameters[BANDWIDTH_PROPORTION] = params.s_BandwidthProportion;
    parameters[NUMBER_POINTS] = params.s_NumberPoints;

    json::object result;
    result[ANALYSIS] = analysis;
    result[PARAMETERS] = std::move(parameters);
    return result;
}

void CMxfarJsonOutputWriter::write(const json::object& doc) {
    m_StrmOut << json::serialize(doc) << '\n';
    m_StrmOut.flush();
    if (m_StrmOut.fail()) {
        LOG_ERROR(<< "Failed writing " << doc.at(ANALYSIS).as_string() << " result");
    }
}
}
}
