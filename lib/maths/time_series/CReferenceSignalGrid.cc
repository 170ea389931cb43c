/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/time_series/CReferenceSignalGrid.h>

#include <core/CLogger.h>

#include <maths/common/CBasicStatistics.h>

#include <algorithm>
#include <stdexcept>

namespace mxfar {
namespace maths {
namespace time_series {

CReferenceSignalGrid::CReferenceSignalGrid(const common::TDenseVector::TBase& reference,
                                           std::size_t numberPoints) {
    if (numberPoints < 2) {
        throw std::invalid_argument("Input error: need at least 2 grid points");
    }
    if (reference.size() == 0) {
        throw std::invalid_argument("Input error: empty reference signal");
    }

    TDoubleVec values(reference.data(), reference.data() + reference.size());
    double a{common::CBasicStatistics::quantile(values, LOWER_QUANTILE)};
    double b{common::CBasicStatistics::quantile(values, UPPER_QUANTILE)};
    double step{(b - a) / static_cast<double>(numberPoints - 1)};

    m_CutPoints.reserve(numberPoints);
    for (std::size_t i = 0; i + 1 < numberPoints; ++i) {
        m_CutPoints.push_back(a + static_cast<double>(i) * step);
    }
    m_CutPoints.push_back(b);

    m_EvaluationPoints.reserve(numberPoints + 1);
    m_EvaluationPoints.push_back(0.5 * (m_CutPoints[0] + m_CutPoints[1]) - step);
    for (std::size_t i = 0; i + 1 < numberPoints; ++i) {
        m_EvaluationPoints.push_back(0.5 * (m_CutPoints[i] + m_CutPoints[i + 1]));
    }
    m_EvaluationPoints.push_back(m_EvaluationPoints.back() + step);

    LOG_TRACE(<< "grid [" << a << ", " << b << "] with " << numberPoints << " cut points");
}

std::size_t CReferenceSignalGrid::numberCutPoints() const {
    return m_CutPoints.size();
}

std::size_t CReferenceSignalGrid::numberCells() const {
    return m_EvaluationPoints.size();
}

const CReferenceSignalGrid::TDoubleVec& CReferenceSignalGrid::cutPoints() const {
    return m_CutPoints;
}

const CReferenceSignalGrid::TDoubleVec& CReferenceSignalGrid::evaluationPoints() const {
    return m_EvaluationPoints;
}

std::size_t CReferenceSignalGrid::cell(double x) const {
    // The first cut point which is not less than x bounds x's cell on the right.
    return static_cast<std::size_t>(
        std::lower_bound(m_CutPoints.begin(), m_CutPoints.end(), x) - m_CutPoints.begin());
}
}
}
}
