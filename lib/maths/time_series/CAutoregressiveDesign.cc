/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/time_series/CAutoregressiveDesign.h>

#include <core/CLogger.h>

#include <algorithm>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace mxfar {
namespace maths {
namespace time_series {
namespace {
void checkLags(std::size_t order, std::size_t referenceLag) {
    if (order == 0) {
        throw std::invalid_argument("Input error: order must be positive");
    }
    if (referenceLag == 0) {
        throw std::invalid_argument("Input error: reference lag must be positive");
    }
}

void checkLength(std::size_t length, std::size_t maximumLag) {
    if (length <= maximumLag) {
        std::ostringstream error;
        error << "Input error: series length " << length
              << " must exceed max(p, d) = " << maximumLag;
        throw std::invalid_argument(error.str());
    }
}
}

CAutoregressiveDesign CAutoregressiveDesign::build(const common::TDenseMatrix& y,
                                                   const common::TDenseVector& u,
                                                   std::size_t order,
                                                   std::size_t referenceLag) {
    checkLags(order, referenceLag);
    std::size_t length{static_cast<std::size_t>(y.rows())};
    if (static_cast<std::size_t>(u.size()) != length) {
        std::ostringstream error;
        error << "Input error: mismatched series length " << length
              << " and reference length " << u.size();
        throw std::invalid_argument(error.str());
    }
    if (y.cols() == 0) {
        throw std::invalid_argument("Input error: zero dimension series");
    }
    std::size_t maximumLag{std::max(order, referenceLag)};
    checkLength(length, maximumLag);

    CAutoregressiveDesign result{static_cast<std::size_t>(y.cols()), order,
                                 referenceLag, length - maximumLag};
    result.addSeries(y, u, 0, length, 0);
    result.m_NumberGroups = 1;
    return result;
}

CAutoregressiveDesign CAutoregressiveDesign::buildStacked(const TSizeVec& groupSizes,
                                                          std::size_t seriesLength,
                                                          const common::TDenseMatrix& y,
                                                          const common::TDenseVector& u,
                                                          std::size_t order,
                                                          std::size_t referenceLag) {
    checkLags(order, referenceLag);
    if (groupSizes.empty() ||
        std::find(groupSizes.begin(), groupSizes.end(), 0) != groupSizes.end()) {
        throw std::invalid_argument("Input error: every group needs at least one series");
    }
    std::size_t numberSeries{std::accumulate(groupSizes.begin(), groupSizes.end(),
                                             std::size_t{0})};
    std::size_t rows{numberSeries * seriesLength};
    if (static_cast<std::size_t>(y.rows()) != rows ||
        static_cast<std::size_t>(u.size()) != rows) {
        std::ostringstream error;
        error << "Input error: expected " << numberSeries << " series of length "
              << seriesLength << " (" << rows << " rows), got " << y.rows()
              << " observations and " << u.size() << " reference values";
        throw std::invalid_argument(error.str());
    }
    if (y.cols() == 0) {
        throw std::invalid_argument("Input error: zero dimension series");
    }
    std::size_t maximumLag{std::max(order, referenceLag)};
    checkLength(seriesLength, maximumLag);

    CAutoregressiveDesign result{static_cast<std::size_t>(y.cols()), order, referenceLag,
                                 numberSeries * (seriesLength - maximumLag)};
    std::size_t offset{0};
    for (std::size_t group = 0; group < groupSizes.size(); ++group) {
        for (std::size_t i = 0; i < groupSizes[group]; ++i, offset += seriesLength) {
            result.addSeries(y, u, offset, seriesLength, group);
        }
    }
    result.m_NumberGroups = groupSizes.size();
    LOG_TRACE(<< "stacked design with " << numberSeries << " series in "
              << groupSizes.size() << " groups");
    return result;
}

CAutoregressiveDesign::CAutoregressiveDesign(std::size_t dimension,
                                             std::size_t order,
                                             std::size_t referenceLag,
                                             std::size_t numberRows)
    : m_Order{order}, m_ReferenceLag{referenceLag}, m_NumberGroups{0},
      m_Responses(numberRows, dimension), m_Predictors(numberRows, dimension * order),
      m_References(numberRows) {
}

void CAutoregressiveDesign::addSeries(const common::TDenseMatrix& y,
                                      const common::TDenseVector& u,
                                      std::size_t offset,
                                      std::size_t length,
                                      std::size_t group) {
    std::size_t k{static_cast<std::size_t>(y.cols())};
    std::size_t maximumLag{std::max(m_Order, m_ReferenceLag)};
    std::size_t begin{m_Series.empty() ? 0 : m_Series.back().s_End};
    std::size_t row{begin};
    for (std::size_t t = offset + maximumLag; t < offset + length; ++t, ++row) {
        m_Responses.row(row) = y.row(t);
        for (std::size_t l = 1; l <= m_Order; ++l) {
            m_Predictors.block(row, k * (l - 1), 1, k) = y.row(t - l);
        }
        m_References(row) = u(t - m_ReferenceLag);
    }
    m_Series.push_back(SSeriesRows{begin, row, group});
}

std::size_t CAutoregressiveDesign::dimension() const {
    return static_cast<std::size_t>(m_Responses.cols());
}

std::size_t CAutoregressiveDesign::order() const {
    return m_Order;
}

std::size_t CAutoregressiveDesign::referenceLag() const {
    return m_ReferenceLag;
}

std::size_t CAutoregressiveDesign::numberRows() const {
    return static_cast<std::size_t>(m_Responses.rows());
}

std::size_t CAutoregressiveDesign::numberSeries() const {
    return m_Series.size();
}

std::size_t CAutoregressiveDesign::numberGroups() const {
    return m_NumberGroups;
}

const CAutoregressiveDesign::SSeriesRows& CAutoregressiveDesign::series(std::size_t i) const {
    return m_Series[i];
}

const common::TDenseMatrix& CAutoregressiveDesign::responses() const {
    return m_Responses;
}

const common::TDenseMatrix& CAutoregressiveDesign::predictors() const {
    return m_Predictors;
}

const common::TDenseVector& CAutoregressiveDesign::references() const {
    return m_References;
}
}
}
}
