/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/time_series/CFunctionalCoefficientField.h>

#include <algorithm>
#include <limits>

namespace mxfar {
namespace maths {
namespace time_series {

CFunctionalCoefficientField::CFunctionalCoefficientField(std::size_t dimension,
                                                         TOptionalDenseMatrixVec coefficients)
    : m_Dimension{dimension}, m_Coefficients(std::move(coefficients)) {
}

std::size_t CFunctionalCoefficientField::dimension() const {
    return m_Dimension;
}

std::size_t CFunctionalCoefficientField::size() const {
    return m_Coefficients.size();
}

std::size_t CFunctionalCoefficientField::numberMissing() const {
    return static_cast<std::size_t>(std::count_if(
        m_Coefficients.begin(), m_Coefficients.end(),
        [](const TOptionalDenseMatrix& coefficients) { return coefficients == std::nullopt; }));
}

bool CFunctionalCoefficientField::missing(std::size_t cell) const {
    return m_Coefficients[cell] == std::nullopt;
}

const CFunctionalCoefficientField::TOptionalDenseMatrix&
CFunctionalCoefficientField::operator[](std::size_t cell) const {
    return m_Coefficients[cell];
}

common::TDenseMatrix CFunctionalCoefficientField::lag(std::size_t cell, std::size_t lag) const {
    const auto& coefficients = *m_Coefficients[cell];
    std::ptrdiff_t k{coefficients.rows()};
    return coefficients.block(0, k * static_cast<std::ptrdiff_t>(lag - 1), k, k);
}

common::TDenseVector CFunctionalCoefficientField::predict(std::size_t cell,
                                                          const common::TDenseVector::TBase& x) const {
    const auto& coefficients = m_Coefficients[cell];
    if (coefficients == std::nullopt) {
        return common::TDenseVector::TBase::Constant(
            m_Dimension, std::numeric_limits<double>::quiet_NaN());
    }
    return *coefficients * x;
}
}
}
}
