/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CStackedSeriesCsvParser.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <istream>
#include <limits>

namespace mxfar {
namespace api {

CStackedSeriesCsvParser::CStackedSeriesCsvParser(std::istream& strmIn, char separator)
    : m_StrmIn{strmIn}, m_LineParser{separator} {
}

bool CStackedSeriesCsvParser::parse(SStackedSeries& result) {
    std::string line;
    std::size_t lineNumber{0};

    while (std::getline(m_StrmIn, line)) {
        ++lineNumber;
        core::CStringUtils::trimWhitespace(line);
        if (line.empty() == false) {
            break;
        }
    }
    if (line.empty()) {
        LOG_ERROR(<< "No header row in input");
        return false;
    }
    if (this->parseFieldNames(line, result) == false) {
        return false;
    }

    std::size_t d{m_NumberFields - 1};
    std::vector<double> values;
    std::vector<double> record;
    while (std::getline(m_StrmIn, line)) {
        ++lineNumber;
        core::CStringUtils::trimWhitespace(line);
        if (line.empty()) {
            continue;
        }
        if (this->parseDataRecord(line, lineNumber, record) == false) {
            return false;
        }
        values.insert(values.end(), record.begin(), record.end());
    }
    if (m_StrmIn.bad()) {
        LOG_ERROR(<< "Error reading input at line " << lineNumber);
        return false;
    }

    std::size_t n{values.size() / m_NumberFields};
    if (n == 0) {
        LOG_ERROR(<< "No data rows in input");
        return false;
    }
    LOG_DEBUG(<< "Read " << n << " rows of " << d << " dimensional series");

    auto rows = static_cast<std::ptrdiff_t>(n);
    result.s_Y.resize(rows, static_cast<std::ptrdiff_t>(d));
    result.s_U.resize(rows);
    for (std::ptrdiff_t i = 0; i < rows; ++i) {
        const double* row{values.data() + static_cast<std::size_t>(i) * m_NumberFields};
        for (std::size_t j = 0; j < d; ++j) {
            result.s_Y(i, static_cast<std::ptrdiff_t>(j)) = row[j];
        }
        result.s_U(i) = row[d];
    }

    return true;
}

bool CStackedSeriesCsvParser::parseFieldNames(const std::string& line, SStackedSeries& result) {
    if (m_LineParser.parseLine(line, m_Fields) == false) {
        LOG_ERROR(<< "Failed to parse header row '" << line << "'");
        return false;
    }
    if (m_Fields.size() < 2) {
        LOG_ERROR(<< "Expected at least one series column and a reference column in header '"
                  << line << "'");
        return false;
    }
    m_NumberFields = m_Fields.size();
    for (auto& name : m_Fields) {
        core::CStringUtils::trimWhitespace(name);
    }
    result.s_DimensionNames.assign(m_Fields.begin(), m_Fields.end() - 1);
    result.s_ReferenceName = m_Fields.back();
    return true;
}

bool CStackedSeriesCsvParser::parseDataRecord(const std::string& line,
                                              std::size_t lineNumber,
                                              std::vector<double>& values) {
    if (m_LineParser.parseLine(line, m_Fields) == false) {
        LOG_ERROR(<< "Failed to parse line " << lineNumber);
        return false;
    }
    if (m_Fields.size() != m_NumberFields) {
        LOG_ERROR(<< "Line " << lineNumber << " has " << m_Fields.size()
                  << " fields but the header has " << m_NumberFields);
        return false;
    }

    values.assign(m_NumberFields, std::numeric_limits<double>::quiet_NaN());
    for (std::size_t i = 0; i < m_NumberFields; ++i) {
        std::string& field{m_Fields[i]};
        core::CStringUtils::trimWhitespace(field);
        if (field.empty()) {
            continue;
        }
        if (core::CStringUtils::stringToType(field, values[i]) == false) {
            LOG_ERROR(<< "Invalid value '" << field << "' in column " << i + 1
                      << " of line " << lineNumber);
            return false;
        }
    }
    return true;
}
}
}
