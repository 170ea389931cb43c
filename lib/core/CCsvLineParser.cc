/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CCsvLineParser.h>

#include <core/CLogger.h>

namespace mxfar {
namespace core {

const char CCsvLineParser::COMMA{','};
const char CCsvLineParser::QUOTE{'"'};

CCsvLineParser::CCsvLineParser(char separator) : m_Separator{separator} {
}

void CCsvLineParser::reset(const std::string& line) {
    m_SeparatorAfterLastField = false;
    m_Line = &line;
    m_LineCurrent = line.data();
    m_LineEnd = line.data() + line.length();
    if (m_LineEnd != m_LineCurrent && *(m_LineEnd - 1) == '\r') {
        --m_LineEnd;
    }
    m_WorkField.clear();
    m_WorkField.reserve(line.length());
}

bool CCsvLineParser::parseNext(std::string& value) {
    if (m_Line == nullptr || this->parseNextToken() == false) {
        return false;
    }
    value = m_WorkField;
    return true;
}

bool CCsvLineParser::atEnd() const {
    return m_LineCurrent == m_LineEnd && m_SeparatorAfterLastField == false;
}

bool CCsvLineParser::parseLine(const std::string& line, TStrVec& fields) {
    fields.clear();
    this->reset(line);
    std::string field;
    while (this->atEnd() == false) {
        if (this->parseNext(field) == false) {
            return false;
        }
        fields.push_back(field);
    }
    return true;
}

bool CCsvLineParser::parseNextToken() {
    m_WorkField.clear();

    if (m_LineCurrent == m_LineEnd) {
        // Allow one empty token at the end of a line
        if (m_SeparatorAfterLastField == false) {
            LOG_ERROR(<< "Trying to read too many fields from record: " << *m_Line);
            return false;
        }
        m_SeparatorAfterLastField = false;
        return true;
    }

    bool insideQuotes{false};
    do {
        char current{*m_LineCurrent};
        if (insideQuotes) {
            if (current == QUOTE) {
                ++m_LineCurrent;
                if (m_LineCurrent == m_LineEnd) {
                    m_SeparatorAfterLastField = false;
                    return true;
                }
                current = *m_LineCurrent;
                // Two adjacent quotes are a literal quote
                if (current != QUOTE) {
                    insideQuotes = false;
                    if (current == m_Separator) {
                        ++m_LineCurrent;
                        m_SeparatorAfterLastField = true;
                        return true;
                    }
                }
            }
            m_WorkField += current;
        } else if (current == m_Separator) {
            ++m_LineCurrent;
            m_SeparatorAfterLastField = true;
            return true;
        } else if (current == QUOTE) {
            insideQuotes = true;
        } else {
            m_WorkField += current;
        }
    } while (++m_LineCurrent != m_LineEnd);

    m_SeparatorAfterLastField = false;

    if (insideQuotes) {
        LOG_ERROR(<< "Unmatched final quote in record: " << *m_Line);
        return false;
    }

    return true;
}
}
}
