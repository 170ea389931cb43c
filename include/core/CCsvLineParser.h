/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_core_CCsvLineParser_h
#define INCLUDED_mxfar_core_CCsvLineParser_h

#include <string>
#include <vector>

namespace mxfar {
namespace core {

//! \brief
//! Parses single lines of CSV formatted data.
//!
//! DESCRIPTION:\n
//! Fields are separated by a single character, comma by default, and
//! may be quoted Excel style, i.e. a quoted field can contain the
//! separator and a literal quote is written as two adjacent quotes.
//! A trailing carriage return is stripped so that files with Windows
//! line endings parse the same as those with Unix line endings.
class CCsvLineParser {
public:
    using TStrVec = std::vector<std::string>;

public:
    //! Default CSV separator
    static const char COMMA;

    //! CSV quote character
    static const char QUOTE;

public:
    explicit CCsvLineParser(char separator = COMMA);

    //! Supply a new CSV string to be parsed.
    //!
    //! \note \p line must outlive the calls to parseNext.
    void reset(const std::string& line);

    //! Parse the next token from the current line.
    //!
    //! \return False if there are no more fields or the line is malformed.
    bool parseNext(std::string& value);

    //! Are we at the end of the current line?
    bool atEnd() const;

    //! Split \p line into \p fields.
    //!
    //! \return False if the line is malformed.
    bool parseLine(const std::string& line, TStrVec& fields);

private:
    //! Parse the next token into the working field.
    bool parseNextToken();

private:
    //! The field separator.
    const char m_Separator;

    //! Did the separator character appear after the last field we parsed?
    bool m_SeparatorAfterLastField{false};

    //! The line being parsed.
    const std::string* m_Line{nullptr};

    //! The current position and end of the line being parsed.
    const char* m_LineCurrent{nullptr};
    const char* m_LineEnd{nullptr};

    //! The field currently being parsed.
    std::string m_WorkField;
};
}
}

#endif // INCLUDED_mxfar_core_CCsvLineParser_h
