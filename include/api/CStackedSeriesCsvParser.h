/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_api_CStackedSeriesCsvParser_h
#define INCLUDED_mxfar_api_CStackedSeriesCsvParser_h

#include <core/CCsvLineParser.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace mxfar {
namespace api {

//! \brief
//! Parse stacked multivariate series from CSV.
//!
//! DESCRIPTION:\n
//! The input format consists of:
//! 1) A header row naming the columns.
//! 2) Data rows with one column per dimension of the series followed by
//!    the reference signal in the last column.
//!
//! Series are stacked one after another, so every series contributes the
//! same number of consecutive rows. Empty fields and "nan" are read as
//! missing values.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The whole input is held in memory since every analysis needs random
//! access to the full data set.
class CStackedSeriesCsvParser {
public:
    using TStrVec = std::vector<std::string>;

    //! \brief The parsed series.
    struct SStackedSeries {
        //! The names of the series' dimensions.
        TStrVec s_DimensionNames;
        //! The name of the reference signal column.
        std::string s_ReferenceName;
        //! The stacked series with one column per dimension.
        maths::common::TDenseMatrix s_Y;
        //! The stacked reference signal.
        maths::common::TDenseVector s_U;
    };

public:
    explicit CStackedSeriesCsvParser(std::istream& strmIn,
                                     char separator = core::CCsvLineParser::COMMA);

    //! Read the whole stream into \p result.
    //!
    //! \return False if the input is malformed, in which case the reason
    //! is logged.
    bool parse(SStackedSeries& result);

private:
    //! Parse the header row into the column names.
    bool parseFieldNames(const std::string& line, SStackedSeries& result);

    //! Parse a data row into \p values.
    bool parseDataRecord(const std::string& line, std::size_t lineNumber, std::vector<double>& values);

private:
    //! Reference to the stream we're going to read from
    std::istream& m_StrmIn;

    //! Parser used to parse the individual lines
    core::CCsvLineParser m_LineParser;

    //! The number of columns in the header row.
    std::size_t m_NumberFields{0};

    //! Working space for the current record's fields.
    TStrVec m_Fields;
};
}
}

#endif // INCLUDED_mxfar_api_CStackedSeriesCsvParser_h
